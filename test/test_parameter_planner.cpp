#include "test_util.hpp"
#include "core/config.hpp"
#include "planner/parameter_planner.hpp"
#include "util/size_parser.hpp"

#include <cstdint>

using namespace kubuild;

static SizeBudget budget(const char* text) {
    return *parse_size_budget(text);
}

static void test_hash_size() {
    std::fprintf(stderr, "-- test_hash_size\n");
    CHECK_EQ(estimate_hash_size(0), 0u);
    CHECK_EQ(estimate_hash_size(1000000000), 1150000000u);
    CHECK_EQ(estimate_hash_size(100), 115u);
    // Fractional results round up
    CHECK_EQ(estimate_hash_size(1), 2u);
    CHECK_EQ(estimate_hash_size(22), 26u);
    // No overflow in the intermediate product
    CHECK_EQ(estimate_hash_size(UINT64_MAX / 100), (UINT64_MAX / 100) / 100 * 115 +
             ((UINT64_MAX / 100) % 100 * 115 + 99) / 100);
    CHECK_EQ(estimate_hash_size(UINT64_MAX), UINT64_MAX);
}

static void test_index_size() {
    std::fprintf(stderr, "-- test_index_size\n");
    CHECK_EQ(index_size_bytes(0), 24u);
    CHECK_EQ(index_size_bytes(1), 48u);
    CHECK_EQ(index_size_bytes(15), 8589934608u);   // 8 * (2^30 + 2)
    CHECK_EQ(index_size_bytes(MAX_MINIMIZER_LEN), 8 * ((uint64_t(1) << 58) + 2));
}

static void test_reduction_needed() {
    std::fprintf(stderr, "-- test_reduction_needed\n");
    // Exactly at the budget is not over it
    CHECK(!reduction_needed(GIB - 48, 48, budget("1")));
    CHECK(reduction_needed(GIB - 47, 48, budget("1")));
    CHECK(!reduction_needed(GIB / 2, 0, budget("0.5")));
    CHECK(reduction_needed(GIB / 2 + 1, 0, budget("0.5")));
    CHECK(reduction_needed(1, 0, budget("0")));
    CHECK(!reduction_needed(0, 0, budget("0")));
    // Large sizes stay exact
    CHECK(!reduction_needed(uint64_t(1000) * GIB, 0, budget("1000")));
    CHECK(reduction_needed(uint64_t(1000) * GIB + 1, 0, budget("1000")));
}

static void test_target_record_count() {
    std::fprintf(stderr, "-- test_target_record_count\n");
    uint64_t count = 7;

    // keyBits 32 -> 4-byte keys, 4-byte values: 8-byte records
    CHECK(target_record_count(budget("1"), 0, 8, count));
    CHECK_EQ(count, GIB / 8);

    // keyBits 33 -> 5-byte keys: 9-byte records
    CHECK(target_record_count(budget("1"), 0, 9, count));
    CHECK_EQ(count, GIB / 9);

    CHECK(target_record_count(budget("2"), index_size_bytes(1), 12, count));
    CHECK_EQ(count, (2 * GIB - 48) / 12);

    CHECK(target_record_count(budget("0.5"), 1000, 10, count));
    CHECK_EQ(count, (GIB / 2 - 1000) / 10);

    // Index exactly fills the budget: zero records
    CHECK(target_record_count(budget("1"), GIB, 12, count));
    CHECK_EQ(count, 0u);
}

static void test_index_too_large() {
    std::fprintf(stderr, "-- test_index_too_large\n");
    uint64_t count = 7;
    CHECK(!target_record_count(budget("1"), index_size_bytes(15), 12, count));
    CHECK_EQ(count, 7u);
    CHECK(!target_record_count(budget("0"), 48, 12, count));
    CHECK(!target_record_count(budget("1"), 0, 0, count));
    CHECK_EQ(count, 7u);

    CHECK_EQ(kdb_byte_allowance(budget("1"), index_size_bytes(15)), -1);
    CHECK_EQ(kdb_byte_allowance(budget("0"), 1), -1);
}

static void test_allowance() {
    std::fprintf(stderr, "-- test_allowance\n");
    CHECK_EQ(kdb_byte_allowance(budget("1"), 48), static_cast<int64_t>(GIB - 48));
    CHECK_EQ(kdb_byte_allowance(budget("0.000001"), 48), 1025);
    CHECK_EQ(kdb_byte_allowance(budget("1"), GIB), 0);
}

int main() {
    test_hash_size();
    test_index_size();
    test_reduction_needed();
    test_target_record_count();
    test_index_too_large();
    test_allowance();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
