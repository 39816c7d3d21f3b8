#include "test_util.hpp"
#include "util/elapsed_time.hpp"

#include <string>

using namespace kubuild;

static void test_seconds_only() {
    std::fprintf(stderr, "-- test_seconds_only\n");
    CHECK_STR(format_elapsed(0), "0.000s");
    CHECK_STR(format_elapsed(59.25), "59.250s");
    CHECK_STR(format_elapsed(0.0004), "0.000s");
    CHECK_STR(format_elapsed(1.0006), "1.001s");
}

static void test_minutes_and_hours() {
    std::fprintf(stderr, "-- test_minutes_and_hours\n");
    CHECK_STR(format_elapsed(60), "1m0.000s");
    CHECK_STR(format_elapsed(125.5), "2m5.500s");
    CHECK_STR(format_elapsed(3723.5), "1h2m3.500s");
    // Hours shown forces minutes, even when zero
    CHECK_STR(format_elapsed(3600), "1h0m0.000s");
    CHECK_STR(format_elapsed(90000), "25h0m0.000s");
}

static void test_rounding_carries() {
    std::fprintf(stderr, "-- test_rounding_carries\n");
    CHECK_STR(format_elapsed(59.9996), "1m0.000s");
    CHECK_STR(format_elapsed(3599.9999), "1h0m0.000s");
}

static void test_negative() {
    std::fprintf(stderr, "-- test_negative\n");
    CHECK_STR(format_elapsed(-5), "0.000s");
}

static void test_timer() {
    std::fprintf(stderr, "-- test_timer\n");
    ElapsedTimer t;
    double s = t.seconds();
    CHECK(s >= 0);
    CHECK(s < 60);
    CHECK(!t.elapsed().empty());
    CHECK(t.elapsed().back() == 's');
}

int main() {
    test_seconds_only();
    test_minutes_and_hours();
    test_rounding_carries();
    test_negative();
    test_timer();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
