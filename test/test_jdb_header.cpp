#include "test_util.hpp"
#include "io/jdb_header.hpp"
#include "util/file_util.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>

using namespace kubuild;

static std::string g_test_dir;

static void put_u64(std::string& data, uint64_t off, uint64_t v) {
    for (int i = 0; i < 8; i++) data[off + i] = static_cast<char>((v >> (8 * i)) & 0xff);
}

static std::string make_header(uint64_t key_bits, uint64_t value_len, uint64_t key_count,
                               size_t size) {
    std::string data(size, '\x5a');
    put_u64(data, JDB_KEY_BITS_OFFSET, key_bits);
    put_u64(data, JDB_VALUE_LEN_OFFSET, value_len);
    put_u64(data, JDB_KEY_COUNT_OFFSET, key_count);
    return data;
}

static void test_read_fields() {
    std::fprintf(stderr, "-- test_read_fields\n");
    std::string path = g_test_dir + "/a.jdb";
    write_file_string(path, make_header(62, 4, 123456789012ULL, 4096));

    auto hdr = read_jdb_header(path);
    CHECK(hdr.has_value());
    CHECK_EQ(hdr->key_bits, 62u);
    CHECK_EQ(hdr->value_len, 4u);
    CHECK_EQ(hdr->key_count, 123456789012ULL);
    CHECK_EQ(hdr->key_len(), 8u);
    CHECK_EQ(hdr->record_len(), 12u);
}

static void test_key_len_rounding() {
    std::fprintf(stderr, "-- test_key_len_rounding\n");
    JdbHeader h;
    h.key_bits = 32;
    CHECK_EQ(h.key_len(), 4u);
    h.key_bits = 33;
    CHECK_EQ(h.key_len(), 5u);
    h.key_bits = 0;
    CHECK_EQ(h.key_len(), 0u);
    h.key_bits = 1;
    h.value_len = 2;
    CHECK_EQ(h.record_len(), 3u);
}

static void test_minimum_size() {
    std::fprintf(stderr, "-- test_minimum_size\n");
    std::string path = g_test_dir + "/exact.jdb";
    write_file_string(path, make_header(33, 1, 5, JDB_HEADER_MIN_SIZE));
    auto hdr = read_jdb_header(path);
    CHECK(hdr.has_value());
    CHECK_EQ(hdr->record_len(), 6u);
    CHECK_EQ(hdr->key_count, 5u);
}

static void test_short_file() {
    std::fprintf(stderr, "-- test_short_file\n");
    std::string path = g_test_dir + "/short.jdb";
    write_file_string(path, make_header(62, 4, 10, JDB_HEADER_MIN_SIZE).substr(0, 55));
    CHECK(!read_jdb_header(path).has_value());

    write_file_string(path, "");
    CHECK(!read_jdb_header(path).has_value());
}

static void test_missing_file() {
    std::fprintf(stderr, "-- test_missing_file\n");
    CHECK(!read_jdb_header(g_test_dir + "/nope.jdb").has_value());
}

int main() {
    char tmpl[] = "/tmp/kubuild_jdb_test_XXXXXX";
    char* dir = ::mkdtemp(tmpl);
    if (!dir) return 1;
    g_test_dir = dir;

    test_read_fields();
    test_key_len_rounding();
    test_minimum_size();
    test_short_file();
    test_missing_file();

    std::filesystem::remove_all(g_test_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
