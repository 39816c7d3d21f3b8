#include "taxonomy/taxdb_sort.hpp"

#include <cstdio>
#include <fstream>
#include <limits>

#include <tbb/parallel_sort.h>

namespace kubuild {

int64_t taxdb_numeric_field(const std::string& line, int field) {
    size_t start = 0;
    for (int f = 1; f < field; f++) {
        size_t tab = line.find('\t', start);
        if (tab == std::string::npos) return 0;
        start = tab + 1;
    }
    size_t end = line.find('\t', start);
    if (end == std::string::npos) end = line.size();

    size_t p = start;
    while (p < end && (line[p] == ' ' || line[p] == '\t')) p++;
    bool neg = false;
    if (p < end && line[p] == '-') {
        neg = true;
        p++;
    }
    // Saturates instead of overflowing on absurdly long digit runs.
    const int64_t limit = std::numeric_limits<int64_t>::max();
    int64_t v = 0;
    while (p < end && line[p] >= '0' && line[p] <= '9') {
        int digit = line[p] - '0';
        v = v > (limit - digit) / 10 ? limit : v * 10 + digit;
        p++;
    }
    return neg ? -v : v;
}

namespace {

struct TaxRecord {
    int64_t key6;
    int64_t key5;
    std::string line;
};

} // namespace

void sort_taxdb_records(std::vector<std::string>& lines) {
    std::vector<TaxRecord> recs;
    recs.reserve(lines.size());
    for (auto& l : lines) {
        int64_t k6 = taxdb_numeric_field(l, 6);
        int64_t k5 = taxdb_numeric_field(l, 5);
        recs.push_back({k6, k5, std::move(l)});
    }

    tbb::parallel_sort(recs.begin(), recs.end(),
                       [](const TaxRecord& a, const TaxRecord& b) {
                           if (a.key6 != b.key6) return a.key6 > b.key6;
                           if (a.key5 != b.key5) return a.key5 > b.key5;
                           // -r reverses sort's last-resort line comparison too
                           return a.line > b.line;
                       });

    for (size_t i = 0; i < recs.size(); i++) lines[i] = std::move(recs[i].line);
}

bool sort_taxdb_file(const std::string& input, const std::string& output,
                     std::string& error) {
    std::ifstream in(input, std::ios::binary);
    if (!in.is_open()) {
        error = "cannot open '" + input + "'";
        return false;
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(std::move(line));
    if (in.bad()) {
        error = "read error in '" + input + "'";
        return false;
    }

    sort_taxdb_records(lines);

    std::ofstream out(output, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        error = "cannot open '" + output + "' for writing";
        return false;
    }
    for (const auto& l : lines) out << l << '\n';
    out.flush();
    if (!out.good()) {
        error = "write error in '" + output + "'";
        return false;
    }
    return true;
}

} // namespace kubuild
