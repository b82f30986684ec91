#ifndef TABLE_STATS_H
#define TABLE_STATS_H

#include <cstddef>
#include <iosfwd>
#include <vector>
#include <nlohmann/json.hpp>

// Shape of a HashTable's chains at one point in time. Keys and values are not included.
struct TableStats {
    std::size_t bucket_count = 0;
    std::size_t entry_count = 0;
    std::size_t empty_buckets = 0;
    std::size_t longest_chain = 0;
    std::vector<std::size_t> chain_lengths;   // indexed by bucket
};

nlohmann::json stats_to_json(const TableStats& stats);

void print_stats(std::ostream& out, const TableStats& stats);

#endif // TABLE_STATS_H
