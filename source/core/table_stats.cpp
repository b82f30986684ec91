#include "../include/table_stats.h"
#include <ostream>

using json = nlohmann::json;

json stats_to_json(const TableStats& stats) {
    json chains = json::array();
    for (std::size_t n : stats.chain_lengths) chains.push_back(n);

    return json{
        {"bucket_count", stats.bucket_count},
        {"entry_count", stats.entry_count},
        {"empty_buckets", stats.empty_buckets},
        {"longest_chain", stats.longest_chain},
        {"chain_lengths", chains}
    };
}

void print_stats(std::ostream& out, const TableStats& stats) {
    out << "--- Hash Table Stats ---\n";
    out << "Buckets: " << stats.bucket_count
        << "  Entries: " << stats.entry_count
        << "  Empty: " << stats.empty_buckets
        << "  Longest chain: " << stats.longest_chain << "\n";
    for (std::size_t i = 0; i < stats.chain_lengths.size(); ++i) {
        out << "  [" << i << "] ";
        for (std::size_t k = 0; k < stats.chain_lengths[i]; ++k) out << '#';
        out << " (" << stats.chain_lengths[i] << ")\n";
    }
}
