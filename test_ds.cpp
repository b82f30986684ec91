#include <iostream>
#include <sstream>
#include <string>
#include "data_structures/bucket.hpp"
#include "data_structures/hash_table.hpp"
#include "include/table_stats.h"

using json = nlohmann::json;

static int failures = 0;

void print_test(const char* name, bool ok) {
    std::cout << "[" << name << "]" << (ok ? " ✓ PASS" : " ✗ FAIL") << "\n";
    if (!ok) ++failures;
}

int main() {
    Bucket<std::string, int> b;
    print_test("Bucket starts empty", b.empty() && b.size() == 0 && b.get("x") == nullptr);

    b.insert("x", 1); b.insert("y", 2); b.insert("z", 3);
    std::cout << "Bucket size=" << b.size() << " y=" << *b.get("y") << "\n";
    print_test("Bucket insert", b.size() == 3 && *b.get("x") == 1 && *b.get("z") == 3);

    b.insert("x", 10);
    print_test("Bucket update in place", b.size() == 3 && *b.get("x") == 10);

    b.remove("nope");
    print_test("Bucket remove absent", b.size() == 3);

    b.remove("x");   // tail: first inserted
    b.remove("z");   // head: last inserted
    print_test("Bucket remove tail and head", b.size() == 1 && *b.get("y") == 2 &&
               b.get("x") == nullptr && b.get("z") == nullptr);

    Bucket<std::string, int> other(std::move(b));
    print_test("Bucket move", other.size() == 1 && b.size() == 0 && b.get("y") == nullptr);

    other.clear();
    print_test("Bucket clear", other.empty() && other.get("y") == nullptr);

    // teardown walks the chain in a loop
    {
        Bucket<int, int> chain;
        for (int i = 0; i < 20000; ++i) chain.insert(i, i);
        print_test("Long chain built", chain.size() == 20000 && *chain.get(0) == 0);
    }
    print_test("Long chain destroyed", true);

    HashTable<std::string, int> t;
    t.insert("Horse", 11); t.insert("Monkey", 22); t.insert("Elephant", 33);
    TableStats s = t.stats();
    json j = stats_to_json(s);
    std::cout << "Stats json=" << j.dump() << "\n";
    print_test("Stats json fields",
               j["bucket_count"] == 8 && j["entry_count"] == 3 &&
               j["chain_lengths"].size() == 8 &&
               j["longest_chain"].get<std::size_t>() >= 1 &&
               j["empty_buckets"].get<std::size_t>() >= 5);

    std::ostringstream out;
    print_stats(out, s);
    std::string report = out.str();
    std::cout << report;
    print_test("Stats report", report.find("Entries: 3") != std::string::npos &&
               report.find("[7]") != std::string::npos);

    return failures == 0 ? 0 : 1;
}
