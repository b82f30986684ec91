#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include "bucket.hpp"
#include "../include/config.h"
#include "../include/table_stats.h"

template<typename K> struct SimpleHash { std::size_t operator()(const K& k) const { return std::hash<K>{}(k); } };
template<> struct SimpleHash<std::string> {
    std::size_t operator()(const std::string& s) const { std::size_t h=5381; for(unsigned char c: s) h=((h<<5)+h)+c; return h; }
};

// Separate-chaining hash table with a fixed number of buckets.
// There is no rehashing: every key stays in the bucket picked at insert time.
template<typename K, typename V, typename H=SimpleHash<K>>
class HashTable {
    Bucket<K, V> buckets[BUCKET_SIZE];

    static std::size_t hash(const K& key) { return H{}(key) % BUCKET_SIZE; }

public:
    HashTable() = default;

    HashTable(HashTable&&) = default;
    HashTable& operator=(HashTable&&) = default;
    HashTable(const HashTable&) = delete;
    HashTable& operator=(const HashTable&) = delete;

    std::size_t len() const {
        std::size_t total = 0;
        for (const auto& b : buckets) total += b.size();
        return total;
    }
    bool empty() const { return len() == 0; }
    std::size_t bucket_count() const { return BUCKET_SIZE; }

    void insert(K key, V value) {
        std::size_t i = hash(key);
        buckets[i].insert(std::move(key), std::move(value));
    }

    void remove(const K& key) { buckets[hash(key)].remove(key); }

    // nullptr when the key is absent.
    V* get(const K& key) { return buckets[hash(key)].get(key); }
    const V* get(const K& key) const { return buckets[hash(key)].get(key); }

    bool contains(const K& key) const { return get(key) != nullptr; }

    void clear() {
        for (auto& b : buckets) b.clear();
    }

    TableStats stats() const {
        TableStats s;
        s.bucket_count = BUCKET_SIZE;
        for (const auto& b : buckets) {
            std::size_t n = b.size();
            s.chain_lengths.push_back(n);
            s.entry_count += n;
            if (n == 0) ++s.empty_buckets;
            if (n > s.longest_chain) s.longest_chain = n;
        }
        return s;
    }
};
