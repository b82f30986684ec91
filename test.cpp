#include <iostream>
#include <string>
#include "data_structures/hash_table.hpp"

using namespace std;

static int failures = 0;

void print_test(const char* name, bool ok) {
    cout << "[" << name << "]";
    if (ok)
        cout << " ✓ PASS" << endl;
    else {
        cout << " ✗ FAIL" << endl;
        ++failures;
    }
}

// Sends every key to bucket 0.
struct CollideHash {
    size_t operator()(const string&) const { return 0; }
};

bool value_is(const HashTable<string, int>& t, const string& key, int expected) {
    const int* v = t.get(key);
    return v != nullptr && *v == expected;
}

int main() {
    cout << "========================================\n";
    cout << "   HASH TABLE TEST\n";
    cout << "========================================\n\n";

    // --------------------------
    // 1. Animals
    // --------------------------
    cout << "--- PHASE 1: Insert / Get / Remove ---" << endl;
    HashTable<string, int> animals;
    print_test("New table is empty", animals.empty() && animals.len() == 0);
    print_test("Bucket count fixed at 8", animals.bucket_count() == 8);

    animals.insert("Horse", 11);
    animals.insert("Monkey", 22);
    animals.insert("Elephant", 33);
    animals.insert("Lion", 44);

    print_test("get Horse", value_is(animals, "Horse", 11));
    print_test("get Monkey", value_is(animals, "Monkey", 22));
    print_test("get Elephant", value_is(animals, "Elephant", 33));
    print_test("get Lion", value_is(animals, "Lion", 44));
    print_test("get Tiger is absent", animals.get("Tiger") == nullptr);
    print_test("len after 4 inserts", animals.len() == 4);

    animals.remove("Lion");
    print_test("Lion absent after remove", animals.get("Lion") == nullptr);
    print_test("len after remove", animals.len() == 3);
    print_test("Others survive remove",
               value_is(animals, "Horse", 11) && value_is(animals, "Monkey", 22) &&
               value_is(animals, "Elephant", 33));

    // --------------------------
    // 2. Update and no-op removal
    // --------------------------
    cout << "\n--- PHASE 2: Update / Absent Remove ---" << endl;
    animals.insert("Horse", 99);
    print_test("Re-insert keeps len", animals.len() == 3);
    print_test("Re-insert replaces value", value_is(animals, "Horse", 99));

    animals.remove("Tiger");
    print_test("Remove absent key keeps len", animals.len() == 3);
    print_test("Remove absent key keeps entries",
               value_is(animals, "Horse", 99) && value_is(animals, "Monkey", 22) &&
               value_is(animals, "Elephant", 33));

    animals.remove("Lion");
    print_test("Second remove is a no-op", animals.len() == 3);

    int* horse = animals.get("Horse");
    if (horse) *horse = 7;
    print_test("Mutable get writes through", value_is(animals, "Horse", 7));
    print_test("contains", animals.contains("Monkey") && !animals.contains("Lion"));

    // --------------------------
    // 3. Collisions
    // --------------------------
    cout << "\n--- PHASE 3: Collisions ---" << endl;
    HashTable<string, int, CollideHash> same;
    same.insert("a", 1);
    same.insert("b", 2);
    same.insert("c", 3);
    print_test("Colliding keys all stored", same.len() == 3);
    print_test("Colliding keys retrievable",
               same.get("a") && *same.get("a") == 1 &&
               same.get("b") && *same.get("b") == 2 &&
               same.get("c") && *same.get("c") == 3);
    TableStats cs = same.stats();
    print_test("Collisions share one chain", cs.longest_chain == 3 && cs.empty_buckets == 7);

    same.remove("b");
    print_test("Remove middle of chain",
               same.get("b") == nullptr && same.len() == 2 &&
               *same.get("a") == 1 && *same.get("c") == 3);
    same.remove("c");
    print_test("Remove head of chain", same.get("c") == nullptr && *same.get("a") == 1);
    same.remove("a");
    print_test("Remove last of chain", same.empty());

    // more keys than buckets: at least one bucket holds two keys
    HashTable<int, int> many;
    for (int i = 0; i < 100; ++i) many.insert(i, i * 10);
    bool all_found = true;
    for (int i = 0; i < 100; ++i) {
        const int* v = many.get(i);
        if (!v || *v != i * 10) all_found = false;
    }
    print_test("100 keys in 8 buckets", many.len() == 100 && all_found);

    for (int i = 0; i < 100; i += 2) many.remove(i);
    bool odd_only = true;
    for (int i = 0; i < 100; ++i) {
        bool present = many.contains(i);
        if (present != (i % 2 == 1)) odd_only = false;
    }
    print_test("Removing evens leaves odds", many.len() == 50 && odd_only);

    // --------------------------
    // 4. Sum invariant
    // --------------------------
    cout << "\n--- PHASE 4: Counting ---" << endl;
    HashTable<string, string> words;
    size_t inserted = 0, removed = 0;
    bool tracked = true;
    const char* keys[] = { "alpha", "beta", "gamma", "delta", "epsilon", "zeta", "eta", "theta",
                           "iota", "kappa", "lambda", "mu" };
    for (const char* k : keys) {
        words.insert(k, string(k) + "!");
        ++inserted;
        if (words.len() != inserted - removed) tracked = false;
    }
    for (int i = 0; i < 12; i += 3) {
        words.remove(keys[i]);
        ++removed;
        if (words.len() != inserted - removed) tracked = false;
    }
    words.remove("omega");
    if (words.len() != inserted - removed) tracked = false;
    print_test("len == inserted - removed", tracked && words.len() == 8);

    TableStats ws = words.stats();
    size_t sum = 0;
    for (size_t n : ws.chain_lengths) sum += n;
    print_test("Stats agree with len",
               ws.bucket_count == 8 && ws.chain_lengths.size() == 8 &&
               ws.entry_count == words.len() && sum == words.len());

    // --------------------------
    // 5. Clear and move
    // --------------------------
    cout << "\n--- PHASE 5: Clear / Move ---" << endl;
    words.clear();
    print_test("clear empties table", words.empty() && words.get("beta") == nullptr);
    words.insert("beta", "again");
    print_test("Table usable after clear", words.len() == 1 && *words.get("beta") == "again");

    HashTable<string, int> moved(std::move(animals));
    print_test("Move keeps entries", moved.len() == 3 && value_is(moved, "Monkey", 22));

    cout << "\n" << (failures == 0 ? "ALL TESTS PASSED" : "SOME TESTS FAILED") << endl;
    return failures == 0 ? 0 : 1;
}
