#pragma once
#include <cstddef>
#include <utility>

// One chain of a HashTable. Keys in a chain are pairwise distinct.
template<typename K, typename V>
class Bucket {
    struct Node {
        K key;
        V value;
        Node* next;
        Node(K&& k, V&& v, Node* nx) : key(std::move(k)), value(std::move(v)), next(nx) {}
    };

    Node* head;
    std::size_t count;

    Node* find(const K& key) const {
        for (Node* cur = head; cur; cur = cur->next)
            if (cur->key == key) return cur;
        return nullptr;
    }

public:

    Bucket() : head(nullptr), count(0) {}
    ~Bucket() { clear(); }


    Bucket(Bucket&& other) noexcept : head(other.head), count(other.count) {
        other.head = nullptr;
        other.count = 0;
    }
    Bucket& operator=(Bucket&& other) noexcept {
        if (this != &other) {
            clear();
            head = other.head; count = other.count;
            other.head = nullptr;
            other.count = 0;
        }
        return *this;
    }
    Bucket(const Bucket&) = delete;
    Bucket& operator=(const Bucket&) = delete;


    // Existing key: value replaced in place. New key: prepended as head.
    void insert(K key, V value) {
        if (Node* n = find(key)) {
            n->value = std::move(value);
            return;
        }
        head = new Node(std::move(key), std::move(value), head);
        ++count;
    }

    void remove(const K& key) {
        Node** link = &head;
        while (*link) {
            Node* cur = *link;
            if (cur->key == key) {
                *link = cur->next;
                delete cur;
                --count;
                return;
            }
            link = &cur->next;
        }
    }

    V* get(const K& key) {
        Node* n = find(key);
        return n ? &n->value : nullptr;
    }
    const V* get(const K& key) const {
        const Node* n = find(key);
        return n ? &n->value : nullptr;
    }

    std::size_t size() const { return count; }
    bool empty() const { return count == 0; }

    void clear() {
        Node* cur = head;
        while (cur) {
            Node* nx = cur->next;
            delete cur;
            cur = nx;
        }
        head = nullptr;
        count = 0;
    }
};
