#pragma once
#include <cstddef>

// Number of chains in every HashTable. Never changes after construction.
constexpr std::size_t BUCKET_SIZE = 8;
