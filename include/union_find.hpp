#pragma once
#include <cstdint>
#include <vector>

// Array-indexed disjoint-set forest. Elements are dense ints handed out by
// make_set(); union by rank, find with path compression.
class DisjointSet {
public:
    DisjointSet() = default;
    explicit DisjointSet(int reserve) { m_parent.reserve(reserve); m_rank.reserve(reserve); }

    int  make_set();
    int  find(int i);
    // Returns the surviving root.
    int  unite(int a, int b);
    int  size() const { return (int)m_parent.size(); }

private:
    std::vector<int>     m_parent;
    std::vector<uint8_t> m_rank;
};
