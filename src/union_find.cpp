#include "union_find.hpp"
#include <utility>

int DisjointSet::make_set() {
    const int id = (int)m_parent.size();
    m_parent.push_back(id);
    m_rank.push_back(0);
    return id;
}

int DisjointSet::find(int i) {
    int root = i;
    while (m_parent[root] != root) root = m_parent[root];
    // Second walk points every node on the path straight at the root.
    while (m_parent[i] != root) {
        int next = m_parent[i];
        m_parent[i] = root;
        i = next;
    }
    return root;
}

int DisjointSet::unite(int a, int b) {
    int ra = find(a), rb = find(b);
    if (ra == rb) return ra;
    if (m_rank[ra] < m_rank[rb]) std::swap(ra, rb);
    m_parent[rb] = ra;
    if (m_rank[ra] == m_rank[rb]) ++m_rank[ra];
    return ra;
}
