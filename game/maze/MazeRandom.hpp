#pragma once

#include <cstddef>
#include <cstdint>
#include <numeric>
#include <utility>
#include <vector>

namespace trisolar::maze
{
/// Deterministic 32-bit generator (mulberry32). Output matches the browser client
/// bit for bit, so the client can rebuild the same maze from a seed.
class Mulberry32
{
public:
    explicit Mulberry32(std::uint32_t seed)
        : m_state(seed)
    {
    }

    /// Uniform double in [0, 1).
    double Next()
    {
        m_state += 0x6D2B79F5U;
        std::uint32_t t = (m_state ^ (m_state >> 15U)) * (1U | m_state);
        t = (t + ((t ^ (t >> 7U)) * (61U | t))) ^ t;
        return static_cast<double>(t ^ (t >> 14U)) / 4294967296.0;
    }

    double operator()() { return Next(); }

private:
    std::uint32_t m_state;
};

/// Fisher-Yates from the back; j = floor(rng * (i + 1)).
template <typename T, typename Rng>
std::vector<T>& Shuffle(std::vector<T>& items, Rng& rng)
{
    if (items.size() < 2)
    {
        return items;
    }

    for (std::size_t i = items.size() - 1; i > 0; --i)
    {
        const auto j = static_cast<std::size_t>(rng() * static_cast<double>(i + 1));
        std::swap(items[i], items[j]);
    }
    return items;
}

/// Disjoint set with union by rank and path compression.
class UnionFind
{
public:
    explicit UnionFind(std::size_t size)
        : m_parent(size)
        , m_rank(size, 0)
    {
        std::iota(m_parent.begin(), m_parent.end(), std::size_t{0});
    }

    std::size_t Find(std::size_t x)
    {
        std::size_t root = x;
        while (m_parent[root] != root)
        {
            root = m_parent[root];
        }
        while (m_parent[x] != root)
        {
            const std::size_t next = m_parent[x];
            m_parent[x] = root;
            x = next;
        }
        return root;
    }

    /// Returns false when both were already in the same set.
    bool Union(std::size_t a, std::size_t b)
    {
        const std::size_t ra = Find(a);
        const std::size_t rb = Find(b);
        if (ra == rb)
        {
            return false;
        }

        if (m_rank[ra] < m_rank[rb])
        {
            m_parent[ra] = rb;
        }
        else if (m_rank[ra] > m_rank[rb])
        {
            m_parent[rb] = ra;
        }
        else
        {
            m_parent[rb] = ra;
            ++m_rank[ra];
        }
        return true;
    }

    [[nodiscard]] bool Connected(std::size_t a, std::size_t b) { return Find(a) == Find(b); }

private:
    std::vector<std::size_t> m_parent;
    std::vector<int> m_rank;
};
} // namespace trisolar::maze
