module;

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

export module Decimation:CollapseHeap;

import :IndexedMesh;

export namespace Decimation
{
    enum class PairKind : std::uint8_t
    {
        Edge,       // endpoints share at least one face
        Proximity   // endpoints closer than the clustering threshold
    };

    struct CollapseCandidate
    {
        VertexIndex Lo{kInvalidIndex};
        VertexIndex Hi{kInvalidIndex};
        double Cost{0.0};
        glm::vec3 Position{0.0f};
        std::uint32_t GenerationLo{0}; // To detect stale entries
        std::uint32_t GenerationHi{0};
        PairKind Kind{PairKind::Edge};
    };

    // Ascending cost; equal costs resolve by ascending (Lo, Hi).
    [[nodiscard]] constexpr bool CollapsesBefore(const CollapseCandidate& a, const CollapseCandidate& b)
    {
        if (a.Cost != b.Cost) return a.Cost < b.Cost;
        if (a.Lo != b.Lo) return a.Lo < b.Lo;
        return a.Hi < b.Hi;
    }

    // True once either endpoint has taken part in a merge since c was pushed.
    [[nodiscard]] constexpr bool IsStale(const CollapseCandidate& c, std::span<const std::uint32_t> generation)
    {
        return c.GenerationLo != generation[c.Lo] || c.GenerationHi != generation[c.Hi];
    }

    // =========================================================================
    // Binary min-heap for the collapse priority queue
    // =========================================================================
    //
    // Entries are never updated in place. A re-scored pair is pushed again and
    // the old entry is recognised as stale on pop through its generation tags.

    class CollapseHeap
    {
    public:
        void Push(const CollapseCandidate& c)
        {
            m_Entries.push_back(c);
            SiftUp(m_Entries.size() - 1);
        }

        [[nodiscard]] bool Empty() const noexcept { return m_Entries.empty(); }
        [[nodiscard]] std::size_t Size() const noexcept { return m_Entries.size(); }

        [[nodiscard]] const CollapseCandidate& Top() const
        {
            assert(!m_Entries.empty());
            return m_Entries.front();
        }

        CollapseCandidate Pop()
        {
            assert(!m_Entries.empty());
            CollapseCandidate top = m_Entries[0];
            m_Entries[0] = m_Entries.back();
            m_Entries.pop_back();
            if (!m_Entries.empty()) SiftDown(0);
            return top;
        }

        void Reserve(std::size_t n) { m_Entries.reserve(n); }
        void Clear() { m_Entries.clear(); }

    private:
        void SiftUp(std::size_t i)
        {
            while (i > 0)
            {
                std::size_t parent = (i - 1) / 2;
                if (CollapsesBefore(m_Entries[i], m_Entries[parent]))
                {
                    std::swap(m_Entries[i], m_Entries[parent]);
                    i = parent;
                }
                else break;
            }
        }

        void SiftDown(std::size_t i)
        {
            const std::size_t n = m_Entries.size();
            while (true)
            {
                std::size_t left = 2 * i + 1;
                std::size_t right = 2 * i + 2;
                std::size_t smallest = i;

                if (left < n && CollapsesBefore(m_Entries[left], m_Entries[smallest]))
                    smallest = left;
                if (right < n && CollapsesBefore(m_Entries[right], m_Entries[smallest]))
                    smallest = right;

                if (smallest == i) break;
                std::swap(m_Entries[i], m_Entries[smallest]);
                i = smallest;
            }
        }

        std::vector<CollapseCandidate> m_Entries;
    };
}
