module;

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>
#include <glm/glm.hpp>

module Decimation:KDTree.Impl;
import :KDTree;

namespace Decimation
{
    namespace
    {
        struct PendingNode
        {
            KDTree::NodeIndex Index{0};
            std::uint32_t Depth{0};
        };

        [[nodiscard]] std::uint8_t WidestAxis(const glm::vec3& extent)
        {
            if (extent.x >= extent.y && extent.x >= extent.z) return 0;
            return extent.y >= extent.z ? 1 : 2;
        }
    }

    void KDTree::Clear()
    {
        m_Ordered.clear();
        m_ElementIndices.clear();
        m_Nodes.clear();
    }

    std::optional<KDTreeBuildResult> KDTree::BuildFromPoints(std::span<const glm::vec3> points,
        const KDTreeBuildParams& params)
    {
        Clear();

        if (points.empty() || params.LeafSize == 0 || params.MaxDepth == 0 ||
            !std::isfinite(params.MinSplitExtent) || params.MinSplitExtent < 0.0f)
        {
            return std::nullopt;
        }

        const auto count = static_cast<std::uint32_t>(points.size());
        m_ElementIndices.resize(count);
        for (ElementIndex i = 0; i < count; ++i) m_ElementIndices[i] = i;

        m_Nodes.push_back(Node{.Begin = 0, .End = count});

        std::vector<PendingNode> pending{{0u, 0u}};
        std::uint32_t maxDepthReached = 0;

        while (!pending.empty())
        {
            const PendingNode current = pending.back();
            pending.pop_back();
            maxDepthReached = std::max(maxDepthReached, current.Depth);

            const std::uint32_t begin = m_Nodes[current.Index].Begin;
            const std::uint32_t end = m_Nodes[current.Index].End;
            if (end - begin <= params.LeafSize || current.Depth >= params.MaxDepth) continue;

            glm::vec3 lo = points[m_ElementIndices[begin]];
            glm::vec3 hi = lo;
            for (std::uint32_t i = begin + 1; i < end; ++i)
            {
                lo = glm::min(lo, points[m_ElementIndices[i]]);
                hi = glm::max(hi, points[m_ElementIndices[i]]);
            }

            const std::uint8_t axis = WidestAxis(hi - lo);
            if ((hi - lo)[axis] <= params.MinSplitExtent) continue; // all coincident along every axis

            const std::uint32_t mid = begin + (end - begin) / 2;
            std::nth_element(m_ElementIndices.begin() + begin,
                             m_ElementIndices.begin() + mid,
                             m_ElementIndices.begin() + end,
                             [&](ElementIndex a, ElementIndex b)
                             {
                                 const float ca = points[a][axis];
                                 const float cb = points[b][axis];
                                 return ca != cb ? ca < cb : a < b;
                             });

            const auto left = static_cast<NodeIndex>(m_Nodes.size());
            const NodeIndex right = left + 1;

            Node& node = m_Nodes[current.Index];
            node.Left = left;
            node.Right = right;
            node.SplitAxis = axis;
            node.SplitValue = points[m_ElementIndices[mid]][axis];

            m_Nodes.push_back(Node{.Begin = begin, .End = mid});
            m_Nodes.push_back(Node{.Begin = mid, .End = end});

            pending.push_back({right, current.Depth + 1});
            pending.push_back({left, current.Depth + 1});
        }

        m_Ordered.reserve(count);
        for (ElementIndex e : m_ElementIndices) m_Ordered.push_back(points[e]);

        return KDTreeBuildResult{
            .ElementCount = m_ElementIndices.size(),
            .NodeCount = m_Nodes.size(),
            .MaxDepthReached = maxDepthReached,
        };
    }

    std::optional<KDTreeRadiusResult> KDTree::QueryRadius(const glm::vec3& query, const float radius,
        std::vector<ElementIndex>& outElementIndices) const
    {
        outElementIndices.clear();
        if (m_Nodes.empty() || !std::isfinite(radius) || radius < 0.0f) return std::nullopt;

        const float radius2 = radius * radius;
        KDTreeRadiusResult result;

        std::vector<NodeIndex> stack{0u};
        while (!stack.empty())
        {
            const Node& node = m_Nodes[stack.back()];
            stack.pop_back();
            ++result.VisitedNodes;

            if (node.IsLeaf())
            {
                for (std::uint32_t i = node.Begin; i < node.End; ++i)
                {
                    const glm::vec3 d = m_Ordered[i] - query;
                    ++result.DistanceEvaluations;
                    if (glm::dot(d, d) <= radius2) outElementIndices.push_back(m_ElementIndices[i]);
                }
                continue;
            }

            // Points beyond the split plane are at least |offset| away.
            const float offset = query[node.SplitAxis] - node.SplitValue;
            const NodeIndex nearSide = offset < 0.0f ? node.Left : node.Right;
            const NodeIndex farSide = offset < 0.0f ? node.Right : node.Left;

            if (offset * offset <= radius2) stack.push_back(farSide);
            stack.push_back(nearSide);
        }

        std::sort(outElementIndices.begin(), outElementIndices.end());
        result.ReturnedCount = outElementIndices.size();
        return result;
    }
}
