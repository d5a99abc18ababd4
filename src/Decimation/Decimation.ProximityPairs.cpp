module;

#include <cmath>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <glm/glm.hpp>

module Decimation:ProximityPairs.Impl;

import :ProximityPairs;
import :IndexedMesh;
import :KDTree;

namespace Decimation::Clustering
{
    std::optional<std::vector<ProximityPair>> FindProximityPairs(
        std::span<const glm::vec3> positions,
        float threshold,
        ProximityStats* stats)
    {
        if (!std::isfinite(threshold) || threshold < 0.0f) return std::nullopt;

        std::vector<ProximityPair> pairs;
        ProximityStats local;

        if (positions.size() < 2)
        {
            if (stats) *stats = local;
            return pairs;
        }

        KDTree tree;
        if (!tree.BuildFromPoints(positions).has_value()) return std::nullopt;

        std::vector<KDTree::ElementIndex> hits;
        for (std::size_t i = 0; i < positions.size(); ++i)
        {
            const auto query = tree.QueryRadius(positions[i], threshold, hits);
            if (!query) continue;

            local.DistanceEvaluations += query->DistanceEvaluations;

            // hits are ascending; keep only partners above i so each pair is emitted once
            for (KDTree::ElementIndex j : hits)
            {
                if (j <= i) continue;
                pairs.push_back({static_cast<VertexIndex>(i), static_cast<VertexIndex>(j)});
            }
        }

        local.PairCount = pairs.size();
        if (stats) *stats = local;
        return pairs;
    }
}
