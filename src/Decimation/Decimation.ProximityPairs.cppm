module;

#include <compare>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <glm/glm.hpp>

export module Decimation:ProximityPairs;

import :IndexedMesh;

export namespace Decimation::Clustering
{
    // =========================================================================
    // Threshold clustering candidates
    // =========================================================================
    //
    // Every pair of vertices whose Euclidean distance is <= threshold becomes a
    // contraction candidate, whether or not the two share a face. These pairs
    // let the collapse loop stitch coincident or nearly coincident vertices of
    // unconnected components. Pairs are found with a KD-tree radius query per
    // vertex, so the pass is O(n log n + pairs) rather than O(n^2).

    struct ProximityPair
    {
        VertexIndex Lo{kInvalidIndex};
        VertexIndex Hi{kInvalidIndex};

        auto operator<=>(const ProximityPair&) const = default;
    };

    struct ProximityStats
    {
        std::size_t PairCount{0};
        std::size_t DistanceEvaluations{0};
    };

    // Unique pairs (Lo < Hi) within threshold, sorted ascending.
    // Returns nullopt when threshold is negative or not finite.
    [[nodiscard]] std::optional<std::vector<ProximityPair>> FindProximityPairs(
        std::span<const glm::vec3> positions,
        float threshold,
        ProximityStats* stats = nullptr);
}
