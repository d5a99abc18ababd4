module;

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

export module Decimation:Simplification;

import Core.Error;
import :IndexedMesh;

export namespace Decimation::Simplification
{
    // =========================================================================
    // Quadric Error Metric (QEM) Vertex-Pair Contraction
    // =========================================================================
    //
    // Garland & Heckbert (1997) "Surface Simplification Using Quadric Error
    // Metrics", driven to a target vertex count.
    //
    // Algorithm overview:
    //   1. Validate the input and build the vertex/face connectivity store.
    //
    //   2. For each vertex, accumulate Q_v = sum of K_f over incident faces.
    //
    //   3. Candidate pairs are the mesh edges plus, if a threshold is given,
    //      every vertex pair within that distance (proximity pairs). Both
    //      kinds are costed by the same model and share one min-heap, ordered
    //      by (cost, lower index, higher index).
    //
    //   4. Pop the cheapest pair. Entries carry the generation counters of
    //      their endpoints; an entry whose endpoint was merged since it was
    //      pushed is stale and skipped. A pair that would flip a face or
    //      orphan a vertex is dropped until a later merge re-derives it.
    //
    //   5. Contract the pair: the survivor moves to the chosen position and
    //      takes Q_i + Q_j. Every live neighbor of the survivor (mesh
    //      neighbors and inherited proximity partners) is re-scored.
    //
    //   6. Stop at the target vertex count, when the heap runs dry (reported,
    //      not an error) or when the cheapest pair exceeds MaxError.
    //
    //   7. Compact the surviving vertices and faces into dense arrays.
    //
    // Stages: Init -> Clustering (threshold only) -> Collapsing -> Compacting -> Done.

    struct SimplificationParams
    {
        // The loop stops once this many vertices remain. Must lie in
        // [1, positions.size()]; equal to the vertex count is an identity run.
        std::size_t TargetVertexCount{1};

        // Maximum distance between two vertices for them to be merge
        // candidates without sharing a face. Disabled by default.
        std::optional<float> Threshold{};

        // Maximum allowed error per collapse. Set to a very large value to
        // use only the vertex count target.
        double MaxError{1e30};

        // Keep the cost of every applied collapse, in execution order.
        bool RecordCollapseCosts{false};
    };

    enum class Stage : std::uint8_t
    {
        Init,
        Clustering,
        Collapsing,
        Compacting,
        Done
    };

    constexpr std::string_view StageToString(Stage stage)
    {
        switch (stage)
        {
            case Stage::Init:       return "Init";
            case Stage::Clustering: return "Clustering";
            case Stage::Collapsing: return "Collapsing";
            case Stage::Compacting: return "Compacting";
            case Stage::Done:       return "Done";
        }
        return "Unknown";
    }

    struct SimplificationResult
    {
        std::size_t InitialVertexCount{0};
        std::size_t InitialFaceCount{0};
        std::size_t FinalVertexCount{0};
        std::size_t FinalFaceCount{0};

        // Number of collapses performed, split by candidate kind
        std::size_t CollapseCount{0};
        std::size_t EdgeCollapseCount{0};
        std::size_t ProximityMergeCount{0};

        std::size_t ProximityCandidates{0};
        std::size_t RejectedCollapses{0};
        std::size_t StaleEntriesSkipped{0};
        std::size_t DegenerateFacesSkipped{0};
        std::size_t DuplicateFacesDropped{0};

        // Maximum error of any performed collapse
        double MaxCollapseError{0.0};

        bool TargetReached{false};
        bool StoppedByMaxError{false};

        // Filled only with SimplificationParams::RecordCollapseCosts
        std::vector<double> CollapseCosts;
    };

    struct SimplificationOutput
    {
        IndexedMesh Mesh;
        SimplificationResult Report;
    };

    // -------------------------------------------------------------------------
    // Simplify an indexed triangle mesh
    // -------------------------------------------------------------------------
    //
    // The inputs are not modified. Returns InvalidArgument for malformed faces,
    // non-finite positions or a bad threshold, OutOfRange for a target outside
    // [1, positions.size()]. An unreachable target is not an error: the result
    // holds the best mesh reached and Report.TargetReached is false.
    [[nodiscard]] Core::Expected<SimplificationOutput> Simplify(
        std::span<const glm::vec3> positions,
        std::span<const Triangle> faces,
        const SimplificationParams& params);

    [[nodiscard]] Core::Expected<SimplificationOutput> Simplify(
        const IndexedMesh& mesh,
        const SimplificationParams& params);

} // namespace Decimation::Simplification
