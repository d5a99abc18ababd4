module;

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <vector>
#include <glm/glm.hpp>

export module Decimation:KDTree;

export namespace Decimation
{
    struct KDTreeBuildParams
    {
        std::uint32_t LeafSize{16};
        std::uint32_t MaxDepth{32};
        float MinSplitExtent{1.0e-12f};
    };

    struct KDTreeBuildResult
    {
        std::size_t ElementCount{0};
        std::size_t NodeCount{0};
        std::uint32_t MaxDepthReached{0};
    };

    struct KDTreeRadiusResult
    {
        std::size_t ReturnedCount{0};
        std::size_t VisitedNodes{0};
        std::size_t DistanceEvaluations{0};
    };

    // Static point KD-tree for fixed-radius neighbor search.
    //
    // Each inner node splits its range at the median of the widest axis; the
    // points of a leaf are stored contiguously so a leaf scan is a linear pass.
    // Points on the left of a split have coordinate <= SplitValue, points on
    // the right >= SplitValue.
    class KDTree
    {
    public:
        using NodeIndex = std::uint32_t;
        using ElementIndex = std::uint32_t;
        static constexpr NodeIndex kInvalidIndex = std::numeric_limits<NodeIndex>::max();

        struct Node
        {
            std::uint32_t Begin{0}; // range into ElementIndices()
            std::uint32_t End{0};
            NodeIndex Left{kInvalidIndex};
            NodeIndex Right{kInvalidIndex};
            float SplitValue{0.0f};
            std::uint8_t SplitAxis{0};

            [[nodiscard]] bool IsLeaf() const noexcept { return Left == kInvalidIndex; }
            [[nodiscard]] std::uint32_t Size() const noexcept { return End - Begin; }
        };

        [[nodiscard]] std::optional<KDTreeBuildResult> BuildFromPoints(std::span<const glm::vec3> points,
            const KDTreeBuildParams& params = {});

        // All points with |p - query| <= radius, ascending by element index.
        // Returns nullopt for an empty tree or a negative / non-finite radius.
        [[nodiscard]] std::optional<KDTreeRadiusResult> QueryRadius(const glm::vec3& query, float radius,
            std::vector<ElementIndex>& outElementIndices) const;

        [[nodiscard]] std::size_t Size() const noexcept { return m_ElementIndices.size(); }
        [[nodiscard]] const std::vector<ElementIndex>& ElementIndices() const noexcept { return m_ElementIndices; }
        [[nodiscard]] const std::vector<Node>& Nodes() const noexcept { return m_Nodes; }

    private:
        void Clear();

        // Positions in tree order: m_Ordered[i] is the point m_ElementIndices[i].
        std::vector<glm::vec3> m_Ordered{};
        std::vector<ElementIndex> m_ElementIndices{};
        std::vector<Node> m_Nodes{};
    };
}
