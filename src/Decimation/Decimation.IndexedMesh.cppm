module;

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

#include <glm/glm.hpp>

export module Decimation:IndexedMesh;

export namespace Decimation
{
    using VertexIndex = std::uint32_t;
    using FaceIndex = std::uint32_t;

    inline constexpr std::uint32_t kInvalidIndex = std::numeric_limits<std::uint32_t>::max();

    // Ordered vertex triple. Winding is preserved through every operation.
    using Triangle = std::array<VertexIndex, 3>;

    // Plain indexed triangle mesh, the only form in which geometry enters and
    // leaves the decimation engine.
    struct IndexedMesh
    {
        std::vector<glm::vec3> Positions;
        std::vector<Triangle> Faces;

        [[nodiscard]] std::size_t VertexCount() const noexcept { return Positions.size(); }
        [[nodiscard]] std::size_t FaceCount() const noexcept { return Faces.size(); }
    };
}
