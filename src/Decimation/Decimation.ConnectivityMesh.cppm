module;

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <glm/glm.hpp>

export module Decimation:ConnectivityMesh;

import :IndexedMesh;

export namespace Decimation::Connectivity
{
    // =========================================================================
    // Vertex/face adjacency store for pair contraction
    // =========================================================================
    //
    // Unlike a halfedge structure, this store does not require a manifold
    // surface: any two live vertices can be merged, which is what proximity
    // merges between unconnected components need. Each vertex keeps the
    // sorted list of its incident faces; vertex neighbors are derived from it.
    //
    // Elements are never physically removed while the mesh is mutated. They
    // are flagged deleted and dropped by Compact().

    enum class CollapseCheck : std::uint8_t
    {
        Ok,
        SameVertex,
        DeletedEndpoint,
        FlipsFace,      // a surviving face would reverse its orientation
        OrphansVertex   // a vertex would be left without any incident face
    };

    struct MergeResult
    {
        VertexIndex Survivor{kInvalidIndex};
        VertexIndex Removed{kInvalidIndex};

        // Faces deleted because they repeated a vertex or became duplicates
        std::vector<FaceIndex> RemovedFaces;

        // Faces that referenced the removed vertex and now reference the survivor
        std::vector<FaceIndex> RewrittenFaces;

        // Live vertices whose adjacency changed, sorted, survivor included
        std::vector<VertexIndex> AffectedVertices;

        std::size_t DuplicateFacesRemoved{0};
    };

    class Mesh
    {
    public:
        Mesh() = default;

        // Precondition: faces are validated (in range, three distinct indices).
        // A face equal to an earlier face up to rotation is dropped; the same
        // corners in opposite winding are a distinct face.
        [[nodiscard]] static Mesh Build(std::span<const glm::vec3> positions, std::span<const Triangle> faces);

        [[nodiscard]] std::size_t VerticesSize() const noexcept { return m_Positions.size(); }
        [[nodiscard]] std::size_t FacesSize() const noexcept { return m_Faces.size(); }

        [[nodiscard]] std::size_t VertexCount() const noexcept { return VerticesSize() - m_DeletedVertices; }
        [[nodiscard]] std::size_t FaceCount() const noexcept { return FacesSize() - m_DeletedFaces; }

        [[nodiscard]] std::size_t DuplicateFacesDropped() const noexcept { return m_DuplicateFacesDropped; }

        [[nodiscard]] bool IsDeleted(VertexIndex v) const { return m_VDeleted[v]; }
        [[nodiscard]] bool IsFaceDeleted(FaceIndex f) const { return m_FDeleted[f]; }
        [[nodiscard]] bool IsIsolated(VertexIndex v) const { return m_VertexFaces[v].empty(); }

        [[nodiscard]] const glm::vec3& Position(VertexIndex v) const { return m_Positions[v]; }
        [[nodiscard]] const Triangle& Face(FaceIndex f) const { return m_Faces[f]; }
        [[nodiscard]] std::span<const FaceIndex> IncidentFaces(VertexIndex v) const { return m_VertexFaces[v]; }

        // Distinct vertices sharing at least one live face with v, ascending.
        [[nodiscard]] std::vector<VertexIndex> Neighbors(VertexIndex v) const;

        [[nodiscard]] bool SharesFace(VertexIndex a, VertexIndex b) const;

        // Whether merging a and b at position keeps every surviving face
        // oriented and every vertex attached to at least one face.
        [[nodiscard]] CollapseCheck IsCollapseOk(VertexIndex a, VertexIndex b, glm::vec3 position) const;

        // Moves keep to position and folds drop into it. Faces containing both
        // vertices are removed, as are faces that become rotations of another
        // live face (the lower face index survives). drop is marked deleted.
        MergeResult Merge(VertexIndex keep, VertexIndex drop, glm::vec3 position);

        // Dense, 0-based copy of the live mesh. Live vertices and faces keep
        // their relative order; face winding is preserved.
        [[nodiscard]] IndexedMesh Compact() const;

    private:
        void RemoveFace(FaceIndex f);
        [[nodiscard]] bool HasFaceAvoidingPair(VertexIndex v, VertexIndex a, VertexIndex b) const;
        [[nodiscard]] bool ContainsVertex(FaceIndex f, VertexIndex v) const;

        std::vector<glm::vec3> m_Positions;
        std::vector<Triangle> m_Faces;
        std::vector<std::vector<FaceIndex>> m_VertexFaces;

        std::vector<bool> m_VDeleted;
        std::vector<bool> m_FDeleted;

        std::size_t m_DeletedVertices{0};
        std::size_t m_DeletedFaces{0};
        std::size_t m_DuplicateFacesDropped{0};
    };
}
