module;

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <initializer_list>
#include <set>
#include <span>
#include <vector>

#include <glm/glm.hpp>
#include <glm/geometric.hpp>

module Decimation:ConnectivityMesh.Impl;

import :ConnectivityMesh;
import :IndexedMesh;
import :Quadric;

namespace Decimation::Connectivity
{
    namespace
    {
        // Rotates the smallest index to the front and keeps the winding, so
        // {1,2,0} matches {0,1,2} but {0,2,1} does not.
        [[nodiscard]] Triangle RotationKey(const Triangle& t)
        {
            Triangle key = t;
            std::rotate(key.begin(), std::min_element(key.begin(), key.end()), key.end());
            return key;
        }

        void InsertSorted(std::vector<FaceIndex>& list, FaceIndex f)
        {
            auto it = std::lower_bound(list.begin(), list.end(), f);
            if (it == list.end() || *it != f) list.insert(it, f);
        }

        void EraseSorted(std::vector<FaceIndex>& list, FaceIndex f)
        {
            auto it = std::lower_bound(list.begin(), list.end(), f);
            if (it != list.end() && *it == f) list.erase(it);
        }
    }

    Mesh Mesh::Build(std::span<const glm::vec3> positions, std::span<const Triangle> faces)
    {
        Mesh mesh;
        const std::size_t nV = positions.size();

        mesh.m_Positions.assign(positions.begin(), positions.end());
        mesh.m_VertexFaces.resize(nV);
        mesh.m_VDeleted.assign(nV, false);
        mesh.m_Faces.reserve(faces.size());

        std::set<Triangle> seen;
        for (const Triangle& tri : faces)
        {
            assert(tri[0] < nV && tri[1] < nV && tri[2] < nV);
            assert(tri[0] != tri[1] && tri[1] != tri[2] && tri[0] != tri[2]);

            if (!seen.insert(RotationKey(tri)).second)
            {
                ++mesh.m_DuplicateFacesDropped;
                continue;
            }

            const auto f = static_cast<FaceIndex>(mesh.m_Faces.size());
            mesh.m_Faces.push_back(tri);
            for (VertexIndex v : tri)
                mesh.m_VertexFaces[v].push_back(f); // faces arrive in ascending order
        }

        mesh.m_FDeleted.assign(mesh.m_Faces.size(), false);
        return mesh;
    }

    bool Mesh::ContainsVertex(FaceIndex f, VertexIndex v) const
    {
        const Triangle& t = m_Faces[f];
        return t[0] == v || t[1] == v || t[2] == v;
    }

    std::vector<VertexIndex> Mesh::Neighbors(VertexIndex v) const
    {
        std::vector<VertexIndex> result;
        result.reserve(m_VertexFaces[v].size() * 2);
        for (FaceIndex f : m_VertexFaces[v])
        {
            for (VertexIndex u : m_Faces[f])
            {
                if (u != v) result.push_back(u);
            }
        }
        std::sort(result.begin(), result.end());
        result.erase(std::unique(result.begin(), result.end()), result.end());
        return result;
    }

    bool Mesh::SharesFace(VertexIndex a, VertexIndex b) const
    {
        const auto& fa = m_VertexFaces[a];
        const auto& fb = m_VertexFaces[b];
        const auto& smaller = fa.size() <= fb.size() ? fa : fb;
        const VertexIndex other = fa.size() <= fb.size() ? b : a;
        return std::any_of(smaller.begin(), smaller.end(),
                           [&](FaceIndex f) { return ContainsVertex(f, other); });
    }

    bool Mesh::HasFaceAvoidingPair(VertexIndex v, VertexIndex a, VertexIndex b) const
    {
        return std::any_of(m_VertexFaces[v].begin(), m_VertexFaces[v].end(),
                           [&](FaceIndex f) { return !(ContainsVertex(f, a) && ContainsVertex(f, b)); });
    }

    CollapseCheck Mesh::IsCollapseOk(VertexIndex a, VertexIndex b, glm::vec3 position) const
    {
        if (a == b) return CollapseCheck::SameVertex;
        if (IsDeleted(a) || IsDeleted(b)) return CollapseCheck::DeletedEndpoint;

        std::size_t survivingFaces = 0;

        for (VertexIndex v : {a, b})
        {
            for (FaceIndex f : m_VertexFaces[v])
            {
                const Triangle& tri = m_Faces[f];
                const bool hasA = ContainsVertex(f, a);
                const bool hasB = ContainsVertex(f, b);

                if (hasA && hasB)
                {
                    // This face disappears; its third corner must stay attached.
                    for (VertexIndex c : tri)
                    {
                        if (c == a || c == b) continue;
                        if (!HasFaceAvoidingPair(c, a, b)) return CollapseCheck::OrphansVertex;
                    }
                    continue;
                }

                ++survivingFaces;

                glm::vec3 p[3];
                glm::vec3 q[3];
                for (int i = 0; i < 3; ++i)
                {
                    p[i] = m_Positions[tri[i]];
                    q[i] = (tri[i] == a || tri[i] == b) ? position : p[i];
                }

                const glm::vec3 nOld = TriangleNormal(p[0], p[1], p[2]);
                const glm::vec3 nNew = TriangleNormal(q[0], q[1], q[2]);
                if (glm::dot(nOld, nNew) < 0.0f) return CollapseCheck::FlipsFace;
            }
        }

        const bool hadFaces = !m_VertexFaces[a].empty() || !m_VertexFaces[b].empty();
        if (hadFaces && survivingFaces == 0) return CollapseCheck::OrphansVertex;

        return CollapseCheck::Ok;
    }

    void Mesh::RemoveFace(FaceIndex f)
    {
        assert(!m_FDeleted[f]);
        for (VertexIndex v : m_Faces[f])
            EraseSorted(m_VertexFaces[v], f);
        m_FDeleted[f] = true;
        ++m_DeletedFaces;
    }

    MergeResult Mesh::Merge(VertexIndex keep, VertexIndex drop, glm::vec3 position)
    {
        assert(keep != drop);
        assert(!IsDeleted(keep) && !IsDeleted(drop));

        MergeResult result;
        result.Survivor = keep;
        result.Removed = drop;

        std::vector<VertexIndex> affected = Neighbors(keep);
        {
            std::vector<VertexIndex> dropRing = Neighbors(drop);
            affected.insert(affected.end(), dropRing.begin(), dropRing.end());
        }
        affected.push_back(keep);

        m_Positions[keep] = position;

        const std::vector<FaceIndex> dropFaces = m_VertexFaces[drop];
        for (FaceIndex f : dropFaces)
        {
            if (ContainsVertex(f, keep))
            {
                RemoveFace(f);
                result.RemovedFaces.push_back(f);
                continue;
            }

            for (VertexIndex& v : m_Faces[f])
            {
                if (v == drop) v = keep;
            }
            InsertSorted(m_VertexFaces[keep], f);
            result.RewrittenFaces.push_back(f);
        }

        m_VertexFaces[drop].clear();
        m_VDeleted[drop] = true;
        ++m_DeletedVertices;

        // Two faces wound the same way around an edge, with apexes at keep and
        // drop, are now the same face. Keep the lower face index. Faces with
        // opposite winding stay: together they form a two-sided sheet.
        std::set<Triangle> seen;
        const std::vector<FaceIndex> keepFaces = m_VertexFaces[keep];
        for (FaceIndex f : keepFaces)
        {
            if (seen.insert(RotationKey(m_Faces[f])).second) continue;

            RemoveFace(f);
            result.RemovedFaces.push_back(f);
            ++result.DuplicateFacesRemoved;
        }

        std::sort(affected.begin(), affected.end());
        affected.erase(std::unique(affected.begin(), affected.end()), affected.end());
        affected.erase(std::remove(affected.begin(), affected.end(), drop), affected.end());
        result.AffectedVertices = std::move(affected);

        return result;
    }

    IndexedMesh Mesh::Compact() const
    {
        IndexedMesh out;
        out.Positions.reserve(VertexCount());
        out.Faces.reserve(FaceCount());

        std::vector<VertexIndex> remap(VerticesSize(), kInvalidIndex);
        for (std::size_t vi = 0; vi < VerticesSize(); ++vi)
        {
            if (m_VDeleted[vi]) continue;
            remap[vi] = static_cast<VertexIndex>(out.Positions.size());
            out.Positions.push_back(m_Positions[vi]);
        }

        for (std::size_t fi = 0; fi < FacesSize(); ++fi)
        {
            if (m_FDeleted[fi]) continue;
            const Triangle& t = m_Faces[fi];
            assert(remap[t[0]] != kInvalidIndex && remap[t[1]] != kInvalidIndex && remap[t[2]] != kInvalidIndex);
            out.Faces.push_back({remap[t[0]], remap[t[1]], remap[t[2]]});
        }

        return out;
    }
}
