module;

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <vector>

#include <glm/glm.hpp>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtx/norm.hpp>

module Decimation:CostModel.Impl;

import :CostModel;
import :IndexedMesh;
import :Quadric;
import :ConnectivityMesh;

namespace Decimation::CostModel
{
    std::vector<Quadric> ComputeVertexQuadrics(const Connectivity::Mesh& mesh, QuadricStats* stats)
    {
        std::vector<Quadric> quadrics(mesh.VerticesSize());
        QuadricStats local;

        for (std::size_t fi = 0; fi < mesh.FacesSize(); ++fi)
        {
            const auto f = static_cast<FaceIndex>(fi);
            if (mesh.IsFaceDeleted(f)) continue;

            const Triangle& tri = mesh.Face(f);
            auto plane = TrianglePlane(mesh.Position(tri[0]), mesh.Position(tri[1]), mesh.Position(tri[2]));
            if (!plane)
            {
                ++local.DegenerateFaces;
                continue;
            }

            const Quadric kf = Quadric::FromPlane(*plane);
            quadrics[tri[0]] += kf;
            quadrics[tri[1]] += kf;
            quadrics[tri[2]] += kf;
            ++local.FacesAccumulated;
        }

        if (stats) *stats = local;
        return quadrics;
    }

    CollapseEstimate EvaluatePair(const Quadric& qa, const Quadric& qb, glm::vec3 pa, glm::vec3 pb)
    {
        const Quadric q = qa + qb;
        const glm::vec3 pm = (pa + pb) * 0.5f;

        CollapseEstimate estimate;

        if (q.IsZero())
        {
            estimate.Position = pm;
            estimate.Where = Placement::Midpoint;
            estimate.Cost = static_cast<double>(glm::distance2(pa, pm)) +
                            static_cast<double>(glm::distance2(pb, pm));
        }
        else if (auto opt = q.OptimalPosition())
        {
            estimate.Position = *opt;
            estimate.Where = Placement::Optimal;
            estimate.Cost = q.Evaluate(*opt);
        }
        else
        {
            const double cm = q.Evaluate(pm);
            const double ca = q.Evaluate(pa);
            const double cb = q.Evaluate(pb);
            const double tolerance = kCostNoiseFloor * (1.0 + q.Trace3x3());

            estimate.Position = pm;
            estimate.Where = Placement::Midpoint;
            estimate.Cost = cm;

            if (ca <= cb && ca < cm - tolerance)      { estimate.Position = pa; estimate.Where = Placement::EndpointA; estimate.Cost = ca; }
            else if (cb < ca && cb < cm - tolerance) { estimate.Position = pb; estimate.Where = Placement::EndpointB; estimate.Cost = cb; }
        }

        // Ensure non-negative cost (numerical precision)
        if (estimate.Cost < kCostNoiseFloor) estimate.Cost = 0.0;

        return estimate;
    }

    VertexIndex ChooseSurvivor(VertexIndex a, VertexIndex b, const Quadric& qa, const Quadric& qb,
                               glm::vec3 position)
    {
        const double ea = qa.Evaluate(position);
        const double eb = qb.Evaluate(position);

        // Differences at rounding level count as ties.
        const double tolerance = kCostNoiseFloor + 1e-9 * std::max(std::abs(ea), std::abs(eb));
        if (ea < eb - tolerance) return a;
        if (eb < ea - tolerance) return b;
        return a < b ? a : b;
    }
}
