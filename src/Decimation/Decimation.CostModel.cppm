module;

#include <cstddef>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

export module Decimation:CostModel;

import :IndexedMesh;
import :Quadric;
import :ConnectivityMesh;

export namespace Decimation::CostModel
{
    // =========================================================================
    // Quadric Error Metric pair costs
    // =========================================================================
    //
    // Garland & Heckbert (1997): every vertex carries Q_v = sum of K_f over its
    // incident faces f, with K_f = k k^T for the unit plane k = (a, b, c, d).
    // Contracting a pair (v_i, v_j) into v' costs v'^T (Q_i + Q_j) v'.
    //
    // Placement ladder for v':
    //   1. the stationary point of the quadric, if the 3x3 block is well
    //      conditioned;
    //   2. the midpoint of the pair;
    //   3. the better endpoint, if it beats the midpoint by more than the
    //      numerical tolerance.
    // If both quadrics are zero (two isolated vertices), v' is the midpoint
    // and the cost is the summed squared distance of the endpoints to it.

    enum class Placement : std::uint8_t
    {
        Optimal,
        Midpoint,
        EndpointA,
        EndpointB
    };

    struct CollapseEstimate
    {
        double Cost{0.0};
        glm::vec3 Position{0.0f};
        Placement Where{Placement::Midpoint};
    };

    struct QuadricStats
    {
        std::size_t FacesAccumulated{0};
        std::size_t DegenerateFaces{0};
    };

    // Costs below this are rounding noise and are reported as exactly zero.
    inline constexpr double kCostNoiseFloor = 1e-12;

    // Per-vertex quadrics over the live faces of the mesh; zero-area faces are
    // skipped and counted in stats.
    [[nodiscard]] std::vector<Quadric> ComputeVertexQuadrics(const Connectivity::Mesh& mesh,
                                                             QuadricStats* stats = nullptr);

    [[nodiscard]] CollapseEstimate EvaluatePair(const Quadric& qa, const Quadric& qb,
                                                glm::vec3 pa, glm::vec3 pb);

    // The endpoint whose own quadric is lower at the merge position survives;
    // ties (up to rounding) go to the lower index.
    [[nodiscard]] VertexIndex ChooseSurvivor(VertexIndex a, VertexIndex b,
                                             const Quadric& qa, const Quadric& qb,
                                             glm::vec3 position);
}
