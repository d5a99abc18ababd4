#include <gtest/gtest.h>

#include <vector>

#include <glm/glm.hpp>

import Decimation;

#include "TestMeshBuilders.h"

using namespace Decimation;

// =============================================================================
// Per-vertex quadrics
// =============================================================================

TEST(CostModel_Quadrics, PlanarSquareQuadricsVanishInPlane)
{
    const auto input = MakeTwoTriangleSquare();
    const auto mesh = Connectivity::Mesh::Build(input.Positions, input.Faces);

    CostModel::QuadricStats stats;
    const auto quadrics = CostModel::ComputeVertexQuadrics(mesh, &stats);

    ASSERT_EQ(quadrics.size(), 4u);
    EXPECT_EQ(stats.FacesAccumulated, 2u);
    EXPECT_EQ(stats.DegenerateFaces, 0u);

    // v0 and v2 touch both faces, v1 and v3 only one
    EXPECT_NEAR(quadrics[0].Evaluate(0.3, 0.7, 0.0), 0.0, 1e-12);
    EXPECT_NEAR(quadrics[0].Evaluate(0.0, 0.0, 1.0), 2.0, 1e-12);
    EXPECT_NEAR(quadrics[2].Evaluate(0.0, 0.0, 1.0), 2.0, 1e-12);
    EXPECT_NEAR(quadrics[1].Evaluate(0.0, 0.0, 1.0), 1.0, 1e-12);
    EXPECT_NEAR(quadrics[3].Evaluate(0.0, 0.0, 1.0), 1.0, 1e-12);
}

TEST(CostModel_Quadrics, ZeroAreaFacesContributeNothing)
{
    IndexedMesh input;
    input.Positions = {
        {0.0f, 0.0f, 0.0f},
        {1.0f, 0.0f, 0.0f},
        {2.0f, 0.0f, 0.0f},
        {0.0f, 1.0f, 0.0f},
    };
    input.Faces = {{0, 1, 2}, {0, 1, 3}};

    const auto mesh = Connectivity::Mesh::Build(input.Positions, input.Faces);

    CostModel::QuadricStats stats;
    const auto quadrics = CostModel::ComputeVertexQuadrics(mesh, &stats);

    EXPECT_EQ(stats.FacesAccumulated, 1u);
    EXPECT_EQ(stats.DegenerateFaces, 1u);

    // v2 only touches the collinear face
    EXPECT_TRUE(quadrics[2].IsZero());
    EXPECT_FALSE(quadrics[0].IsZero());
}

// =============================================================================
// Pair evaluation
// =============================================================================

TEST(CostModel_EvaluatePair, IsolatedPairCollapsesToMidpoint)
{
    const Quadric zero;
    const auto estimate = CostModel::EvaluatePair(zero, zero, {0.0f, 0.0f, 0.0f}, {2.0f, 0.0f, 0.0f});

    EXPECT_EQ(estimate.Where, CostModel::Placement::Midpoint);
    EXPECT_FLOAT_EQ(estimate.Position.x, 1.0f);
    EXPECT_FLOAT_EQ(estimate.Position.y, 0.0f);
    EXPECT_FLOAT_EQ(estimate.Position.z, 0.0f);
    EXPECT_DOUBLE_EQ(estimate.Cost, 2.0);
}

TEST(CostModel_EvaluatePair, WellConditionedPairUsesOptimalPosition)
{
    Quadric qa = Quadric::FromPlane(1.0, 0.0, 0.0, -1.0);
    qa += Quadric::FromPlane(0.0, 1.0, 0.0, -2.0);
    qa += Quadric::FromPlane(0.0, 0.0, 1.0, -3.0);
    const Quadric qb;

    const auto estimate = CostModel::EvaluatePair(qa, qb, {0.0f, 0.0f, 0.0f}, {5.0f, 5.0f, 5.0f});

    EXPECT_EQ(estimate.Where, CostModel::Placement::Optimal);
    EXPECT_NEAR(estimate.Position.x, 1.0f, 1e-5f);
    EXPECT_NEAR(estimate.Position.y, 2.0f, 1e-5f);
    EXPECT_NEAR(estimate.Position.z, 3.0f, 1e-5f);
    EXPECT_DOUBLE_EQ(estimate.Cost, 0.0);
}

TEST(CostModel_EvaluatePair, SingularPairFallsBackToMidpoint)
{
    // Both endpoints on the plane z = 0: midpoint is as good as either end
    const Quadric q = Quadric::FromPlane(0.0, 0.0, 1.0, 0.0);
    const auto estimate = CostModel::EvaluatePair(q, q, {0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f});

    EXPECT_EQ(estimate.Where, CostModel::Placement::Midpoint);
    EXPECT_FLOAT_EQ(estimate.Position.x, 0.5f);
    EXPECT_DOUBLE_EQ(estimate.Cost, 0.0);
}

TEST(CostModel_EvaluatePair, SingularPairPrefersStrictlyBetterEndpoint)
{
    // Error vanishes only on the x axis; a sits on it, b does not
    Quadric qa = Quadric::FromPlane(0.0, 0.0, 1.0, 0.0);
    qa += Quadric::FromPlane(0.0, 1.0, 0.0, 0.0);
    const Quadric qb;

    const auto estimate = CostModel::EvaluatePair(qa, qb, {0.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 1.0f});

    EXPECT_EQ(estimate.Where, CostModel::Placement::EndpointA);
    EXPECT_FLOAT_EQ(estimate.Position.y, 0.0f);
    EXPECT_FLOAT_EQ(estimate.Position.z, 0.0f);
    EXPECT_DOUBLE_EQ(estimate.Cost, 0.0);

    const auto swapped = CostModel::EvaluatePair(qb, qa, {0.0f, 1.0f, 1.0f}, {0.0f, 0.0f, 0.0f});
    EXPECT_EQ(swapped.Where, CostModel::Placement::EndpointB);
}

TEST(CostModel_EvaluatePair, CostIsNeverNegative)
{
    const auto input = MakeIcosahedron();
    const auto mesh = Connectivity::Mesh::Build(input.Positions, input.Faces);
    const auto quadrics = CostModel::ComputeVertexQuadrics(mesh);

    for (VertexIndex v = 0; v < input.Positions.size(); ++v)
    {
        for (VertexIndex u : mesh.Neighbors(v))
        {
            const auto e = CostModel::EvaluatePair(quadrics[v], quadrics[u], mesh.Position(v), mesh.Position(u));
            EXPECT_GE(e.Cost, 0.0);
        }
    }
}

// =============================================================================
// Survivor choice
// =============================================================================

TEST(CostModel_Survivor, LowerOwnErrorSurvives)
{
    const Quadric q0 = Quadric::FromPlane(0.0, 0.0, 1.0, 0.0);   // z = 0
    const Quadric q1 = Quadric::FromPlane(0.0, 0.0, 1.0, -1.0);  // z = 1
    const glm::vec3 p{0.0f, 0.0f, 0.25f};

    EXPECT_EQ(CostModel::ChooseSurvivor(4, 7, q0, q1, p), 4u);
    EXPECT_EQ(CostModel::ChooseSurvivor(4, 7, q1, q0, p), 7u);
}

TEST(CostModel_Survivor, TiesGoToLowerIndex)
{
    const Quadric q = Quadric::FromPlane(0.0, 0.0, 1.0, 0.0);
    const glm::vec3 p{1.0f, 1.0f, 0.5f};

    EXPECT_EQ(CostModel::ChooseSurvivor(5, 3, q, q, p), 3u);
    EXPECT_EQ(CostModel::ChooseSurvivor(3, 5, q, q, p), 3u);

    const Quadric zero;
    EXPECT_EQ(CostModel::ChooseSurvivor(9, 2, zero, zero, p), 2u);
}
