#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

#include <glm/glm.hpp>

import Decimation;

TEST(KDTree, RejectsDegenerateBuildInputs)
{
    Decimation::KDTree tree;

    std::array<glm::vec3, 0> empty{};
    EXPECT_FALSE(tree.BuildFromPoints(empty).has_value());

    Decimation::KDTreeBuildParams params{};
    params.LeafSize = 0;

    std::array<glm::vec3, 2> points{
        glm::vec3{0.0f, 0.0f, 0.0f},
        glm::vec3{1.0f, 0.0f, 0.0f},
    };
    EXPECT_FALSE(tree.BuildFromPoints(points, params).has_value());

    params = {};
    params.MinSplitExtent = -1.0f;
    EXPECT_FALSE(tree.BuildFromPoints(points, params).has_value());
}

TEST(KDTree, RadiusQueryMatchesBruteForceSet)
{
    const std::vector<glm::vec3> points{
        {0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}, {0.0f, 0.0f, 1.0f},
        {2.0f, 2.0f, 2.0f}, {-1.0f, 0.0f, 0.0f},
    };

    Decimation::KDTree tree;
    ASSERT_TRUE(tree.BuildFromPoints(points).has_value());

    const glm::vec3 query{0.0f, 0.0f, 0.0f};
    constexpr float radius = 1.01f;

    std::vector<Decimation::KDTree::ElementIndex> kdIndices;
    const auto radiusResult = tree.QueryRadius(query, radius, kdIndices);
    ASSERT_TRUE(radiusResult.has_value());
    EXPECT_EQ(radiusResult->ReturnedCount, kdIndices.size());

    std::vector<std::uint32_t> brute;
    for (std::uint32_t i = 0; i < static_cast<std::uint32_t>(points.size()); ++i)
    {
        const glm::vec3 d = points[i] - query;
        if (glm::dot(d, d) <= radius * radius)
        {
            brute.push_back(i);
        }
    }

    EXPECT_EQ(kdIndices, brute);
}

TEST(KDTree, RadiusQueryOnLargerCloudSplitsIntoLeaves)
{
    // 6x6x6 lattice, spacing 1; small leaves force a real hierarchy
    std::vector<glm::vec3> points;
    for (int x = 0; x < 6; ++x)
        for (int y = 0; y < 6; ++y)
            for (int z = 0; z < 6; ++z)
                points.emplace_back(static_cast<float>(x), static_cast<float>(y), static_cast<float>(z));

    Decimation::KDTreeBuildParams params{};
    params.LeafSize = 4;

    Decimation::KDTree tree;
    auto build = tree.BuildFromPoints(points, params);
    ASSERT_TRUE(build.has_value());
    EXPECT_EQ(build->ElementCount, points.size());
    EXPECT_GT(build->NodeCount, 1u);

    const glm::vec3 query{2.0f, 3.0f, 2.0f};
    std::vector<Decimation::KDTree::ElementIndex> hits;
    ASSERT_TRUE(tree.QueryRadius(query, 1.0f, hits).has_value());

    // Centre plus its six axis neighbours
    EXPECT_EQ(hits.size(), 7u);
    EXPECT_TRUE(std::is_sorted(hits.begin(), hits.end()));
    for (auto i : hits)
    {
        const glm::vec3 d = points[i] - query;
        EXPECT_LE(glm::dot(d, d), 1.0f);
    }
}

TEST(KDTree, HandlesCoincidentPointsAndInvalidQueries)
{
    const std::vector<glm::vec3> points{
        {1.0f, 2.0f, 3.0f}, {1.0f, 2.0f, 3.0f}, {1.0f, 2.0f, 3.0f}, {2.0f, 2.0f, 3.0f},
    };

    Decimation::KDTree tree;
    ASSERT_TRUE(tree.BuildFromPoints(points).has_value());

    std::vector<Decimation::KDTree::ElementIndex> indices;
    ASSERT_TRUE(tree.QueryRadius(glm::vec3{1.0f, 2.0f, 3.0f}, 0.0f, indices).has_value());
    EXPECT_EQ(indices, (std::vector<Decimation::KDTree::ElementIndex>{0, 1, 2}));

    EXPECT_FALSE(tree.QueryRadius(glm::vec3{0.0f}, -1.0f, indices).has_value());
    EXPECT_FALSE(tree.QueryRadius(glm::vec3{0.0f}, std::numeric_limits<float>::quiet_NaN(), indices).has_value());

    Decimation::KDTree unbuilt;
    EXPECT_FALSE(unbuilt.QueryRadius(glm::vec3{0.0f}, 1.0f, indices).has_value());
}

TEST(KDTree, LeavesPartitionElementsAndRespectSplitPlanes)
{
    std::vector<glm::vec3> points;
    for (int x = 0; x < 6; ++x)
        for (int y = 0; y < 6; ++y)
            for (int z = 0; z < 6; ++z)
                points.emplace_back(static_cast<float>(x), static_cast<float>(2 * y), static_cast<float>(z));

    Decimation::KDTreeBuildParams params{};
    params.LeafSize = 4;

    Decimation::KDTree tree;
    auto build = tree.BuildFromPoints(points, params);
    ASSERT_TRUE(build.has_value());

    const auto& nodes = tree.Nodes();
    const auto& elements = tree.ElementIndices();
    ASSERT_EQ(nodes.size(), build->NodeCount);
    ASSERT_EQ(elements.size(), points.size());

    std::vector<Decimation::KDTree::ElementIndex> sorted = elements;
    std::sort(sorted.begin(), sorted.end());
    for (std::uint32_t i = 0; i < static_cast<std::uint32_t>(sorted.size()); ++i)
        ASSERT_EQ(sorted[i], i);

    std::size_t leafTotal = 0;
    for (const auto& node : nodes)
    {
        if (node.IsLeaf())
        {
            EXPECT_LE(node.Size(), params.LeafSize);
            leafTotal += node.Size();
            continue;
        }

        const auto& left = nodes[node.Left];
        const auto& right = nodes[node.Right];
        EXPECT_EQ(left.Begin, node.Begin);
        EXPECT_EQ(left.End, right.Begin);
        EXPECT_EQ(right.End, node.End);

        for (std::uint32_t i = left.Begin; i < left.End; ++i)
            EXPECT_LE(points[elements[i]][node.SplitAxis], node.SplitValue);
        for (std::uint32_t i = right.Begin; i < right.End; ++i)
            EXPECT_GE(points[elements[i]][node.SplitAxis], node.SplitValue);
    }
    EXPECT_EQ(leafTotal, points.size());
}
