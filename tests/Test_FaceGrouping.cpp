#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <glm/glm.hpp>

import Geometry;

#include "TestMeshBuilders.h"

using namespace Geometry;
using namespace Geometry::FaceGrouping;

namespace
{
    PlaneMath::TriangleTable TableOf(const MeshSolid& solid, std::vector<glm::dvec3>& points)
    {
        points = PointsOf(solid);
        return PlaneMath::BuildTriangleRecords(points, solid.TriangleIndices());
    }
}

// =============================================================================
// Plane keys and tolerances
// =============================================================================

TEST(FaceGrouping, QuantizeRoundsToNearestStep)
{
    EXPECT_EQ(Quantize(0.5, 0.1), 5);
    EXPECT_EQ(Quantize(-0.26, 0.1), -3);
    EXPECT_EQ(Quantize(1.0, 0.0), 0);
}

TEST(FaceGrouping, QuantizeSaturates)
{
    EXPECT_EQ(Quantize(1e300, 1e-6), INT64_MAX);
    EXPECT_EQ(Quantize(-1e300, 1e-6), INT64_MIN);
}

TEST(FaceGrouping, ToleranceDefaultsFollowDiagonal)
{
    const Tolerances small = ResolveTolerances(std::nullopt, std::nullopt, 0.5);
    EXPECT_DOUBLE_EQ(small.Normal, DefaultNormalTolerance);
    EXPECT_DOUBLE_EQ(small.Distance, 1e-6);

    const Tolerances large = ResolveTolerances(std::nullopt, std::nullopt, 100.0);
    EXPECT_DOUBLE_EQ(large.Distance, 1e-4);
}

TEST(FaceGrouping, ToleranceOverrides)
{
    const Tolerances t = ResolveTolerances(1e-3, 0.01, 100.0);
    EXPECT_DOUBLE_EQ(t.Normal, 1e-3);
    EXPECT_DOUBLE_EQ(t.Distance, 0.01);

    const Tolerances ignored = ResolveTolerances(-1.0, 0.0, 1.0);
    EXPECT_DOUBLE_EQ(ignored.Normal, DefaultNormalTolerance);
    EXPECT_DOUBLE_EQ(ignored.Distance, 1e-6);
}

// =============================================================================
// Grouping
// =============================================================================

TEST(FaceGrouping, CubeGroupsBySixPlanes)
{
    const MeshSolid cube = MakeCube();
    std::vector<glm::dvec3> points;
    const auto table = TableOf(cube, points);

    const auto merged = GroupByPlane(table, 1e-5, 1e-6, true);
    ASSERT_EQ(merged.size(), 6u);
    for (std::size_t i = 0; i < merged.size(); ++i)
    {
        EXPECT_EQ(merged[i].Label, i);
        EXPECT_EQ(merged[i].Triangles.size(), 2u);
    }

    const auto separate = GroupByPlane(table, 1e-5, 1e-6, false);
    EXPECT_EQ(separate.size(), 12u);
}

TEST(FaceGrouping, CubeGroupsByFaceId)
{
    const MeshSolid cube = MakeCube();
    std::vector<glm::dvec3> points;
    const auto table = TableOf(cube, points);

    const auto groups = GroupByFaceId(table, cube.FaceIds());

    ASSERT_EQ(groups.size(), 6u);
    EXPECT_EQ(groups[0].Label, 1u);
    EXPECT_EQ(groups[5].Label, 6u);
    EXPECT_EQ(groups[1].Triangles, (std::vector<uint32_t>{2, 3}));
}

TEST(FaceGrouping, SplitsDisjointComponents)
{
    MeshSolid solid("two");
    AddQuad(solid, "F", {0, 0, 0}, {1, 0, 0}, {1, 1, 0}, {0, 1, 0});
    AddQuad(solid, "F", {5, 0, 0}, {6, 0, 0}, {6, 1, 0}, {5, 1, 0});
    std::vector<glm::dvec3> points;
    const auto table = TableOf(solid, points);

    const std::vector<uint32_t> all = {0, 1, 2, 3};
    const auto components = SplitComponents(all, table);

    ASSERT_EQ(components.size(), 2u);
    EXPECT_EQ(components[0], (std::vector<uint32_t>{0, 1}));
    EXPECT_EQ(components[1], (std::vector<uint32_t>{2, 3}));
}

TEST(FaceGrouping, CoplanarityCheck)
{
    const MeshSolid square = MakeSquare();
    std::vector<glm::dvec3> squarePoints;
    const auto squareTable = TableOf(square, squarePoints);
    const std::vector<uint32_t> both = {0, 1};
    EXPECT_TRUE(IsCoplanarGroup(both, squareTable, 1e-5, 1e-6));

    const MeshSolid bent = MakeBentFace();
    std::vector<glm::dvec3> bentPoints;
    const auto bentTable = TableOf(bent, bentPoints);
    EXPECT_FALSE(IsCoplanarGroup(both, bentTable, 1e-5, 1e-6));

    const auto parts = SplitByPlaneKey(both, bentTable, 1e-5, 1e-6);
    EXPECT_EQ(parts.size(), 2u);
}

TEST(FaceGrouping, LabelsFollowGroups)
{
    const MeshSolid cube = MakeCube();
    std::vector<glm::dvec3> points;
    const auto table = TableOf(cube, points);
    const auto groups = GroupByFaceId(table, cube.FaceIds());

    const auto labels = LabelTriangles(groups, table.Size());

    ASSERT_EQ(labels.size(), 12u);
    EXPECT_EQ(labels[0], 1u);
    EXPECT_EQ(labels[11], 6u);
}
