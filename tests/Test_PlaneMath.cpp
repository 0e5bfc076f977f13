#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <optional>
#include <vector>

#include <glm/glm.hpp>

import Geometry;

#include "TestMeshBuilders.h"

using namespace Geometry;
using namespace Geometry::PlaneMath;

TEST(PlaneMath, IdentityDetection)
{
    EXPECT_TRUE(IsIdentity(glm::dmat4(1.0)));

    glm::dmat4 m(1.0);
    m[3][0] = 2.0;
    EXPECT_FALSE(IsIdentity(m));
}

TEST(PlaneMath, TransformPointAppliesTranslation)
{
    glm::dmat4 m(1.0);
    m[3] = glm::dvec4(1.0, 2.0, 3.0, 1.0);

    const glm::dvec3 p = TransformPoint(m, {1.0, 1.0, 1.0});
    EXPECT_DOUBLE_EQ(p.x, 2.0);
    EXPECT_DOUBLE_EQ(p.y, 3.0);
    EXPECT_DOUBLE_EQ(p.z, 4.0);
}

TEST(PlaneMath, TransformPointDividesByW)
{
    glm::dmat4 m(1.0);
    m[3][3] = 2.0;

    const glm::dvec3 p = TransformPoint(m, {2.0, 4.0, 6.0});
    EXPECT_DOUBLE_EQ(p.x, 1.0);
    EXPECT_DOUBLE_EQ(p.y, 2.0);
    EXPECT_DOUBLE_EQ(p.z, 3.0);
}

TEST(PlaneMath, PreparePositionsTransformsThenScales)
{
    MeshSolid cube = MakeCube();
    glm::dmat4 m(1.0);
    m[3] = glm::dvec4(1.0, 0.0, 0.0, 1.0);

    const PreparedPositions prepared = PreparePositions(cube, m, 10.0);

    ASSERT_EQ(prepared.Points.size(), 8u);
    EXPECT_DOUBLE_EQ(prepared.BoundsMin.x, 10.0);
    EXPECT_DOUBLE_EQ(prepared.BoundsMax.x, 20.0);
    EXPECT_DOUBLE_EQ(prepared.BoundsMax.z, 10.0);
    EXPECT_NEAR(BoundingDiagonal(prepared), std::sqrt(300.0), 1e-12);
}

TEST(PlaneMath, PreparePositionsWithoutTransform)
{
    MeshSolid cube = MakeCube();
    const PreparedPositions prepared = PreparePositions(cube, std::nullopt, 1.0);
    EXPECT_DOUBLE_EQ(prepared.BoundsMax.y, 1.0);
    EXPECT_NEAR(BoundingDiagonal(prepared), std::sqrt(3.0), 1e-12);
}

TEST(PlaneMath, BoundingDiagonalOfPointIsOne)
{
    PreparedPositions prepared;
    prepared.Points = {glm::dvec3(5.0)};
    prepared.BoundsMin = glm::dvec3(5.0);
    prepared.BoundsMax = glm::dvec3(5.0);
    EXPECT_DOUBLE_EQ(BoundingDiagonal(prepared), 1.0);
}

TEST(PlaneMath, TriangleRecordHasUnitNormalAndOffset)
{
    const std::vector<glm::dvec3> points = {{0, 0, 2}, {3, 0, 2}, {0, 3, 2}};
    const auto rec = MakeTriangleRecord(0, 1, 2, points);

    ASSERT_TRUE(rec.has_value());
    EXPECT_NEAR(rec->Normal.z, 1.0, 1e-12);
    EXPECT_NEAR(rec->D, 2.0, 1e-12);
    EXPECT_DOUBLE_EQ(rec->E1.x, 3.0);
}

TEST(PlaneMath, ZeroAreaTriangleIsExcluded)
{
    const std::vector<glm::dvec3> points = {{0, 0, 0}, {1, 0, 0}, {1, 1, 0}, {0, 1, 0}, {2, 0, 0}};
    // Two valid triangles and one collinear sliver along the x axis.
    const std::vector<uint32_t> indices = {0, 1, 2, 0, 2, 3, 0, 1, 4};

    const TriangleTable table = BuildTriangleRecords(points, indices);

    ASSERT_EQ(table.Size(), 3u);
    EXPECT_EQ(table.ValidCount, 2u);
    EXPECT_EQ(table.DegenerateCount, 1u);
    EXPECT_NE(table.Find(0), nullptr);
    EXPECT_EQ(table.Find(2), nullptr);
}

TEST(PlaneMath, OutOfRangeIndicesAreCounted)
{
    const std::vector<glm::dvec3> points = {{0, 0, 0}, {1, 0, 0}, {0, 1, 0}};
    const std::vector<uint32_t> indices = {0, 1, 2, 0, 1, 99};

    const TriangleTable table = BuildTriangleRecords(points, indices);

    EXPECT_EQ(table.ValidCount, 1u);
    EXPECT_EQ(table.InvalidIndexCount, 1u);
    EXPECT_EQ(table.Find(1), nullptr);
    EXPECT_EQ(table.Find(7), nullptr);
}
