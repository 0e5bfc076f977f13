#include <gtest/gtest.h>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

import Geometry;

#include "TestMeshBuilders.h"

using namespace Geometry;
using namespace Geometry::BoundaryLoops;

// =============================================================================
// Edge collection and loop assembly
// =============================================================================

TEST(BoundaryLoops, SquareHasFourBoundaryEdgesAndOneInterior)
{
    const MeshSolid square = MakeSquare();
    const auto points = PointsOf(square);
    const auto table = PlaneMath::BuildTriangleRecords(points, square.TriangleIndices());

    const std::vector<uint32_t> component = {0, 1};
    const BoundaryEdgeSet edges = CollectBoundaryEdges(component, table);

    EXPECT_EQ(edges.Edges.size(), 4u);
    EXPECT_EQ(edges.InteriorEdgeCount, 1u);
    EXPECT_EQ(edges.NonManifoldEdgeCount, 0u);
}

TEST(BoundaryLoops, AssemblesTriangleLoop)
{
    const std::vector<DirectedEdge> edges = {{0, 1}, {1, 2}, {2, 0}};
    const LoopAssembly assembly = AssembleLoops(edges);

    ASSERT_EQ(assembly.Status, LoopStatus::Ok);
    ASSERT_EQ(assembly.Loops.size(), 1u);
    EXPECT_EQ(assembly.Loops[0], (Loop{0, 1, 2}));
}

TEST(BoundaryLoops, AssemblesTwoDisjointLoops)
{
    const std::vector<DirectedEdge> edges = {{0, 1}, {5, 6}, {1, 2}, {6, 7}, {2, 0}, {7, 5}};
    const LoopAssembly assembly = AssembleLoops(edges);

    ASSERT_EQ(assembly.Status, LoopStatus::Ok);
    ASSERT_EQ(assembly.Loops.size(), 2u);
    EXPECT_EQ(assembly.Loops[1], (Loop{5, 6, 7}));
}

TEST(BoundaryLoops, OpenChainIsUnclosed)
{
    const std::vector<DirectedEdge> edges = {{0, 1}, {1, 2}, {2, 3}};
    const LoopAssembly assembly = AssembleLoops(edges);

    EXPECT_EQ(assembly.Status, LoopStatus::Unclosed);
    EXPECT_TRUE(assembly.Loops.empty());
    EXPECT_EQ(LoopStatusToString(assembly.Status), "Unclosed");
}

// =============================================================================
// Plane basis and classification
// =============================================================================

TEST(BoundaryLoops, BasisFallsBackWhenReferenceIsParallel)
{
    const PlaneBasis basis = MakePlaneBasis({0, 0, 1}, {0, 0, 5});

    EXPECT_NEAR(basis.U.x, 1.0, 1e-12);
    EXPECT_NEAR(basis.V.y, 1.0, 1e-12);
    EXPECT_NEAR(glm::dot(basis.U, glm::dvec3(0, 0, 1)), 0.0, 1e-12);
}

TEST(BoundaryLoops, ClassifyReversesClockwiseOuter)
{
    const std::vector<glm::dvec3> points = {{0, 0, 0}, {1, 0, 0}, {1, 1, 0}, {0, 1, 0}};
    std::vector<Loop> loops = {{0, 3, 2, 1}};

    const ClassifiedLoops face = ClassifyLoops(std::move(loops), points, {0, 0, 1}, {1, 0, 0});

    ASSERT_EQ(face.Loops.size(), 1u);
    EXPECT_NEAR(face.Areas[0], 1.0, 1e-12);
    EXPECT_EQ(face.Outer(), (Loop{1, 2, 3, 0}));
    EXPECT_EQ(face.HoleCount(), 0u);
}

TEST(BoundaryLoops, CubeFacesHaveFourVertexOuterLoops)
{
    const MeshSolid cube = MakeCube();
    const auto points = PointsOf(cube);
    const auto table = PlaneMath::BuildTriangleRecords(points, cube.TriangleIndices());
    const auto groups = FaceGrouping::GroupByFaceId(table, cube.FaceIds());
    ASSERT_EQ(groups.size(), 6u);

    for (const auto& group : groups)
    {
        const FaceLoopResult result = BuildFaceLoops(group.Triangles, table, points);
        ASSERT_TRUE(result.Ok()) << "face " << group.Label;
        EXPECT_EQ(result.Face.Outer().size(), 4u);
        EXPECT_EQ(result.Face.HoleCount(), 0u);
        EXPECT_NEAR(result.Face.Areas[result.Face.OuterIndex], 1.0, 1e-12);
    }
}

TEST(BoundaryLoops, SquareWithHoleHasOppositeLoopAreas)
{
    const MeshSolid plate = MakeSquareWithHole();
    const auto points = PointsOf(plate);
    const auto table = PlaneMath::BuildTriangleRecords(points, plate.TriangleIndices());

    const std::vector<uint32_t> component = {0, 1, 2, 3, 4, 5, 6};
    const FaceLoopResult result = BuildFaceLoops(component, table, points);

    ASSERT_TRUE(result.Ok());
    ASSERT_EQ(result.Face.Loops.size(), 2u);
    EXPECT_EQ(result.Face.HoleCount(), 1u);

    const std::size_t outer = result.Face.OuterIndex;
    const std::size_t hole = 1 - outer;
    EXPECT_EQ(result.Face.Loops[outer].size(), 4u);
    EXPECT_EQ(result.Face.Loops[hole].size(), 3u);
    EXPECT_NEAR(result.Face.Areas[outer], 16.0, 1e-9);
    EXPECT_NEAR(result.Face.Areas[hole], -2.0, 1e-9);
    EXPECT_GT(result.Face.Areas[outer] * -result.Face.Areas[hole], 0.0);
}

TEST(BoundaryLoops, NonManifoldEdgeRejectsComponent)
{
    const std::vector<glm::dvec3> points = {{0, 0, 0}, {1, 0, 0}, {0.5, 1, 0}, {0.5, -1, 0}, {0.5, 2, 0}};
    // Three triangles on the edge 0-1.
    const std::vector<uint32_t> indices = {0, 1, 2, 1, 0, 3, 0, 1, 4};
    const auto table = PlaneMath::BuildTriangleRecords(points, indices);

    const std::vector<uint32_t> component = {0, 1, 2};
    const FaceLoopResult result = BuildFaceLoops(component, table, points);

    EXPECT_FALSE(result.Ok());
    EXPECT_EQ(result.Status, LoopStatus::NonManifold);
}

TEST(BoundaryLoops, ClosedComponentHasTooFewEdges)
{
    const MeshSolid cube = MakeCube();
    const auto points = PointsOf(cube);
    const auto table = PlaneMath::BuildTriangleRecords(points, cube.TriangleIndices());

    std::vector<uint32_t> all(12);
    for (uint32_t i = 0; i < 12; ++i)
        all[i] = i;

    const FaceLoopResult result = BuildFaceLoops(all, table, points);
    EXPECT_EQ(result.Status, LoopStatus::TooFewEdges);
}
