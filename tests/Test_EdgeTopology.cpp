#include <gtest/gtest.h>
#include <cstdint>
#include <format>
#include <set>
#include <string>
#include <vector>

#include <glm/glm.hpp>

import Geometry;

#include "TestMeshBuilders.h"

using namespace Geometry;
using namespace Geometry::EdgeTopology;

namespace
{
    // Table, labels and face names for a solid grouped by its face ids.
    struct Labelled
    {
        std::vector<glm::dvec3> Points;
        PlaneMath::TriangleTable Table;
        std::vector<uint32_t> Labels;
        FaceNameFn NameOf;
    };

    Labelled LabelByFaceId(const MeshSolid& solid)
    {
        Labelled out;
        out.Points = PointsOf(solid);
        out.Table = PlaneMath::BuildTriangleRecords(out.Points, solid.TriangleIndices());
        const auto groups = FaceGrouping::GroupByFaceId(out.Table, solid.FaceIds());
        out.Labels = FaceGrouping::LabelTriangles(groups, out.Table.Size());
        out.NameOf = [&solid](uint32_t id) {
            const auto name = solid.FaceName(id);
            return name ? std::string(*name) : std::format("FACE_{}", id);
        };
        return out;
    }
}

TEST(EdgeTopology, NameAllocatorSuffixesRepeats)
{
    NameAllocator names;
    EXPECT_EQ(names.Allocate("A"), "A");
    EXPECT_EQ(names.Allocate("A"), "A[1]");
    EXPECT_EQ(names.Allocate("B"), "B");
    EXPECT_EQ(names.Allocate("A"), "A[2]");

    names.Reset();
    EXPECT_EQ(names.Allocate("A"), "A");
}

TEST(EdgeTopology, IndexedNamesShareOneSuffixForm)
{
    EXPECT_EQ(IndexedName("A|B", 0), "A|B[0]");
    EXPECT_EQ(IndexedName("A|B", 2), "A|B[2]");

    // The allocator and batch naming agree on every index past the first.
    NameAllocator names;
    (void)names.Allocate("F|BOUNDARY");
    EXPECT_EQ(names.Allocate("F|BOUNDARY"), IndexedName("F|BOUNDARY", 1));

    const MeshSolid square = MakeSquare("F");
    const Labelled l = LabelByFaceId(square);
    const EdgeNameMap edgeNames = BuildEdgeNames(l.Table, l.Labels, l.NameOf);
    std::set<std::string> all;
    for (const auto& [key, name] : edgeNames)
        all.insert(name);
    EXPECT_TRUE(all.contains(IndexedName("F|BOUNDARY", 1)));
}

TEST(EdgeTopology, CubeEdgesNamedByAdjacentFaces)
{
    const MeshSolid cube = MakeCube();
    const Labelled l = LabelByFaceId(cube);

    const EdgeNameMap names = BuildEdgeNames(l.Table, l.Labels, l.NameOf);

    // 12 cube edges plus one diagonal per side.
    EXPECT_EQ(names.size(), 18u);

    const uint32_t a = *cube.FindPointIndex({0, 0, 0});
    const uint32_t b = *cube.FindPointIndex({1, 0, 0});
    EXPECT_EQ(names.at(MakeEdgeKey(a, b)), "Bottom|Front");

    const uint32_t c = *cube.FindPointIndex({1, 1, 1});
    const uint32_t d = *cube.FindPointIndex({0, 1, 1});
    EXPECT_EQ(names.at(MakeEdgeKey(c, d)), "Back|Top");
}

TEST(EdgeTopology, SharedBaseNamesGetUniqueSuffixes)
{
    const MeshSolid square = MakeSquare("F");
    const Labelled l = LabelByFaceId(square);

    const EdgeNameMap names = BuildEdgeNames(l.Table, l.Labels, l.NameOf);

    ASSERT_EQ(names.size(), 5u);
    std::set<std::string> unique;
    for (const auto& [key, name] : names)
    {
        EXPECT_EQ(name.rfind("F|BOUNDARY[", 0), 0u) << name;
        unique.insert(name);
    }
    EXPECT_EQ(unique.size(), 5u);

    // Suffixes follow key order, so the lowest key gets [0].
    EXPECT_EQ(names.at(MakeEdgeKey(0, 1)), "F|BOUNDARY[0]");
}

TEST(EdgeTopology, CubeSeamsAreSingleEdges)
{
    const MeshSolid cube = MakeCube();
    const Labelled l = LabelByFaceId(cube);

    const auto seams = BuildSeamPolylines(l.Table, l.Labels, l.NameOf);

    ASSERT_EQ(seams.size(), 12u);
    for (const SeamPolyline& seam : seams)
    {
        EXPECT_EQ(seam.Indices.size(), 2u);
        EXPECT_FALSE(seam.Closed);
        EXPECT_LT(seam.FaceA, seam.FaceB);
        EXPECT_EQ(seam.Name, seam.FaceA + "|" + seam.FaceB + "[0]");
    }
}

TEST(EdgeTopology, OpenSeamChainsAcrossEdges)
{
    const MeshSolid grid = MakeTwoColumnGrid();
    const Labelled l = LabelByFaceId(grid);

    const auto seams = BuildSeamPolylines(l.Table, l.Labels, l.NameOf);

    ASSERT_EQ(seams.size(), 1u);
    EXPECT_EQ(seams[0].Name, "L|R[0]");
    EXPECT_FALSE(seams[0].Closed);
    ASSERT_EQ(seams[0].Indices.size(), 3u);

    const uint32_t mid = *grid.FindPointIndex({1, 1, 0});
    EXPECT_EQ(seams[0].Indices[1], mid);
}

TEST(EdgeTopology, ClosedSeamAroundCap)
{
    const MeshSolid capped = MakeCappedCube();
    const Labelled l = LabelByFaceId(capped);

    const auto seams = BuildSeamPolylines(l.Table, l.Labels, l.NameOf);

    ASSERT_EQ(seams.size(), 1u);
    EXPECT_EQ(seams[0].FaceA, "SIDE");
    EXPECT_EQ(seams[0].FaceB, "TOP");
    EXPECT_TRUE(seams[0].Closed);
    ASSERT_EQ(seams[0].Indices.size(), 5u);
    EXPECT_EQ(seams[0].Indices.front(), seams[0].Indices.back());
}

TEST(EdgeTopology, SingleFaceHasNoSeams)
{
    const MeshSolid plate = MakeSquareWithHole();
    const Labelled l = LabelByFaceId(plate);

    EXPECT_TRUE(BuildSeamPolylines(l.Table, l.Labels, l.NameOf).empty());
}
