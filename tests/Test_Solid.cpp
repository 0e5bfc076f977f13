#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

import Core;
import Geometry;

#include "TestMeshBuilders.h"

using namespace Geometry;

// =============================================================================
// MeshSolid
// =============================================================================

TEST(MeshSolid, WeldsVerticesByExactPosition)
{
    MeshSolid solid = MakeSquare();

    EXPECT_EQ(solid.VertexCount(), 4u);
    EXPECT_EQ(solid.TriangleCount(), 2u);
    EXPECT_EQ(solid.FaceIds().size(), 2u);
}

TEST(MeshSolid, NegativeZeroWeldsWithPositiveZero)
{
    MeshSolid solid;
    const uint32_t a = solid.GetPointIndex({0.0, 1.0, 2.0});
    const uint32_t b = solid.GetPointIndex({-0.0, 1.0, 2.0});
    EXPECT_EQ(a, b);
    EXPECT_EQ(solid.VertexCount(), 1u);
}

TEST(MeshSolid, FaceIdsStartAtOneInFirstUseOrder)
{
    MeshSolid cube = MakeCube();

    EXPECT_EQ(cube.FindFaceId("Bottom"), std::optional<uint32_t>(1u));
    EXPECT_EQ(cube.FindFaceId("Right"), std::optional<uint32_t>(6u));
    EXPECT_FALSE(cube.FindFaceId("Missing").has_value());

    const auto name = cube.FaceName(2);
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "Top");

    const std::vector<std::string> names = cube.FaceNames();
    ASSERT_EQ(names.size(), 6u);
    EXPECT_EQ(names.front(), "Bottom");
    EXPECT_EQ(names.back(), "Right");
}

TEST(MeshSolid, RejectsNonFiniteTriangle)
{
    MeshSolid solid;
    const double nan = std::numeric_limits<double>::quiet_NaN();

    EXPECT_FALSE(solid.AddTriangle("F", {0, 0, 0}, {nan, 0, 0}, {0, 1, 0}));
    EXPECT_TRUE(solid.IsEmpty());
    EXPECT_EQ(solid.VertexCount(), 0u);
}

TEST(MeshSolid, AddTriangleKeepsRawBuffersIdLess)
{
    MeshSolid solid;
    solid.Assign({0, 0, 0, 1, 0, 0, 0, 1, 0}, {0, 1, 2});
    EXPECT_TRUE(solid.FaceIds().empty());

    ASSERT_TRUE(solid.AddTriangle("NEW", {0, 0, 0}, {0, 1, 0}, {0, 0, 1}));

    EXPECT_EQ(solid.TriangleCount(), 2u);
    EXPECT_TRUE(solid.FaceIds().empty());
    EXPECT_FALSE(solid.FindFaceId("NEW").has_value());
    EXPECT_FALSE(solid.FindFaceId("UNNAMED").has_value());
}

TEST(MeshSolid, AddTrianglePadsIdsAfterIndexEdit)
{
    MeshSolid solid = MakeSquare("F");
    auto& idx = solid.MutableIndices();
    idx.insert(idx.end(), {0, 2, 3});
    ASSERT_EQ(solid.FaceIds().size(), 2u);

    ASSERT_TRUE(solid.AddTriangle("NEW", {0, 0, 0}, {0, 1, 0}, {0, 0, 1}));

    ASSERT_EQ(solid.FaceIds().size(), 4u);
    EXPECT_EQ(solid.FaceName(solid.FaceIds()[2]), std::optional<std::string_view>("UNNAMED"));
    EXPECT_EQ(solid.FaceName(solid.FaceIds()[3]), std::optional<std::string_view>("NEW"));
}

TEST(MeshSolid, AssignDropsMismatchedFaceIds)
{
    MeshSolid solid;
    solid.Assign({0, 0, 0, 1, 0, 0, 0, 1, 0}, {0, 1, 2}, {1, 2});

    EXPECT_TRUE(solid.FaceIds().empty());
    EXPECT_EQ(solid.FindPointIndex({1, 0, 0}), std::optional<uint32_t>(1u));
}

TEST(MeshSolid, SetFaceNameRenames)
{
    MeshSolid solid = MakeSquare("OLD");
    const uint32_t id = *solid.FindFaceId("OLD");

    solid.SetFaceName(id, "NEW");

    EXPECT_FALSE(solid.FindFaceId("OLD").has_value());
    EXPECT_EQ(solid.FindFaceId("NEW"), std::optional<uint32_t>(id));
}

// =============================================================================
// ValidateSolid
// =============================================================================

TEST(ValidateSolid, RejectsNull)
{
    const auto r = ValidateSolid(nullptr);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), Core::ErrorCode::InvalidArgument);
}

TEST(ValidateSolid, RejectsEmpty)
{
    MeshSolid solid;
    const auto r = ValidateSolid(&solid);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), Core::ErrorCode::EmptyMesh);
}

TEST(ValidateSolid, RejectsRaggedBuffers)
{
    MeshSolid solid;
    solid.Assign({0, 0, 0, 1, 0, 0, 0, 1}, {0, 1, 2});
    const auto r = ValidateSolid(&solid);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), Core::ErrorCode::InvalidFormat);
}

TEST(ValidateSolid, AcceptsCube)
{
    MeshSolid cube = MakeCube();
    EXPECT_TRUE(ValidateSolid(&cube).has_value());
}
