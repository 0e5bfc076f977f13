#pragma once

// =============================================================================
// Shared test solid builders for geometry and exchange test suites.
//
// Usage: #include "TestMeshBuilders.h" AFTER `import Geometry;` in each test
// file. All functions are inline to avoid ODR issues across translation units.
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

// Adds the quad a-b-c-d (counter-clockwise seen from its front) as the two
// triangles a-b-c and a-c-d.
inline void AddQuad(Geometry::MeshSolid& solid, std::string_view face,
                    const glm::dvec3& a, const glm::dvec3& b,
                    const glm::dvec3& c, const glm::dvec3& d)
{
    (void)solid.AddTriangle(face, a, b, c);
    (void)solid.AddTriangle(face, a, c, d);
}

// Unit cube [0,1]^3 with outward winding. 8 vertices, 12 triangles and one
// named face per side: Bottom, Top, Front, Back, Left, Right (ids 1..6).
inline Geometry::MeshSolid MakeCube(std::string name = "cube")
{
    Geometry::MeshSolid solid(std::move(name));
    AddQuad(solid, "Bottom", {0, 0, 0}, {0, 1, 0}, {1, 1, 0}, {1, 0, 0});
    AddQuad(solid, "Top",    {0, 0, 1}, {1, 0, 1}, {1, 1, 1}, {0, 1, 1});
    AddQuad(solid, "Front",  {0, 0, 0}, {1, 0, 0}, {1, 0, 1}, {0, 0, 1});
    AddQuad(solid, "Back",   {0, 1, 0}, {0, 1, 1}, {1, 1, 1}, {1, 1, 0});
    AddQuad(solid, "Left",   {0, 0, 0}, {0, 0, 1}, {0, 1, 1}, {0, 1, 0});
    AddQuad(solid, "Right",  {1, 0, 0}, {1, 1, 0}, {1, 1, 1}, {1, 0, 1});
    return solid;
}

// Same cube with the top named "TOP" and every other side "SIDE", so the
// only seam is the closed square around the top.
inline Geometry::MeshSolid MakeCappedCube()
{
    Geometry::MeshSolid solid("capped");
    AddQuad(solid, "SIDE", {0, 0, 0}, {0, 1, 0}, {1, 1, 0}, {1, 0, 0});
    AddQuad(solid, "TOP",  {0, 0, 1}, {1, 0, 1}, {1, 1, 1}, {0, 1, 1});
    AddQuad(solid, "SIDE", {0, 0, 0}, {1, 0, 0}, {1, 0, 1}, {0, 0, 1});
    AddQuad(solid, "SIDE", {0, 1, 0}, {0, 1, 1}, {1, 1, 1}, {1, 1, 0});
    AddQuad(solid, "SIDE", {0, 0, 0}, {0, 0, 1}, {0, 1, 1}, {0, 1, 0});
    AddQuad(solid, "SIDE", {1, 0, 0}, {1, 1, 0}, {1, 1, 1}, {1, 0, 1});
    return solid;
}

// Copies a solid's buffers without face ids, so exporters must group
// triangles by plane.
inline Geometry::MeshSolid StripFaceIds(const Geometry::MeshSolid& source)
{
    Geometry::MeshSolid solid{std::string(source.Name())};
    solid.Assign(std::vector<double>(source.VertexPositions().begin(), source.VertexPositions().end()),
                 std::vector<uint32_t>(source.TriangleIndices().begin(), source.TriangleIndices().end()));
    return solid;
}

// Unit square in z = 0 split along its diagonal: 4 vertices, 2 triangles.
inline Geometry::MeshSolid MakeSquare(std::string_view face = "F")
{
    Geometry::MeshSolid solid("square");
    AddQuad(solid, face, {0, 0, 0}, {1, 0, 0}, {1, 1, 0}, {0, 1, 0});
    return solid;
}

// 4x4 square in z = 0 with a triangular hole (1,1) (3,1) (2,3).
// 7 vertices, 7 triangles, all wound about +z. Outer area 16, hole area 2.
//   O0=(0,0) O1=(4,0) O2=(4,4) O3=(0,4)  H0=(1,1) H1=(3,1) H2=(2,3)
inline Geometry::MeshSolid MakeSquareWithHole(std::string_view face = "PLATE")
{
    const glm::dvec3 o0{0, 0, 0}, o1{4, 0, 0}, o2{4, 4, 0}, o3{0, 4, 0};
    const glm::dvec3 h0{1, 1, 0}, h1{3, 1, 0}, h2{2, 3, 0};

    Geometry::MeshSolid solid("plate");
    (void)solid.AddTriangle(face, o0, o1, h1);
    (void)solid.AddTriangle(face, o0, h1, h0);
    (void)solid.AddTriangle(face, o1, o2, h1);
    (void)solid.AddTriangle(face, h1, o2, h2);
    (void)solid.AddTriangle(face, o2, o3, h2);
    (void)solid.AddTriangle(face, o3, h0, h2);
    (void)solid.AddTriangle(face, o3, o0, h0);
    return solid;
}

// Three triangles in z = 0 under one face name, all on the edge
// (0,0,0)-(1,0,0), so that edge is non-manifold. All wound about +z.
inline Geometry::MeshSolid MakeNonManifoldFin(std::string_view face = "FIN")
{
    Geometry::MeshSolid solid("fin");
    (void)solid.AddTriangle(face, {0, 0, 0}, {1, 0, 0}, {0.5, 1, 0});
    (void)solid.AddTriangle(face, {1, 0, 0}, {0, 0, 0}, {0.5, -1, 0});
    (void)solid.AddTriangle(face, {0, 0, 0}, {1, 0, 0}, {0.5, 2, 0});
    return solid;
}

// Two triangles sharing the edge (0,0,0)-(1,0,0) at a right angle, both
// under one face name.
inline Geometry::MeshSolid MakeBentFace(std::string_view face = "BENT")
{
    Geometry::MeshSolid solid("bent");
    (void)solid.AddTriangle(face, {0, 0, 0}, {1, 0, 0}, {0, 1, 0});
    (void)solid.AddTriangle(face, {1, 0, 0}, {0, 0, 0}, {0, 0, 1});
    return solid;
}

// 2x2 grid of unit squares in z = 0. The left column is "L", the right "R";
// they meet along the two-edge seam x = 1.
inline Geometry::MeshSolid MakeTwoColumnGrid()
{
    Geometry::MeshSolid solid("grid");
    AddQuad(solid, "L", {0, 0, 0}, {1, 0, 0}, {1, 1, 0}, {0, 1, 0});
    AddQuad(solid, "L", {0, 1, 0}, {1, 1, 0}, {1, 2, 0}, {0, 2, 0});
    AddQuad(solid, "R", {1, 0, 0}, {2, 0, 0}, {2, 1, 0}, {1, 1, 0});
    AddQuad(solid, "R", {1, 1, 0}, {2, 1, 0}, {2, 2, 0}, {1, 2, 0});
    return solid;
}

// Positions of a solid as dvec3, for the table builders.
inline std::vector<glm::dvec3> PointsOf(const Geometry::ISolidView& solid)
{
    const auto flat = solid.VertexPositions();
    std::vector<glm::dvec3> points;
    points.reserve(flat.size() / 3);
    for (std::size_t i = 0; i + 2 < flat.size(); i += 3)
        points.emplace_back(flat[i], flat[i + 1], flat[i + 2]);
    return points;
}
