module;

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

export module Geometry:BoundaryLoops;

import :PlaneMath;

export namespace Geometry::BoundaryLoops
{
    // =========================================================================
    // Boundary Edges
    // =========================================================================
    //
    // Within a component every triangle contributes three directed edges.
    // An undirected edge used once is boundary, twice is interior, three or
    // more times is non-manifold. Boundary edges keep the direction of their
    // owning triangle's winding.

    struct DirectedEdge
    {
        uint32_t From{0};
        uint32_t To{0};
    };

    struct BoundaryEdgeSet
    {
        // In order of first appearance in the component.
        std::vector<DirectedEdge> Edges;

        std::size_t InteriorEdgeCount{0};
        std::size_t NonManifoldEdgeCount{0};
    };

    [[nodiscard]] BoundaryEdgeSet CollectBoundaryEdges(std::span<const uint32_t> component,
                                                       const PlaneMath::TriangleTable& table);

    // =========================================================================
    // Loop Assembly
    // =========================================================================

    enum class LoopStatus : uint8_t
    {
        Ok,
        TooFewEdges,
        NonManifold,
        Unclosed
    };

    [[nodiscard]] std::string_view LoopStatusToString(LoopStatus status);

    using Loop = std::vector<uint32_t>;

    struct LoopAssembly
    {
        LoopStatus Status{LoopStatus::Ok};
        std::vector<Loop> Loops;
    };

    // Chains directed boundary edges into closed loops. Each walk seeds from
    // an unused edge and follows the first unused successor. A walk that
    // finds no successor, or does not close within edgeCount + 5 steps,
    // aborts the whole assembly with Unclosed.
    [[nodiscard]] LoopAssembly AssembleLoops(std::span<const DirectedEdge> edges);

    // =========================================================================
    // Plane Basis and Classification
    // =========================================================================

    struct PlaneBasis
    {
        glm::dvec3 U{1.0, 0.0, 0.0};
        glm::dvec3 V{0.0, 1.0, 0.0};
    };

    // cross(axis, normal) with axis = Z, or Y when |normal.z| >= 0.9.
    [[nodiscard]] glm::dvec3 OrthogonalReference(const glm::dvec3& normal);

    // U follows refDir unless it is nearly parallel to the normal
    // (|U . n| > 0.99), in which case OrthogonalReference is used.
    // V = normalize(n x U).
    [[nodiscard]] PlaneBasis MakePlaneBasis(const glm::dvec3& normal, const glm::dvec3& refDir);

    // Shoelace area of the loop projected on (U, V). Positive when the loop
    // runs counter-clockwise about U x V.
    [[nodiscard]] double SignedLoopArea(std::span<const uint32_t> loop,
                                        std::span<const glm::dvec3> points,
                                        const PlaneBasis& basis);

    struct ClassifiedLoops
    {
        std::vector<Loop> Loops;
        std::vector<double> Areas;
        std::size_t OuterIndex{0};
        PlaneBasis Basis;
        glm::dvec3 Normal{0.0, 0.0, 1.0};

        [[nodiscard]] const Loop& Outer() const { return Loops[OuterIndex]; }
        [[nodiscard]] std::size_t HoleCount() const { return Loops.empty() ? 0 : Loops.size() - 1; }
    };

    // The loop with the greatest absolute area becomes the outer bound and
    // is reversed if needed to make its area positive. Every other loop is
    // reversed if needed to make its area negative.
    [[nodiscard]] ClassifiedLoops ClassifyLoops(std::vector<Loop> loops,
                                                std::span<const glm::dvec3> points,
                                                const glm::dvec3& normal,
                                                const glm::dvec3& refDir);

    struct FaceLoopResult
    {
        LoopStatus Status{LoopStatus::Ok};
        ClassifiedLoops Face;

        [[nodiscard]] bool Ok() const { return Status == LoopStatus::Ok; }
    };

    // Boundary edges -> loops -> classification for one coplanar component.
    // Plane normal and reference direction come from the component's first
    // valid triangle.
    [[nodiscard]] FaceLoopResult BuildFaceLoops(std::span<const uint32_t> component,
                                                const PlaneMath::TriangleTable& table,
                                                std::span<const glm::dvec3> points);
}
