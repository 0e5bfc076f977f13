module;

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>

#include <glm/glm.hpp>

export module Geometry:MeshRepair;

import :Solid;
import :Triangulation;

export namespace Geometry::MeshRepair
{
    // =========================================================================
    // Mesh Repair Operations
    // =========================================================================
    //
    // In-place fixes for authoring meshes before export: degenerate
    // triangles, vertex noise, inconsistent winding and open boundaries.
    // Operations are not reentrant per solid. An empty mesh yields nullopt.

    // =====================================================================
    // 1. Consistent Winding
    // =====================================================================
    //
    // BFS over each edge-connected component from its lowest triangle. A
    // neighbour that traverses a shared manifold edge in the same direction
    // as the current triangle is flipped. Components that are closed (every
    // edge used exactly twice) and enclose negative signed volume are then
    // flipped wholesale so their normals point outward.

    struct OrientationResult
    {
        // Number of connected components found
        std::size_t ComponentCount{0};

        // Triangles flipped during propagation
        std::size_t TrianglesFlipped{0};

        // Closed components flipped for outward orientation
        std::size_t ComponentsInverted{0};

        // Whether nothing had to change
        bool WasConsistent{true};
    };

    [[nodiscard]] std::optional<OrientationResult> FixWindingsByAdjacency(MeshSolid& solid);

    // =====================================================================
    // 2. Degenerate Triangle Removal
    // =====================================================================
    //
    // Drops triangles with area at or below the threshold (or non-finite,
    // or referencing missing vertices), then compacts unreferenced vertices,
    // remaps indices and face ids, rebuilds the position lookup and fixes
    // winding.

    struct DegenerateRemovalParams
    {
        double AreaEpsilon{1e-12};
    };

    struct DegenerateRemovalResult
    {
        std::size_t TrianglesRemoved{0};
        std::size_t VerticesRemoved{0};
        std::size_t TrianglesKept{0};
    };

    [[nodiscard]] std::optional<DegenerateRemovalResult> RemoveDegenerateTriangles(
        MeshSolid& solid,
        const DegenerateRemovalParams& params = {});

    // =====================================================================
    // 3. Vertex Quantization
    // =====================================================================
    //
    // Snaps every coordinate to round(v / Grid) * Grid. When anything moved
    // the lookup is rebuilt and winding is fixed. A second call with the same
    // grid moves nothing. Vertices that land on the same position are not
    // merged.

    struct QuantizationParams
    {
        double Grid{1e-6};
    };

    struct QuantizationResult
    {
        // Vertices with at least one coordinate changed
        std::size_t VerticesMoved{0};

        std::size_t CoordinatesMoved{0};
    };

    // nullopt when the grid is not a positive finite number.
    [[nodiscard]] std::optional<QuantizationResult> QuantizeVertices(
        MeshSolid& solid,
        const QuantizationParams& params = {});

    // =====================================================================
    // 4. Endcap Generation
    // =====================================================================
    //
    // Triangulates a boundary loop and appends the triangles to the solid
    // under faceName. Fan triangulation is the default as caps are usually
    // convex; use EarClip for concave outlines.

    struct EndcapParams
    {
        Triangulation::TriangulationMethod Method{Triangulation::TriangulationMethod::Fan};
        Triangulation::EarFallback Fallback{Triangulation::EarFallback::Fan};
        bool EnsureCounterClockwise{true};
        double MinTriangleArea{1e-12};

        // Cap normal; derived from the loop when absent.
        std::optional<glm::dvec3> Normal;
    };

    struct EndcapResult
    {
        Triangulation::TriangulationStatus Status{Triangulation::TriangulationStatus::Ok};
        std::size_t TrianglesAdded{0};
        bool UsedFallback{false};
    };

    [[nodiscard]] EndcapResult GenerateEndcap(IMutableSolid& solid,
                                              std::string_view faceName,
                                              std::span<const glm::dvec3> loop,
                                              const EndcapParams& params = {});

    // =====================================================================
    // 5. Combined Repair
    // =====================================================================

    struct RepairParams
    {
        bool RemoveDegenerates{true};
        DegenerateRemovalParams DegenerateParams;

        // Quantization runs only when a grid is given.
        std::optional<QuantizationParams> Quantize;

        bool FixOrientation{true};
    };

    struct RepairResult
    {
        DegenerateRemovalResult DegenerateResult;
        QuantizationResult QuantizeResult;
        OrientationResult OrientResult;
    };

    // Order: remove degenerates -> quantize -> fix orientation
    [[nodiscard]] std::optional<RepairResult> Repair(
        MeshSolid& solid,
        const RepairParams& params = {});

} // namespace Geometry::MeshRepair
