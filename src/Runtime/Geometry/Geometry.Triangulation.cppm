module;

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

export module Geometry:Triangulation;

export namespace Geometry::Triangulation
{
    // =========================================================================
    // Polygon Triangulation
    // =========================================================================
    //
    // Triangulates a single closed 3D polygon loop (no holes). The loop is
    // cleaned of coincident neighbours, given a normal (Newell's method
    // unless one is supplied) and optionally re-oriented so it runs
    // counter-clockwise about that normal before a strategy runs.

    enum class TriangulationMethod : uint8_t
    {
        Fan,      // From the first vertex. Convex loops only.
        Centroid, // From the vertex mean. Star-shaped loops only.
        EarClip   // Handles concave loops.
    };

    // What ear clipping does with the remaining vertices when a full pass
    // finds no ear.
    enum class EarFallback : uint8_t
    {
        None,
        Centroid,
        Fan
    };

    enum class TriangulationStatus : uint8_t
    {
        Ok,
        Partial, // Ear search exhausted with EarFallback::None.
        Failed   // Fewer than three usable points, or no usable normal.
    };

    [[nodiscard]] std::string_view TriangulationStatusToString(TriangulationStatus status);

    struct TriangulationParams
    {
        TriangulationMethod Method{TriangulationMethod::EarClip};
        EarFallback Fallback{EarFallback::Fan};

        // Reverse the loop when its signed area about the normal is negative.
        bool EnsureCounterClockwise{true};

        // Triangles with area at or below this are not emitted.
        double MinTriangleArea{1e-12};

        // Neighbour distance at or below which a point is dropped.
        // Defaults to max(MinTriangleArea, 1e-10).
        std::optional<double> DuplicateTolerance;

        // Loop normal. Computed with Newell's method when absent or not finite.
        std::optional<glm::dvec3> Normal;
    };

    using Triangle = std::array<glm::dvec3, 3>;

    struct TriangulationResult
    {
        TriangulationStatus Status{TriangulationStatus::Ok};
        std::vector<Triangle> Triangles;

        // Points left after duplicate collapse.
        std::size_t UniquePointCount{0};

        // Ear-search passes, including the final one that found no ear.
        std::size_t EarPasses{0};

        bool UsedFallback{false};

        // True when EnsureCounterClockwise reversed the loop.
        bool Reversed{false};

        // Fallback triangles flipped to agree with the loop normal.
        std::size_t FlippedAfterFallback{0};

        glm::dvec3 Normal{0.0, 0.0, 1.0};
    };

    // =========================================================================
    // Building Blocks
    // =========================================================================

    // Drops every point whose distance to its cyclic successor is <= tol.
    [[nodiscard]] std::vector<glm::dvec3> CollapseDuplicatePoints(std::span<const glm::dvec3> loop, double tol);

    // Newell's method. Returns the unnormalized sum; callers normalize.
    [[nodiscard]] glm::dvec3 ComputeNewellNormal(std::span<const glm::dvec3> loop);

    // Shoelace area on the coordinate plane most perpendicular to normal.
    // The sign is relative to the normal: positive means counter-clockwise
    // seen from the tip of the normal.
    [[nodiscard]] double ComputeSignedArea(std::span<const glm::dvec3> loop, const glm::dvec3& normal);

    [[nodiscard]] double TriangleArea(const glm::dvec3& a, const glm::dvec3& b, const glm::dvec3& c);

    // Barycentric test, boundary inclusive.
    [[nodiscard]] bool PointInTriangle(const glm::dvec3& p,
                                       const glm::dvec3& a, const glm::dvec3& b, const glm::dvec3& c);

    // Convex relative to normal, and no other vertex inside the clip triangle.
    [[nodiscard]] bool IsEar(std::span<const glm::dvec3> vertices, std::size_t i, const glm::dvec3& normal);

    // =========================================================================
    // Strategies
    // =========================================================================
    //
    // Each appends to out and returns how many triangles were appended.

    std::size_t TriangulateFan(std::span<const glm::dvec3> points, double minArea, std::vector<Triangle>& out);
    std::size_t TriangulateCentroid(std::span<const glm::dvec3> points, double minArea, std::vector<Triangle>& out);

    // =========================================================================
    // Entry Point
    // =========================================================================

    [[nodiscard]] TriangulationResult TriangulatePolygon(std::span<const glm::dvec3> loop,
                                                         const TriangulationParams& params = {});
}
