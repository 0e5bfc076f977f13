module;

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <glm/glm.hpp>

export module Geometry:PlaneMath;

import :Solid;

export namespace Geometry::PlaneMath
{
    // Raw cross-product length below which a triangle has no usable normal.
    inline constexpr double DegenerateNormalEpsilon = 1e-16;

    // =========================================================================
    // Transforms
    // =========================================================================

    [[nodiscard]] bool IsIdentity(const glm::dmat4& m, double eps = 1e-12);

    // Applies m to p. The homogeneous divide only happens when |w - 1| is
    // above 1e-12 and w is non-zero.
    [[nodiscard]] glm::dvec3 TransformPoint(const glm::dmat4& m, const glm::dvec3& p);

    // =========================================================================
    // Prepared Positions
    // =========================================================================

    struct PreparedPositions
    {
        std::vector<glm::dvec3> Points;
        glm::dvec3 BoundsMin{0.0};
        glm::dvec3 BoundsMax{0.0};
    };

    // Copies the solid's vertices into export space: world transform first
    // (skipped when identity or absent), then the uniform scale. Bounds are
    // taken after both.
    [[nodiscard]] PreparedPositions PreparePositions(const ISolidView& solid,
                                                     const std::optional<glm::dmat4>& transform,
                                                     double scale);

    // Length of the bounds diagonal, or 1 when it is zero or not finite.
    [[nodiscard]] double BoundingDiagonal(const PreparedPositions& prepared);

    // =========================================================================
    // Triangle Records
    // =========================================================================

    struct TriangleRecord
    {
        uint32_t I0{0}, I1{0}, I2{0};

        // Unit normal from (p1 - p0) x (p2 - p0).
        glm::dvec3 Normal{0.0, 0.0, 1.0};

        // Plane offset, Normal . p0.
        double D{0.0};

        // p1 - p0, used as the in-plane reference direction.
        glm::dvec3 E1{1.0, 0.0, 0.0};
    };

    struct TriangleTable
    {
        // One entry per source triangle; empty for degenerate or
        // out-of-range triangles.
        std::vector<std::optional<TriangleRecord>> Records;

        std::size_t ValidCount{0};
        std::size_t DegenerateCount{0};
        std::size_t InvalidIndexCount{0};

        [[nodiscard]] const TriangleRecord* Find(std::size_t triangle) const
        {
            if (triangle >= Records.size() || !Records[triangle])
                return nullptr;
            return &*Records[triangle];
        }

        [[nodiscard]] std::size_t Size() const { return Records.size(); }
    };

    [[nodiscard]] std::optional<TriangleRecord> MakeTriangleRecord(uint32_t i0, uint32_t i1, uint32_t i2,
                                                                   std::span<const glm::dvec3> points);

    [[nodiscard]] TriangleTable BuildTriangleRecords(std::span<const glm::dvec3> points,
                                                     std::span<const uint32_t> indices);
}
