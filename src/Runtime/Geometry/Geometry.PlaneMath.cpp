module;

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <glm/glm.hpp>

module Geometry:PlaneMath.Impl;

import :PlaneMath;
import :Solid;

namespace Geometry::PlaneMath
{
    bool IsIdentity(const glm::dmat4& m, double eps)
    {
        for (int c = 0; c < 4; ++c)
        {
            for (int r = 0; r < 4; ++r)
            {
                const double expected = (c == r) ? 1.0 : 0.0;
                if (!(std::abs(m[c][r] - expected) <= eps))
                    return false;
            }
        }
        return true;
    }

    glm::dvec3 TransformPoint(const glm::dmat4& m, const glm::dvec3& p)
    {
        const glm::dvec4 r = m * glm::dvec4(p, 1.0);
        if (std::abs(r.w - 1.0) > 1e-12 && r.w != 0.0)
            return glm::dvec3(r) / r.w;
        return glm::dvec3(r);
    }

    PreparedPositions PreparePositions(const ISolidView& solid,
                                       const std::optional<glm::dmat4>& transform,
                                       double scale)
    {
        PreparedPositions out;

        const auto flat = solid.VertexPositions();
        const std::size_t count = flat.size() / 3;
        out.Points.reserve(count);

        const bool applyTransform = transform.has_value() && !IsIdentity(*transform);
        const bool applyScale = std::isfinite(scale) && scale != 1.0;

        for (std::size_t i = 0; i < count; ++i)
        {
            glm::dvec3 p{flat[i * 3], flat[i * 3 + 1], flat[i * 3 + 2]};
            if (applyTransform)
                p = TransformPoint(*transform, p);
            if (applyScale)
                p *= scale;
            out.Points.push_back(p);
        }

        if (!out.Points.empty())
        {
            out.BoundsMin = out.Points.front();
            out.BoundsMax = out.Points.front();
            for (const glm::dvec3& p : out.Points)
            {
                out.BoundsMin = glm::min(out.BoundsMin, p);
                out.BoundsMax = glm::max(out.BoundsMax, p);
            }
        }

        return out;
    }

    double BoundingDiagonal(const PreparedPositions& prepared)
    {
        const double diag = glm::length(prepared.BoundsMax - prepared.BoundsMin);
        if (!std::isfinite(diag) || diag <= 0.0)
            return 1.0;
        return diag;
    }

    std::optional<TriangleRecord> MakeTriangleRecord(uint32_t i0, uint32_t i1, uint32_t i2,
                                                     std::span<const glm::dvec3> points)
    {
        if (i0 >= points.size() || i1 >= points.size() || i2 >= points.size())
            return std::nullopt;

        const glm::dvec3& p0 = points[i0];
        const glm::dvec3 e1 = points[i1] - p0;
        const glm::dvec3 e2 = points[i2] - p0;
        const glm::dvec3 n = glm::cross(e1, e2);
        const double len = glm::length(n);
        if (!std::isfinite(len) || len < DegenerateNormalEpsilon)
            return std::nullopt;

        TriangleRecord rec;
        rec.I0 = i0;
        rec.I1 = i1;
        rec.I2 = i2;
        rec.Normal = n / len;
        rec.D = glm::dot(rec.Normal, p0);
        rec.E1 = e1;
        return rec;
    }

    TriangleTable BuildTriangleRecords(std::span<const glm::dvec3> points,
                                       std::span<const uint32_t> indices)
    {
        TriangleTable table;
        const std::size_t triCount = indices.size() / 3;
        table.Records.resize(triCount);

        for (std::size_t t = 0; t < triCount; ++t)
        {
            const uint32_t i0 = indices[t * 3];
            const uint32_t i1 = indices[t * 3 + 1];
            const uint32_t i2 = indices[t * 3 + 2];

            if (i0 >= points.size() || i1 >= points.size() || i2 >= points.size())
            {
                ++table.InvalidIndexCount;
                continue;
            }

            table.Records[t] = MakeTriangleRecord(i0, i1, i2, points);
            if (table.Records[t])
                ++table.ValidCount;
            else
                ++table.DegenerateCount;
        }

        return table;
    }
}
