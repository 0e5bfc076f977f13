module;

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

module Geometry:Triangulation.Impl;

import :Triangulation;
import Core.Logging;

namespace Geometry::Triangulation
{
    namespace
    {
        constexpr double s_FlatnessEpsilon = 1e-12;

        bool IsFiniteVec(const glm::dvec3& v)
        {
            return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
        }

        // Ear clipping over a working copy. Returns false when a pass found no
        // ear; vertices then holds what is left.
        bool ClipEars(std::vector<glm::dvec3>& vertices, const glm::dvec3& normal, double minArea,
                      std::vector<Triangle>& out, std::size_t& passes)
        {
            while (vertices.size() > 3)
            {
                ++passes;
                bool earFound = false;
                const std::size_t n = vertices.size();

                for (std::size_t i = 0; i < n; ++i)
                {
                    if (!IsEar(vertices, i, normal))
                        continue;

                    const glm::dvec3& prev = vertices[(i + n - 1) % n];
                    const glm::dvec3& next = vertices[(i + 1) % n];
                    if (TriangleArea(prev, vertices[i], next) > minArea)
                        out.push_back({prev, vertices[i], next});

                    vertices.erase(vertices.begin() + static_cast<std::ptrdiff_t>(i));
                    earFound = true;
                    break;
                }

                if (!earFound)
                    return false;
            }

            if (vertices.size() == 3 && TriangleArea(vertices[0], vertices[1], vertices[2]) > minArea)
                out.push_back({vertices[0], vertices[1], vertices[2]});
            return true;
        }
    }

    std::string_view TriangulationStatusToString(TriangulationStatus status)
    {
        switch (status)
        {
            case TriangulationStatus::Ok:      return "Ok";
            case TriangulationStatus::Partial: return "Partial";
            case TriangulationStatus::Failed:  return "Failed";
        }
        return "Unknown";
    }

    std::vector<glm::dvec3> CollapseDuplicatePoints(std::span<const glm::dvec3> loop, double tol)
    {
        std::vector<glm::dvec3> clean;
        clean.reserve(loop.size());
        const std::size_t n = loop.size();
        for (std::size_t i = 0; i < n; ++i)
        {
            if (glm::length(loop[(i + 1) % n] - loop[i]) > tol)
                clean.push_back(loop[i]);
        }
        return clean;
    }

    glm::dvec3 ComputeNewellNormal(std::span<const glm::dvec3> loop)
    {
        glm::dvec3 n(0.0);
        const std::size_t count = loop.size();
        for (std::size_t i = 0; i < count; ++i)
        {
            const glm::dvec3& a = loop[i];
            const glm::dvec3& b = loop[(i + 1) % count];
            n.x += (a.y - b.y) * (a.z + b.z);
            n.y += (a.z - b.z) * (a.x + b.x);
            n.z += (a.x - b.x) * (a.y + b.y);
        }
        return n;
    }

    double ComputeSignedArea(std::span<const glm::dvec3> loop, const glm::dvec3& normal)
    {
        const glm::dvec3 a = glm::abs(normal);
        int axis = 0;
        if (a.y > a.x) axis = 1;
        if (a.z > a[axis]) axis = 2;

        // Cyclic (u, v) so u x v points along +axis.
        const int u = (axis + 1) % 3;
        const int v = (axis + 2) % 3;

        double area = 0.0;
        const std::size_t n = loop.size();
        for (std::size_t i = 0; i < n; ++i)
        {
            const glm::dvec3& p0 = loop[i];
            const glm::dvec3& p1 = loop[(i + 1) % n];
            area += p0[u] * p1[v] - p1[u] * p0[v];
        }

        area *= 0.5;
        return normal[axis] < 0.0 ? -area : area;
    }

    double TriangleArea(const glm::dvec3& a, const glm::dvec3& b, const glm::dvec3& c)
    {
        return 0.5 * glm::length(glm::cross(b - a, c - a));
    }

    bool PointInTriangle(const glm::dvec3& p, const glm::dvec3& a, const glm::dvec3& b, const glm::dvec3& c)
    {
        const glm::dvec3 v0 = c - a;
        const glm::dvec3 v1 = b - a;
        const glm::dvec3 v2 = p - a;

        const double dot00 = glm::dot(v0, v0);
        const double dot01 = glm::dot(v0, v1);
        const double dot02 = glm::dot(v0, v2);
        const double dot11 = glm::dot(v1, v1);
        const double dot12 = glm::dot(v1, v2);

        const double denom = dot00 * dot11 - dot01 * dot01;
        if (denom == 0.0)
            return false;

        const double inv = 1.0 / denom;
        const double u = (dot11 * dot02 - dot01 * dot12) * inv;
        const double v = (dot00 * dot12 - dot01 * dot02) * inv;
        return u >= 0.0 && v >= 0.0 && u + v <= 1.0;
    }

    bool IsEar(std::span<const glm::dvec3> vertices, std::size_t i, const glm::dvec3& normal)
    {
        const std::size_t n = vertices.size();
        if (n < 3)
            return false;

        const std::size_t ip = (i + n - 1) % n;
        const std::size_t in = (i + 1) % n;
        const glm::dvec3& prev = vertices[ip];
        const glm::dvec3& cur = vertices[i];
        const glm::dvec3& next = vertices[in];

        if (glm::dot(glm::cross(cur - prev, next - cur), normal) <= 0.0)
            return false;

        for (std::size_t j = 0; j < n; ++j)
        {
            if (j == ip || j == i || j == in)
                continue;
            if (PointInTriangle(vertices[j], prev, cur, next))
                return false;
        }
        return true;
    }

    std::size_t TriangulateFan(std::span<const glm::dvec3> points, double minArea, std::vector<Triangle>& out)
    {
        if (points.size() < 3)
            return 0;

        std::size_t count = 0;
        const glm::dvec3& p0 = points[0];
        for (std::size_t i = 1; i + 1 < points.size(); ++i)
        {
            if (TriangleArea(p0, points[i], points[i + 1]) > minArea)
            {
                out.push_back({p0, points[i], points[i + 1]});
                ++count;
            }
        }
        return count;
    }

    std::size_t TriangulateCentroid(std::span<const glm::dvec3> points, double minArea, std::vector<Triangle>& out)
    {
        if (points.size() < 3)
            return 0;

        glm::dvec3 centroid(0.0);
        for (const glm::dvec3& p : points)
            centroid += p;
        centroid /= static_cast<double>(points.size());

        std::size_t count = 0;
        const std::size_t n = points.size();
        for (std::size_t i = 0; i < n; ++i)
        {
            const glm::dvec3& a = points[i];
            const glm::dvec3& b = points[(i + 1) % n];
            if (TriangleArea(centroid, a, b) > minArea)
            {
                out.push_back({centroid, a, b});
                ++count;
            }
        }
        return count;
    }

    TriangulationResult TriangulatePolygon(std::span<const glm::dvec3> loop, const TriangulationParams& params)
    {
        TriangulationResult result;

        const double minArea = std::max(0.0, params.MinTriangleArea);
        const double tol = params.DuplicateTolerance.value_or(std::max(minArea, 1e-10));

        std::vector<glm::dvec3> points = CollapseDuplicatePoints(loop, tol);
        result.UniquePointCount = points.size();
        if (points.size() < 3)
        {
            Core::Log::Warn("Triangulation: {} usable points after cleaning, need 3", points.size());
            result.Status = TriangulationStatus::Failed;
            return result;
        }

        glm::dvec3 normal(0.0);
        if (params.Normal && IsFiniteVec(*params.Normal) && glm::length(*params.Normal) > 0.0)
        {
            normal = glm::normalize(*params.Normal);
        }
        else
        {
            // The Newell length is twice the area, so compare it against the
            // squared perimeter to stay independent of model scale.
            double perimeter = 0.0;
            for (std::size_t i = 0; i < points.size(); ++i)
                perimeter += glm::length(points[(i + 1) % points.size()] - points[i]);

            const glm::dvec3 raw = ComputeNewellNormal(points);
            const double len = glm::length(raw);
            if (!std::isfinite(len) || len <= s_FlatnessEpsilon * perimeter * perimeter)
            {
                Core::Log::Warn("Triangulation: degenerate polygon, no usable normal");
                result.Status = TriangulationStatus::Failed;
                return result;
            }
            normal = raw / len;
        }
        result.Normal = normal;

        if (params.EnsureCounterClockwise && ComputeSignedArea(points, normal) < 0.0)
        {
            std::reverse(points.begin(), points.end());
            result.Reversed = true;
        }

        switch (params.Method)
        {
            case TriangulationMethod::Fan:
                TriangulateFan(points, minArea, result.Triangles);
                return result;
            case TriangulationMethod::Centroid:
                TriangulateCentroid(points, minArea, result.Triangles);
                return result;
            case TriangulationMethod::EarClip:
                break;
        }

        std::vector<glm::dvec3> remaining = points;
        if (ClipEars(remaining, normal, minArea, result.Triangles, result.EarPasses))
            return result;

        const std::size_t fallbackStart = result.Triangles.size();
        switch (params.Fallback)
        {
            case EarFallback::None:
                Core::Log::Warn("Triangulation: ear clipping failed with {} vertices left, fallback disabled",
                                remaining.size());
                result.Status = TriangulationStatus::Partial;
                return result;
            case EarFallback::Centroid:
                Core::Log::Warn("Triangulation: ear clipping failed, falling back to centroid");
                TriangulateCentroid(remaining, minArea, result.Triangles);
                break;
            case EarFallback::Fan:
                Core::Log::Warn("Triangulation: ear clipping failed, falling back to fan");
                TriangulateFan(remaining, minArea, result.Triangles);
                break;
        }
        result.UsedFallback = true;

        // Fallback triangles must still face along the loop normal.
        for (std::size_t i = fallbackStart; i < result.Triangles.size(); ++i)
        {
            Triangle& tri = result.Triangles[i];
            if (glm::dot(glm::cross(tri[1] - tri[0], tri[2] - tri[0]), normal) < 0.0)
            {
                std::swap(tri[1], tri[2]);
                ++result.FlippedAfterFallback;
            }
        }

        return result;
    }
}
