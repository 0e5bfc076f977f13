module;

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>

module Geometry:FaceGrouping.Impl;

import :FaceGrouping;
import :PlaneMath;
import :EdgeKey;

namespace Geometry::FaceGrouping
{
    std::size_t PlaneKeyHash::operator()(const PlaneKey& k) const noexcept
    {
        std::size_t h = std::hash<int64_t>{}(k.Nx);
        const auto mix = [&h](int64_t v) {
            h ^= std::hash<int64_t>{}(v) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
        };
        mix(k.Ny);
        mix(k.Nz);
        mix(k.D);
        return h;
    }

    int64_t Quantize(double value, double tol)
    {
        if (!std::isfinite(value) || !std::isfinite(tol) || tol <= 0.0)
            return 0;

        const double q = std::round(value / tol);
        // Saturate instead of overflowing the cast.
        if (!(std::abs(q) < 9.0e18))
            return q > 0.0 ? INT64_MAX : INT64_MIN;
        return static_cast<int64_t>(q);
    }

    PlaneKey MakePlaneKey(const glm::dvec3& normal, double d, double normalTol, double distTol)
    {
        return PlaneKey{
            Quantize(normal.x, normalTol),
            Quantize(normal.y, normalTol),
            Quantize(normal.z, normalTol),
            Quantize(d, distTol)};
    }

    Tolerances ResolveTolerances(std::optional<double> normalTol,
                                 std::optional<double> distTol,
                                 double boundingDiagonal)
    {
        Tolerances tol;
        if (normalTol && std::isfinite(*normalTol) && *normalTol > 0.0)
            tol.Normal = *normalTol;

        const double diag = (std::isfinite(boundingDiagonal) && boundingDiagonal > 0.0) ? boundingDiagonal : 1.0;
        tol.Distance = std::max(1e-6, diag * 1e-6);
        if (distTol && std::isfinite(*distTol) && *distTol > 0.0)
            tol.Distance = *distTol;

        return tol;
    }

    std::vector<FaceGroup> GroupByFaceId(const PlaneMath::TriangleTable& table,
                                         std::span<const uint32_t> faceIds)
    {
        std::vector<FaceGroup> groups;
        std::unordered_map<uint32_t, std::size_t> slot;

        const std::size_t count = std::min(table.Size(), faceIds.size());
        for (std::size_t t = 0; t < count; ++t)
        {
            if (!table.Find(t))
                continue;

            const uint32_t id = faceIds[t];
            auto [it, inserted] = slot.try_emplace(id, groups.size());
            if (inserted)
                groups.push_back(FaceGroup{id, {}});
            groups[it->second].Triangles.push_back(static_cast<uint32_t>(t));
        }

        return groups;
    }

    std::vector<FaceGroup> GroupByPlane(const PlaneMath::TriangleTable& table,
                                        double normalTol, double distTol, bool merge)
    {
        std::vector<FaceGroup> groups;
        std::unordered_map<PlaneKey, std::size_t, PlaneKeyHash> slot;

        for (std::size_t t = 0; t < table.Size(); ++t)
        {
            const PlaneMath::TriangleRecord* rec = table.Find(t);
            if (!rec)
                continue;

            if (!merge)
            {
                groups.push_back(FaceGroup{static_cast<uint32_t>(groups.size()), {static_cast<uint32_t>(t)}});
                continue;
            }

            const PlaneKey key = MakePlaneKey(rec->Normal, rec->D, normalTol, distTol);
            auto [it, inserted] = slot.try_emplace(key, groups.size());
            if (inserted)
                groups.push_back(FaceGroup{static_cast<uint32_t>(groups.size()), {}});
            groups[it->second].Triangles.push_back(static_cast<uint32_t>(t));
        }

        return groups;
    }

    std::vector<std::vector<uint32_t>> SplitComponents(std::span<const uint32_t> group,
                                                       const PlaneMath::TriangleTable& table)
    {
        std::vector<std::vector<uint32_t>> components;
        if (group.empty())
            return components;

        // Edge -> local triangle slots using it.
        std::unordered_map<EdgeKey, std::vector<std::size_t>, EdgeKeyHash> edgeUsers;
        edgeUsers.reserve(group.size() * 3);

        for (std::size_t local = 0; local < group.size(); ++local)
        {
            const PlaneMath::TriangleRecord* rec = table.Find(group[local]);
            if (!rec)
                continue;
            edgeUsers[MakeEdgeKey(rec->I0, rec->I1)].push_back(local);
            edgeUsers[MakeEdgeKey(rec->I1, rec->I2)].push_back(local);
            edgeUsers[MakeEdgeKey(rec->I2, rec->I0)].push_back(local);
        }

        std::vector<bool> visited(group.size(), false);
        std::vector<std::size_t> stack;

        for (std::size_t seed = 0; seed < group.size(); ++seed)
        {
            if (visited[seed] || !table.Find(group[seed]))
                continue;

            std::vector<uint32_t> component;
            stack.push_back(seed);
            visited[seed] = true;

            while (!stack.empty())
            {
                const std::size_t local = stack.back();
                stack.pop_back();
                component.push_back(group[local]);

                const PlaneMath::TriangleRecord* rec = table.Find(group[local]);
                const EdgeKey edges[3] = {
                    MakeEdgeKey(rec->I0, rec->I1),
                    MakeEdgeKey(rec->I1, rec->I2),
                    MakeEdgeKey(rec->I2, rec->I0)};

                for (const EdgeKey& e : edges)
                {
                    for (std::size_t neighbor : edgeUsers[e])
                    {
                        if (visited[neighbor])
                            continue;
                        visited[neighbor] = true;
                        stack.push_back(neighbor);
                    }
                }
            }

            std::sort(component.begin(), component.end());
            components.push_back(std::move(component));
        }

        return components;
    }

    bool IsCoplanarGroup(std::span<const uint32_t> group,
                         const PlaneMath::TriangleTable& table,
                         double normalTol, double distTol)
    {
        const PlaneMath::TriangleRecord* first = nullptr;
        for (uint32_t t : group)
        {
            const PlaneMath::TriangleRecord* rec = table.Find(t);
            if (!rec)
                continue;

            if (!first)
            {
                first = rec;
                continue;
            }

            const double dot = glm::dot(first->Normal, rec->Normal);
            if (1.0 - std::abs(dot) > normalTol)
                return false;

            const double d = dot < 0.0 ? -rec->D : rec->D;
            if (std::abs(d - first->D) > distTol)
                return false;
        }
        return true;
    }

    std::vector<std::vector<uint32_t>> SplitByPlaneKey(std::span<const uint32_t> group,
                                                       const PlaneMath::TriangleTable& table,
                                                       double normalTol, double distTol)
    {
        std::vector<std::vector<uint32_t>> parts;
        std::unordered_map<PlaneKey, std::size_t, PlaneKeyHash> slot;

        for (uint32_t t : group)
        {
            const PlaneMath::TriangleRecord* rec = table.Find(t);
            if (!rec)
                continue;

            const PlaneKey key = MakePlaneKey(rec->Normal, rec->D, normalTol, distTol);
            auto [it, inserted] = slot.try_emplace(key, parts.size());
            if (inserted)
                parts.emplace_back();
            parts[it->second].push_back(t);
        }

        return parts;
    }

    std::vector<uint32_t> LabelTriangles(std::span<const FaceGroup> groups, std::size_t triangleCount)
    {
        std::vector<uint32_t> labels(triangleCount, 0);
        for (const FaceGroup& g : groups)
        {
            for (uint32_t t : g.Triangles)
            {
                if (t < labels.size())
                    labels[t] = g.Label;
            }
        }
        return labels;
    }
}
