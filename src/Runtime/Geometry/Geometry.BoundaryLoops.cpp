module;

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>

module Geometry:BoundaryLoops.Impl;

import :BoundaryLoops;
import :PlaneMath;
import :EdgeKey;
import Core.Logging;

namespace Geometry::BoundaryLoops
{
    std::string_view LoopStatusToString(LoopStatus status)
    {
        switch (status)
        {
            case LoopStatus::Ok:          return "Ok";
            case LoopStatus::TooFewEdges: return "TooFewEdges";
            case LoopStatus::NonManifold: return "NonManifold";
            case LoopStatus::Unclosed:    return "Unclosed";
        }
        return "Unknown";
    }

    BoundaryEdgeSet CollectBoundaryEdges(std::span<const uint32_t> component,
                                         const PlaneMath::TriangleTable& table)
    {
        struct EdgeUse
        {
            DirectedEdge First;
            std::size_t Count{0};
        };

        std::vector<EdgeUse> uses;
        std::unordered_map<EdgeKey, std::size_t, EdgeKeyHash> slot;
        slot.reserve(component.size() * 3);

        const auto record = [&](uint32_t a, uint32_t b) {
            auto [it, inserted] = slot.try_emplace(MakeEdgeKey(a, b), uses.size());
            if (inserted)
                uses.push_back(EdgeUse{DirectedEdge{a, b}, 0});
            ++uses[it->second].Count;
        };

        for (uint32_t t : component)
        {
            const PlaneMath::TriangleRecord* rec = table.Find(t);
            if (!rec)
                continue;
            record(rec->I0, rec->I1);
            record(rec->I1, rec->I2);
            record(rec->I2, rec->I0);
        }

        BoundaryEdgeSet out;
        for (const EdgeUse& use : uses)
        {
            if (use.Count == 1)
                out.Edges.push_back(use.First);
            else if (use.Count == 2)
                ++out.InteriorEdgeCount;
            else
                ++out.NonManifoldEdgeCount;
        }
        return out;
    }

    LoopAssembly AssembleLoops(std::span<const DirectedEdge> edges)
    {
        LoopAssembly out;

        std::unordered_map<uint32_t, std::vector<std::size_t>> outgoing;
        outgoing.reserve(edges.size());
        for (std::size_t i = 0; i < edges.size(); ++i)
            outgoing[edges[i].From].push_back(i);

        std::vector<bool> used(edges.size(), false);
        const std::size_t guardLimit = edges.size() + 5;

        for (std::size_t seed = 0; seed < edges.size(); ++seed)
        {
            if (used[seed])
                continue;

            used[seed] = true;
            Loop loop{edges[seed].From};
            std::size_t current = seed;
            bool closed = false;

            for (std::size_t guard = 0; guard < guardLimit; ++guard)
            {
                const uint32_t to = edges[current].To;
                if (to == loop.front())
                {
                    closed = true;
                    break;
                }
                loop.push_back(to);

                std::size_t next = edges.size();
                auto it = outgoing.find(to);
                if (it != outgoing.end())
                {
                    for (std::size_t candidate : it->second)
                    {
                        if (!used[candidate])
                        {
                            next = candidate;
                            break;
                        }
                    }
                }

                if (next == edges.size())
                    break;

                used[next] = true;
                current = next;
            }

            if (!closed)
            {
                Core::Log::Debug("BoundaryLoops: walk from vertex {} did not close after {} vertices",
                                 loop.front(), loop.size());
                out.Status = LoopStatus::Unclosed;
                out.Loops.clear();
                return out;
            }

            if (loop.size() >= 3)
                out.Loops.push_back(std::move(loop));
        }

        if (out.Loops.empty())
            out.Status = LoopStatus::Unclosed;
        return out;
    }

    glm::dvec3 OrthogonalReference(const glm::dvec3& normal)
    {
        const glm::dvec3 axis = std::abs(normal.z) < 0.9 ? glm::dvec3(0.0, 0.0, 1.0) : glm::dvec3(0.0, 1.0, 0.0);
        return glm::normalize(glm::cross(axis, normal));
    }

    PlaneBasis MakePlaneBasis(const glm::dvec3& normal, const glm::dvec3& refDir)
    {
        PlaneBasis basis;

        glm::dvec3 u = refDir;
        const double len = glm::length(u);
        if (!std::isfinite(len) || len < 1e-16)
            u = OrthogonalReference(normal);
        else
            u /= len;

        if (std::abs(glm::dot(u, normal)) > 0.99)
            u = OrthogonalReference(normal);

        basis.U = u;
        basis.V = glm::normalize(glm::cross(normal, u));
        return basis;
    }

    double SignedLoopArea(std::span<const uint32_t> loop,
                          std::span<const glm::dvec3> points,
                          const PlaneBasis& basis)
    {
        const std::size_t n = loop.size();
        if (n < 3)
            return 0.0;

        double area = 0.0;
        for (std::size_t i = 0; i < n; ++i)
        {
            const glm::dvec3& a = points[loop[i]];
            const glm::dvec3& b = points[loop[(i + 1) % n]];
            const double ax = glm::dot(a, basis.U);
            const double ay = glm::dot(a, basis.V);
            const double bx = glm::dot(b, basis.U);
            const double by = glm::dot(b, basis.V);
            area += ax * by - bx * ay;
        }
        return 0.5 * area;
    }

    ClassifiedLoops ClassifyLoops(std::vector<Loop> loops,
                                  std::span<const glm::dvec3> points,
                                  const glm::dvec3& normal,
                                  const glm::dvec3& refDir)
    {
        ClassifiedLoops out;
        out.Normal = normal;
        out.Basis = MakePlaneBasis(normal, refDir);
        out.Loops = std::move(loops);
        out.Areas.reserve(out.Loops.size());

        double best = -1.0;
        for (std::size_t i = 0; i < out.Loops.size(); ++i)
        {
            const double area = SignedLoopArea(out.Loops[i], points, out.Basis);
            out.Areas.push_back(area);
            if (std::abs(area) > best)
            {
                best = std::abs(area);
                out.OuterIndex = i;
            }
        }

        for (std::size_t i = 0; i < out.Loops.size(); ++i)
        {
            const bool outer = (i == out.OuterIndex);
            if ((outer && out.Areas[i] < 0.0) || (!outer && out.Areas[i] > 0.0))
            {
                std::reverse(out.Loops[i].begin(), out.Loops[i].end());
                out.Areas[i] = -out.Areas[i];
            }
        }

        return out;
    }

    FaceLoopResult BuildFaceLoops(std::span<const uint32_t> component,
                                  const PlaneMath::TriangleTable& table,
                                  std::span<const glm::dvec3> points)
    {
        FaceLoopResult out;

        const PlaneMath::TriangleRecord* first = nullptr;
        for (uint32_t t : component)
        {
            first = table.Find(t);
            if (first)
                break;
        }
        if (!first)
        {
            out.Status = LoopStatus::TooFewEdges;
            return out;
        }

        const BoundaryEdgeSet boundary = CollectBoundaryEdges(component, table);
        if (boundary.NonManifoldEdgeCount > 0)
        {
            out.Status = LoopStatus::NonManifold;
            return out;
        }
        if (boundary.Edges.size() < 3)
        {
            out.Status = LoopStatus::TooFewEdges;
            return out;
        }

        LoopAssembly assembly = AssembleLoops(boundary.Edges);
        if (assembly.Status != LoopStatus::Ok)
        {
            out.Status = assembly.Status;
            return out;
        }

        out.Face = ClassifyLoops(std::move(assembly.Loops), points, first->Normal, first->E1);
        return out;
    }
}
