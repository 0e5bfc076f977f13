module;

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <queue>
#include <span>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

module Geometry:MeshRepair.Impl;

import :MeshRepair;
import :Solid;
import :EdgeKey;
import :Triangulation;
import Core.Logging;

namespace Geometry::MeshRepair
{
    namespace
    {
        glm::dvec3 VertexAt(std::span<const double> positions, uint32_t v)
        {
            const std::size_t base = static_cast<std::size_t>(v) * 3;
            return {positions[base], positions[base + 1], positions[base + 2]};
        }

        bool TriangleInRange(std::span<const uint32_t> indices, std::size_t t, std::size_t vertexCount)
        {
            return indices[t * 3] < vertexCount && indices[t * 3 + 1] < vertexCount &&
                   indices[t * 3 + 2] < vertexCount;
        }

        // +1 when triangle t contains the directed edge a->b, -1 for b->a,
        // 0 when it does not contain the edge.
        int EdgeDirection(std::span<const uint32_t> indices, std::size_t t, uint32_t a, uint32_t b)
        {
            for (int k = 0; k < 3; ++k)
            {
                const uint32_t u = indices[t * 3 + k];
                const uint32_t v = indices[t * 3 + (k + 1) % 3];
                if (u == a && v == b) return 1;
                if (u == b && v == a) return -1;
            }
            return 0;
        }

        void FlipTriangle(std::vector<uint32_t>& indices, std::size_t t)
        {
            std::swap(indices[t * 3 + 1], indices[t * 3 + 2]);
        }
    }

    // =========================================================================
    // Consistent Winding
    // =========================================================================

    std::optional<OrientationResult> FixWindingsByAdjacency(MeshSolid& solid)
    {
        std::vector<uint32_t>& indices = solid.MutableIndices();
        const std::span<const double> positions = solid.VertexPositions();
        const std::size_t triCount = indices.size() / 3;
        const std::size_t vertexCount = positions.size() / 3;
        if (triCount == 0)
            return std::nullopt;

        std::unordered_map<EdgeKey, std::vector<uint32_t>, EdgeKeyHash> edgeTris;
        edgeTris.reserve(triCount * 3);
        for (std::size_t t = 0; t < triCount; ++t)
        {
            if (!TriangleInRange(indices, t, vertexCount))
                continue;
            for (int k = 0; k < 3; ++k)
            {
                const EdgeKey key = MakeEdgeKey(indices[t * 3 + k], indices[t * 3 + (k + 1) % 3]);
                edgeTris[key].push_back(static_cast<uint32_t>(t));
            }
        }

        OrientationResult result;
        std::vector<bool> visited(triCount, false);
        std::queue<std::size_t> queue;

        for (std::size_t seed = 0; seed < triCount; ++seed)
        {
            if (visited[seed] || !TriangleInRange(indices, seed, vertexCount))
                continue;

            ++result.ComponentCount;
            std::vector<std::size_t> component;
            visited[seed] = true;
            queue.push(seed);

            while (!queue.empty())
            {
                const std::size_t t = queue.front();
                queue.pop();
                component.push_back(t);

                for (int k = 0; k < 3; ++k)
                {
                    const uint32_t a = indices[t * 3 + k];
                    const uint32_t b = indices[t * 3 + (k + 1) % 3];
                    const auto& users = edgeTris[MakeEdgeKey(a, b)];
                    if (users.size() != 2)
                        continue;

                    const std::size_t u = (users[0] == t) ? users[1] : users[0];
                    if (u == t || visited[u])
                        continue;

                    // Oriented neighbours traverse the shared edge as b->a.
                    if (EdgeDirection(indices, u, a, b) == 1)
                    {
                        FlipTriangle(indices, u);
                        ++result.TrianglesFlipped;
                    }

                    visited[u] = true;
                    queue.push(u);
                }
            }

            bool closed = true;
            for (std::size_t t : component)
            {
                for (int k = 0; k < 3 && closed; ++k)
                {
                    const EdgeKey key = MakeEdgeKey(indices[t * 3 + k], indices[t * 3 + (k + 1) % 3]);
                    closed = edgeTris[key].size() == 2;
                }
                if (!closed)
                    break;
            }

            if (!closed)
                continue;

            double volume = 0.0;
            for (std::size_t t : component)
            {
                const glm::dvec3 p0 = VertexAt(positions, indices[t * 3]);
                const glm::dvec3 p1 = VertexAt(positions, indices[t * 3 + 1]);
                const glm::dvec3 p2 = VertexAt(positions, indices[t * 3 + 2]);
                volume += glm::dot(p0, glm::cross(p1, p2));
            }

            if (volume < 0.0)
            {
                for (std::size_t t : component)
                    FlipTriangle(indices, t);
                ++result.ComponentsInverted;
            }
        }

        result.WasConsistent = (result.TrianglesFlipped == 0 && result.ComponentsInverted == 0);
        return result;
    }

    // =========================================================================
    // Degenerate Triangle Removal
    // =========================================================================

    std::optional<DegenerateRemovalResult> RemoveDegenerateTriangles(MeshSolid& solid,
                                                                     const DegenerateRemovalParams& params)
    {
        std::vector<uint32_t>& indices = solid.MutableIndices();
        std::vector<double>& positions = solid.MutablePositions();
        std::vector<uint32_t>& faceIds = solid.MutableFaceIds();

        const std::size_t triCount = indices.size() / 3;
        const std::size_t vertexCount = positions.size() / 3;
        if (triCount == 0)
            return std::nullopt;

        DegenerateRemovalResult result;
        std::vector<bool> keep(triCount, false);

        for (std::size_t t = 0; t < triCount; ++t)
        {
            if (!TriangleInRange(indices, t, vertexCount))
            {
                ++result.TrianglesRemoved;
                continue;
            }

            const glm::dvec3 a = VertexAt(positions, indices[t * 3]);
            const glm::dvec3 b = VertexAt(positions, indices[t * 3 + 1]);
            const glm::dvec3 c = VertexAt(positions, indices[t * 3 + 2]);
            const double area = 0.5 * glm::length(glm::cross(b - a, c - a));

            if (std::isfinite(area) && area > params.AreaEpsilon)
                keep[t] = true;
            else
                ++result.TrianglesRemoved;
        }

        result.TrianglesKept = triCount - result.TrianglesRemoved;
        if (result.TrianglesRemoved == 0)
            return result;

        const bool hasFaceIds = faceIds.size() == triCount;
        std::vector<uint32_t> newIndices;
        std::vector<uint32_t> newFaceIds;
        newIndices.reserve(result.TrianglesKept * 3);
        if (hasFaceIds)
            newFaceIds.reserve(result.TrianglesKept);

        std::vector<bool> used(vertexCount, false);
        for (std::size_t t = 0; t < triCount; ++t)
        {
            if (!keep[t])
                continue;
            for (int k = 0; k < 3; ++k)
            {
                newIndices.push_back(indices[t * 3 + k]);
                used[indices[t * 3 + k]] = true;
            }
            if (hasFaceIds)
                newFaceIds.push_back(faceIds[t]);
        }

        constexpr uint32_t kUnmapped = UINT32_MAX;
        std::vector<uint32_t> oldToNew(vertexCount, kUnmapped);
        std::vector<double> newPositions;
        newPositions.reserve(positions.size());
        uint32_t next = 0;
        for (std::size_t v = 0; v < vertexCount; ++v)
        {
            if (!used[v])
                continue;
            newPositions.push_back(positions[v * 3]);
            newPositions.push_back(positions[v * 3 + 1]);
            newPositions.push_back(positions[v * 3 + 2]);
            oldToNew[v] = next++;
        }

        for (uint32_t& idx : newIndices)
            idx = oldToNew[idx];

        result.VerticesRemoved = vertexCount - next;

        positions = std::move(newPositions);
        indices = std::move(newIndices);
        if (hasFaceIds)
            faceIds = std::move(newFaceIds);
        else
            faceIds.clear();

        solid.RebuildVertexLookup();
        // Empty meshes have nothing left to orient.
        (void)FixWindingsByAdjacency(solid);

        Core::Log::Info("MeshRepair: removed {} degenerate triangles and {} vertices from '{}'",
                        result.TrianglesRemoved, result.VerticesRemoved, solid.Name());
        return result;
    }

    // =========================================================================
    // Vertex Quantization
    // =========================================================================

    std::optional<QuantizationResult> QuantizeVertices(MeshSolid& solid, const QuantizationParams& params)
    {
        const double q = params.Grid;
        if (!std::isfinite(q) || !(q > 0.0))
        {
            Core::Log::Warn("MeshRepair: invalid quantization grid {}", q);
            return std::nullopt;
        }

        std::vector<double>& positions = solid.MutablePositions();
        QuantizationResult result;

        const std::size_t vertexCount = positions.size() / 3;
        for (std::size_t v = 0; v < vertexCount; ++v)
        {
            bool moved = false;
            for (int k = 0; k < 3; ++k)
            {
                double& value = positions[v * 3 + k];
                const double snapped = std::round(value / q) * q;
                if (snapped != value && std::isfinite(snapped))
                {
                    value = snapped;
                    moved = true;
                    ++result.CoordinatesMoved;
                }
            }
            if (moved)
                ++result.VerticesMoved;
        }

        if (result.VerticesMoved > 0)
        {
            solid.RebuildVertexLookup();
            (void)FixWindingsByAdjacency(solid);
        }

        return result;
    }

    // =========================================================================
    // Endcap Generation
    // =========================================================================

    EndcapResult GenerateEndcap(IMutableSolid& solid,
                                std::string_view faceName,
                                std::span<const glm::dvec3> loop,
                                const EndcapParams& params)
    {
        EndcapResult result;

        if (loop.size() < 3)
        {
            Core::Log::Warn("MeshRepair: endcap '{}' needs at least 3 boundary points, got {}",
                            faceName, loop.size());
            result.Status = Triangulation::TriangulationStatus::Failed;
            return result;
        }

        for (const glm::dvec3& p : loop)
        {
            if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.z))
            {
                Core::Log::Error("MeshRepair: endcap '{}' has a non-finite boundary point", faceName);
                result.Status = Triangulation::TriangulationStatus::Failed;
                return result;
            }
        }

        Triangulation::TriangulationParams tp;
        tp.Method = params.Method;
        tp.Fallback = params.Fallback;
        tp.EnsureCounterClockwise = params.EnsureCounterClockwise;
        tp.MinTriangleArea = params.MinTriangleArea;
        tp.Normal = params.Normal;

        const Triangulation::TriangulationResult tri = Triangulation::TriangulatePolygon(loop, tp);
        result.Status = tri.Status;
        result.UsedFallback = tri.UsedFallback;

        for (const Triangulation::Triangle& t : tri.Triangles)
        {
            if (solid.AddTriangle(faceName, t[0], t[1], t[2]))
                ++result.TrianglesAdded;
        }

        return result;
    }

    // =========================================================================
    // Combined Repair
    // =========================================================================

    std::optional<RepairResult> Repair(MeshSolid& solid, const RepairParams& params)
    {
        if (solid.IsEmpty())
            return std::nullopt;

        RepairResult result;

        if (params.RemoveDegenerates)
        {
            if (auto r = RemoveDegenerateTriangles(solid, params.DegenerateParams))
                result.DegenerateResult = *r;
        }

        if (params.Quantize)
        {
            if (auto r = QuantizeVertices(solid, *params.Quantize))
                result.QuantizeResult = *r;
        }

        if (params.FixOrientation)
        {
            if (auto r = FixWindingsByAdjacency(solid))
                result.OrientResult = *r;
        }

        return result;
    }
}
