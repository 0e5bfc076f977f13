module;

#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

module Exchange:StepFaces.Impl;

import :StepFaces;
import :StepWriter;
import Geometry;
import Core.Logging;

namespace Exchange::Step
{
    using Geometry::PlaneMath::TriangleRecord;

    SolidExportContext::SolidExportContext(StepWriter& writer,
                                           DirectionCache& directions,
                                           int precision,
                                           const Geometry::PlaneMath::TriangleTable& table,
                                           std::span<const glm::dvec3> points)
        : Writer(writer),
          Directions(directions),
          Precision(precision),
          Table(table),
          Points(points),
          m_Vertices(points.size())
    {
    }

    EntityId SolidExportContext::PointId(uint32_t vertex)
    {
        VertexRecord& rec = m_Vertices[vertex];
        if (rec.Point == 0)
            rec.Point = Writer.AddF("CARTESIAN_POINT('',{})", FormatTriple(Points[vertex], Precision));
        return rec.Point;
    }

    EntityId SolidExportContext::VertexId(uint32_t vertex)
    {
        const EntityId point = PointId(vertex);
        VertexRecord& rec = m_Vertices[vertex];
        if (rec.Vertex == 0)
            rec.Vertex = Writer.AddF("VERTEX_POINT('',{})", Ref(point));
        return rec.Vertex;
    }

    EntityId SolidExportContext::DirectionId(const glm::dvec3& direction)
    {
        return Directions.Resolve(Writer, direction);
    }

    EntityId SolidExportContext::OrientedEdge(uint32_t a, uint32_t b)
    {
        const Geometry::EdgeKey key = Geometry::MakeEdgeKey(a, b);
        auto it = m_EdgeCurves.find(key);
        if (it == m_EdgeCurves.end())
        {
            std::string name;
            if (auto named = EdgeNames.find(key); named != EdgeNames.end())
                name = named->second;
            else
                name = EdgeNameAllocator.Allocate(std::format("EDGE_{}", m_EdgeCurves.size()));

            const EntityId vs = VertexId(a);
            const EntityId ve = VertexId(b);
            const EntityId polyline = Writer.AddF("POLYLINE('',({},{}))", Ref(PointId(a)), Ref(PointId(b)));
            const EntityId curve = Writer.AddF("EDGE_CURVE('{}',{},{},{},.T.)",
                                               SafeName(name), Ref(vs), Ref(ve), Ref(polyline));
            it = m_EdgeCurves.emplace(key, EdgeRecord{curve, a, b}).first;
        }

        const EdgeRecord& rec = it->second;
        const bool sense = (rec.Start == a && rec.End == b);
        return Writer.AddF("ORIENTED_EDGE('',*,*,{},{})", Ref(rec.Curve), sense ? ".T." : ".F.");
    }

    // -------------------------------------------------------------------------
    // Faces
    // -------------------------------------------------------------------------

    std::optional<EntityId> EmitTriangleFace(SolidExportContext& ctx, uint32_t triangle, std::string_view name)
    {
        const TriangleRecord* tri = ctx.Table.Find(triangle);
        if (!tri)
            return std::nullopt;

        const EntityId p0 = ctx.PointId(tri->I0);
        const EntityId p1 = ctx.PointId(tri->I1);
        const EntityId p2 = ctx.PointId(tri->I2);

        const auto basis = Geometry::BoundaryLoops::MakePlaneBasis(tri->Normal, tri->E1);
        const EntityId axisDir = ctx.DirectionId(tri->Normal);
        const EntityId refDir = ctx.DirectionId(basis.U);

        StepWriter& w = ctx.Writer;
        const EntityId axis = w.AddF("AXIS2_PLACEMENT_3D('',{},{},{})", Ref(p0), Ref(axisDir), Ref(refDir));
        const EntityId plane = w.AddF("PLANE('',{})", Ref(axis));
        const EntityId loop = w.AddF("POLY_LOOP('',({},{},{}))", Ref(p0), Ref(p1), Ref(p2));
        const EntityId bound = w.AddF("FACE_OUTER_BOUND('',{},.T.)", Ref(loop));
        return w.AddF("ADVANCED_FACE('{}',({}),{},.T.)", SafeName(name, ""), Ref(bound), Ref(plane));
    }

    std::size_t EmitTriangleFaces(SolidExportContext& ctx,
                                  std::span<const uint32_t> triangles,
                                  std::string_view baseName)
    {
        std::size_t count = 0;
        for (uint32_t t : triangles)
        {
            if (!ctx.Table.Find(t))
                continue;

            const std::string name = ctx.FaceNames.Allocate(baseName);
            if (auto face = EmitTriangleFace(ctx, t, name))
            {
                ctx.Faces.push_back(*face);
                ++count;
            }
        }
        return count;
    }

    std::optional<EntityId> EmitPlanarComponent(SolidExportContext& ctx,
                                                std::span<const uint32_t> component,
                                                std::string_view name)
    {
        using namespace Geometry::BoundaryLoops;

        const FaceLoopResult loops = BuildFaceLoops(component, ctx.Table, ctx.Points);
        if (!loops.Ok())
        {
            Core::Log::Debug("StepExport: face '{}' falls back, loop status {}",
                             name, LoopStatusToString(loops.Status));
            return std::nullopt;
        }

        const ClassifiedLoops& face = loops.Face;
        StepWriter& w = ctx.Writer;

        const EntityId origin = ctx.PointId(face.Outer().front());
        const EntityId axisDir = ctx.DirectionId(face.Normal);
        const EntityId refDir = ctx.DirectionId(face.Basis.U);
        const EntityId axis = w.AddF("AXIS2_PLACEMENT_3D('',{},{},{})", Ref(origin), Ref(axisDir), Ref(refDir));
        const EntityId plane = w.AddF("PLANE('',{})", Ref(axis));

        std::vector<EntityId> bounds;
        bounds.reserve(face.Loops.size());

        for (std::size_t i = 0; i < face.Loops.size(); ++i)
        {
            const Loop& loop = face.Loops[i];
            EntityId loopId = 0;

            if (ctx.UseEdgeCurves)
            {
                std::vector<EntityId> edges;
                edges.reserve(loop.size());
                for (std::size_t k = 0; k < loop.size(); ++k)
                    edges.push_back(ctx.OrientedEdge(loop[k], loop[(k + 1) % loop.size()]));

                loopId = w.AddF("EDGE_LOOP('{}',{})",
                                SafeName(std::format("{}_LOOP_{}", name, i), ""),
                                FormatEntityList(edges, 0));
            }
            else
            {
                std::vector<EntityId> points;
                points.reserve(loop.size());
                for (uint32_t v : loop)
                    points.push_back(ctx.PointId(v));
                loopId = w.AddF("POLY_LOOP('',{})", FormatEntityList(points, 0));
            }

            // Hole loops are already reversed, so both bounds keep .T.
            if (i == face.OuterIndex)
                bounds.push_back(w.AddF("FACE_OUTER_BOUND('',{},.T.)", Ref(loopId)));
            else
                bounds.push_back(w.AddF("FACE_BOUND('',{},.T.)", Ref(loopId)));
        }

        return w.AddF("ADVANCED_FACE('{}',{},{},.T.)", SafeName(name, ""), FormatEntityList(bounds, 0), Ref(plane));
    }

    std::optional<EntityId> EmitTessellatedFace(SolidExportContext& ctx,
                                                std::span<const uint32_t> component,
                                                std::string_view name)
    {
        std::unordered_map<uint32_t, std::size_t> local;
        std::vector<glm::dvec3> coords;
        std::string triangles;

        const auto map = [&](uint32_t v) {
            auto [it, inserted] = local.try_emplace(v, coords.size() + 1);
            if (inserted)
                coords.push_back(ctx.Points[v]);
            return it->second;
        };

        std::size_t triCount = 0;
        for (uint32_t t : component)
        {
            const TriangleRecord* tri = ctx.Table.Find(t);
            if (!tri)
                continue;

            const std::size_t a = map(tri->I0);
            const std::size_t b = map(tri->I1);
            const std::size_t c = map(tri->I2);
            if (triCount++ > 0)
                triangles += ',';
            triangles += std::format("({},{},{})", a, b, c);
        }

        if (coords.size() < 3 || triCount == 0)
            return std::nullopt;

        std::string coordList;
        for (std::size_t i = 0; i < coords.size(); ++i)
        {
            if (i > 0)
                coordList += ',';
            coordList += FormatTriple(coords[i], ctx.Precision);
        }

        StepWriter& w = ctx.Writer;
        const EntityId pointList = w.AddF("CARTESIAN_POINT_LIST_3D('',({}))", coordList);
        // coordinates, pnmax, normals, geometric_link, pnindex, triangles
        return w.AddF("TRIANGULATED_FACE('{}',{},{},(),$,(),({}))",
                      SafeName(name, ""), Ref(pointList), coords.size(), triangles);
    }

    void EmitComponentWithFallback(SolidExportContext& ctx,
                                   std::span<const uint32_t> component,
                                   std::string_view baseName,
                                   bool tryPlanar,
                                   bool allowTessellated)
    {
        std::optional<std::string> reserved;
        if (tryPlanar || allowTessellated)
        {
            std::string name = ctx.FaceNames.Allocate(baseName);

            if (tryPlanar)
            {
                if (auto face = EmitPlanarComponent(ctx, component, name))
                {
                    ctx.Faces.push_back(*face);
                    return;
                }
            }

            if (allowTessellated)
            {
                if (auto face = EmitTessellatedFace(ctx, component, name))
                {
                    ctx.Faces.push_back(*face);
                    ++ctx.TessellatedFaces;
                    return;
                }
            }
            reserved = std::move(name);
        }

        // Per-triangle faces; the first one takes the name already allocated.
        for (uint32_t t : component)
        {
            if (!ctx.Table.Find(t))
                continue;

            std::string name = reserved ? std::move(*reserved) : ctx.FaceNames.Allocate(baseName);
            reserved.reset();
            if (auto face = EmitTriangleFace(ctx, t, name))
                ctx.Faces.push_back(*face);
        }
    }

    std::vector<EntityId> EmitSeamPolylines(SolidExportContext& ctx,
                                            std::span<const uint32_t> labels,
                                            const Geometry::EdgeTopology::FaceNameFn& nameOf)
    {
        std::vector<EntityId> curves;
        const auto seams = Geometry::EdgeTopology::BuildSeamPolylines(ctx.Table, labels, nameOf);

        for (const auto& seam : seams)
        {
            if (seam.Indices.size() < 2)
                continue;

            std::vector<EntityId> points;
            points.reserve(seam.Indices.size());
            for (uint32_t v : seam.Indices)
                points.push_back(ctx.PointId(v));

            const std::string name = ctx.EdgeNameAllocator.Allocate(seam.Name);
            curves.push_back(ctx.Writer.AddF("POLYLINE('{}',{})", SafeName(name), FormatEntityList(points, 0)));
        }

        return curves;
    }
}
