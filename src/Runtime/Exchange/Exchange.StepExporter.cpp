module;

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

module Exchange:StepExporter.Impl;

import :StepExporter;
import :StepFaces;
import :StepUnits;
import :StepWriter;
import Geometry;
import Core.Error;
import Core.Logging;

namespace Exchange
{
    namespace
    {
        static constexpr std::string_view s_Extensions[] = { ".step", ".stp" };

        constexpr std::string_view s_ToolName = "Faceter";

        std::string SolidLabel(const Geometry::ISolidView* solid, std::size_t index)
        {
            if (solid && !solid->Name().empty())
                return std::string(solid->Name());
            return std::format("solid_{}", index + 1);
        }

        std::optional<double> PositiveOrNone(std::optional<double> value)
        {
            if (value && std::isfinite(*value) && *value > 0.0)
                return value;
            return std::nullopt;
        }

        struct ProductContext
        {
            Step::UnitContext Units;
            Step::EntityId ProductShape{0};
        };

        ProductContext EmitProductContext(Step::StepWriter& w, const ResolvedStepOptions& opts)
        {
            using Step::Ref;

            const Step::EntityId app = w.Add("APPLICATION_CONTEXT('automotive_design')");
            w.AddF("APPLICATION_PROTOCOL_DEFINITION('international standard','{}',2000,{})",
                   opts.UseTessellatedFaces ? "ap242" : "automotive_design", Ref(app));

            ProductContext ctx;
            ctx.Units = Step::EmitUnitContext(w, opts.Unit, opts.Scale);

            const std::string name = Step::EscapeString(opts.Name);
            const Step::EntityId prodCtx = w.AddF("PRODUCT_CONTEXT('',{},'mechanical')", Ref(app));
            const Step::EntityId product = w.AddF("PRODUCT('{}','{}','',({}))", name, name, Ref(prodCtx));
            const Step::EntityId formation = w.AddF("PRODUCT_DEFINITION_FORMATION('','',{})", Ref(product));
            const Step::EntityId defCtx = w.AddF("PRODUCT_DEFINITION_CONTEXT('part definition',{},'design')", Ref(app));
            const Step::EntityId def = w.AddF("PRODUCT_DEFINITION('design','',{},{})", Ref(formation), Ref(defCtx));
            ctx.ProductShape = w.AddF("PRODUCT_DEFINITION_SHAPE('','',{})", Ref(def));
            return ctx;
        }

        // Authoritative grouping: one face group per face id.
        void EmitFaceIdGroups(Step::SolidExportContext& ctx,
                              const ResolvedStepOptions& opts,
                              const Geometry::FaceGrouping::Tolerances& tol,
                              std::span<const Geometry::FaceGrouping::FaceGroup> groups,
                              const Geometry::EdgeTopology::FaceNameFn& nameOf)
        {
            using namespace Geometry::FaceGrouping;

            for (const FaceGroup& group : groups)
            {
                const std::string baseName = nameOf(group.Label);

                if (opts.UseTessellatedFaces)
                {
                    const bool planar = IsCoplanarGroup(group.Triangles, ctx.Table, tol.Normal, tol.Distance);
                    if (!planar || opts.MergeCoplanarFaces)
                    {
                        for (const auto& component : SplitComponents(group.Triangles, ctx.Table))
                            EmitComponentWithFallback(ctx, component, baseName, planar, true);
                        continue;
                    }
                }

                if (opts.MergeCoplanarFaces)
                {
                    for (const auto& plane : SplitByPlaneKey(group.Triangles, ctx.Table, tol.Normal, tol.Distance))
                    {
                        for (const auto& component : SplitComponents(plane, ctx.Table))
                            EmitComponentWithFallback(ctx, component, baseName, true, false);
                    }
                    continue;
                }

                Step::EmitTriangleFaces(ctx, group.Triangles, baseName);
            }
        }

        // Geometric grouping: one face group per quantized plane.
        void EmitPlaneGroups(Step::SolidExportContext& ctx,
                             const ResolvedStepOptions& opts,
                             std::span<const Geometry::FaceGrouping::FaceGroup> groups,
                             const Geometry::EdgeTopology::FaceNameFn& nameOf)
        {
            using namespace Geometry::FaceGrouping;

            for (const FaceGroup& group : groups)
            {
                const std::string baseName = nameOf(group.Label);
                if (!opts.MergeCoplanarFaces)
                {
                    Step::EmitTriangleFaces(ctx, group.Triangles, baseName);
                    continue;
                }

                for (const auto& component : SplitComponents(group.Triangles, ctx.Table))
                    EmitComponentWithFallback(ctx, component, baseName, true, opts.UseTessellatedFaces);
            }
        }

        struct SolidOutput
        {
            std::optional<Step::EntityId> Brep;
            std::vector<Step::EntityId> Curves;
            bool Tessellated{false};
        };

        // Returns nullopt when the solid must be reported as skipped.
        std::optional<SolidOutput> ExportSolid(Step::StepWriter& writer,
                                               Step::DirectionCache& directions,
                                               const Geometry::ISolidView& solid,
                                               const ResolvedStepOptions& opts)
        {
            using namespace Geometry;

            std::optional<glm::dmat4> transform;
            if (opts.ApplyWorldTransform)
                transform = solid.WorldTransform();

            const PlaneMath::PreparedPositions prepared = PlaneMath::PreparePositions(solid, transform, opts.Scale);
            const PlaneMath::TriangleTable table = PlaneMath::BuildTriangleRecords(prepared.Points, solid.TriangleIndices());

            if (table.InvalidIndexCount > 0)
            {
                Core::Log::Warn("StepExport: '{}' has {} triangles with out-of-range indices, dropped",
                                solid.Name(), table.InvalidIndexCount);
            }
            if (table.DegenerateCount > 0)
            {
                Core::Log::Debug("StepExport: '{}' has {} degenerate triangles, dropped",
                                 solid.Name(), table.DegenerateCount);
            }

            const FaceGrouping::Tolerances tol = FaceGrouping::ResolveTolerances(
                opts.PlanarNormalTolerance, opts.PlanarDistanceTolerance, PlaneMath::BoundingDiagonal(prepared));

            const auto faceIds = solid.FaceIds();
            const bool authoritative = !faceIds.empty() && faceIds.size() == table.Size();

            std::vector<FaceGrouping::FaceGroup> groups = authoritative
                ? FaceGrouping::GroupByFaceId(table, faceIds)
                : FaceGrouping::GroupByPlane(table, tol.Normal, tol.Distance, opts.MergeCoplanarFaces);

            EdgeTopology::FaceNameFn nameOf;
            if (authoritative)
            {
                nameOf = [&solid](uint32_t id) {
                    if (auto name = solid.FaceName(id); name && !name->empty())
                        return std::string(*name);
                    return std::format("FACE_{}", id);
                };
            }
            else
            {
                nameOf = [](uint32_t label) { return std::format("FACE_{}", label + 1); };
            }

            const std::vector<uint32_t> labels = FaceGrouping::LabelTriangles(groups, table.Size());

            Step::SolidExportContext ctx(writer, directions, opts.Precision, table, prepared.Points);
            ctx.UseEdgeCurves = opts.MergeCoplanarFaces && opts.ExportEdgesAsPolylines;
            if (ctx.UseEdgeCurves)
                ctx.EdgeNames = EdgeTopology::BuildEdgeNames(table, labels, nameOf);

            SolidOutput out;

            if (opts.ExportFaces)
            {
                if (authoritative)
                    EmitFaceIdGroups(ctx, opts, tol, groups, nameOf);
                else
                    EmitPlaneGroups(ctx, opts, groups, nameOf);

                if (ctx.Faces.empty())
                {
                    Core::Log::Warn("StepExport: '{}' produced no faces", solid.Name());
                    return std::nullopt;
                }

                const Step::EntityId shell = writer.AddF("CLOSED_SHELL('',{})", Step::FormatEntityList(ctx.Faces));
                out.Brep = writer.AddF("FACETED_BREP('',{})", Step::Ref(shell));
                out.Tessellated = ctx.TessellatedFaces > 0;
            }

            if (opts.ExportEdgesAsPolylines)
                out.Curves = Step::EmitSeamPolylines(ctx, labels, nameOf);

            if (!out.Brep && out.Curves.empty())
            {
                Core::Log::Warn("StepExport: '{}' produced no faces or seam curves", solid.Name());
                return std::nullopt;
            }

            Core::Log::Debug("StepExport: '{}' -> {} faces, {} seam curves", solid.Name(), ctx.Faces.size(), out.Curves.size());
            return out;
        }
    }

    std::span<const std::string_view> StepExporter::Extensions() const
    {
        return s_Extensions;
    }

    std::string CurrentTimestamp()
    {
        const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
        return std::format("{:%Y-%m-%dT%H:%M:%S}", now);
    }

    ResolvedStepOptions ResolveOptions(const StepExportOptions& options,
                                       std::span<const Geometry::ISolidView* const> solids)
    {
        ResolvedStepOptions r;

        if (auto unit = Step::ParseLengthUnit(options.Unit))
        {
            r.Unit = *unit;
        }
        else
        {
            Core::Log::Warn("StepExport: unknown unit '{}', using millimeter", options.Unit);
            r.Unit = Step::LengthUnit::Millimeter;
        }

        r.Precision = std::clamp(options.Precision, 0, 17);
        r.Scale = std::isfinite(options.Scale) ? options.Scale : 1.0;
        r.ApplyWorldTransform = options.ApplyWorldTransform;
        r.MergeCoplanarFaces = options.MergeCoplanarFaces;
        r.PlanarNormalTolerance = PositiveOrNone(options.PlanarNormalTolerance);
        r.PlanarDistanceTolerance = PositiveOrNone(options.PlanarDistanceTolerance);
        r.UseTessellatedFaces = options.UseTessellatedFaces;
        r.ExportFaces = options.ExportFaces;
        r.ExportEdgesAsPolylines = options.ExportEdgesAsPolylines;

        if (options.Name && !options.Name->empty())
            r.Name = *options.Name;
        else if (!solids.empty() && solids.front() && !solids.front()->Name().empty())
            r.Name = std::string(solids.front()->Name());
        else
            r.Name = "part";

        r.Timestamp = options.Timestamp.value_or(CurrentTimestamp());
        return r;
    }

    StepExportResult StepExporter::Export(std::span<const Geometry::ISolidView* const> solids,
                                          const StepExportOptions& options) const
    {
        const ResolvedStepOptions opts = ResolveOptions(options, solids);
        StepExportResult result;

        Step::StepWriter writer;
        const ProductContext product = EmitProductContext(writer, opts);
        Step::DirectionCache directions(opts.Precision);

        std::vector<Step::EntityId> brepItems;
        std::vector<Step::EntityId> curveItems;
        bool tessellated = false;

        for (std::size_t i = 0; i < solids.size(); ++i)
        {
            const Geometry::ISolidView* solid = solids[i];
            const std::string label = SolidLabel(solid, i);

            if (auto valid = Geometry::ValidateSolid(solid); !valid)
            {
                Core::Log::Warn("StepExport: skipping '{}': {}", label, Core::ErrorCodeToString(valid.error()));
                result.Skipped.push_back(label);
                continue;
            }

            std::optional<SolidOutput> out = ExportSolid(writer, directions, *solid, opts);
            if (!out)
            {
                result.Skipped.push_back(label);
                continue;
            }

            if (out->Brep)
                brepItems.push_back(*out->Brep);
            tessellated = tessellated || out->Tessellated;
            curveItems.insert(curveItems.end(), out->Curves.begin(), out->Curves.end());
        }

        std::vector<Step::EntityId> repItems;
        if (opts.ExportFaces)
            repItems.insert(repItems.end(), brepItems.begin(), brepItems.end());
        if (opts.ExportEdgesAsPolylines && !curveItems.empty())
            repItems.push_back(writer.AddF("GEOMETRIC_CURVE_SET('EDGES',{})", Step::FormatEntityList(curveItems)));

        if (repItems.empty())
        {
            Core::Log::Warn("StepExport: nothing to export from {} solids", solids.size());
            result.Skipped.clear();
            for (std::size_t i = 0; i < solids.size(); ++i)
                result.Skipped.push_back(SolidLabel(solids[i], i));
            return result;
        }

        const std::string_view repEntity = opts.ExportEdgesAsPolylines ? "SHAPE_REPRESENTATION"
                                                                        : "ADVANCED_BREP_SHAPE_REPRESENTATION";
        const std::string name = Step::EscapeString(opts.Name);

        // 'tessellated' only labels representations that carry TRIANGULATED_FACE items.
        const Step::EntityId shapeRep = writer.AddF("{}('{}',{},{})",
                                                    repEntity,
                                                    tessellated ? std::string("tessellated") : name,
                                                    Step::FormatEntityList(repItems),
                                                    Step::Ref(product.Units.GeometricContext));
        writer.AddF("SHAPE_DEFINITION_REPRESENTATION({},{})", Step::Ref(product.ProductShape), Step::Ref(shapeRep));

        std::string& data = result.Data;
        data += "ISO-10303-21;\n";
        data += "HEADER;\n";
        data += "FILE_DESCRIPTION(('BREP STEP export'),'2;1');\n";
        data += std::format("FILE_NAME('{}','{}',('BREP'),('BREP'),'{}','BREP','');\n",
                            name, Step::EscapeString(opts.Timestamp), s_ToolName);
        data += std::format("FILE_SCHEMA(('{}'));\n",
                            opts.UseTessellatedFaces ? "AP242_MANAGED_MODEL_BASED_3D_ENGINEERING" : "AUTOMOTIVE_DESIGN");
        data += "ENDSEC;\n";
        data += "DATA;\n";
        data += writer.Join();
        data += "\nENDSEC;\n";
        data += "END-ISO-10303-21;\n";

        result.Exported = repItems.size();
        Core::Log::Info("StepExport: wrote {} entities, {} items, {} skipped",
                        writer.Size(), result.Exported, result.Skipped.size());
        return result;
    }

    StepExportResult ExportStep(std::span<const Geometry::ISolidView* const> solids,
                                const StepExportOptions& options)
    {
        return StepExporter{}.Export(solids, options);
    }
}
