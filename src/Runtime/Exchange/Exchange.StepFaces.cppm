module;

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>

module Exchange:StepFaces;

import :StepWriter;
import Geometry;

namespace Exchange::Step
{
    struct VertexRecord
    {
        EntityId Point{0};
        EntityId Vertex{0};
    };

    // One EDGE_CURVE per undirected vertex pair, oriented Start -> End.
    struct EdgeRecord
    {
        EntityId Curve{0};
        uint32_t Start{0};
        uint32_t End{0};
    };

    // =========================================================================
    // SolidExportContext
    // =========================================================================
    //
    // Per-solid emission state. Points and vertices are written on first use
    // so every reference resolves to an earlier entity.

    struct SolidExportContext
    {
        SolidExportContext(StepWriter& writer,
                           DirectionCache& directions,
                           int precision,
                           const Geometry::PlaneMath::TriangleTable& table,
                           std::span<const glm::dvec3> points);

        EntityId PointId(uint32_t vertex);
        EntityId VertexId(uint32_t vertex);
        EntityId DirectionId(const glm::dvec3& direction);

        // ORIENTED_EDGE for a -> b, creating the shared EDGE_CURVE on first use.
        EntityId OrientedEdge(uint32_t a, uint32_t b);

        StepWriter& Writer;
        DirectionCache& Directions;
        int Precision;
        const Geometry::PlaneMath::TriangleTable& Table;
        std::span<const glm::dvec3> Points;

        // Loops are written as EDGE_LOOPs of shared edge curves when set,
        // POLY_LOOPs otherwise.
        bool UseEdgeCurves{false};

        Geometry::EdgeTopology::EdgeNameMap EdgeNames;
        Geometry::EdgeTopology::NameAllocator FaceNames;
        Geometry::EdgeTopology::NameAllocator EdgeNameAllocator;

        std::vector<EntityId> Faces;

        // TRIANGULATED_FACE patches among Faces.
        std::size_t TessellatedFaces{0};

    private:
        std::vector<VertexRecord> m_Vertices;
        std::unordered_map<Geometry::EdgeKey, EdgeRecord, Geometry::EdgeKeyHash> m_EdgeCurves;
    };

    // =========================================================================
    // Face Emitters
    // =========================================================================
    //
    // Emitters only write entities once the face is known to succeed; a
    // nullopt return leaves the ledger untouched.

    // PLANE + POLY_LOOP face for one triangle.
    std::optional<EntityId> EmitTriangleFace(SolidExportContext& ctx, uint32_t triangle, std::string_view name);

    // One face per valid triangle, each under a fresh name from baseName.
    std::size_t EmitTriangleFaces(SolidExportContext& ctx,
                                  std::span<const uint32_t> triangles,
                                  std::string_view baseName);

    // Loop-based planar face with holes. nullopt when loop building fails.
    std::optional<EntityId> EmitPlanarComponent(SolidExportContext& ctx,
                                                std::span<const uint32_t> component,
                                                std::string_view name);

    // TRIANGULATED_FACE over the component's own triangles.
    std::optional<EntityId> EmitTessellatedFace(SolidExportContext& ctx,
                                                std::span<const uint32_t> component,
                                                std::string_view name);

    // Planar face, else tessellated patch (when allowed), else one face per
    // triangle. Faces are appended to ctx.Faces.
    void EmitComponentWithFallback(SolidExportContext& ctx,
                                   std::span<const uint32_t> component,
                                   std::string_view baseName,
                                   bool tryPlanar,
                                   bool allowTessellated);

    // Named POLYLINEs along the seams between differently labelled regions.
    std::vector<EntityId> EmitSeamPolylines(SolidExportContext& ctx,
                                            std::span<const uint32_t> labels,
                                            const Geometry::EdgeTopology::FaceNameFn& nameOf);
}
