module;

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

export module Geometry:EdgeTopology;

import :EdgeKey;
import :PlaneMath;

export namespace Geometry::EdgeTopology
{
    // =========================================================================
    // Name Allocation
    // =========================================================================

    // "base[index]", the one suffix form used for every generated name.
    [[nodiscard]] std::string IndexedName(std::string_view base, std::size_t index);

    // Incremental unique names: the first request for a base returns it
    // unchanged, later ones return base[1], base[2], ... Used where names are
    // handed out one at a time and later duplicates are not known up front.
    // Batch naming (edge names, seams) sees the whole set and indexes every
    // member of a shared base from [0] instead.
    class NameAllocator
    {
    public:
        [[nodiscard]] std::string Allocate(std::string_view base);
        void Reset() { m_Counts.clear(); }

    private:
        std::unordered_map<std::string, std::size_t> m_Counts;
    };

    // Maps a triangle label (face id or plane group) to a display name.
    using FaceNameFn = std::function<std::string(uint32_t label)>;

    inline constexpr std::string_view BoundaryFaceName = "BOUNDARY";

    // =========================================================================
    // Edge Names
    // =========================================================================
    //
    // Every undirected edge of a valid triangle gets a name from the faces
    // touching it: "A|B" with A < B for two distinct faces, "A|BOUNDARY" for
    // one. Edges that share a base name are ordered by key and suffixed
    // [0], [1], ... so each name is unique.

    using EdgeNameMap = std::unordered_map<EdgeKey, std::string, EdgeKeyHash>;

    [[nodiscard]] EdgeNameMap BuildEdgeNames(const PlaneMath::TriangleTable& table,
                                             std::span<const uint32_t> labels,
                                             const FaceNameFn& nameOf);

    // =========================================================================
    // Seam Polylines
    // =========================================================================
    //
    // A seam edge has exactly two adjacent triangles with different labels.
    // Seam edges are grouped by their (sorted) face-name pair and chained
    // into polylines: open chains from degree-1 vertices first, then closed
    // loops from whatever is left.

    struct SeamPolyline
    {
        std::string Name;
        std::string FaceA;
        std::string FaceB;
        std::vector<uint32_t> Indices;
        bool Closed{false};
    };

    [[nodiscard]] std::vector<SeamPolyline> BuildSeamPolylines(const PlaneMath::TriangleTable& table,
                                                               std::span<const uint32_t> labels,
                                                               const FaceNameFn& nameOf);
}
