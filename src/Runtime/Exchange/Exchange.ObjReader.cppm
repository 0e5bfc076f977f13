module;

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

export module Exchange:ObjReader;

import Core.Error;
import Geometry;

export namespace Exchange
{
    struct ObjReadOptions
    {
        // Face name for triangles outside any g/o group.
        std::string DefaultFaceName{"OBJ"};

        // Use g/o names as face names. When off every triangle goes to
        // DefaultFaceName.
        bool GroupsAsFaces{true};
    };

    struct ObjReadStats
    {
        std::size_t Vertices{0};
        std::size_t Polygons{0};
        std::size_t Triangles{0};
        std::size_t SkippedPolygons{0};
    };

    // =========================================================================
    // ObjReader: Wavefront OBJ to MeshSolid
    // =========================================================================
    //
    // Reads v and f records; polygons are fanned from their first corner,
    // negative indices count back from the latest vertex and texture/normal
    // references are ignored. Vertices are welded by exact position.

    class ObjReader
    {
    public:
        explicit ObjReader(ObjReadOptions options = {}) : m_Options(std::move(options)) {}

        [[nodiscard]] std::string_view FormatName() const { return "Wavefront OBJ"; }

        // InvalidFormat on a malformed vertex record, EmptyMesh when no
        // triangle survives.
        [[nodiscard]] Core::Expected<Geometry::MeshSolid> Parse(std::string_view text,
                                                                std::string_view solidName);

        // Solid is named after the file stem.
        [[nodiscard]] Core::Expected<Geometry::MeshSolid> LoadFile(std::string_view path);

        [[nodiscard]] const ObjReadStats& Stats() const { return m_Stats; }

    private:
        ObjReadOptions m_Options;
        ObjReadStats m_Stats;
    };
}
