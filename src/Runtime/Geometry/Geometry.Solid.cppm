module;

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>

export module Geometry:Solid;

import Core.Error;

export namespace Geometry
{
    // =========================================================================
    // Solid Accessors
    // =========================================================================
    //
    // ISolidView is the read-only contract the STEP exporter consumes. Buffers
    // are flat: 3 doubles per vertex, 3 indices per triangle. FaceIds() is
    // either empty or holds exactly one id per triangle.

    class ISolidView
    {
    public:
        virtual ~ISolidView() = default;

        [[nodiscard]] virtual std::string_view Name() const = 0;
        [[nodiscard]] virtual std::span<const double> VertexPositions() const = 0;
        [[nodiscard]] virtual std::span<const uint32_t> TriangleIndices() const = 0;
        [[nodiscard]] virtual std::span<const uint32_t> FaceIds() const = 0;
        [[nodiscard]] virtual std::optional<std::string_view> FaceName(uint32_t faceId) const = 0;
        [[nodiscard]] virtual std::optional<glm::dmat4> WorldTransform() const = 0;

        [[nodiscard]] std::size_t VertexCount() const { return VertexPositions().size() / 3; }
        [[nodiscard]] std::size_t TriangleCount() const { return TriangleIndices().size() / 3; }
    };

    // Narrow mutate interface used by endcap generation.
    class IMutableSolid : public ISolidView
    {
    public:
        // Returns false when a point is not finite; nothing is appended then.
        virtual bool AddTriangle(std::string_view faceName,
                                 const glm::dvec3& p0,
                                 const glm::dvec3& p1,
                                 const glm::dvec3& p2) = 0;
    };

    // Structural checks only: a null solid, no vertices or triangles, or
    // buffers whose lengths are not multiples of three.
    [[nodiscard]] Core::Result ValidateSolid(const ISolidView* solid);

    // =========================================================================
    // MeshSolid: authoring triangle mesh
    // =========================================================================
    //
    // Vertices are welded by exact position on insertion. Face names map to
    // per-solid ids in first-use order starting at 1.

    class MeshSolid final : public IMutableSolid
    {
    public:
        explicit MeshSolid(std::string name = "solid");

        [[nodiscard]] std::string_view Name() const override { return m_Name; }
        [[nodiscard]] std::span<const double> VertexPositions() const override { return m_Positions; }
        [[nodiscard]] std::span<const uint32_t> TriangleIndices() const override { return m_Indices; }
        [[nodiscard]] std::span<const uint32_t> FaceIds() const override { return m_FaceIds; }
        [[nodiscard]] std::optional<std::string_view> FaceName(uint32_t faceId) const override;
        [[nodiscard]] std::optional<glm::dmat4> WorldTransform() const override { return m_WorldTransform; }

        bool AddTriangle(std::string_view faceName,
                         const glm::dvec3& p0,
                         const glm::dvec3& p1,
                         const glm::dvec3& p2) override;

        void SetName(std::string name) { m_Name = std::move(name); }
        void SetWorldTransform(std::optional<glm::dmat4> transform) { m_WorldTransform = transform; }

        uint32_t GetOrCreateFaceId(std::string_view faceName);
        [[nodiscard]] std::optional<uint32_t> FindFaceId(std::string_view faceName) const;
        void SetFaceName(uint32_t faceId, std::string_view faceName);
        [[nodiscard]] std::vector<std::string> FaceNames() const;

        // Index of an existing vertex at exactly this position, or a new one.
        uint32_t GetPointIndex(const glm::dvec3& p);
        [[nodiscard]] std::optional<uint32_t> FindPointIndex(const glm::dvec3& p) const;
        [[nodiscard]] glm::dvec3 Position(uint32_t vertex) const;

        // Replaces all buffers. faceIds may be empty; otherwise it must hold
        // one id per triangle or it is dropped.
        void Assign(std::vector<double> positions,
                    std::vector<uint32_t> indices,
                    std::vector<uint32_t> faceIds = {});

        // Raw buffer access for repair passes. Call RebuildVertexLookup()
        // after editing positions.
        [[nodiscard]] std::vector<double>& MutablePositions() { return m_Positions; }
        [[nodiscard]] std::vector<uint32_t>& MutableIndices() { return m_Indices; }
        [[nodiscard]] std::vector<uint32_t>& MutableFaceIds() { return m_FaceIds; }

        void RebuildVertexLookup();

        [[nodiscard]] bool IsEmpty() const { return m_Indices.empty(); }

    private:
        struct PositionKey
        {
            uint64_t X = 0, Y = 0, Z = 0;
            bool operator==(const PositionKey&) const = default;
        };

        struct PositionKeyHash
        {
            std::size_t operator()(const PositionKey& k) const noexcept;
        };

        static PositionKey MakeKey(const glm::dvec3& p);

        std::string m_Name;
        std::vector<double> m_Positions;
        std::vector<uint32_t> m_Indices;
        std::vector<uint32_t> m_FaceIds;
        std::unordered_map<PositionKey, uint32_t, PositionKeyHash> m_VertexLookup;
        std::unordered_map<std::string, uint32_t> m_FaceNameToId;
        std::unordered_map<uint32_t, std::string> m_FaceIdToName;
        uint32_t m_NextFaceId = 1;
        std::optional<glm::dmat4> m_WorldTransform;
    };
}
