module;

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

module Geometry:Solid.Impl;

import :Solid;
import Core.Error;
import Core.Logging;

namespace Geometry
{
    namespace
    {
        bool IsFinite(const glm::dvec3& p)
        {
            return std::isfinite(p.x) && std::isfinite(p.y) && std::isfinite(p.z);
        }
    }

    Core::Result ValidateSolid(const ISolidView* solid)
    {
        if (!solid)
            return Core::Err(Core::ErrorCode::InvalidArgument);

        const auto positions = solid->VertexPositions();
        const auto indices = solid->TriangleIndices();

        if (positions.size() % 3 != 0 || indices.size() % 3 != 0)
            return Core::Err(Core::ErrorCode::InvalidFormat);

        if (positions.empty() || indices.empty())
            return Core::Err(Core::ErrorCode::EmptyMesh);

        return Core::Ok();
    }

    // -------------------------------------------------------------------------
    // MeshSolid
    // -------------------------------------------------------------------------

    MeshSolid::MeshSolid(std::string name)
        : m_Name(std::move(name))
    {
    }

    std::size_t MeshSolid::PositionKeyHash::operator()(const PositionKey& k) const noexcept
    {
        std::size_t h = std::hash<uint64_t>{}(k.X);
        h ^= std::hash<uint64_t>{}(k.Y) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
        h ^= std::hash<uint64_t>{}(k.Z) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
        return h;
    }

    MeshSolid::PositionKey MeshSolid::MakeKey(const glm::dvec3& p)
    {
        // Adding +0.0 folds -0.0 onto +0.0 so both weld to one vertex.
        return PositionKey{
            std::bit_cast<uint64_t>(p.x + 0.0),
            std::bit_cast<uint64_t>(p.y + 0.0),
            std::bit_cast<uint64_t>(p.z + 0.0)};
    }

    std::optional<std::string_view> MeshSolid::FaceName(uint32_t faceId) const
    {
        auto it = m_FaceIdToName.find(faceId);
        if (it == m_FaceIdToName.end())
            return std::nullopt;
        return std::string_view(it->second);
    }

    bool MeshSolid::AddTriangle(std::string_view faceName,
                                const glm::dvec3& p0,
                                const glm::dvec3& p1,
                                const glm::dvec3& p2)
    {
        if (!IsFinite(p0) || !IsFinite(p1) || !IsFinite(p2))
        {
            Core::Log::Error("MeshSolid '{}': rejected triangle with non-finite coordinates on face '{}'",
                             m_Name, faceName);
            return false;
        }

        const std::size_t triangles = m_Indices.size() / 3;

        // A solid assigned from raw buffers without ids stays id-less, so it
        // keeps exporting by geometric plane grouping.
        const bool idLess = triangles > 0 && m_FaceIds.empty();

        // Ids that fell out of step after a raw index edit are padded.
        if (!idLess && m_FaceIds.size() != triangles)
        {
            const uint32_t unnamed = GetOrCreateFaceId("UNNAMED");
            m_FaceIds.resize(triangles, unnamed);
        }

        const uint32_t i0 = GetPointIndex(p0);
        const uint32_t i1 = GetPointIndex(p1);
        const uint32_t i2 = GetPointIndex(p2);

        m_Indices.push_back(i0);
        m_Indices.push_back(i1);
        m_Indices.push_back(i2);
        if (!idLess)
            m_FaceIds.push_back(GetOrCreateFaceId(faceName));
        return true;
    }

    uint32_t MeshSolid::GetOrCreateFaceId(std::string_view faceName)
    {
        std::string key(faceName);
        auto it = m_FaceNameToId.find(key);
        if (it != m_FaceNameToId.end())
            return it->second;

        // Skip ids already claimed through SetFaceName/Assign.
        while (m_FaceIdToName.contains(m_NextFaceId))
            ++m_NextFaceId;

        const uint32_t id = m_NextFaceId++;
        m_FaceNameToId.emplace(key, id);
        m_FaceIdToName.emplace(id, std::move(key));
        return id;
    }

    std::optional<uint32_t> MeshSolid::FindFaceId(std::string_view faceName) const
    {
        auto it = m_FaceNameToId.find(std::string(faceName));
        if (it == m_FaceNameToId.end())
            return std::nullopt;
        return it->second;
    }

    void MeshSolid::SetFaceName(uint32_t faceId, std::string_view faceName)
    {
        auto old = m_FaceIdToName.find(faceId);
        if (old != m_FaceIdToName.end())
            m_FaceNameToId.erase(old->second);

        m_FaceIdToName[faceId] = std::string(faceName);
        m_FaceNameToId[std::string(faceName)] = faceId;
    }

    std::vector<std::string> MeshSolid::FaceNames() const
    {
        std::vector<std::pair<uint32_t, std::string>> ordered(m_FaceIdToName.begin(), m_FaceIdToName.end());
        std::sort(ordered.begin(), ordered.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });

        std::vector<std::string> names;
        names.reserve(ordered.size());
        for (auto& [id, name] : ordered)
            names.push_back(std::move(name));
        return names;
    }

    uint32_t MeshSolid::GetPointIndex(const glm::dvec3& p)
    {
        const PositionKey key = MakeKey(p);
        auto it = m_VertexLookup.find(key);
        if (it != m_VertexLookup.end())
            return it->second;

        const auto idx = static_cast<uint32_t>(m_Positions.size() / 3);
        m_Positions.push_back(p.x);
        m_Positions.push_back(p.y);
        m_Positions.push_back(p.z);
        m_VertexLookup.emplace(key, idx);
        return idx;
    }

    std::optional<uint32_t> MeshSolid::FindPointIndex(const glm::dvec3& p) const
    {
        auto it = m_VertexLookup.find(MakeKey(p));
        if (it == m_VertexLookup.end())
            return std::nullopt;
        return it->second;
    }

    glm::dvec3 MeshSolid::Position(uint32_t vertex) const
    {
        const std::size_t base = static_cast<std::size_t>(vertex) * 3;
        if (base + 2 >= m_Positions.size())
            return glm::dvec3(0.0);
        return {m_Positions[base], m_Positions[base + 1], m_Positions[base + 2]};
    }

    void MeshSolid::Assign(std::vector<double> positions,
                           std::vector<uint32_t> indices,
                           std::vector<uint32_t> faceIds)
    {
        m_Positions = std::move(positions);
        m_Indices = std::move(indices);
        m_FaceIds = std::move(faceIds);

        if (!m_FaceIds.empty() && m_FaceIds.size() != m_Indices.size() / 3)
        {
            Core::Log::Warn("MeshSolid '{}': dropping {} face ids for {} triangles",
                            m_Name, m_FaceIds.size(), m_Indices.size() / 3);
            m_FaceIds.clear();
        }

        RebuildVertexLookup();
    }

    void MeshSolid::RebuildVertexLookup()
    {
        m_VertexLookup.clear();
        const std::size_t count = m_Positions.size() / 3;
        m_VertexLookup.reserve(count);
        for (std::size_t i = 0; i < count; ++i)
        {
            const glm::dvec3 p{m_Positions[i * 3], m_Positions[i * 3 + 1], m_Positions[i * 3 + 2]};
            // First index wins when two vertices share a position.
            m_VertexLookup.try_emplace(MakeKey(p), static_cast<uint32_t>(i));
        }
    }
}
