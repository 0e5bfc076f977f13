module;

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <glm/glm.hpp>

module Exchange:ObjReader.Impl;

import :ObjReader;
import Core.Error;
import Core.IOBackend;
import Core.Logging;
import Geometry;

namespace Exchange
{
    namespace
    {
        constexpr std::string_view s_Whitespace = " \t\r\f\v";

        // Splits on whitespace; views point into line.
        std::vector<std::string_view> Tokenize(std::string_view line)
        {
            std::vector<std::string_view> tokens;
            std::size_t pos = 0;
            while (pos < line.size())
            {
                const std::size_t start = line.find_first_not_of(s_Whitespace, pos);
                if (start == std::string_view::npos)
                    break;
                std::size_t end = line.find_first_of(s_Whitespace, start);
                if (end == std::string_view::npos)
                    end = line.size();
                tokens.push_back(line.substr(start, end - start));
                pos = end;
            }
            return tokens;
        }

        std::optional<double> ParseDouble(std::string_view token)
        {
            if (!token.empty() && token.front() == '+')
                token.remove_prefix(1);

            double value = 0.0;
            const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
            if (ec != std::errc() || ptr != token.data() + token.size())
                return std::nullopt;
            return value;
        }

        // Resolves "7", "7/2", "7//3" or "-1" to a 0-based position index.
        std::optional<std::size_t> ParseCorner(std::string_view token, std::size_t vertexCount)
        {
            const std::size_t slash = token.find('/');
            const std::string_view head = token.substr(0, slash);

            long long index = 0;
            const auto [ptr, ec] = std::from_chars(head.data(), head.data() + head.size(), index);
            if (ec != std::errc() || ptr != head.data() + head.size() || index == 0)
                return std::nullopt;

            const long long resolved = index > 0 ? index - 1 : static_cast<long long>(vertexCount) + index;
            if (resolved < 0 || static_cast<std::size_t>(resolved) >= vertexCount)
                return std::nullopt;
            return static_cast<std::size_t>(resolved);
        }

        std::string JoinName(std::span<const std::string_view> tokens)
        {
            std::string name;
            for (std::size_t i = 1; i < tokens.size(); ++i)
            {
                if (i > 1)
                    name += ' ';
                name += tokens[i];
            }
            return name;
        }
    }

    Core::Expected<Geometry::MeshSolid> ObjReader::Parse(std::string_view text, std::string_view solidName)
    {
        m_Stats = {};
        Geometry::MeshSolid solid{std::string(solidName)};
        std::vector<glm::dvec3> positions;
        std::string currentFace = m_Options.DefaultFaceName;

        std::size_t lineNo = 0;
        std::size_t pos = 0;
        while (pos <= text.size())
        {
            std::size_t end = text.find('\n', pos);
            if (end == std::string_view::npos)
                end = text.size();
            std::string_view line = text.substr(pos, end - pos);
            pos = end + 1;
            ++lineNo;

            if (const std::size_t hash = line.find('#'); hash != std::string_view::npos)
                line = line.substr(0, hash);

            const std::vector<std::string_view> tokens = Tokenize(line);
            if (tokens.empty())
                continue;

            const std::string_view type = tokens.front();

            if (type == "v")
            {
                if (tokens.size() < 4)
                {
                    Core::Log::Error("ObjReader: line {}: vertex needs 3 coordinates", lineNo);
                    return Core::Err<Geometry::MeshSolid>(Core::ErrorCode::InvalidFormat);
                }

                const auto x = ParseDouble(tokens[1]);
                const auto y = ParseDouble(tokens[2]);
                const auto z = ParseDouble(tokens[3]);
                if (!x || !y || !z)
                {
                    Core::Log::Error("ObjReader: line {}: malformed vertex", lineNo);
                    return Core::Err<Geometry::MeshSolid>(Core::ErrorCode::InvalidFormat);
                }
                positions.emplace_back(*x, *y, *z);
            }
            else if (type == "f")
            {
                ++m_Stats.Polygons;

                std::vector<std::size_t> corners;
                corners.reserve(tokens.size() - 1);
                bool valid = tokens.size() >= 4;
                for (std::size_t i = 1; i < tokens.size() && valid; ++i)
                {
                    const auto corner = ParseCorner(tokens[i], positions.size());
                    if (!corner)
                        valid = false;
                    else
                        corners.push_back(*corner);
                }

                if (!valid)
                {
                    Core::Log::Warn("ObjReader: line {}: skipping face with bad or too few indices", lineNo);
                    ++m_Stats.SkippedPolygons;
                    continue;
                }

                for (std::size_t i = 1; i + 1 < corners.size(); ++i)
                {
                    if (solid.AddTriangle(currentFace,
                                          positions[corners[0]],
                                          positions[corners[i]],
                                          positions[corners[i + 1]]))
                    {
                        ++m_Stats.Triangles;
                    }
                }
            }
            else if (type == "g" || type == "o")
            {
                if (!m_Options.GroupsAsFaces)
                    continue;

                const std::string name = JoinName(tokens);
                currentFace = name.empty() ? m_Options.DefaultFaceName : name;
            }
        }

        m_Stats.Vertices = positions.size();

        if (m_Stats.Triangles == 0)
        {
            Core::Log::Error("ObjReader: '{}' contains no triangles", solidName);
            return Core::Err<Geometry::MeshSolid>(Core::ErrorCode::EmptyMesh);
        }

        Core::Log::Info("ObjReader: '{}' read {} vertices, {} polygons -> {} triangles ({} skipped)",
                        solidName, m_Stats.Vertices, m_Stats.Polygons, m_Stats.Triangles,
                        m_Stats.SkippedPolygons);
        return solid;
    }

    Core::Expected<Geometry::MeshSolid> ObjReader::LoadFile(std::string_view path)
    {
        auto text = Core::IO::ReadTextFile(path);
        if (!text)
        {
            Core::Log::Error("ObjReader: cannot read '{}': {}", path, Core::ErrorCodeToString(text.error()));
            return Core::Err<Geometry::MeshSolid>(text.error());
        }

        const std::string stem = std::filesystem::path(std::string(path)).stem().string();
        return Parse(*text, stem.empty() ? std::string_view("solid") : std::string_view(stem));
    }
}
