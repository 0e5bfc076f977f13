module;

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <format>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

module Exchange:StepWriter.Impl;

import :StepWriter;

namespace Exchange::Step
{
    EntityId StepWriter::Add(std::string_view body)
    {
        const EntityId id = m_NextId++;
        std::string line;
        line.reserve(body.size() + 12);
        line += '#';
        line += std::to_string(id);
        line += '=';
        line += body;
        line += ';';
        m_Lines.push_back(std::move(line));
        return id;
    }

    std::string StepWriter::Join() const
    {
        std::size_t total = 0;
        for (const std::string& l : m_Lines)
            total += l.size() + 1;

        std::string out;
        out.reserve(total);
        for (std::size_t i = 0; i < m_Lines.size(); ++i)
        {
            if (i > 0)
                out += '\n';
            out += m_Lines[i];
        }
        return out;
    }

    std::string FormatReal(double value, int precision)
    {
        if (!std::isfinite(value))
            return "0.";

        std::string s = std::format("{:.{}f}", value, precision);

        const std::size_t dot = s.find('.');
        if (dot == std::string::npos)
        {
            s += '.';
        }
        else
        {
            std::size_t end = s.size();
            while (end > dot + 1 && s[end - 1] == '0')
                --end;
            s.resize(end);
        }

        if (s == "-0.")
            s = "0.";
        return s;
    }

    std::string FormatExponent(double value, int mantissaDigits)
    {
        if (!std::isfinite(value) || value == 0.0)
            return "0.";

        const std::string s = std::format("{:.{}E}", value, mantissaDigits);
        const std::size_t e = s.find('E');
        if (e == std::string::npos)
            return s;

        const int exponent = std::atoi(s.c_str() + e + 1);
        return std::format("{}E{}{}", s.substr(0, e), exponent >= 0 ? "+" : "", exponent);
    }

    std::string FormatTriple(const glm::dvec3& v, int precision)
    {
        return std::format("({},{},{})",
                           FormatReal(v.x, precision),
                           FormatReal(v.y, precision),
                           FormatReal(v.z, precision));
    }

    std::string EscapeString(std::string_view value)
    {
        std::string out;
        out.reserve(value.size());
        for (char c : value)
        {
            if (c == '\'' || c == '\\')
                out += c;
            out += c;
        }
        return out;
    }

    std::string SafeName(std::string_view value, std::string_view fallback)
    {
        constexpr std::string_view ws = " \t\r\n\f\v";
        const std::size_t first = value.find_first_not_of(ws);
        if (first == std::string_view::npos)
            return EscapeString(fallback);

        const std::size_t last = value.find_last_not_of(ws);
        return EscapeString(value.substr(first, last - first + 1));
    }

    std::string Ref(EntityId id)
    {
        return "#" + std::to_string(id);
    }

    std::string FormatEntityList(std::span<const EntityId> ids, std::size_t breakEvery)
    {
        if (ids.empty())
            return "()";

        const auto joinRange = [&](std::size_t begin, std::size_t end) {
            std::string s;
            for (std::size_t i = begin; i < end; ++i)
            {
                if (i > begin)
                    s += ',';
                s += Ref(ids[i]);
            }
            return s;
        };

        if (breakEvery == 0 || ids.size() <= breakEvery)
            return "(" + joinRange(0, ids.size()) + ")";

        std::string out = "(\n  ";
        for (std::size_t i = 0; i < ids.size(); i += breakEvery)
        {
            if (i > 0)
                out += ",\n  ";
            out += joinRange(i, std::min(ids.size(), i + breakEvery));
        }
        out += "\n)";
        return out;
    }

    EntityId DirectionCache::Resolve(StepWriter& writer, const glm::dvec3& direction)
    {
        glm::dvec3 n(0.0, 0.0, 1.0);
        const double len = glm::length(direction);
        if (std::isfinite(len) && len > 0.0)
            n = direction / len;

        std::string key = std::format("{},{},{}", FormatReal(n.x, 9), FormatReal(n.y, 9), FormatReal(n.z, 9));
        auto it = m_Ids.find(key);
        if (it != m_Ids.end())
            return it->second;

        const EntityId id = writer.AddF("DIRECTION('',{})", FormatTriple(n, m_Precision));
        m_Ids.emplace(std::move(key), id);
        return id;
    }
}
