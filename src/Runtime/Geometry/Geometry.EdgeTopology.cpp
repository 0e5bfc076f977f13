module;

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <format>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

module Geometry:EdgeTopology.Impl;

import :EdgeTopology;
import :EdgeKey;
import :PlaneMath;

namespace Geometry::EdgeTopology
{
    std::string IndexedName(std::string_view base, std::size_t index)
    {
        return std::format("{}[{}]", base, index);
    }

    std::string NameAllocator::Allocate(std::string_view base)
    {
        std::size_t& count = m_Counts[std::string(base)];
        const std::size_t k = count++;
        if (k == 0)
            return std::string(base);
        return IndexedName(base, k);
    }

    namespace
    {
        std::string JoinPair(const std::string& a, const std::string& b)
        {
            return a < b ? a + "|" + b : b + "|" + a;
        }

        template<typename Fn>
        void ForEachEdge(const PlaneMath::TriangleRecord& rec, Fn&& fn)
        {
            fn(rec.I0, rec.I1);
            fn(rec.I1, rec.I2);
            fn(rec.I2, rec.I0);
        }
    }

    EdgeNameMap BuildEdgeNames(const PlaneMath::TriangleTable& table,
                               std::span<const uint32_t> labels,
                               const FaceNameFn& nameOf)
    {
        // Faces per edge, in order of first contact.
        std::unordered_map<EdgeKey, std::vector<uint32_t>, EdgeKeyHash> faces;
        const std::size_t count = std::min(table.Size(), labels.size());

        for (std::size_t t = 0; t < count; ++t)
        {
            const PlaneMath::TriangleRecord* rec = table.Find(t);
            if (!rec)
                continue;

            const uint32_t label = labels[t];
            ForEachEdge(*rec, [&](uint32_t a, uint32_t b) {
                std::vector<uint32_t>& list = faces[MakeEdgeKey(a, b)];
                if (std::find(list.begin(), list.end(), label) == list.end())
                    list.push_back(label);
            });
        }

        std::map<std::string, std::vector<EdgeKey>> byBase;
        for (const auto& [key, list] : faces)
        {
            const std::string a = nameOf(list[0]);
            const std::string base = list.size() >= 2 ? JoinPair(a, nameOf(list[1]))
                                                      : a + "|" + std::string(BoundaryFaceName);
            byBase[base].push_back(key);
        }

        EdgeNameMap names;
        names.reserve(faces.size());
        for (auto& [base, keys] : byBase)
        {
            if (keys.size() == 1)
            {
                names.emplace(keys.front(), base);
                continue;
            }

            std::sort(keys.begin(), keys.end());
            for (std::size_t i = 0; i < keys.size(); ++i)
                names.emplace(keys[i], IndexedName(base, i));
        }
        return names;
    }

    std::vector<SeamPolyline> BuildSeamPolylines(const PlaneMath::TriangleTable& table,
                                                 std::span<const uint32_t> labels,
                                                 const FaceNameFn& nameOf)
    {
        const std::size_t count = std::min(table.Size(), labels.size());

        // Whole-mesh edge -> adjacent triangles, in first-seen edge order.
        std::vector<EdgeKey> edgeOrder;
        std::unordered_map<EdgeKey, std::vector<uint32_t>, EdgeKeyHash> edgeTris;
        for (std::size_t t = 0; t < count; ++t)
        {
            const PlaneMath::TriangleRecord* rec = table.Find(t);
            if (!rec)
                continue;
            ForEachEdge(*rec, [&](uint32_t a, uint32_t b) {
                const EdgeKey key = MakeEdgeKey(a, b);
                auto [it, inserted] = edgeTris.try_emplace(key);
                if (inserted)
                    edgeOrder.push_back(key);
                it->second.push_back(static_cast<uint32_t>(t));
            });
        }

        struct PairGroup
        {
            std::string FaceA;
            std::string FaceB;
            std::vector<EdgeKey> Edges;
        };

        std::vector<PairGroup> groups;
        std::unordered_map<std::string, std::size_t> groupSlot;

        for (const EdgeKey& key : edgeOrder)
        {
            const std::vector<uint32_t>& tris = edgeTris[key];
            if (tris.size() != 2)
                continue;

            const uint32_t la = labels[tris[0]];
            const uint32_t lb = labels[tris[1]];
            if (la == lb)
                continue;

            std::string a = nameOf(la);
            std::string b = nameOf(lb);
            if (b < a)
                std::swap(a, b);

            const std::string pairKey = a + "|" + b;
            auto [it, inserted] = groupSlot.try_emplace(pairKey, groups.size());
            if (inserted)
                groups.push_back(PairGroup{a, b, {}});
            groups[it->second].Edges.push_back(key);
        }

        std::vector<SeamPolyline> polylines;

        for (const PairGroup& group : groups)
        {
            std::map<uint32_t, std::vector<uint32_t>> adjacency;
            for (const EdgeKey& e : group.Edges)
            {
                adjacency[e.A].push_back(e.B);
                adjacency[e.B].push_back(e.A);
            }

            std::unordered_set<EdgeKey, EdgeKeyHash> visited;
            const auto nextFrom = [&](uint32_t from, uint32_t prev, bool hasPrev) -> std::optional<uint32_t> {
                for (uint32_t n : adjacency[from])
                {
                    if (hasPrev && n == prev)
                        continue;
                    if (!visited.contains(MakeEdgeKey(from, n)))
                        return n;
                }
                return std::nullopt;
            };

            const auto walk = [&](std::vector<uint32_t>& chain) {
                while (true)
                {
                    const uint32_t last = chain.back();
                    const bool hasPrev = chain.size() >= 2;
                    const uint32_t prev = hasPrev ? chain[chain.size() - 2] : last;
                    const std::optional<uint32_t> next = nextFrom(last, prev, hasPrev);
                    if (!next)
                        break;
                    visited.insert(MakeEdgeKey(last, *next));
                    chain.push_back(*next);
                    if (*next == chain.front())
                        break;
                }
            };

            std::vector<std::vector<uint32_t>> chains;

            // Open chains start at degree-1 vertices.
            for (const auto& [v, neighbors] : adjacency)
            {
                if (neighbors.size() != 1)
                    continue;
                if (visited.contains(MakeEdgeKey(v, neighbors.front())))
                    continue;

                std::vector<uint32_t> chain{v};
                walk(chain);
                if (chain.size() >= 2)
                    chains.push_back(std::move(chain));
            }

            // Whatever is left lies on loops.
            for (const EdgeKey& e : group.Edges)
            {
                if (visited.contains(e))
                    continue;

                visited.insert(e);
                std::vector<uint32_t> chain{e.A, e.B};
                walk(chain);
                chains.push_back(std::move(chain));
            }

            for (std::size_t i = 0; i < chains.size(); ++i)
            {
                SeamPolyline poly;
                poly.FaceA = group.FaceA;
                poly.FaceB = group.FaceB;
                poly.Name = IndexedName(group.FaceA + "|" + group.FaceB, i);
                poly.Closed = chains[i].size() >= 4 && chains[i].front() == chains[i].back();
                poly.Indices = std::move(chains[i]);
                polylines.push_back(std::move(poly));
            }
        }

        return polylines;
    }
}
