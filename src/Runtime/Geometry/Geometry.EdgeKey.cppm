module;

#include <cstddef>
#include <cstdint>
#include <functional>

export module Geometry:EdgeKey;

export namespace Geometry
{
    // Undirected vertex pair, stored with A <= B.
    struct EdgeKey
    {
        uint32_t A = 0;
        uint32_t B = 0;

        bool operator==(const EdgeKey&) const = default;
        auto operator<=>(const EdgeKey&) const = default;
    };

    [[nodiscard]] constexpr EdgeKey MakeEdgeKey(uint32_t a, uint32_t b) noexcept
    {
        return a <= b ? EdgeKey{a, b} : EdgeKey{b, a};
    }

    struct EdgeKeyHash
    {
        std::size_t operator()(const EdgeKey& k) const noexcept
        {
            return std::hash<uint64_t>{}((static_cast<uint64_t>(k.A) << 32) | k.B);
        }
    };
}
