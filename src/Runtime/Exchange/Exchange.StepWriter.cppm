module;

#include <cstddef>
#include <cstdint>
#include <format>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

export module Exchange:StepWriter;

export namespace Exchange::Step
{
    using EntityId = uint32_t;

    // =========================================================================
    // StepWriter: append-only entity ledger
    // =========================================================================
    //
    // Ids start at 1 and grow by one per entity. An entity can only reference
    // ids returned earlier, so the data section never holds a forward
    // reference.

    class StepWriter
    {
    public:
        // Appends "#<id>=<body>;" and returns the id.
        EntityId Add(std::string_view body);

        template<typename... Args>
        EntityId AddF(std::format_string<Args...> fmt, Args&&... args)
        {
            return Add(std::format(fmt, std::forward<Args>(args)...));
        }

        [[nodiscard]] EntityId NextId() const { return m_NextId; }
        [[nodiscard]] std::size_t Size() const { return m_Lines.size(); }
        [[nodiscard]] const std::vector<std::string>& Lines() const { return m_Lines; }

        // Lines joined with '\n', no trailing newline.
        [[nodiscard]] std::string Join() const;

    private:
        EntityId m_NextId = 1;
        std::vector<std::string> m_Lines;
    };

    // =========================================================================
    // Formatting
    // =========================================================================

    // Fixed notation with trailing zeros trimmed. The decimal point is kept
    // ("1.", "0.5"), "-0." becomes "0." and non-finite values print "0.".
    [[nodiscard]] std::string FormatReal(double value, int precision);

    // "1.000000E-6" style. Zero and non-finite values print "0.".
    [[nodiscard]] std::string FormatExponent(double value, int mantissaDigits = 6);

    // "(x,y,z)" with FormatReal components.
    [[nodiscard]] std::string FormatTriple(const glm::dvec3& v, int precision);

    // Doubles single quotes and backslashes.
    [[nodiscard]] std::string EscapeString(std::string_view value);

    // Trimmed and escaped; fallback is used when nothing is left.
    [[nodiscard]] std::string SafeName(std::string_view value, std::string_view fallback = "NAME");

    [[nodiscard]] std::string Ref(EntityId id);

    // "(#1,#2)". Lists longer than breakEvery are split onto indented lines
    // of breakEvery ids.
    [[nodiscard]] std::string FormatEntityList(std::span<const EntityId> ids, std::size_t breakEvery = 40);

    // =========================================================================
    // DirectionCache
    // =========================================================================
    //
    // One DIRECTION entity per unit vector, keyed by its components at 9
    // decimals. Zero or non-finite input maps to +Z.

    class DirectionCache
    {
    public:
        explicit DirectionCache(int precision) : m_Precision(precision) {}

        EntityId Resolve(StepWriter& writer, const glm::dvec3& direction);

        [[nodiscard]] std::size_t Size() const { return m_Ids.size(); }

    private:
        int m_Precision;
        std::unordered_map<std::string, EntityId> m_Ids;
    };
}
