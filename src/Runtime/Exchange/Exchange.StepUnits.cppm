module;

#include <cstdint>
#include <optional>
#include <string_view>

export module Exchange:StepUnits;

import :StepWriter;

export namespace Exchange::Step
{
    enum class LengthUnit : uint8_t
    {
        Millimeter,
        Centimeter,
        Meter,
        Micron,
        Inch,
        Foot
    };

    // Case-insensitive. nullopt for names outside the table.
    [[nodiscard]] std::optional<LengthUnit> ParseLengthUnit(std::string_view name);

    [[nodiscard]] std::string_view LengthUnitName(LengthUnit unit);

    [[nodiscard]] double MetresPerUnit(LengthUnit unit);

    // Emits the base SI metre, then the requested unit on top of it: an SI
    // prefix for metric units, a CONVERSION_BASED_UNIT for inch and foot.
    // Returns the id of the requested unit.
    EntityId EmitLengthUnit(StepWriter& writer, LengthUnit unit);

    // max(1e-9, |scale| * 1e-6)
    [[nodiscard]] double UncertaintyForScale(double scale);

    struct UnitContext
    {
        EntityId Length{0};
        EntityId PlaneAngle{0};
        EntityId SolidAngle{0};
        EntityId Uncertainty{0};
        EntityId GeometricContext{0};
    };

    // Units, uncertainty and the 3D geometric representation context.
    UnitContext EmitUnitContext(StepWriter& writer, LengthUnit unit, double scale);
}
