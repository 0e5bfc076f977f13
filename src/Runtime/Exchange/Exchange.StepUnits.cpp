module;

#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <string>
#include <string_view>

module Exchange:StepUnits.Impl;

import :StepUnits;
import :StepWriter;

namespace Exchange::Step
{
    namespace
    {
        struct UnitEntry
        {
            std::string_view Name;
            LengthUnit Unit;
        };

        constexpr UnitEntry s_Units[] = {
            {"millimeter", LengthUnit::Millimeter},
            {"centimeter", LengthUnit::Centimeter},
            {"meter", LengthUnit::Meter},
            {"micron", LengthUnit::Micron},
            {"inch", LengthUnit::Inch},
            {"foot", LengthUnit::Foot},
        };
    }

    std::optional<LengthUnit> ParseLengthUnit(std::string_view name)
    {
        std::string lower(name);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        for (const UnitEntry& e : s_Units)
        {
            if (e.Name == lower)
                return e.Unit;
        }
        return std::nullopt;
    }

    std::string_view LengthUnitName(LengthUnit unit)
    {
        for (const UnitEntry& e : s_Units)
        {
            if (e.Unit == unit)
                return e.Name;
        }
        return "millimeter";
    }

    double MetresPerUnit(LengthUnit unit)
    {
        switch (unit)
        {
            case LengthUnit::Millimeter: return 1e-3;
            case LengthUnit::Centimeter: return 1e-2;
            case LengthUnit::Meter:      return 1.0;
            case LengthUnit::Micron:     return 1e-6;
            case LengthUnit::Inch:       return 0.0254;
            case LengthUnit::Foot:       return 0.3048;
        }
        return 1e-3;
    }

    EntityId EmitLengthUnit(StepWriter& writer, LengthUnit unit)
    {
        const EntityId metre = writer.Add("(LENGTH_UNIT() NAMED_UNIT(*) SI_UNIT($,.METRE.))");

        switch (unit)
        {
            case LengthUnit::Meter:
                return metre;
            case LengthUnit::Millimeter:
                return writer.Add("(LENGTH_UNIT() NAMED_UNIT(*) SI_UNIT(.MILLI.,.METRE.))");
            case LengthUnit::Centimeter:
                return writer.Add("(LENGTH_UNIT() NAMED_UNIT(*) SI_UNIT(.CENTI.,.METRE.))");
            case LengthUnit::Micron:
                return writer.Add("(LENGTH_UNIT() NAMED_UNIT(*) SI_UNIT(.MICRO.,.METRE.))");
            case LengthUnit::Inch:
            case LengthUnit::Foot:
                break;
        }

        const bool inch = (unit == LengthUnit::Inch);
        const EntityId measure = writer.AddF("LENGTH_MEASURE_WITH_UNIT(LENGTH_MEASURE({}),{})",
                                             FormatReal(MetresPerUnit(unit), 8), Ref(metre));
        return writer.AddF("(CONVERSION_BASED_UNIT('{}',{}) LENGTH_UNIT() NAMED_UNIT(*))",
                           inch ? "INCH" : "FOOT", Ref(measure));
    }

    double UncertaintyForScale(double scale)
    {
        const double s = std::isfinite(scale) ? std::abs(scale) : 1.0;
        return std::max(1e-9, s * 1e-6);
    }

    UnitContext EmitUnitContext(StepWriter& writer, LengthUnit unit, double scale)
    {
        UnitContext ctx;
        ctx.Length = EmitLengthUnit(writer, unit);
        ctx.PlaneAngle = writer.Add("(PLANE_ANGLE_UNIT() NAMED_UNIT(*) SI_UNIT($,.RADIAN.))");
        ctx.SolidAngle = writer.Add("(SOLID_ANGLE_UNIT() NAMED_UNIT(*) SI_UNIT($,.STERADIAN.))");
        ctx.Uncertainty = writer.AddF(
            "UNCERTAINTY_MEASURE_WITH_UNIT(LENGTH_MEASURE({}),{},'distance_accuracy_value','')",
            FormatExponent(UncertaintyForScale(scale), 6), Ref(ctx.Length));
        ctx.GeometricContext = writer.AddF(
            "(GEOMETRIC_REPRESENTATION_CONTEXT(3) GLOBAL_UNCERTAINTY_ASSIGNED_CONTEXT(({})) "
            "GLOBAL_UNIT_ASSIGNED_CONTEXT(({},{},{})) REPRESENTATION_CONTEXT('',''))",
            Ref(ctx.Uncertainty), Ref(ctx.Length), Ref(ctx.PlaneAngle), Ref(ctx.SolidAngle));
        return ctx;
    }
}
