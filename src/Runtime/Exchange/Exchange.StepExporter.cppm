module;

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

export module Exchange:StepExporter;

import :StepUnits;
import Geometry;

export namespace Exchange
{
    // =========================================================================
    // STEP Export Options
    // =========================================================================

    struct StepExportOptions
    {
        // millimeter | centimeter | meter | micron | inch | foot
        std::string Unit{"millimeter"};

        // Decimal places for coordinates and directions.
        int Precision{6};

        // Uniform scale applied after the world transform.
        double Scale{1.0};

        bool ApplyWorldTransform{true};
        bool MergeCoplanarFaces{true};

        // Geometry-derived when absent.
        std::optional<double> PlanarNormalTolerance;
        std::optional<double> PlanarDistanceTolerance;

        // Emit non-planar face groups as AP242 TRIANGULATED_FACE patches.
        bool UseTessellatedFaces{true};

        bool ExportFaces{true};
        bool ExportEdgesAsPolylines{true};

        // Product and file name. Defaults to the first solid's name, or "part".
        std::optional<std::string> Name;

        // FILE_NAME time stamp. Defaults to the current UTC time.
        std::optional<std::string> Timestamp;
    };

    // Options after defaults and clamping; built once per export call.
    struct ResolvedStepOptions
    {
        Step::LengthUnit Unit{Step::LengthUnit::Millimeter};
        int Precision{6};
        double Scale{1.0};
        bool ApplyWorldTransform{true};
        bool MergeCoplanarFaces{true};
        std::optional<double> PlanarNormalTolerance;
        std::optional<double> PlanarDistanceTolerance;
        bool UseTessellatedFaces{true};
        bool ExportFaces{true};
        bool ExportEdgesAsPolylines{true};
        std::string Name{"part"};
        std::string Timestamp;
    };

    // Precision is clamped to [0, 17], a non-finite scale becomes 1,
    // non-positive tolerances are dropped and unknown units fall back to
    // millimeter with a warning.
    [[nodiscard]] ResolvedStepOptions ResolveOptions(const StepExportOptions& options,
                                                     std::span<const Geometry::ISolidView* const> solids);

    // ISO 8601 UTC time without fractional seconds.
    [[nodiscard]] std::string CurrentTimestamp();

    struct StepExportResult
    {
        // Complete ISO 10303-21 document, or empty when nothing was exported.
        std::string Data;

        // Top-level shape representation items emitted.
        std::size_t Exported{0};

        // Names of solids that produced no output.
        std::vector<std::string> Skipped;

        [[nodiscard]] bool Empty() const { return Exported == 0; }
    };

    // =========================================================================
    // StepExporter
    // =========================================================================
    //
    // Rebuilds planar BREP faces from triangle meshes and writes one STEP
    // document per call. Solids that fail validation or yield no faces are
    // skipped and reported; the rest of the batch is still written.

    class StepExporter
    {
    public:
        [[nodiscard]] std::string_view FormatName() const { return "STEP"; }
        [[nodiscard]] std::span<const std::string_view> Extensions() const;

        [[nodiscard]] StepExportResult Export(std::span<const Geometry::ISolidView* const> solids,
                                              const StepExportOptions& options = {}) const;
    };

    [[nodiscard]] StepExportResult ExportStep(std::span<const Geometry::ISolidView* const> solids,
                                              const StepExportOptions& options = {});
}
