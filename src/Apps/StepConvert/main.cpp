#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <cxxopts.hpp>

import Core;
import Geometry;
import Exchange;

using namespace Core;

namespace
{
    Geometry::MeshRepair::RepairParams MakeRepairParams(const cxxopts::ParseResult& args)
    {
        Geometry::MeshRepair::RepairParams params;
        if (args.count("quantize"))
            params.Quantize = Geometry::MeshRepair::QuantizationParams{args["quantize"].as<double>()};
        return params;
    }

    Exchange::StepExportOptions MakeExportOptions(const cxxopts::ParseResult& args)
    {
        Exchange::StepExportOptions options;
        options.Unit = args["unit"].as<std::string>();
        options.Precision = args["precision"].as<int>();
        options.Scale = args["scale"].as<double>();
        options.MergeCoplanarFaces = !args.count("no-merge");
        options.UseTessellatedFaces = !args.count("no-tessellated");
        options.ExportFaces = !args.count("no-faces");
        options.ExportEdgesAsPolylines = !args.count("no-edges");
        options.ApplyWorldTransform = true;

        if (args.count("normal-tol"))
            options.PlanarNormalTolerance = args["normal-tol"].as<double>();
        if (args.count("dist-tol"))
            options.PlanarDistanceTolerance = args["dist-tol"].as<double>();
        if (args.count("name"))
            options.Name = args["name"].as<std::string>();
        return options;
    }
}

int main(int argc, char* argv[])
{
    cxxopts::Options cli{"faceter-step", "Rebuilds planar BREP faces from OBJ triangle meshes and writes a STEP file."};
    cli.add_options()
        ("i,input", "Input OBJ files", cxxopts::value<std::vector<std::string>>())
        ("o,output", "Output STEP file", cxxopts::value<std::string>())
        ("u,unit", "Length unit (millimeter, centimeter, meter, micron, inch, foot)",
            cxxopts::value<std::string>()->default_value("millimeter"))
        ("p,precision", "Decimal places", cxxopts::value<int>()->default_value("6"))
        ("s,scale", "Uniform scale", cxxopts::value<double>()->default_value("1"))
        ("no-merge", "Write one face per triangle")
        ("no-tessellated", "Do not write tessellated faces")
        ("no-faces", "Do not write BREP faces")
        ("no-edges", "Do not write edge curves or seam polylines")
        ("normal-tol", "Coplanarity normal tolerance", cxxopts::value<double>())
        ("dist-tol", "Coplanarity distance tolerance", cxxopts::value<double>())
        ("n,name", "Product name", cxxopts::value<std::string>())
        ("r,repair", "Remove degenerate triangles and fix winding before export")
        ("q,quantize", "Snap vertices to this grid while repairing", cxxopts::value<double>())
        ("v,verbose", "Log debug output")
        ("h,help", "Print usage");
    cli.parse_positional({"input"});
    cli.positional_help("input.obj [more.obj ...]");

    try
    {
        const auto args = cli.parse(argc, argv);
        if (args.count("help") || !args.count("input") || !args.count("output"))
        {
            std::cout << cli.help() << std::endl;
            return args.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        Log::SetLevel(args.count("verbose") ? Log::Level::Debug : Log::Level::Info);

        const bool repair = args.count("repair") || args.count("quantize");
        const auto repairParams = MakeRepairParams(args);

        std::vector<Geometry::MeshSolid> solids;
        Exchange::ObjReader reader;
        for (const std::string& path : args["input"].as<std::vector<std::string>>())
        {
            auto solid = reader.LoadFile(path);
            if (!solid)
            {
                Log::Error("Cannot load '{}': {}", path, ErrorCodeToString(solid.error()));
                return EXIT_FAILURE;
            }

            if (repair)
            {
                if (auto result = Geometry::MeshRepair::Repair(*solid, repairParams))
                {
                    Log::Info("Repaired '{}': {} degenerate triangles removed, {} vertices snapped, {} triangles flipped",
                              solid->Name(),
                              result->DegenerateResult.TrianglesRemoved,
                              result->QuantizeResult.VerticesMoved,
                              result->OrientResult.TrianglesFlipped);
                }
            }

            solids.push_back(std::move(*solid));
        }

        std::vector<const Geometry::ISolidView*> views;
        views.reserve(solids.size());
        for (const auto& s : solids)
            views.push_back(&s);

        Exchange::StepExporter exporter;
        const auto result = exporter.Export(views, MakeExportOptions(args));

        for (const auto& skipped : result.Skipped)
            Log::Warn("Skipped solid '{}'", skipped);

        if (result.Empty())
        {
            Log::Error("Nothing was exported");
            return EXIT_FAILURE;
        }

        const std::string output = args["output"].as<std::string>();
        if (auto written = IO::WriteTextFile(output, result.Data); !written)
        {
            Log::Error("Cannot write '{}': {}", output, ErrorCodeToString(written.error()));
            return EXIT_FAILURE;
        }

        Log::Info("Wrote {} ({} shape items)", output, result.Exported);
        return EXIT_SUCCESS;
    }
    catch (const std::exception& ex)
    {
        Log::Error("{}", ex.what());
        return EXIT_FAILURE;
    }
}
