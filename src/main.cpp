#include <array>
#include <cmath>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "AppConfig.h"
#include "MarchingCubes.h"
#include "MeshExport.h"
#include "SliceExtractor.h"
#include "SurfaceScheduler.h"
#include "Volume.h"
#include "VolumeErrors.h"

namespace
{

struct CliOptions
{
    std::string volumePath;
    std::string configPath;
    std::optional<double> threshold;
    std::optional<int> stride;
    std::optional<double> windowLevel;
    std::optional<double> windowWidth;
    std::array<std::optional<int>, kSlicePlaneCount> sliceIndices;
    std::optional<std::string> outputDir;
    bool surface = true;
};

void printUsage()
{
    std::cerr << "Usage: brainsurf [options] [volume.nii[.gz] | volume.hdr]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>     Load config from <path>\n"
              << "  -h, --help              Show this help message\n"
              << "      --threshold <t>     Isosurface threshold in [0,1]\n"
              << "      --stride <n>        Marching-cubes sampling stride (>= 1)\n"
              << "      --level <l>         Window level in [0,1]\n"
              << "      --width <w>         Window width in [0,1]\n"
              << "      --axial <i>         Axial slice index\n"
              << "      --coronal <i>       Coronal slice index\n"
              << "      --sagittal <i>      Sagittal slice index\n"
              << "  -o, --out <dir>         Output directory for slices and mesh\n"
              << "      --no-surface        Skip isosurface extraction\n"
              << "\nWithout a volume a synthetic test phantom is used.\n";
}

double parseDouble(std::string_view flag, const std::string& text)
{
    try
    {
        std::size_t used = 0;
        double v = std::stod(text, &used);
        if (used == text.size() && std::isfinite(v))
            return v;
    }
    catch (const std::exception&)
    {
    }
    throw std::invalid_argument(std::format("Invalid value for {}: {}", flag, text));
}

int parseInt(std::string_view flag, const std::string& text)
{
    try
    {
        std::size_t used = 0;
        int v = std::stoi(text, &used);
        if (used == text.size())
            return v;
    }
    catch (const std::exception&)
    {
    }
    throw std::invalid_argument(std::format("Invalid value for {}: {}", flag, text));
}

/// Returns std::nullopt when the program should exit (help shown).
std::optional<CliOptions> parseArgs(int argc, char** argv)
{
    CliOptions opts;

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc)
                throw std::invalid_argument(std::format("Missing value for {}", arg));
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h")
        {
            printUsage();
            return std::nullopt;
        }
        if (arg == "--config" || arg == "-c")
        {
            opts.configPath = next();
            continue;
        }
        if (arg == "--threshold")
        {
            opts.threshold = parseDouble(arg, next());
            continue;
        }
        if (arg == "--stride")
        {
            opts.stride = parseInt(arg, next());
            continue;
        }
        if (arg == "--level")
        {
            opts.windowLevel = parseDouble(arg, next());
            continue;
        }
        if (arg == "--width")
        {
            opts.windowWidth = parseDouble(arg, next());
            continue;
        }
        if (arg == "--out" || arg == "-o")
        {
            opts.outputDir = next();
            continue;
        }
        if (arg == "--no-surface")
        {
            opts.surface = false;
            continue;
        }
        if (arg.size() > 2 && arg.substr(0, 2) == "--")
        {
            if (auto plane = slicePlaneFromName(arg.substr(2)))
            {
                opts.sliceIndices[static_cast<int>(*plane)] = parseInt(arg, next());
                continue;
            }
            throw std::invalid_argument(std::format("Unknown option: {}", arg));
        }

        if (!opts.volumePath.empty())
            throw std::invalid_argument("Only one volume can be processed at a time");
        opts.volumePath = std::string(arg);
    }

    return opts;
}

AppConfig loadMergedConfig(const CliOptions& opts)
{
    AppConfig globalCfg;
    try { globalCfg = loadConfig(globalConfigPath()); }
    catch (const std::exception& e)
    {
        std::cerr << "Warning: " << e.what() << "\n";
    }

    // --config flag takes priority, else ./config.json
    std::string localPath = opts.configPath;
    if (localPath.empty() && std::filesystem::exists("config.json"))
        localPath = "config.json";

    AppConfig localCfg;
    if (!localPath.empty())
    {
        try { localCfg = loadConfig(localPath); }
        catch (const std::exception& e)
        {
            std::cerr << "Warning: " << e.what() << "\n";
        }
    }

    return mergeConfigs(globalCfg, localCfg);
}

std::shared_ptr<const Volume> loadOrGenerate(const std::string& path)
{
    if (path.empty())
    {
        std::cout << "No volume given, using test phantom\n";
        auto vol = std::make_shared<Volume>();
        vol->generateTestData();
        return vol;
    }

    std::cout << "Loading NIfTI file: " << path << "\n";
    NiftiLoadResult result = Volume::load(path);
    for (const auto& w : result.warnings)
        std::cerr << "Warning: " << w.message << "\n";
    return std::make_shared<Volume>(std::move(result.volume));
}

void printSummary(const Volume& vol)
{
    std::cout << std::format("Dimensions: {} x {} x {}\n",
                             vol.dimensions.x, vol.dimensions.y, vol.dimensions.z)
              << std::format("Voxel size: {:.3f} x {:.3f} x {:.3f} mm\n",
                             vol.voxelSize.x, vol.voxelSize.y, vol.voxelSize.z)
              << std::format("Data type: {}, range: {:.2f} - {:.2f}\n",
                             dataTypeName(vol.header.datatype), vol.min_value, vol.max_value);
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        std::optional<CliOptions> parsed;
        try
        {
            parsed = parseArgs(argc, argv);
        }
        catch (const std::invalid_argument& e)
        {
            std::cerr << e.what() << "\n";
            printUsage();
            return 1;
        }
        if (!parsed)
            return 0;
        CliOptions& opts = *parsed;

        AppConfig cfg = loadMergedConfig(opts);

        // CLI filename takes priority; otherwise the first configured volume.
        if (opts.volumePath.empty())
        {
            for (const auto& vc : cfg.volumes)
            {
                if (!vc.path.empty())
                {
                    opts.volumePath = vc.path;
                    break;
                }
            }
        }
        const VolumeConfig* volCfg = findVolumeConfig(cfg, opts.volumePath);

        std::shared_ptr<const Volume> volume;
        try
        {
            volume = loadOrGenerate(opts.volumePath);
        }
        catch (const VolumeError& e)
        {
            std::cerr << "Failed to load volume: " << e.what() << "\n";
            return 1;
        }
        printSummary(*volume);

        std::filesystem::path outDir = opts.outputDir.value_or(cfg.global.outputDir);
        std::error_code ec;
        std::filesystem::create_directories(outDir, ec);
        if (ec)
        {
            std::cerr << "Cannot create output directory " << outDir << ": " << ec.message() << "\n";
            return 1;
        }

        // --- Slices ---
        WindowSettings window;
        window.level = opts.windowLevel.value_or(
            volCfg && volCfg->windowLevel ? *volCfg->windowLevel : cfg.global.windowLevel);
        window.width = opts.windowWidth.value_or(
            volCfg && volCfg->windowWidth ? *volCfg->windowWidth : cfg.global.windowWidth);

        for (int p = 0; p < kSlicePlaneCount; ++p)
        {
            auto plane = static_cast<SlicePlane>(p);
            int index = defaultSliceIndex(*volume, plane);
            if (volCfg && volCfg->sliceIndices[p] >= 0)
                index = volCfg->sliceIndices[p];
            if (opts.sliceIndices[p])
                index = *opts.sliceIndices[p];
            index = clampSliceIndex(*volume, plane, index);

            SliceImage img = extractSlice(*volume, { plane, index, window });
            std::filesystem::path file = outDir / (std::string(slicePlaneName(plane)) + ".png");
            writeSlicePng(img, file.string());
            std::cout << std::format("Slice {} [{}]: {} x {} -> {}\n", slicePlaneName(plane),
                                     index, img.width, img.height, file.string());
        }

        // --- Surface ---
        if (opts.surface)
        {
            SurfaceRequest req;
            req.threshold = opts.threshold.value_or(
                volCfg && volCfg->surfaceThreshold ? *volCfg->surfaceThreshold
                                                   : cfg.global.surfaceThreshold);
            req.stride = opts.stride.value_or(cfg.global.surfaceStride);

            std::cout << std::format("Generating surface at threshold: {}\n", req.threshold);

            SurfaceScheduler scheduler(volume, cfg.global.targetSize);
            int lastReported = -1;
            auto future = scheduler.request(req, [&lastReported](double fraction) {
                int pct = static_cast<int>(fraction * 100.0);
                if (pct / 10 != lastReported / 10)
                {
                    std::cout << "[surface] " << pct << "%\n";
                    lastReported = pct;
                }
            });
            scheduler.runUntilIdle();

            SurfaceScheduler::Result mesh = future.get();
            if (!mesh)
            {
                std::cerr << "Surface extraction was cancelled\n";
                return 1;
            }

            std::cout << "Surface generated: " << mesh->triangleCount() << " triangles\n";
            if (!mesh->empty())
            {
                std::filesystem::path file = outDir / "surface.obj";
                writeObj(*mesh, file.string());
                std::cout << "Wrote: " << file.string() << "\n";
            }
        }

        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
