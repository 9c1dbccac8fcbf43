#include "AppConfig.h"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <glaze/glaze.hpp>

// ---- JSON field names ------------------------------------------------------

template <>
struct glz::meta<VolumeConfig>
{
    using T = VolumeConfig;
    static constexpr auto value = object(
        "path",              &T::path,
        "slice_indices",     &T::sliceIndices,
        "surface_threshold", &T::surfaceThreshold,
        "window_level",      &T::windowLevel,
        "window_width",      &T::windowWidth
    );
};

template <>
struct glz::meta<GlobalConfig>
{
    using T = GlobalConfig;
    static constexpr auto value = object(
        "target_size",       &T::targetSize,
        "surface_threshold", &T::surfaceThreshold,
        "surface_stride",    &T::surfaceStride,
        "window_level",      &T::windowLevel,
        "window_width",      &T::windowWidth,
        "output_dir",        &T::outputDir
    );
};

template <>
struct glz::meta<AppConfig>
{
    using T = AppConfig;
    static constexpr auto value = object(
        "global",  &T::global,
        "volumes", &T::volumes
    );
};

namespace
{

bool isFraction(double v)
{
    return std::isfinite(v) && v >= 0.0 && v <= 1.0;
}

void requireFraction(double v, const char* key, const std::string& where)
{
    if (!isFraction(v))
        throw std::runtime_error(where + ": " + key + " must be in [0, 1], got " +
                                 std::to_string(v));
}

void requireFraction(const std::optional<double>& v, const char* key, const std::string& where)
{
    if (v)
        requireFraction(*v, key, where);
}

/// Reject values the slice and surface code cannot use.
void validateConfig(const AppConfig& config, const std::string& path)
{
    const GlobalConfig& g = config.global;
    const std::string where = path + " (global)";

    if (!std::isfinite(g.targetSize) || g.targetSize <= 0.0)
        throw std::runtime_error(where + ": target_size must be positive");
    if (g.surfaceStride < 1)
        throw std::runtime_error(where + ": surface_stride must be >= 1");
    requireFraction(g.surfaceThreshold, "surface_threshold", where);
    requireFraction(g.windowLevel, "window_level", where);
    requireFraction(g.windowWidth, "window_width", where);

    for (const VolumeConfig& vc : config.volumes)
    {
        const std::string volWhere = path + " (" + vc.path + ")";
        for (int idx : vc.sliceIndices)
        {
            if (idx < -1)
                throw std::runtime_error(volWhere + ": slice_indices must be >= -1");
        }
        requireFraction(vc.surfaceThreshold, "surface_threshold", volWhere);
        requireFraction(vc.windowLevel, "window_level", volWhere);
        requireFraction(vc.windowWidth, "window_width", volWhere);
    }
}

std::filesystem::path configHome()
{
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && xdg[0] != '\0')
        return xdg;

    const char* home = std::getenv("HOME");
    if (!home || home[0] == '\0')
        throw std::runtime_error("Cannot determine home directory");
    return std::filesystem::path(home) / ".config";
}

} // namespace

std::string globalConfigPath()
{
    return (configHome() / "brainsurf" / "config.json").string();
}

AppConfig loadConfig(const std::string& path)
{
    AppConfig config{};
    if (!std::filesystem::exists(path))
        return config;

    std::ifstream ifs(path);
    if (!ifs)
        throw std::runtime_error("Cannot open config file: " + path);
    std::string json((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());

    // Keys from other tools' configs are skipped, not rejected.
    if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(config, json))
        throw std::runtime_error("Failed to parse config file: " + path + "\n" +
                                 glz::format_error(ec, json));

    validateConfig(config, path);
    return config;
}

void saveConfig(const AppConfig& config, const std::string& path)
{
    validateConfig(config, path);

    std::string json;
    if (glz::write<glz::opts{.prettify = true}>(config, json))
        throw std::runtime_error("Failed to serialize config to JSON");

    std::filesystem::path dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
            throw std::runtime_error("Cannot create config directory: " + dir.string() +
                                     " (" + ec.message() + ")");
    }

    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs)
        throw std::runtime_error("Cannot write config file: " + path);
    ofs << json;
    if (!ofs)
        throw std::runtime_error("Error writing config file: " + path);
}

AppConfig mergeConfigs(const AppConfig& global, const AppConfig& local)
{
    AppConfig merged = global;

    // A local value wins only where it was actually changed from the default.
    const GlobalConfig defaults{};
    auto overlay = [](auto& dst, const auto& src, const auto& def) {
        if (src != def)
            dst = src;
    };
    overlay(merged.global.targetSize, local.global.targetSize, defaults.targetSize);
    overlay(merged.global.surfaceThreshold, local.global.surfaceThreshold,
            defaults.surfaceThreshold);
    overlay(merged.global.surfaceStride, local.global.surfaceStride, defaults.surfaceStride);
    overlay(merged.global.windowLevel, local.global.windowLevel, defaults.windowLevel);
    overlay(merged.global.windowWidth, local.global.windowWidth, defaults.windowWidth);
    overlay(merged.global.outputDir, local.global.outputDir, defaults.outputDir);

    // Volume entries are keyed by path; local entries replace or append.
    for (const VolumeConfig& lv : local.volumes)
    {
        VolumeConfig* existing = nullptr;
        for (VolumeConfig& mv : merged.volumes)
        {
            if (mv.path == lv.path)
            {
                existing = &mv;
                break;
            }
        }
        if (existing)
            *existing = lv;
        else
            merged.volumes.push_back(lv);
    }

    return merged;
}

const VolumeConfig* findVolumeConfig(const AppConfig& config, const std::string& path)
{
    for (const VolumeConfig& vc : config.volumes)
    {
        if (vc.path == path)
            return &vc;
    }
    return nullptr;
}
