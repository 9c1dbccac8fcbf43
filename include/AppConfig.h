#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

/// Per-volume settings that get persisted.
struct VolumeConfig
{
    std::string path;                                // Volume file path
    std::array<int, 3> sliceIndices = {-1, -1, -1};  // axial, coronal, sagittal; -1 = middle
    std::optional<double> surfaceThreshold;          // nullopt = global default
    std::optional<double> windowLevel;               // nullopt = global default
    std::optional<double> windowWidth;               // nullopt = global default
};

/// Global application defaults.
struct GlobalConfig
{
    double targetSize = 4.0;          // World size of the largest volume axis
    double surfaceThreshold = 0.3;    // Normalised isosurface threshold
    int surfaceStride = 2;            // Marching-cubes sampling stride
    double windowLevel = 0.5;         // Slice window centre, fraction of range
    double windowWidth = 1.0;         // Slice window width, fraction of range
    std::string outputDir = ".";      // Where slices and meshes are written
};

/// Top-level config structure.
struct AppConfig
{
    GlobalConfig global;
    std::vector<VolumeConfig> volumes;
};

/// Return the global config file path:
/// $XDG_CONFIG_HOME/brainsurf/config.json, else $HOME/.config/brainsurf/config.json
std::string globalConfigPath();

/// Load a config from a JSON file.  Returns a default AppConfig if the file
/// does not exist.  Throws std::runtime_error on parse errors and on values
/// outside their valid range (stride < 1, fractions outside [0, 1],
/// non-positive target size, slice index < -1).
AppConfig loadConfig(const std::string& path);

/// Save a config to a JSON file.  Creates parent directories as needed.
/// Throws std::runtime_error on I/O errors or invalid values.
void saveConfig(const AppConfig& config, const std::string& path);

/// Merge a local config on top of a global config.
/// Local values override global values where they differ from defaults.
/// Local volume entries override global volume entries matched by path;
/// unmatched local volumes are appended.
AppConfig mergeConfigs(const AppConfig& global, const AppConfig& local);

/// Find the entry for a volume path, or nullptr.
const VolumeConfig* findVolumeConfig(const AppConfig& config, const std::string& path);
