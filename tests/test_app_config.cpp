// test_app_config.cpp - Tests for AppConfig JSON serialization and file I/O.
//
// Verifies loadConfig(), saveConfig(), mergeConfigs() and
// findVolumeConfig() for VolumeConfig, GlobalConfig and AppConfig.

#include "AppConfig.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

static int failures = 0;

static void check(bool cond, const char* msg, int line)
{
    if (!cond)
    {
        std::cerr << "FAIL (line " << line << "): " << msg << "\n";
        ++failures;
    }
}

#define CHECK(cond, msg) check((cond), (msg), __LINE__)

static bool approxEq(double a, double b, double tol = 1e-9)
{
    return std::fabs(a - b) < tol;
}

/// RAII helper to create a temp file and remove it on destruction.
struct TmpFile
{
    std::string path;

    TmpFile(const std::string& name)
        : path((std::filesystem::temp_directory_path() / name).string())
    {}

    TmpFile(const std::string& name, const std::string& content)
        : path((std::filesystem::temp_directory_path() / name).string())
    {
        std::ofstream ofs(path, std::ios::trunc);
        ofs << content;
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

// ---------------------------------------------------------------------------
// Test 1: Missing file returns default AppConfig
// ---------------------------------------------------------------------------
static void testMissingFileReturnsDefault()
{
    std::cout << "  testMissingFileReturnsDefault...";

    AppConfig cfg = loadConfig("/nonexistent/path/config_that_does_not_exist.json");

    CHECK(cfg.volumes.empty(), "default config should have no volumes");
    CHECK(approxEq(cfg.global.targetSize, 4.0), "default targetSize should be 4");
    CHECK(approxEq(cfg.global.surfaceThreshold, 0.3), "default surfaceThreshold should be 0.3");
    CHECK(cfg.global.surfaceStride == 2, "default surfaceStride should be 2");
    CHECK(approxEq(cfg.global.windowLevel, 0.5), "default windowLevel should be 0.5");
    CHECK(approxEq(cfg.global.windowWidth, 1.0), "default windowWidth should be 1");
    CHECK(cfg.global.outputDir == ".", "default outputDir should be '.'");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 2: Full round-trip with all fields populated
// ---------------------------------------------------------------------------
static void testSaveAndReloadRoundTrip()
{
    std::cout << "  testSaveAndReloadRoundTrip...";
    TmpFile tmp("test_brainsurf_config_rt.json");

    AppConfig original;
    original.global.targetSize = 2.5;
    original.global.surfaceThreshold = 0.45;
    original.global.surfaceStride = 3;
    original.global.windowLevel = 0.4;
    original.global.windowWidth = 0.6;
    original.global.outputDir = "/tmp/brainsurf_out";

    VolumeConfig v1;
    v1.path = "/data/t1.nii.gz";
    v1.sliceIndices = {50, 100, 75};
    v1.surfaceThreshold = 0.25;
    v1.windowLevel = 0.3;
    v1.windowWidth = 0.7;

    VolumeConfig v2;
    v2.path = "/data/t2.nii";
    v2.sliceIndices = {10, 20, 30};

    original.volumes = {v1, v2};

    saveConfig(original, tmp.path);
    AppConfig loaded = loadConfig(tmp.path);

    CHECK(approxEq(loaded.global.targetSize, 2.5), "global.targetSize");
    CHECK(approxEq(loaded.global.surfaceThreshold, 0.45), "global.surfaceThreshold");
    CHECK(loaded.global.surfaceStride == 3, "global.surfaceStride");
    CHECK(approxEq(loaded.global.windowLevel, 0.4), "global.windowLevel");
    CHECK(approxEq(loaded.global.windowWidth, 0.6), "global.windowWidth");
    CHECK(loaded.global.outputDir == "/tmp/brainsurf_out", "global.outputDir");

    CHECK(loaded.volumes.size() == 2, "should have 2 volumes");

    const auto& lv1 = loaded.volumes[0];
    CHECK(lv1.path == "/data/t1.nii.gz", "vol1.path");
    CHECK(lv1.sliceIndices[0] == 50 && lv1.sliceIndices[1] == 100 && lv1.sliceIndices[2] == 75,
          "vol1.sliceIndices");
    CHECK(lv1.surfaceThreshold.has_value() && approxEq(*lv1.surfaceThreshold, 0.25),
          "vol1.surfaceThreshold");
    CHECK(lv1.windowLevel.has_value() && approxEq(*lv1.windowLevel, 0.3), "vol1.windowLevel");
    CHECK(lv1.windowWidth.has_value() && approxEq(*lv1.windowWidth, 0.7), "vol1.windowWidth");

    const auto& lv2 = loaded.volumes[1];
    CHECK(lv2.path == "/data/t2.nii", "vol2.path");
    CHECK(lv2.sliceIndices[0] == 10 && lv2.sliceIndices[1] == 20 && lv2.sliceIndices[2] == 30,
          "vol2.sliceIndices");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 3: Optional fields omitted survive round-trip as nullopt
// ---------------------------------------------------------------------------
static void testOptionalFieldsOmitted()
{
    std::cout << "  testOptionalFieldsOmitted...";
    TmpFile tmp("test_brainsurf_config_opt.json");

    AppConfig original;
    VolumeConfig v;
    v.path = "/data/test.nii";
    original.volumes = {v};

    saveConfig(original, tmp.path);
    AppConfig loaded = loadConfig(tmp.path);

    CHECK(loaded.volumes.size() == 1, "should have 1 volume");
    const auto& lv = loaded.volumes[0];
    CHECK(!lv.surfaceThreshold.has_value(), "surfaceThreshold should remain nullopt");
    CHECK(!lv.windowLevel.has_value(), "windowLevel should remain nullopt");
    CHECK(!lv.windowWidth.has_value(), "windowWidth should remain nullopt");
    CHECK(lv.sliceIndices[0] == -1 && lv.sliceIndices[1] == -1 && lv.sliceIndices[2] == -1,
          "default sliceIndices should be {-1,-1,-1}");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 4: Unknown keys are ignored and partial files keep defaults
// ---------------------------------------------------------------------------
static void testUnknownKeysIgnored()
{
    std::cout << "  testUnknownKeysIgnored...";

    TmpFile tmp("test_brainsurf_config_unknown.json",
                R"({"global": {"surface_stride": 4, "colour_map": "HotMetal"},
                    "volumes": [{"path": "/data/a.nii", "zoom": [1, 2, 3]}],
                    "qc_columns": {}})");

    AppConfig cfg = loadConfig(tmp.path);

    CHECK(cfg.global.surfaceStride == 4, "known key should be read");
    CHECK(approxEq(cfg.global.surfaceThreshold, 0.3), "absent key should keep default");
    CHECK(cfg.volumes.size() == 1 && cfg.volumes[0].path == "/data/a.nii",
          "volume entry should be read");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 5: Malformed JSON throws
// ---------------------------------------------------------------------------
static void testMalformedJsonThrows()
{
    std::cout << "  testMalformedJsonThrows...";

    TmpFile tmp("test_brainsurf_config_bad.json", "{ this is not valid json !!!");

    bool caught = false;
    try
    {
        loadConfig(tmp.path);
    }
    catch (const std::runtime_error&)
    {
        caught = true;
    }
    CHECK(caught, "loadConfig should throw std::runtime_error on malformed JSON");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 6: Invalid structure throws
// ---------------------------------------------------------------------------
static void testInvalidStructureThrows()
{
    std::cout << "  testInvalidStructureThrows...";

    TmpFile tmp("test_brainsurf_config_badstruct.json",
                R"({"global": 42, "volumes": "not_an_array"})");

    bool caught = false;
    try
    {
        loadConfig(tmp.path);
    }
    catch (const std::runtime_error&)
    {
        caught = true;
    }
    CHECK(caught, "loadConfig should throw std::runtime_error on invalid structure");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 7: saveConfig creates parent directories
// ---------------------------------------------------------------------------
static void testSaveCreatesParentDir()
{
    std::cout << "  testSaveCreatesParentDir...";

    auto root = std::filesystem::temp_directory_path() / "test_brainsurf_cfg_sub";
    std::string nested = (root / "deep" / "config.json").string();

    std::filesystem::remove_all(root);

    AppConfig cfg;
    cfg.global.outputDir = "slices";

    saveConfig(cfg, nested);
    CHECK(std::filesystem::exists(nested), "config file should exist in nested dir");

    AppConfig loaded = loadConfig(nested);
    CHECK(loaded.global.outputDir == "slices", "nested config should round-trip");

    std::filesystem::remove_all(root);

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 8: Local config overrides global settings and volumes
// ---------------------------------------------------------------------------
static void testMergeConfigs()
{
    std::cout << "  testMergeConfigs...";

    AppConfig global;
    global.global.surfaceThreshold = 0.4;
    global.global.outputDir = "/global/out";
    VolumeConfig g1;
    g1.path = "/data/shared.nii";
    g1.sliceIndices = {1, 2, 3};
    VolumeConfig g2;
    g2.path = "/data/global_only.nii";
    global.volumes = {g1, g2};

    AppConfig local;
    local.global.surfaceStride = 1;
    VolumeConfig l1;
    l1.path = "/data/shared.nii";
    l1.sliceIndices = {7, 8, 9};
    VolumeConfig l2;
    l2.path = "/data/local_only.nii";
    local.volumes = {l1, l2};

    AppConfig merged = mergeConfigs(global, local);

    CHECK(approxEq(merged.global.surfaceThreshold, 0.4),
          "global value should survive when local keeps the default");
    CHECK(merged.global.outputDir == "/global/out", "global outputDir should survive");
    CHECK(merged.global.surfaceStride == 1, "local non-default stride should win");

    CHECK(merged.volumes.size() == 3, "should have 3 merged volumes");

    const VolumeConfig* shared = findVolumeConfig(merged, "/data/shared.nii");
    CHECK(shared != nullptr, "shared volume should be present");
    CHECK(shared && shared->sliceIndices[0] == 7, "local volume entry should override global");
    CHECK(findVolumeConfig(merged, "/data/global_only.nii") != nullptr,
          "global-only volume should be kept");
    CHECK(findVolumeConfig(merged, "/data/local_only.nii") != nullptr,
          "local-only volume should be appended");
    CHECK(findVolumeConfig(merged, "/data/missing.nii") == nullptr,
          "unknown path should give nullptr");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 9: Global config path honours XDG_CONFIG_HOME
// ---------------------------------------------------------------------------
static void testGlobalConfigPath()
{
    std::cout << "  testGlobalConfigPath...";

    setenv("XDG_CONFIG_HOME", "/tmp/xdg_test_home", 1);
    std::string path = globalConfigPath();
    CHECK(path == "/tmp/xdg_test_home/brainsurf/config.json",
          "path should live under XDG_CONFIG_HOME/brainsurf");
    unsetenv("XDG_CONFIG_HOME");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 10: Out-of-range values are rejected on load and save
// ---------------------------------------------------------------------------
static bool loadThrows(const char* name, const std::string& json)
{
    TmpFile tmp(name, json);
    try
    {
        loadConfig(tmp.path);
    }
    catch (const std::runtime_error&)
    {
        return true;
    }
    return false;
}

static void testValidationRejectsBadValues()
{
    std::cout << "  testValidationRejectsBadValues...";

    CHECK(loadThrows("test_brainsurf_cfg_stride.json", R"({"global": {"surface_stride": 0}})"),
          "stride 0 should be rejected");
    CHECK(loadThrows("test_brainsurf_cfg_thr.json", R"({"global": {"surface_threshold": 1.5}})"),
          "threshold above 1 should be rejected");
    CHECK(loadThrows("test_brainsurf_cfg_size.json", R"({"global": {"target_size": -2}})"),
          "negative target size should be rejected");
    CHECK(loadThrows("test_brainsurf_cfg_win.json",
                     R"({"volumes": [{"path": "/a.nii", "window_width": -0.1}]})"),
          "negative per-volume window width should be rejected");
    CHECK(loadThrows("test_brainsurf_cfg_slice.json",
                     R"({"volumes": [{"path": "/a.nii", "slice_indices": [0, -2, 0]}]})"),
          "slice index below -1 should be rejected");
    CHECK(!loadThrows("test_brainsurf_cfg_edges.json",
                      R"({"global": {"surface_threshold": 0, "window_width": 1, "surface_stride": 1}})"),
          "boundary values should load");

    TmpFile tmp("test_brainsurf_cfg_badsave.json");
    AppConfig bad;
    bad.global.windowLevel = 2.0;
    bool caught = false;
    try
    {
        saveConfig(bad, tmp.path);
    }
    catch (const std::runtime_error&)
    {
        caught = true;
    }
    CHECK(caught, "saveConfig should refuse invalid values");
    CHECK(!std::filesystem::exists(tmp.path), "nothing is written for an invalid config");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main()
{
    std::cout << "=== AppConfig Tests ===\n";

    testMissingFileReturnsDefault();
    testSaveAndReloadRoundTrip();
    testOptionalFieldsOmitted();
    testUnknownKeysIgnored();
    testMalformedJsonThrows();
    testInvalidStructureThrows();
    testSaveCreatesParentDir();
    testMergeConfigs();
    testGlobalConfigPath();
    testValidationRejectsBadValues();

    std::cout << "\n";
    if (failures == 0)
    {
        std::cout << "All AppConfig tests PASSED.\n";
        return 0;
    }
    else
    {
        std::cout << failures << " AppConfig test(s) FAILED.\n";
        return 1;
    }
}
