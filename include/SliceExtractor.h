#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

#include "CoordinateMapper.h"

class Volume;

/// The three orthogonal cuts through a volume.
enum class SlicePlane
{
    Axial,     ///< XY plane at fixed Z.
    Coronal,   ///< XZ plane at fixed Y.
    Sagittal,  ///< YZ plane at fixed X.
};

constexpr int kSlicePlaneCount = 3;

/// Intensity window; both values are fractions of the full range.
struct WindowSettings
{
    double level = 0.5;
    double width = 1.0;
};

struct SliceRequest
{
    SlicePlane plane = SlicePlane::Axial;
    int index = 0;
    WindowSettings window;
};

/// An RGBA8 raster, row-major, 4 bytes per pixel.
struct SliceImage
{
    int width = 0;
    int height = 0;
    std::vector<uint8_t> rgba;

    uint8_t gray(int x, int y) const { return rgba[(static_cast<std::size_t>(y) * width + x) * 4]; }
};

/// World-space placement of a slice quad.
struct SliceGeometry
{
    glm::dvec3 center{0.0};
    double width = 0.0;   ///< Extent along the raster's horizontal axis.
    double height = 0.0;  ///< Extent along the raster's vertical axis.
};

std::string_view slicePlaneName(SlicePlane plane);
std::optional<SlicePlane> slicePlaneFromName(std::string_view name);

/// Number of slices along the plane's normal axis.
int sliceCount(const Volume& vol, SlicePlane plane);

/// Clamp an index into [0, sliceCount - 1].
int clampSliceIndex(const Volume& vol, SlicePlane plane, int index);

/// Middle slice along the plane's normal axis.
int defaultSliceIndex(const Volume& vol, SlicePlane plane);

/// Apply the intensity window to one 8-bit gray value.
uint8_t applyWindow(uint8_t value, const WindowSettings& window);

/// Sample one slice.  The index must already be in range (see
/// clampSliceIndex).  Coronal and sagittal rows are flipped so that
/// superior is up; axial rows keep scan order.
SliceImage extractSlice(const Volume& vol, const SliceRequest& request);

/// Where the slice quad sits in the shared world frame.
SliceGeometry slicePlaneGeometry(const VolumeFrame& frame, SlicePlane plane, int index);
