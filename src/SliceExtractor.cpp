#include "SliceExtractor.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "Volume.h"

std::string_view slicePlaneName(SlicePlane plane)
{
    switch (plane)
    {
    case SlicePlane::Axial:    return "axial";
    case SlicePlane::Coronal:  return "coronal";
    case SlicePlane::Sagittal: return "sagittal";
    }
    return "axial";
}

std::optional<SlicePlane> slicePlaneFromName(std::string_view name)
{
    if (name == "axial")    return SlicePlane::Axial;
    if (name == "coronal")  return SlicePlane::Coronal;
    if (name == "sagittal") return SlicePlane::Sagittal;
    return std::nullopt;
}

int sliceCount(const Volume& vol, SlicePlane plane)
{
    switch (plane)
    {
    case SlicePlane::Axial:    return vol.dimensions.z;
    case SlicePlane::Coronal:  return vol.dimensions.y;
    case SlicePlane::Sagittal: return vol.dimensions.x;
    }
    return 0;
}

int clampSliceIndex(const Volume& vol, SlicePlane plane, int index)
{
    int count = sliceCount(vol, plane);
    if (count <= 0)
        return 0;
    return std::clamp(index, 0, count - 1);
}

int defaultSliceIndex(const Volume& vol, SlicePlane plane)
{
    return sliceCount(vol, plane) / 2;
}

uint8_t applyWindow(uint8_t value, const WindowSettings& window)
{
    double center = window.level * 255.0;
    double width = window.width * 255.0;
    if (width < 1e-6)
        width = 1e-6;
    double lo = center - width / 2.0;

    double v = (static_cast<double>(value) - lo) * 255.0 / width;
    v = std::clamp(v, 0.0, 255.0);
    // Halves go to the even neighbour, like a clamped 8-bit canvas buffer.
    return static_cast<uint8_t>(std::nearbyint(v));
}

SliceImage extractSlice(const Volume& vol, const SliceRequest& request)
{
    if (vol.empty())
        throw std::invalid_argument("Cannot extract a slice from an empty volume");

    const int dimX = vol.dimensions.x;
    const int dimY = vol.dimensions.y;
    const int dimZ = vol.dimensions.z;

    // Precompute the windowed value for each 8-bit gray level.
    uint8_t lut[256];
    for (int g = 0; g < 256; ++g)
        lut[g] = applyWindow(static_cast<uint8_t>(g), request.window);

    auto toGray = [&](int x, int y, int z) -> uint8_t {
        float n = vol.normalized(x, y, z);
        int g = static_cast<int>(std::floor(n * 255.0f));
        return lut[std::clamp(g, 0, 255)];
    };

    SliceImage img;
    auto put = [&img](int col, int row, uint8_t v) {
        std::size_t off = (static_cast<std::size_t>(row) * img.width + col) * 4;
        img.rgba[off + 0] = v;
        img.rgba[off + 1] = v;
        img.rgba[off + 2] = v;
        img.rgba[off + 3] = 255;
    };

    const int index = request.index;

    switch (request.plane)
    {
    case SlicePlane::Axial:
        img.width = dimX;
        img.height = dimY;
        img.rgba.resize(static_cast<std::size_t>(img.width) * img.height * 4);
        for (int y = 0; y < img.height; ++y)
            for (int x = 0; x < img.width; ++x)
                put(x, y, toGray(x, y, index));
        break;

    case SlicePlane::Coronal:
        img.width = dimX;
        img.height = dimZ;
        img.rgba.resize(static_cast<std::size_t>(img.width) * img.height * 4);
        for (int z = 0; z < img.height; ++z)
        {
            int row = img.height - 1 - z;
            for (int x = 0; x < img.width; ++x)
                put(x, row, toGray(x, index, z));
        }
        break;

    case SlicePlane::Sagittal:
        img.width = dimY;
        img.height = dimZ;
        img.rgba.resize(static_cast<std::size_t>(img.width) * img.height * 4);
        for (int z = 0; z < img.height; ++z)
        {
            int row = img.height - 1 - z;
            for (int y = 0; y < img.width; ++y)
                put(y, row, toGray(index, y, z));
        }
        break;
    }

    return img;
}

SliceGeometry slicePlaneGeometry(const VolumeFrame& frame, SlicePlane plane, int index)
{
    glm::dvec3 extent = frame.worldExtent();
    SliceGeometry geom;

    switch (plane)
    {
    case SlicePlane::Axial:
        geom.center = glm::dvec3(0.0, 0.0, worldCoordinate(index, frame.dims.z,
                                                           frame.voxelSize.z, frame.scale));
        geom.width = extent.x;
        geom.height = extent.y;
        break;
    case SlicePlane::Coronal:
        geom.center = glm::dvec3(0.0, worldCoordinate(index, frame.dims.y,
                                                      frame.voxelSize.y, frame.scale), 0.0);
        geom.width = extent.x;
        geom.height = extent.z;
        break;
    case SlicePlane::Sagittal:
        geom.center = glm::dvec3(worldCoordinate(index, frame.dims.x,
                                                 frame.voxelSize.x, frame.scale), 0.0, 0.0);
        geom.width = extent.y;
        geom.height = extent.z;
        break;
    }

    return geom;
}
