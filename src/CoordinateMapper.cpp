#include "CoordinateMapper.h"

#include <algorithm>

#include "Volume.h"

double worldCoordinate(double index, int dim, double voxelSize, double scale)
{
    if (dim <= 0)
        return 0.0;
    return ((index / dim) - 0.5) * dim * voxelSize * scale;
}

double globalScale(const glm::dvec3& physicalSize, double targetSize)
{
    double maxDim = std::max({ physicalSize.x, physicalSize.y, physicalSize.z });
    if (maxDim < 1e-12)
        return 1.0;
    return targetSize / maxDim;
}

double globalScale(const Volume& vol, double targetSize)
{
    return globalScale(vol.physicalSize(), targetSize);
}

VolumeFrame VolumeFrame::forVolume(const Volume& vol, double targetSize)
{
    VolumeFrame frame;
    frame.dims = vol.dimensions;
    frame.voxelSize = vol.voxelSize;
    frame.scale = globalScale(vol, targetSize);
    return frame;
}

glm::dvec3 VolumeFrame::toWorld(const glm::dvec3& voxel) const
{
    return glm::dvec3(worldCoordinate(voxel.x, dims.x, voxelSize.x, scale),
                      worldCoordinate(voxel.y, dims.y, voxelSize.y, scale),
                      worldCoordinate(voxel.z, dims.z, voxelSize.z, scale));
}

glm::dvec3 VolumeFrame::worldExtent() const
{
    return glm::dvec3(dims) * voxelSize * scale;
}
