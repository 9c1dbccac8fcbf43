#pragma once

#include <glm/glm.hpp>

class Volume;

/// Size (in world units) of the largest physical axis after scaling.
constexpr double kDefaultTargetSize = 4.0;

/// Map one voxel-index coordinate to the centred world frame:
///   ((index / dim) - 0.5) * dim * voxelSize * scale
/// Index 0 lands at -extent/2 and index dim at +extent/2, independent of
/// any sampling stride.
double worldCoordinate(double index, int dim, double voxelSize, double scale);

/// Uniform scale so the largest physical dimension maps to targetSize.
double globalScale(const glm::dvec3& physicalSize, double targetSize = kDefaultTargetSize);
double globalScale(const Volume& vol, double targetSize = kDefaultTargetSize);

/// The coordinate frame shared by slice placement and isosurface vertices.
struct VolumeFrame
{
    glm::ivec3 dims{1, 1, 1};
    glm::dvec3 voxelSize{1.0, 1.0, 1.0};
    double scale = 1.0;

    static VolumeFrame forVolume(const Volume& vol, double targetSize = kDefaultTargetSize);

    /// World position of a (possibly fractional) voxel index triple.
    glm::dvec3 toWorld(const glm::dvec3& voxel) const;

    /// World-space size of the whole volume along each axis.
    glm::dvec3 worldExtent() const;
};
