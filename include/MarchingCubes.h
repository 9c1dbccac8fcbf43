#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include <glm/glm.hpp>

#include "CancellationToken.h"
#include "CoordinateMapper.h"

class Volume;

/// Default sampling stride: every other voxel along each axis.
constexpr int kDefaultSurfaceStride = 2;

/// Default isosurface threshold (normalised intensity).
constexpr double kDefaultSurfaceThreshold = 0.3;

/// Corner values closer than this to the threshold (or to each other)
/// short-circuit edge interpolation.
constexpr double kInterpolationEpsilon = 1e-5;

/// Parameters of one extraction pass.  Immutable once a job starts.
struct SurfaceRequest
{
    double threshold = kDefaultSurfaceThreshold;  ///< In [0, 1].
    int stride = kDefaultSurfaceStride;           ///< >= 1.
};

/// Triangle soup: 3 vertices x 3 floats per triangle.
struct SurfaceMesh
{
    std::vector<float> positions;

    std::size_t triangleCount() const { return positions.size() / 9; }
    std::size_t vertexCount() const { return positions.size() / 3; }
    bool empty() const { return positions.empty(); }

    glm::vec3 vertex(std::size_t i) const
    {
        return glm::vec3(positions[i * 3], positions[i * 3 + 1], positions[i * 3 + 2]);
    }
};

/// Progress callback: fraction complete in [0, 1].
using ProgressCallback = std::function<void(double)>;

/// @throws std::invalid_argument for a non-finite or out-of-range
///         threshold, or a stride below 1.
void validateSurfaceRequest(const SurfaceRequest& request);

/// Point where the isosurface crosses the edge p1-p2.  Returns p1 when the
/// threshold matches v1 or the edge is flat, p2 when it matches v2.
glm::dvec3 interpolateEdge(const glm::dvec3& p1, const glm::dvec3& p2,
                           double v1, double v2, double threshold);

/// One incremental marching-cubes pass.  Each step() handles one z-slab
/// of cells; the caller decides when to run the next one.
class SurfaceExtraction {
public:
    SurfaceExtraction(std::shared_ptr<const Volume> volume, SurfaceRequest request,
                      CancellationToken token = {},
                      double targetSize = kDefaultTargetSize);

    /// Process the next slab.  Returns true while more work remains;
    /// false once finished or cancelled.
    bool step();

    bool finished() const { return finished_; }
    bool cancelled() const { return token_.isCancelled(); }

    /// completedSlabs / totalSlabs (1 for an empty grid).
    double progress() const;
    int totalSlabs() const { return totalSlabs_; }
    int completedSlabs() const { return completedSlabs_; }

    const SurfaceRequest& request() const { return request_; }
    const CancellationToken& token() const { return token_; }

    /// Hand over the finished mesh.
    /// @throws std::logic_error if the pass has not finished.
    SurfaceMesh takeMesh();

private:
    void processSlab(int z);

    std::shared_ptr<const Volume> volume_;
    SurfaceRequest request_;
    CancellationToken token_;
    VolumeFrame frame_;

    int nextZ_ = 0;
    int totalSlabs_ = 0;
    int completedSlabs_ = 0;
    bool finished_ = false;

    SurfaceMesh mesh_;
};

/// Run a whole pass, reporting progress after every slab.
/// Returns std::nullopt if the token is cancelled before completion.
std::optional<SurfaceMesh> extractSurface(std::shared_ptr<const Volume> volume,
                                          const SurfaceRequest& request,
                                          const ProgressCallback& onProgress = {},
                                          CancellationToken token = {});

/// One unit normal per triangle (zero for degenerate triangles), computed
/// from the winding order.
std::vector<glm::vec3> computeFaceNormals(const SurfaceMesh& mesh);
