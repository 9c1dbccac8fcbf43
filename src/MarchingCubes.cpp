#include "MarchingCubes.h"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "MarchingCubesTables.h"
#include "Volume.h"

void validateSurfaceRequest(const SurfaceRequest& request)
{
    if (!std::isfinite(request.threshold) || request.threshold < 0.0 || request.threshold > 1.0)
        throw std::invalid_argument("Surface threshold must be in [0, 1], got " +
                                    std::to_string(request.threshold));
    if (request.stride < 1)
        throw std::invalid_argument("Surface stride must be >= 1, got " +
                                    std::to_string(request.stride));
}

glm::dvec3 interpolateEdge(const glm::dvec3& p1, const glm::dvec3& p2,
                           double v1, double v2, double threshold)
{
    if (std::abs(threshold - v1) < kInterpolationEpsilon) return p1;
    if (std::abs(threshold - v2) < kInterpolationEpsilon) return p2;
    if (std::abs(v1 - v2) < kInterpolationEpsilon) return p1;

    double t = (threshold - v1) / (v2 - v1);
    return p1 + t * (p2 - p1);
}

SurfaceExtraction::SurfaceExtraction(std::shared_ptr<const Volume> volume,
                                     SurfaceRequest request, CancellationToken token,
                                     double targetSize)
    : volume_(std::move(volume)), request_(request), token_(std::move(token))
{
    if (!volume_)
        throw std::invalid_argument("SurfaceExtraction needs a volume");
    validateSurfaceRequest(request_);

    frame_ = VolumeFrame::forVolume(*volume_, targetSize);

    // Cells start at z = 0, stride, ... while z < dimZ - 1.
    int lastStart = volume_->dimensions.z - 1;
    totalSlabs_ = lastStart > 0 ? (lastStart + request_.stride - 1) / request_.stride : 0;
    finished_ = (totalSlabs_ == 0);
}

double SurfaceExtraction::progress() const
{
    if (totalSlabs_ == 0)
        return 1.0;
    return static_cast<double>(completedSlabs_) / totalSlabs_;
}

bool SurfaceExtraction::step()
{
    if (finished_ || token_.isCancelled())
        return false;

    processSlab(nextZ_);
    nextZ_ += request_.stride;
    ++completedSlabs_;

    if (completedSlabs_ >= totalSlabs_)
        finished_ = true;
    return !finished_;
}

SurfaceMesh SurfaceExtraction::takeMesh()
{
    if (!finished_)
        throw std::logic_error("Surface extraction has not finished");
    return std::move(mesh_);
}

void SurfaceExtraction::processSlab(int z)
{
    const Volume& vol = *volume_;
    const int s = request_.stride;
    const double threshold = request_.threshold;
    const int dimX = vol.dimensions.x;
    const int dimY = vol.dimensions.y;

    double values[8];
    glm::dvec3 corners[8];
    glm::dvec3 edgePoints[12];

    for (int y = 0; y < dimY - 1; y += s)
    {
        for (int x = 0; x < dimX - 1; x += s)
        {
            int cubeIndex = 0;
            for (int i = 0; i < 8; ++i)
            {
                values[i] = vol.normalized(x + kCubeCorners[i][0] * s,
                                           y + kCubeCorners[i][1] * s,
                                           z + kCubeCorners[i][2] * s);
                if (values[i] > threshold)
                    cubeIndex |= (1 << i);
            }

            const int edges = kEdgeTable[cubeIndex];
            if (edges == 0)
                continue;

            for (int i = 0; i < 8; ++i)
            {
                corners[i] = frame_.toWorld(glm::dvec3(x + kCubeCorners[i][0] * s,
                                                       y + kCubeCorners[i][1] * s,
                                                       z + kCubeCorners[i][2] * s));
            }

            bool have[12] = {};
            for (int e = 0; e < 12; ++e)
            {
                if (!(edges & (1 << e)))
                    continue;
                int a = kCubeEdges[e][0];
                int b = kCubeEdges[e][1];
                edgePoints[e] = interpolateEdge(corners[a], corners[b],
                                                values[a], values[b], threshold);
                have[e] = true;
            }

            const int* tri = kTriTable[cubeIndex];
            for (int i = 0; tri[i] != kTriTableEnd; i += 3)
            {
                if (!have[tri[i]] || !have[tri[i + 1]] || !have[tri[i + 2]])
                    continue;
                for (int k = 0; k < 3; ++k)
                {
                    const glm::dvec3& p = edgePoints[tri[i + k]];
                    mesh_.positions.push_back(static_cast<float>(p.x));
                    mesh_.positions.push_back(static_cast<float>(p.y));
                    mesh_.positions.push_back(static_cast<float>(p.z));
                }
            }
        }
    }
}

std::optional<SurfaceMesh> extractSurface(std::shared_ptr<const Volume> volume,
                                          const SurfaceRequest& request,
                                          const ProgressCallback& onProgress,
                                          CancellationToken token)
{
    SurfaceExtraction job(std::move(volume), request, token);

    while (!job.finished())
    {
        if (job.cancelled())
            return std::nullopt;
        job.step();
        if (onProgress)
            onProgress(job.progress());
    }

    if (job.cancelled())
        return std::nullopt;
    return job.takeMesh();
}

std::vector<glm::vec3> computeFaceNormals(const SurfaceMesh& mesh)
{
    std::vector<glm::vec3> normals;
    normals.reserve(mesh.triangleCount());

    for (std::size_t t = 0; t < mesh.triangleCount(); ++t)
    {
        glm::vec3 a = mesh.vertex(t * 3);
        glm::vec3 b = mesh.vertex(t * 3 + 1);
        glm::vec3 c = mesh.vertex(t * 3 + 2);
        glm::vec3 n = glm::cross(b - a, c - a);
        float len = glm::length(n);
        normals.push_back(len > 1e-12f ? n / len : glm::vec3(0.0f));
    }
    return normals;
}
