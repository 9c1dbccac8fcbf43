#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <optional>

#include "MarchingCubes.h"

class Volume;

/// Cooperative driver for isosurface extraction on the host's own loop.
///
/// Usage:
///   1. Construct with the loaded volume.
///   2. Call request() whenever the threshold or stride changes.  Any
///      in-flight job for a different request is cancelled (last request
///      wins); repeating the in-flight request reuses it.
///   3. Call poll() once per frame / event-loop tick.  Each call runs one
///      slab, reports progress, and returns so input and repaint can
///      interleave.
///
/// The future returned by request() resolves with the mesh when the job
/// completes, or with std::nullopt if it was superseded or cancelled.
/// Not thread-safe: all calls are expected from the host's main thread.
/// A progress callback may itself call request() or cancel().
class SurfaceScheduler {
public:
    using Result = std::optional<SurfaceMesh>;

    explicit SurfaceScheduler(std::shared_ptr<const Volume> volume,
                              double targetSize = kDefaultTargetSize);
    ~SurfaceScheduler();

    SurfaceScheduler(const SurfaceScheduler&) = delete;
    SurfaceScheduler& operator=(const SurfaceScheduler&) = delete;

    /// Start (or reuse) an extraction for this request.
    /// @throws std::invalid_argument for an invalid request.
    std::shared_future<Result> request(const SurfaceRequest& req,
                                       ProgressCallback onProgress = {});

    /// Advance the current job by one slab.  Returns true while a job is
    /// still running afterwards.
    bool poll();

    /// Run poll() until idle.
    void runUntilIdle();

    /// Cancel the current job, if any.
    void cancel();

    /// Swap in a new volume; cancels the current job.
    void setVolume(std::shared_ptr<const Volume> volume);

    bool busy() const { return job_ != nullptr; }
    std::optional<SurfaceRequest> currentRequest() const;
    double progress() const;

private:
    struct Job {
        std::unique_ptr<SurfaceExtraction> extraction;
        std::promise<Result> promise;
        std::shared_future<Result> future;
        ProgressCallback onProgress;
    };

    void finishJob(Result result);

    std::shared_ptr<const Volume> volume_;
    double targetSize_;
    std::unique_ptr<Job> job_;
    std::uint64_t generation_ = 0;  // Bumped whenever job_ starts or finishes
};
