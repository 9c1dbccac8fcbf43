#include "SurfaceScheduler.h"

#include <stdexcept>
#include <utility>

#include "Volume.h"

SurfaceScheduler::SurfaceScheduler(std::shared_ptr<const Volume> volume, double targetSize)
    : volume_(std::move(volume)), targetSize_(targetSize)
{
    if (!volume_)
        throw std::invalid_argument("SurfaceScheduler needs a volume");
}

SurfaceScheduler::~SurfaceScheduler()
{
    cancel();
}

std::shared_future<SurfaceScheduler::Result>
SurfaceScheduler::request(const SurfaceRequest& req, ProgressCallback onProgress)
{
    validateSurfaceRequest(req);

    if (job_)
    {
        const SurfaceRequest& running = job_->extraction->request();
        if (running.threshold == req.threshold && running.stride == req.stride)
        {
            job_->onProgress = std::move(onProgress);
            return job_->future;
        }
        cancel();
    }

    auto job = std::make_unique<Job>();
    job->extraction = std::make_unique<SurfaceExtraction>(volume_, req, CancellationToken{},
                                                          targetSize_);
    job->future = job->promise.get_future().share();
    job->onProgress = std::move(onProgress);
    job_ = std::move(job);
    ++generation_;

    // A grid with no cells finishes without any polling.
    if (job_->extraction->finished())
    {
        auto future = job_->future;
        finishJob(job_->extraction->takeMesh());
        return future;
    }
    return job_->future;
}

bool SurfaceScheduler::poll()
{
    if (!job_)
        return false;

    SurfaceExtraction& extraction = *job_->extraction;
    if (extraction.cancelled())
    {
        finishJob(std::nullopt);
        return false;
    }

    extraction.step();
    const double fraction = extraction.progress();
    const bool done = extraction.finished();

    // The callback may call request() or cancel(), which retires this job and
    // everything it owns, the callback included.
    if (ProgressCallback onProgress = job_->onProgress)
    {
        const std::uint64_t generation = generation_;
        onProgress(fraction);
        if (generation != generation_)
            return job_ != nullptr;
    }

    if (done)
    {
        finishJob(job_->extraction->takeMesh());
        return false;
    }
    return true;
}

void SurfaceScheduler::runUntilIdle()
{
    while (poll())
    {
    }
}

void SurfaceScheduler::cancel()
{
    if (!job_)
        return;
    job_->extraction->token().cancel();
    finishJob(std::nullopt);
}

void SurfaceScheduler::setVolume(std::shared_ptr<const Volume> volume)
{
    if (!volume)
        throw std::invalid_argument("SurfaceScheduler needs a volume");
    cancel();
    volume_ = std::move(volume);
}

std::optional<SurfaceRequest> SurfaceScheduler::currentRequest() const
{
    if (!job_)
        return std::nullopt;
    return job_->extraction->request();
}

double SurfaceScheduler::progress() const
{
    if (!job_)
        return 0.0;
    return job_->extraction->progress();
}

void SurfaceScheduler::finishJob(Result result)
{
    std::unique_ptr<Job> job = std::move(job_);
    ++generation_;
    job->promise.set_value(std::move(result));
}
