#pragma once

#include <atomic>
#include <memory>

/// Shared cancel flag.  Copies refer to the same flag, so the owner of a
/// job can cancel it while the job polls its own copy between slabs.
class CancellationToken {
public:
    CancellationToken()
        : flag_(std::make_shared<std::atomic<bool>>(false))
    {}

    void cancel() const { flag_->store(true, std::memory_order_relaxed); }

    bool isCancelled() const { return flag_->load(std::memory_order_relaxed); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};
