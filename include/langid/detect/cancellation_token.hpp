#pragma once

#include <atomic>
#include <memory>

namespace langid {

/**
 * Shared cancellation flag handed to guarded operations.
 *
 * Copies observe the same flag. Long-running operations poll
 * is_cancelled() and return early once the caller has given up on them.
 */
class CancellationToken {
public:
    CancellationToken()
        : flag_(std::make_shared<std::atomic<bool>>(false))
    {}

    void cancel() const { flag_->store(true, std::memory_order_release); }

    bool is_cancelled() const { return flag_->load(std::memory_order_acquire); }

    bool operator==(const CancellationToken& other) const { return flag_ == other.flag_; }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace langid
