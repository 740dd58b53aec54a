#pragma once

#include <langid/detect/cancellation_token.hpp>
#include <langid/result.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>

namespace langid {

/**
 * TimeoutGuard - Runs an operation with a wall-clock upper bound.
 *
 * Each call gets its own worker thread and CancellationToken, so one slow
 * call never delays or cancels another. On breach the caller receives
 * ErrorCode::TIMEOUT immediately and the worker's token is cancelled; the
 * worker finishes in the background and releases its state on its own.
 *
 * The destructor cancels every outstanding worker and waits for them, so no
 * operation outlives the guard (and whatever the operation references, as
 * long as that is destroyed after the guard).
 *
 * Usage:
 *   TimeoutGuard guard;
 *   auto result = guard.run<int>(
 *       [](const CancellationToken& token) { return compute(token); },
 *       std::chrono::milliseconds(10));
 *   if (result.error_code() == ErrorCode::TIMEOUT) { ... }
 */
class TimeoutGuard {
public:
    TimeoutGuard();
    ~TimeoutGuard();

    TimeoutGuard(const TimeoutGuard&) = delete;
    TimeoutGuard& operator=(const TimeoutGuard&) = delete;

    /**
     * Run operation, waiting at most limit for its result.
     *
     * @param operation Work to run; receives the call's cancellation token
     * @param limit Upper bound on the wait
     * @return The operation's value, TIMEOUT on breach, or INTERNAL_ERROR if
     *         the operation threw or no worker could be started
     */
    template<typename T>
    Result<T> run(std::function<T(const CancellationToken&)> operation,
                  std::chrono::milliseconds limit);

    // Workers that have not finished yet (including abandoned ones)
    size_t in_flight() const;

    // Number of calls that ended in TIMEOUT
    uint64_t timeout_count() const { return timeouts_.load(); }

private:
    struct Tracker {
        std::mutex mutex;
        std::condition_variable idle;
        std::unordered_map<uint64_t, CancellationToken> active;
        uint64_t next_id = 0;
    };

    uint64_t register_worker(const CancellationToken& token);
    static void release_worker(const std::shared_ptr<Tracker>& tracker, uint64_t id);

    std::shared_ptr<Tracker> tracker_;
    std::atomic<uint64_t> timeouts_{0};
};

template<typename T>
Result<T> TimeoutGuard::run(std::function<T(const CancellationToken&)> operation,
                            std::chrono::milliseconds limit) {
    if (!operation) {
        return Error(ErrorCode::INVALID_ARGUMENT, "empty operation");
    }

    auto promise = std::make_shared<std::promise<T>>();
    std::future<T> future = promise->get_future();
    CancellationToken token;
    uint64_t id = register_worker(token);

    try {
        std::thread worker(
            [operation = std::move(operation), promise, token, tracker = tracker_, id]() {
                try {
                    promise->set_value(operation(token));
                } catch (...) {
                    // Rethrown to the caller by future::get()
                    promise->set_exception(std::current_exception());
                }
                release_worker(tracker, id);
            });
        worker.detach();
    } catch (const std::system_error& e) {
        release_worker(tracker_, id);
        return Error(ErrorCode::INTERNAL_ERROR,
                     std::string("cannot start worker: ") + e.what());
    }

    if (future.wait_for(limit) != std::future_status::ready) {
        token.cancel();
        timeouts_.fetch_add(1);
        return Error(ErrorCode::TIMEOUT,
                     "operation exceeded " + std::to_string(limit.count()) + "ms");
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        return Error(ErrorCode::INTERNAL_ERROR, e.what());
    } catch (...) {
        return Error(ErrorCode::INTERNAL_ERROR, "operation threw a non-standard exception");
    }
}

}  // namespace langid
