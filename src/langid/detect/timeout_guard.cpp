#include <langid/detect/timeout_guard.hpp>

namespace langid {

TimeoutGuard::TimeoutGuard()
    : tracker_(std::make_shared<Tracker>())
{}

TimeoutGuard::~TimeoutGuard() {
    std::unique_lock<std::mutex> lock(tracker_->mutex);
    for (auto& entry : tracker_->active) {
        entry.second.cancel();
    }
    tracker_->idle.wait(lock, [this]() { return tracker_->active.empty(); });
}

uint64_t TimeoutGuard::register_worker(const CancellationToken& token) {
    std::lock_guard<std::mutex> lock(tracker_->mutex);
    uint64_t id = tracker_->next_id++;
    tracker_->active.emplace(id, token);
    return id;
}

void TimeoutGuard::release_worker(const std::shared_ptr<Tracker>& tracker, uint64_t id) {
    std::lock_guard<std::mutex> lock(tracker->mutex);
    tracker->active.erase(id);
    if (tracker->active.empty()) {
        tracker->idle.notify_all();
    }
}

size_t TimeoutGuard::in_flight() const {
    std::lock_guard<std::mutex> lock(tracker_->mutex);
    return tracker_->active.size();
}

}  // namespace langid
