#include "surge/speed_tracker.hpp"

namespace surge {

SpeedTracker::SpeedTracker(std::chrono::milliseconds window) : window_(window) {}

void SpeedTracker::record(std::uint64_t total_bytes) {
    record(total_bytes, Clock::now());
}

void SpeedTracker::record(std::uint64_t total_bytes, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.push_back({now, total_bytes});
    // Keep exactly one sample at or beyond the window edge as the baseline.
    while (samples_.size() > 2 && now - samples_[1].at >= window_) {
        samples_.pop_front();
    }
}

std::uint64_t SpeedTracker::bytesPerSecond() const {
    return bytesPerSecond(Clock::now());
}

std::uint64_t SpeedTracker::bytesPerSecond(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (samples_.size() < 2 || now - samples_.back().at >= window_) {
        return 0;
    }

    const auto& first = samples_.front();
    const auto& last = samples_.back();
    const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(now - first.at).count();
    if (elapsed <= 0 || last.total_bytes < first.total_bytes) {
        return 0;
    }
    const auto bytes = static_cast<double>(last.total_bytes - first.total_bytes);
    return static_cast<std::uint64_t>(bytes * 1e9 / static_cast<double>(elapsed));
}

void SpeedTracker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.clear();
}

} // namespace surge
