#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>

namespace surge {

// Throughput over a sliding window of cumulative byte counts.
class SpeedTracker {
public:
    using Clock = std::chrono::steady_clock;

    explicit SpeedTracker(std::chrono::milliseconds window = std::chrono::seconds{1});

    void record(std::uint64_t total_bytes);
    void record(std::uint64_t total_bytes, Clock::time_point now);

    [[nodiscard]] std::uint64_t bytesPerSecond() const;
    [[nodiscard]] std::uint64_t bytesPerSecond(Clock::time_point now) const;

    void reset();

private:
    struct Sample {
        Clock::time_point at;
        std::uint64_t total_bytes;
    };

    std::chrono::milliseconds window_;
    mutable std::mutex mutex_;
    std::deque<Sample> samples_;
};

} // namespace surge
