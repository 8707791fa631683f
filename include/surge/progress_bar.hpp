#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace surge {

class ProgressBar {
public:
    // Width is the terminal column count clamped to max_width, taken once.
    explicit ProgressBar(std::size_t max_width);
    ProgressBar(std::size_t max_width, std::size_t terminal_columns);

    // Returns the two-line frame. The reference stays valid until the next
    // call. Requires total > 0.
    const std::string& update(std::uint64_t downloaded, std::uint64_t total, std::uint64_t speed);

    [[nodiscard]] std::size_t width() const noexcept { return bar_width_; }

    [[nodiscard]] static unsigned percent(std::uint64_t downloaded, std::uint64_t total);
    [[nodiscard]] static std::size_t filledCells(unsigned pct, std::size_t width) noexcept;

private:
    std::string bar_buf_;
    std::string size_buf_;
    std::chrono::steady_clock::time_point start_;
    std::size_t bar_width_;
};

[[nodiscard]] std::string formatElapsed(std::chrono::nanoseconds elapsed);

} // namespace surge
