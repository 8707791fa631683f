#include "surge/progress_bar.hpp"
#include "surge/byte_format.hpp"
#include "surge/terminal.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string_view>

#include <fmt/format.h>

namespace surge {

namespace {

// Terminal columns taken by UTF-8 text, assuming no wide glyphs.
std::size_t displayWidth(std::string_view text) {
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0U) != 0x80U;
    }));
}

} // namespace

ProgressBar::ProgressBar(std::size_t max_width)
    : ProgressBar(max_width, terminal::columns().value_or(0)) {}

ProgressBar::ProgressBar(std::size_t max_width, std::size_t terminal_columns)
    : start_(std::chrono::steady_clock::now()),
      bar_width_(std::min(terminal_columns, max_width)) {}

const std::string& ProgressBar::update(std::uint64_t downloaded, std::uint64_t total, std::uint64_t speed) {
    const unsigned progress = percent(downloaded, total);

    const auto done = scaleBytes(downloaded);
    const auto size = scaleBytes(total);
    const auto rate = scaleBytes(speed);
    const auto elapsed = std::chrono::steady_clock::now() - start_;

    bar_buf_.clear();
    size_buf_.clear();
    fmt::format_to(std::back_inserter(bar_buf_), "{:.2f} {}/s - {} % - elapsed: {} ",
                   rate.value, rate.unit, progress, formatElapsed(elapsed));
    fmt::format_to(std::back_inserter(size_buf_), "{:.2f} {} / {:.2f} {}",
                   done.value, done.unit, size.value, size.unit);

    const std::size_t used = displayWidth(bar_buf_) + displayWidth(size_buf_);
    if (used < bar_width_) {
        bar_buf_.append(bar_width_ - used, ' ');
    }
    bar_buf_ += size_buf_;
    bar_buf_.push_back('\n');

    if (bar_width_ >= 2) {
        const std::size_t cells = bar_width_ - 2;
        const std::size_t filled = filledCells(progress, bar_width_);
        bar_buf_.push_back('[');
        for (std::size_t i = 0; i < filled; ++i) {
            bar_buf_ += u8"█";
        }
        bar_buf_.append(cells - filled, ' ');
        bar_buf_.push_back(']');
    }

    return bar_buf_;
}

unsigned ProgressBar::percent(std::uint64_t downloaded, std::uint64_t total) {
    if (total == 0) {
        throw std::invalid_argument("progress total must be positive");
    }
    if (downloaded >= total) {
        return 100;
    }
    if (downloaded <= std::numeric_limits<std::uint64_t>::max() / 100) {
        return static_cast<unsigned>(downloaded * 100 / total);
    }
    // downloaded * 100 would overflow here.
    return static_cast<unsigned>(static_cast<long double>(downloaded) * 100 / static_cast<long double>(total));
}

std::size_t ProgressBar::filledCells(unsigned pct, std::size_t width) noexcept {
    if (width < 2) {
        return 0;
    }
    return std::min(pct, 100U) * (width - 2) / 100;
}

std::string formatElapsed(std::chrono::nanoseconds elapsed) {
    const auto ns = static_cast<double>(elapsed.count());
    if (ns >= 1e9) {
        return fmt::format("{:.2f}s", ns / 1e9);
    }
    if (ns >= 1e6) {
        return fmt::format("{:.2f}ms", ns / 1e6);
    }
    if (ns >= 1e3) {
        return fmt::format("{:.2f}µs", ns / 1e3);
    }
    return fmt::format("{:.2f}ns", ns);
}

} // namespace surge
