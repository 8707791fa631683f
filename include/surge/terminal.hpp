#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string_view>

namespace surge::terminal {

inline constexpr const char* hide_cursor = "\x1b[?25l";
inline constexpr const char* show_cursor = "\x1b[?25h";
inline constexpr const char* clear_line = "\x1b[2K";
inline constexpr const char* previous_line = "\x1b[1F";
inline constexpr const char* column_zero = "\x1b[1G";

// Clears the bar line and the stats line above it, leaving the cursor at
// column 0 of the stats line.
inline constexpr const char* erase_frame = "\x1b[2K\x1b[1F\x1b[2K\x1b[1G";

// Column count of the terminal attached to stdout.
[[nodiscard]] std::optional<std::size_t> columns();

// Writes and flushes; throws std::runtime_error if the stream went bad.
void write(std::ostream& out, std::string_view text);

class CursorGuard {
public:
    explicit CursorGuard(std::ostream& out);
    ~CursorGuard();

    CursorGuard(const CursorGuard&) = delete;
    CursorGuard& operator=(const CursorGuard&) = delete;

private:
    std::ostream& out_;
};

} // namespace surge::terminal
