#include "surge/terminal.hpp"

#include <stdexcept>

#include <sys/ioctl.h>
#include <unistd.h>

namespace surge::terminal {

std::optional<std::size_t> columns() {
    winsize size{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) == -1 || size.ws_col == 0) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(size.ws_col);
}

void write(std::ostream& out, std::string_view text) {
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write to terminal");
    }
}

CursorGuard::CursorGuard(std::ostream& out) : out_(out) {
    write(out_, hide_cursor);
}

CursorGuard::~CursorGuard() {
    out_.clear();
    out_ << show_cursor << std::flush;
}

} // namespace surge::terminal
