#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace surge {

// Installs the process-wide default spdlog logger for the lifetime of the
// object: colored stderr, plus a plain file sink when a path is given. The
// previous default logger is put back on destruction.
class Logger {
public:
    using Level = spdlog::level::level_enum;

    explicit Logger(Level level, const std::string& filepath = {});
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    auto& logger() { return logger_; }
    [[nodiscard]] Level logLevel() const { return logger_->level(); }
    void setLogLevel(Level level) { logger_->set_level(level); }

private:
    std::shared_ptr<spdlog::logger> previous_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Turns off every sink of the default logger except file sinks while in
// scope, so nothing but the progress frames reaches the terminal. File sinks
// keep logging. Sink levels are put back on destruction.
class ConsoleMute {
public:
    ConsoleMute();
    ~ConsoleMute();

    ConsoleMute(const ConsoleMute&) = delete;
    ConsoleMute& operator=(const ConsoleMute&) = delete;

private:
    std::vector<std::pair<spdlog::sink_ptr, Logger::Level>> muted_;
};

} // namespace surge
