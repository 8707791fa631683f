#include "surge/logger.hpp"

#include <cstdio>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace surge {

Logger::Logger(Level level, const std::string& filepath) : previous_(spdlog::default_logger()) {
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    stderr_sink->set_pattern("\033[36m[%Y-%m-%d %H:%M:%S.%e] \033[0m%^[%l]%$ %v");

    std::vector<spdlog::sink_ptr> sinks{stderr_sink};
    if (!filepath.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filepath);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%t] [%l] %v");
        sinks.push_back(std::move(file_sink));
    }

    logger_ = std::make_shared<spdlog::logger>("surge", sinks.begin(), sinks.end());
    logger_->set_level(level);
    logger_->set_error_handler(
        [](const std::string& msg) { std::fprintf(stderr, "*** LOGGER ERROR ***: %s\n", msg.c_str()); });
    spdlog::set_default_logger(logger_);
}

Logger::~Logger() {
    logger_->flush();
    spdlog::set_default_logger(previous_);
}

ConsoleMute::ConsoleMute() {
    auto logger = spdlog::default_logger();
    if (!logger) {
        return;
    }
    logger->flush();
    for (const auto& sink : logger->sinks()) {
        if (std::dynamic_pointer_cast<spdlog::sinks::basic_file_sink_mt>(sink)
            || std::dynamic_pointer_cast<spdlog::sinks::basic_file_sink_st>(sink)) {
            continue;
        }
        muted_.emplace_back(sink, sink->level());
        sink->set_level(Logger::Level::off);
    }
}

ConsoleMute::~ConsoleMute() {
    for (const auto& [sink, level] : muted_) {
        sink->set_level(level);
    }
}

} // namespace surge
