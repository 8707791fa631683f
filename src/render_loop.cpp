#include "surge/render_loop.hpp"
#include "surge/terminal.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace surge {

RenderLoop::RenderLoop(TransferSource& source,
                       ProgressBar bar,
                       std::ostream& out,
                       std::chrono::milliseconds interval)
    : source_(source),
      bar_(std::move(bar)),
      out_(out),
      interval_(interval),
      receiver_(source.subscribe()) {}

RenderLoop::~RenderLoop() {
    if (thread_.joinable()) {
        cancel();
        thread_.join();
    }
}

void RenderLoop::start() {
    thread_ = std::thread([this] { run(); });
}

void RenderLoop::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
    if (error_) {
        std::rethrow_exception(std::exchange(error_, nullptr));
    }
}

void RenderLoop::cancel() {
    {
        std::lock_guard<std::mutex> lock(pause_mutex_);
        cancelled_ = true;
    }
    pause_cv_.notify_all();
    receiver_.interrupt();
}

void RenderLoop::run() {
    try {
        while (receiver_.changed()) {
            const auto downloaded = receiver_.value();
            const auto total = source_.totalSize();
            if (total && *total > 0) {
                draw(downloaded, *total);
            }
            if (!pause()) {
                break;
            }
        }
    } catch (const std::exception& ex) {
        spdlog::error("Progress rendering failed: {}", ex.what());
        error_ = std::current_exception();
        source_.cancel();
    }
    state_ = State::Stopped;
    spdlog::debug("Render loop stopped after {} frames", frames_.load());
}

void RenderLoop::draw(std::uint64_t downloaded, std::uint64_t total) {
    const auto& frame = bar_.update(downloaded, total, source_.downloadSpeed());
    if (state_ == State::Idle) {
        terminal::write(out_, frame);
        state_ = State::FirstFrame;
    } else {
        std::string redraw{terminal::erase_frame};
        redraw += frame;
        terminal::write(out_, redraw);
        state_ = State::Redrawing;
    }
    ++frames_;
}

bool RenderLoop::pause() {
    std::unique_lock<std::mutex> lock(pause_mutex_);
    return !pause_cv_.wait_for(lock, interval_, [this] { return cancelled_; });
}

} // namespace surge
