#pragma once

#include "progress_bar.hpp"
#include "progress_signal.hpp"
#include "transfer_source.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <mutex>
#include <ostream>
#include <thread>

namespace surge {

inline constexpr std::chrono::milliseconds kRedrawInterval{100};

class RenderLoop {
public:
    enum class State {
        Idle,
        FirstFrame,
        Redrawing,
        Stopped,
    };

    RenderLoop(TransferSource& source,
               ProgressBar bar,
               std::ostream& out,
               std::chrono::milliseconds interval = kRedrawInterval);
    ~RenderLoop();

    RenderLoop(const RenderLoop&) = delete;
    RenderLoop& operator=(const RenderLoop&) = delete;

    void start();

    // Waits for the loop to finish. Rethrows a render failure.
    void join();

    // Abandons the pending wait or pause; no frame is drawn afterwards.
    void cancel();

    [[nodiscard]] State state() const noexcept { return state_.load(); }
    [[nodiscard]] std::size_t framesRendered() const noexcept { return frames_.load(); }

private:
    void run();
    void draw(std::uint64_t downloaded, std::uint64_t total);
    bool pause();

    TransferSource& source_;
    ProgressBar bar_;
    std::ostream& out_;
    std::chrono::milliseconds interval_;
    ProgressReceiver receiver_;

    std::thread thread_;
    std::atomic<State> state_{State::Idle};
    std::atomic<std::size_t> frames_{0};
    std::exception_ptr error_;

    std::mutex pause_mutex_;
    std::condition_variable pause_cv_;
    bool cancelled_{false};
};

} // namespace surge
