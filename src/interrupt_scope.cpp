#include "surge/interrupt_scope.hpp"

#include <atomic>
#include <chrono>
#include <csignal>

#include <spdlog/spdlog.h>

namespace surge {

namespace {

constexpr std::chrono::milliseconds kPollInterval{50};

std::atomic<bool> g_interrupted{false};
static_assert(std::atomic<bool>::is_always_lock_free);

void handleInterrupt(int) { g_interrupted = true; }

} // namespace

InterruptScope::InterruptScope(TransferSource& transfer) : transfer_(transfer) {
    g_interrupted = false;
    watcher_ = std::thread{[this] { watch(); }};
    std::signal(SIGINT, handleInterrupt);
}

InterruptScope::~InterruptScope() {
    std::signal(SIGINT, SIG_DFL);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    stop_.notify_all();
    watcher_.join();
}

void InterruptScope::watch() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (g_interrupted.exchange(false)) {
            spdlog::info("Interrupted, cancelling transfer");
            transfer_.cancel();
        }
        stop_.wait_for(lock, kPollInterval);
    }
}

} // namespace surge
