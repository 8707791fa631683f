#pragma once

#include "surge/progress_signal.hpp"
#include "surge/transfer_source.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>

namespace surge::test {

// Transfer source driven by the test: it publishes whatever the test tells it
// to and resolves when told.
class FakeTransferSource : public TransferSource {
public:
    explicit FakeTransferSource(std::filesystem::path path = "/tmp/surge/file.bin") : path_(std::move(path)) {}

    std::future<DownloadOutcome> start() override {
        started_ = true;
        return promise_.get_future();
    }

    ProgressReceiver subscribe() const override { return signal_.subscribe(); }

    std::optional<std::uint64_t> totalSize() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_;
    }

    std::uint64_t downloadSpeed() const override { return speed_; }

    std::filesystem::path filePath() const override { return path_; }

    void cancel() noexcept override { cancelled_ = true; }

    void setTotal(std::optional<std::uint64_t> total) {
        std::lock_guard<std::mutex> lock(mutex_);
        total_ = total;
    }

    void setSpeed(std::uint64_t speed) { speed_ = speed; }

    void publish(std::uint64_t downloaded) { signal_.publish(downloaded); }

    void close() { signal_.close(); }

    void finish(DownloadOutcome outcome = DownloadOutcome::Finished) {
        signal_.close();
        promise_.set_value(outcome);
    }

    void fail(std::exception_ptr error) {
        signal_.close();
        promise_.set_exception(std::move(error));
    }

    [[nodiscard]] bool started() const { return started_; }
    [[nodiscard]] bool cancelled() const { return cancelled_; }

private:
    std::filesystem::path path_;
    ProgressSignal signal_;
    std::promise<DownloadOutcome> promise_;

    mutable std::mutex mutex_;
    std::optional<std::uint64_t> total_;
    std::atomic<std::uint64_t> speed_{0};
    std::atomic<bool> started_{false};
    std::atomic<bool> cancelled_{false};
};

inline bool waitUntil(const std::function<bool()>& condition,
                      std::chrono::milliseconds timeout = std::chrono::seconds{5}) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!condition()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{1});
    }
    return true;
}

} // namespace surge::test
