#pragma once

#include "transfer_source.hpp"

#include <condition_variable>
#include <mutex>
#include <thread>

namespace surge {

// Routes SIGINT to a transfer's cancel() while in scope. The handler only sets
// a lock-free flag; a watcher thread turns it into the cancel() call. The
// default disposition is restored on destruction.
class InterruptScope {
public:
    explicit InterruptScope(TransferSource& transfer);
    ~InterruptScope();

    InterruptScope(const InterruptScope&) = delete;
    InterruptScope& operator=(const InterruptScope&) = delete;

private:
    void watch();

    TransferSource& transfer_;
    std::thread watcher_;
    std::mutex mutex_;
    std::condition_variable stop_;
    bool stopping_{false};
};

} // namespace surge
