#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

namespace surge {

class ProgressReceiver;

// Single-producer watch channel for the downloaded byte count. Receivers only
// ever see the latest value; intermediate values may be skipped.
class ProgressSignal {
public:
    ProgressSignal();

    void publish(std::uint64_t downloaded_bytes);
    void close();

    [[nodiscard]] bool isClosed() const;
    [[nodiscard]] std::uint64_t value() const;

    // The new receiver treats the current value as already seen.
    [[nodiscard]] ProgressReceiver subscribe() const;

private:
    friend class ProgressReceiver;

    struct State {
        mutable std::mutex mutex;
        std::condition_variable changed;
        std::uint64_t value{0};
        std::uint64_t version{0};
        bool closed{false};
    };

    std::shared_ptr<State> state_;
};

class ProgressReceiver {
public:
    // Blocks until a value newer than the last seen one is published (returns
    // true and marks it seen), or until the signal is closed with nothing
    // unseen left, or interrupt() is called (both return false).
    bool changed();

    [[nodiscard]] std::uint64_t value() const;

    // Wakes a blocked changed() from another thread. Sticky.
    void interrupt();

private:
    friend class ProgressSignal;

    struct Shared {
        std::shared_ptr<ProgressSignal::State> state;
        std::uint64_t seen{0};
        bool interrupted{false};
    };

    explicit ProgressReceiver(std::shared_ptr<ProgressSignal::State> state);

    std::shared_ptr<Shared> shared_;
};

} // namespace surge
