#include "surge/progress_signal.hpp"

#include <utility>

namespace surge {

ProgressSignal::ProgressSignal() : state_(std::make_shared<State>()) {}

void ProgressSignal::publish(std::uint64_t downloaded_bytes) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->closed) {
            return;
        }
        state_->value = downloaded_bytes;
        ++state_->version;
    }
    state_->changed.notify_all();
}

void ProgressSignal::close() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->closed = true;
    }
    state_->changed.notify_all();
}

bool ProgressSignal::isClosed() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->closed;
}

std::uint64_t ProgressSignal::value() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->value;
}

ProgressReceiver ProgressSignal::subscribe() const {
    return ProgressReceiver{state_};
}

ProgressReceiver::ProgressReceiver(std::shared_ptr<ProgressSignal::State> state)
    : shared_(std::make_shared<Shared>()) {
    std::lock_guard<std::mutex> lock(state->mutex);
    shared_->seen = state->version;
    shared_->state = std::move(state);
}

bool ProgressReceiver::changed() {
    auto& state = *shared_->state;
    std::unique_lock<std::mutex> lock(state.mutex);
    state.changed.wait(lock, [&] {
        return shared_->interrupted || state.closed || state.version != shared_->seen;
    });

    if (shared_->interrupted || state.version == shared_->seen) {
        return false;
    }
    shared_->seen = state.version;
    return true;
}

std::uint64_t ProgressReceiver::value() const {
    std::lock_guard<std::mutex> lock(shared_->state->mutex);
    return shared_->state->value;
}

void ProgressReceiver::interrupt() {
    {
        std::lock_guard<std::mutex> lock(shared_->state->mutex);
        shared_->interrupted = true;
    }
    shared_->state->changed.notify_all();
}

} // namespace surge
