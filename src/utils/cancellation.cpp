#include "docflow/cancellation.hpp"
#include <algorithm>

namespace docflow {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

CancellationToken CancellationToken::child() const {
    auto child_state = std::make_shared<State>();
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled) {
        child_state->cancelled = true;
    } else {
        auto& children = state_->children;
        children.erase(std::remove_if(children.begin(), children.end(),
                                      [](const std::weak_ptr<State>& c) { return c.expired(); }),
                       children.end());
        children.push_back(child_state);
    }
    return CancellationToken(std::move(child_state));
}

void CancellationToken::cancel_state(const std::shared_ptr<State>& state) {
    std::vector<std::weak_ptr<State>> children;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->cancelled) return;
        state->cancelled = true;
        children.swap(state->children);
    }
    state->cv.notify_all();

    for (const auto& weak : children) {
        if (auto child = weak.lock()) {
            cancel_state(child);
        }
    }
}

void CancellationToken::cancel() {
    cancel_state(state_);
}

bool CancellationToken::is_cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

void CancellationToken::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw OperationCancelled();
    }
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return !state_->cv.wait_for(lock, duration, [this] { return state_->cancelled; });
}

void CancellationToken::sleep_for(std::chrono::milliseconds duration) const {
    if (!wait_for(duration)) {
        throw OperationCancelled();
    }
}

} // namespace docflow
