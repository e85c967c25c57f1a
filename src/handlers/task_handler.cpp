#include "docflow/task_handler.hpp"
#include <algorithm>

namespace docflow {

std::chrono::milliseconds TaskContext::remaining() const {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

void TaskContext::check() const {
    token_.throw_if_cancelled();
    if (Clock::now() >= deadline_) {
        throw DeadlineExceeded("Task deadline exceeded");
    }
}

void TaskContext::sleep_for(std::chrono::milliseconds duration) const {
    check();
    auto left = remaining();
    if (duration >= left) {
        token_.sleep_for(left);
        throw DeadlineExceeded("Task deadline exceeded");
    }
    token_.sleep_for(duration);
}

} // namespace docflow
