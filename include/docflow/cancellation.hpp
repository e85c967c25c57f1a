#pragma once

#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace docflow {

// Raised at a suspension point after the worker asked the operation to stop.
// Never turned into ack/retry/fail: the task stays pending.
class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled() : std::runtime_error("Operation cancelled") {}
};

// Raised when an absolute deadline passes while waiting.
class DeadlineExceeded : public std::runtime_error {
public:
    explicit DeadlineExceeded(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Shared cancellation flag.
 *
 * Copies refer to the same state, so the worker loop keeps one copy and hands
 * others to dequeue waits, handler steps and backoff sleeps. Waiting threads
 * are woken as soon as cancel() is called.
 *
 * A child token is cancelled with its parent but can also be cancelled on its
 * own, which leaves the parent untouched.
 */
class CancellationToken {
public:
    CancellationToken();

    CancellationToken child() const;

    void cancel();
    bool is_cancelled() const;
    void throw_if_cancelled() const;

    // Returns false if the token was cancelled before the duration elapsed
    bool wait_for(std::chrono::milliseconds duration) const;

    // Like wait_for but throws OperationCancelled instead of returning false
    void sleep_for(std::chrono::milliseconds duration) const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
        std::vector<std::weak_ptr<State>> children;
    };

    explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}
    static void cancel_state(const std::shared_ptr<State>& state);

    std::shared_ptr<State> state_;
};

/**
 * Run a blocking call on a helper thread and wait for it until the timeout
 * passes or the token is cancelled.
 *
 * fn is called with a child of token that is cancelled when the caller stops
 * waiting, so cooperative steps wind down instead of running on. fn must own
 * everything it touches: the helper thread is detached and its result
 * discarded once the caller gave up. Exceptions thrown by fn are rethrown.
 */
template <typename Fn>
auto run_with_timeout(const CancellationToken& token,
                      std::chrono::milliseconds timeout,
                      Fn fn) -> decltype(fn(std::declval<const CancellationToken&>())) {
    using Result = decltype(fn(std::declval<const CancellationToken&>()));
    constexpr auto slice = std::chrono::milliseconds(50);

    CancellationToken step = token.child();
    auto task = std::make_shared<std::packaged_task<Result()>>(
        [fn = std::move(fn), step]() mutable { return fn(step); });
    auto future = task->get_future();
    std::thread([task]() { (*task)(); }).detach();

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (future.wait_for(slice) != std::future_status::ready) {
        if (token.is_cancelled()) {
            step.cancel();
            throw OperationCancelled();
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            step.cancel();
            throw DeadlineExceeded("Timed out after " + std::to_string(timeout.count()) + "ms");
        }
    }
    return future.get();
}

} // namespace docflow
