#pragma once

#include "docflow/cancellation.hpp"
#include "docflow/database.hpp"
#include "docflow/task_types.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <string>
#include <utility>

namespace docflow {

/**
 * Everything a handler may touch while processing one task: the unit of work
 * owned by this execution, the worker's cancellation token and the absolute
 * deadline of the execution.
 */
class TaskContext {
public:
    using Clock = std::chrono::steady_clock;

    TaskContext(UnitOfWork& uow, CancellationToken token, Clock::time_point deadline)
        : uow_(uow), token_(std::move(token)), deadline_(deadline) {}

    UnitOfWork& uow() { return uow_; }
    const CancellationToken& token() const { return token_; }
    Clock::time_point deadline() const { return deadline_; }

    std::chrono::milliseconds remaining() const;

    // Throws OperationCancelled or DeadlineExceeded
    void check() const;

    // Cancellable sleep bounded by the deadline
    void sleep_for(std::chrono::milliseconds duration) const;

    /**
     * Runs a blocking collaborator call on a helper thread, bounded by
     * min(timeout, remaining()).
     *
     * fn receives a step token that is cancelled once the step is abandoned.
     * Throws TaskError("<name> timeout", retryable) when the step's own
     * timeout fires, DeadlineExceeded when the execution deadline comes
     * first, OperationCancelled on cancellation. fn must own its captures.
     */
    template <typename Fn>
    auto run_step(const std::string& name, std::chrono::milliseconds timeout, Fn fn)
        -> decltype(fn(std::declval<const CancellationToken&>())) {
        check();
        auto left = remaining();
        bool bounded_by_deadline = left <= timeout;
        try {
            return run_with_timeout(token_, bounded_by_deadline ? left : timeout, std::move(fn));
        } catch (const DeadlineExceeded&) {
            if (bounded_by_deadline) throw;
            throw TaskError(name + " timeout", true);
        }
    }

private:
    UnitOfWork& uow_;
    CancellationToken token_;
    Clock::time_point deadline_;
};

/**
 * Runs one task through a handler inside its own unit of work.
 *
 * Handler requirements:
 *   const char* name() const;
 *   std::chrono::milliseconds timeout() const;
 *   DatabasePool& pool() const;
 *   void process(const Task& task, TaskContext& ctx) const;
 *
 * Commits when process() returns and rolls back on every failure. Errors
 * come out as TaskError, except OperationCancelled which is re-raised
 * untouched so the delivery stays pending.
 */
template <typename Handler>
void execute_task(const Handler& handler, const Task& task, const CancellationToken& token) {
    const auto timeout = handler.timeout();

    UnitOfWork uow(&handler.pool());
    TaskContext ctx(uow, token, TaskContext::Clock::now() + timeout);

    auto rollback = [&]() {
        try {
            uow.rollback();
        } catch (const std::exception& e) {
            spdlog::warn("[{}] Rollback after failure of task {} failed: {}", handler.name(), task.id, e.what());
        }
    };

    try {
        handler.process(task, ctx);
        uow.commit();
    } catch (const OperationCancelled&) {
        rollback();
        throw;
    } catch (const DeadlineExceeded&) {
        rollback();
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout).count();
        throw TaskError("Task timed out after " + std::to_string(seconds) + "s", true);
    } catch (const TaskError&) {
        rollback();
        throw;
    } catch (const std::exception& e) {
        rollback();
        spdlog::error("[{}] Unexpected error in task {}: {}", handler.name(), task.id, e.what());
        throw TaskError(e.what(), false);
    }
}

} // namespace docflow
