#pragma once

#include "docflow/cancellation.hpp"
#include "docflow/config.hpp"
#include "docflow/database.hpp"
#include "docflow/handler_registry.hpp"
#include "docflow/progress_store.hpp"
#include "docflow/task_queue.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace docflow {

/**
 * WorkerManager - supervises one consumer loop.
 *
 * start() creates the queue consumer, makes sure the consumer group exists
 * and launches the loop thread. The loop dequeues one task at a time, runs
 * it through its handler and settles the delivery:
 *   success             -> ack
 *   retryable error     -> retry (re-enqueue, dead-letter after max retries)
 *   non-retryable error -> fail (dead-letter)
 *   unknown task type   -> fail
 * Cancellation by stop() settles nothing; the task stays pending for this
 * consumer identity or a later claim.
 *
 * NotStarted -> Running -> Stopping -> Stopped. A manager is not restartable.
 */
class WorkerManager {
public:
    enum class State {
        NotStarted,
        Running,
        Stopping,
        Stopped,
    };

    WorkerManager(std::shared_ptr<DatabasePool> db_pool,
                  std::shared_ptr<ProgressStore> progress,
                  std::shared_ptr<const HandlerRegistry> handlers,
                  const QueueConfig& queue_config,
                  const WorkerConfig& worker_config,
                  const ProgressConfig& progress_config,
                  std::optional<int> worker_index = std::nullopt);
    ~WorkerManager();

    WorkerManager(const WorkerManager&) = delete;
    WorkerManager& operator=(const WorkerManager&) = delete;

    // Throws std::logic_error unless the manager was never started
    void start();

    // Idempotent. Blocks until the loop has exited.
    void stop();

    State state() const { return state_.load(); }
    bool is_running() const { return state_.load() == State::Running; }

    // Empty before start()
    std::string consumer_name() const;

    uint64_t processed_count() const { return processed_count_.load(); }
    uint64_t failed_count() const { return failed_count_.load(); }
    uint64_t retried_count() const { return retried_count_.load(); }

private:
    std::shared_ptr<DatabasePool> db_pool_;
    std::shared_ptr<ProgressStore> progress_;
    std::shared_ptr<const HandlerRegistry> handlers_;
    QueueConfig queue_config_;
    WorkerConfig worker_config_;
    ProgressConfig progress_config_;
    std::optional<int> worker_index_;

    std::unique_ptr<TaskQueue> queue_;
    std::thread thread_;
    CancellationToken token_;
    mutable std::mutex lifecycle_mutex_;

    std::atomic<State> state_{State::NotStarted};
    std::atomic<uint64_t> processed_count_{0};
    std::atomic<uint64_t> failed_count_{0};
    std::atomic<uint64_t> retried_count_{0};

    std::chrono::steady_clock::time_point last_purge_;

    void run_loop();
    void handle(const Task& task);
    void settle_failure(const Task& task, const TaskError& error);
    void maybe_purge_progress();
};

const char* to_string(WorkerManager::State state);

} // namespace docflow
