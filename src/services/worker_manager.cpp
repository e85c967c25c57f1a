#include "docflow/worker_manager.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace docflow {

namespace {

// Keeps an in-flight delivery from looking idle until destroyed
class DeliveryHeartbeat {
public:
    DeliveryHeartbeat(TaskQueue& queue, const Task& task, const CancellationToken& worker_token,
                      std::chrono::milliseconds interval)
        : stop_(worker_token.child()) {
        if (interval.count() <= 0) return;
        thread_ = std::thread([&queue, task, interval, stop = stop_]() {
            while (stop.wait_for(interval)) {
                try {
                    if (!queue.touch(task)) {
                        spdlog::warn("[WorkerManager] Task {} is no longer pending on {}", task.id, queue.consumer_name());
                        return;
                    }
                } catch (const std::exception& e) {
                    spdlog::warn("[WorkerManager] Heartbeat for task {} failed: {}", task.id, e.what());
                }
            }
        });
    }

    ~DeliveryHeartbeat() {
        stop_.cancel();
        if (thread_.joinable()) thread_.join();
    }

    DeliveryHeartbeat(const DeliveryHeartbeat&) = delete;
    DeliveryHeartbeat& operator=(const DeliveryHeartbeat&) = delete;

private:
    CancellationToken stop_;
    std::thread thread_;
};

} // anonymous namespace

const char* to_string(WorkerManager::State state) {
    switch (state) {
        case WorkerManager::State::NotStarted: return "not_started";
        case WorkerManager::State::Running: return "running";
        case WorkerManager::State::Stopping: return "stopping";
        case WorkerManager::State::Stopped: return "stopped";
    }
    return "unknown";
}

WorkerManager::WorkerManager(std::shared_ptr<DatabasePool> db_pool,
                             std::shared_ptr<ProgressStore> progress,
                             std::shared_ptr<const HandlerRegistry> handlers,
                             const QueueConfig& queue_config,
                             const WorkerConfig& worker_config,
                             const ProgressConfig& progress_config,
                             std::optional<int> worker_index)
    : db_pool_(std::move(db_pool)),
      progress_(std::move(progress)),
      handlers_(std::move(handlers)),
      queue_config_(queue_config),
      worker_config_(worker_config),
      progress_config_(progress_config),
      worker_index_(worker_index) {
    if (!db_pool_) {
        throw std::invalid_argument("Database pool cannot be null");
    }
    if (!handlers_) {
        throw std::invalid_argument("Handler registry cannot be null");
    }
}

WorkerManager::~WorkerManager() {
    stop();
}

void WorkerManager::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (state_.load() != State::NotStarted) {
        throw std::logic_error(std::string("WorkerManager cannot start from state ") + to_string(state_.load()));
    }
    if (handlers_->empty()) {
        throw std::logic_error("WorkerManager needs at least one task handler");
    }

    queue_ = std::make_unique<TaskQueue>(db_pool_, queue_config_, worker_index_);
    queue_->setup();

    last_purge_ = std::chrono::steady_clock::now();
    state_ = State::Running;
    thread_ = std::thread(&WorkerManager::run_loop, this);

    std::string tags;
    for (const auto& tag : handlers_->tags()) {
        tags += (tags.empty() ? "" : ", ") + tag;
    }
    spdlog::info("[WorkerManager] Started consumer {} (handlers: {})", queue_->consumer_name(), tags);
}

void WorkerManager::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    auto current = state_.load();
    if (current == State::Stopped) return;
    if (current == State::NotStarted) {
        state_ = State::Stopped;
        return;
    }

    state_ = State::Stopping;
    spdlog::info("[WorkerManager] Stopping consumer {}", queue_->consumer_name());

    token_.cancel();
    if (thread_.joinable()) {
        thread_.join();
    }

    state_ = State::Stopped;
    spdlog::info("[WorkerManager] Consumer {} stopped (processed={}, failed={}, retried={})",
                 queue_->consumer_name(), processed_count_.load(), failed_count_.load(), retried_count_.load());
}

std::string WorkerManager::consumer_name() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return queue_ ? queue_->consumer_name() : std::string();
}

void WorkerManager::run_loop() {
    const auto block = std::chrono::milliseconds(queue_config_.block_ms);
    const auto& consumer = queue_->consumer_name();

    spdlog::debug("[WorkerManager] Loop started for {}", consumer);

    while (state_.load() == State::Running) {
        try {
            auto task = queue_->dequeue(block, token_);
            if (!task) {
                maybe_purge_progress();
                continue;
            }
            handle(*task);
        } catch (const OperationCancelled&) {
            break;
        } catch (const std::exception& e) {
            spdlog::error("[WorkerManager] Backend error on {}: {}", consumer, e.what());
            if (!token_.wait_for(std::chrono::milliseconds(worker_config_.error_backoff_ms))) {
                break;
            }
        }
    }

    spdlog::debug("[WorkerManager] Loop exited for {}", consumer);
}

void WorkerManager::handle(const Task& task) {
    const TaskHandler* handler = handlers_->find(task.type);
    if (!handler) {
        spdlog::error("[WorkerManager] No handler for task {} type '{}'", task.id, task.type);
        queue_->fail(task, "Unknown task type: " + task.type);
        ++failed_count_;
        return;
    }

    spdlog::info("[WorkerManager] Processing task {} type={} retry_count={}", task.id, task.type, task.retry_count);
    auto started = std::chrono::steady_clock::now();

    try {
        DeliveryHeartbeat heartbeat(*queue_, task, token_, std::chrono::milliseconds(queue_config_.heartbeat_interval_ms));
        execute(*handler, task, token_);
    } catch (const OperationCancelled&) {
        spdlog::warn("[WorkerManager] Task {} interrupted by shutdown, left pending", task.id);
        throw;
    } catch (const TaskError& e) {
        settle_failure(task, e);
        return;
    } catch (const std::exception& e) {
        spdlog::error("[WorkerManager] Unexpected error in task {}: {}", task.id, e.what());
        queue_->fail(task, e.what());
        ++failed_count_;
        return;
    }

    queue_->ack(task);
    ++processed_count_;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    spdlog::info("[WorkerManager] Task {} completed in {}ms", task.id, elapsed);
}

void WorkerManager::settle_failure(const Task& task, const TaskError& error) {
    if (!error.retryable()) {
        spdlog::error("[WorkerManager] Task {} failed: {}", task.id, error.what());
        queue_->fail(task, error.what());
        ++failed_count_;
        return;
    }

    spdlog::warn("[WorkerManager] Task {} failed (retryable): {}", task.id, error.what());
    if (queue_->retry(task, error.what())) {
        ++retried_count_;
    } else {
        ++failed_count_;
    }
}

void WorkerManager::maybe_purge_progress() {
    if (!progress_) return;

    auto now = std::chrono::steady_clock::now();
    if (now - last_purge_ < std::chrono::seconds(progress_config_.purge_interval_seconds)) return;
    last_purge_ = now;

    try {
        progress_->purge_expired();
    } catch (const std::runtime_error& e) {
        spdlog::warn("[WorkerManager] Progress purge failed: {}", e.what());
    }
}

} // namespace docflow
