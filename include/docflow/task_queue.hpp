#pragma once

#include "docflow/cancellation.hpp"
#include "docflow/config.hpp"
#include "docflow/database.hpp"
#include "docflow/task_types.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace docflow {

// Backend failure of a queue operation
class QueueError : public std::runtime_error {
public:
    explicit QueueError(const std::string& what) : std::runtime_error(what) {}
};

// The consumer group (or the log itself) disappeared underneath us
class GroupMissingError : public QueueError {
public:
    explicit GroupMissingError(const std::string& what) : QueueError(what) {}
};

/**
 * TaskQueue - durable ordered task log with consumer-group delivery.
 *
 * Entries live in stream_entries ordered by seq. A group shares one read
 * cursor (consumer_groups.last_delivered_seq); every delivered entry sits in
 * pending_entries under the consumer that received it until ack() or fail()
 * removes it. Each instance is one consumer identity and is meant to be used
 * from one thread, except touch().
 *
 * Throws std::invalid_argument at construction when automatic claiming is on
 * with a threshold below three heartbeat intervals, since live deliveries
 * would then be claimed from under their consumer.
 */
class TaskQueue {
public:
    TaskQueue(std::shared_ptr<DatabasePool> db_pool,
              const QueueConfig& config,
              const std::optional<int>& consumer_suffix = std::nullopt);

    // Idempotently creates the log tables and the consumer group
    void setup();

    // Appends a new task and returns its application id
    std::string enqueue(TaskType type, const nlohmann::json& payload);

    // Same, for a raw wire tag (producers of tags this worker may not handle)
    std::string enqueue(const std::string& type, const nlohmann::json& payload);

    // Own pending entries first, then orphans, then new entries. Waits up to
    // block_duration for work. Throws OperationCancelled when the token fires.
    std::optional<Task> dequeue(std::chrono::milliseconds block_duration,
                                const CancellationToken& token);

    // Takes over the oldest entry pending on another consumer for at least min_idle
    std::optional<Task> claim_orphaned(std::chrono::milliseconds min_idle);

    // Marks an in-flight delivery as alive. Returns false once the entry is no
    // longer pending on this consumer. Safe to call from a second thread.
    bool touch(const Task& task);

    // Settling only applies to deliveries still pending on this consumer.
    // Returns false if the task was no longer pending here.
    bool ack(const Task& task);

    // Re-enqueues with retry_count + 1, or dead-letters once max_retries is
    // reached. Returns true if the task was re-enqueued.
    bool retry(const Task& task, const std::string& error);

    // Dead-letters the task and releases it. Returns false if it was no longer pending.
    bool fail(const Task& task, const std::string& error);

    std::vector<DeadLetterEntry> dead_letters(int limit = 100);
    int64_t pending_count();

    const std::string& consumer_name() const { return consumer_name_; }
    const std::string& stream() const { return config_.stream; }
    const std::string& group() const { return config_.group; }

private:
    struct RawEntry {
        int64_t seq;
        nlohmann::json fields;
    };

    std::shared_ptr<DatabasePool> db_pool_;
    QueueConfig config_;
    std::string consumer_name_;

    std::optional<RawEntry> read_own_pending();
    std::optional<RawEntry> claim_orphaned_entry(std::chrono::milliseconds min_idle);
    std::optional<RawEntry> read_new();

    // Decodes an entry; malformed ones are dead-lettered and yield nullopt
    std::optional<Task> decode_or_dead_letter(const RawEntry& entry);

    int64_t append(UnitOfWork& uow, const nlohmann::json& fields);
    bool dead_letter(int64_t seq, const std::string& original_id, const std::string& type,
                     const std::string& payload, const std::string& error, int retry_count);
    bool log_has_expected_shape(UnitOfWork& uow);

    QueryResult run(const std::string& sql, const std::vector<std::string>& params);

    template <typename Fn>
    auto with_group_recovery(Fn fn) -> decltype(fn());
};

} // namespace docflow
