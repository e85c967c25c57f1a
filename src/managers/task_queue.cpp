#include "docflow/task_queue.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <map>

namespace docflow {

namespace {

// SQLSTATE undefined_table
constexpr const char* kUndefinedTable = "42P01";

const char* kCreateLogTablesSql = R"(
    CREATE TABLE IF NOT EXISTS stream_entries (
        stream VARCHAR(255) NOT NULL,
        seq BIGSERIAL NOT NULL,
        fields JSONB NOT NULL,
        created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
        PRIMARY KEY (stream, seq)
    );

    CREATE TABLE IF NOT EXISTS consumer_groups (
        stream VARCHAR(255) NOT NULL,
        group_name VARCHAR(255) NOT NULL,
        last_delivered_seq BIGINT NOT NULL DEFAULT 0,
        created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
        PRIMARY KEY (stream, group_name)
    );

    CREATE TABLE IF NOT EXISTS pending_entries (
        stream VARCHAR(255) NOT NULL,
        group_name VARCHAR(255) NOT NULL,
        seq BIGINT NOT NULL,
        consumer VARCHAR(255) NOT NULL,
        delivered_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
        delivery_count INTEGER NOT NULL DEFAULT 1,
        PRIMARY KEY (stream, group_name, seq),
        FOREIGN KEY (stream, group_name) REFERENCES consumer_groups(stream, group_name) ON DELETE CASCADE,
        FOREIGN KEY (stream, seq) REFERENCES stream_entries(stream, seq) ON DELETE CASCADE
    );

    CREATE TABLE IF NOT EXISTS dead_letters (
        id BIGSERIAL PRIMARY KEY,
        stream VARCHAR(255) NOT NULL,
        original_id VARCHAR(255) NOT NULL,
        type VARCHAR(255) NOT NULL,
        payload TEXT NOT NULL,
        error TEXT NOT NULL,
        retry_count INTEGER NOT NULL DEFAULT 0,
        failed_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
    );

    CREATE INDEX IF NOT EXISTS idx_pending_entries_consumer
        ON pending_entries(stream, group_name, consumer, seq);
    CREATE INDEX IF NOT EXISTS idx_pending_entries_delivered
        ON pending_entries(stream, group_name, delivered_at);
    CREATE INDEX IF NOT EXISTS idx_dead_letters_stream
        ON dead_letters(stream, failed_at);
)";

std::string string_field(const nlohmann::json& fields, const char* name) {
    if (!fields.is_object()) return "";
    auto it = fields.find(name);
    return (it != fields.end() && it->is_string()) ? it->get<std::string>() : "";
}

} // anonymous namespace

TaskQueue::TaskQueue(std::shared_ptr<DatabasePool> db_pool,
                     const QueueConfig& config,
                     const std::optional<int>& consumer_suffix)
    : db_pool_(std::move(db_pool)),
      config_(config),
      consumer_name_(generate_consumer_name(consumer_suffix)) {
    if (!db_pool_) {
        throw std::invalid_argument("Database pool cannot be null");
    }
    if (config_.claim_min_idle_ms > 0 &&
        (config_.heartbeat_interval_ms <= 0 ||
         config_.claim_min_idle_ms < 3 * static_cast<int64_t>(config_.heartbeat_interval_ms))) {
        throw std::invalid_argument("claim_min_idle_ms (" + std::to_string(config_.claim_min_idle_ms) +
                                    ") must be at least three heartbeat intervals (" +
                                    std::to_string(config_.heartbeat_interval_ms) + "ms)");
    }
    spdlog::info("[TaskQueue] Consumer {} on stream '{}' group '{}'",
                 consumer_name_, config_.stream, config_.group);
}

template <typename Fn>
auto TaskQueue::with_group_recovery(Fn fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const GroupMissingError& e) {
        spdlog::warn("[TaskQueue] {}, re-creating consumer group", e.what());
    } catch (const DatabaseError& e) {
        if (e.sql_state() != kUndefinedTable) {
            throw QueueError(e.what());
        }
        spdlog::warn("[TaskQueue] Log table missing, re-creating: {}", e.what());
    }
    setup();
    return fn();
}

QueryResult TaskQueue::run(const std::string& sql, const std::vector<std::string>& params) {
    QueryResult result(db_pool_->query_params(sql, params));
    if (!result.is_success()) {
        throw DatabaseError("Query failed: " + result.error_message(), result.sql_state());
    }
    return result;
}

bool TaskQueue::log_has_expected_shape(UnitOfWork& uow) {
    auto columns = uow.execute(R"(
        SELECT column_name, data_type
        FROM information_schema.columns
        WHERE table_schema = current_schema() AND table_name = 'stream_entries'
    )");

    // Not created yet
    if (columns.num_rows() == 0) return true;

    const std::map<std::string, std::string> expected = {
        {"stream", "character varying"},
        {"seq", "bigint"},
        {"fields", "jsonb"},
    };
    std::map<std::string, std::string> actual;
    for (int i = 0; i < columns.num_rows(); ++i) {
        actual[columns.get_value(i, "column_name")] = columns.get_value(i, "data_type");
    }
    for (const auto& [name, type] : expected) {
        auto it = actual.find(name);
        if (it == actual.end() || it->second != type) {
            spdlog::warn("[TaskQueue] stream_entries.{} is {} (expected {})",
                         name, it == actual.end() ? "missing" : it->second, type);
            return false;
        }
    }
    return true;
}

void TaskQueue::setup() {
    UnitOfWork uow(db_pool_.get());

    // Concurrent workers start together; DDL below must not race
    uow.execute("SELECT pg_advisory_xact_lock(hashtext('docflow_queue_setup'))");

    if (!log_has_expected_shape(uow)) {
        spdlog::warn("[TaskQueue] Task log has an incompatible shape, dropping and recreating it");
        uow.execute("DROP TABLE IF EXISTS pending_entries, consumer_groups, stream_entries CASCADE");
    }
    uow.execute(kCreateLogTablesSql);

    auto created = uow.execute(R"(
        INSERT INTO consumer_groups (stream, group_name, last_delivered_seq)
        VALUES ($1, $2, 0)
        ON CONFLICT (stream, group_name) DO NOTHING
    )", {config_.stream, config_.group});
    uow.commit();

    if (created.affected_rows() == 1) {
        spdlog::info("[TaskQueue] Created consumer group '{}' on stream '{}'", config_.group, config_.stream);
    } else {
        spdlog::debug("[TaskQueue] Consumer group '{}' already exists", config_.group);
    }
}

int64_t TaskQueue::append(UnitOfWork& uow, const nlohmann::json& fields) {
    // Appends are serialized per stream so seq order matches commit order and
    // the group cursor never passes an entry that commits later
    uow.execute("SELECT pg_advisory_xact_lock(hashtext($1))", {config_.stream});
    auto result = uow.execute(
        "INSERT INTO stream_entries (stream, fields) VALUES ($1, $2::jsonb) RETURNING seq",
        {config_.stream, fields.dump()});
    return std::stoll(result.get_value(0, "seq"));
}

std::string TaskQueue::enqueue(TaskType type, const nlohmann::json& payload) {
    return enqueue(std::string(to_string(type)), payload);
}

std::string TaskQueue::enqueue(const std::string& type, const nlohmann::json& payload) {
    std::string id = generate_task_id();
    auto fields = encode_task_fields(id, type, payload, 0);

    int64_t seq = with_group_recovery([&] {
        UnitOfWork uow(db_pool_.get());
        int64_t appended = append(uow, fields);
        uow.commit();
        return appended;
    });

    spdlog::info("[TaskQueue] Enqueued task {} type={} seq={}", id, type, seq);
    return id;
}

std::optional<Task> TaskQueue::dequeue(std::chrono::milliseconds block_duration,
                                       const CancellationToken& token) {
    using namespace std::chrono;

    const auto deadline = steady_clock::now() + block_duration;
    const auto max_interval = milliseconds(config_.max_poll_interval_ms);
    auto interval = milliseconds(config_.poll_interval_ms);

    while (true) {
        token.throw_if_cancelled();

        auto entry = with_group_recovery([this] {
            // A task handed to us earlier and never settled comes back first
            if (auto own = read_own_pending()) return own;
            if (config_.claim_min_idle_ms > 0) {
                if (auto orphan = claim_orphaned_entry(milliseconds(config_.claim_min_idle_ms))) {
                    return orphan;
                }
            }
            return read_new();
        });

        if (entry) {
            if (auto task = decode_or_dead_letter(*entry)) {
                spdlog::debug("[TaskQueue] Dequeued task {} seq={} retry_count={}",
                              task->id, task->delivery_token, task->retry_count);
                return task;
            }
            continue;
        }

        auto now = steady_clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }
        auto remaining = duration_cast<milliseconds>(deadline - now);
        token.sleep_for(std::min(interval, remaining));
        interval = std::min(
            milliseconds(static_cast<int64_t>(interval.count() * config_.backoff_multiplier)),
            max_interval);
    }
}

std::optional<TaskQueue::RawEntry> TaskQueue::read_own_pending() {
    auto result = run(R"(
        UPDATE pending_entries p
        SET delivered_at = NOW(), delivery_count = p.delivery_count + 1
        FROM stream_entries e
        WHERE p.stream = $1 AND p.group_name = $2 AND p.consumer = $3
          AND p.seq = (
              SELECT MIN(seq) FROM pending_entries
              WHERE stream = $1 AND group_name = $2 AND consumer = $3
          )
          AND e.stream = p.stream AND e.seq = p.seq
        RETURNING p.seq, e.fields
    )", {config_.stream, config_.group, consumer_name_});

    if (result.num_rows() == 0) return std::nullopt;

    spdlog::info("[TaskQueue] Redelivering own pending entry seq={}", result.get_value(0, "seq"));
    return RawEntry{std::stoll(result.get_value(0, "seq")),
                    nlohmann::json::parse(result.get_value(0, "fields"))};
}

std::optional<TaskQueue::RawEntry> TaskQueue::claim_orphaned_entry(std::chrono::milliseconds min_idle) {
    auto result = run(R"(
        UPDATE pending_entries p
        SET consumer = $3, delivered_at = NOW(), delivery_count = p.delivery_count + 1
        FROM stream_entries e
        WHERE p.stream = $1 AND p.group_name = $2
          AND p.seq = (
              SELECT seq FROM pending_entries
              WHERE stream = $1 AND group_name = $2 AND consumer <> $3
                AND delivered_at < NOW() - ($4::bigint * INTERVAL '1 millisecond')
              ORDER BY seq
              LIMIT 1
              FOR UPDATE SKIP LOCKED
          )
          AND e.stream = p.stream AND e.seq = p.seq
        RETURNING p.seq, e.fields
    )", {config_.stream, config_.group, consumer_name_, std::to_string(min_idle.count())});

    if (result.num_rows() == 0) return std::nullopt;

    spdlog::info("[TaskQueue] Claimed orphaned entry seq={} (idle > {}ms)",
                 result.get_value(0, "seq"), min_idle.count());
    return RawEntry{std::stoll(result.get_value(0, "seq")),
                    nlohmann::json::parse(result.get_value(0, "fields"))};
}

std::optional<Task> TaskQueue::claim_orphaned(std::chrono::milliseconds min_idle) {
    auto entry = with_group_recovery([&] { return claim_orphaned_entry(min_idle); });
    if (!entry) return std::nullopt;
    return decode_or_dead_letter(*entry);
}

std::optional<TaskQueue::RawEntry> TaskQueue::read_new() {
    UnitOfWork uow(db_pool_.get());

    auto group = uow.execute(
        "SELECT last_delivered_seq FROM consumer_groups WHERE stream = $1 AND group_name = $2 FOR UPDATE",
        {config_.stream, config_.group});
    if (group.num_rows() == 0) {
        throw GroupMissingError("Consumer group '" + config_.group + "' does not exist on stream '" +
                                config_.stream + "'");
    }
    std::string cursor = group.get_value(0, "last_delivered_seq");

    auto next = uow.execute(
        "SELECT seq, fields FROM stream_entries WHERE stream = $1 AND seq > $2::bigint ORDER BY seq LIMIT 1",
        {config_.stream, cursor});
    if (next.num_rows() == 0) {
        uow.rollback();
        return std::nullopt;
    }
    std::string seq = next.get_value(0, "seq");

    uow.execute(
        "UPDATE consumer_groups SET last_delivered_seq = $3::bigint WHERE stream = $1 AND group_name = $2",
        {config_.stream, config_.group, seq});
    uow.execute(
        "INSERT INTO pending_entries (stream, group_name, seq, consumer) VALUES ($1, $2, $3::bigint, $4)",
        {config_.stream, config_.group, seq, consumer_name_});
    uow.commit();

    return RawEntry{std::stoll(seq), nlohmann::json::parse(next.get_value(0, "fields"))};
}

std::optional<Task> TaskQueue::decode_or_dead_letter(const RawEntry& entry) {
    try {
        return decode_task_fields(entry.fields, entry.seq);
    } catch (const std::invalid_argument& e) {
        spdlog::error("[TaskQueue] Malformed entry seq={}: {}", entry.seq, e.what());
        dead_letter(entry.seq,
                    string_field(entry.fields, "id"),
                    string_field(entry.fields, "type"),
                    entry.fields.dump(),
                    std::string("Malformed task entry: ") + e.what(),
                    0);
        return std::nullopt;
    }
}

bool TaskQueue::dead_letter(int64_t seq, const std::string& original_id, const std::string& type,
                            const std::string& payload, const std::string& error, int retry_count) {
    // Releasing the pending entry and writing the dead letter is one statement,
    // so a task is dead-lettered at most once
    auto result = run(R"(
        WITH released AS (
            DELETE FROM pending_entries
            WHERE stream = $1 AND group_name = $2 AND seq = $3::bigint AND consumer = $9
            RETURNING seq
        )
        INSERT INTO dead_letters (stream, original_id, type, payload, error, retry_count)
        SELECT $1, $4, $5, $6, $7, $8::int FROM released
    )", {config_.stream, config_.group, std::to_string(seq), original_id, type, payload, error,
         std::to_string(retry_count), consumer_name_});

    return result.affected_rows() == 1;
}

bool TaskQueue::touch(const Task& task) {
    auto result = run(R"(
        UPDATE pending_entries SET delivered_at = NOW()
        WHERE stream = $1 AND group_name = $2 AND seq = $3::bigint AND consumer = $4
    )", {config_.stream, config_.group, std::to_string(task.delivery_token), consumer_name_});
    return result.affected_rows() == 1;
}

bool TaskQueue::ack(const Task& task) {
    auto result = with_group_recovery([&] {
        return run(
            "DELETE FROM pending_entries WHERE stream = $1 AND group_name = $2 AND seq = $3::bigint AND consumer = $4",
            {config_.stream, config_.group, std::to_string(task.delivery_token), consumer_name_});
    });

    bool released = result.affected_rows() == 1;
    if (released) {
        spdlog::debug("[TaskQueue] Acked task {} seq={}", task.id, task.delivery_token);
    } else {
        spdlog::debug("[TaskQueue] Task {} seq={} not pending on this consumer, ack ignored", task.id, task.delivery_token);
    }
    return released;
}

bool TaskQueue::retry(const Task& task, const std::string& error) {
    int next_count = task.retry_count + 1;

    if (next_count >= config_.max_retries) {
        spdlog::warn("[TaskQueue] Task {} exhausted {} retries, moving to dead-letter sink",
                     task.id, config_.max_retries);
        fail(task, "Max retries (" + std::to_string(config_.max_retries) + ") exceeded: " + error);
        return false;
    }

    return with_group_recovery([&] {
        UnitOfWork uow(db_pool_.get());

        auto released = uow.execute(
            "DELETE FROM pending_entries WHERE stream = $1 AND group_name = $2 AND seq = $3::bigint AND consumer = $4",
            {config_.stream, config_.group, std::to_string(task.delivery_token), consumer_name_});
        if (released.affected_rows() == 0) {
            uow.rollback();
            spdlog::warn("[TaskQueue] Task {} seq={} not pending on this consumer, not re-enqueued",
                         task.id, task.delivery_token);
            return false;
        }

        int64_t seq = append(uow, encode_task_fields(task.id, task.type, task.payload, next_count));
        uow.commit();

        spdlog::warn("[TaskQueue] Task {} re-enqueued as seq={} (retry {}/{}): {}",
                     task.id, seq, next_count, config_.max_retries, error);
        return true;
    });
}

bool TaskQueue::fail(const Task& task, const std::string& error) {
    bool moved = with_group_recovery([&] {
        return dead_letter(task.delivery_token, task.id, task.type, task.payload.dump(), error, task.retry_count);
    });

    if (moved) {
        spdlog::error("[TaskQueue] Task {} type={} moved to dead-letter sink: {}", task.id, task.type, error);
    } else {
        spdlog::warn("[TaskQueue] Task {} seq={} not pending on this consumer, not dead-lettered", task.id, task.delivery_token);
    }
    return moved;
}

std::vector<DeadLetterEntry> TaskQueue::dead_letters(int limit) {
    auto result = with_group_recovery([&] {
        return run(R"(
            SELECT id, original_id, type, payload, error, retry_count, failed_at
            FROM dead_letters
            WHERE stream = $1
            ORDER BY id
            LIMIT $2::int
        )", {config_.stream, std::to_string(limit)});
    });

    std::vector<DeadLetterEntry> entries;
    entries.reserve(result.num_rows());
    for (int i = 0; i < result.num_rows(); ++i) {
        DeadLetterEntry entry;
        entry.id = std::stoll(result.get_value(i, "id"));
        entry.original_id = result.get_value(i, "original_id");
        entry.type = result.get_value(i, "type");
        entry.error = result.get_value(i, "error");
        entry.retry_count = std::stoi(result.get_value(i, "retry_count"));
        entry.failed_at = result.get_value(i, "failed_at");

        // Malformed entries keep their raw text
        std::string raw_payload = result.get_value(i, "payload");
        try {
            entry.payload = nlohmann::json::parse(raw_payload);
        } catch (const nlohmann::json::parse_error&) {
            entry.payload = raw_payload;
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

int64_t TaskQueue::pending_count() {
    auto result = with_group_recovery([&] {
        return run(
            "SELECT COUNT(*) AS pending FROM pending_entries WHERE stream = $1 AND group_name = $2 AND consumer = $3",
            {config_.stream, config_.group, consumer_name_});
    });
    return std::stoll(result.get_value(0, "pending"));
}

} // namespace docflow
