#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace docflow {

// ============================================================================
// Task types shared by the queue, the handlers and the worker loop
// ============================================================================

// Closed set of task kinds the worker knows how to run
enum class TaskType {
    DocumentProcess,
};

const char* to_string(TaskType type);
std::optional<TaskType> parse_task_type(const std::string& tag);

struct Task {
    std::string id;               // Application id, kept across retries
    std::string type;             // Wire tag; may be unknown to this worker
    nlohmann::json payload = nlohmann::json::object();
    int64_t delivery_token = 0;   // Log sequence number, needed to ack
    int retry_count = 0;
};

struct DeadLetterEntry {
    int64_t id = 0;
    std::string original_id;
    std::string type;
    nlohmann::json payload;
    std::string error;
    int retry_count = 0;
    std::string failed_at;
};

/**
 * Error raised by task execution.
 *
 * retryable decides between the retry and dead-letter outcomes in the
 * worker loop.
 */
class TaskError : public std::runtime_error {
public:
    TaskError(const std::string& message, bool retryable)
        : std::runtime_error(message), retryable_(retryable) {}

    bool retryable() const { return retryable_; }

private:
    bool retryable_;
};

// Log entry wire shape: {"id", "type", "payload", "retry_count"}, all strings
nlohmann::json encode_task_fields(const std::string& id,
                                  const std::string& type,
                                  const nlohmann::json& payload,
                                  int retry_count);

// Throws std::invalid_argument if a field is missing or cannot be parsed
Task decode_task_fields(const nlohmann::json& fields, int64_t delivery_token);

// UUIDv7 string, time ordered
std::string generate_task_id();

// "worker-<8 hex>" with an optional "-<suffix>"
std::string generate_consumer_name(const std::optional<int>& suffix = std::nullopt);

} // namespace docflow
