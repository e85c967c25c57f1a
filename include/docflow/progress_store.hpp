#pragma once

#include "docflow/cancellation.hpp"
#include "docflow/config.hpp"
#include "docflow/database.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace docflow {

enum class ProgressStatus {
    Processing,
    Ready,
    Error,
};

NLOHMANN_JSON_SERIALIZE_ENUM(ProgressStatus, {
    {ProgressStatus::Processing, "processing"},
    {ProgressStatus::Ready, "ready"},
    {ProgressStatus::Error, "error"},
})

struct Progress {
    int64_t subject_id = 0;
    int page = 0;
    int total = 0;
    ProgressStatus status = ProgressStatus::Processing;
    std::optional<std::string> message;

    nlohmann::json to_json() const;
    static Progress from_json(const nlohmann::json& j);

    bool operator==(const Progress& other) const {
        return subject_id == other.subject_id && page == other.page && total == other.total &&
               status == other.status && message == other.message;
    }
    bool operator!=(const Progress& other) const { return !(*this == other); }
};

/**
 * Live feed of progress updates for one subject.
 *
 * Holds a dedicated LISTEN connection outside the pool. Only updates
 * published after subscribe() returned are seen. Destroying the
 * subscription stops listening.
 */
class ProgressSubscription {
public:
    ProgressSubscription(std::unique_ptr<DatabaseConnection> conn, std::string channel);
    ~ProgressSubscription();

    ProgressSubscription(const ProgressSubscription&) = delete;
    ProgressSubscription& operator=(const ProgressSubscription&) = delete;

    // Next published update, or nullopt if none arrived within timeout.
    // Throws OperationCancelled if the token fires while waiting.
    std::optional<Progress> next(const CancellationToken& token, std::chrono::milliseconds timeout);

    const std::string& channel() const { return channel_; }

private:
    std::unique_ptr<DatabaseConnection> conn_;
    std::string channel_;

    std::optional<Progress> take_notification();
};

/**
 * ProgressStore - last-write-wins progress snapshots with a TTL, fanned out
 * to subscribers over NOTIFY on channel <prefix><subject_id>.
 */
class ProgressStore {
public:
    ProgressStore(std::shared_ptr<DatabasePool> db_pool, const ProgressConfig& config);

    void update(const Progress& progress);
    std::optional<Progress> get(int64_t subject_id);
    std::unique_ptr<ProgressSubscription> subscribe(int64_t subject_id);

    // Best effort: failures are logged, never thrown
    void clear(int64_t subject_id);

    // Returns the number of snapshots removed
    int purge_expired();

    std::string channel_for(int64_t subject_id) const;

private:
    std::shared_ptr<DatabasePool> db_pool_;
    ProgressConfig config_;
};

} // namespace docflow
