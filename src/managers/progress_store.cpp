#include "docflow/progress_store.hpp"
#include "docflow/schema.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>

// For select() system call (POSIX)
#include <sys/select.h>

namespace docflow {

nlohmann::json Progress::to_json() const {
    nlohmann::json j = {
        {"subject_id", subject_id},
        {"page", page},
        {"total", total},
        {"status", status},
    };
    j["message"] = message ? nlohmann::json(*message) : nlohmann::json(nullptr);
    return j;
}

Progress Progress::from_json(const nlohmann::json& j) {
    Progress progress;
    progress.subject_id = j.at("subject_id").get<int64_t>();
    progress.page = j.at("page").get<int>();
    progress.total = j.at("total").get<int>();
    progress.status = j.at("status").get<ProgressStatus>();
    if (j.contains("message") && j["message"].is_string()) {
        progress.message = j["message"].get<std::string>();
    }
    return progress;
}

// --- ProgressSubscription ---

ProgressSubscription::ProgressSubscription(std::unique_ptr<DatabaseConnection> conn, std::string channel)
    : conn_(std::move(conn)), channel_(std::move(channel)) {
    if (!conn_ || !conn_->is_valid()) {
        throw std::runtime_error("Progress subscription needs a live connection");
    }
    QueryResult result(conn_->exec("LISTEN " + quote_identifier(*conn_, channel_)));
    if (!result.is_success()) {
        throw std::runtime_error("LISTEN " + channel_ + " failed: " + result.error_message());
    }
    spdlog::debug("[ProgressStore] Subscribed to {}", channel_);
}

ProgressSubscription::~ProgressSubscription() {
    if (conn_ && conn_->is_valid()) {
        QueryResult result(conn_->exec("UNLISTEN *"));
        if (!result.is_success()) {
            spdlog::warn("[ProgressStore] UNLISTEN on {} failed: {}", channel_, result.error_message());
        }
    }
}

std::optional<Progress> ProgressSubscription::take_notification() {
    while (PGnotify* notify = PQnotifies(conn_->raw())) {
        std::string payload = notify->extra ? notify->extra : "";
        std::string relname = notify->relname ? notify->relname : "";
        PQfreemem(notify);

        if (relname != channel_) continue;

        try {
            return Progress::from_json(nlohmann::json::parse(payload));
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("[ProgressStore] Dropping unreadable update on {}: {}", channel_, e.what());
        }
    }
    return std::nullopt;
}

std::optional<Progress> ProgressSubscription::next(const CancellationToken& token,
                                                   std::chrono::milliseconds timeout) {
    using namespace std::chrono;
    constexpr auto slice = milliseconds(100);

    // Notifications may already be buffered from an earlier read
    if (auto progress = take_notification()) return progress;

    PGconn* conn = conn_->raw();
    int sock_fd = PQsocket(conn);
    if (sock_fd < 0) {
        throw std::runtime_error("PQsocket returned invalid file descriptor.");
    }

    const auto deadline = steady_clock::now() + timeout;
    while (true) {
        token.throw_if_cancelled();

        auto now = steady_clock::now();
        if (now >= deadline) return std::nullopt;
        auto wait = std::min(slice, duration_cast<milliseconds>(deadline - now));

        fd_set fds;
        FD_ZERO(&fds);
        FD_SET(sock_fd, &fds);
        timeval tv;
        tv.tv_sec = static_cast<long>(wait.count() / 1000);
        tv.tv_usec = static_cast<long>((wait.count() % 1000) * 1000);

        int ret = select(sock_fd + 1, &fds, nullptr, nullptr, &tv);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("select() failed: " + std::string(strerror(errno)));
        }
        if (ret == 0) continue;

        if (!PQconsumeInput(conn)) {
            throw std::runtime_error(std::string("PQconsumeInput failed: ") + PQerrorMessage(conn));
        }
        if (auto progress = take_notification()) return progress;
    }
}

// --- ProgressStore ---

ProgressStore::ProgressStore(std::shared_ptr<DatabasePool> db_pool, const ProgressConfig& config)
    : db_pool_(std::move(db_pool)), config_(config) {
    if (!db_pool_) {
        throw std::invalid_argument("Database pool cannot be null");
    }
}

std::string ProgressStore::channel_for(int64_t subject_id) const {
    return config_.channel_prefix + std::to_string(subject_id);
}

void ProgressStore::update(const Progress& progress) {
    std::string data = progress.to_json().dump();

    // Snapshot and broadcast in one statement; NOTIFY fires on commit
    QueryResult result(db_pool_->query_params(R"(
        WITH upsert AS (
            INSERT INTO progress_snapshots (subject_id, data, expires_at, updated_at)
            VALUES ($1::bigint, $2::jsonb, NOW() + ($3::int * INTERVAL '1 second'), NOW())
            ON CONFLICT (subject_id) DO UPDATE
            SET data = EXCLUDED.data, expires_at = EXCLUDED.expires_at, updated_at = NOW()
            RETURNING subject_id
        )
        SELECT pg_notify($4, $5) FROM upsert
    )", {std::to_string(progress.subject_id), data, std::to_string(config_.ttl_seconds),
         channel_for(progress.subject_id), data}));

    if (!result.is_success()) {
        throw std::runtime_error("Failed to update progress: " + result.error_message());
    }

    spdlog::debug("[ProgressStore] Progress {} page {}/{} {}",
                  progress.subject_id, progress.page, progress.total, data);
}

std::optional<Progress> ProgressStore::get(int64_t subject_id) {
    QueryResult result(db_pool_->query_params(
        "SELECT data FROM progress_snapshots WHERE subject_id = $1::bigint AND expires_at > NOW()",
        {std::to_string(subject_id)}));

    if (!result.is_success()) {
        throw std::runtime_error("Failed to read progress: " + result.error_message());
    }
    if (result.num_rows() == 0) {
        return std::nullopt;
    }
    return Progress::from_json(nlohmann::json::parse(result.get_value(0, "data")));
}

std::unique_ptr<ProgressSubscription> ProgressStore::subscribe(int64_t subject_id) {
    // LISTEN state is per session, so subscribers never share pooled connections
    return std::make_unique<ProgressSubscription>(db_pool_->create_connection(), channel_for(subject_id));
}

void ProgressStore::clear(int64_t subject_id) {
    try {
        QueryResult result(db_pool_->query_params(
            "DELETE FROM progress_snapshots WHERE subject_id = $1::bigint",
            {std::to_string(subject_id)}));
        if (!result.is_success()) {
            spdlog::warn("[ProgressStore] Failed to clear progress {}: {}", subject_id, result.error_message());
            return;
        }
        spdlog::debug("[ProgressStore] Progress {} cleared", subject_id);
    } catch (const std::exception& e) {
        spdlog::warn("[ProgressStore] Failed to clear progress {}: {}", subject_id, e.what());
    }
}

int ProgressStore::purge_expired() {
    QueryResult result(db_pool_->query("DELETE FROM progress_snapshots WHERE expires_at <= NOW()"));
    if (!result.is_success()) {
        throw std::runtime_error("Failed to purge progress: " + result.error_message());
    }
    int purged = result.affected_rows();
    if (purged > 0) {
        spdlog::debug("[ProgressStore] Purged {} expired progress snapshots", purged);
    }
    return purged;
}

} // namespace docflow
