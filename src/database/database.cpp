#include "docflow/database.hpp"
#include "docflow/config.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>

namespace docflow {

namespace {

std::string quoted_identifier(PGconn* conn, const std::string& name) {
    char* escaped = PQescapeIdentifier(conn, name.c_str(), name.size());
    if (!escaped) {
        throw std::runtime_error(std::string("Invalid schema name: ") + PQerrorMessage(conn));
    }
    std::string quoted(escaped);
    PQfreemem(escaped);
    return quoted;
}

// SET rather than startup options so the settings survive PgBouncer
std::string session_statement(PGconn* conn, const SessionSettings& settings) {
    return "SET statement_timeout = " + std::to_string(settings.statement_timeout_ms) +
           "; SET lock_timeout = " + std::to_string(settings.lock_timeout_ms) +
           "; SET idle_in_transaction_session_timeout = " + std::to_string(settings.idle_in_transaction_timeout_ms) +
           "; SET search_path TO " + quoted_identifier(conn, settings.schema) + ", public";
}

} // anonymous namespace

DatabaseConnection::DatabaseConnection(const std::string& connection_string, const SessionSettings& settings)
    : conn_(PQconnectdb(connection_string.c_str())) {
    std::string failure;
    if (PQstatus(conn_) != CONNECTION_OK) {
        failure = std::string("Failed to connect to database: ") + PQerrorMessage(conn_);
    } else {
        PQsetClientEncoding(conn_, "UTF8");
        try {
            QueryResult applied(PQexec(conn_, session_statement(conn_, settings).c_str()));
            if (!applied.is_success()) {
                failure = "Failed to set session parameters: " + applied.error_message();
            }
        } catch (const std::runtime_error& e) {
            failure = e.what();
        }
    }

    if (!failure.empty()) {
        PQfinish(conn_);
        conn_ = nullptr;
        throw std::runtime_error(failure);
    }
}

DatabaseConnection::~DatabaseConnection() {
    if (conn_) PQfinish(conn_);
}

bool DatabaseConnection::is_valid() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

bool DatabaseConnection::in_transaction() const {
    return is_valid() && PQtransactionStatus(conn_) != PQTRANS_IDLE;
}

PGresult* DatabaseConnection::exec(const std::string& query) {
    return is_valid() ? PQexec(conn_, query.c_str()) : nullptr;
}

PGresult* DatabaseConnection::exec_params(const std::string& query, const std::vector<std::string>& params) {
    if (!is_valid()) return nullptr;

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& param : params) {
        values.push_back(param.c_str());
    }

    return PQexecParams(conn_, query.c_str(), static_cast<int>(values.size()),
                        nullptr, values.data(), nullptr, nullptr, 0);
}

bool DatabaseConnection::begin_transaction() {
    return QueryResult(exec("BEGIN")).is_success();
}

bool DatabaseConnection::commit_transaction() {
    return QueryResult(exec("COMMIT")).is_success();
}

bool DatabaseConnection::rollback_transaction() {
    return QueryResult(exec("ROLLBACK")).is_success();
}

DatabasePool::DatabasePool(const std::string& connection_string,
                           size_t pool_size,
                           int acquisition_timeout_ms,
                           SessionSettings settings)
    : connection_string_(connection_string),
      settings_(std::move(settings)),
      target_size_(pool_size),
      acquisition_timeout_ms_(acquisition_timeout_ms) {

    std::string last_error;
    for (size_t i = 0; i < target_size_; ++i) {
        try {
            idle_.push_back(create_connection());
            ++open_count_;
        } catch (const std::exception& e) {
            last_error = e.what();
            spdlog::error("[DatabasePool] Failed to open connection {}/{}: {}", i + 1, target_size_, last_error);
        }
    }

    if (open_count_ == 0) {
        throw std::runtime_error("No database connection could be opened: " + last_error);
    }

    spdlog::info("[DatabasePool] Ready with {}/{} connections (schema: {}, acquisition timeout: {}ms)",
                 open_count_, target_size_, settings_.schema, acquisition_timeout_ms_);
}

DatabasePool::~DatabasePool() {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_.clear();
}

std::shared_ptr<DatabasePool> DatabasePool::from_config(const DatabaseConfig& config) {
    SessionSettings settings;
    settings.statement_timeout_ms = config.statement_timeout;
    settings.lock_timeout_ms = config.lock_timeout;
    settings.idle_in_transaction_timeout_ms = config.idle_in_transaction_timeout;
    settings.schema = config.schema;

    return std::make_shared<DatabasePool>(config.connection_string(),
                                          static_cast<size_t>(config.pool_size > 0 ? config.pool_size : 1),
                                          config.pool_acquisition_timeout,
                                          std::move(settings));
}

std::unique_ptr<DatabaseConnection> DatabasePool::create_connection() {
    return std::make_unique<DatabaseConnection>(connection_string_, settings_);
}

std::unique_ptr<DatabaseConnection> DatabasePool::get_connection() {
    std::unique_lock<std::mutex> lock(mutex_);

    bool available = returned_.wait_for(lock, std::chrono::milliseconds(acquisition_timeout_ms_),
                                        [this] { return !idle_.empty(); });

    if (available) {
        auto conn = std::move(idle_.front());
        idle_.pop_front();
        if (conn->is_valid()) {
            return conn;
        }
        // Dropped while idle (server restart, network): reopen in its place
        spdlog::warn("[DatabasePool] Discarding broken idle connection");
        --open_count_;
    } else {
        spdlog::warn("[DatabasePool] No connection returned within {}ms ({} open), opening another",
                     acquisition_timeout_ms_, open_count_);
    }

    lock.unlock();
    std::unique_ptr<DatabaseConnection> fresh;
    try {
        fresh = create_connection();
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Database connection unavailable: ") + e.what());
    }
    lock.lock();
    ++open_count_;
    return fresh;
}

void DatabasePool::return_connection(std::unique_ptr<DatabaseConnection> conn) {
    if (!conn) return;

    if (conn->in_transaction()) {
        spdlog::warn("[DatabasePool] Connection returned inside a transaction, rolling back");
        if (!conn->rollback_transaction()) {
            spdlog::error("[DatabasePool] Rollback failed: {}", PQerrorMessage(conn->raw()));
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!conn->is_valid()) {
        // The next checkout reopens; only the open count changes here
        --open_count_;
        spdlog::warn("[DatabasePool] Dropped broken connection ({} open)", open_count_);
        return;
    }

    if (open_count_ > target_size_) {
        // Extra connection opened under pressure
        --open_count_;
        return;
    }

    idle_.push_back(std::move(conn));
    returned_.notify_one();
}

PGresult* DatabasePool::query(const std::string& sql) {
    ScopedConnection conn(this);
    return conn->exec(sql);
}

PGresult* DatabasePool::query_params(const std::string& sql, const std::vector<std::string>& params) {
    ScopedConnection conn(this);
    return conn->exec_params(sql, params);
}

ScopedConnection::ScopedConnection(DatabasePool* pool) : pool_(pool) {
    if (!pool_) {
        throw std::invalid_argument("Database pool cannot be null");
    }
    conn_ = pool_->get_connection();
}

ScopedConnection::~ScopedConnection() {
    if (conn_) pool_->return_connection(std::move(conn_));
}

UnitOfWork::UnitOfWork(DatabasePool* pool) : pool_(pool) {
    if (!pool_) {
        throw std::invalid_argument("Database pool cannot be null");
    }
    conn_ = pool_->get_connection();
    try {
        begin();
    } catch (...) {
        pool_->return_connection(std::move(conn_));
        throw;
    }
}

UnitOfWork::~UnitOfWork() {
    if (!conn_) return;
    if (active_ && !conn_->rollback_transaction()) {
        spdlog::warn("[UnitOfWork] Rollback on release failed: {}", PQerrorMessage(conn_->raw()));
    }
    pool_->return_connection(std::move(conn_));
}

QueryResult UnitOfWork::execute(const std::string& sql, const std::vector<std::string>& params) {
    QueryResult result(params.empty() ? conn_->exec(sql) : conn_->exec_params(sql, params));
    if (!result.is_success()) {
        throw DatabaseError("Query failed: " + result.error_message(), result.sql_state());
    }
    return result;
}

void UnitOfWork::begin() {
    if (active_) return;
    if (!conn_->begin_transaction()) {
        throw std::runtime_error(std::string("Failed to begin transaction: ") + PQerrorMessage(conn_->raw()));
    }
    active_ = true;
}

void UnitOfWork::commit() {
    if (!active_) {
        throw std::logic_error("commit() without an open transaction");
    }
    active_ = false;
    QueryResult result(conn_->exec("COMMIT"));
    if (!result.is_success()) {
        throw std::runtime_error("Failed to commit transaction: " + result.error_message());
    }
    // COMMIT of an aborted transaction reports success with a ROLLBACK tag
    if (result.command_status() == "ROLLBACK") {
        throw std::runtime_error("Transaction was aborted and has been rolled back");
    }
}

void UnitOfWork::rollback() {
    if (!active_) return;
    active_ = false;
    if (!conn_->rollback_transaction()) {
        throw std::runtime_error(std::string("Failed to roll back transaction: ") + PQerrorMessage(conn_->raw()));
    }
}

void UnitOfWork::savepoint(const std::string& name) {
    execute("SAVEPOINT " + name);
}

void UnitOfWork::rollback_to_savepoint(const std::string& name) {
    execute("ROLLBACK TO SAVEPOINT " + name);
}

} // namespace docflow
