#pragma once

#include <libpq-fe.h>
#include <condition_variable>
#include <cstdlib>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace docflow {

struct DatabaseConfig;

// Statement failure carrying the server's SQLSTATE
class DatabaseError : public std::runtime_error {
public:
    DatabaseError(const std::string& message, std::string sql_state)
        : std::runtime_error(message), sql_state_(std::move(sql_state)) {}

    const std::string& sql_state() const { return sql_state_; }

private:
    std::string sql_state_;
};

// Session settings applied to every connection right after it is opened
struct SessionSettings {
    int statement_timeout_ms = 30000;
    int lock_timeout_ms = 10000;
    int idle_in_transaction_timeout_ms = 0;
    std::string schema = "docflow";
};

class DatabaseConnection {
private:
    PGconn* conn_;

public:
    DatabaseConnection(const std::string& connection_string, const SessionSettings& settings);
    ~DatabaseConnection();

    DatabaseConnection(const DatabaseConnection&) = delete;
    DatabaseConnection& operator=(const DatabaseConnection&) = delete;

    bool is_valid() const;
    bool in_transaction() const;

    // Underlying handle, used by LISTEN subscribers that poll the socket
    PGconn* raw() const { return conn_; }

    // Both return nullptr when the connection is gone
    PGresult* exec(const std::string& query);
    PGresult* exec_params(const std::string& query, const std::vector<std::string>& params);

    bool begin_transaction();
    bool commit_transaction();
    bool rollback_transaction();
};

/**
 * Fixed-size set of PostgreSQL connections shared by every component of a
 * worker process. Connections that broke while idle are replaced on checkout,
 * and an exhausted pool opens an extra connection rather than failing, so the
 * process recovers once the database is reachable again.
 */
class DatabasePool {
private:
    std::deque<std::unique_ptr<DatabaseConnection>> idle_;
    mutable std::mutex mutex_;
    std::condition_variable returned_;
    std::string connection_string_;
    SessionSettings settings_;
    size_t target_size_;
    size_t open_count_ = 0;
    int acquisition_timeout_ms_;

public:
    DatabasePool(const std::string& connection_string,
                 size_t pool_size,
                 int acquisition_timeout_ms,
                 SessionSettings settings);
    ~DatabasePool();

    static std::shared_ptr<DatabasePool> from_config(const DatabaseConfig& config);

    // A connection outside the pool, owned by the caller (LISTEN sessions)
    std::unique_ptr<DatabaseConnection> create_connection();

    std::unique_ptr<DatabaseConnection> get_connection();
    void return_connection(std::unique_ptr<DatabaseConnection> conn);

    // Single statement on a borrowed connection; caller owns the result
    PGresult* query(const std::string& sql);
    PGresult* query_params(const std::string& sql, const std::vector<std::string>& params);

    const std::string& schema() const { return settings_.schema; }
};

// RAII connection wrapper
class ScopedConnection {
private:
    DatabasePool* pool_;
    std::unique_ptr<DatabaseConnection> conn_;

public:
    explicit ScopedConnection(DatabasePool* pool);
    ~ScopedConnection();

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    DatabaseConnection* operator->() { return conn_.get(); }
    DatabaseConnection& operator*() { return *conn_; }
    bool is_valid() const { return conn_ && conn_->is_valid(); }
};

// Owns a PGresult and clears it on destruction
class QueryResult {
private:
    PGresult* result_;

    int column(const std::string& field_name) const {
        return result_ ? PQfnumber(result_, field_name.c_str()) : -1;
    }

public:
    explicit QueryResult(PGresult* result) : result_(result) {}
    ~QueryResult() { if (result_) PQclear(result_); }

    QueryResult(const QueryResult&) = delete;
    QueryResult& operator=(const QueryResult&) = delete;
    QueryResult(QueryResult&& other) noexcept : result_(std::exchange(other.result_, nullptr)) {}
    QueryResult& operator=(QueryResult&& other) noexcept {
        if (this != &other) {
            if (result_) PQclear(result_);
            result_ = std::exchange(other.result_, nullptr);
        }
        return *this;
    }

    bool is_success() const {
        if (!result_) return false;
        ExecStatusType status = PQresultStatus(result_);
        return status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK;
    }

    int num_rows() const { return result_ ? PQntuples(result_) : 0; }

    // Rows touched by INSERT/UPDATE/DELETE
    int affected_rows() const {
        const char* tuples = result_ ? PQcmdTuples(result_) : nullptr;
        return (tuples && *tuples) ? std::atoi(tuples) : 0;
    }

    std::string get_value(int row, int col) const {
        if (!result_ || row < 0 || row >= num_rows() || col < 0 || col >= PQnfields(result_)) return "";
        return PQgetvalue(result_, row, col);
    }

    std::string get_value(int row, const std::string& field_name) const {
        return get_value(row, column(field_name));
    }

    bool is_null(int row, int col) const {
        return !result_ || PQgetisnull(result_, row, col);
    }

    bool is_null(int row, const std::string& field_name) const {
        int col = column(field_name);
        return col < 0 || is_null(row, col);
    }

    // Command tag, e.g. "COMMIT" or "ROLLBACK"
    std::string command_status() const {
        return result_ ? PQcmdStatus(result_) : "";
    }

    // SQLSTATE of a failed statement, e.g. "42P01" for undefined_table
    std::string sql_state() const {
        const char* state = result_ ? PQresultErrorField(result_, PG_DIAG_SQLSTATE) : nullptr;
        return state ? state : "";
    }

    std::string error_message() const {
        return result_ ? PQresultErrorMessage(result_) : "connection unavailable";
    }
};

/**
 * UnitOfWork - one database transaction over an exclusively owned connection.
 *
 * Opens a transaction on construction and rolls it back on destruction unless
 * commit() was called. Statements run through execute() are visible to later
 * statements in the same transaction immediately (flush without commit).
 * Never shared between task executions.
 */
class UnitOfWork {
private:
    DatabasePool* pool_;
    std::unique_ptr<DatabaseConnection> conn_;
    bool active_ = false;

public:
    explicit UnitOfWork(DatabasePool* pool);
    ~UnitOfWork();

    UnitOfWork(const UnitOfWork&) = delete;
    UnitOfWork& operator=(const UnitOfWork&) = delete;

    // Throws DatabaseError with the server message when the statement fails
    QueryResult execute(const std::string& sql, const std::vector<std::string>& params = {});

    void begin();
    void commit();
    void rollback();  // no-op when no transaction is open

    void savepoint(const std::string& name);
    void rollback_to_savepoint(const std::string& name);

    bool is_active() const { return active_; }
};

} // namespace docflow
