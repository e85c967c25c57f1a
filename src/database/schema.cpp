#include "docflow/schema.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace docflow {

std::string quote_identifier(DatabaseConnection& conn, const std::string& name) {
    char* escaped = PQescapeIdentifier(conn.raw(), name.c_str(), name.size());
    if (!escaped) {
        throw std::runtime_error(std::string("Failed to escape identifier: ") + PQerrorMessage(conn.raw()));
    }
    std::string quoted(escaped);
    PQfreemem(escaped);
    return quoted;
}

bool initialize_schema(DatabasePool& pool) {
    try {
        ScopedConnection conn(&pool);

        spdlog::info("Initializing schema: {}", pool.schema());

        // Serialize concurrent bootstraps; CREATE ... IF NOT EXISTS races on the catalog
        if (!conn->begin_transaction()) {
            spdlog::error("Failed to begin schema transaction: {}", PQerrorMessage(conn->raw()));
            return false;
        }
        auto lock_result = QueryResult(conn->exec("SELECT pg_advisory_xact_lock(hashtext('docflow_schema_init'))"));
        if (!lock_result.is_success()) {
            spdlog::error("Failed to lock schema initialization: {}", lock_result.error_message());
            conn->rollback_transaction();
            return false;
        }

        auto schema_result = QueryResult(conn->exec(
            "CREATE SCHEMA IF NOT EXISTS " + quote_identifier(*conn, pool.schema())));
        if (!schema_result.is_success()) {
            spdlog::error("Failed to create schema: {}", schema_result.error_message());
            conn->rollback_transaction();
            return false;
        }

        // Unqualified names resolve through the connection's search_path
        std::string create_tables_sql = R"(
            CREATE TABLE IF NOT EXISTS documents (
                id BIGSERIAL PRIMARY KEY,
                filename VARCHAR(255) NOT NULL,
                s3_key VARCHAR(512) NOT NULL UNIQUE,
                status VARCHAR(20) NOT NULL DEFAULT 'uploaded',
                progress JSONB NOT NULL DEFAULT '{"page": 0, "total": 0}',
                error TEXT,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                processed_at TIMESTAMPTZ
            );

            CREATE TABLE IF NOT EXISTS document_lines (
                id BIGSERIAL PRIMARY KEY,
                document_id BIGINT NOT NULL REFERENCES documents(id) ON DELETE CASCADE,
                page_number INTEGER NOT NULL,
                line_number INTEGER NOT NULL,
                text TEXT NOT NULL,
                line_type VARCHAR(50) NOT NULL DEFAULT 'text',
                font_size INTEGER,
                is_printed BOOLEAN NOT NULL DEFAULT TRUE,
                is_handwritten BOOLEAN NOT NULL DEFAULT FALSE,
                confidence DOUBLE PRECISION,
                region JSONB,
                raw_metadata JSONB,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                CONSTRAINT uq_document_lines_document_page_line UNIQUE (document_id, page_number, line_number)
            );

            CREATE TABLE IF NOT EXISTS progress_snapshots (
                subject_id BIGINT PRIMARY KEY,
                data JSONB NOT NULL,
                expires_at TIMESTAMPTZ NOT NULL,
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            );
        )";

        auto tables_result = QueryResult(conn->exec(create_tables_sql));
        if (!tables_result.is_success()) {
            spdlog::error("Failed to create tables: {}", tables_result.error_message());
            conn->rollback_transaction();
            return false;
        }

        std::string create_indexes_sql = R"(
            CREATE INDEX IF NOT EXISTS idx_documents_status ON documents(status);
            CREATE INDEX IF NOT EXISTS idx_document_lines_document ON document_lines(document_id);
            CREATE INDEX IF NOT EXISTS idx_document_lines_page ON document_lines(document_id, page_number);
            CREATE INDEX IF NOT EXISTS idx_progress_snapshots_expires ON progress_snapshots(expires_at);
        )";

        auto indexes_result = QueryResult(conn->exec(create_indexes_sql));
        if (!indexes_result.is_success()) {
            spdlog::error("Failed to create indexes: {}", indexes_result.error_message());
            conn->rollback_transaction();
            return false;
        }

        if (!conn->commit_transaction()) {
            spdlog::error("Failed to commit schema: {}", PQerrorMessage(conn->raw()));
            return false;
        }

        spdlog::info("Schema initialized");
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Schema initialization failed: {}", e.what());
        return false;
    }
}

} // namespace docflow
