#pragma once

#include <cctype>
#include <cstdlib>
#include <string>

namespace docflow {

// Environment lookups; an unset variable yields the fallback

inline bool get_env_bool(const char* name, bool fallback) {
    const char* raw = std::getenv(name);
    if (!raw) return fallback;
    std::string value(raw);
    for (auto& c : value) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return value == "true" || value == "1" || value == "yes";
}

inline int get_env_int(const char* name, int fallback) {
    const char* raw = std::getenv(name);
    return raw && *raw ? std::atoi(raw) : fallback;
}

inline double get_env_double(const char* name, double fallback) {
    const char* raw = std::getenv(name);
    return raw && *raw ? std::atof(raw) : fallback;
}

inline std::string get_env_string(const char* name, const std::string& fallback) {
    const char* raw = std::getenv(name);
    return raw ? std::string(raw) : fallback;
}

struct DatabaseConfig {
    std::string host = "localhost";
    std::string port = "5432";
    std::string database = "postgres";
    std::string user = "postgres";
    std::string password = "postgres";
    std::string schema = "docflow";   // holds every docflow table

    bool use_ssl = false;
    bool ssl_reject_unauthorized = true;

    int pool_size = 8;
    int connection_timeout = 2000;          // ms, rounded to whole seconds for libpq
    int statement_timeout = 30000;
    int lock_timeout = 10000;
    int idle_in_transaction_timeout = 0;    // off: document transactions span minutes
    int pool_acquisition_timeout = 10000;   // wait for an idle connection before opening one

    static DatabaseConfig from_env() {
        DatabaseConfig c;
        c.host = get_env_string("PG_HOST", c.host);
        c.port = get_env_string("PG_PORT", c.port);
        c.database = get_env_string("PG_DB", c.database);
        c.user = get_env_string("PG_USER", c.user);
        c.password = get_env_string("PG_PASSWORD", c.password);
        c.schema = get_env_string("PG_SCHEMA", c.schema);
        c.use_ssl = get_env_bool("PG_USE_SSL", c.use_ssl);
        c.ssl_reject_unauthorized = get_env_bool("PG_SSL_REJECT_UNAUTHORIZED", c.ssl_reject_unauthorized);
        c.pool_size = get_env_int("DB_POOL_SIZE", c.pool_size);
        c.connection_timeout = get_env_int("DB_CONNECTION_TIMEOUT", c.connection_timeout);
        c.statement_timeout = get_env_int("DB_STATEMENT_TIMEOUT", c.statement_timeout);
        c.lock_timeout = get_env_int("DB_LOCK_TIMEOUT", c.lock_timeout);
        c.idle_in_transaction_timeout = get_env_int("DB_IDLE_IN_TRANSACTION_TIMEOUT", c.idle_in_transaction_timeout);
        c.pool_acquisition_timeout = get_env_int("DB_POOL_ACQUISITION_TIMEOUT", c.pool_acquisition_timeout);
        return c;
    }

    // libpq keyword/value string; session timeouts are applied after connect
    std::string connection_string() const {
        const char* sslmode = !use_ssl ? "disable" : (ssl_reject_unauthorized ? "require" : "prefer");
        int connect_seconds = connection_timeout >= 1000 ? connection_timeout / 1000 : 1;

        return "host=" + host + " port=" + port + " dbname=" + database +
               " user=" + user + " password=" + password +
               " sslmode=" + sslmode +
               " connect_timeout=" + std::to_string(connect_seconds) +
               " application_name=docflow-worker";
    }
};

struct QueueConfig {
    // Log and consumer group names
    std::string stream = "docflow:tasks";
    std::string group = "docflow:workers";

    // Retry outcome: re-enqueue until max_retries, then dead-letter
    int max_retries = 3;

    // dequeue() blocking window and poll backoff while waiting for new entries
    int block_ms = 5000;
    int poll_interval_ms = 100;
    int max_poll_interval_ms = 1000;
    double backoff_multiplier = 2.0;

    // dequeue() takes over entries another consumer left untouched this long.
    // 0 keeps pending work with its consumer; recovery then goes through
    // an explicit claim_orphaned() call.
    int claim_min_idle_ms = 0;

    // In-flight deliveries are touched this often so they never look idle
    int heartbeat_interval_ms = 30000;

    static QueueConfig from_env() {
        QueueConfig config;
        config.stream = get_env_string("QUEUE_STREAM", "docflow:tasks");
        config.group = get_env_string("QUEUE_GROUP", "docflow:workers");
        config.max_retries = get_env_int("QUEUE_MAX_RETRIES", 3);
        config.block_ms = get_env_int("QUEUE_BLOCK_MS", 5000);
        config.poll_interval_ms = get_env_int("QUEUE_POLL_INTERVAL", 100);
        config.max_poll_interval_ms = get_env_int("QUEUE_MAX_POLL_INTERVAL", 1000);
        config.backoff_multiplier = get_env_double("QUEUE_BACKOFF_MULTIPLIER", 2.0);
        config.claim_min_idle_ms = get_env_int("QUEUE_CLAIM_MIN_IDLE_MS", 0);
        config.heartbeat_interval_ms = get_env_int("QUEUE_HEARTBEAT_INTERVAL_MS", 30000);
        return config;
    }
};

struct ProgressConfig {
    int ttl_seconds = 3600;  // 1 hour
    std::string channel_prefix = "docflow_progress_";
    int purge_interval_seconds = 60;

    static ProgressConfig from_env() {
        ProgressConfig config;
        config.ttl_seconds = get_env_int("PROGRESS_TTL_SECONDS", 3600);
        config.channel_prefix = get_env_string("PROGRESS_CHANNEL_PREFIX", "docflow_progress_");
        config.purge_interval_seconds = get_env_int("PROGRESS_PURGE_INTERVAL_SECONDS", 60);
        return config;
    }
};

struct WorkerConfig {
    int concurrency = 1;                  // WorkerManagers (run loops) per process
    int error_backoff_ms = 1000;          // Sleep after a backend error in the run loop

    // Document handler deadlines
    int document_timeout_ms = 600000;     // 10 minutes overall
    int download_timeout_ms = 120000;     // 2 minutes
    int parse_timeout_ms = 60000;         // 1 minute
    int extract_timeout_ms = 600000;      // 10 minutes

    static WorkerConfig from_env() {
        WorkerConfig config;
        config.concurrency = get_env_int("WORKER_CONCURRENCY", 1);
        config.error_backoff_ms = get_env_int("WORKER_ERROR_BACKOFF_MS", 1000);
        config.document_timeout_ms = get_env_int("WORKER_DOCUMENT_TIMEOUT_MS", 600000);
        config.download_timeout_ms = get_env_int("WORKER_DOWNLOAD_TIMEOUT_MS", 120000);
        config.parse_timeout_ms = get_env_int("WORKER_PARSE_TIMEOUT_MS", 60000);
        config.extract_timeout_ms = get_env_int("WORKER_EXTRACT_TIMEOUT_MS", 600000);
        return config;
    }
};

struct StorageConfig {
    // Objects are fetched from <public_base_url>/<bucket>/<key>
    std::string public_base_url = "http://localhost:9000";
    std::string bucket = "documents";
    int request_timeout_ms = 30000;

    static StorageConfig from_env() {
        StorageConfig config;
        config.public_base_url = get_env_string("STORAGE_PUBLIC_BASE_URL", "http://localhost:9000");
        config.bucket = get_env_string("STORAGE_BUCKET", "documents");
        config.request_timeout_ms = get_env_int("STORAGE_REQUEST_TIMEOUT_MS", 30000);
        return config;
    }
};

struct MathpixConfig {
    std::string app_id = "";
    std::string app_key = "";
    std::string base_url = "https://api.mathpix.com";
    int request_timeout_ms = 30000;
    int poll_interval_ms = 2000;
    int max_polls = 300;

    static MathpixConfig from_env() {
        MathpixConfig config;
        config.app_id = get_env_string("MATHPIX_APP_ID", "");
        config.app_key = get_env_string("MATHPIX_APP_KEY", "");
        config.base_url = get_env_string("MATHPIX_BASE_URL", "https://api.mathpix.com");
        config.request_timeout_ms = get_env_int("MATHPIX_REQUEST_TIMEOUT_MS", 30000);
        config.poll_interval_ms = get_env_int("MATHPIX_POLL_INTERVAL_MS", 2000);
        config.max_polls = get_env_int("MATHPIX_MAX_POLLS", 300);
        return config;
    }

    bool is_configured() const {
        return !app_id.empty() && !app_key.empty();
    }
};

struct LoggingConfig {
    std::string log_level = "info";

    static LoggingConfig from_env() {
        LoggingConfig config;
        config.log_level = get_env_string("LOG_LEVEL", "info");
        return config;
    }
};

struct Config {
    DatabaseConfig database;
    QueueConfig queue;
    ProgressConfig progress;
    WorkerConfig worker;
    StorageConfig storage;
    MathpixConfig mathpix;
    LoggingConfig logging;

    static Config load() {
        Config config;
        config.database = DatabaseConfig::from_env();
        config.queue = QueueConfig::from_env();
        config.progress = ProgressConfig::from_env();
        config.worker = WorkerConfig::from_env();
        config.storage = StorageConfig::from_env();
        config.mathpix = MathpixConfig::from_env();
        config.logging = LoggingConfig::from_env();
        return config;
    }
};

} // namespace docflow
