#include "docflow/config.hpp"
#include "docflow/database.hpp"
#include "docflow/document_handler.hpp"
#include "docflow/handler_registry.hpp"
#include "docflow/object_storage.hpp"
#include "docflow/progress_store.hpp"
#include "docflow/schema.hpp"
#include "docflow/structuring_client.hpp"
#include "docflow/task_queue.hpp"
#include "docflow/worker_manager.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_shutdown{false};

void signal_handler(int) {
    g_shutdown.store(true);
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  --concurrency N        Worker loops in this process (default: WORKER_CONCURRENCY or 1)\n"
              << "  --enqueue DOCUMENT_ID  Enqueue a document:process task and exit\n"
              << "  --log-level LEVEL      trace, debug, info, warn, error (default: LOG_LEVEL or info)\n"
              << "  --dev                  Enable debug logging\n"
              << "  --help                 Show this help message\n"
              << "\n"
              << "Environment variables:\n"
              << "  PG_HOST, PG_PORT, PG_DB, PG_USER, PG_PASSWORD, PG_SCHEMA   PostgreSQL connection\n"
              << "  DB_POOL_SIZE           Database pool size (default: 8)\n"
              << "  QUEUE_STREAM           Task log name (default: docflow:tasks)\n"
              << "  QUEUE_GROUP            Consumer group (default: docflow:workers)\n"
              << "  QUEUE_MAX_RETRIES      Attempts before dead-lettering (default: 3)\n"
              << "  QUEUE_CLAIM_MIN_IDLE_MS  Take over deliveries idle this long (default: 0, off)\n"
              << "  QUEUE_HEARTBEAT_INTERVAL_MS  Touch interval of the task in flight (default: 30000)\n"
              << "  STORAGE_PUBLIC_BASE_URL, STORAGE_BUCKET                    Document storage\n"
              << "  MATHPIX_APP_ID, MATHPIX_APP_KEY                            Mathpix credentials\n"
              << std::endl;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // Set up logging
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

    docflow::Config config = docflow::Config::load();
    spdlog::set_level(spdlog::level::from_str(config.logging.log_level));

    std::optional<int64_t> enqueue_document;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--concurrency" && i + 1 < argc) {
            config.worker.concurrency = std::atoi(argv[++i]);
        } else if (arg == "--enqueue" && i + 1 < argc) {
            enqueue_document = std::atoll(argv[++i]);
        } else if (arg == "--log-level" && i + 1 < argc) {
            config.logging.log_level = argv[++i];
            spdlog::set_level(spdlog::level::from_str(config.logging.log_level));
        } else if (arg == "--dev") {
            spdlog::set_level(spdlog::level::debug);
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config.worker.concurrency < 1) {
        std::cerr << "--concurrency must be at least 1" << std::endl;
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        spdlog::info("docflow worker");
        spdlog::info("Configuration:");
        spdlog::info("  - Database: {}:{}/{} (schema {})", config.database.host, config.database.port,
                     config.database.database, config.database.schema);
        spdlog::info("  - Stream: {} / group {}", config.queue.stream, config.queue.group);
        spdlog::info("  - Concurrency: {}", config.worker.concurrency);
        spdlog::info("  - Max retries: {}", config.queue.max_retries);

        auto db_pool = docflow::DatabasePool::from_config(config.database);
        if (!docflow::initialize_schema(*db_pool)) {
            spdlog::error("Failed to initialize schema");
            return 1;
        }

        if (enqueue_document) {
            docflow::TaskQueue queue(db_pool, config.queue);
            queue.setup();
            auto id = queue.enqueue(docflow::TaskType::DocumentProcess, {{"document_id", *enqueue_document}});
            std::cout << id << std::endl;
            return 0;
        }

        auto progress = std::make_shared<docflow::ProgressStore>(db_pool, config.progress);
        auto storage = std::make_shared<docflow::HttpObjectStorage>(config.storage);

        std::shared_ptr<docflow::StructuringClient> structuring;
        if (config.mathpix.is_configured()) {
            structuring = std::make_shared<docflow::MathpixClient>(config.mathpix);
        } else {
            spdlog::warn("Mathpix credentials not configured, document extraction disabled");
        }

        auto handlers = std::make_shared<docflow::HandlerRegistry>();
        handlers->add(docflow::TaskType::DocumentProcess,
                      docflow::DocumentHandler(db_pool, storage, progress, structuring, config.worker));

        std::vector<std::unique_ptr<docflow::WorkerManager>> managers;
        for (int i = 0; i < config.worker.concurrency; ++i) {
            std::optional<int> index;
            if (config.worker.concurrency > 1) index = i;
            managers.push_back(std::make_unique<docflow::WorkerManager>(
                db_pool, progress, handlers, config.queue, config.worker, config.progress, index));
            managers.back()->start();
        }

        spdlog::info("Worker started with {} consumer(s)", managers.size());

        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        spdlog::info("Shutdown requested, stopping workers...");
        for (auto& manager : managers) {
            manager->stop();
        }

        uint64_t processed = 0;
        uint64_t failed = 0;
        for (const auto& manager : managers) {
            processed += manager->processed_count();
            failed += manager->failed_count();
        }
        spdlog::info("Worker exited cleanly (processed={}, failed={})", processed, failed);

    } catch (const std::exception& e) {
        spdlog::error("Worker error: {}", e.what());
        return 1;
    }

    return 0;
}
