/**
 * Worker Tests
 *
 * Runs against a live PostgreSQL (PG_HOST etc.). Object storage and the
 * structuring service are replaced by in-process fakes.
 *
 * 1. Handler executions commit on success and roll back on failure
 * 2. Deadlines and step timeouts become retryable task errors
 * 3. A document is extracted, stored and reported as ready
 * 4. Document failures end in status "error" with the work rolled back
 * 5. The worker loop settles success, failure and unknown types
 * 6. Retryable failures are retried up to the cap
 * 7. stop() leaves the task in flight pending
 * 8. Reprocessing replaces lines; unreadable page trees and slow storage
 * 9. A task in flight is kept alive and cannot be claimed by a sibling
 */

#include "test_support.hpp"
#include "docflow/database.hpp"
#include "docflow/document_handler.hpp"
#include "docflow/handler_registry.hpp"
#include "docflow/progress_store.hpp"
#include "docflow/schema.hpp"
#include "docflow/task_handler.hpp"
#include "docflow/task_queue.hpp"
#include "docflow/worker_manager.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <thread>

using namespace docflow;
using namespace std::chrono;

namespace {

std::shared_ptr<DatabasePool> g_pool;

class FakeStorage : public ObjectStorage {
public:
    explicit FakeStorage(std::string pdf, milliseconds url_delay = milliseconds(0))
        : pdf_(std::move(pdf)), url_delay_(url_delay) {}

    std::string download(const std::string& key) override {
        if (pdf_.empty()) throw std::runtime_error("NoSuchKey: " + key);
        return pdf_;
    }

    std::string public_url(const std::string& key) override {
        std::this_thread::sleep_for(url_delay_);
        return "https://storage.test/documents/" + key;
    }

private:
    std::string pdf_;
    milliseconds url_delay_;
};

class FakeStructuring : public StructuringClient {
public:
    enum class Mode { Succeed, FailRetryable, FailPermanent, Block };

    explicit FakeStructuring(Mode mode) : mode_(mode) {}

    nlohmann::json extract(const std::string& url, const CancellationToken& token) override {
        ++calls;
        switch (mode_) {
            case Mode::FailRetryable:
                throw StructuringError("Mathpix request failed: connection reset", true);
            case Mode::FailPermanent:
                throw StructuringError("Mathpix processing error: unsupported file", false);
            case Mode::Block:
                started = true;
                token.sleep_for(seconds(30));
                return nlohmann::json::object();
            case Mode::Succeed:
                break;
        }
        return {
            {"pages", {
                {{"page", 1}, {"lines", {
                    {{"text", "Chapter 1"}, {"type", "header"}},
                    {{"text", ""}},
                    {{"text", "a^2 + b^2 = c^2"}, {"type", "math"}},
                }}},
                {{"page", 2}, {"lines", {
                    {{"text", "The end."}, {"type", "text"}},
                }}},
            }},
        };
    }

    std::atomic<int> calls{0};
    std::atomic<bool> started{false};

private:
    Mode mode_;
};

// Generic handler for exercising execute_task directly
struct ScriptedHandler {
    std::shared_ptr<DatabasePool> db_pool;
    milliseconds limit;
    std::function<void(const Task&, TaskContext&)> body;

    const char* name() const { return "ScriptedHandler"; }
    milliseconds timeout() const { return limit; }
    DatabasePool& pool() const { return *db_pool; }
    void process(const Task& task, TaskContext& ctx) const { body(task, ctx); }
};

std::string two_page_pdf() {
    return "%PDF-1.4\n"
           "1 0 obj\n<< /Type /Pages /Kids [2 0 R 3 0 R] /Count 2 >>\nendobj\n"
           "2 0 obj\n<< /Type /Page /Parent 1 0 R >>\nendobj\n"
           "3 0 obj\n<< /Type /Page /Parent 1 0 R >>\nendobj\n%%EOF\n";
}

int64_t create_document() {
    QueryResult result(g_pool->query_params(
        "INSERT INTO documents (filename, s3_key, status) VALUES ('report.pdf', $1, 'uploaded') RETURNING id",
        {"uploads/" + generate_task_id() + ".pdf"}));
    if (!result.is_success()) {
        throw std::runtime_error("Failed to create document: " + result.error_message());
    }
    return std::stoll(result.get_value(0, "id"));
}

std::string document_column(int64_t id, const std::string& column) {
    QueryResult result(g_pool->query_params(
        "SELECT " + column + " FROM documents WHERE id = $1::bigint", {std::to_string(id)}));
    return result.num_rows() == 0 ? "" : result.get_value(0, 0);
}

int count_lines(int64_t id) {
    QueryResult result(g_pool->query_params(
        "SELECT COUNT(*) FROM document_lines WHERE document_id = $1::bigint", {std::to_string(id)}));
    return std::stoi(result.get_value(0, 0));
}

int64_t stream_pending(const std::string& stream) {
    QueryResult result(g_pool->query_params(
        "SELECT COUNT(*) FROM pending_entries WHERE stream = $1", {stream}));
    return std::stoll(result.get_value(0, 0));
}

Task document_task(int64_t document_id) {
    Task task;
    task.id = generate_task_id();
    task.type = "document:process";
    task.payload = {{"document_id", document_id}};
    return task;
}

DocumentHandler make_handler(std::shared_ptr<ProgressStore> progress,
                             std::shared_ptr<StructuringClient> structuring,
                             const WorkerConfig& config = WorkerConfig{}) {
    return DocumentHandler(g_pool, std::make_shared<FakeStorage>(two_page_pdf()), std::move(progress),
                           std::move(structuring), config);
}

template <typename Predicate>
bool wait_until(Predicate done, milliseconds limit = seconds(20)) {
    auto deadline = steady_clock::now() + limit;
    while (steady_clock::now() < deadline) {
        if (done()) return true;
        std::this_thread::sleep_for(milliseconds(50));
    }
    return done();
}

} // anonymous namespace

// Test 1: execute_task commits on success and rolls back on failure
bool test_execute_commit_and_rollback() {
    std::cout << "\n=== Test 1: Commit and Rollback ===" << std::endl;

    CancellationToken token;
    Task task = document_task(0);

    std::string committed_key = "uploads/" + generate_task_id() + ".pdf";
    ScriptedHandler ok{g_pool, seconds(5), [&](const Task&, TaskContext& ctx) {
        ctx.uow().execute("INSERT INTO documents (filename, s3_key) VALUES ('a.pdf', $1)", {committed_key});
    }};
    execute_task(ok, task, token);

    QueryResult committed(g_pool->query_params("SELECT id FROM documents WHERE s3_key = $1", {committed_key}));
    TEST_ASSERT(committed.num_rows() == 1, "Successful execution committed");

    std::string rolled_back_key = "uploads/" + generate_task_id() + ".pdf";
    ScriptedHandler failing{g_pool, seconds(5), [&](const Task&, TaskContext& ctx) {
        ctx.uow().execute("INSERT INTO documents (filename, s3_key) VALUES ('b.pdf', $1)", {rolled_back_key});
        throw std::runtime_error("parser exploded");
    }};

    bool raised = false;
    try {
        execute_task(failing, task, token);
    } catch (const TaskError& e) {
        raised = !e.retryable() && std::string(e.what()) == "parser exploded";
    }
    TEST_ASSERT(raised, "Unexpected error becomes a non-retryable TaskError");

    QueryResult absent(g_pool->query_params("SELECT id FROM documents WHERE s3_key = $1", {rolled_back_key}));
    TEST_ASSERT(absent.num_rows() == 0, "Failed execution rolled back");

    ScriptedHandler explicit_error{g_pool, seconds(5), [](const Task&, TaskContext&) {
        throw TaskError("S3 download failed", true);
    }};
    bool kept = false;
    try {
        execute_task(explicit_error, task, token);
    } catch (const TaskError& e) {
        kept = e.retryable() && std::string(e.what()) == "S3 download failed";
    }
    TEST_ASSERT(kept, "TaskError passes through unchanged");

    CancellationToken cancelled;
    cancelled.cancel();
    ScriptedHandler checking{g_pool, seconds(5), [](const Task&, TaskContext& ctx) { ctx.check(); }};
    bool interrupted = false;
    try {
        execute_task(checking, task, cancelled);
    } catch (const OperationCancelled&) {
        interrupted = true;
    }
    TEST_ASSERT(interrupted, "Cancellation passes through as OperationCancelled");

    return true;
}

// Test 2: the execution deadline and step timeouts are retryable
bool test_deadlines() {
    std::cout << "\n=== Test 2: Deadlines ===" << std::endl;

    CancellationToken token;
    Task task = document_task(0);

    std::string key = "uploads/" + generate_task_id() + ".pdf";
    ScriptedHandler slow{g_pool, milliseconds(1000), [&](const Task&, TaskContext& ctx) {
        ctx.uow().execute("INSERT INTO documents (filename, s3_key) VALUES ('c.pdf', $1)", {key});
        ctx.sleep_for(seconds(30));
    }};

    bool timed_out = false;
    auto started = steady_clock::now();
    try {
        execute_task(slow, task, token);
    } catch (const TaskError& e) {
        timed_out = e.retryable() && std::string(e.what()) == "Task timed out after 1s";
    }
    auto waited = duration_cast<milliseconds>(steady_clock::now() - started);
    TEST_ASSERT(timed_out, "Overall deadline becomes 'Task timed out after 1s'");
    TEST_ASSERT(waited < seconds(5), "Execution stopped at its deadline");

    QueryResult absent(g_pool->query_params("SELECT id FROM documents WHERE s3_key = $1", {key}));
    TEST_ASSERT(absent.num_rows() == 0, "Work of the timed out execution rolled back");

    ScriptedHandler stuck_step{g_pool, seconds(10), [](const Task&, TaskContext& ctx) {
        ctx.run_step("S3 download", milliseconds(100), [](const CancellationToken&) {
            std::this_thread::sleep_for(milliseconds(800));
            return std::string("late");
        });
    }};
    bool step_timeout = false;
    try {
        execute_task(stuck_step, task, token);
    } catch (const TaskError& e) {
        step_timeout = e.retryable() && std::string(e.what()) == "S3 download timeout";
    }
    TEST_ASSERT(step_timeout, "Step timeout becomes '<step> timeout'");

    ScriptedHandler deadline_first{g_pool, milliseconds(200), [](const Task&, TaskContext& ctx) {
        ctx.run_step("Mathpix OCR", seconds(10), [](const CancellationToken&) {
            std::this_thread::sleep_for(milliseconds(800));
            return 0;
        });
    }};
    bool overall = false;
    try {
        execute_task(deadline_first, task, token);
    } catch (const TaskError& e) {
        overall = e.retryable() && std::string(e.what()).rfind("Task timed out", 0) == 0;
    }
    TEST_ASSERT(overall, "Deadline binding before the step timeout reports the task timeout");

    return true;
}

// Test 3: a document goes all the way to ready
bool test_document_success() {
    std::cout << "\n=== Test 3: Document Processing ===" << std::endl;

    auto progress = std::make_shared<ProgressStore>(g_pool, ProgressConfig{});
    auto structuring = std::make_shared<FakeStructuring>(FakeStructuring::Mode::Succeed);
    auto handler = make_handler(progress, structuring);

    int64_t id = create_document();
    CancellationToken token;
    execute_task(handler, document_task(id), token);

    TEST_ASSERT(document_column(id, "status") == "ready", "Document marked ready");
    TEST_ASSERT(!document_column(id, "processed_at").empty(), "processed_at set");
    TEST_ASSERT(count_lines(id) == 3, "Non-empty lines stored");
    TEST_ASSERT(structuring->calls == 1, "Structuring service called once");

    QueryResult numbered(g_pool->query_params(
        "SELECT line_number, line_type FROM document_lines WHERE document_id = $1::bigint AND page_number = 1 "
        "ORDER BY line_number", {std::to_string(id)}));
    TEST_ASSERT(numbered.get_value(1, "line_number") == "3", "Line numbers keep original positions");
    TEST_ASSERT(numbered.get_value(0, "line_type") == "section_header", "Line types mapped");

    auto snapshot = progress->get(id);
    TEST_ASSERT(snapshot && snapshot->status == ProgressStatus::Ready, "Ready snapshot published");
    TEST_ASSERT(snapshot->page == 2 && snapshot->total == 2, "Snapshot covers all pages");

    progress->clear(id);
    return true;
}

// Test 4: failures leave the document in status error and store nothing
bool test_document_failures() {
    std::cout << "\n=== Test 4: Document Failures ===" << std::endl;

    auto progress = std::make_shared<ProgressStore>(g_pool, ProgressConfig{});
    CancellationToken token;

    auto ok_handler = make_handler(progress, std::make_shared<FakeStructuring>(FakeStructuring::Mode::Succeed));
    bool missing = false;
    try {
        execute_task(ok_handler, document_task(987654321987LL), token);
    } catch (const TaskError& e) {
        missing = !e.retryable() && std::string(e.what()) == "Document 987654321987 not found";
    }
    TEST_ASSERT(missing, "Missing document is a non-retryable error");

    Task bad_payload = document_task(0);
    bad_payload.payload = {{"doc", 1}};
    bool invalid = false;
    try {
        execute_task(ok_handler, bad_payload, token);
    } catch (const TaskError& e) {
        invalid = !e.retryable();
    }
    TEST_ASSERT(invalid, "Payload without document_id is a non-retryable error");

    auto retry_handler = make_handler(progress, std::make_shared<FakeStructuring>(FakeStructuring::Mode::FailRetryable));
    int64_t id = create_document();
    bool retryable = false;
    try {
        execute_task(retry_handler, document_task(id), token);
    } catch (const TaskError& e) {
        retryable = e.retryable() && std::string(e.what()).rfind("Mathpix OCR failed: ", 0) == 0;
    }
    TEST_ASSERT(retryable, "Transient structuring failure is retryable");
    TEST_ASSERT(document_column(id, "status") == "error", "Document marked error");
    TEST_ASSERT(document_column(id, "error").find("connection reset") != std::string::npos, "Error message stored");
    TEST_ASSERT(count_lines(id) == 0, "No lines stored");

    auto snapshot = progress->get(id);
    TEST_ASSERT(snapshot && snapshot->status == ProgressStatus::Error, "Error snapshot published");

    auto no_client = make_handler(progress, nullptr);
    int64_t unconfigured = create_document();
    bool not_configured = false;
    try {
        execute_task(no_client, document_task(unconfigured), token);
    } catch (const TaskError& e) {
        not_configured = !e.retryable() && std::string(e.what()) == "Mathpix client not configured";
    }
    TEST_ASSERT(not_configured, "Missing structuring client is a non-retryable error");
    TEST_ASSERT(document_column(unconfigured, "status") == "error", "Unconfigured run marks the document error");

    progress->clear(id);
    progress->clear(unconfigured);
    return true;
}

// Test 5: the worker loop acks, dead-letters and ignores nothing
bool test_worker_loop() {
    std::cout << "\n=== Test 5: Worker Loop ===" << std::endl;

    auto queue_config = docflow_test::isolated_queue("worker");
    auto progress = std::make_shared<ProgressStore>(g_pool, ProgressConfig{});
    auto registry = std::make_shared<HandlerRegistry>();
    registry->add(TaskType::DocumentProcess,
                  make_handler(progress, std::make_shared<FakeStructuring>(FakeStructuring::Mode::Succeed)));

    TaskQueue producer(g_pool, queue_config);
    producer.setup();

    int64_t id = create_document();
    producer.enqueue(TaskType::DocumentProcess, {{"document_id", id}});
    producer.enqueue(TaskType::DocumentProcess, {{"document_id", 987654321987LL}});
    producer.enqueue(std::string("email:send"), {{"to", "someone"}});

    WorkerManager manager(g_pool, progress, registry, queue_config, WorkerConfig{}, ProgressConfig{});
    TEST_ASSERT(manager.state() == WorkerManager::State::NotStarted, "Manager starts idle");
    TEST_ASSERT(manager.consumer_name().empty(), "No consumer before start");

    manager.start();
    TEST_ASSERT(manager.is_running(), "Manager running");
    TEST_ASSERT(manager.consumer_name().rfind("worker-", 0) == 0, "Consumer named after start");

    bool settled = wait_until([&] { return manager.processed_count() + manager.failed_count() == 3; });
    TEST_ASSERT(settled, "All three tasks settled");
    TEST_ASSERT(manager.processed_count() == 1, "One task processed");
    TEST_ASSERT(manager.failed_count() == 2, "Two tasks failed");
    TEST_ASSERT(document_column(id, "status") == "ready", "Document processed by the loop");

    auto dead = producer.dead_letters();
    TEST_ASSERT(dead.size() == 2, "Two dead letters");
    TEST_ASSERT(dead[0].error == "Document 987654321987 not found", "Missing document dead-lettered");
    TEST_ASSERT(dead[1].error == "Unknown task type: email:send", "Unknown type dead-lettered");
    TEST_ASSERT(stream_pending(queue_config.stream) == 0, "Nothing left pending");

    manager.stop();
    TEST_ASSERT(manager.state() == WorkerManager::State::Stopped, "Manager stopped");
    manager.stop();
    TEST_ASSERT(manager.state() == WorkerManager::State::Stopped, "Second stop is a no-op");

    bool restart_rejected = false;
    try {
        manager.start();
    } catch (const std::logic_error&) {
        restart_rejected = true;
    }
    TEST_ASSERT(restart_rejected, "Stopped manager cannot be restarted");

    progress->clear(id);
    return true;
}

// Test 6: retryable failures come back until the cap
bool test_worker_retries() {
    std::cout << "\n=== Test 6: Worker Retries ===" << std::endl;

    auto queue_config = docflow_test::isolated_queue("retries");
    queue_config.max_retries = 2;
    auto progress = std::make_shared<ProgressStore>(g_pool, ProgressConfig{});
    auto structuring = std::make_shared<FakeStructuring>(FakeStructuring::Mode::FailRetryable);
    auto registry = std::make_shared<HandlerRegistry>();
    registry->add(TaskType::DocumentProcess, make_handler(progress, structuring));

    TaskQueue producer(g_pool, queue_config);
    producer.setup();
    int64_t id = create_document();
    producer.enqueue(TaskType::DocumentProcess, {{"document_id", id}});

    WorkerManager manager(g_pool, progress, registry, queue_config, WorkerConfig{}, ProgressConfig{});
    manager.start();

    bool settled = wait_until([&] { return manager.failed_count() == 1; });
    manager.stop();

    TEST_ASSERT(settled, "Task dead-lettered eventually");
    TEST_ASSERT(manager.retried_count() == 1, "One retry before the cap");
    TEST_ASSERT(structuring->calls == 2, "Two attempts made");

    auto dead = producer.dead_letters();
    TEST_ASSERT(dead.size() == 1, "One dead letter");
    TEST_ASSERT(dead[0].error.rfind("Max retries (2) exceeded: Mathpix OCR failed: ", 0) == 0,
                "Dead letter names the cap and the last error");
    TEST_ASSERT(dead[0].retry_count == 1, "Dead letter keeps the retry count");
    TEST_ASSERT(document_column(id, "status") == "error", "Document left in status error");

    progress->clear(id);
    return true;
}

// Test 7: shutdown during a task leaves it pending and the document untouched
bool test_stop_leaves_task_pending() {
    std::cout << "\n=== Test 7: Stop During Task ===" << std::endl;

    auto queue_config = docflow_test::isolated_queue("stop");
    auto progress = std::make_shared<ProgressStore>(g_pool, ProgressConfig{});
    auto structuring = std::make_shared<FakeStructuring>(FakeStructuring::Mode::Block);
    auto registry = std::make_shared<HandlerRegistry>();
    registry->add(TaskType::DocumentProcess, make_handler(progress, structuring));

    TaskQueue producer(g_pool, queue_config);
    producer.setup();
    int64_t id = create_document();
    producer.enqueue(TaskType::DocumentProcess, {{"document_id", id}});

    WorkerManager manager(g_pool, progress, registry, queue_config, WorkerConfig{}, ProgressConfig{});
    manager.start();

    bool in_flight = wait_until([&] { return structuring->started.load(); });
    TEST_ASSERT(in_flight, "Task reached the structuring step");

    auto started = steady_clock::now();
    manager.stop();
    auto waited = duration_cast<milliseconds>(steady_clock::now() - started);

    TEST_ASSERT(waited < seconds(5), "stop() returned promptly");
    TEST_ASSERT(manager.processed_count() == 0 && manager.failed_count() == 0, "Nothing settled");
    TEST_ASSERT(stream_pending(queue_config.stream) == 1, "Task still pending");
    TEST_ASSERT(producer.dead_letters().empty(), "Task not dead-lettered");
    TEST_ASSERT(document_column(id, "status") == "uploaded", "Document status rolled back");

    progress->clear(id);
    return true;
}

// Test 8: reprocessing, unreadable page trees and slow storage calls
bool test_document_edge_cases() {
    std::cout << "\n=== Test 8: Document Edge Cases ===" << std::endl;

    auto progress = std::make_shared<ProgressStore>(g_pool, ProgressConfig{});
    CancellationToken token;

    auto handler = make_handler(progress, std::make_shared<FakeStructuring>(FakeStructuring::Mode::Succeed));
    int64_t twice = create_document();
    execute_task(handler, document_task(twice), token);
    TEST_ASSERT(count_lines(twice) == 3, "First run stores the lines");

    bool second_ok = true;
    try {
        execute_task(handler, document_task(twice), token);
    } catch (const TaskError& e) {
        std::cerr << "   second run failed: " << e.what() << std::endl;
        second_ok = false;
    }
    TEST_ASSERT(second_ok, "Processing the same document again succeeds");
    TEST_ASSERT(document_column(twice, "status") == "ready", "Document stays ready");
    TEST_ASSERT(count_lines(twice) == 3, "Lines replaced, not duplicated");

    // Valid header, but no page tree anywhere
    std::string opaque_pdf = "%PDF-1.5\n1 0 obj\n<< /Type /Catalog >>\nendobj\n%%EOF\n";
    DocumentHandler opaque(g_pool, std::make_shared<FakeStorage>(opaque_pdf), progress,
                           std::make_shared<FakeStructuring>(FakeStructuring::Mode::Succeed), WorkerConfig{});
    int64_t unreadable = create_document();
    execute_task(opaque, document_task(unreadable), token);
    TEST_ASSERT(document_column(unreadable, "status") == "ready", "Unreadable page tree still ends ready");
    auto snapshot = progress->get(unreadable);
    TEST_ASSERT(snapshot && snapshot->total == 2, "Page total taken from the extraction");

    WorkerConfig quick;
    quick.download_timeout_ms = 200;
    DocumentHandler slow_urls(g_pool, std::make_shared<FakeStorage>(two_page_pdf(), seconds(2)), progress,
                              std::make_shared<FakeStructuring>(FakeStructuring::Mode::Succeed), quick);
    int64_t slow = create_document();
    bool url_timeout = false;
    auto started = steady_clock::now();
    try {
        execute_task(slow_urls, document_task(slow), token);
    } catch (const TaskError& e) {
        url_timeout = e.retryable() && std::string(e.what()) == "Public URL timeout";
    }
    TEST_ASSERT(url_timeout, "Slow public URL lookup becomes 'Public URL timeout'");
    TEST_ASSERT(steady_clock::now() - started < milliseconds(1500), "Handler did not wait for the lookup");
    TEST_ASSERT(document_column(slow, "status") == "error", "Document marked error");

    progress->clear(twice);
    progress->clear(unreadable);
    progress->clear(slow);
    return true;
}

// Test 9: heartbeats keep a long-running task with its worker
bool test_in_flight_task_not_claimed() {
    std::cout << "\n=== Test 9: In-Flight Task Kept Alive ===" << std::endl;

    auto queue_config = docflow_test::isolated_queue("alive");
    queue_config.heartbeat_interval_ms = 100;
    auto progress = std::make_shared<ProgressStore>(g_pool, ProgressConfig{});
    auto structuring = std::make_shared<FakeStructuring>(FakeStructuring::Mode::Block);
    auto registry = std::make_shared<HandlerRegistry>();
    registry->add(TaskType::DocumentProcess, make_handler(progress, structuring));

    TaskQueue sibling(g_pool, queue_config, 7);
    sibling.setup();
    int64_t id = create_document();
    sibling.enqueue(TaskType::DocumentProcess, {{"document_id", id}});

    WorkerManager manager(g_pool, progress, registry, queue_config, WorkerConfig{}, ProgressConfig{}, 3);
    manager.start();

    bool in_flight = wait_until([&] { return structuring->started.load(); });
    TEST_ASSERT(in_flight, "Task reached the structuring step");

    bool claimed_live = false;
    for (int i = 0; i < 6; ++i) {
        std::this_thread::sleep_for(milliseconds(200));
        if (auto stolen = sibling.claim_orphaned(milliseconds(400))) {
            claimed_live = true;
            sibling.ack(*stolen);
        }
    }
    TEST_ASSERT(!claimed_live, "Live task never claimed by a sibling");

    manager.stop();
    std::this_thread::sleep_for(milliseconds(600));
    auto recovered = sibling.claim_orphaned(milliseconds(400));
    TEST_ASSERT(recovered.has_value(), "Task of a stopped worker can be claimed");
    TEST_ASSERT(sibling.ack(*recovered), "Claimed task acknowledged by its new holder");

    progress->clear(id);
    return true;
}

// Main test runner
int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);  // Reduce noise during tests

    std::cout << "╔══════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║     docflow Worker Tests                                 ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════╝" << std::endl;

    if (docflow_test::skip_without_pg()) {
        return 0;
    }

    bool all_passed = true;

    try {
        g_pool = DatabasePool::from_config(*docflow_test::pg_config());
        if (!initialize_schema(*g_pool)) {
            std::cerr << "❌ Schema initialization failed" << std::endl;
            return 1;
        }

        all_passed &= test_execute_commit_and_rollback();
        all_passed &= test_deadlines();
        all_passed &= test_document_success();
        all_passed &= test_document_failures();
        all_passed &= test_worker_loop();
        all_passed &= test_worker_retries();
        all_passed &= test_stop_leaves_task_pending();
        all_passed &= test_document_edge_cases();
        all_passed &= test_in_flight_task_not_claimed();
    } catch (const std::exception& e) {
        std::cerr << "❌ Exception: " << e.what() << std::endl;
        all_passed = false;
    }

    return docflow_test::finish(all_passed);
}
