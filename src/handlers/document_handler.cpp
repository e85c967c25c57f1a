#include "docflow/document_handler.hpp"
#include "docflow/pdf_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace docflow {

namespace {

// Everything after this point is undone when processing fails
constexpr const char* kWorkSavepoint = "document_work";

} // anonymous namespace

DocumentHandler::DocumentHandler(std::shared_ptr<DatabasePool> db_pool,
                                 std::shared_ptr<ObjectStorage> storage,
                                 std::shared_ptr<ProgressStore> progress,
                                 std::shared_ptr<StructuringClient> structuring,
                                 const WorkerConfig& config)
    : db_pool_(std::move(db_pool)),
      storage_(std::move(storage)),
      progress_(std::move(progress)),
      structuring_(std::move(structuring)),
      config_(config) {
    if (!db_pool_ || !storage_ || !progress_) {
        throw std::invalid_argument("DocumentHandler needs a database pool, object storage and progress store");
    }
    if (!structuring_) {
        spdlog::warn("[DocumentHandler] No structuring client configured, documents will fail extraction");
    }
}

int64_t DocumentHandler::document_id_from(const Task& task) const {
    auto it = task.payload.find("document_id");
    if (it == task.payload.end()) {
        throw TaskError("Invalid payload: missing document_id", false);
    }
    if (it->is_number_integer()) {
        return it->get<int64_t>();
    }
    if (it->is_string()) {
        const std::string raw = it->get<std::string>();
        char* end = nullptr;
        long long value = std::strtoll(raw.c_str(), &end, 10);
        if (!raw.empty() && end && *end == '\0') {
            return value;
        }
    }
    throw TaskError("Invalid payload: document_id is not an integer", false);
}

void DocumentHandler::report(const Progress& progress) const {
    try {
        progress_->update(progress);
    } catch (const std::runtime_error& e) {
        spdlog::warn("[DocumentHandler] Progress update for document {} failed: {}", progress.subject_id, e.what());
    }
}

void DocumentHandler::process(const Task& task, TaskContext& ctx) const {
    int64_t document_id = document_id_from(task);
    auto& uow = ctx.uow();

    auto document = find_document(uow, document_id, true);
    if (!document) {
        throw TaskError("Document " + std::to_string(document_id) + " not found", false);
    }

    set_document_processing(uow, document_id);
    uow.savepoint(kWorkSavepoint);

    try {
        run_pipeline(document_id, *document, ctx);
    } catch (const OperationCancelled&) {
        throw;
    } catch (const DeadlineExceeded&) {
        throw;
    } catch (const TaskError& e) {
        mark_failed(document_id, e.what(), ctx);
        throw;
    } catch (const std::exception& e) {
        mark_failed(document_id, e.what(), ctx);
        throw TaskError(e.what(), false);
    }
}

void DocumentHandler::run_pipeline(int64_t document_id, const Document& document, TaskContext& ctx) const {
    using std::chrono::milliseconds;

    auto storage = storage_;
    auto key = document.s3_key;
    auto pdf = std::make_shared<std::string>(
        ctx.run_step("S3 download", milliseconds(config_.download_timeout_ms),
                     [storage, key](const CancellationToken&) { return storage->download(key); }));

    // 0 when the page tree cannot be read; the extraction result decides then
    int total_pages = 0;
    try {
        total_pages = ctx.run_step("PDF parsing", milliseconds(config_.parse_timeout_ms),
                                   [pdf](const CancellationToken&) { return count_pdf_pages(*pdf); });
    } catch (const PdfPageCountError& e) {
        spdlog::warn("[DocumentHandler] Page count of document {} unavailable, using extraction result: {}",
                     document_id, e.what());
    }
    pdf.reset();

    spdlog::info("[DocumentHandler] Processing document {} ({} pages)", document_id, total_pages);

    if (!structuring_) {
        throw TaskError("Mathpix client not configured", false);
    }

    std::string url = ctx.run_step("Public URL", milliseconds(config_.download_timeout_ms),
                                   [storage, key](const CancellationToken&) { return storage->public_url(key); });
    report({document_id, 0, total_pages, ProgressStatus::Processing, std::string("Extracting lines with Mathpix...")});

    nlohmann::json result;
    try {
        auto client = structuring_;
        result = ctx.run_step("Mathpix OCR", milliseconds(config_.extract_timeout_ms),
                              [client, url](const CancellationToken& step) { return client->extract(url, step); });
    } catch (const StructuringError& e) {
        spdlog::error("[DocumentHandler] Mathpix OCR failed for document {} (retryable={}): {}",
                      document_id, e.retryable(), e.what());
        throw TaskError(std::string("Mathpix OCR failed: ") + e.what(), e.retryable());
    }

    auto pages = convert_structured_lines(result);
    int total = std::max(total_pages, static_cast<int>(pages.size()));
    spdlog::info("[DocumentHandler] Extraction of document {} returned {} pages", document_id, pages.size());

    int replaced = delete_document_lines(ctx.uow(), document_id);
    if (replaced > 0) {
        spdlog::info("[DocumentHandler] Replacing {} lines from an earlier run of document {}", replaced, document_id);
    }

    int saved = 0;
    for (size_t i = 0; i < pages.size(); ++i) {
        ctx.check();
        saved += insert_document_lines(ctx.uow(), document_id, pages[i].lines);
        report({document_id, static_cast<int>(i + 1), total, ProgressStatus::Processing, std::nullopt});
    }

    set_document_ready(ctx.uow(), document_id, total);
    report({document_id, total, total, ProgressStatus::Ready, std::string("Processing complete")});

    spdlog::info("[DocumentHandler] Document {} ready ({} lines)", document_id, saved);
}

void DocumentHandler::mark_failed(int64_t document_id, const std::string& message, TaskContext& ctx) const {
    // The error marker must survive the rollback of the work itself
    try {
        auto& uow = ctx.uow();
        uow.rollback_to_savepoint(kWorkSavepoint);
        set_document_error(uow, document_id, message);
        uow.commit();
    } catch (const std::exception& e) {
        spdlog::error("[DocumentHandler] Could not record failure of document {}: {}", document_id, e.what());
    }
    report({document_id, 0, 0, ProgressStatus::Error, message});
    spdlog::error("[DocumentHandler] Document {} failed: {}", document_id, message);
}

} // namespace docflow
