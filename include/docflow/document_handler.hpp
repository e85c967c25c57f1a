#pragma once

#include "docflow/config.hpp"
#include "docflow/database.hpp"
#include "docflow/documents.hpp"
#include "docflow/object_storage.hpp"
#include "docflow/progress_store.hpp"
#include "docflow/structuring_client.hpp"
#include "docflow/task_handler.hpp"
#include <chrono>
#include <memory>

namespace docflow {

/**
 * Handler for "document:process" tasks.
 *
 * Downloads the document, counts its pages, sends it through the structuring
 * service and stores the extracted lines page by page, reporting progress as
 * it goes. A document that fails ends in status "error" even though the
 * task's own work is rolled back.
 *
 * Payload: {"document_id": <int>}
 */
class DocumentHandler {
public:
    DocumentHandler(std::shared_ptr<DatabasePool> db_pool,
                    std::shared_ptr<ObjectStorage> storage,
                    std::shared_ptr<ProgressStore> progress,
                    std::shared_ptr<StructuringClient> structuring,  // may be null
                    const WorkerConfig& config);

    const char* name() const { return "DocumentHandler"; }
    std::chrono::milliseconds timeout() const { return std::chrono::milliseconds(config_.document_timeout_ms); }
    DatabasePool& pool() const { return *db_pool_; }

    void process(const Task& task, TaskContext& ctx) const;

private:
    std::shared_ptr<DatabasePool> db_pool_;
    std::shared_ptr<ObjectStorage> storage_;
    std::shared_ptr<ProgressStore> progress_;
    std::shared_ptr<StructuringClient> structuring_;
    WorkerConfig config_;

    int64_t document_id_from(const Task& task) const;
    void run_pipeline(int64_t document_id, const Document& document, TaskContext& ctx) const;
    void mark_failed(int64_t document_id, const std::string& message, TaskContext& ctx) const;
    void report(const Progress& progress) const;
};

} // namespace docflow
