#pragma once

#include "docflow/database.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace docflow {

enum class DocumentStatus {
    Pending,
    Uploaded,
    Processing,
    Ready,
    Error,
};

const char* to_string(DocumentStatus status);
std::optional<DocumentStatus> parse_document_status(const std::string& value);

struct Document {
    int64_t id = 0;
    std::string filename;
    std::string s3_key;
    DocumentStatus status = DocumentStatus::Uploaded;
    std::optional<std::string> error;
    std::optional<std::string> processed_at;
};

struct DocumentLine {
    int page_number = 1;
    int line_number = 1;
    std::string text;
    std::string line_type = "text";     // text | math | section_header
    std::optional<int> font_size;
    bool is_printed = true;
    bool is_handwritten = false;
    std::optional<double> confidence;
    nlohmann::json region;              // null when the service gave no position
    nlohmann::json raw_metadata;
};

// Lines of a structuring result grouped by page, empty lines dropped.
// Line numbers are 1-based positions in the page's original line list.
struct PageLines {
    int page_number = 1;
    std::vector<DocumentLine> lines;
};

std::vector<PageLines> convert_structured_lines(const nlohmann::json& result);

// --- Repository functions, all within the caller's unit of work ---

// for_update locks the row for the rest of the transaction
std::optional<Document> find_document(UnitOfWork& uow, int64_t id, bool for_update = false);

void set_document_processing(UnitOfWork& uow, int64_t id);
void set_document_ready(UnitOfWork& uow, int64_t id, int total_pages);
void set_document_error(UnitOfWork& uow, int64_t id, const std::string& error);

// Drops lines left by an earlier run; returns the number removed
int delete_document_lines(UnitOfWork& uow, int64_t document_id);

// Returns the number of rows written
int insert_document_lines(UnitOfWork& uow, int64_t document_id, const std::vector<DocumentLine>& lines);

} // namespace docflow
