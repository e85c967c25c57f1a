#include "docflow/documents.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <map>

namespace docflow {

const char* to_string(DocumentStatus status) {
    switch (status) {
        case DocumentStatus::Pending: return "pending";
        case DocumentStatus::Uploaded: return "uploaded";
        case DocumentStatus::Processing: return "processing";
        case DocumentStatus::Ready: return "ready";
        case DocumentStatus::Error: return "error";
    }
    return "unknown";
}

std::optional<DocumentStatus> parse_document_status(const std::string& value) {
    static const std::map<std::string, DocumentStatus> statuses = {
        {"pending", DocumentStatus::Pending},
        {"uploaded", DocumentStatus::Uploaded},
        {"processing", DocumentStatus::Processing},
        {"ready", DocumentStatus::Ready},
        {"error", DocumentStatus::Error},
    };
    auto it = statuses.find(value);
    if (it == statuses.end()) return std::nullopt;
    return it->second;
}

namespace {

std::string strip(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string map_line_type(const std::string& raw) {
    if (raw == "math" || raw == "formula") return "math";
    if (raw == "header" || raw == "title") return "section_header";
    return "text";
}

DocumentLine convert_line(const nlohmann::json& line, int page_number, int line_number, std::string text) {
    DocumentLine converted;
    converted.page_number = page_number;
    converted.line_number = line_number;
    converted.text = std::move(text);

    auto type = line.find("type");
    converted.line_type = map_line_type(type != line.end() && type->is_string() ? type->get<std::string>() : "text");

    auto font_size = line.find("font_size");
    if (font_size != line.end() && font_size->is_number()) {
        converted.font_size = static_cast<int>(font_size->get<double>());
    }

    auto handwritten = line.find("is_handwritten");
    converted.is_handwritten = handwritten != line.end() && handwritten->is_boolean() && handwritten->get<bool>();
    converted.is_printed = !converted.is_handwritten;

    auto confidence = line.find("confidence");
    if (confidence != line.end() && confidence->is_number()) {
        converted.confidence = confidence->get<double>();
    }

    if (line.contains("region")) {
        converted.region = line["region"];
    } else if (line.contains("top_left_x") && line.contains("top_left_y") &&
               line.contains("width") && line.contains("height")) {
        converted.region = {
            {"top_left_x", line["top_left_x"]},
            {"top_left_y", line["top_left_y"]},
            {"width", line["width"]},
            {"height", line["height"]},
        };
    }

    converted.raw_metadata = line;
    return converted;
}

Document document_from_row(const QueryResult& result) {
    Document document;
    document.id = std::stoll(result.get_value(0, "id"));
    document.filename = result.get_value(0, "filename");
    document.s3_key = result.get_value(0, "s3_key");
    document.status = parse_document_status(result.get_value(0, "status")).value_or(DocumentStatus::Pending);
    if (!result.is_null(0, "error")) document.error = result.get_value(0, "error");
    if (!result.is_null(0, "processed_at")) document.processed_at = result.get_value(0, "processed_at");
    return document;
}

} // anonymous namespace

std::vector<PageLines> convert_structured_lines(const nlohmann::json& result) {
    std::vector<PageLines> pages;
    if (!result.is_object() || !result.contains("pages") || !result["pages"].is_array()) {
        return pages;
    }

    for (const auto& page : result["pages"]) {
        if (!page.is_object()) continue;

        PageLines page_lines;
        auto number = page.find("page");
        page_lines.page_number = number != page.end() && number->is_number_integer() ? number->get<int>() : 1;

        auto lines = page.find("lines");
        if (lines != page.end() && lines->is_array()) {
            int line_number = 0;
            for (const auto& line : *lines) {
                ++line_number;
                if (!line.is_object()) continue;
                auto text = line.find("text");
                std::string stripped = text != line.end() && text->is_string() ? strip(text->get<std::string>()) : "";
                if (stripped.empty()) continue;
                page_lines.lines.push_back(convert_line(line, page_lines.page_number, line_number, std::move(stripped)));
            }
        }
        pages.push_back(std::move(page_lines));
    }
    return pages;
}

std::optional<Document> find_document(UnitOfWork& uow, int64_t id, bool for_update) {
    std::string sql = "SELECT id, filename, s3_key, status, error, processed_at FROM documents WHERE id = $1::bigint";
    if (for_update) sql += " FOR UPDATE";

    auto result = uow.execute(sql, {std::to_string(id)});
    if (result.num_rows() == 0) return std::nullopt;
    return document_from_row(result);
}

void set_document_processing(UnitOfWork& uow, int64_t id) {
    uow.execute("UPDATE documents SET status = 'processing', error = NULL, updated_at = NOW() WHERE id = $1::bigint",
                {std::to_string(id)});
}

void set_document_ready(UnitOfWork& uow, int64_t id, int total_pages) {
    nlohmann::json progress = {{"page", total_pages}, {"total", total_pages}};
    uow.execute(R"(
        UPDATE documents
        SET status = 'ready', processed_at = NOW(), error = NULL, progress = $2::jsonb, updated_at = NOW()
        WHERE id = $1::bigint
    )", {std::to_string(id), progress.dump()});
}

void set_document_error(UnitOfWork& uow, int64_t id, const std::string& error) {
    uow.execute("UPDATE documents SET status = 'error', error = $2, updated_at = NOW() WHERE id = $1::bigint",
                {std::to_string(id), error});
}

int delete_document_lines(UnitOfWork& uow, int64_t document_id) {
    auto result = uow.execute("DELETE FROM document_lines WHERE document_id = $1::bigint",
                              {std::to_string(document_id)});
    return result.affected_rows();
}

int insert_document_lines(UnitOfWork& uow, int64_t document_id, const std::vector<DocumentLine>& lines) {
    if (lines.empty()) return 0;

    nlohmann::json rows = nlohmann::json::array();
    for (const auto& line : lines) {
        rows.push_back({
            {"page_number", line.page_number},
            {"line_number", line.line_number},
            {"text", line.text},
            {"line_type", line.line_type},
            {"font_size", line.font_size ? nlohmann::json(*line.font_size) : nlohmann::json(nullptr)},
            {"is_printed", line.is_printed},
            {"is_handwritten", line.is_handwritten},
            {"confidence", line.confidence ? nlohmann::json(*line.confidence) : nlohmann::json(nullptr)},
            {"region", line.region},
            {"raw_metadata", line.raw_metadata},
        });
    }

    // One round trip per batch
    auto result = uow.execute(R"(
        INSERT INTO document_lines
            (document_id, page_number, line_number, text, line_type, font_size,
             is_printed, is_handwritten, confidence, region, raw_metadata)
        SELECT $1::bigint, l.page_number, l.line_number, l.text, l.line_type, l.font_size,
               l.is_printed, l.is_handwritten, l.confidence, l.region, l.raw_metadata
        FROM jsonb_to_recordset($2::jsonb) AS l(
            page_number INTEGER, line_number INTEGER, text TEXT, line_type TEXT, font_size INTEGER,
            is_printed BOOLEAN, is_handwritten BOOLEAN, confidence DOUBLE PRECISION,
            region JSONB, raw_metadata JSONB)
    )", {std::to_string(document_id), rows.dump()});

    int written = result.affected_rows();
    spdlog::debug("[Documents] Saved {} lines for document {}", written, document_id);
    return written;
}

} // namespace docflow
