#include "docflow/structuring_client.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace docflow {

namespace {

std::string describe(const nlohmann::json& status, const char* key, const std::string& fallback) {
    if (!status.contains(key)) return fallback;
    const auto& value = status[key];
    return value.is_string() ? value.get<std::string>() : value.dump();
}

} // anonymous namespace

MathpixClient::MathpixClient(const MathpixConfig& config) : config_(config) {
    if (!config_.is_configured()) {
        throw std::invalid_argument("Mathpix app_id and app_key are required");
    }
    spdlog::info("[Mathpix] Client initialized for {}", config_.base_url);
}

nlohmann::json MathpixClient::request(const std::string& method, const std::string& path,
                                      const std::string& body, const std::string& what) {
    httplib::Client cli(config_.base_url);
    cli.set_connection_timeout(config_.request_timeout_ms / 1000,
                               (config_.request_timeout_ms % 1000) * 1000);
    cli.set_read_timeout(config_.request_timeout_ms / 1000,
                         (config_.request_timeout_ms % 1000) * 1000);

    httplib::Headers headers = {
        {"app_id", config_.app_id},
        {"app_key", config_.app_key},
    };

    auto res = method == "POST" ? cli.Post(path, headers, body, "application/json")
                                : cli.Get(path, headers);

    if (!res) {
        spdlog::error("[Mathpix] Failed to {} - network error: {}", what, httplib::to_string(res.error()));
        throw StructuringError("Failed to " + what + ": " + httplib::to_string(res.error()), true);
    }
    if (res->status < 200 || res->status >= 300) {
        spdlog::error("[Mathpix] Failed to {} - HTTP {}", what, res->status);
        throw StructuringError("Failed to " + what + ": HTTP " + std::to_string(res->status), false);
    }

    try {
        return nlohmann::json::parse(res->body);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::error("[Mathpix] Failed to {} - unreadable response: {}", what, e.what());
        throw StructuringError("Failed to " + what + ": " + e.what(), true);
    }
}

std::string MathpixClient::submit_pdf(const std::string& url) {
    spdlog::info("[Mathpix] Submitting PDF {}", url);

    nlohmann::json body = {{"url", url}};
    auto data = request("POST", "/v3/pdf", body.dump(), "submit PDF");

    if (!data.contains("pdf_id") || !data["pdf_id"].is_string()) {
        throw StructuringError("Failed to submit PDF: response has no pdf_id (" +
                               describe(data, "error", data.dump()) + ")", true);
    }
    auto pdf_id = data["pdf_id"].get<std::string>();
    spdlog::info("[Mathpix] PDF submitted, pdf_id={}", pdf_id);
    return pdf_id;
}

nlohmann::json MathpixClient::poll_status(const std::string& pdf_id) {
    auto data = request("GET", "/v3/pdf/" + pdf_id, "", "poll status");
    spdlog::debug("[Mathpix] Status of {}: {}", pdf_id, describe(data, "status", "unknown"));
    return data;
}

nlohmann::json MathpixClient::get_lines(const std::string& pdf_id) {
    spdlog::info("[Mathpix] Fetching lines for {}", pdf_id);
    auto data = request("GET", "/v3/pdf/" + pdf_id + ".lines.json", "", "get lines");
    size_t num_pages = data.contains("pages") && data["pages"].is_array() ? data["pages"].size() : 0;
    spdlog::info("[Mathpix] Lines fetched for {} ({} pages)", pdf_id, num_pages);
    return data;
}

nlohmann::json MathpixClient::extract(const std::string& url, const CancellationToken& token) {
    auto pdf_id = submit_pdf(url);

    for (int poll = 1; poll <= config_.max_polls; ++poll) {
        token.throw_if_cancelled();

        auto status = poll_status(pdf_id);
        auto state = describe(status, "status", "");

        if (state == "completed") {
            spdlog::info("[Mathpix] PDF {} processing completed ({} pages)",
                         pdf_id, describe(status, "num_pages", "?"));
            return get_lines(pdf_id);
        }
        if (state == "error") {
            auto message = describe(status, "error", "Unknown error");
            spdlog::error("[Mathpix] PDF {} processing failed: {}", pdf_id, message);
            throw StructuringError("Mathpix processing error: " + message, false);
        }

        spdlog::info("[Mathpix] PDF {} still processing (status={}, {}% done, poll {})",
                     pdf_id, state, describe(status, "percent_done", "0"), poll);
        token.sleep_for(std::chrono::milliseconds(config_.poll_interval_ms));
    }

    spdlog::error("[Mathpix] PDF {} not processed after {} polls", pdf_id, config_.max_polls);
    throw StructuringError("Timeout waiting for PDF processing (max_polls=" +
                           std::to_string(config_.max_polls) + ")", true);
}

} // namespace docflow
