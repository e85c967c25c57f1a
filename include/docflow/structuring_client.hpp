#pragma once

#include "docflow/cancellation.hpp"
#include "docflow/config.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace docflow {

// Failure of the external structuring service; carries its own retry verdict
class StructuringError : public std::runtime_error {
public:
    StructuringError(const std::string& message, bool retryable)
        : std::runtime_error(message), retryable_(retryable) {}

    bool retryable() const { return retryable_; }

private:
    bool retryable_;
};

/**
 * External service turning a publicly reachable PDF into line-by-line
 * structured output: {"pages": [{"page": N, "lines": [{"text", "type", ...}]}]}.
 */
class StructuringClient {
public:
    virtual ~StructuringClient() = default;

    // Throws StructuringError, or OperationCancelled while waiting on the service
    virtual nlohmann::json extract(const std::string& url, const CancellationToken& token) = 0;
};

/**
 * Mathpix PDF API client: submit, poll until completed, fetch lines.
 *
 * Connection failures and unexpected responses are retryable; HTTP error
 * statuses and a processing error reported by Mathpix are not.
 */
class MathpixClient : public StructuringClient {
public:
    explicit MathpixClient(const MathpixConfig& config);

    nlohmann::json extract(const std::string& url, const CancellationToken& token) override;

    std::string submit_pdf(const std::string& url);
    nlohmann::json poll_status(const std::string& pdf_id);
    nlohmann::json get_lines(const std::string& pdf_id);

private:
    MathpixConfig config_;

    nlohmann::json request(const std::string& method, const std::string& path,
                           const std::string& body, const std::string& what);
};

} // namespace docflow
