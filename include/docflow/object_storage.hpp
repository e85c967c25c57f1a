#pragma once

#include "docflow/config.hpp"
#include <string>

namespace docflow {

/**
 * Source of uploaded document bytes.
 *
 * Implementations must be safe to call from several threads: handler steps
 * run them on helper threads.
 */
class ObjectStorage {
public:
    virtual ~ObjectStorage() = default;

    // Raw object contents. Throws std::runtime_error if the object cannot be read.
    virtual std::string download(const std::string& key) = 0;

    // URL an external service can fetch the object from
    virtual std::string public_url(const std::string& key) = 0;
};

/**
 * Object storage reachable over plain HTTP(S) GETs on
 * <public_base_url>/<bucket>/<key> (S3-compatible public bucket).
 */
class HttpObjectStorage : public ObjectStorage {
public:
    explicit HttpObjectStorage(const StorageConfig& config);

    std::string download(const std::string& key) override;
    std::string public_url(const std::string& key) override;

private:
    StorageConfig config_;
};

} // namespace docflow
