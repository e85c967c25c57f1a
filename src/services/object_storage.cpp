#include "docflow/object_storage.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace docflow {

namespace {

// Strips a trailing slash so joins never produce "//"
std::string trim_slash(std::string value) {
    while (!value.empty() && value.back() == '/') value.pop_back();
    return value;
}

} // anonymous namespace

HttpObjectStorage::HttpObjectStorage(const StorageConfig& config) : config_(config) {
    config_.public_base_url = trim_slash(config_.public_base_url);
    spdlog::info("[ObjectStorage] Using {}/{}", config_.public_base_url, config_.bucket);
}

std::string HttpObjectStorage::public_url(const std::string& key) {
    return config_.public_base_url + "/" + config_.bucket + "/" + key;
}

std::string HttpObjectStorage::download(const std::string& key) {
    std::string path = "/" + config_.bucket + "/" + key;

    httplib::Client cli(config_.public_base_url);
    cli.set_connection_timeout(config_.request_timeout_ms / 1000,
                               (config_.request_timeout_ms % 1000) * 1000);
    cli.set_read_timeout(config_.request_timeout_ms / 1000,
                         (config_.request_timeout_ms % 1000) * 1000);
    cli.set_follow_location(true);

    spdlog::debug("[ObjectStorage] GET {}{}", config_.public_base_url, path);
    auto res = cli.Get(path);

    if (!res) {
        throw std::runtime_error("Download of " + key + " failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw std::runtime_error("Download of " + key + " failed: HTTP " + std::to_string(res->status));
    }

    spdlog::debug("[ObjectStorage] Downloaded {} ({} bytes)", key, res->body.size());
    return std::move(res->body);
}

} // namespace docflow
