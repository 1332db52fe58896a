#pragma once

#include "storage/BlobStore.hpp"
#include "config/Config.hpp"

#include <string>
#include <utility>
#include <curl/curl.h>

namespace cs::storage {

// BlobStore over any S3-compatible endpoint, path-style addressing, SigV4.
class S3Controller final : public BlobStore {
public:
    explicit S3Controller(config::StorageConfig cfg);

    ~S3Controller() override;

    [[nodiscard]] std::string presignPut(const std::string& key, std::chrono::seconds ttl) const override;
    [[nodiscard]] std::string presignGet(const std::string& key, std::chrono::seconds ttl) const override;
    void deleteObject(const std::string& key) const override;

private:
    config::StorageConfig cfg_;

    [[nodiscard]] std::string presign(const std::string& method, const std::string& key, std::chrono::seconds ttl) const;

    // {canonical path, full URL}
    std::pair<std::string, std::string> constructPaths(CURL* curl, const std::string& key) const;
};

}
