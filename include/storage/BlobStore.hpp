#pragma once

#include <chrono>
#include <string>

namespace cs::storage {

// Server-side view of the object store. Clients never get delete rights;
// they only receive presigned PUT and GET capabilities.
class BlobStore {
public:
    virtual ~BlobStore() = default;

    // Time-bound URL allowing a single-object PUT to `key`
    [[nodiscard]] virtual std::string presignPut(const std::string& key, std::chrono::seconds ttl) const = 0;

    // Time-bound URL allowing a GET of `key`
    [[nodiscard]] virtual std::string presignGet(const std::string& key, std::chrono::seconds ttl) const = 0;

    // Server-issued delete. A missing object counts as deleted.
    virtual void deleteObject(const std::string& key) const = 0;
};

// workspaces/{workspaceId}/files/{fileId}/{contentHash}
std::string fileObjectKey(const std::string& workspaceId, const std::string& fileId, const std::string& contentHash);

}
