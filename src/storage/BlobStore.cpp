#include "storage/BlobStore.hpp"

std::string cs::storage::fileObjectKey(const std::string& workspaceId, const std::string& fileId,
                                       const std::string& contentHash) {
    return "workspaces/" + workspaceId + "/files/" + fileId + "/" + contentHash;
}
