#pragma once

#include "sync/model/Entry.hpp"
#include "sync/model/Messages.hpp"

#include <filesystem>
#include <vector>

namespace cs::storage {
class BlobTransport;
}

namespace cs::sync::client {

// Local directory <-> workspace tree. Dot-prefixed names are skipped.
struct LocalTree {
    // Every file and folder under `root` as workspace paths
    static std::vector<model::ClientFileState> scan(const std::filesystem::path& root);

    // Writes every manifest entry under `root`, downloading file bytes through
    // their content URLs. Returns the number of files written.
    static size_t materialize(const std::filesystem::path& root, const model::ManifestResponse& manifest,
                              storage::BlobTransport& transport);
};

}
