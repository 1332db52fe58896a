#pragma once

#include "sync/model/Change.hpp"
#include "sync/model/Entry.hpp"

#include <vector>

namespace cs::sync {

// Minimal change set between the client's files and the last committed
// manifest. Output is sorted by path (deletes before adds at the same path),
// so it is independent of input order.
struct Differ {
    static std::vector<model::SyncFileClientState> diff(const std::vector<model::ClientFileState>& local,
                                                        const std::vector<model::ManifestEntry>& manifest);
};

}
