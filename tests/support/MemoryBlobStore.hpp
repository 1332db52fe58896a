#pragma once

#include "storage/BlobStore.hpp"
#include "storage/BlobTransport.hpp"
#include "util/timestamp.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace cs::test {

// Object store and client transport in one. Capabilities are
// "mem://{put|get}/{key}?expires={epoch}" and are checked against the clock.
class MemoryBlobStore final : public storage::BlobStore, public storage::BlobTransport {
public:
    explicit MemoryBlobStore(util::Clock clock);

    [[nodiscard]] std::string presignPut(const std::string& key, std::chrono::seconds ttl) const override;
    [[nodiscard]] std::string presignGet(const std::string& key, std::chrono::seconds ttl) const override;
    void deleteObject(const std::string& key) const override;

    void put(const std::string& capabilityUrl, const std::string& bytes) override;
    std::string get(const std::string& capabilityUrl) override;

    // Any PUT whose key contains `fragment` fails
    void failUploadsMatching(const std::string& fragment);

    // deleteObject throws for any key containing `fragment`; "" matches all
    void failDeletesMatching(const std::string& fragment);

    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::string read(const std::string& key) const;
    [[nodiscard]] size_t objectCount() const;
    [[nodiscard]] size_t putCount() const { return puts_.load(); }
    [[nodiscard]] std::vector<std::string> deletedKeys() const;

private:
    util::Clock clock_;

    mutable std::mutex mutex_;
    mutable std::map<std::string, std::string> objects_;
    mutable std::vector<std::string> deleted_;
    std::set<std::string> failing_;
    std::set<std::string> failing_deletes_;
    std::atomic<size_t> puts_{0};

    // {key} from a capability of the expected kind; throws if expired or malformed
    std::string redeem(const std::string& url, const std::string& kind) const;
};

}
