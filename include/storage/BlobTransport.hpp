#pragma once

#include <chrono>
#include <string>

namespace cs::storage {

// Client-side byte mover. Talks to capability URLs only, never to the server.
class BlobTransport {
public:
    virtual ~BlobTransport() = default;

    // PUT raw bytes to an upload capability. Throws on any non-2xx outcome.
    virtual void put(const std::string& capabilityUrl, const std::string& bytes) = 0;

    // GET through a download capability
    virtual std::string get(const std::string& capabilityUrl) = 0;
};

class HttpBlobTransport final : public BlobTransport {
public:
    explicit HttpBlobTransport(std::chrono::seconds timeout = std::chrono::seconds(30));

    void put(const std::string& capabilityUrl, const std::string& bytes) override;
    std::string get(const std::string& capabilityUrl) override;

private:
    std::chrono::seconds timeout_;
};

}
