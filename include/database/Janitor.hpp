#pragma once

#include "concurrency/AsyncService.hpp"

#include <chrono>
#include <memory>

namespace cs::database {

class WorkspaceStore;

// Periodically drops expired pending reservations and old resolved ones
class Janitor final : public concurrency::AsyncService {
public:
    Janitor(std::shared_ptr<WorkspaceStore> store, std::chrono::minutes sweepInterval,
            std::chrono::seconds retention);
    ~Janitor() override;

    // One pass; returns the number of reservations removed
    size_t sweep() const;

protected:
    void runLoop() override;

private:
    std::shared_ptr<WorkspaceStore> store_;
    std::chrono::minutes sweep_interval_;
    std::chrono::seconds retention_;
};

}
