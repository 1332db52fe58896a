#pragma once

#include "config/Config.hpp"
#include "execution/model/Job.hpp"

#include <memory>
#include <string>

namespace cs::database {
class WorkspaceStore;
}

namespace cs::execution {

class JobQueue;

// Server side of the execution trigger. Pins the job to the committed
// version the request was accepted at and forwards it to the worker.
class Dispatcher {
public:
    Dispatcher(std::shared_ptr<database::WorkspaceStore> store,
               std::shared_ptr<JobQueue> queue,
               config::ExecutionConfig cfg,
               std::string bucket);

    model::ExecuteResponse dispatch(const std::string& workspaceId, const std::string& userId,
                                    const model::ExecuteRequest& request) const;

private:
    std::shared_ptr<database::WorkspaceStore> store_;
    std::shared_ptr<JobQueue> queue_;
    config::ExecutionConfig cfg_;
    std::string bucket_;
};

}
