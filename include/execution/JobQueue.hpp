#pragma once

#include "execution/model/Job.hpp"

#include <chrono>
#include <string>

namespace cs::execution {

// Hand-off to the external execution engine
class JobQueue {
public:
    virtual ~JobQueue() = default;

    // Throws if the engine did not accept the job
    virtual void submit(const model::WorkerPayload& payload) = 0;
};

// POSTs the payload to {worker_url}/execute_auth
class HttpJobQueue final : public JobQueue {
public:
    HttpJobQueue(std::string workerUrl, std::chrono::seconds timeout);

    void submit(const model::WorkerPayload& payload) override;

private:
    std::string worker_url_;
    std::chrono::seconds timeout_;
};

}
