#pragma once

#include "execution/model/Job.hpp"

#include <chrono>
#include <string>

namespace cs::execution {

// Pull-based view of a job's progress
class JobStatusChannel {
public:
    virtual ~JobStatusChannel() = default;

    virtual model::JobStatus poll(const std::string& jobId) = 0;
};

// GET {status_url}/jobs/{jobId}
class HttpJobStatusChannel final : public JobStatusChannel {
public:
    HttpJobStatusChannel(std::string statusUrl, std::chrono::seconds timeout);

    model::JobStatus poll(const std::string& jobId) override;

private:
    std::string status_url_;
    std::chrono::seconds timeout_;
};

// Polls until the job reaches a terminal state. Throws std::runtime_error
// once `timeout` has passed without one.
model::JobStatus waitFor(JobStatusChannel& channel, const std::string& jobId,
                         std::chrono::milliseconds interval, std::chrono::milliseconds timeout);

}
