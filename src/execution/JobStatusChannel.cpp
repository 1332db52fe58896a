#include "execution/JobStatusChannel.hpp"
#include "util/jsonHttp.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <thread>

using namespace cs::execution;
using namespace cs::util;
using namespace cs::logging;

HttpJobStatusChannel::HttpJobStatusChannel(std::string statusUrl, const std::chrono::seconds timeout)
    : status_url_(std::move(statusUrl)), timeout_(timeout) {
    while (!status_url_.empty() && status_url_.back() == '/') status_url_.pop_back();
}

model::JobStatus HttpJobStatusChannel::poll(const std::string& jobId) {
    const auto resp = sendJson("GET", status_url_ + "/jobs/" + jobId, {}, "", timeout_);
    if (!resp.ok())
        throw std::runtime_error(fmt::format("job status unavailable for {} (HTTP {}, {})", jobId, resp.http, resp.curlError()));

    auto status = nlohmann::json::parse(resp.body).get<model::JobStatus>();
    if (status.jobId.empty()) status.jobId = jobId;
    return status;
}

model::JobStatus cs::execution::waitFor(JobStatusChannel& channel, const std::string& jobId,
                                        const std::chrono::milliseconds interval,
                                        const std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        auto status = channel.poll(jobId);
        LogRegistry::exec()->debug("[JobStatusChannel] Job {} is {}", jobId, to_string(status.state));
        if (status.isTerminal()) return status;

        if (std::chrono::steady_clock::now() + interval > deadline)
            throw std::runtime_error("Timed out waiting for job " + jobId + " (last status: " + to_string(status.state) + ")");

        std::this_thread::sleep_for(interval);
    }
}
