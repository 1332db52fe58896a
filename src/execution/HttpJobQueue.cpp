#include "execution/JobQueue.hpp"
#include "util/jsonHttp.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace cs::execution;
using namespace cs::util;
using namespace cs::logging;

HttpJobQueue::HttpJobQueue(std::string workerUrl, const std::chrono::seconds timeout)
    : worker_url_(std::move(workerUrl)), timeout_(timeout) {
    while (!worker_url_.empty() && worker_url_.back() == '/') worker_url_.pop_back();
}

void HttpJobQueue::submit(const model::WorkerPayload& payload) {
    const nlohmann::json body = payload;
    const auto resp = sendJson("POST", worker_url_ + "/execute_auth", {}, body.dump(), timeout_);

    if (!resp.ok()) {
        LogRegistry::exec()->error("[HttpJobQueue] Worker rejected job {}: CURL={} HTTP={} body={}",
                                   payload.jobId, resp.curlError(), resp.http, resp.body);
        throw std::runtime_error(fmt::format("execution worker rejected job (HTTP {}, {})", resp.http, resp.curlError()));
    }
}
