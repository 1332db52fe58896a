#include "execution/model/Job.hpp"
#include "util/json.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace cs::execution::model;
using namespace cs::util;

std::string cs::execution::model::to_string(const JobState s) {
    switch (s) {
        case JobState::Queued: return "queued";
        case JobState::Processing: return "processing";
        case JobState::Completed: return "completed";
        case JobState::Failed: return "failed";
    }
    return "unknown";
}

JobState cs::execution::model::jobStateFromString(const std::string& s) {
    if (s == "queued") return JobState::Queued;
    if (s == "processing") return JobState::Processing;
    if (s == "completed") return JobState::Completed;
    if (s == "failed") return JobState::Failed;
    throw std::invalid_argument("Unknown job status: " + s);
}

void cs::execution::model::to_json(nlohmann::json& j, const ExecuteRequest& r) {
    j = {
        {"entrypointFile", r.entrypointFile},
        {"language", r.language}
    };
    put_optional(j, "input", r.input);
}

void cs::execution::model::from_json(const nlohmann::json& j, ExecuteRequest& r) {
    j.at("entrypointFile").get_to(r.entrypointFile);
    j.at("language").get_to(r.language);
    r.input = get_optional<std::string>(j, "input");
}

void cs::execution::model::to_json(nlohmann::json& j, const ExecuteResponse& r) {
    j = {
        {"jobId", r.jobId},
        {"workspaceVersion", r.workspaceVersion}
    };
}

void cs::execution::model::from_json(const nlohmann::json& j, ExecuteResponse& r) {
    j.at("jobId").get_to(r.jobId);
    j.at("workspaceVersion").get_to(r.workspaceVersion);
}

// Worker-side status documents are snake_case
void cs::execution::model::to_json(nlohmann::json& j, const JobStatus& s) {
    j = {
        {"job_id", s.jobId},
        {"status", to_string(s.state)}
    };
    put_optional(j, "output", s.output);
    put_optional(j, "error", s.error);
    put_optional(j, "failure_type", s.failureType);
}

void cs::execution::model::from_json(const nlohmann::json& j, JobStatus& s) {
    s.jobId = j.value("job_id", "");
    s.state = jobStateFromString(j.at("status").get<std::string>());
    s.output = get_optional<std::string>(j, "output");
    s.error = get_optional<std::string>(j, "error");
    s.failureType = get_optional<std::string>(j, "failure_type");
}

void cs::execution::model::to_json(nlohmann::json& j, const WorkerFile& f) {
    j = {
        {"storage_key", f.storageKey},
        {"file_path", f.filePath}
    };
}

void cs::execution::model::to_json(nlohmann::json& j, const WorkerPayload& p) {
    j = {
        {"job_id", p.jobId},
        {"workspace_id", p.workspaceId},
        {"workspace_version", p.workspaceVersion},
        {"entrypoint_file", p.entrypointFile},
        {"language", p.language},
        {"input", p.input},
        {"bucket", p.bucket},
        {"files", p.files}
    };
}
