#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace cs::execution::model {

// Client -> server: run `entrypointFile` against the current committed version
struct ExecuteRequest {
    std::string entrypointFile;
    std::string language;
    std::optional<std::string> input;
};

struct ExecuteResponse {
    std::string jobId;
    uint64_t workspaceVersion{};
};

enum class JobState { Queued, Processing, Completed, Failed };

std::string to_string(JobState s);
JobState jobStateFromString(const std::string& s);

struct JobStatus {
    std::string jobId;
    JobState state{JobState::Queued};
    std::optional<std::string> output;
    std::optional<std::string> error;
    std::optional<std::string> failureType;   // e.g. "timeout", "runtime_error", set by the worker

    [[nodiscard]] bool isTerminal() const { return state == JobState::Completed || state == JobState::Failed; }
};

struct WorkerFile {
    std::string storageKey;
    std::string filePath;
};

// Server -> worker. Pins the version so the worker reads exactly one commit.
struct WorkerPayload {
    std::string jobId;
    std::string workspaceId;
    uint64_t workspaceVersion{};
    std::string entrypointFile;
    std::string language;
    std::string input;
    std::string bucket;
    std::vector<WorkerFile> files;
};

void to_json(nlohmann::json& j, const ExecuteRequest& r);
void from_json(const nlohmann::json& j, ExecuteRequest& r);
void to_json(nlohmann::json& j, const ExecuteResponse& r);
void from_json(const nlohmann::json& j, ExecuteResponse& r);
void to_json(nlohmann::json& j, const JobStatus& s);
void from_json(const nlohmann::json& j, JobStatus& s);
void to_json(nlohmann::json& j, const WorkerFile& f);
void to_json(nlohmann::json& j, const WorkerPayload& p);

}
