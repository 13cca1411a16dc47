#pragma once

#include "ctxsys/core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ctxsys::agent {

using namespace ctxsys::core;

enum class StepStatus {
    Pending,
    Running,
    Completed,
    Failed,
    Skipped
};

inline std::string_view step_status_to_string(StepStatus status) {
    switch (status) {
        case StepStatus::Pending: return "pending";
        case StepStatus::Running: return "running";
        case StepStatus::Completed: return "completed";
        case StepStatus::Failed: return "failed";
        case StepStatus::Skipped: return "skipped";
    }
    return "pending";
}

inline StepStatus step_status_from_string(std::string_view str) {
    if (str == "running") return StepStatus::Running;
    if (str == "completed") return StepStatus::Completed;
    if (str == "failed") return StepStatus::Failed;
    if (str == "skipped") return StepStatus::Skipped;
    return StepStatus::Pending;
}

// What caused a checkpoint to be written
enum class TriggerType {
    Auto,
    Manual,
    Error
};

inline std::string_view trigger_type_to_string(TriggerType trigger) {
    switch (trigger) {
        case TriggerType::Auto: return "auto";
        case TriggerType::Manual: return "manual";
        case TriggerType::Error: return "error";
    }
    return "auto";
}

inline TriggerType trigger_type_from_string(std::string_view str) {
    if (str == "manual") return TriggerType::Manual;
    if (str == "error") return TriggerType::Error;
    return TriggerType::Auto;
}

// One unit of work in a plan
struct PlanStep {
    StepId id;
    std::string description;
    std::string action;            // resolved by the step runner
    Json parameters = Json::object();
    StepStatus status = StepStatus::Pending;
    std::vector<StepId> dependencies;

    Json to_json() const;
    static PlanStep from_json(const Json& j);
};

// Output of a successfully completed step
struct StepResult {
    StepId step_id;
    Json output;
    TimePoint completed_at;
    int64_t duration_ms = 0;
    std::optional<int64_t> token_usage;

    Json to_json() const;
    static StepResult from_json(const Json& j);
};

struct LastError {
    int step_index = 0;
    std::string message;
    TimePoint timestamp;

    Json to_json() const;
    static LastError from_json(const Json& j);
};

// Execution state snapshotted into checkpoints.
// results only holds entries for completed steps.
struct AgentState {
    std::string query;
    std::vector<PlanStep> plan;
    int current_step_index = 0;
    std::vector<StepResult> results;
    Json context = Json::object();
    std::optional<LastError> last_error;

    bool is_complete() const { return current_step_index >= static_cast<int>(plan.size()); }

    Json to_json() const;
    static AgentState from_json(const Json& j);
};

}  // namespace ctxsys::agent
