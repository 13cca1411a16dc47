#include "ctxsys/agent/agent_state.hpp"

namespace ctxsys::agent {

// PlanStep
Json PlanStep::to_json() const {
    Json j{
        {"id", id},
        {"description", description},
        {"action", action},
        {"parameters", parameters},
        {"status", std::string(step_status_to_string(status))}
    };

    if (!dependencies.empty()) {
        j["dependencies"] = dependencies;
    }

    return j;
}

PlanStep PlanStep::from_json(const Json& j) {
    PlanStep step;
    step.id = j.value("id", "");
    step.description = j.value("description", "");
    step.action = j.value("action", "");
    step.status = step_status_from_string(j.value("status", "pending"));

    if (j.contains("parameters") && j["parameters"].is_object()) {
        step.parameters = j["parameters"];
    }

    if (j.contains("dependencies") && j["dependencies"].is_array()) {
        for (const auto& dep : j["dependencies"]) {
            step.dependencies.push_back(dep.get<std::string>());
        }
    }

    return step;
}

// StepResult
Json StepResult::to_json() const {
    Json j{
        {"step_id", step_id},
        {"output", output},
        {"completed_at", to_epoch_ms(completed_at)},
        {"duration_ms", duration_ms}
    };

    if (token_usage) {
        j["token_usage"] = *token_usage;
    }

    return j;
}

StepResult StepResult::from_json(const Json& j) {
    StepResult result;
    result.step_id = j.value("step_id", "");
    result.duration_ms = j.value("duration_ms", int64_t{0});

    if (j.contains("output")) {
        result.output = j["output"];
    }

    if (j.contains("completed_at")) {
        result.completed_at = from_epoch_ms(j["completed_at"].get<int64_t>());
    }

    if (j.contains("token_usage") && !j["token_usage"].is_null()) {
        result.token_usage = j["token_usage"].get<int64_t>();
    }

    return result;
}

// LastError
Json LastError::to_json() const {
    return Json{
        {"step_index", step_index},
        {"message", message},
        {"timestamp", to_epoch_ms(timestamp)}
    };
}

LastError LastError::from_json(const Json& j) {
    LastError error;
    error.step_index = j.value("step_index", 0);
    error.message = j.value("message", "");
    if (j.contains("timestamp")) {
        error.timestamp = from_epoch_ms(j["timestamp"].get<int64_t>());
    }
    return error;
}

// AgentState
Json AgentState::to_json() const {
    Json plan_json = Json::array();
    for (const auto& step : plan) {
        plan_json.push_back(step.to_json());
    }

    Json results_json = Json::array();
    for (const auto& result : results) {
        results_json.push_back(result.to_json());
    }

    Json j{
        {"query", query},
        {"plan", plan_json},
        {"current_step_index", current_step_index},
        {"results", results_json},
        {"context", context}
    };

    if (last_error) {
        j["last_error"] = last_error->to_json();
    }

    return j;
}

AgentState AgentState::from_json(const Json& j) {
    AgentState state;
    state.query = j.value("query", "");
    state.current_step_index = j.value("current_step_index", 0);

    if (j.contains("plan")) {
        for (const auto& step : j["plan"]) {
            state.plan.push_back(PlanStep::from_json(step));
        }
    }

    if (j.contains("results")) {
        for (const auto& result : j["results"]) {
            state.results.push_back(StepResult::from_json(result));
        }
    }

    if (j.contains("context") && j["context"].is_object()) {
        state.context = j["context"];
    }

    if (j.contains("last_error") && j["last_error"].is_object()) {
        state.last_error = LastError::from_json(j["last_error"]);
    }

    return state;
}

}  // namespace ctxsys::agent
