#pragma once

#include "agent_state.hpp"
#include "ctxsys/core/result.hpp"

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ctxsys::agent {

using namespace ctxsys::core;

// Performs one plan step. An error result (or a thrown std::exception) fails
// the step; the value becomes the StepResult output.
using StepRunner = std::function<Result<Json, Error>(const PlanStep& step, AgentState& state)>;

// Handler for a single action name; receives the step's parameters
using StepHandler = std::function<Result<Json, Error>(const Json& parameters, AgentState& state)>;

// Builds a runner dispatching on PlanStep::action. Unmapped actions fail
// with UnknownAction.
StepRunner make_step_runner(std::unordered_map<std::string, StepHandler> handlers);

// Runner used when none is configured; always fails with NoStepRunner
StepRunner default_step_runner();

// Action name -> handler registry
class StepRegistry {
public:
    StepRegistry() = default;

    Result<void, Error> register_action(const std::string& action, StepHandler handler);
    Result<void, Error> unregister_action(const std::string& action);

    bool has_action(const std::string& action) const;
    std::vector<std::string> actions() const;
    size_t size() const;

    // Dispatch a step directly through the registry
    Result<Json, Error> run(const PlanStep& step, AgentState& state) const;

    // Runner over a snapshot of the handlers registered so far
    StepRunner as_runner() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, StepHandler> handlers_;
};

}  // namespace ctxsys::agent
