#include "ctxsys/agent/step_registry.hpp"

#include <algorithm>

namespace ctxsys::agent {

StepRunner make_step_runner(std::unordered_map<std::string, StepHandler> handlers) {
    return [handlers = std::move(handlers)](const PlanStep& step, AgentState& state) -> Result<Json, Error> {
        auto it = handlers.find(step.action);
        if (it == handlers.end()) {
            return Result<Json, Error>::err(
                ErrorCode::UnknownAction,
                "Unknown action: " + step.action,
                step.id
            );
        }
        return it->second(step.parameters, state);
    };
}

StepRunner default_step_runner() {
    return [](const PlanStep& step, AgentState&) -> Result<Json, Error> {
        return Result<Json, Error>::err(
            ErrorCode::NoStepRunner,
            "No step runner configured. Cannot execute step: " + step.action,
            step.id
        );
    };
}

Result<void, Error> StepRegistry::register_action(const std::string& action, StepHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (action.empty() || !handler) {
        return Result<void, Error>::err(
            ErrorCode::InvalidArgument,
            "Action name and handler are required"
        );
    }

    if (handlers_.count(action)) {
        return Result<void, Error>::err(
            ErrorCode::AlreadyExists,
            "Action already registered",
            action
        );
    }

    handlers_[action] = std::move(handler);
    return Result<void, Error>::ok();
}

Result<void, Error> StepRegistry::unregister_action(const std::string& action) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!handlers_.erase(action)) {
        return Result<void, Error>::err(
            ErrorCode::NotFound,
            "Action not registered",
            action
        );
    }
    return Result<void, Error>::ok();
}

bool StepRegistry::has_action(const std::string& action) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.count(action) > 0;
}

std::vector<std::string> StepRegistry::actions() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& [name, handler] : handlers_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

size_t StepRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}

Result<Json, Error> StepRegistry::run(const PlanStep& step, AgentState& state) const {
    StepHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(step.action);
        if (it == handlers_.end()) {
            return Result<Json, Error>::err(
                ErrorCode::UnknownAction,
                "Unknown action: " + step.action,
                step.id
            );
        }
        handler = it->second;
    }
    return handler(step.parameters, state);
}

StepRunner StepRegistry::as_runner() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return make_step_runner(handlers_);
}

}  // namespace ctxsys::agent
