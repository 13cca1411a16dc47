#include "ctxsys/agent/plan_executor.hpp"

#include <spdlog/spdlog.h>

#include <unordered_set>

namespace ctxsys::agent {

PlanExecutor::PlanExecutor(CheckpointStore& checkpoints, StepRunner runner, bool auto_checkpoint)
    : checkpoints_(checkpoints)
    , runner_(runner ? std::move(runner) : default_step_runner())
    , auto_checkpoint_(auto_checkpoint)
{
}

PlanExecutor::PlanExecutor(std::shared_ptr<CheckpointStore> checkpoints, StepRunner runner, bool auto_checkpoint)
    : owned_checkpoints_(std::move(checkpoints))
    , checkpoints_(*owned_checkpoints_)
    , runner_(runner ? std::move(runner) : default_step_runner())
    , auto_checkpoint_(auto_checkpoint)
{
}

void PlanExecutor::add_listener(ExecutionEventCallback callback) {
    if (callback) {
        listeners_.push_back(std::move(callback));
    }
}

void PlanExecutor::clear_listeners() {
    listeners_.clear();
}

void PlanExecutor::set_runner(StepRunner runner) {
    runner_ = runner ? std::move(runner) : default_step_runner();
}

void PlanExecutor::emit(ExecutionEventData data) const {
    for (const auto& listener : listeners_) {
        try {
            listener(data);
        } catch (const std::exception& e) {
            spdlog::warn("Execution listener threw on step {}: {}", data.step_index, e.what());
        }
    }
}

AgentState PlanExecutor::initialize_state(const std::vector<PlanStep>& plan, const std::string& query) {
    AgentState state;
    state.query = query;
    state.plan = plan;
    state.current_step_index = 0;
    return state;
}

bool PlanExecutor::dependencies_met(const PlanStep& step, const AgentState& state) {
    if (step.dependencies.empty()) {
        return true;
    }

    std::unordered_set<StepId> completed;
    for (const auto& result : state.results) {
        completed.insert(result.step_id);
    }

    for (const auto& dep : step.dependencies) {
        if (!completed.count(dep)) {
            return false;
        }
    }
    return true;
}

ExecutionResult PlanExecutor::execute(const SessionId& session_id,
                                      const std::vector<PlanStep>& plan,
                                      const ExecuteOptions& options) {
    auto start = std::chrono::steady_clock::now();

    if (options.resume_from_checkpoint) {
        auto latest = checkpoints_.load_latest(session_id);
        if (latest.is_err()) {
            ExecutionResult result;
            result.state = initialize_state(plan, options.query);
            result.error = std::move(latest).error();
            result.total_duration_ms = elapsed_ms(start);
            spdlog::error("Failed to load checkpoint for session {}: {}",
                          session_id, result.error->message);
            return result;
        }

        if (latest.value()) {
            const auto& checkpoint = *latest.value();
            if (!plan.empty()) {
                spdlog::warn("Resuming session {}: supplied plan ignored, using checkpoint {}",
                             session_id, checkpoint.id);
            }
            spdlog::info("Resuming session {} from checkpoint {} at step {}",
                         session_id, checkpoint.id, checkpoint.step_number);
            return run(session_id, checkpoint.state, options, true, start);
        }

        spdlog::info("No checkpoint for session {}, starting fresh", session_id);
    }

    return run(session_id, initialize_state(plan, options.query), options, false, start);
}

ExecutionResult PlanExecutor::resume(const SessionId& session_id, ExecuteOptions options) {
    options.resume_from_checkpoint = true;
    return execute(session_id, {}, options);
}

Result<ExecutionResult, Error> PlanExecutor::resume_from(const CheckpointId& checkpoint_id,
                                                         const SessionId& session_id,
                                                         const ExecuteOptions& options) {
    auto start = std::chrono::steady_clock::now();

    auto loaded = checkpoints_.load(checkpoint_id);
    if (loaded.is_err()) {
        return Result<ExecutionResult, Error>::err(std::move(loaded).error());
    }
    if (!loaded.value()) {
        return Result<ExecutionResult, Error>::err(
            ErrorCode::CheckpointNotFound,
            "Checkpoint not found: " + checkpoint_id,
            checkpoint_id
        );
    }

    spdlog::info("Resuming session {} from checkpoint {}", session_id, checkpoint_id);
    return Result<ExecutionResult, Error>::ok(
        run(session_id, loaded.value()->state, options, true, start));
}

Result<Checkpoint, Error> PlanExecutor::create_manual_checkpoint(const SessionId& session_id,
                                                                 const AgentState& state,
                                                                 std::optional<std::string> description) {
    SaveOptions save_options;
    save_options.trigger_type = TriggerType::Manual;
    save_options.description = std::move(description);
    return checkpoints_.save(session_id, state, save_options);
}

Result<Json, Error> PlanExecutor::invoke_runner(const PlanStep& step, AgentState& state) {
    try {
        return runner_(step, state);
    } catch (const std::exception& e) {
        return Result<Json, Error>::err(ErrorCode::StepFailed, e.what(), step.id);
    }
}

Result<void, Error> PlanExecutor::save_checkpoint(const SessionId& session_id,
                                                  const AgentState& state,
                                                  SaveOptions options,
                                                  int step_index) {
    auto saved = checkpoints_.save(session_id, state, options);
    if (saved.is_err()) {
        return Result<void, Error>::err(std::move(saved).error());
    }

    const auto& checkpoint = saved.value();
    emit(ExecutionEventData{
        .event = ExecutionEvent::CheckpointSaved,
        .step_index = step_index,
        .step_id = {},
        .message = checkpoint.metadata.description.value_or(""),
        .metadata = {
            {"checkpoint_id", checkpoint.id},
            {"step_number", checkpoint.step_number},
            {"trigger_type", std::string(trigger_type_to_string(checkpoint.metadata.trigger_type))}
        }
    });

    return Result<void, Error>::ok();
}

ExecutionResult PlanExecutor::run(const SessionId& session_id,
                                  AgentState state,
                                  const ExecuteOptions& options,
                                  bool resumed,
                                  std::chrono::steady_clock::time_point start) {
    bool auto_checkpoint = options.auto_checkpoint.value_or(auto_checkpoint_);

    ExecutionResult result;
    result.resumed_from_checkpoint = resumed;

    auto finish = [&](std::optional<Error> error) {
        result.success = !error.has_value();
        result.error = std::move(error);
        result.state = std::move(state);
        result.total_duration_ms = elapsed_ms(start);
        return std::move(result);
    };

    while (state.current_step_index < static_cast<int>(state.plan.size())) {
        int index = state.current_step_index;
        PlanStep& step = state.plan[index];

        if (step.status == StepStatus::Completed) {
            ++state.current_step_index;
            continue;
        }

        if (!dependencies_met(step, state)) {
            spdlog::debug("Skipping step {} ({}): unmet dependencies", index, step.id);
            step.status = StepStatus::Skipped;
            ++state.current_step_index;
            continue;
        }

        step.status = StepStatus::Running;
        auto step_start = std::chrono::steady_clock::now();

        emit(ExecutionEventData{
            .event = ExecutionEvent::StepStarted,
            .step_index = index,
            .step_id = step.id,
            .message = step.description,
            .metadata = {{"action", step.action}}
        });

        // Runner may reshape state.plan, so it gets a copy of the step
        PlanStep dispatched = step;
        auto outcome = invoke_runner(dispatched, state);

        if (index >= static_cast<int>(state.plan.size())) {
            Error error(ErrorCode::InvalidState,
                        "Plan no longer contains step " + std::to_string(index) + " after it ran",
                        dispatched.id);
            state.last_error = LastError{
                .step_index = index,
                .message = error.message,
                .timestamp = now()
            };

            spdlog::error("Step {} ({}) removed from the plan by its runner", index, dispatched.id);

            emit(ExecutionEventData{
                .event = ExecutionEvent::StepFailed,
                .step_index = index,
                .step_id = dispatched.id,
                .message = error.message,
                .metadata = {{"error_code", static_cast<int>(error.code)}}
            });

            return finish(std::move(error));
        }

        PlanStep& current = state.plan[index];

        if (outcome.is_err()) {
            Error error = std::move(outcome).error();
            current.status = StepStatus::Failed;
            state.last_error = LastError{
                .step_index = index,
                .message = error.message,
                .timestamp = now()
            };

            spdlog::warn("Step {} ({}) failed: {}", index, current.id, error.message);

            emit(ExecutionEventData{
                .event = ExecutionEvent::StepFailed,
                .step_index = index,
                .step_id = current.id,
                .message = error.message,
                .metadata = {{"error_code", static_cast<int>(error.code)}}
            });

            SaveOptions save_options;
            save_options.trigger_type = TriggerType::Error;
            save_options.description = "Failed at step " + std::to_string(index) + ": " + current.description;
            save_options.duration_ms = elapsed_ms(start);

            auto saved = save_checkpoint(session_id, state, save_options, index);
            if (saved.is_err()) {
                spdlog::error("Failed to save error checkpoint: {}", saved.error().message);
            }

            return finish(std::move(error));
        }

        current.status = StepStatus::Completed;
        StepResult step_result{
            .step_id = current.id,
            .output = std::move(outcome).value(),
            .completed_at = now(),
            .duration_ms = elapsed_ms(step_start),
            .token_usage = std::nullopt
        };
        state.results.push_back(step_result);
        ++result.steps_executed;

        emit(ExecutionEventData{
            .event = ExecutionEvent::StepCompleted,
            .step_index = index,
            .step_id = current.id,
            .message = current.description,
            .metadata = {{"output", step_result.output}, {"duration_ms", step_result.duration_ms}}
        });

        ++state.current_step_index;

        if (auto_checkpoint) {
            SaveOptions save_options;
            save_options.trigger_type = TriggerType::Auto;
            save_options.duration_ms = elapsed_ms(start);

            auto saved = save_checkpoint(session_id, state, save_options, index);
            if (saved.is_err()) {
                return finish(std::move(saved).error());
            }
        }
    }

    if (auto_checkpoint) {
        SaveOptions save_options;
        save_options.trigger_type = TriggerType::Auto;
        save_options.description = "Execution complete";
        save_options.duration_ms = elapsed_ms(start);

        auto saved = save_checkpoint(session_id, state, save_options, state.current_step_index);
        if (saved.is_err()) {
            return finish(std::move(saved).error());
        }
    }

    spdlog::info("Session {}: plan complete, {} steps executed", session_id, result.steps_executed);
    return finish(std::nullopt);
}

}  // namespace ctxsys::agent
