#pragma once

#include "agent_state.hpp"
#include "checkpoint_store.hpp"
#include "step_registry.hpp"
#include "ctxsys/core/result.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ctxsys::agent {

using namespace ctxsys::core;

// Events emitted while a plan runs
enum class ExecutionEvent {
    StepStarted,        // Step dispatched to the runner
    StepCompleted,      // Runner returned a value
    StepFailed,         // Runner failed; the run stops
    CheckpointSaved     // Auto, error, or final checkpoint written
};

struct ExecutionEventData {
    ExecutionEvent event;
    int step_index = -1;
    StepId step_id;
    std::string message;    // failure message or checkpoint description
    Json metadata;          // step output, checkpoint id and trigger
};

using ExecutionEventCallback = std::function<void(const ExecutionEventData&)>;

struct ExecuteOptions {
    std::string query;
    bool resume_from_checkpoint = false;
    std::optional<bool> auto_checkpoint;  // unset: executor default
};

struct ExecutionResult {
    bool success = false;
    AgentState state;
    std::optional<Error> error;
    int64_t total_duration_ms = 0;
    int steps_executed = 0;
    bool resumed_from_checkpoint = false;
};

// Runs a plan step by step, checkpointing after each completed step.
//
// Steps are visited once each, in plan order. A step whose dependencies are
// not all present in state.results at its turn is marked skipped and is not
// revisited in that run. The first failing step stops the run; its error
// checkpoint leaves the cursor on the failed step so a later resume retries it.
class PlanExecutor {
public:
    PlanExecutor(CheckpointStore& checkpoints,
                 StepRunner runner = nullptr,
                 bool auto_checkpoint = true);

    // Shares ownership of the store, which then outlives any cache holding it
    PlanExecutor(std::shared_ptr<CheckpointStore> checkpoints,
                 StepRunner runner = nullptr,
                 bool auto_checkpoint = true);

    // Never fails: every failure is captured in the returned result.
    // With resume_from_checkpoint the plan argument is ignored in favour of
    // the latest checkpoint's plan; without a checkpoint the plan starts fresh.
    ExecutionResult execute(const SessionId& session_id,
                            const std::vector<PlanStep>& plan,
                            const ExecuteOptions& options = {});

    // execute() with resume semantics and no plan
    ExecutionResult resume(const SessionId& session_id, ExecuteOptions options = {});

    // Continue from a specific checkpoint. CheckpointNotFound if it does not exist.
    Result<ExecutionResult, Error> resume_from(const CheckpointId& checkpoint_id,
                                               const SessionId& session_id,
                                               const ExecuteOptions& options = {});

    Result<Checkpoint, Error> create_manual_checkpoint(const SessionId& session_id,
                                                       const AgentState& state,
                                                       std::optional<std::string> description = std::nullopt);

    // A listener that throws is logged and does not affect the run
    void add_listener(ExecutionEventCallback callback);
    void clear_listeners();

    void set_runner(StepRunner runner);

private:
    std::shared_ptr<CheckpointStore> owned_checkpoints_;
    CheckpointStore& checkpoints_;
    StepRunner runner_;
    bool auto_checkpoint_;
    std::vector<ExecutionEventCallback> listeners_;

    static AgentState initialize_state(const std::vector<PlanStep>& plan, const std::string& query);
    static bool dependencies_met(const PlanStep& step, const AgentState& state);

    ExecutionResult run(const SessionId& session_id,
                        AgentState state,
                        const ExecuteOptions& options,
                        bool resumed,
                        std::chrono::steady_clock::time_point start);

    Result<Json, Error> invoke_runner(const PlanStep& step, AgentState& state);

    Result<void, Error> save_checkpoint(const SessionId& session_id,
                                        const AgentState& state,
                                        SaveOptions options,
                                        int step_index);

    void emit(ExecutionEventData data) const;
};

}  // namespace ctxsys::agent
