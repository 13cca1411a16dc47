#pragma once

#include "agent_state.hpp"
#include "ctxsys/core/result.hpp"
#include "ctxsys/db/database.hpp"
#include "ctxsys/db/schema.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ctxsys::agent {

using namespace ctxsys::core;

struct CheckpointMetadata {
    std::optional<std::string> description;
    TriggerType trigger_type = TriggerType::Auto;
    int64_t duration_ms = 0;
    std::optional<int64_t> token_usage;
};

// Immutable snapshot of an AgentState. step_number is the state's
// current_step_index at save time.
struct Checkpoint {
    CheckpointId id;
    SessionId session_id;
    ProjectId project_id;
    int step_number = 0;
    TimePoint created_at;
    AgentState state;
    CheckpointMetadata metadata;
};

// Checkpoint without its state payload, for listings
struct CheckpointSummary {
    CheckpointId id;
    int step_number = 0;
    TimePoint created_at;
    std::optional<std::string> description;
    TriggerType trigger_type = TriggerType::Auto;
    int64_t duration_ms = 0;
};

struct SaveOptions {
    std::optional<std::string> description;
    TriggerType trigger_type = TriggerType::Auto;
    int64_t duration_ms = 0;
    std::optional<int64_t> token_usage;
};

// Persists agent state snapshots for one project. Every save is followed by
// a retention prune in the same transaction, keeping the max_checkpoints most
// recent checkpoints of the session by (step_number, created_at).
class CheckpointStore {
public:
    CheckpointStore(db::Database& db, ProjectId project_id, int max_checkpoints = 10);

    Result<Checkpoint, Error> save(const SessionId& session_id,
                                   const AgentState& state,
                                   const SaveOptions& options = {});

    // Highest (step_number, created_at) checkpoint of the session
    Result<std::optional<Checkpoint>, Error> load_latest(const SessionId& session_id) const;

    Result<std::optional<Checkpoint>, Error> load(const CheckpointId& id) const;

    // Most recently created checkpoint at the given step
    Result<std::optional<Checkpoint>, Error> load_at_step(const SessionId& session_id,
                                                          int step_number) const;

    // Summaries, step_number descending
    Result<std::vector<CheckpointSummary>, Error> list(const SessionId& session_id) const;

    Result<bool, Error> remove(const CheckpointId& id);
    Result<int64_t, Error> clear_session(const SessionId& session_id);
    Result<int64_t, Error> count(const SessionId& session_id) const;

    // Deletes checkpoints of every session older than now - days
    Result<int64_t, Error> prune_by_age(int days);

    const ProjectId& project_id() const { return project_id_; }
    int max_checkpoints() const { return max_checkpoints_; }

private:
    db::Database& db_;
    ProjectId project_id_;
    db::ProjectTables tables_;
    int max_checkpoints_;

    Result<int64_t, Error> prune_session(const SessionId& session_id);
    Result<std::optional<Checkpoint>, Error> load_one(const std::string& sql,
                                                      const db::Params& params) const;
    Result<Checkpoint, Error> row_to_checkpoint(const db::Row& row) const;
};

}  // namespace ctxsys::agent
