#include "ctxsys/agent/checkpoint_store.hpp"
#include "ctxsys/core/uuid.hpp"

#include <spdlog/spdlog.h>

namespace ctxsys::agent {

namespace {

Json optional_text(const std::optional<std::string>& value) {
    return value ? Json(*value) : Json(nullptr);
}

Json optional_int(const std::optional<int64_t>& value) {
    return value ? Json(*value) : Json(nullptr);
}

}  // namespace

CheckpointStore::CheckpointStore(db::Database& db, ProjectId project_id, int max_checkpoints)
    : db_(db)
    , project_id_(std::move(project_id))
    , tables_(db::ProjectTables::for_project(project_id_))
    , max_checkpoints_(max_checkpoints)
{
}

Result<Checkpoint, Error> CheckpointStore::save(const SessionId& session_id,
                                                const AgentState& state,
                                                const SaveOptions& options) {
    Checkpoint checkpoint;
    checkpoint.id = generate_checkpoint_id();
    checkpoint.session_id = session_id;
    checkpoint.project_id = project_id_;
    checkpoint.step_number = state.current_step_index;
    checkpoint.created_at = now();
    checkpoint.state = state;
    checkpoint.metadata.description = options.description;
    checkpoint.metadata.trigger_type = options.trigger_type;
    checkpoint.metadata.duration_ms = options.duration_ms;
    checkpoint.metadata.token_usage = options.token_usage;

    auto written = db_.with_transaction([&]() -> Result<int64_t, Error> {
        auto inserted = db_.execute(
            "INSERT INTO " + tables_.checkpoints + " ("
            "id, session_id, step_number, created_at, state, "
            "description, trigger_type, duration_ms, token_usage"
            ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)",
            {
                checkpoint.id,
                checkpoint.session_id,
                checkpoint.step_number,
                to_epoch_ms(checkpoint.created_at),
                checkpoint.state.to_json().dump(),
                optional_text(checkpoint.metadata.description),
                std::string(trigger_type_to_string(checkpoint.metadata.trigger_type)),
                checkpoint.metadata.duration_ms,
                optional_int(checkpoint.metadata.token_usage)
            }
        );
        if (inserted.is_err()) {
            return inserted;
        }
        return prune_session(session_id);
    });

    if (written.is_err()) {
        spdlog::error("Failed to save checkpoint for session {}: {}",
                      session_id, written.error().message);
        return Result<Checkpoint, Error>::err(
            ErrorCode::CheckpointSaveFailed,
            written.error().message,
            session_id
        );
    }

    if (written.value() > 0) {
        spdlog::debug("Pruned {} checkpoints for session {}", written.value(), session_id);
    }

    spdlog::debug("Saved checkpoint {} (session {}, step {}, {})",
                  checkpoint.id, session_id, checkpoint.step_number,
                  trigger_type_to_string(checkpoint.metadata.trigger_type));

    return Result<Checkpoint, Error>::ok(std::move(checkpoint));
}

Result<int64_t, Error> CheckpointStore::prune_session(const SessionId& session_id) {
    return db_.execute(
        "DELETE FROM " + tables_.checkpoints + " "
        "WHERE session_id = ? AND id NOT IN ("
        "  SELECT id FROM " + tables_.checkpoints + " "
        "  WHERE session_id = ? "
        "  ORDER BY step_number DESC, created_at DESC, rowid DESC "
        "  LIMIT ?)",
        {session_id, session_id, max_checkpoints_}
    );
}

Result<std::optional<Checkpoint>, Error> CheckpointStore::load_latest(const SessionId& session_id) const {
    return load_one(
        "SELECT * FROM " + tables_.checkpoints + " "
        "WHERE session_id = ? "
        "ORDER BY step_number DESC, created_at DESC, rowid DESC LIMIT 1",
        {session_id}
    );
}

Result<std::optional<Checkpoint>, Error> CheckpointStore::load(const CheckpointId& id) const {
    return load_one(
        "SELECT * FROM " + tables_.checkpoints + " WHERE id = ?",
        {id}
    );
}

Result<std::optional<Checkpoint>, Error> CheckpointStore::load_at_step(const SessionId& session_id,
                                                                      int step_number) const {
    return load_one(
        "SELECT * FROM " + tables_.checkpoints + " "
        "WHERE session_id = ? AND step_number = ? "
        "ORDER BY created_at DESC, rowid DESC LIMIT 1",
        {session_id, step_number}
    );
}

Result<std::vector<CheckpointSummary>, Error> CheckpointStore::list(const SessionId& session_id) const {
    using R = Result<std::vector<CheckpointSummary>, Error>;

    auto rows = db_.fetch_many(
        "SELECT id, step_number, created_at, description, trigger_type, duration_ms "
        "FROM " + tables_.checkpoints + " "
        "WHERE session_id = ? "
        "ORDER BY step_number DESC, created_at DESC, rowid DESC",
        {session_id}
    );
    if (rows.is_err()) {
        return R::err(std::move(rows).error());
    }

    std::vector<CheckpointSummary> summaries;
    summaries.reserve(rows.value().size());
    for (const auto& row : rows.value()) {
        CheckpointSummary summary;
        summary.id = row["id"].get<std::string>();
        summary.step_number = row["step_number"].get<int>();
        summary.created_at = from_epoch_ms(row["created_at"].get<int64_t>());
        if (!row["description"].is_null()) {
            summary.description = row["description"].get<std::string>();
        }
        summary.trigger_type = trigger_type_from_string(row["trigger_type"].get<std::string>());
        summary.duration_ms = row["duration_ms"].is_null() ? 0 : row["duration_ms"].get<int64_t>();
        summaries.push_back(std::move(summary));
    }

    return R::ok(std::move(summaries));
}

Result<bool, Error> CheckpointStore::remove(const CheckpointId& id) {
    auto deleted = db_.execute("DELETE FROM " + tables_.checkpoints + " WHERE id = ?", {id});
    if (deleted.is_err()) {
        return Result<bool, Error>::err(std::move(deleted).error());
    }
    return Result<bool, Error>::ok(deleted.value() > 0);
}

Result<int64_t, Error> CheckpointStore::clear_session(const SessionId& session_id) {
    auto deleted = db_.execute(
        "DELETE FROM " + tables_.checkpoints + " WHERE session_id = ?",
        {session_id}
    );
    if (deleted.is_ok()) {
        spdlog::info("Cleared {} checkpoints for session {}", deleted.value(), session_id);
    }
    return deleted;
}

Result<int64_t, Error> CheckpointStore::count(const SessionId& session_id) const {
    auto row = db_.fetch_one(
        "SELECT COUNT(*) AS count FROM " + tables_.checkpoints + " WHERE session_id = ?",
        {session_id}
    );
    if (row.is_err()) {
        return Result<int64_t, Error>::err(std::move(row).error());
    }
    const auto& found = row.value();
    return Result<int64_t, Error>::ok(found ? (*found)["count"].get<int64_t>() : 0);
}

Result<int64_t, Error> CheckpointStore::prune_by_age(int days) {
    // In epoch ms: a time_point in nanoseconds cannot hold very large spans
    constexpr int64_t kMsPerDay = 24LL * 60 * 60 * 1000;
    int64_t cutoff = to_epoch_ms(now()) - static_cast<int64_t>(days) * kMsPerDay;
    auto deleted = db_.execute(
        "DELETE FROM " + tables_.checkpoints + " WHERE created_at < ?",
        {cutoff}
    );
    if (deleted.is_ok() && deleted.value() > 0) {
        spdlog::info("Pruned {} checkpoints older than {} days", deleted.value(), days);
    }
    return deleted;
}

Result<std::optional<Checkpoint>, Error> CheckpointStore::load_one(const std::string& sql,
                                                                  const db::Params& params) const {
    using R = Result<std::optional<Checkpoint>, Error>;

    auto row = db_.fetch_one(sql, params);
    if (row.is_err()) {
        return R::err(std::move(row).error());
    }
    if (!row.value()) {
        return R::ok(std::nullopt);
    }

    auto checkpoint = row_to_checkpoint(*row.value());
    if (checkpoint.is_err()) {
        return R::err(std::move(checkpoint).error());
    }
    return R::ok(std::move(checkpoint).value());
}

Result<Checkpoint, Error> CheckpointStore::row_to_checkpoint(const db::Row& row) const {
    Checkpoint checkpoint;
    checkpoint.id = row["id"].get<std::string>();
    checkpoint.session_id = row["session_id"].get<std::string>();
    checkpoint.project_id = project_id_;
    checkpoint.step_number = row["step_number"].get<int>();
    checkpoint.created_at = from_epoch_ms(row["created_at"].get<int64_t>());

    try {
        checkpoint.state = AgentState::from_json(Json::parse(row["state"].get<std::string>()));
    } catch (const Json::exception& e) {
        return Result<Checkpoint, Error>::err(
            ErrorCode::SerializationFailed,
            std::string("Corrupt checkpoint state: ") + e.what(),
            checkpoint.id
        );
    }

    if (!row["description"].is_null()) {
        checkpoint.metadata.description = row["description"].get<std::string>();
    }
    checkpoint.metadata.trigger_type = trigger_type_from_string(row["trigger_type"].get<std::string>());
    checkpoint.metadata.duration_ms = row["duration_ms"].is_null() ? 0 : row["duration_ms"].get<int64_t>();
    if (!row["token_usage"].is_null()) {
        checkpoint.metadata.token_usage = row["token_usage"].get<int64_t>();
    }

    return Result<Checkpoint, Error>::ok(std::move(checkpoint));
}

}  // namespace ctxsys::agent
