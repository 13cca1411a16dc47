#include "ctxsys/service/core_service.hpp"
#include "ctxsys/core/logging.hpp"
#include "ctxsys/db/schema.hpp"
#include "ctxsys/embeddings/ollama_provider.hpp"

#include <spdlog/spdlog.h>

namespace ctxsys::service {

std::shared_ptr<memory::EmbeddingProvider> make_embedding_provider(const EmbeddingConfig& config) {
    if (config.provider == "ollama") {
        return std::make_shared<embeddings::OllamaProvider>(
            config.base_url, config.model, config.timeout_ms);
    }
    return nullptr;
}

Result<std::unique_ptr<CoreService>, Error> CoreService::create(
    const Config& config,
    std::shared_ptr<memory::EmbeddingProvider> embeddings) {
    using R = Result<std::unique_ptr<CoreService>, Error>;

    auto valid = config.validate();
    if (valid.is_err()) {
        return R::err(std::move(valid).error());
    }

    auto logging = init_logging(config.observability);
    if (logging.is_err()) {
        return R::err(std::move(logging).error());
    }

    auto db = db::Database::open(config.storage.database_path, config.storage.busy_timeout_ms);
    if (db.is_err()) {
        spdlog::error("Failed to open database {}: {}",
                      config.storage.database_path.string(), db.error().message);
        return R::err(std::move(db).error());
    }

    if (!embeddings) {
        embeddings = make_embedding_provider(config.embeddings);
    }

    spdlog::info("ctxsys core ready (database {}, embeddings {})",
                 config.storage.database_path.string(),
                 embeddings ? embeddings->name() : "none");

    return R::ok(std::unique_ptr<CoreService>(
        new CoreService(config, std::move(db).value(), std::move(embeddings))));
}

CoreService::CoreService(Config config,
                         std::unique_ptr<db::Database> db,
                         std::shared_ptr<memory::EmbeddingProvider> embeddings)
    : config_(std::move(config))
    , db_(std::move(db))
    , embeddings_(std::move(embeddings))
{
}

Result<CoreService::ProjectContext*, Error> CoreService::project(const ProjectId& project_id) {
    using R = Result<ProjectContext*, Error>;
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = projects_.find(project_id);
    if (it != projects_.end()) {
        return R::ok(it->second.get());
    }

    if (project_id.empty()) {
        return R::err(ErrorCode::InvalidArgument, "Project id must not be empty");
    }

    auto created = db::create_project(*db_, project_id);
    if (created.is_err()) {
        return R::err(ErrorCode::ProjectNotInitialized, created.error().message, project_id);
    }

    auto context = std::make_unique<ProjectContext>();
    context->checkpoints = std::make_shared<agent::CheckpointStore>(
        *db_, project_id, config_.checkpoints.max_checkpoints);
    context->memory = std::make_shared<memory::MemoryTierManager>(
        *db_, project_id, embeddings_, config_.memory);

    if (config_.checkpoints.retention_days > 0) {
        auto pruned = context->checkpoints->prune_by_age(config_.checkpoints.retention_days);
        if (pruned.is_err()) {
            spdlog::warn("Checkpoint retention for project {} failed: {}",
                         project_id, pruned.error().message);
        }
    }

    auto* raw = context.get();
    projects_.emplace(project_id, std::move(context));
    return R::ok(raw);
}

Result<std::shared_ptr<agent::CheckpointStore>, Error> CoreService::checkpoints(const ProjectId& project_id) {
    using R = Result<std::shared_ptr<agent::CheckpointStore>, Error>;

    auto ctx = project(project_id);
    if (ctx.is_err()) {
        return R::err(std::move(ctx).error());
    }
    return R::ok(ctx.value()->checkpoints);
}

Result<std::shared_ptr<memory::MemoryTierManager>, Error> CoreService::memory(const ProjectId& project_id) {
    using R = Result<std::shared_ptr<memory::MemoryTierManager>, Error>;

    auto ctx = project(project_id);
    if (ctx.is_err()) {
        return R::err(std::move(ctx).error());
    }
    return R::ok(ctx.value()->memory);
}

Result<std::unique_ptr<agent::PlanExecutor>, Error> CoreService::create_executor(
    const ProjectId& project_id, agent::StepRunner runner) {
    using R = Result<std::unique_ptr<agent::PlanExecutor>, Error>;

    auto store = checkpoints(project_id);
    if (store.is_err()) {
        return R::err(std::move(store).error());
    }
    return R::ok(std::make_unique<agent::PlanExecutor>(
        std::move(store).value(), std::move(runner), config_.checkpoints.auto_checkpoint));
}

Result<agent::Checkpoint, Error> CoreService::save_checkpoint(const ProjectId& project_id,
                                                              const SessionId& session_id,
                                                              const agent::AgentState& state,
                                                              const agent::SaveOptions& options) {
    auto store = checkpoints(project_id);
    if (store.is_err()) {
        return Result<agent::Checkpoint, Error>::err(std::move(store).error());
    }
    return store.value()->save(session_id, state, options);
}

Result<std::optional<agent::Checkpoint>, Error> CoreService::load_checkpoint(
    const ProjectId& project_id,
    const SessionId& session_id,
    const std::optional<CheckpointId>& checkpoint_id) {
    auto store = checkpoints(project_id);
    if (store.is_err()) {
        return Result<std::optional<agent::Checkpoint>, Error>::err(std::move(store).error());
    }
    if (checkpoint_id) {
        return store.value()->load(*checkpoint_id);
    }
    return store.value()->load_latest(session_id);
}

Result<std::vector<agent::CheckpointSummary>, Error> CoreService::list_checkpoints(
    const ProjectId& project_id, const SessionId& session_id) {
    auto store = checkpoints(project_id);
    if (store.is_err()) {
        return Result<std::vector<agent::CheckpointSummary>, Error>::err(std::move(store).error());
    }
    return store.value()->list(session_id);
}

Result<bool, Error> CoreService::delete_checkpoint(const ProjectId& project_id,
                                                   const CheckpointId& checkpoint_id) {
    auto store = checkpoints(project_id);
    if (store.is_err()) {
        return Result<bool, Error>::err(std::move(store).error());
    }
    return store.value()->remove(checkpoint_id);
}

Result<int64_t, Error> CoreService::prune_expired_checkpoints(const ProjectId& project_id) {
    if (config_.checkpoints.retention_days <= 0) {
        return Result<int64_t, Error>::ok(0);
    }
    auto store = checkpoints(project_id);
    if (store.is_err()) {
        return Result<int64_t, Error>::err(std::move(store).error());
    }
    return store.value()->prune_by_age(config_.checkpoints.retention_days);
}

Result<memory::MemoryStatus, Error> CoreService::memory_status(const ProjectId& project_id,
                                                               const SessionId& session_id) {
    auto manager = memory(project_id);
    if (manager.is_err()) {
        return Result<memory::MemoryStatus, Error>::err(std::move(manager).error());
    }
    return manager.value()->get_status(session_id);
}

void CoreService::clear_project_cache(const ProjectId& project_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    projects_.erase(project_id);
}

Result<void, Error> CoreService::drop_project(const ProjectId& project_id) {
    clear_project_cache(project_id);
    return db::drop_project(*db_, project_id);
}

}  // namespace ctxsys::service
