#pragma once

#include "ctxsys/agent/checkpoint_store.hpp"
#include "ctxsys/agent/plan_executor.hpp"
#include "ctxsys/core/config.hpp"
#include "ctxsys/core/result.hpp"
#include "ctxsys/db/database.hpp"
#include "ctxsys/memory/embedding_provider.hpp"
#include "ctxsys/memory/memory_tier.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ctxsys::service {

using namespace ctxsys::core;

// nullptr for provider "none"
std::shared_ptr<memory::EmbeddingProvider> make_embedding_provider(const EmbeddingConfig& config);

// Wires configuration, logging, the database and the embedding provider,
// and hands out per-project checkpoint stores and memory tier managers.
class CoreService {
public:
    static Result<std::unique_ptr<CoreService>, Error> create(
        const Config& config,
        std::shared_ptr<memory::EmbeddingProvider> embeddings = nullptr);

    CoreService(const CoreService&) = delete;
    CoreService& operator=(const CoreService&) = delete;

    // Project components are created (with their tables) on first use.
    // Handed-out components and executors stay usable after the cache drops
    // them; the Database must outlive them all.
    Result<std::shared_ptr<agent::CheckpointStore>, Error> checkpoints(const ProjectId& project_id);
    Result<std::shared_ptr<memory::MemoryTierManager>, Error> memory(const ProjectId& project_id);

    Result<std::unique_ptr<agent::PlanExecutor>, Error> create_executor(
        const ProjectId& project_id, agent::StepRunner runner = nullptr);

    // Checkpoint shortcuts
    Result<agent::Checkpoint, Error> save_checkpoint(const ProjectId& project_id,
                                                     const SessionId& session_id,
                                                     const agent::AgentState& state,
                                                     const agent::SaveOptions& options = {});

    // Specific checkpoint when an id is given, else the session's latest
    Result<std::optional<agent::Checkpoint>, Error> load_checkpoint(
        const ProjectId& project_id,
        const SessionId& session_id,
        const std::optional<CheckpointId>& checkpoint_id = std::nullopt);

    Result<std::vector<agent::CheckpointSummary>, Error> list_checkpoints(const ProjectId& project_id,
                                                                          const SessionId& session_id);

    Result<bool, Error> delete_checkpoint(const ProjectId& project_id, const CheckpointId& checkpoint_id);

    // Applies checkpoints.retention_days; 0 when retention is disabled
    Result<int64_t, Error> prune_expired_checkpoints(const ProjectId& project_id);

    // Memory shortcuts
    Result<memory::MemoryStatus, Error> memory_status(const ProjectId& project_id,
                                                      const SessionId& session_id);

    // Forget cached project components (tables are kept)
    void clear_project_cache(const ProjectId& project_id);

    // Delete a project's tables and cached components. Components still held
    // elsewhere then fail their storage calls with DatabaseError.
    Result<void, Error> drop_project(const ProjectId& project_id);

    db::Database& database() { return *db_; }
    const Config& config() const { return config_; }
    memory::EmbeddingProvider* embedding_provider() const { return embeddings_.get(); }

private:
    CoreService(Config config,
                std::unique_ptr<db::Database> db,
                std::shared_ptr<memory::EmbeddingProvider> embeddings);

    struct ProjectContext {
        std::shared_ptr<agent::CheckpointStore> checkpoints;
        std::shared_ptr<memory::MemoryTierManager> memory;
    };

    Result<ProjectContext*, Error> project(const ProjectId& project_id);

    Config config_;
    std::unique_ptr<db::Database> db_;
    std::shared_ptr<memory::EmbeddingProvider> embeddings_;

    std::mutex mutex_;
    std::unordered_map<ProjectId, std::unique_ptr<ProjectContext>> projects_;
};

}  // namespace ctxsys::service
