#pragma once

#include "embedding_provider.hpp"
#include "memory_item.hpp"
#include "ctxsys/core/config.hpp"
#include "ctxsys/core/result.hpp"
#include "ctxsys/db/database.hpp"
#include "ctxsys/db/schema.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ctxsys::memory {

using namespace ctxsys::core;

struct AddMemoryOptions {
    std::optional<double> relevance_score;  // default 1.0
    Json metadata = Json::object();
};

struct SpillOptions {
    std::optional<std::vector<MemoryItemId>> item_ids;  // explicit selection
    int count = 4;                                      // otherwise the lowest-value hot items
};

struct SpillResult {
    int spilled_count = 0;
    std::vector<MemoryItemId> spilled_ids;
    std::vector<MemoryItemId> warm_ids;
    std::vector<MemoryItemId> cold_ids;
};

struct RecallOptions {
    int limit = 3;
    std::optional<bool> auto_promote;  // unset: config default
    std::vector<MemoryItemType> types; // empty: all types
    double min_relevance = 0.0;
};

struct RecallResult {
    std::vector<MemoryItem> items;  // best first, with access updates applied
    std::vector<MemoryItemId> promoted;
    std::unordered_map<MemoryItemId, double> relevance_scores;
};

struct TierStats {
    int items = 0;
    int64_t tokens = 0;
};

struct HotTierStats {
    int items = 0;
    int64_t tokens = 0;
    int limit = 0;
    double utilization_percent = 0.0;
};

enum class SuggestionType {
    Spill,
    Prune
};

struct MemorySuggestion {
    SuggestionType type;
    std::string reason;
};

struct MemoryStatus {
    SessionId session_id;
    HotTierStats hot;
    TierStats warm;
    TierStats cold;
    std::vector<MemorySuggestion> suggestions;
};

// Hot/warm/cold memory for one project.
//
// Hot is bounded by hot_token_limit. With auto spill, add_to_hot spills the
// lowest (relevance, created_at) hot items until the new item fits. Spilled
// items go to warm when accessed at least warm_access_threshold times, else
// to cold. Cold is capped by prune_cold at max_cold_items.
class MemoryTierManager {
public:
    MemoryTierManager(db::Database& db,
                      ProjectId project_id,
                      std::shared_ptr<EmbeddingProvider> embeddings = nullptr,
                      MemoryTierConfig config = {});

    Result<MemoryItem, Error> add_to_hot(const SessionId& session_id,
                                         const std::string& content,
                                         MemoryItemType type,
                                         const AddMemoryOptions& options = {});

    Result<SpillResult, Error> spill_to_warm(const SessionId& session_id,
                                             const SpillOptions& options = {});

    Result<RecallResult, Error> recall(const SessionId& session_id,
                                       const std::string& query,
                                       const RecallOptions& options = {});

    // false when the item is missing or already hot
    Result<bool, Error> promote_to_hot(const MemoryItemId& item_id);

    // false when the item is missing; InvalidTier when target is hot
    Result<bool, Error> demote(const MemoryItemId& item_id, MemoryTier target = MemoryTier::Warm);

    Result<MemoryStatus, Error> get_status(const SessionId& session_id) const;

    // Deletes the lowest scoring cold items beyond max_cold_items.
    // Score is relevance_score + access_count * 0.1.
    Result<int64_t, Error> prune_cold(const SessionId& session_id);

    Result<bool, Error> remove(const MemoryItemId& item_id);
    Result<int64_t, Error> clear_session(const SessionId& session_id);

    // Newest first
    Result<std::vector<MemoryItem>, Error> get_hot(const SessionId& session_id) const;
    Result<std::vector<MemoryItem>, Error> get_by_tier(const SessionId& session_id, MemoryTier tier) const;

    Result<std::optional<MemoryItem>, Error> get_item(const MemoryItemId& item_id) const;

    const MemoryTierConfig& config() const { return config_; }
    const ProjectId& project_id() const { return project_id_; }
    bool has_embeddings() const { return embeddings_ != nullptr; }

private:
    db::Database& db_;
    ProjectId project_id_;
    db::ProjectTables tables_;
    std::shared_ptr<EmbeddingProvider> embeddings_;
    const MemoryTierConfig config_;

    Result<TierStats, Error> hot_stats(const SessionId& session_id) const;
    Result<std::vector<MemoryItem>, Error> select_for_spill(const SessionId& session_id, int count) const;
    Result<std::vector<MemoryItem>, Error> items_by_ids(const SessionId& session_id,
                                                        const std::vector<MemoryItemId>& ids) const;
    Result<std::vector<MemoryItem>, Error> query_items(const std::string& sql,
                                                       const db::Params& params) const;
    Result<bool, Error> move_to_hot(const MemoryItem& item);

    std::vector<MemorySuggestion> suggestions(const HotTierStats& hot, const TierStats& cold) const;
};

// Embedding vectors are stored as raw float BLOBs
Json encode_embedding(const std::vector<float>& embedding);
std::vector<float> decode_embedding(const Json& blob);

MemoryItem row_to_item(const db::Row& row);

}  // namespace ctxsys::memory
