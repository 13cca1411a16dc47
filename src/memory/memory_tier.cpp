#include "ctxsys/memory/memory_tier.hpp"
#include "ctxsys/memory/similarity.hpp"
#include "ctxsys/memory/tokenizer.hpp"
#include "ctxsys/core/uuid.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>

namespace ctxsys::memory {

namespace {

std::string placeholders(size_t n) {
    std::string out;
    for (size_t i = 0; i < n; ++i) {
        out += i == 0 ? "?" : ",?";
    }
    return out;
}

}  // namespace

Json encode_embedding(const std::vector<float>& embedding) {
    std::vector<uint8_t> bytes(embedding.size() * sizeof(float));
    if (!bytes.empty()) {
        std::memcpy(bytes.data(), embedding.data(), bytes.size());
    }
    return Json::binary(std::move(bytes));
}

std::vector<float> decode_embedding(const Json& blob) {
    if (!blob.is_binary()) {
        return {};
    }
    const auto& bytes = blob.get_binary();
    std::vector<float> embedding(bytes.size() / sizeof(float));
    if (!embedding.empty()) {
        std::memcpy(embedding.data(), bytes.data(), embedding.size() * sizeof(float));
    }
    return embedding;
}

MemoryItem row_to_item(const db::Row& row) {
    MemoryItem item;
    item.id = row["id"].get<std::string>();
    item.session_id = row["session_id"].get<std::string>();
    item.content = row["content"].get<std::string>();
    item.type = memory_item_type_from_string(row["type"].get<std::string>());
    item.tier = memory_tier_from_string(row["tier"].get<std::string>()).value_or(MemoryTier::Cold);
    item.access_count = row["access_count"].get<int>();
    item.last_accessed_at = from_epoch_ms(row["last_accessed_at"].get<int64_t>());
    item.created_at = from_epoch_ms(row["created_at"].get<int64_t>());
    item.relevance_score = row["relevance_score"].get<double>();
    item.token_count = row["token_count"].get<int>();

    if (row["metadata"].is_string()) {
        auto parsed = Json::parse(row["metadata"].get<std::string>(), nullptr, false);
        if (parsed.is_object()) {
            item.metadata = std::move(parsed);
        }
    }

    if (row["embedding"].is_binary()) {
        item.embedding = decode_embedding(row["embedding"]);
    }

    return item;
}

MemoryTierManager::MemoryTierManager(db::Database& db,
                                     ProjectId project_id,
                                     std::shared_ptr<EmbeddingProvider> embeddings,
                                     MemoryTierConfig config)
    : db_(db)
    , project_id_(std::move(project_id))
    , tables_(db::ProjectTables::for_project(project_id_))
    , embeddings_(std::move(embeddings))
    , config_(config)
{
}

Result<std::vector<MemoryItem>, Error> MemoryTierManager::query_items(const std::string& sql,
                                                                      const db::Params& params) const {
    using R = Result<std::vector<MemoryItem>, Error>;

    auto rows = db_.fetch_many(sql, params);
    if (rows.is_err()) {
        return R::err(std::move(rows).error());
    }

    std::vector<MemoryItem> items;
    items.reserve(rows.value().size());
    for (const auto& row : rows.value()) {
        items.push_back(row_to_item(row));
    }
    return R::ok(std::move(items));
}

Result<TierStats, Error> MemoryTierManager::hot_stats(const SessionId& session_id) const {
    auto row = db_.fetch_one(
        "SELECT COUNT(*) AS items, COALESCE(SUM(token_count), 0) AS tokens "
        "FROM " + tables_.memory_items + " WHERE session_id = ? AND tier = 'hot'",
        {session_id}
    );
    if (row.is_err()) {
        return Result<TierStats, Error>::err(std::move(row).error());
    }

    TierStats stats;
    if (row.value()) {
        const auto& r = *row.value();
        stats.items = r["items"].get<int>();
        stats.tokens = r["tokens"].get<int64_t>();
    }
    return Result<TierStats, Error>::ok(stats);
}

Result<MemoryItem, Error> MemoryTierManager::add_to_hot(const SessionId& session_id,
                                                        const std::string& content,
                                                        MemoryItemType type,
                                                        const AddMemoryOptions& options) {
    using R = Result<MemoryItem, Error>;

    auto timestamp = now();

    MemoryItem item;
    item.id = generate_memory_item_id();
    item.session_id = session_id;
    item.content = content;
    item.type = type;
    item.tier = MemoryTier::Hot;
    item.access_count = 0;
    item.last_accessed_at = timestamp;
    item.created_at = timestamp;
    item.relevance_score = options.relevance_score.value_or(1.0);
    item.token_count = Tokenizer::estimate_tokens(content);
    item.metadata = options.metadata.is_object() ? options.metadata : Json::object();

    // Computed outside the transaction: providers may block on the network
    if (embeddings_) {
        auto embedded = embeddings_->embed(content);
        if (embedded.is_ok()) {
            item.embedding = std::move(embedded).value();
        } else {
            spdlog::warn("Embedding failed for new memory item, storing without: {}",
                         embedded.error().message);
        }
    }

    auto written = db_.with_transaction([&]() -> Result<void, Error> {
        if (config_.auto_spill_enabled) {
            while (true) {
                auto stats = hot_stats(session_id);
                if (stats.is_err()) {
                    return Result<void, Error>::err(std::move(stats).error());
                }
                if (stats.value().items == 0 ||
                    stats.value().tokens + item.token_count <= config_.hot_token_limit) {
                    break;
                }

                auto spilled = spill_to_warm(session_id);
                if (spilled.is_err()) {
                    return Result<void, Error>::err(std::move(spilled).error());
                }
                if (spilled.value().spilled_count == 0) {
                    break;
                }
            }
        }

        auto inserted = db_.execute(
            "INSERT INTO " + tables_.memory_items + " ("
            "id, session_id, content, type, tier, access_count, last_accessed_at, "
            "created_at, relevance_score, token_count, metadata, embedding"
            ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
            {
                item.id,
                item.session_id,
                item.content,
                std::string(memory_item_type_to_string(item.type)),
                std::string(memory_tier_to_string(item.tier)),
                item.access_count,
                to_epoch_ms(item.last_accessed_at),
                to_epoch_ms(item.created_at),
                item.relevance_score,
                item.token_count,
                item.metadata.dump(),
                item.embedding ? encode_embedding(*item.embedding) : Json(nullptr)
            }
        );
        if (inserted.is_err()) {
            return Result<void, Error>::err(std::move(inserted).error());
        }
        return Result<void, Error>::ok();
    });

    if (written.is_err()) {
        return R::err(std::move(written).error());
    }

    return R::ok(std::move(item));
}

Result<std::vector<MemoryItem>, Error> MemoryTierManager::select_for_spill(const SessionId& session_id,
                                                                           int count) const {
    return query_items(
        "SELECT * FROM " + tables_.memory_items + " "
        "WHERE session_id = ? AND tier = 'hot' "
        "ORDER BY relevance_score ASC, created_at ASC, rowid ASC "
        "LIMIT ?",
        {session_id, count}
    );
}

Result<std::vector<MemoryItem>, Error> MemoryTierManager::items_by_ids(
    const SessionId& session_id, const std::vector<MemoryItemId>& ids) const {
    if (ids.empty()) {
        return Result<std::vector<MemoryItem>, Error>::ok({});
    }

    db::Params params{session_id};
    for (const auto& id : ids) {
        params.push_back(id);
    }

    return query_items(
        "SELECT * FROM " + tables_.memory_items + " "
        "WHERE session_id = ? AND tier = 'hot' AND id IN (" + placeholders(ids.size()) + ") "
        "ORDER BY relevance_score ASC, created_at ASC, rowid ASC",
        params
    );
}

Result<SpillResult, Error> MemoryTierManager::spill_to_warm(const SessionId& session_id,
                                                            const SpillOptions& options) {
    using R = Result<SpillResult, Error>;

    return db_.with_transaction([&]() -> R {
        auto selected = options.item_ids
            ? items_by_ids(session_id, *options.item_ids)
            : select_for_spill(session_id, options.count);
        if (selected.is_err()) {
            return R::err(std::move(selected).error());
        }

        SpillResult result;
        for (const auto& item : selected.value()) {
            MemoryTier target = item.access_count >= config_.warm_access_threshold
                ? MemoryTier::Warm
                : MemoryTier::Cold;

            auto updated = db_.execute(
                "UPDATE " + tables_.memory_items + " SET tier = ? WHERE id = ?",
                {std::string(memory_tier_to_string(target)), item.id}
            );
            if (updated.is_err()) {
                return R::err(std::move(updated).error());
            }

            result.spilled_ids.push_back(item.id);
            (target == MemoryTier::Warm ? result.warm_ids : result.cold_ids).push_back(item.id);
        }
        result.spilled_count = static_cast<int>(result.spilled_ids.size());

        if (result.spilled_count > 0) {
            spdlog::debug("Spilled {} hot items for session {} ({} warm, {} cold)",
                          result.spilled_count, session_id,
                          result.warm_ids.size(), result.cold_ids.size());
        }

        return R::ok(std::move(result));
    });
}

Result<RecallResult, Error> MemoryTierManager::recall(const SessionId& session_id,
                                                      const std::string& query,
                                                      const RecallOptions& options) {
    using R = Result<RecallResult, Error>;

    std::string sql =
        "SELECT * FROM " + tables_.memory_items + " "
        "WHERE session_id = ? AND tier IN ('warm', 'cold')";
    db::Params params{session_id};

    if (!options.types.empty()) {
        sql += " AND type IN (" + placeholders(options.types.size()) + ")";
        for (auto type : options.types) {
            params.push_back(std::string(memory_item_type_to_string(type)));
        }
    }
    sql += " ORDER BY created_at DESC, rowid DESC";

    auto candidates = query_items(sql, params);
    if (candidates.is_err()) {
        return R::err(std::move(candidates).error());
    }

    std::optional<std::vector<float>> query_embedding;
    if (embeddings_ && !candidates.value().empty()) {
        auto embedded = embeddings_->embed_query(query);
        if (embedded.is_ok()) {
            query_embedding = std::move(embedded).value();
        } else {
            spdlog::warn("Query embedding failed, falling back to keyword relevance: {}",
                         embedded.error().message);
        }
    }

    RecallResult result;
    std::vector<std::pair<MemoryItem, double>> scored;
    for (auto& item : candidates.value()) {
        double score = (query_embedding && item.embedding)
            ? cosine_similarity(*query_embedding, *item.embedding)
            : keyword_relevance(query, item.content);
        result.relevance_scores[item.id] = score;
        if (score >= options.min_relevance) {
            scored.emplace_back(std::move(item), score);
        }
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (options.limit >= 0 && scored.size() > static_cast<size_t>(options.limit)) {
        scored.resize(static_cast<size_t>(options.limit));
    }

    bool auto_promote = options.auto_promote.value_or(config_.auto_promote_enabled);
    auto accessed_at = to_epoch_ms(now());

    auto updated = db_.with_transaction([&]() -> Result<void, Error> {
        for (const auto& [item, score] : scored) {
            auto touched = db_.execute(
                "UPDATE " + tables_.memory_items + " "
                "SET access_count = access_count + 1, "
                "    last_accessed_at = ?, "
                "    relevance_score = (relevance_score + ?) / 2 "
                "WHERE id = ?",
                {accessed_at, score, item.id}
            );
            if (touched.is_err()) {
                return Result<void, Error>::err(std::move(touched).error());
            }

            if (auto_promote && score >= config_.promote_threshold) {
                auto promoted = promote_to_hot(item.id);
                if (promoted.is_err()) {
                    return Result<void, Error>::err(std::move(promoted).error());
                }
                if (promoted.value()) {
                    result.promoted.push_back(item.id);
                }
            }
        }
        return Result<void, Error>::ok();
    });
    if (updated.is_err()) {
        return R::err(std::move(updated).error());
    }

    for (const auto& [item, score] : scored) {
        auto refreshed = get_item(item.id);
        if (refreshed.is_err()) {
            return R::err(std::move(refreshed).error());
        }
        if (refreshed.value()) {
            result.items.push_back(std::move(*refreshed.value()));
        }
    }

    if (!result.promoted.empty()) {
        spdlog::debug("Recall promoted {} items for session {}", result.promoted.size(), session_id);
    }

    return R::ok(std::move(result));
}

Result<bool, Error> MemoryTierManager::move_to_hot(const MemoryItem& item) {
    if (config_.auto_spill_enabled) {
        auto stats = hot_stats(item.session_id);
        if (stats.is_err()) {
            return Result<bool, Error>::err(std::move(stats).error());
        }
        if (stats.value().tokens + item.token_count > config_.hot_token_limit) {
            SpillOptions spill;
            spill.count = 2;
            auto spilled = spill_to_warm(item.session_id, spill);
            if (spilled.is_err()) {
                return Result<bool, Error>::err(std::move(spilled).error());
            }
        }
    }

    auto updated = db_.execute(
        "UPDATE " + tables_.memory_items + " SET tier = 'hot', relevance_score = 1.0 WHERE id = ?",
        {item.id}
    );
    if (updated.is_err()) {
        return Result<bool, Error>::err(std::move(updated).error());
    }
    return Result<bool, Error>::ok(true);
}

Result<bool, Error> MemoryTierManager::promote_to_hot(const MemoryItemId& item_id) {
    return db_.with_transaction([&]() -> Result<bool, Error> {
        auto found = get_item(item_id);
        if (found.is_err()) {
            return Result<bool, Error>::err(std::move(found).error());
        }
        if (!found.value() || found.value()->tier == MemoryTier::Hot) {
            return Result<bool, Error>::ok(false);
        }

        auto moved = move_to_hot(*found.value());
        if (moved.is_ok()) {
            spdlog::debug("Promoted memory item {} to hot", item_id);
        }
        return moved;
    });
}

Result<bool, Error> MemoryTierManager::demote(const MemoryItemId& item_id, MemoryTier target) {
    if (target == MemoryTier::Hot) {
        return Result<bool, Error>::err(
            ErrorCode::InvalidTier,
            "Demotion target must be warm or cold",
            item_id
        );
    }

    auto updated = db_.execute(
        "UPDATE " + tables_.memory_items + " SET tier = ? WHERE id = ?",
        {std::string(memory_tier_to_string(target)), item_id}
    );
    if (updated.is_err()) {
        return Result<bool, Error>::err(std::move(updated).error());
    }
    return Result<bool, Error>::ok(updated.value() > 0);
}

std::vector<MemorySuggestion> MemoryTierManager::suggestions(const HotTierStats& hot,
                                                             const TierStats& cold) const {
    std::vector<MemorySuggestion> out;

    if (static_cast<double>(hot.tokens) > config_.hot_token_limit * 0.9) {
        out.push_back({SuggestionType::Spill, "Hot memory near capacity (>90%)"});
    }

    if (cold.items > config_.max_cold_items) {
        out.push_back({SuggestionType::Prune,
                       "Cold storage exceeds " + std::to_string(config_.max_cold_items) + " items"});
    }

    return out;
}

Result<MemoryStatus, Error> MemoryTierManager::get_status(const SessionId& session_id) const {
    using R = Result<MemoryStatus, Error>;

    auto rows = db_.fetch_many(
        "SELECT tier, COUNT(*) AS items, COALESCE(SUM(token_count), 0) AS tokens "
        "FROM " + tables_.memory_items + " WHERE session_id = ? GROUP BY tier",
        {session_id}
    );
    if (rows.is_err()) {
        return R::err(std::move(rows).error());
    }

    MemoryStatus status;
    status.session_id = session_id;
    status.hot.limit = config_.hot_token_limit;

    for (const auto& row : rows.value()) {
        auto tier = memory_tier_from_string(row["tier"].get<std::string>());
        int items = row["items"].get<int>();
        int64_t tokens = row["tokens"].get<int64_t>();
        if (!tier) {
            continue;
        }
        switch (*tier) {
            case MemoryTier::Hot:
                status.hot.items = items;
                status.hot.tokens = tokens;
                break;
            case MemoryTier::Warm:
                status.warm = TierStats{items, tokens};
                break;
            case MemoryTier::Cold:
                status.cold = TierStats{items, tokens};
                break;
        }
    }

    status.hot.utilization_percent = config_.hot_token_limit > 0
        ? static_cast<double>(status.hot.tokens) / config_.hot_token_limit * 100.0
        : 0.0;
    status.suggestions = suggestions(status.hot, status.cold);

    return R::ok(std::move(status));
}

Result<int64_t, Error> MemoryTierManager::prune_cold(const SessionId& session_id) {
    using R = Result<int64_t, Error>;

    auto pruned = db_.with_transaction([&]() -> R {
        auto cold = get_by_tier(session_id, MemoryTier::Cold);
        if (cold.is_err()) {
            return R::err(std::move(cold).error());
        }

        auto& items = cold.value();
        if (static_cast<int>(items.size()) <= config_.max_cold_items) {
            return R::ok(0);
        }

        auto score = [](const MemoryItem& item) {
            return item.relevance_score + item.access_count * 0.1;
        };
        std::stable_sort(items.begin(), items.end(), [&](const MemoryItem& a, const MemoryItem& b) {
            return score(a) < score(b);
        });

        size_t excess = items.size() - static_cast<size_t>(config_.max_cold_items);
        db::Params ids;
        for (size_t i = 0; i < excess; ++i) {
            ids.push_back(items[i].id);
        }

        return db_.execute(
            "DELETE FROM " + tables_.memory_items + " WHERE id IN (" + placeholders(ids.size()) + ")",
            ids
        );
    });

    if (pruned.is_ok() && pruned.value() > 0) {
        spdlog::info("Pruned {} cold memory items for session {}", pruned.value(), session_id);
    }
    return pruned;
}

Result<bool, Error> MemoryTierManager::remove(const MemoryItemId& item_id) {
    auto deleted = db_.execute("DELETE FROM " + tables_.memory_items + " WHERE id = ?", {item_id});
    if (deleted.is_err()) {
        return Result<bool, Error>::err(std::move(deleted).error());
    }
    return Result<bool, Error>::ok(deleted.value() > 0);
}

Result<int64_t, Error> MemoryTierManager::clear_session(const SessionId& session_id) {
    return db_.execute(
        "DELETE FROM " + tables_.memory_items + " WHERE session_id = ?",
        {session_id}
    );
}

Result<std::vector<MemoryItem>, Error> MemoryTierManager::get_hot(const SessionId& session_id) const {
    return get_by_tier(session_id, MemoryTier::Hot);
}

Result<std::vector<MemoryItem>, Error> MemoryTierManager::get_by_tier(const SessionId& session_id,
                                                                      MemoryTier tier) const {
    return query_items(
        "SELECT * FROM " + tables_.memory_items + " "
        "WHERE session_id = ? AND tier = ? "
        "ORDER BY created_at DESC, rowid DESC",
        {session_id, std::string(memory_tier_to_string(tier))}
    );
}

Result<std::optional<MemoryItem>, Error> MemoryTierManager::get_item(const MemoryItemId& item_id) const {
    using R = Result<std::optional<MemoryItem>, Error>;

    auto row = db_.fetch_one("SELECT * FROM " + tables_.memory_items + " WHERE id = ?", {item_id});
    if (row.is_err()) {
        return R::err(std::move(row).error());
    }
    if (!row.value()) {
        return R::ok(std::nullopt);
    }
    return R::ok(row_to_item(*row.value()));
}

}  // namespace ctxsys::memory
