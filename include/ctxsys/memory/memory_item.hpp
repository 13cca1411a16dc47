#pragma once

#include "ctxsys/core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ctxsys::memory {

using namespace ctxsys::core;

enum class MemoryTier {
    Hot,    // in the working set, counted against the token budget
    Warm,   // spilled but frequently accessed
    Cold    // spilled, bounded by item count
};

inline std::string_view memory_tier_to_string(MemoryTier tier) {
    switch (tier) {
        case MemoryTier::Hot: return "hot";
        case MemoryTier::Warm: return "warm";
        case MemoryTier::Cold: return "cold";
    }
    return "cold";
}

inline std::optional<MemoryTier> memory_tier_from_string(std::string_view str) {
    if (str == "hot") return MemoryTier::Hot;
    if (str == "warm") return MemoryTier::Warm;
    if (str == "cold") return MemoryTier::Cold;
    return std::nullopt;
}

enum class MemoryItemType {
    Message,
    Fact,
    Decision,
    Entity,
    Context
};

inline std::string_view memory_item_type_to_string(MemoryItemType type) {
    switch (type) {
        case MemoryItemType::Message: return "message";
        case MemoryItemType::Fact: return "fact";
        case MemoryItemType::Decision: return "decision";
        case MemoryItemType::Entity: return "entity";
        case MemoryItemType::Context: return "context";
    }
    return "context";
}

inline MemoryItemType memory_item_type_from_string(std::string_view str) {
    if (str == "message") return MemoryItemType::Message;
    if (str == "fact") return MemoryItemType::Fact;
    if (str == "decision") return MemoryItemType::Decision;
    if (str == "entity") return MemoryItemType::Entity;
    return MemoryItemType::Context;
}

struct MemoryItem {
    MemoryItemId id;
    SessionId session_id;
    std::string content;
    MemoryItemType type = MemoryItemType::Context;
    MemoryTier tier = MemoryTier::Hot;
    int access_count = 0;
    TimePoint last_accessed_at;
    TimePoint created_at;
    double relevance_score = 1.0;  // 0..1
    int token_count = 0;
    Json metadata = Json::object();
    std::optional<std::vector<float>> embedding;

    Json to_json() const;
};

inline Json MemoryItem::to_json() const {
    return Json{
        {"id", id},
        {"session_id", session_id},
        {"content", content},
        {"type", std::string(memory_item_type_to_string(type))},
        {"tier", std::string(memory_tier_to_string(tier))},
        {"access_count", access_count},
        {"last_accessed_at", to_epoch_ms(last_accessed_at)},
        {"created_at", to_epoch_ms(created_at)},
        {"relevance_score", relevance_score},
        {"token_count", token_count},
        {"metadata", metadata},
        {"has_embedding", embedding.has_value()}
    };
}

}  // namespace ctxsys::memory
