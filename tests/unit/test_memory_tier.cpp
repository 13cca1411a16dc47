#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "ctxsys/memory/memory_tier.hpp"

#include <algorithm>

using namespace ctxsys::memory;
using namespace ctxsys::db;

namespace {

struct Fixture {
    std::unique_ptr<Database> db;

    Fixture() {
        auto opened = Database::open(":memory:");
        REQUIRE(opened.is_ok());
        db = std::move(opened).value();
        REQUIRE(create_project(*db, "proj").is_ok());
    }

    MemoryTierManager manager(MemoryTierConfig config = {},
                              std::shared_ptr<EmbeddingProvider> embeddings = nullptr) {
        return MemoryTierManager(*db, "proj", std::move(embeddings), config);
    }
};

// 50 characters, 13 estimated tokens
std::string fifty_chars(int n) {
    std::string s = "item " + std::to_string(n) + " ";
    s.resize(50, '.');
    return s;
}

MemoryTierConfig small_budget() {
    MemoryTierConfig config;
    config.hot_token_limit = 100;
    return config;
}

MemoryItem add(MemoryTierManager& manager, const std::string& session, const std::string& content,
               std::optional<double> relevance = std::nullopt) {
    AddMemoryOptions options;
    options.relevance_score = relevance;
    auto added = manager.add_to_hot(session, content, MemoryItemType::Fact, options);
    REQUIRE(added.is_ok());
    return added.value();
}

std::vector<MemoryItemId> ids_of(const std::vector<MemoryItem>& items) {
    std::vector<MemoryItemId> ids;
    for (const auto& item : items) {
        ids.push_back(item.id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<MemoryItemId> sorted(std::vector<MemoryItemId> ids) {
    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace

TEST_CASE("Added items start hot", "[memory]") {
    Fixture f;
    auto manager = f.manager();

    AddMemoryOptions options;
    options.metadata = {{"source", "chat"}};
    auto added = manager.add_to_hot("sess", "Use SQLite for storage", MemoryItemType::Decision, options);
    REQUIRE(added.is_ok());

    const auto& item = added.value();
    REQUIRE(item.id.rfind("mem_", 0) == 0);
    REQUIRE(item.tier == MemoryTier::Hot);
    REQUIRE(item.access_count == 0);
    REQUIRE(item.relevance_score == 1.0);
    REQUIRE(item.token_count == 6);

    auto stored = manager.get_item(item.id);
    REQUIRE(stored.is_ok());
    REQUIRE(stored.value().has_value());
    REQUIRE(stored.value()->type == MemoryItemType::Decision);
    REQUIRE(stored.value()->metadata["source"] == "chat");
    REQUIRE(stored.value()->created_at == item.created_at);
    REQUIRE_FALSE(stored.value()->embedding.has_value());
}

TEST_CASE("Hot tier stays within the token budget", "[memory]") {
    Fixture f;
    auto manager = f.manager(small_budget());

    std::vector<MemoryItem> added;
    for (int i = 0; i < 7; ++i) {
        added.push_back(add(manager, "sess", fifty_chars(i)));
    }

    auto status = manager.get_status("sess");
    REQUIRE(status.value().hot.items == 7);
    REQUIRE(status.value().hot.tokens == 91);

    added.push_back(add(manager, "sess", fifty_chars(7)));

    status = manager.get_status("sess");
    REQUIRE(status.value().hot.tokens <= 100);
    REQUIRE(status.value().hot.items == 4);
    REQUIRE(status.value().cold.items == 4);

    // Equal relevance: the oldest four were spilled
    auto cold = manager.get_by_tier("sess", MemoryTier::Cold);
    REQUIRE(ids_of(cold.value()) ==
            sorted({added[0].id, added[1].id, added[2].id, added[3].id}));

    auto hot = manager.get_hot("sess");
    REQUIRE(hot.value().front().id == added[7].id);
}

TEST_CASE("Spill takes the lowest relevance first", "[memory]") {
    Fixture f;
    auto manager = f.manager();

    auto high = add(manager, "sess", "high value note", 0.9);
    auto low = add(manager, "sess", "low value note", 0.2);
    auto mid = add(manager, "sess", "mid value note", 0.5);

    SpillOptions options;
    options.count = 1;
    auto spilled = manager.spill_to_warm("sess", options);
    REQUIRE(spilled.is_ok());
    REQUIRE(spilled.value().spilled_ids == std::vector<MemoryItemId>{low.id});

    options.count = 1;
    spilled = manager.spill_to_warm("sess", options);
    REQUIRE(spilled.value().spilled_ids == std::vector<MemoryItemId>{mid.id});
    REQUIRE(manager.get_item(high.id).value()->tier == MemoryTier::Hot);
}

TEST_CASE("Explicit spill only touches the session's hot items", "[memory]") {
    Fixture f;
    auto manager = f.manager();

    auto mine = add(manager, "sess", "mine");
    auto theirs = add(manager, "other", "theirs");

    SpillOptions options;
    options.item_ids = std::vector<MemoryItemId>{mine.id, theirs.id, "mem_missing"};
    auto spilled = manager.spill_to_warm("sess", options);

    REQUIRE(spilled.is_ok());
    REQUIRE(spilled.value().spilled_count == 1);
    REQUIRE(spilled.value().cold_ids == std::vector<MemoryItemId>{mine.id});
    REQUIRE(manager.get_item(theirs.id).value()->tier == MemoryTier::Hot);

    // Already spilled: nothing left to move
    options.item_ids = std::vector<MemoryItemId>{mine.id};
    REQUIRE(manager.spill_to_warm("sess", options).value().spilled_count == 0);
}

TEST_CASE("Frequently accessed items spill to warm", "[memory]") {
    Fixture f;
    auto manager = f.manager();

    auto item = add(manager, "sess", "the deployment pipeline uses blue green releases");

    SpillOptions spill;
    spill.item_ids = std::vector<MemoryItemId>{item.id};
    auto first = manager.spill_to_warm("sess", spill);
    REQUIRE(first.value().cold_ids == std::vector<MemoryItemId>{item.id});

    RecallOptions recall;
    recall.auto_promote = false;
    for (int i = 0; i < 3; ++i) {
        REQUIRE(manager.recall("sess", "deployment pipeline", recall).is_ok());
    }
    REQUIRE(manager.get_item(item.id).value()->access_count == 3);

    REQUIRE(manager.promote_to_hot(item.id).value());

    auto second = manager.spill_to_warm("sess", spill);
    REQUIRE(second.value().warm_ids == std::vector<MemoryItemId>{item.id});
    REQUIRE(second.value().cold_ids.empty());
}

TEST_CASE("Keyword recall ranks and updates items", "[memory]") {
    Fixture f;
    auto manager = f.manager();

    auto schema = add(manager, "sess", "database migration for the user schema");
    auto css = add(manager, "sess", "frontend css styles for buttons");
    auto rollback = add(manager, "sess", "migration rollback plan");

    SpillOptions spill;
    spill.count = 10;
    REQUIRE(manager.spill_to_warm("sess", spill).value().spilled_count == 3);

    RecallOptions options;
    options.limit = 2;
    options.auto_promote = false;
    auto recalled = manager.recall("sess", "migration schema", options);
    REQUIRE(recalled.is_ok());

    const auto& result = recalled.value();
    REQUIRE(result.items.size() == 2);
    REQUIRE(result.items[0].id == schema.id);
    REQUIRE(result.items[1].id == rollback.id);
    REQUIRE(result.promoted.empty());

    REQUIRE(result.relevance_scores.at(schema.id) == Catch::Approx(1.0));
    REQUIRE(result.relevance_scores.at(rollback.id) == Catch::Approx(0.5));
    REQUIRE(result.relevance_scores.at(css.id) == Catch::Approx(0.0));

    REQUIRE(result.items[0].access_count == 1);
    REQUIRE(result.items[1].relevance_score == Catch::Approx(0.75));
    REQUIRE(manager.get_item(css.id).value()->access_count == 0);
}

TEST_CASE("Recall filters by type and minimum relevance", "[memory]") {
    Fixture f;
    auto manager = f.manager();

    auto fact = manager.add_to_hot("sess", "cache invalidation rule", MemoryItemType::Fact);
    auto message = manager.add_to_hot("sess", "cache is slow today", MemoryItemType::Message);
    REQUIRE(fact.is_ok());
    REQUIRE(message.is_ok());
    SpillOptions spill;
    spill.count = 10;
    REQUIRE(manager.spill_to_warm("sess", spill).is_ok());

    RecallOptions options;
    options.auto_promote = false;
    options.types = {MemoryItemType::Message};
    auto recalled = manager.recall("sess", "cache", options);
    REQUIRE(recalled.value().items.size() == 1);
    REQUIRE(recalled.value().items[0].id == message.value().id);

    options.types.clear();
    options.min_relevance = 0.9;
    recalled = manager.recall("sess", "cache invalidation", options);
    REQUIRE(recalled.value().items.size() == 1);
    REQUIRE(recalled.value().items[0].id == fact.value().id);
}

TEST_CASE("Recall promotes strong matches", "[memory]") {
    Fixture f;
    auto manager = f.manager();

    auto strong = add(manager, "sess", "kubernetes ingress configuration");
    auto weak = add(manager, "sess", "kubernetes pod resources");
    SpillOptions spill;
    spill.count = 10;
    REQUIRE(manager.spill_to_warm("sess", spill).is_ok());

    auto recalled = manager.recall("sess", "kubernetes ingress");
    REQUIRE(recalled.is_ok());
    REQUIRE(recalled.value().promoted == std::vector<MemoryItemId>{strong.id});
    REQUIRE(recalled.value().items[0].tier == MemoryTier::Hot);
    REQUIRE(recalled.value().items[0].relevance_score == 1.0);
    REQUIRE(manager.get_item(weak.id).value()->tier == MemoryTier::Cold);
}

TEST_CASE("Hot items are not recalled", "[memory]") {
    Fixture f;
    auto manager = f.manager();

    add(manager, "sess", "still in the working set");
    auto recalled = manager.recall("sess", "working set");
    REQUIRE(recalled.is_ok());
    REQUIRE(recalled.value().items.empty());
}

TEST_CASE("Recall uses embeddings when available", "[memory]") {
    Fixture f;
    auto embeddings = std::make_shared<FunctionEmbeddingProvider>(
        [](const std::string& text) -> Result<std::vector<float>, Error> {
            bool animal = text.find("cat") != std::string::npos || text.find("kitten") != std::string::npos;
            return Result<std::vector<float>, Error>::ok(
                animal ? std::vector<float>{1.0f, 0.0f} : std::vector<float>{0.0f, 1.0f});
        });
    auto manager = f.manager({}, embeddings);
    REQUIRE(manager.has_embeddings());

    auto pet = add(manager, "sess", "the cat sleeps on the sofa");
    auto car = add(manager, "sess", "the car needs new tyres");
    REQUIRE(manager.get_item(pet.id).value()->embedding == std::vector<float>{1.0f, 0.0f});

    SpillOptions spill;
    spill.count = 10;
    REQUIRE(manager.spill_to_warm("sess", spill).is_ok());

    RecallOptions options;
    options.auto_promote = false;
    // No keyword overlap with either item
    auto recalled = manager.recall("sess", "kitten", options);
    REQUIRE(recalled.is_ok());
    REQUIRE(recalled.value().items[0].id == pet.id);
    REQUIRE(recalled.value().relevance_scores.at(pet.id) == Catch::Approx(1.0));
    REQUIRE(recalled.value().relevance_scores.at(car.id) == Catch::Approx(0.0));
}

TEST_CASE("Embedding failures do not block storage", "[memory]") {
    Fixture f;
    auto embeddings = std::make_shared<FunctionEmbeddingProvider>(
        [](const std::string&) -> Result<std::vector<float>, Error> {
            return Result<std::vector<float>, Error>::err(ErrorCode::EmbeddingUnavailable, "offline");
        });
    auto manager = f.manager({}, embeddings);

    auto item = add(manager, "sess", "retry policy uses exponential backoff");
    REQUIRE_FALSE(item.embedding.has_value());

    SpillOptions spill;
    spill.count = 10;
    REQUIRE(manager.spill_to_warm("sess", spill).is_ok());

    RecallOptions options;
    options.auto_promote = false;
    auto recalled = manager.recall("sess", "exponential backoff", options);
    REQUIRE(recalled.is_ok());
    REQUIRE(recalled.value().relevance_scores.at(item.id) == Catch::Approx(1.0));
}

TEST_CASE("Promotion is idempotent", "[memory]") {
    Fixture f;
    auto manager = f.manager();

    auto item = add(manager, "sess", "promote me", 0.3);
    REQUIRE_FALSE(manager.promote_to_hot(item.id).value());

    REQUIRE(manager.demote(item.id, MemoryTier::Cold).value());
    REQUIRE(manager.promote_to_hot(item.id).value());
    REQUIRE_FALSE(manager.promote_to_hot(item.id).value());

    auto stored = manager.get_item(item.id).value();
    REQUIRE(stored->tier == MemoryTier::Hot);
    REQUIRE(stored->relevance_score == 1.0);

    REQUIRE_FALSE(manager.promote_to_hot("mem_missing").value());
}

TEST_CASE("Promotion makes room in a full hot tier", "[memory]") {
    Fixture f;
    auto manager = f.manager(small_budget());

    std::vector<MemoryItem> added;
    for (int i = 0; i < 7; ++i) {
        added.push_back(add(manager, "sess", fifty_chars(i)));
    }
    REQUIRE(manager.demote(added[0].id, MemoryTier::Warm).value());

    auto extra = add(manager, "sess", fifty_chars(99));
    REQUIRE(manager.get_status("sess").value().hot.tokens == 91);

    REQUIRE(manager.promote_to_hot(added[0].id).value());

    auto status = manager.get_status("sess").value();
    REQUIRE(status.hot.tokens <= 100);
    REQUIRE(manager.get_item(added[0].id).value()->tier == MemoryTier::Hot);
    REQUIRE(manager.get_item(extra.id).value()->tier == MemoryTier::Hot);
}

TEST_CASE("Demotion", "[memory]") {
    Fixture f;
    auto manager = f.manager();

    auto item = add(manager, "sess", "demote me");

    REQUIRE(manager.demote(item.id).value());
    REQUIRE(manager.get_item(item.id).value()->tier == MemoryTier::Warm);

    REQUIRE(manager.demote(item.id, MemoryTier::Cold).value());
    REQUIRE(manager.get_item(item.id).value()->tier == MemoryTier::Cold);

    auto invalid = manager.demote(item.id, MemoryTier::Hot);
    REQUIRE(invalid.is_err());
    REQUIRE(invalid.error().code == ErrorCode::InvalidTier);

    REQUIRE_FALSE(manager.demote("mem_missing").value());
}

TEST_CASE("Status reports usage and suggestions", "[memory]") {
    Fixture f;
    auto config = small_budget();
    config.auto_spill_enabled = false;
    config.max_cold_items = 2;
    auto manager = f.manager(config);

    auto empty = manager.get_status("sess");
    REQUIRE(empty.is_ok());
    REQUIRE(empty.value().hot.items == 0);
    REQUIRE(empty.value().hot.limit == 100);
    REQUIRE(empty.value().suggestions.empty());

    for (int i = 0; i < 7; ++i) {
        add(manager, "sess", fifty_chars(i));
    }
    auto status = manager.get_status("sess").value();
    REQUIRE(status.hot.utilization_percent == Catch::Approx(91.0));
    REQUIRE(status.suggestions.size() == 1);
    REQUIRE(status.suggestions[0].type == SuggestionType::Spill);

    SpillOptions spill;
    spill.count = 3;
    REQUIRE(manager.spill_to_warm("sess", spill).is_ok());

    status = manager.get_status("sess").value();
    REQUIRE(status.cold.items == 3);
    REQUIRE(status.cold.tokens == 39);
    REQUIRE(status.suggestions.size() == 1);
    REQUIRE(status.suggestions[0].type == SuggestionType::Prune);
    REQUIRE(status.suggestions[0].reason == "Cold storage exceeds 2 items");
}

TEST_CASE("Without auto spill the hot tier may exceed its budget", "[memory]") {
    Fixture f;
    auto config = small_budget();
    config.auto_spill_enabled = false;
    auto manager = f.manager(config);

    for (int i = 0; i < 9; ++i) {
        add(manager, "sess", fifty_chars(i));
    }
    REQUIRE(manager.get_status("sess").value().hot.tokens == 117);
}

TEST_CASE("Prune cold keeps the highest scoring items", "[memory]") {
    Fixture f;
    MemoryTierConfig config;
    config.max_cold_items = 2;
    auto manager = f.manager(config);

    auto a = add(manager, "sess", "a note", 0.1);
    auto b = add(manager, "sess", "b note", 0.9);
    auto c = add(manager, "sess", "c note", 0.5);
    auto d = add(manager, "sess", "d note", 0.3);

    SpillOptions spill;
    spill.count = 10;
    REQUIRE(manager.spill_to_warm("sess", spill).value().spilled_count == 4);

    auto pruned = manager.prune_cold("sess");
    REQUIRE(pruned.is_ok());
    REQUIRE(pruned.value() == 2);

    auto cold = manager.get_by_tier("sess", MemoryTier::Cold);
    REQUIRE(ids_of(cold.value()) == sorted({b.id, c.id}));
    REQUIRE_FALSE(manager.get_item(a.id).value().has_value());
    REQUIRE_FALSE(manager.get_item(d.id).value().has_value());

    REQUIRE(manager.prune_cold("sess").value() == 0);
}

TEST_CASE("Remove and clear memory", "[memory]") {
    Fixture f;
    auto manager = f.manager();

    auto first = add(manager, "sess", "first");
    add(manager, "sess", "second");
    auto other = add(manager, "other", "elsewhere");

    REQUIRE(manager.remove(first.id).value());
    REQUIRE_FALSE(manager.remove(first.id).value());

    REQUIRE(manager.clear_session("sess").value() == 1);
    REQUIRE(manager.get_hot("sess").value().empty());
    REQUIRE(manager.get_item(other.id).value().has_value());
}
