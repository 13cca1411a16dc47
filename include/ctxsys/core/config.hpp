#pragma once

#include "errors.hpp"
#include "result.hpp"
#include "types.hpp"

#include <filesystem>
#include <string>

namespace ctxsys::core {

namespace fs = std::filesystem;

// SQLite storage
struct StorageConfig {
    fs::path database_path = "~/.ctxsys/ctxsys.db";
    int busy_timeout_ms = 5000;
};

// Checkpoint retention
struct CheckpointConfig {
    int max_checkpoints = 10;     // per session
    bool auto_checkpoint = true;  // save after every completed step
    int retention_days = 0;       // 0 disables age-based pruning
};

// Hot/warm/cold memory tiering
struct MemoryTierConfig {
    int hot_token_limit = 4000;
    int warm_access_threshold = 3;
    double promote_threshold = 0.85;
    int max_cold_items = 1000;
    bool auto_spill_enabled = true;
    bool auto_promote_enabled = true;
};

// Embedding provider used for semantic recall
struct EmbeddingConfig {
    std::string provider = "none";  // none | ollama
    std::string base_url = "http://localhost:11434";
    std::string model = "nomic-embed-text";
    int timeout_ms = 30000;
};

struct ObservabilityConfig {
    std::string log_level = "info";  // trace, debug, info, warn, error, off
    fs::path log_path;               // empty: console only
};

struct Config {
    StorageConfig storage;
    CheckpointConfig checkpoints;
    MemoryTierConfig memory;
    EmbeddingConfig embeddings;
    ObservabilityConfig observability;

    // Load configuration from a YAML file
    static Result<Config, Error> load(const fs::path& path);

    // Defaults (plus environment overrides) when the file is missing or invalid
    static Config load_or_default(const fs::path& path);

    Result<void, Error> save(const fs::path& path) const;

    static fs::path default_path();

    void expand_paths();

    // CTXSYS_DB_PATH, CTXSYS_LOG_LEVEL, OLLAMA_HOST
    void apply_env_overrides();

    Result<void, Error> validate() const;
};

// Expand ~ and ${VAR} / $VAR references
std::string expand_path(const std::string& path);
fs::path expand_path(const fs::path& path);

}  // namespace ctxsys::core
