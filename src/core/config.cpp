#include "ctxsys/core/config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <regex>

namespace ctxsys::core {

namespace {

const char* kLogLevels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};

bool is_known_log_level(const std::string& level) {
    for (const char* known : kLogLevels) {
        if (level == known) return true;
    }
    return false;
}

}  // namespace

std::string expand_path(const std::string& path) {
    std::string result = path;

    if (!result.empty() && result[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            result = std::string(home) + result.substr(1);
        }
    }

    std::regex env_regex(R"(\$\{([^}]+)\})");
    std::smatch match;
    while (std::regex_search(result, match, env_regex)) {
        const char* var_value = std::getenv(match[1].str().c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    std::regex env_regex2(R"(\$([A-Za-z_][A-Za-z0-9_]*))");
    while (std::regex_search(result, match, env_regex2)) {
        const char* var_value = std::getenv(match[1].str().c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    return result;
}

fs::path expand_path(const fs::path& path) {
    return fs::path(expand_path(path.string()));
}

fs::path Config::default_path() {
    return expand_path(fs::path("~/.ctxsys/config.yaml"));
}

void Config::expand_paths() {
    // ":memory:" and "" are SQLite special names, leave them alone
    std::string db = storage.database_path.string();
    if (!db.empty() && db != ":memory:") {
        storage.database_path = expand_path(storage.database_path);
    }
    if (!observability.log_path.empty()) {
        observability.log_path = expand_path(observability.log_path);
    }
}

void Config::apply_env_overrides() {
    if (const char* path = std::getenv("CTXSYS_DB_PATH")) {
        storage.database_path = path;
    }
    if (const char* level = std::getenv("CTXSYS_LOG_LEVEL")) {
        observability.log_level = level;
    }
    if (const char* host = std::getenv("OLLAMA_HOST")) {
        std::string url = host;
        if (url.find("://") == std::string::npos) {
            url = "http://" + url;
        }
        embeddings.base_url = url;
    }
}

Result<void, Error> Config::validate() const {
    if (storage.database_path.empty()) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "storage.database_path must not be empty"
        );
    }

    if (storage.busy_timeout_ms < 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "storage.busy_timeout_ms must not be negative"
        );
    }

    if (checkpoints.max_checkpoints < 1) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "checkpoints.max_checkpoints must be at least 1"
        );
    }

    if (checkpoints.retention_days < 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "checkpoints.retention_days must not be negative"
        );
    }

    if (memory.hot_token_limit <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "memory.hot_token_limit must be positive"
        );
    }

    if (memory.promote_threshold < 0.0 || memory.promote_threshold > 1.0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "memory.promote_threshold must be within [0, 1]"
        );
    }

    if (memory.max_cold_items < 0 || memory.warm_access_threshold < 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "memory.max_cold_items and memory.warm_access_threshold must not be negative"
        );
    }

    if (embeddings.provider != "none" && embeddings.provider != "ollama") {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "embeddings.provider must be 'none' or 'ollama'",
            embeddings.provider
        );
    }

    if (!is_known_log_level(observability.log_level)) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "Unknown observability.log_level",
            observability.log_level
        );
    }

    return Result<void, Error>::ok();
}

Result<Config, Error> Config::load(const fs::path& path) {
    fs::path expanded = expand_path(path);

    if (!fs::exists(expanded)) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigNotFound,
            "Configuration file not found",
            expanded.string()
        );
    }

    try {
        YAML::Node root = YAML::LoadFile(expanded.string());
        Config config;

        if (auto node = root["storage"]) {
            config.storage.database_path = node["database_path"].as<std::string>(config.storage.database_path.string());
            config.storage.busy_timeout_ms = node["busy_timeout_ms"].as<int>(config.storage.busy_timeout_ms);
        }

        if (auto node = root["checkpoints"]) {
            config.checkpoints.max_checkpoints = node["max_checkpoints"].as<int>(config.checkpoints.max_checkpoints);
            config.checkpoints.auto_checkpoint = node["auto_checkpoint"].as<bool>(config.checkpoints.auto_checkpoint);
            config.checkpoints.retention_days = node["retention_days"].as<int>(config.checkpoints.retention_days);
        }

        if (auto node = root["memory"]) {
            config.memory.hot_token_limit = node["hot_token_limit"].as<int>(config.memory.hot_token_limit);
            config.memory.warm_access_threshold = node["warm_access_threshold"].as<int>(config.memory.warm_access_threshold);
            config.memory.promote_threshold = node["promote_threshold"].as<double>(config.memory.promote_threshold);
            config.memory.max_cold_items = node["max_cold_items"].as<int>(config.memory.max_cold_items);
            config.memory.auto_spill_enabled = node["auto_spill_enabled"].as<bool>(config.memory.auto_spill_enabled);
            config.memory.auto_promote_enabled = node["auto_promote_enabled"].as<bool>(config.memory.auto_promote_enabled);
        }

        if (auto node = root["embeddings"]) {
            config.embeddings.provider = node["provider"].as<std::string>(config.embeddings.provider);
            config.embeddings.base_url = node["base_url"].as<std::string>(config.embeddings.base_url);
            config.embeddings.model = node["model"].as<std::string>(config.embeddings.model);
            config.embeddings.timeout_ms = node["timeout_ms"].as<int>(config.embeddings.timeout_ms);
        }

        if (auto node = root["observability"]) {
            config.observability.log_level = node["log_level"].as<std::string>(config.observability.log_level);
            config.observability.log_path = node["log_path"].as<std::string>(config.observability.log_path.string());
        }

        config.apply_env_overrides();
        config.expand_paths();

        auto validation = config.validate();
        if (validation.is_err()) {
            return Result<Config, Error>::err(std::move(validation).error());
        }

        return Result<Config, Error>::ok(std::move(config));

    } catch (const YAML::Exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            std::string("YAML parse error: ") + e.what(),
            expanded.string()
        );
    }
}

Config Config::load_or_default(const fs::path& path) {
    auto result = load(path);
    if (result.is_ok()) {
        return std::move(result).value();
    }

    Config config;
    config.apply_env_overrides();
    config.expand_paths();
    return config;
}

Result<void, Error> Config::save(const fs::path& path) const {
    fs::path expanded = expand_path(path);

    std::error_code ec;
    if (expanded.has_parent_path()) {
        fs::create_directories(expanded.parent_path(), ec);
        if (ec) {
            return Result<void, Error>::err(
                ErrorCode::ConfigWriteFailed,
                ec.message(),
                expanded.parent_path().string()
            );
        }
    }

    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "storage" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "database_path" << YAML::Value << storage.database_path.string();
    out << YAML::Key << "busy_timeout_ms" << YAML::Value << storage.busy_timeout_ms;
    out << YAML::EndMap;

    out << YAML::Key << "checkpoints" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "max_checkpoints" << YAML::Value << checkpoints.max_checkpoints;
    out << YAML::Key << "auto_checkpoint" << YAML::Value << checkpoints.auto_checkpoint;
    out << YAML::Key << "retention_days" << YAML::Value << checkpoints.retention_days;
    out << YAML::EndMap;

    out << YAML::Key << "memory" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "hot_token_limit" << YAML::Value << memory.hot_token_limit;
    out << YAML::Key << "warm_access_threshold" << YAML::Value << memory.warm_access_threshold;
    out << YAML::Key << "promote_threshold" << YAML::Value << memory.promote_threshold;
    out << YAML::Key << "max_cold_items" << YAML::Value << memory.max_cold_items;
    out << YAML::Key << "auto_spill_enabled" << YAML::Value << memory.auto_spill_enabled;
    out << YAML::Key << "auto_promote_enabled" << YAML::Value << memory.auto_promote_enabled;
    out << YAML::EndMap;

    out << YAML::Key << "embeddings" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "provider" << YAML::Value << embeddings.provider;
    out << YAML::Key << "base_url" << YAML::Value << embeddings.base_url;
    out << YAML::Key << "model" << YAML::Value << embeddings.model;
    out << YAML::Key << "timeout_ms" << YAML::Value << embeddings.timeout_ms;
    out << YAML::EndMap;

    out << YAML::Key << "observability" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "log_level" << YAML::Value << observability.log_level;
    out << YAML::Key << "log_path" << YAML::Value << observability.log_path.string();
    out << YAML::EndMap;

    out << YAML::EndMap;

    std::ofstream file(expanded);
    if (!file) {
        return Result<void, Error>::err(
            ErrorCode::ConfigWriteFailed,
            "Failed to open config file for writing",
            expanded.string()
        );
    }

    file << out.c_str();
    return Result<void, Error>::ok();
}

}  // namespace ctxsys::core
