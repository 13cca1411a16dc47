#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "ctxsys/core/config.hpp"

#include <cstdlib>
#include <fstream>

using namespace ctxsys::core;

namespace {

fs::path temp_config_path(const std::string& name) {
    auto dir = fs::temp_directory_path() / "ctxsys_config_tests";
    fs::create_directories(dir);
    return dir / name;
}

}  // namespace

TEST_CASE("Default config values", "[config]") {
    Config config;

    REQUIRE(config.checkpoints.max_checkpoints == 10);
    REQUIRE(config.checkpoints.auto_checkpoint);
    REQUIRE(config.memory.hot_token_limit == 4000);
    REQUIRE(config.memory.warm_access_threshold == 3);
    REQUIRE(config.memory.promote_threshold == Catch::Approx(0.85));
    REQUIRE(config.memory.max_cold_items == 1000);
    REQUIRE(config.memory.auto_spill_enabled);
    REQUIRE(config.memory.auto_promote_enabled);
    REQUIRE(config.embeddings.provider == "none");
    REQUIRE(config.validate().is_ok());
}

TEST_CASE("Config validation rejects bad values", "[config]") {
    Config config;

    SECTION("max_checkpoints below one") {
        config.checkpoints.max_checkpoints = 0;
        auto result = config.validate();
        REQUIRE(result.is_err());
        REQUIRE(result.error().code == ErrorCode::ConfigValidationFailed);
    }

    SECTION("promote threshold out of range") {
        config.memory.promote_threshold = 1.5;
        REQUIRE(config.validate().is_err());
    }

    SECTION("unknown embedding provider") {
        config.embeddings.provider = "openai";
        REQUIRE(config.validate().is_err());
    }

    SECTION("unknown log level") {
        config.observability.log_level = "verbose";
        REQUIRE(config.validate().is_err());
    }
}

TEST_CASE("Config loads YAML sections", "[config]") {
    auto path = temp_config_path("load.yaml");
    {
        std::ofstream out(path);
        out << "storage:\n"
               "  database_path: \":memory:\"\n"
               "checkpoints:\n"
               "  max_checkpoints: 5\n"
               "  auto_checkpoint: false\n"
               "memory:\n"
               "  hot_token_limit: 100\n"
               "  promote_threshold: 0.5\n"
               "embeddings:\n"
               "  provider: ollama\n"
               "  model: all-minilm\n";
    }

    auto result = Config::load(path);
    REQUIRE(result.is_ok());

    const auto& config = result.value();
    REQUIRE(config.storage.database_path == ":memory:");
    REQUIRE(config.checkpoints.max_checkpoints == 5);
    REQUIRE_FALSE(config.checkpoints.auto_checkpoint);
    REQUIRE(config.memory.hot_token_limit == 100);
    REQUIRE(config.memory.promote_threshold == Catch::Approx(0.5));
    REQUIRE(config.memory.max_cold_items == 1000);
    REQUIRE(config.embeddings.provider == "ollama");
    REQUIRE(config.embeddings.model == "all-minilm");

    fs::remove(path);
}

TEST_CASE("Config load reports missing and malformed files", "[config]") {
    auto missing = Config::load(temp_config_path("does_not_exist.yaml"));
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == ErrorCode::ConfigNotFound);

    auto path = temp_config_path("broken.yaml");
    {
        std::ofstream out(path);
        out << "checkpoints: [unclosed\n";
    }
    auto broken = Config::load(path);
    REQUIRE(broken.is_err());
    REQUIRE(broken.error().code == ErrorCode::ConfigParseFailed);

    auto fallback = Config::load_or_default(path);
    REQUIRE(fallback.checkpoints.max_checkpoints == 10);

    fs::remove(path);
}

TEST_CASE("Config save then load keeps values", "[config]") {
    auto path = temp_config_path("saved.yaml");

    Config config;
    config.storage.database_path = "/tmp/ctxsys-test.db";
    config.checkpoints.retention_days = 7;
    config.memory.max_cold_items = 42;
    config.observability.log_level = "debug";

    REQUIRE(config.save(path).is_ok());

    auto loaded = Config::load(path);
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().checkpoints.retention_days == 7);
    REQUIRE(loaded.value().memory.max_cold_items == 42);
    REQUIRE(loaded.value().observability.log_level == "debug");

    fs::remove(path);
}

TEST_CASE("Path expansion", "[config]") {
    const char* home = std::getenv("HOME");
    if (home) {
        REQUIRE(expand_path(std::string("~/data")) == std::string(home) + "/data");
    }

    setenv("CTXSYS_TEST_DIR", "/var/ctx", 1);
    REQUIRE(expand_path(std::string("${CTXSYS_TEST_DIR}/db.sqlite")) == "/var/ctx/db.sqlite");
    REQUIRE(expand_path(std::string("$CTXSYS_TEST_DIR/db.sqlite")) == "/var/ctx/db.sqlite");
    unsetenv("CTXSYS_TEST_DIR");
}

TEST_CASE("Environment overrides", "[config]") {
    setenv("OLLAMA_HOST", "gpu-box:11434", 1);
    setenv("CTXSYS_LOG_LEVEL", "warn", 1);

    Config config;
    config.apply_env_overrides();
    REQUIRE(config.embeddings.base_url == "http://gpu-box:11434");
    REQUIRE(config.observability.log_level == "warn");

    unsetenv("OLLAMA_HOST");
    unsetenv("CTXSYS_LOG_LEVEL");
}
