#include "ctxsys/db/schema.hpp"

#include <spdlog/spdlog.h>

#include <cctype>

namespace ctxsys::db {

std::string sanitize_project_id(const std::string& project_id) {
    std::string sanitized = "p_";
    sanitized.reserve(project_id.size() + 2);
    for (char c : project_id) {
        sanitized += std::isalnum(static_cast<unsigned char>(c)) ? c : '_';
    }
    return sanitized;
}

ProjectTables ProjectTables::for_project(const ProjectId& project_id) {
    ProjectTables tables;
    tables.prefix = sanitize_project_id(project_id);
    tables.checkpoints = tables.prefix + "_checkpoints";
    tables.memory_items = tables.prefix + "_memory_items";
    return tables;
}

Result<void, Error> create_project(Database& db, const ProjectId& project_id) {
    auto t = ProjectTables::for_project(project_id);

    std::string ddl =
        "CREATE TABLE IF NOT EXISTS " + t.checkpoints + " ("
        "  id TEXT PRIMARY KEY,"
        "  session_id TEXT NOT NULL,"
        "  step_number INTEGER NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  state TEXT NOT NULL,"
        "  description TEXT,"
        "  trigger_type TEXT NOT NULL DEFAULT 'auto',"
        "  duration_ms INTEGER NOT NULL DEFAULT 0,"
        "  token_usage INTEGER"
        ");"
        "CREATE INDEX IF NOT EXISTS " + t.checkpoints + "_session_idx ON " + t.checkpoints +
        "  (session_id, step_number DESC, created_at DESC);"
        "CREATE INDEX IF NOT EXISTS " + t.checkpoints + "_created_idx ON " + t.checkpoints +
        "  (created_at);"
        "CREATE TABLE IF NOT EXISTS " + t.memory_items + " ("
        "  id TEXT PRIMARY KEY,"
        "  session_id TEXT NOT NULL,"
        "  content TEXT NOT NULL,"
        "  type TEXT NOT NULL,"
        "  tier TEXT NOT NULL DEFAULT 'hot',"
        "  access_count INTEGER NOT NULL DEFAULT 0,"
        "  last_accessed_at INTEGER NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  relevance_score REAL NOT NULL DEFAULT 1.0,"
        "  token_count INTEGER NOT NULL DEFAULT 0,"
        "  metadata TEXT,"
        "  embedding BLOB"
        ");"
        "CREATE INDEX IF NOT EXISTS " + t.memory_items + "_tier_idx ON " + t.memory_items +
        "  (session_id, tier);";

    auto result = db.execute_script(ddl);
    if (result.is_err()) {
        return result;
    }

    spdlog::debug("Project storage ready: {}", t.prefix);
    return Result<void, Error>::ok();
}

Result<void, Error> drop_project(Database& db, const ProjectId& project_id) {
    auto t = ProjectTables::for_project(project_id);
    auto result = db.execute_script(
        "DROP TABLE IF EXISTS " + t.checkpoints + ";"
        "DROP TABLE IF EXISTS " + t.memory_items + ";"
    );
    if (result.is_ok()) {
        spdlog::info("Dropped project storage {}", t.prefix);
    }
    return result;
}

Result<bool, Error> project_exists(Database& db, const ProjectId& project_id) {
    auto t = ProjectTables::for_project(project_id);
    auto row = db.fetch_one(
        "SELECT name FROM sqlite_master WHERE type = 'table' AND name = ?",
        {t.checkpoints}
    );
    if (row.is_err()) {
        return Result<bool, Error>::err(std::move(row).error());
    }
    return Result<bool, Error>::ok(row.value().has_value());
}

}  // namespace ctxsys::db
