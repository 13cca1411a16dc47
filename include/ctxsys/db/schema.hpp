#pragma once

#include "database.hpp"

#include <string>

namespace ctxsys::db {

// "p_" + project id with every non-alphanumeric character replaced by '_'
std::string sanitize_project_id(const std::string& project_id);

// Table names for one project's namespace
struct ProjectTables {
    std::string prefix;
    std::string checkpoints;
    std::string memory_items;

    static ProjectTables for_project(const ProjectId& project_id);
};

// Creates the project's tables and indexes if they do not exist yet
Result<void, Error> create_project(Database& db, const ProjectId& project_id);

// Drops the project's tables
Result<void, Error> drop_project(Database& db, const ProjectId& project_id);

Result<bool, Error> project_exists(Database& db, const ProjectId& project_id);

}  // namespace ctxsys::db
