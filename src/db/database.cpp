#include "ctxsys/db/database.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

namespace ctxsys::db {

namespace {

struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

Error sqlite_error(sqlite3* db, const std::string& sql) {
    return Error(ErrorCode::DatabaseError, sqlite3_errmsg(db), sql);
}

int bind_param(sqlite3_stmt* stmt, int index, const Json& value) {
    switch (value.type()) {
        case Json::value_t::null:
        case Json::value_t::discarded:
            return sqlite3_bind_null(stmt, index);
        case Json::value_t::boolean:
            return sqlite3_bind_int(stmt, index, value.get<bool>() ? 1 : 0);
        case Json::value_t::number_integer:
            return sqlite3_bind_int64(stmt, index, value.get<int64_t>());
        case Json::value_t::number_unsigned:
            return sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(value.get<uint64_t>()));
        case Json::value_t::number_float:
            return sqlite3_bind_double(stmt, index, value.get<double>());
        case Json::value_t::string: {
            const auto& s = value.get_ref<const std::string&>();
            return sqlite3_bind_text(stmt, index, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
        }
        case Json::value_t::binary: {
            const auto& bytes = value.get_binary();
            return sqlite3_bind_blob(stmt, index, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
        }
        case Json::value_t::object:
        case Json::value_t::array: {
            std::string text = value.dump();
            return sqlite3_bind_text(stmt, index, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
        }
    }
    return SQLITE_MISUSE;
}

Row read_row(sqlite3_stmt* stmt) {
    Row row = Json::object();
    int columns = sqlite3_column_count(stmt);

    for (int i = 0; i < columns; ++i) {
        const char* name = sqlite3_column_name(stmt, i);
        switch (sqlite3_column_type(stmt, i)) {
            case SQLITE_INTEGER:
                row[name] = static_cast<int64_t>(sqlite3_column_int64(stmt, i));
                break;
            case SQLITE_FLOAT:
                row[name] = sqlite3_column_double(stmt, i);
                break;
            case SQLITE_TEXT: {
                auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, i));
                row[name] = std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, i)));
                break;
            }
            case SQLITE_BLOB: {
                auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, i));
                int size = sqlite3_column_bytes(stmt, i);
                std::vector<uint8_t> bytes;
                if (data && size > 0) {
                    bytes.assign(data, data + size);
                }
                row[name] = Json::binary(std::move(bytes));
                break;
            }
            default:
                row[name] = nullptr;
                break;
        }
    }

    return row;
}

Result<void, Error> prepare(sqlite3* db, const std::string& sql, const Params& params, StmtGuard& g) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error(db, sql));
    }

    int expected = sqlite3_bind_parameter_count(g.stmt);
    if (expected != static_cast<int>(params.size())) {
        return Result<void, Error>::err(
            ErrorCode::InvalidArgument,
            "Expected " + std::to_string(expected) + " parameters, got " + std::to_string(params.size()),
            sql
        );
    }

    for (size_t i = 0; i < params.size(); ++i) {
        if (bind_param(g.stmt, static_cast<int>(i) + 1, params[i]) != SQLITE_OK) {
            return Result<void, Error>::err(sqlite_error(db, sql));
        }
    }

    return Result<void, Error>::ok();
}

}  // namespace

Result<std::unique_ptr<Database>, Error> Database::open(const fs::path& path, int busy_timeout_ms) {
    using R = Result<std::unique_ptr<Database>, Error>;

    std::string target = path.string();
    if (target != ":memory:" && path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return R::err(ErrorCode::DatabaseOpenFailed, ec.message(), path.parent_path().string());
        }
    }

    sqlite3* handle = nullptr;
    if (sqlite3_open(target.c_str(), &handle) != SQLITE_OK) {
        std::string message = handle ? sqlite3_errmsg(handle) : "unknown error";
        if (handle) {
            sqlite3_close(handle);
        }
        return R::err(ErrorCode::DatabaseOpenFailed, message, target);
    }

    sqlite3_busy_timeout(handle, busy_timeout_ms);

    std::unique_ptr<Database> db(new Database(handle, path));

    auto pragmas = db->execute_script(
        "PRAGMA journal_mode=WAL;"
        "PRAGMA synchronous=NORMAL;"
        "PRAGMA foreign_keys=ON;"
    );
    if (pragmas.is_err()) {
        return R::err(std::move(pragmas).error());
    }

    spdlog::debug("Opened database {}", target);
    return R::ok(std::move(db));
}

Database::Database(sqlite3* handle, fs::path path)
    : db_(handle)
    , path_(std::move(path))
{
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

Result<int64_t, Error> Database::execute(const std::string& sql, const Params& params) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    StmtGuard g;
    auto prepared = prepare(db_, sql, params, g);
    if (prepared.is_err()) {
        return Result<int64_t, Error>::err(std::move(prepared).error());
    }

    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) {
        return Result<int64_t, Error>::err(sqlite_error(db_, sql));
    }

    return Result<int64_t, Error>::ok(static_cast<int64_t>(sqlite3_changes(db_)));
}

Result<void, Error> Database::execute_script(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "unknown error";
        sqlite3_free(err);
        return Result<void, Error>::err(ErrorCode::DatabaseError, message, sql);
    }
    return Result<void, Error>::ok();
}

Result<std::optional<Row>, Error> Database::fetch_one(const std::string& sql, const Params& params) {
    using R = Result<std::optional<Row>, Error>;
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    StmtGuard g;
    auto prepared = prepare(db_, sql, params, g);
    if (prepared.is_err()) {
        return R::err(std::move(prepared).error());
    }

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_ROW) {
        return R::ok(std::optional<Row>(read_row(g.stmt)));
    }
    if (rc != SQLITE_DONE) {
        return R::err(sqlite_error(db_, sql));
    }
    return R::ok(std::nullopt);
}

Result<std::vector<Row>, Error> Database::fetch_many(const std::string& sql, const Params& params) {
    using R = Result<std::vector<Row>, Error>;
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    StmtGuard g;
    auto prepared = prepare(db_, sql, params, g);
    if (prepared.is_err()) {
        return R::err(std::move(prepared).error());
    }

    std::vector<Row> rows;
    int rc;
    while ((rc = sqlite3_step(g.stmt)) == SQLITE_ROW) {
        rows.push_back(read_row(g.stmt));
    }
    if (rc != SQLITE_DONE) {
        return R::err(sqlite_error(db_, sql));
    }
    return R::ok(std::move(rows));
}

Result<void, Error> Database::begin() {
    std::string sql = depth_ == 0
        ? std::string("BEGIN IMMEDIATE")
        : "SAVEPOINT sp_" + std::to_string(depth_);

    auto result = execute_script(sql);
    if (result.is_err()) {
        return Result<void, Error>::err(
            ErrorCode::TransactionFailed,
            "Failed to begin transaction: " + result.error().message
        );
    }
    ++depth_;
    return Result<void, Error>::ok();
}

Result<void, Error> Database::commit() {
    std::string sql = depth_ == 1
        ? std::string("COMMIT")
        : "RELEASE sp_" + std::to_string(depth_ - 1);

    auto result = execute_script(sql);
    if (result.is_err()) {
        return Result<void, Error>::err(
            ErrorCode::TransactionFailed,
            "Failed to commit transaction: " + result.error().message
        );
    }
    --depth_;
    return Result<void, Error>::ok();
}

void Database::rollback() {
    if (depth_ == 0) {
        return;
    }

    std::string sql = depth_ == 1
        ? std::string("ROLLBACK")
        : "ROLLBACK TO sp_" + std::to_string(depth_ - 1) + "; RELEASE sp_" + std::to_string(depth_ - 1);

    auto result = execute_script(sql);
    if (result.is_err()) {
        spdlog::error("Rollback failed: {}", result.error().message);
    }
    --depth_;
}

}  // namespace ctxsys::db
