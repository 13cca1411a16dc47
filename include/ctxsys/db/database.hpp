#pragma once

#include "ctxsys/core/errors.hpp"
#include "ctxsys/core/result.hpp"
#include "ctxsys/core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

struct sqlite3;

namespace ctxsys::db {

using namespace ctxsys::core;
namespace fs = std::filesystem;

// A fetched row: JSON object keyed by column name. INTEGER -> number,
// REAL -> number, TEXT -> string, BLOB -> binary, NULL -> null.
using Row = Json;

// Positional statement parameters. Objects and arrays are bound as their
// JSON text, binary values as BLOBs.
using Params = std::vector<Json>;

// SQLite connection shared by the checkpoint store and the memory tier cache.
// All calls are serialized on one recursive mutex, so a transaction body may
// call back into the same Database.
class Database {
public:
    // Opens (creating if needed) a database file. ":memory:" gives a private
    // in-memory database.
    static Result<std::unique_ptr<Database>, Error> open(
        const fs::path& path, int busy_timeout_ms = 5000);

    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Runs one statement, returns the number of affected rows
    Result<int64_t, Error> execute(const std::string& sql, const Params& params = {});

    // Runs several ';'-separated statements without parameters (DDL)
    Result<void, Error> execute_script(const std::string& sql);

    Result<std::optional<Row>, Error> fetch_one(const std::string& sql, const Params& params = {});
    Result<std::vector<Row>, Error> fetch_many(const std::string& sql, const Params& params = {});

    // Runs fn inside a transaction. fn returns a Result; an error result (or a
    // std::exception escaping fn) rolls everything back. Nested calls use
    // savepoints, so an inner failure only undoes the inner work.
    template<typename F>
    auto with_transaction(F&& fn) -> std::invoke_result_t<F> {
        using R = std::invoke_result_t<F>;
        std::lock_guard<std::recursive_mutex> lock(mutex_);

        auto begun = begin();
        if (begun.is_err()) {
            return R::err(std::move(begun).error());
        }

        try {
            R result = fn();
            if (result.is_err()) {
                rollback();
                return result;
            }
            auto committed = commit();
            if (committed.is_err()) {
                rollback();
                return R::err(std::move(committed).error());
            }
            return result;
        } catch (const std::exception& e) {
            rollback();
            return R::err(Error(ErrorCode::TransactionFailed, e.what()));
        }
    }

    int transaction_depth() const { return depth_; }
    const fs::path& path() const { return path_; }

private:
    Database(sqlite3* handle, fs::path path);

    Result<void, Error> begin();
    Result<void, Error> commit();
    void rollback();

    sqlite3* db_;
    fs::path path_;
    mutable std::recursive_mutex mutex_;
    int depth_ = 0;
};

}  // namespace ctxsys::db
