#include <catch2/catch_test_macros.hpp>
#include "ctxsys/core/result.hpp"
#include "ctxsys/core/types.hpp"

#include <memory>

using namespace ctxsys::core;

TEST_CASE("Result with value", "[result]") {
    auto result = Result<int, Error>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.value() == 42);
    REQUIRE(*result == 42);
}

TEST_CASE("Result with error code and context", "[result]") {
    auto result = Result<int, Error>::err(ErrorCode::CheckpointNotFound, "Checkpoint not found", "ckpt_1");

    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::CheckpointNotFound);
    REQUIRE(result.error().full_message() == "Checkpoint not found [ckpt_1]");
    REQUIRE(result.operator->() == nullptr);
    REQUIRE_THROWS(result.value());
}

TEST_CASE("Result void success and error", "[result]") {
    auto ok = Result<void, Error>::ok();
    REQUIRE(ok.is_ok());
    REQUIRE_THROWS(ok.error());

    auto err = Result<void, Error>::err(ErrorCode::DatabaseError, "disk I/O error");
    REQUIRE(err.is_err());
    REQUIRE(err.error().message == "disk I/O error");
}

TEST_CASE("Result holding JSON keeps value and error apart", "[result]") {
    auto value = Result<Json, Error>::ok(Json{{"files", 3}});
    REQUIRE(value.is_ok());
    REQUIRE(value.value()["files"] == 3);

    auto error = Result<Json, Error>::err(ErrorCode::UnknownAction, "Unknown action: deploy");
    REQUIRE(error.is_err());
    REQUIRE(error.error().code == ErrorCode::UnknownAction);
}

TEST_CASE("Result map and and_then", "[result]") {
    auto doubled = Result<int, Error>::ok(21).map([](int v) { return v * 2; });
    REQUIRE(doubled.value() == 42);

    auto failed = Result<int, Error>::err(ErrorCode::NotFound)
        .and_then([](int v) { return Result<std::string, Error>::ok(std::to_string(v)); });
    REQUIRE(failed.is_err());
    REQUIRE(failed.error().code == ErrorCode::NotFound);

    REQUIRE(Result<int, Error>::err(ErrorCode::NotFound).unwrap_or(7) == 7);
}

TEST_CASE("Result moves out move-only values", "[result]") {
    auto result = Result<std::unique_ptr<int>, Error>::ok(std::make_unique<int>(5));
    auto owned = std::move(result).value();
    REQUIRE(*owned == 5);
}

TEST_CASE("Error retriable classification", "[result]") {
    REQUIRE(Error(ErrorCode::ConnectionRefused).is_retriable());
    REQUIRE_FALSE(Error(ErrorCode::CheckpointNotFound).is_retriable());
}
