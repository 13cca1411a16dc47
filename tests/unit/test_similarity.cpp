#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "ctxsys/memory/similarity.hpp"
#include "ctxsys/memory/tokenizer.hpp"

using namespace ctxsys::memory;

TEST_CASE("Cosine similarity", "[similarity]") {
    REQUIRE(cosine_similarity({1.0f, 0.0f}, {1.0f, 0.0f}) == Catch::Approx(1.0));
    REQUIRE(cosine_similarity({1.0f, 0.0f}, {0.0f, 1.0f}) == Catch::Approx(0.0));
    REQUIRE(cosine_similarity({1.0f, 2.0f}, {-1.0f, -2.0f}) == Catch::Approx(-1.0));
    REQUIRE(cosine_similarity({3.0f, 4.0f}, {6.0f, 8.0f}) == Catch::Approx(1.0));
}

TEST_CASE("Cosine similarity degenerate inputs", "[similarity]") {
    REQUIRE(cosine_similarity({}, {}) == 0.0);
    REQUIRE(cosine_similarity({1.0f, 2.0f}, {1.0f}) == 0.0);
    REQUIRE(cosine_similarity({0.0f, 0.0f}, {1.0f, 1.0f}) == 0.0);
}

TEST_CASE("Keyword relevance", "[similarity]") {
    REQUIRE(keyword_relevance("database schema", "The Database SCHEMA changed") == Catch::Approx(1.0));
    REQUIRE(keyword_relevance("database frontend", "database migration") == Catch::Approx(0.5));
    REQUIRE(keyword_relevance("nothing here", "unrelated text") == Catch::Approx(0.0));
    REQUIRE(keyword_relevance("", "anything") == 0.0);
    REQUIRE(keyword_relevance("   ", "anything") == 0.0);
}

TEST_CASE("Short keywords never match but still count", "[similarity]") {
    // "to" and "db" are too short to match, "migrate" matches
    REQUIRE(keyword_relevance("migrate to db", "migrate to db now") == Catch::Approx(1.0 / 3.0));
}

TEST_CASE("Token estimation", "[similarity][tokenizer]") {
    REQUIRE(Tokenizer::estimate_tokens(std::string()) == 0);
    REQUIRE(Tokenizer::estimate_tokens(std::string("abcd")) == 1);
    REQUIRE(Tokenizer::estimate_tokens(std::string("abcde")) == 2);
    REQUIRE(Tokenizer::estimate_tokens(std::string(50, 'x')) == 13);
}
