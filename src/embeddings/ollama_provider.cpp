#include "ctxsys/embeddings/ollama_provider.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <unordered_map>

namespace ctxsys::embeddings {

namespace {

const std::unordered_map<std::string, size_t> kModelMaxChars = {
    {"nomic-embed-text", 4000},
    {"mxbai-embed-large", 1024},
    {"all-minilm", 700},
    {"bge-base", 1024},
    {"bge-large", 1024}
};

constexpr size_t kDefaultMaxChars = 1024;

struct ModelPrefixes {
    std::string query;
    std::string document;
};

const std::unordered_map<std::string, ModelPrefixes> kModelPrefixes = {
    {"nomic-embed-text", {"search_query: ", "search_document: "}},
    {"mxbai-embed-large", {"Represent this sentence for searching relevant passages: ", ""}}
};

std::string strip_tag(const std::string& model) {
    return model.substr(0, model.find(':'));
}

}  // namespace

std::string OllamaProvider::normalize_base_url(const std::string& url) {
    std::string result = url;
    auto pos = result.find("://localhost");
    if (pos != std::string::npos) {
        result.replace(pos, 12, "://127.0.0.1");
    }
    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

size_t OllamaProvider::max_chars_for_model(const std::string& model) {
    auto it = kModelMaxChars.find(strip_tag(model));
    return it != kModelMaxChars.end() ? it->second : kDefaultMaxChars;
}

OllamaProvider::OllamaProvider(const std::string& base_url, const std::string& model, int timeout_ms)
    : base_url_(normalize_base_url(base_url))
    , model_(model)
    , base_model_(strip_tag(model))
    , max_chars_(max_chars_for_model(model))
    , timeout_ms_(timeout_ms)
{
}

std::string OllamaProvider::apply_prefix(const std::string& text, bool is_query) const {
    auto it = kModelPrefixes.find(base_model_);
    if (it == kModelPrefixes.end()) {
        return text;
    }
    return (is_query ? it->second.query : it->second.document) + text;
}

Result<std::vector<float>, Error> OllamaProvider::embed(const std::string& text) {
    return request(apply_prefix(text, false));
}

Result<std::vector<float>, Error> OllamaProvider::embed_query(const std::string& text) {
    return request(apply_prefix(text, true));
}

Result<std::vector<float>, Error> OllamaProvider::request(const std::string& input) const {
    using R = Result<std::vector<float>, Error>;

    std::string truncated = input.size() > max_chars_ ? input.substr(0, max_chars_) : input;

    httplib::Client client(base_url_);
    client.set_connection_timeout(std::chrono::milliseconds(timeout_ms_));
    client.set_read_timeout(std::chrono::milliseconds(timeout_ms_));

    Json body{
        {"model", model_},
        {"input", truncated}
    };

    auto res = client.Post("/api/embed", body.dump(), "application/json");

    if (!res) {
        auto code = res.error() == httplib::Error::Connection
            ? ErrorCode::ConnectionRefused
            : ErrorCode::NetworkError;
        return R::err(
            code,
            "Failed to reach Ollama: " + httplib::to_string(res.error()),
            base_url_
        );
    }

    if (res->status != 200) {
        spdlog::warn("Ollama /api/embed returned {} for model {}", res->status, model_);
        return R::err(
            ErrorCode::EmbeddingFailed,
            "Ollama embedding failed (" + std::to_string(res->status) + "): " + res->body,
            model_
        );
    }

    return parse_response(res->body);
}

Result<std::vector<float>, Error> OllamaProvider::parse_response(const std::string& body) const {
    using R = Result<std::vector<float>, Error>;

    try {
        Json j = Json::parse(body);
        if (!j.contains("embeddings") || !j["embeddings"].is_array() ||
            j["embeddings"].empty() || !j["embeddings"][0].is_array() ||
            j["embeddings"][0].empty()) {
            return R::err(
                ErrorCode::EmbeddingInvalidResponse,
                "Ollama returned empty embedding for model " + model_
            );
        }
        return R::ok(j["embeddings"][0].get<std::vector<float>>());
    } catch (const Json::exception& e) {
        return R::err(
            ErrorCode::EmbeddingInvalidResponse,
            std::string("Failed to parse Ollama response: ") + e.what()
        );
    }
}

Result<void, Error> OllamaProvider::health_check() const {
    httplib::Client client(base_url_);
    client.set_connection_timeout(std::chrono::milliseconds(timeout_ms_));
    client.set_read_timeout(std::chrono::milliseconds(timeout_ms_));

    auto res = client.Get("/api/tags");
    if (!res) {
        return Result<void, Error>::err(
            ErrorCode::ConnectionRefused,
            "Ollama not reachable: " + httplib::to_string(res.error()),
            base_url_
        );
    }
    if (res->status != 200) {
        return Result<void, Error>::err(
            ErrorCode::EmbeddingUnavailable,
            "Ollama health check returned " + std::to_string(res->status),
            base_url_
        );
    }
    return Result<void, Error>::ok();
}

}  // namespace ctxsys::embeddings
