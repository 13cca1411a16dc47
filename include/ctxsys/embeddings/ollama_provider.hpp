#pragma once

#include "ctxsys/memory/embedding_provider.hpp"

#include <string>

namespace ctxsys::embeddings {

using namespace ctxsys::core;

// Embeddings from a local Ollama server via POST /api/embed
class OllamaProvider : public memory::EmbeddingProvider {
public:
    OllamaProvider(const std::string& base_url, const std::string& model, int timeout_ms = 30000);

    std::string name() const override { return "ollama"; }

    Result<std::vector<float>, Error> embed(const std::string& text) override;
    Result<std::vector<float>, Error> embed_query(const std::string& text) override;

    // GET /api/tags
    Result<void, Error> health_check() const;

    const std::string& base_url() const { return base_url_; }
    const std::string& model() const { return model_; }
    size_t max_chars() const { return max_chars_; }

    // Input length accepted by a model, by its name without the tag
    static size_t max_chars_for_model(const std::string& model);

    // localhost resolves to ::1 first on some hosts, Ollama binds 127.0.0.1
    static std::string normalize_base_url(const std::string& url);

private:
    std::string base_url_;
    std::string model_;
    std::string base_model_;
    size_t max_chars_;
    int timeout_ms_;

    std::string apply_prefix(const std::string& text, bool is_query) const;
    Result<std::vector<float>, Error> request(const std::string& input) const;
    Result<std::vector<float>, Error> parse_response(const std::string& body) const;
};

}  // namespace ctxsys::embeddings
