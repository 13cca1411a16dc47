#pragma once

#include "ctxsys/core/result.hpp"

#include <functional>
#include <string>
#include <vector>

namespace ctxsys::memory {

using namespace ctxsys::core;

// Text -> fixed-length vector for semantic recall. Running without a
// provider is supported; recall then scores by keyword overlap.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual std::string name() const = 0;
    virtual bool is_available() const { return true; }

    // Embedding for stored content
    virtual Result<std::vector<float>, Error> embed(const std::string& text) = 0;

    // Embedding for a recall query. Models with asymmetric prompts override this.
    virtual Result<std::vector<float>, Error> embed_query(const std::string& text) {
        return embed(text);
    }
};

using EmbedFunction = std::function<Result<std::vector<float>, Error>(const std::string&)>;

// Adapts a plain function into a provider
class FunctionEmbeddingProvider : public EmbeddingProvider {
public:
    explicit FunctionEmbeddingProvider(EmbedFunction fn, std::string name = "function")
        : fn_(std::move(fn)), name_(std::move(name)) {}

    std::string name() const override { return name_; }
    bool is_available() const override { return static_cast<bool>(fn_); }

    Result<std::vector<float>, Error> embed(const std::string& text) override {
        if (!fn_) {
            return Result<std::vector<float>, Error>::err(ErrorCode::EmbeddingUnavailable);
        }
        return fn_(text);
    }

private:
    EmbedFunction fn_;
    std::string name_;
};

}  // namespace ctxsys::memory
