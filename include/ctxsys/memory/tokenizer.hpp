#pragma once

#include "ctxsys/core/types.hpp"

#include <string>

namespace ctxsys::memory {

using namespace ctxsys::core;

// Token estimation for budgeting the hot tier.
// Approximately 4 characters per token, rounded up.
class Tokenizer {
public:
    static int estimate_tokens(const std::string& text) {
        return static_cast<int>((text.length() + 3) / 4);
    }

    static int estimate_tokens(const Json& j) {
        return estimate_tokens(j.dump());
    }
};

}  // namespace ctxsys::memory
