#pragma once

#include <string>
#include <vector>

namespace ctxsys::memory {

// Dot product over the product of magnitudes. 0 for mismatched dimensions,
// empty input or a zero vector.
double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

// Fraction of the whitespace-separated query terms that are longer than two
// characters and occur case-insensitively in content. 0 for an empty query.
double keyword_relevance(const std::string& query, const std::string& content);

}  // namespace ctxsys::memory
