#include "ctxsys/memory/similarity.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace ctxsys::memory {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}  // namespace

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0;
    }

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }

    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }

    return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

double keyword_relevance(const std::string& query, const std::string& content) {
    std::istringstream words(to_lower(query));
    std::string haystack = to_lower(content);

    int total = 0;
    int matched = 0;
    std::string word;
    while (words >> word) {
        ++total;
        if (word.size() > 2 && haystack.find(word) != std::string::npos) {
            ++matched;
        }
    }

    return total > 0 ? static_cast<double>(matched) / total : 0.0;
}

}  // namespace ctxsys::memory
