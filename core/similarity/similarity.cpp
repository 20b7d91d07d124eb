#include "similarity/similarity.hpp"

#include <cmath>

namespace weave {

double jaccardSimilarity(const TokenSet& a, const TokenSet& b) {
    if (a.empty() && b.empty()) return 0.0;

    const TokenSet& smaller = a.size() <= b.size() ? a : b;
    const TokenSet& larger = a.size() <= b.size() ? b : a;

    size_t intersection = 0;
    for (const auto& token : smaller) {
        if (larger.count(token)) intersection++;
    }
    size_t union_size = a.size() + b.size() - intersection;
    return static_cast<double>(intersection) / static_cast<double>(union_size);
}

double cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.empty() || b.empty() || a.size() != b.size()) return 0.0;

    double dot = 0.0, mag_a = 0.0, mag_b = 0.0;
    for (size_t i = 0; i < a.size(); i++) {
        dot += static_cast<double>(a[i]) * b[i];
        mag_a += static_cast<double>(a[i]) * a[i];
        mag_b += static_cast<double>(b[i]) * b[i];
    }
    double denom = std::sqrt(mag_a) * std::sqrt(mag_b);
    if (denom == 0.0) return 0.0;
    return dot / denom;
}

} // namespace weave
