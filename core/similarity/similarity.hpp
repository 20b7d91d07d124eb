#pragma once

#include "similarity/tokenizer.hpp"

#include <vector>

namespace weave {

/// Jaccard coefficient |A ∩ B| / |A ∪ B|. Two empty sets score 0.
double jaccardSimilarity(const TokenSet& a, const TokenSet& b);

/// Cosine similarity in [-1, 1]. Returns 0 (never NaN) for empty vectors,
/// zero-magnitude vectors, or vectors of different dimension.
double cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

} // namespace weave
