#include "synapse/embedding_provider.hpp"
#include "graph/errors.hpp"

namespace weave {

CachingEmbeddingProvider::CachingEmbeddingProvider(std::shared_ptr<EmbeddingProvider> inner)
    : inner_(std::move(inner)) {
    if (!inner_) {
        throw WeaveError("CachingEmbeddingProvider requires an inner provider");
    }
}

std::vector<float> CachingEmbeddingProvider::embed(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(text);
        if (it != cache_.end()) return it->second;
    }

    // Computed outside the lock; two racing callers may both embed the same
    // text, the second insert is then a no-op.
    std::vector<float> vec = inner_->embed(text);

    std::lock_guard<std::mutex> lock(mutex_);
    cache_.emplace(text, vec);
    return vec;
}

size_t CachingEmbeddingProvider::cacheSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

void CachingEmbeddingProvider::clearCache() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

} // namespace weave
