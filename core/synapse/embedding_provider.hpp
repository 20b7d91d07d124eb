#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace weave {

/// External text-embedding capability (a local model, a remote API, ...).
/// embed() may be called concurrently from several threads; it may block
/// and may throw. Errors propagate to the caller of the linker.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual std::vector<float> embed(const std::string& text) = 0;
};

/// Memoizes another provider by exact text. Thread-safe.
class CachingEmbeddingProvider : public EmbeddingProvider {
public:
    explicit CachingEmbeddingProvider(std::shared_ptr<EmbeddingProvider> inner);

    std::vector<float> embed(const std::string& text) override;

    size_t cacheSize() const;
    void clearCache();

private:
    std::shared_ptr<EmbeddingProvider> inner_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<float>> cache_;
};

} // namespace weave
