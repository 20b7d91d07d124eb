#pragma once

#include "graph/graph_view.hpp"
#include "synapse/embedding_provider.hpp"

#include <memory>
#include <string>
#include <vector>

namespace weave {

struct LinkerConfig {
    double threshold = 0.72;     // minimum similarity for a retroactive edge
    size_t max_connections = 20; // edges created per new node, at most
    size_t embed_workers = 0;    // concurrent embed() calls; 0: hardware_concurrency()
};

// ─── Synaptic Linker ──────────────────────────────────────────
// When a node enters the graph, compare it against every other node,
// however old, and wire RELATES edges new → historical to the most
// similar ones. Edges carry metadata {synapse: true, similarity, mode}
// so they can be told apart from hand-made edges.
//
// Two scoring modes:
// - keyword:   Jaccard over tokenize(label + " " + description)
// - embedding: cosine over vectors from an EmbeddingProvider; without a
//              provider this silently becomes the keyword mode.

class SynapticLinker {
public:
    explicit SynapticLinker(LinkerConfig config = {},
                            std::shared_ptr<EmbeddingProvider> embeddings = nullptr);

    /// Keyword linking. `new_node` must already be in `graph`.
    /// Returns the created edges, best match first.
    std::vector<Edge> linkRetroactively(const Node& new_node, SynapticGraph& graph) const;

    /// Embedding linking. One embed() per node, run on at most
    /// `embed_workers` threads and awaited as a batch before scoring.
    /// Provider exceptions propagate.
    std::vector<Edge> linkRetroactivelyEmbedding(const Node& new_node, SynapticGraph& graph) const;

    const LinkerConfig& config() const { return config_; }
    bool hasEmbeddingProvider() const { return embeddings_ != nullptr; }

private:
    struct Candidate {
        const Node* node;
        double score;
    };

    size_t workerCount(size_t jobs) const;
    std::vector<std::vector<float>> embedAll(EmbeddingProvider& provider,
                                             const std::vector<std::string>& texts) const;

    std::vector<Edge> wire(const Node& new_node, std::vector<Candidate> candidates,
                           const char* mode, SynapticGraph& graph) const;

    LinkerConfig config_;
    std::shared_ptr<EmbeddingProvider> embeddings_;
};

} // namespace weave
