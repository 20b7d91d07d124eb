#include "synapse/synaptic_linker.hpp"
#include "log/log.hpp"
#include "similarity/similarity.hpp"
#include "similarity/tokenizer.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>

namespace weave {

SynapticLinker::SynapticLinker(LinkerConfig config,
                               std::shared_ptr<EmbeddingProvider> embeddings)
    : config_(config), embeddings_(std::move(embeddings)) {}

std::vector<Edge> SynapticLinker::linkRetroactively(const Node& new_node,
                                                    SynapticGraph& graph) const {
    TokenSet new_tokens = tokenize(new_node.text());
    if (new_tokens.empty()) return {};

    std::vector<Node> existing = graph.allNodes();

    std::vector<Candidate> candidates;
    for (const Node& node : existing) {
        if (node.id == new_node.id) continue;
        double score = jaccardSimilarity(new_tokens, tokenize(node.text()));
        if (score >= config_.threshold) {
            candidates.push_back({&node, score});
        }
    }

    return wire(new_node, std::move(candidates), "keyword", graph);
}

std::vector<Edge> SynapticLinker::linkRetroactivelyEmbedding(const Node& new_node,
                                                             SynapticGraph& graph) const {
    if (!embeddings_) {
        log::get()->info("No embedding provider configured, falling back to keyword linking");
        return linkRetroactively(new_node, graph);
    }

    std::string new_text = new_node.text();
    if (new_text.empty()) return {};

    std::vector<Node> existing = graph.allNodes();
    existing.erase(std::remove_if(existing.begin(), existing.end(),
                                  [&](const Node& n) { return n.id == new_node.id; }),
                   existing.end());
    if (existing.empty()) return {};

    std::vector<std::string> texts;
    texts.reserve(existing.size() + 1);
    texts.push_back(std::move(new_text));
    for (const Node& node : existing) texts.push_back(node.text());

    std::vector<std::vector<float>> vectors = embedAll(*embeddings_, texts);
    const std::vector<float>& new_vec = vectors[0];

    std::vector<Candidate> candidates;
    for (size_t i = 0; i < existing.size(); i++) {
        double score = cosineSimilarity(new_vec, vectors[i + 1]);
        if (score >= config_.threshold) {
            candidates.push_back({&existing[i], score});
        }
    }

    return wire(new_node, std::move(candidates), "embedding", graph);
}

size_t SynapticLinker::workerCount(size_t jobs) const {
    size_t workers = config_.embed_workers;
    if (workers == 0) {
        workers = std::thread::hardware_concurrency();
        if (workers == 0) workers = 4;
    }
    return std::max<size_t>(1, std::min(workers, jobs));
}

// Every text is embedded exactly once by a fixed set of workers pulling
// indices from a shared counter. All workers are joined before the first
// provider failure is rethrown.
std::vector<std::vector<float>> SynapticLinker::embedAll(
    EmbeddingProvider& provider, const std::vector<std::string>& texts) const {

    std::vector<std::vector<float>> vectors(texts.size());
    std::atomic<size_t> next{0};
    std::atomic<bool> failed{false};
    std::exception_ptr first_error;
    std::mutex error_mutex;

    auto worker = [&]() {
        while (!failed.load()) {
            size_t idx = next.fetch_add(1);
            if (idx >= texts.size()) break;
            try {
                vectors[idx] = provider.embed(texts[idx]);
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) first_error = std::current_exception();
                failed = true;
            }
        }
    };

    size_t wanted = workerCount(texts.size());
    std::vector<std::thread> threads;
    threads.reserve(wanted);
    for (size_t i = 0; i < wanted; i++) {
        try {
            threads.emplace_back(worker);
        } catch (const std::system_error& e) {
            log::get()->warn("Embedding pool started {} of {} worker(s): {}",
                             threads.size(), wanted, e.what());
            break;
        }
    }

    // No thread could be started: embed on the calling thread.
    if (threads.empty()) worker();
    for (auto& t : threads) t.join();

    if (first_error) std::rethrow_exception(first_error);
    return vectors;
}

std::vector<Edge> SynapticLinker::wire(const Node& new_node, std::vector<Candidate> candidates,
                                       const char* mode, SynapticGraph& graph) const {
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) { return a.score > b.score; });
    if (candidates.size() > config_.max_connections) {
        candidates.resize(config_.max_connections);
    }

    std::vector<Edge> created;
    created.reserve(candidates.size());
    for (const Candidate& c : candidates) {
        Metadata meta = {{"synapse", true}, {"similarity", c.score}, {"mode", mode}};
        Edge edge = makeEdge(new_node.id, c.node->id, EdgeType::Relates, c.score, std::move(meta));
        created.push_back(graph.addEdge(std::move(edge)));
    }

    if (!created.empty()) {
        log::get()->debug("Synaptic linking ({}) created {} edge(s) from node {}",
                          mode, created.size(), new_node.id);
    }
    return created;
}

} // namespace weave
