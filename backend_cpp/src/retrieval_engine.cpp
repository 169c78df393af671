#include "retrieval_engine.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "SystemMonitor.hpp"

namespace merlt {

using json = nlohmann::json;

namespace {
// Cuts at a character boundary so the excerpt stays valid UTF-8.
std::string utf8_prefix(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut) + "...";
}
}

json WeightedEvidence::to_json(size_t max_text_chars) const {
    return json{
        {"id", id},
        {"urn", urn},
        {"source_type", source_type},
        {"relation", relation},
        {"hops", hops},
        {"score", score},
        {"text", utf8_prefix(text, max_text_chars)}
    };
}

CitedSource WeightedEvidence::to_source() const {
    CitedSource src;
    src.source_id = urn.empty() ? id : urn;
    src.relation = relation;
    src.score = score;
    src.excerpt = utf8_prefix(text, 280);
    return src;
}

RetrievalEngine::RetrievalEngine(std::shared_ptr<KnowledgeStore> store, std::shared_ptr<TraversalWeightStore> weights)
    : store_(std::move(store)), weights_(std::move(weights)) {
    if (!store_ || !weights_) throw std::invalid_argument("RetrievalEngine requires a store and traversal weights");
}

void RetrievalEngine::rank(std::vector<WeightedEvidence>& items, int top_k) {
    std::stable_sort(items.begin(), items.end(), [](const auto& a, const auto& b) {
        return a.score > b.score;
    });
    if (top_k >= 0 && items.size() > static_cast<size_t>(top_k)) {
        items.resize(top_k);
    }
}

std::vector<WeightedEvidence> RetrievalEngine::search(ExpertId expert,
                                                      const std::string& query,
                                                      const std::map<std::string, std::string>& filters,
                                                      int top_k) {
    auto start = std::chrono::high_resolution_clock::now();

    auto snap = weights_->snapshot(expert);
    double w = snap->weight(kSemanticRelation);

    std::vector<WeightedEvidence> out;
    for (auto& chunk : store_->search(query, filters, top_k)) {
        WeightedEvidence e;
        e.id = std::move(chunk.id);
        e.urn = std::move(chunk.urn);
        e.text = std::move(chunk.text);
        e.source_type = std::move(chunk.source_type);
        e.relation = kSemanticRelation;
        e.raw_score = chunk.score;
        e.relation_weight = w;
        e.score = chunk.score * w;
        out.push_back(std::move(e));
    }
    rank(out, top_k);

    auto end = std::chrono::high_resolution_clock::now();
    SystemMonitor::global_retrieval_latency_ms.store(std::chrono::duration<double, std::milli>(end - start).count());
    return out;
}

std::vector<WeightedEvidence> RetrievalEngine::traverse(ExpertId expert,
                                                        const std::string& start_node,
                                                        std::vector<std::string> relation_types,
                                                        int max_hops,
                                                        int top_k) {
    auto start = std::chrono::high_resolution_clock::now();

    auto snap = weights_->snapshot(expert);
    if (relation_types.empty()) {
        for (const auto& [rel, _] : snap->logits) {
            if (rel != kSemanticRelation) relation_types.push_back(rel);
        }
    }

    std::map<std::string, double> preference;
    for (const auto& rel : relation_types) preference[rel] = snap->weight(rel);

    std::vector<WeightedEvidence> out;
    for (auto& node : store_->traverse(start_node, relation_types, preference, max_hops)) {
        WeightedEvidence e;
        e.id = std::move(node.id);
        e.urn = std::move(node.urn);
        e.text = std::move(node.text);
        e.source_type = "graph";
        e.relation = node.relation;
        e.hops = node.hops;
        e.raw_score = node.score;
        e.relation_weight = snap->weight(node.relation);
        e.score = node.score * e.relation_weight;
        out.push_back(std::move(e));
    }
    rank(out, top_k);

    auto end = std::chrono::high_resolution_clock::now();
    double duration = std::chrono::duration<double, std::milli>(end - start).count();
    SystemMonitor::global_retrieval_latency_ms.store(duration);
    spdlog::debug("[{}] traversal from {} -> {} nodes in {:.2f} ms", to_string(expert), start_node, out.size(), duration);
    return out;
}

} // namespace merlt
