#include "faiss_vector_store.hpp"
#include <faiss/IndexHNSW.h>
#include <faiss/index_io.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unordered_set>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace merlt {

namespace {
std::unique_ptr<faiss::Index> make_hnsw(int dimension) {
    auto idx = std::make_unique<faiss::IndexHNSWFlat>(dimension, 32, faiss::METRIC_INNER_PRODUCT);
    idx->hnsw.efConstruction = 40;
    idx->hnsw.efSearch = 32;
    return idx;
}

bool passes(const LegalNode& node, const std::map<std::string, std::string>& filters) {
    for (const auto& [key, value] : filters) {
        if (key == "source_type" && node.source_type != value) return false;
        if (key == "urn_prefix" && node.urn.rfind(value, 0) != 0) return false;
    }
    return true;
}
}

FaissKnowledgeStore::FaissKnowledgeStore(int dimension, std::shared_ptr<EmbeddingClient> embedder)
    : dimension_(dimension), embedder_(std::move(embedder)), index_(make_hnsw(dimension)) {
    if (!embedder_) throw std::invalid_argument("FaissKnowledgeStore requires an embedding client");
}

FaissKnowledgeStore::~FaissKnowledgeStore() {
}

void FaissKnowledgeStore::add_nodes(const std::vector<std::shared_ptr<LegalNode>>& nodes) {
    if (nodes.empty()) return;

    std::vector<float> vectors_flat;
    std::vector<std::shared_ptr<LegalNode>> indexed;

    std::lock_guard<std::mutex> lock(index_mutex_);
    for (const auto& node : nodes) {
        graph_.add_node(node);
        if (static_cast<int>(node->embedding.size()) != dimension_) {
            if (!node->embedding.empty()) {
                spdlog::warn("⚠️ Node {} has a {}-d embedding, expected {}; graph only",
                             node->id, node->embedding.size(), dimension_);
            }
            continue;
        }
        auto row = row_of_.find(node->id);
        if (row != row_of_.end()) {
            id_to_node_[row->second] = node;
            spdlog::debug("Node {} already indexed at row {}, vector kept", node->id, row->second);
            continue;
        }
        row_of_[node->id] = id_to_node_.size() + indexed.size();
        vectors_flat.insert(vectors_flat.end(), node->embedding.begin(), node->embedding.end());
        indexed.push_back(node);
    }

    if (vectors_flat.empty()) return;

    long num_to_add = static_cast<long>(indexed.size());
    faiss::fvec_renorm_L2(dimension_, num_to_add, vectors_flat.data());
    index_->add(num_to_add, vectors_flat.data());
    id_to_node_.insert(id_to_node_.end(), indexed.begin(), indexed.end());

    spdlog::info("✅ Added {} legal chunks to FAISS. Total: {}", num_to_add, index_->ntotal);
}

long FaissKnowledgeStore::indexed_count() const {
    std::lock_guard<std::mutex> lock(index_mutex_);
    return static_cast<long>(index_->ntotal);
}

std::vector<RankedChunk> FaissKnowledgeStore::search(const std::string& query,
                                                     const std::map<std::string, std::string>& filters,
                                                     int top_k) {
    if (top_k <= 0) return {};
    auto query_vector = embedder_->embed(query);
    if (static_cast<int>(query_vector.size()) != dimension_) {
        throw std::runtime_error("query embedding has " + std::to_string(query_vector.size()) +
                                 " dimensions, index expects " + std::to_string(dimension_));
    }
    faiss::fvec_renorm_L2(dimension_, 1, query_vector.data());

    std::lock_guard<std::mutex> lock(index_mutex_);
    if (index_->ntotal == 0) return {};

    // Over-fetch so that filtering still leaves top_k candidates.
    int k = static_cast<int>(std::min<long>(index_->ntotal, filters.empty() ? top_k : top_k * 4L));
    std::vector<float> scores(k);
    std::vector<faiss::idx_t> indices(k);
    index_->search(1, query_vector.data(), k, scores.data(), indices.data());

    std::vector<RankedChunk> results;
    for (int i = 0; i < k && static_cast<int>(results.size()) < top_k; ++i) {
        if (indices[i] < 0 || indices[i] >= static_cast<faiss::idx_t>(id_to_node_.size())) continue;
        const auto& node = id_to_node_[indices[i]];
        if (!passes(*node, filters)) continue;
        results.push_back({node->id, node->urn, node->text, node->source_type,
                           std::clamp(static_cast<double>(scores[i]), 0.0, 1.0)});
    }
    return results;
}

std::vector<RelatedNode> FaissKnowledgeStore::traverse(const std::string& start_node,
                                                       const std::vector<std::string>& relation_types,
                                                       const std::map<std::string, double>& weights,
                                                       int max_hops) {
    return graph_.expand(start_node, relation_types, weights, max_hops);
}

void FaissKnowledgeStore::save(const std::string& path) const {
    fs::path dir(path);
    fs::create_directories(dir);

    std::lock_guard<std::mutex> lock(index_mutex_);
    faiss::write_index(index_.get(), (dir / "faiss.index").string().c_str());

    // Indexed nodes first so that their position matches the FAISS row id.
    json metadata = json::array();
    std::unordered_set<std::string> written;
    for (const auto& node : id_to_node_) {
        metadata.push_back(node->to_json());
        written.insert(node->id);
    }
    for (const auto& node : graph_.all_nodes()) {
        if (written.count(node->id)) continue;
        auto j = node->to_json();
        j["graph_only"] = true;
        metadata.push_back(j);
    }

    std::ofstream meta_file(dir / "metadata.json");
    if (!meta_file.is_open()) throw std::runtime_error("cannot write " + (dir / "metadata.json").string());
    meta_file << metadata.dump(2);
}

void FaissKnowledgeStore::load(const std::string& path) {
    fs::path dir(path);

    std::ifstream meta_file(dir / "metadata.json");
    if (!meta_file.is_open()) throw std::runtime_error("missing " + (dir / "metadata.json").string());
    json metadata = json::parse(meta_file);

    std::unique_ptr<faiss::Index> loaded(faiss::read_index((dir / "faiss.index").string().c_str()));
    if (loaded->d != dimension_) {
        throw std::runtime_error("index dimension " + std::to_string(loaded->d) +
                                 " does not match configured " + std::to_string(dimension_));
    }

    std::lock_guard<std::mutex> lock(index_mutex_);
    index_ = std::move(loaded);
    id_to_node_.clear();
    row_of_.clear();
    graph_.clear();

    for (const auto& j_node : metadata) {
        auto node = std::make_shared<LegalNode>(LegalNode::from_json(j_node));
        graph_.add_node(node);
        if (j_node.value("graph_only", false)) continue;
        row_of_[node->id] = id_to_node_.size();
        id_to_node_.push_back(node);
    }
    spdlog::info("✅ Loaded FAISS index with {} chunks ({} graph nodes) from {}",
                 index_->ntotal, graph_.size(), path);
}

} // namespace merlt
