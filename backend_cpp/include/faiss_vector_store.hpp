#pragma once

#include "legal_graph.hpp"
#include "collaborators.hpp"
#include <string>
#include <unordered_map>
#include <vector>
#include <memory>
#include <mutex>
#include <faiss/utils/distances.h>

// Forward declare FAISS Index
namespace faiss { struct Index; }

namespace merlt {

// In-process KnowledgeStore: HNSW over chunk embeddings plus the typed relation graph.
class FaissKnowledgeStore : public KnowledgeStore {
public:
    FaissKnowledgeStore(int dimension, std::shared_ptr<EmbeddingClient> embedder);
    ~FaissKnowledgeStore() override;

    // Nodes whose id is already indexed refresh the graph and the search hit
    // but keep their FAISS row.
    void add_nodes(const std::vector<std::shared_ptr<LegalNode>>& nodes);

    long indexed_count() const;

    // Filters: "source_type" (exact) and "urn_prefix".
    std::vector<RankedChunk> search(const std::string& query,
                                    const std::map<std::string, std::string>& filters,
                                    int top_k) override;

    std::vector<RelatedNode> traverse(const std::string& start_node,
                                      const std::vector<std::string>& relation_types,
                                      const std::map<std::string, double>& weights,
                                      int max_hops) override;

    void save(const std::string& path) const;
    void load(const std::string& path);

    const LegalGraph& graph() const { return graph_; }

private:
    int dimension_;
    std::shared_ptr<EmbeddingClient> embedder_;
    std::unique_ptr<faiss::Index> index_;
    std::vector<std::shared_ptr<LegalNode>> id_to_node_;
    std::unordered_map<std::string, size_t> row_of_;
    LegalGraph graph_;
    mutable std::mutex index_mutex_;
};

} // namespace merlt
