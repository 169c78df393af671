#pragma once
#include "collaborators.hpp"
#include "traversal_weights.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace merlt {

// One retrieved item as an expert sees it: the store's raw score scaled by the
// expert's learned weight for the relation that produced it.
struct WeightedEvidence {
    std::string id;
    std::string urn;
    std::string text;
    std::string source_type;
    std::string relation;
    int hops = 0;
    double raw_score = 0.0;
    double relation_weight = 1.0;
    double score = 0.0;

    nlohmann::json to_json(size_t max_text_chars = 1200) const;
    CitedSource to_source() const;
};

class RetrievalEngine {
public:
    inline static const std::string kSemanticRelation = "semantic";

    RetrievalEngine(std::shared_ptr<KnowledgeStore> store, std::shared_ptr<TraversalWeightStore> weights);

    std::vector<WeightedEvidence> search(ExpertId expert,
                                         const std::string& query,
                                         const std::map<std::string, std::string>& filters,
                                         int top_k);

    // Empty relation_types means the relations the expert has weights for.
    std::vector<WeightedEvidence> traverse(ExpertId expert,
                                           const std::string& start_node,
                                           std::vector<std::string> relation_types,
                                           int max_hops,
                                           int top_k);

private:
    std::shared_ptr<KnowledgeStore> store_;
    std::shared_ptr<TraversalWeightStore> weights_;

    static void rank(std::vector<WeightedEvidence>& items, int top_k);
};

} // namespace merlt
