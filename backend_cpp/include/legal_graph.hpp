#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <memory>
#include <shared_mutex>
#include <nlohmann/json.hpp>
#include "collaborators.hpp"

namespace merlt {

struct LegalRelation {
    std::string type;      // "definisce", "modifica", "cita", ...
    std::string target;    // id of the target node
};

// A chunk of the legal corpus: an article, a ruling, a doctrine passage.
struct LegalNode {
    std::string id;
    std::string urn;
    std::string title;
    std::string text;
    std::string source_type;   // "norma", "sentenza", "dottrina", "principio"
    std::vector<LegalRelation> relations;
    std::vector<float> embedding;

    nlohmann::json to_json() const;
    static LegalNode from_json(const nlohmann::json& j);
};

std::string sanitize_utf8(const std::string& str);

// Typed adjacency over legal nodes. Lookups are by id or by URN.
class LegalGraph {
public:
    void add_node(std::shared_ptr<LegalNode> node);
    void clear();

    std::shared_ptr<LegalNode> get(const std::string& id_or_urn) const;
    size_t size() const;
    std::vector<std::shared_ptr<LegalNode>> all_nodes() const;

    // Best-first expansion from `start`. Only relations listed in `relation_types`
    // are followed (all relations when the list is empty). The frontier is ordered
    // by path score times relation preference; the returned score is the structural
    // score exp(-alpha * hops), independent of `weights`.
    std::vector<RelatedNode> expand(const std::string& start,
                                    const std::vector<std::string>& relation_types,
                                    const std::map<std::string, double>& weights,
                                    int max_hops,
                                    size_t max_nodes = 64,
                                    double alpha = 0.5) const;

private:
    std::vector<std::shared_ptr<LegalNode>> nodes_;
    std::unordered_map<std::string, std::shared_ptr<LegalNode>> by_id_;
    std::unordered_map<std::string, std::shared_ptr<LegalNode>> by_urn_;
    mutable std::shared_mutex mutex_;
};

} // namespace merlt
