#include "legal_graph.hpp"
#include <algorithm>
#include <cmath>
#include <mutex>
#include <queue>
#include <set>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace merlt {

using json = nlohmann::json;

// Keeps well-formed UTF-8 sequences and replaces every other byte with '?',
// so json::dump never throws on corpus text.
std::string sanitize_utf8(const std::string& str) {
    std::string safe_str;
    safe_str.reserve(str.size());
    size_t i = 0;
    while (i < str.size()) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        if (c < 0x80) {
            safe_str += static_cast<char>(c);
            ++i;
            continue;
        }

        size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;   // allowed range of the second byte
        if (c >= 0xC2 && c <= 0xDF) len = 2;
        else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        }

        bool valid = len > 0 && i + len <= str.size();
        for (size_t k = 1; valid && k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(str[i + k]);
            if (k == 1 ? (cc < lo || cc > hi) : (cc < 0x80 || cc > 0xBF)) valid = false;
        }
        if (valid) {
            safe_str.append(str, i, len);
            i += len;
        } else {
            safe_str += '?';
            ++i;
        }
    }
    return safe_str;
}

json LegalNode::to_json() const {
    json rels = json::array();
    for (const auto& r : relations) rels.push_back({{"type", r.type}, {"target", r.target}});
    return json{
        {"id", sanitize_utf8(id)},
        {"urn", sanitize_utf8(urn)},
        {"title", sanitize_utf8(title)},
        {"text", sanitize_utf8(text)},
        {"source_type", sanitize_utf8(source_type)},
        {"relations", rels},
        {"embedding", embedding}
    };
}

LegalNode LegalNode::from_json(const json& j) {
    LegalNode node;
    auto safe_get = [&](const std::string& key) { return j.value(key, ""); };
    node.id = safe_get("id");
    node.urn = safe_get("urn");
    node.title = safe_get("title");
    node.text = safe_get("text");
    node.source_type = safe_get("source_type");
    if (j.contains("relations")) {
        for (const auto& r : j["relations"]) {
            node.relations.push_back({r.value("type", ""), r.value("target", "")});
        }
    }
    if (j.contains("embedding")) node.embedding = j["embedding"].get<std::vector<float>>();
    return node;
}

void LegalGraph::add_node(std::shared_ptr<LegalNode> node) {
    if (!node || node->id.empty()) return;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = by_id_.find(node->id);
    if (it != by_id_.end()) {
        std::replace(nodes_.begin(), nodes_.end(), it->second, node);
    } else {
        nodes_.push_back(node);
    }
    by_id_[node->id] = node;
    if (!node->urn.empty()) by_urn_[node->urn] = node;
}

void LegalGraph::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    nodes_.clear();
    by_id_.clear();
    by_urn_.clear();
}

std::shared_ptr<LegalNode> LegalGraph::get(const std::string& id_or_urn) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = by_id_.find(id_or_urn);
    if (it != by_id_.end()) return it->second;
    auto ut = by_urn_.find(id_or_urn);
    if (ut != by_urn_.end()) return ut->second;
    return nullptr;
}

size_t LegalGraph::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return nodes_.size();
}

std::vector<std::shared_ptr<LegalNode>> LegalGraph::all_nodes() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return nodes_;
}

std::vector<RelatedNode> LegalGraph::expand(const std::string& start,
                                            const std::vector<std::string>& relation_types,
                                            const std::map<std::string, double>& weights,
                                            int max_hops,
                                            size_t max_nodes,
                                            double alpha) const {
    auto origin = get(start);
    if (!origin || max_hops <= 0) return {};

    std::set<std::string> allowed(relation_types.begin(), relation_types.end());
    auto preference = [&](const std::string& rel) {
        auto it = weights.find(rel);
        return it != weights.end() ? it->second : 0.5;
    };

    struct Frontier {
        double priority;
        int hops;
        std::shared_ptr<LegalNode> node;
        bool operator<(const Frontier& o) const { return priority < o.priority; }
    };

    std::priority_queue<Frontier> queue;
    std::unordered_set<std::string> visited{origin->id};
    std::vector<RelatedNode> results;
    queue.push({1.0, 0, origin});

    std::shared_lock<std::shared_mutex> lock(mutex_);
    while (!queue.empty() && results.size() < max_nodes) {
        auto curr = queue.top();
        queue.pop();
        if (curr.hops >= max_hops) continue;

        for (const auto& rel : curr.node->relations) {
            if (!allowed.empty() && !allowed.count(rel.type)) continue;
            auto it = by_id_.find(rel.target);
            if (it == by_id_.end()) {
                auto ut = by_urn_.find(rel.target);
                if (ut == by_urn_.end()) continue;
                it = by_id_.find(ut->second->id);
                if (it == by_id_.end()) continue;
            }
            const auto& next = it->second;
            if (!visited.insert(next->id).second) continue;

            int hops = curr.hops + 1;
            RelatedNode rn;
            rn.id = next->id;
            rn.urn = next->urn;
            rn.text = next->text;
            rn.relation = rel.type;
            rn.hops = hops;
            rn.score = std::exp(-alpha * hops);
            results.push_back(std::move(rn));
            if (results.size() >= max_nodes) break;

            queue.push({curr.priority * preference(rel.type) * std::exp(-alpha), hops, next});
        }
    }

    spdlog::debug("Graph expansion from {}: {} nodes", start, results.size());
    return results;
}

} // namespace merlt
