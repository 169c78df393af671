#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "collaborators.hpp"
#include "orchestrator_errors.hpp"

namespace merlt::fakes {

using json = nlohmann::json;

inline bool is_plan_request(const json& schema) {
    return schema.contains("properties") && schema["properties"].contains("experts");
}
inline bool is_action_request(const json& schema) {
    return schema.contains("properties") && schema["properties"].contains("action");
}
inline bool is_opinion_request(const json& schema) {
    return schema.contains("properties") && schema["properties"].contains("interpretation");
}

// Which expert a prompt addresses, from the ROLE line of the expert prompts.
inline std::string addressed_expert(const std::string& prompt) {
    if (prompt.find("Literal Interpretation Expert") != std::string::npos) return "literal";
    if (prompt.find("Systemic-Teleological Expert") != std::string::npos) return "systemic";
    if (prompt.find("Principles Balancing Expert") != std::string::npos) return "principles";
    if (prompt.find("Jurisprudential Precedent Expert") != std::string::npos) return "precedent";
    return "";
}

inline json plan_json(const std::vector<std::string>& experts,
                      bool kg = true, bool api = false, bool vectordb = true,
                      int max_iterations = 1, double min_confidence = 0.0) {
    return {
        {"retrieval_agents", {{"kg_agent", kg}, {"api_agent", api}, {"vectordb_agent", vectordb}}},
        {"experts", experts},
        {"iteration", {{"max_iterations", max_iterations}, {"min_confidence", min_confidence}}},
        {"rationale", "test plan"}
    };
}

inline json opinion_json(const std::string& interpretation, double confidence, const std::string& conclusion = "") {
    return {
        {"interpretation", interpretation},
        {"rationale", {{"conclusion", conclusion.empty() ? interpretation : conclusion}}},
        {"confidence", confidence},
        {"limitations", json::array()}
    };
}

// Language model driven by a test-supplied handler. Records every prompt.
class ScriptedLanguageModel : public LanguageModelClient {
public:
    using Handler = std::function<json(const std::string& prompt, const json& schema)>;

    explicit ScriptedLanguageModel(Handler handler) : handler_(std::move(handler)) {}

    json generate_structured(const std::string& prompt, const json& schema) override {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            prompts_.push_back(prompt);
        }
        ++calls_;
        return handler_(prompt, schema);
    }

    int calls() const { return calls_.load(); }

    std::vector<std::string> prompts() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return prompts_;
    }

private:
    Handler handler_;
    std::atomic<int> calls_{0};
    std::vector<std::string> prompts_;
    mutable std::mutex mtx_;
};

class FakeEmbedder : public EmbeddingClient {
public:
    explicit FakeEmbedder(size_t dim) : dim_(dim) {}

    std::vector<float> embed(const std::string& text) override {
        if (fail) throw LanguageModelError("embedding endpoint down", 503);
        auto it = fixed.find(text);
        if (it != fixed.end()) return it->second;
        std::vector<float> v(dim_, 0.0f);
        v[text.size() % dim_] = 1.0f;
        return v;
    }

    bool fail = false;
    std::map<std::string, std::vector<float>> fixed;

private:
    size_t dim_;
};

// In-memory store: search returns the configured chunks that pass the filters,
// traverse returns the configured neighbours whose relation is allowed.
class FakeKnowledgeStore : public KnowledgeStore {
public:
    std::vector<RankedChunk> chunks;
    std::map<std::string, std::vector<RelatedNode>> neighbours;
    std::map<std::string, double> last_weights;
    std::vector<std::string> last_relations;

    std::vector<RankedChunk> search(const std::string& /*query*/,
                                    const std::map<std::string, std::string>& filters,
                                    int top_k) override {
        std::vector<RankedChunk> out;
        for (const auto& c : chunks) {
            auto st = filters.find("source_type");
            if (st != filters.end() && c.source_type != st->second) continue;
            auto prefix = filters.find("urn_prefix");
            if (prefix != filters.end() && c.urn.rfind(prefix->second, 0) != 0) continue;
            out.push_back(c);
            if (static_cast<int>(out.size()) >= top_k) break;
        }
        return out;
    }

    std::vector<RelatedNode> traverse(const std::string& start_node,
                                      const std::vector<std::string>& relation_types,
                                      const std::map<std::string, double>& weights,
                                      int max_hops) override {
        last_weights = weights;
        last_relations = relation_types;
        std::vector<RelatedNode> out;
        auto it = neighbours.find(start_node);
        if (it == neighbours.end()) return out;
        for (const auto& n : it->second) {
            if (n.hops > max_hops) continue;
            if (!relation_types.empty() &&
                std::find(relation_types.begin(), relation_types.end(), n.relation) == relation_types.end()) {
                continue;
            }
            out.push_back(n);
        }
        return out;
    }
};

class FakeUserStore : public UserStore {
public:
    std::map<std::string, UserProfile> users;
    std::atomic<int> lookups{0};
    bool fail = false;

    std::optional<UserProfile> get_user_profile(const std::string& user_id) override {
        ++lookups;
        if (fail) throw std::runtime_error("user db unavailable");
        auto it = users.find(user_id);
        if (it == users.end()) return std::nullopt;
        return it->second;
    }
};

class FakeRollout : public RolloutController {
public:
    std::vector<std::string> candidates;
    void candidate_ready(const std::string& weight_set_id) override { candidates.push_back(weight_set_id); }
};

class RecordingArchive : public FeedbackArchive {
public:
    std::vector<std::pair<std::string, double>> archived;
    bool fail = false;
    void archive(const FeedbackRecord& record, double authority) override {
        if (fail) throw std::runtime_error("archive disk full");
        archived.emplace_back(record.feedback_id, authority);
    }
};

// Idempotence store whose first `failures` writes throw.
class FlakyIdempotenceStore : public IdempotenceStore {
public:
    explicit FlakyIdempotenceStore(int failures) : failures_(failures) {}

    bool has_processed(const std::string& feedback_id) override { return processed.count(feedback_id) > 0; }
    void mark_processed(const std::string& feedback_id) override {
        if (failures_ > 0) {
            --failures_;
            throw std::runtime_error("db unavailable");
        }
        processed.insert(feedback_id);
    }

    std::set<std::string> processed;

private:
    int failures_;
};

} // namespace merlt::fakes
