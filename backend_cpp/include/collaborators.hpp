#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "legal_types.hpp"

namespace merlt {

// Interfaces of the services the orchestrator consumes but does not own.

struct RankedChunk {
    std::string id;
    std::string urn;
    std::string text;
    std::string source_type;   // "norma", "sentenza", "dottrina", ...
    double score = 0.0;
};

struct RelatedNode {
    std::string id;
    std::string urn;
    std::string text;
    std::string relation;      // relation type of the last traversed edge
    int hops = 1;
    double score = 0.0;        // structural score (hop decay), before relation weighting
};

class KnowledgeStore {
public:
    virtual ~KnowledgeStore() = default;

    virtual std::vector<RankedChunk> search(const std::string& query,
                                            const std::map<std::string, std::string>& filters,
                                            int top_k) = 0;

    // weights: relation type -> preference, used to order the expansion frontier.
    // Relation types outside `relation_types` are not followed.
    virtual std::vector<RelatedNode> traverse(const std::string& start_node,
                                              const std::vector<std::string>& relation_types,
                                              const std::map<std::string, double>& weights,
                                              int max_hops) = 0;
};

class LanguageModelClient {
public:
    virtual ~LanguageModelClient() = default;

    // Returns a JSON value conforming (as far as the model managed) to `schema`.
    // Throws LanguageModelError once every provider and fallback model failed.
    virtual nlohmann::json generate_structured(const std::string& prompt, const nlohmann::json& schema) = 0;
};

class EmbeddingClient {
public:
    virtual ~EmbeddingClient() = default;
    virtual std::vector<float> embed(const std::string& text) = 0;
};

struct UserHistory {
    double accuracy = 0.5;      // historical accuracy of the user's feedback [0,1]
    double consensus = 0.5;     // agreement with the community on shared items [0,1]
    double reputation = 0.5;    // peer-rated helpfulness [0,1]
    int feedback_count = 0;
};

struct UserProfile {
    std::string user_id;
    std::string role;
    UserHistory history;
};

class UserStore {
public:
    virtual ~UserStore() = default;
    virtual std::optional<UserProfile> get_user_profile(const std::string& user_id) = 0;
};

class IdempotenceStore {
public:
    virtual ~IdempotenceStore() = default;
    virtual bool has_processed(const std::string& feedback_id) = 0;
    virtual void mark_processed(const std::string& feedback_id) = 0;
};

class RolloutController {
public:
    virtual ~RolloutController() = default;
    virtual void candidate_ready(const std::string& weight_set_id) = 0;
};

class FeedbackArchive {
public:
    virtual ~FeedbackArchive() = default;
    virtual void archive(const FeedbackRecord& record, double authority) = 0;
};

} // namespace merlt
