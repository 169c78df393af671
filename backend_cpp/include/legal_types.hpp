#pragma once
#include <array>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace merlt {

// Order matters: it is the index order of GatingWeights and of the gate's output rows.
enum class ExpertId { Literal = 0, Systemic = 1, Principles = 2, Precedent = 3 };

constexpr size_t kExpertCount = 4;
constexpr std::array<ExpertId, kExpertCount> kAllExperts = {
    ExpertId::Literal, ExpertId::Systemic, ExpertId::Principles, ExpertId::Precedent};

std::string to_string(ExpertId id);
std::optional<ExpertId> expert_from_string(const std::string& name);
inline size_t index_of(ExpertId id) { return static_cast<size_t>(id); }

// Limitation flags with a fixed meaning for the synthesizer
inline const std::string kLimitTimedOut = "timed_out";
inline const std::string kLimitIncompleteEvidence = "incomplete_evidence";
inline const std::string kLimitExpertError = "expert_error";
inline const std::string kLimitCancelled = "cancelled";

struct Entity {
    std::string text;
    std::string label;
};

struct Intent {
    std::string name;
    double confidence = 0.0;
};

struct QueryContext {
    std::string trace_id;
    std::string query_text;
    std::vector<Entity> entities;
    std::vector<Intent> intents;
    double complexity = 0.0;
    std::string temporal_scope;

    nlohmann::json to_json() const;
    static QueryContext from_json(const nlohmann::json& j);
};

struct ConceptCandidate {
    std::string id;
    std::string label;
    double score = 0.0;
};

struct NormCandidate {
    std::string urn;
    std::string title;
    double score = 0.0;
};

struct EnrichedContext {
    std::vector<ConceptCandidate> concepts;
    std::vector<NormCandidate> norms;

    nlohmann::json to_json() const;
    static EnrichedContext from_json(const nlohmann::json& j);
};

struct ExecutionPlan {
    bool kg_agent = false;
    bool api_agent = false;
    bool vectordb_agent = false;
    std::vector<ExpertId> experts;
    int max_iterations = 1;
    double min_confidence = 0.0;
    std::string rationale;

    bool selects(ExpertId id) const;
    bool any_retrieval_agent() const { return kg_agent || api_agent || vectordb_agent; }

    nlohmann::json to_json() const;
    // Throws std::invalid_argument on unknown expert names or missing fields.
    static ExecutionPlan from_json(const nlohmann::json& j);
};

struct CitedSource {
    std::string source_id;
    std::string relation;
    double score = 0.0;
    std::string excerpt;
};

struct ExpertOpinion {
    ExpertId expert = ExpertId::Literal;
    std::string interpretation;
    nlohmann::json rationale = nlohmann::json::object();
    double confidence = 0.0;
    std::vector<CitedSource> sources;
    std::vector<std::string> limitations;
    int tool_rounds = 0;
    double elapsed_ms = 0.0;

    bool has_limitation(const std::string& flag) const;
    // False for timed-out, failed or cancelled opinions.
    bool usable() const;
    // Text compared between experts when measuring agreement.
    std::string conclusion() const;

    nlohmann::json to_json() const;

    static ExpertOpinion degraded(ExpertId expert, const std::string& flag, const std::string& detail);
};

using GatingWeights = std::array<double, kExpertCount>;

enum class SynthesisMode { Convergent, Divergent };
std::string to_string(SynthesisMode mode);

struct ExpertContribution {
    ExpertId expert = ExpertId::Literal;
    double gating_weight = 0.0;
    double normalized_weight = 0.0;
    double confidence = 0.0;
    double weighted_confidence = 0.0;
    bool included = false;
};

struct SynthesizedAnswer {
    std::string trace_id;
    std::string text;
    SynthesisMode mode = SynthesisMode::Convergent;
    std::vector<ExpertContribution> contributions;
    double confidence = 0.0;
    double min_agreement = 1.0;
    std::optional<ExpertId> favoured_expert;
    int iterations = 1;
    ExecutionPlan plan;
    std::vector<ExpertOpinion> opinions;

    nlohmann::json to_json() const;
};

struct FeedbackRecord {
    std::string feedback_id;
    std::string user_id;
    std::string trace_id;
    int rating = 0;
    std::map<ExpertId, bool> expert_correctness;
    std::map<ExpertId, std::map<std::string, bool>> relation_usefulness;
    std::vector<float> query_embedding;
    std::optional<double> authority_score;

    nlohmann::json to_json() const;
    static FeedbackRecord from_json(const nlohmann::json& j);
};

enum class FeedbackRejection { None, DuplicateFeedback, UnknownUser, InvalidRecord, StoreUnavailable };
std::string to_string(FeedbackRejection r);

struct FeedbackOutcome {
    bool accepted = false;
    FeedbackRejection rejection = FeedbackRejection::None;
    std::string reason;
    double authority = 0.0;
    bool gating_updated = false;
    int traversal_updates = 0;
    std::vector<std::string> candidates;

    static FeedbackOutcome rejected(FeedbackRejection r, std::string reason) {
        FeedbackOutcome o;
        o.rejection = r;
        o.reason = std::move(reason);
        return o;
    }
    nlohmann::json to_json() const;
};

} // namespace merlt
