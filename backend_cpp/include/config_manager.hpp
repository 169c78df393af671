#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "legal_types.hpp"

namespace merlt {

struct RouterSettings {
    int max_retries = 3;
    double min_intent_confidence = 0.5;
    std::map<std::string, std::vector<ExpertId>> required_experts_by_intent;
};

struct ExpertSettings {
    int timeout_ms = 5000;
    int max_tool_rounds = 5;
    int top_k = 8;
    int max_hops = 2;
    size_t max_evidence_chars = 24000;
    size_t worker_threads = 8;
};

struct SynthesizerSettings {
    double agreement_threshold = 0.7;
};

struct GatingSettings {
    size_t input_dim = 1024;
    double learning_rate = 0.05;
    double gradient_clip = 1.0;
    GatingWeights priors = {0.35, 0.25, 0.20, 0.20};
};

struct TraversalSettings {
    double learning_rate = 0.1;
    double max_logit = 6.0;
    double default_weight = 0.5;
    // expert -> relation -> initial weight in (0,1)
    std::map<ExpertId, std::map<std::string, double>> defaults;
};

struct AuthoritySettings {
    double role_weight = 0.3;
    double accuracy_weight = 0.3;
    double consensus_weight = 0.2;
    double reputation_weight = 0.2;
    double default_role_score = 0.3;
    std::map<std::string, double> roles;
    int cache_ttl_seconds = 300;
    size_t cache_size = 4096;
};

struct FeedbackSettings {
    int rollout_threshold = 10;
    double min_authority = 0.0;
    double label_smoothing = 0.05;
};

struct OrchestratorSettings {
    int max_iterations_cap = 3;
    size_t trace_capacity = 256;
};

struct LlmSettings {
    std::string base_url = "https://openrouter.ai/api/v1";
    std::string embedding_model = "text-embedding-3-large";
    int request_timeout_ms = 30000;
    int max_retries = 4;
    double temperature = 0.1;
};

struct OrchestratorConfig {
    RouterSettings router;
    ExpertSettings experts;
    SynthesizerSettings synthesizer;
    GatingSettings gating;
    TraversalSettings traversal;
    AuthoritySettings authority;
    FeedbackSettings feedback;
    OrchestratorSettings orchestrator;
    LlmSettings llm;
    std::string log_level = "info";
    std::string weights_dir = "weights";
    std::string rollout_endpoint;
    std::string listen_address = "127.0.0.1:50051";
    std::string users_path = "users.json";
    std::string index_dir = "index";

    // Built-in defaults, including the per-expert relation preferences and intent rules.
    static OrchestratorConfig defaults();
    // Missing keys fall back to defaults(); malformed values throw nlohmann::json::exception.
    static OrchestratorConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

// Owns the live configuration. Readers take an immutable snapshot; reload() swaps it.
class ConfigManager {
public:
    explicit ConfigManager(std::string explicit_path = "");

    std::shared_ptr<const OrchestratorConfig> snapshot() const;

    // Re-reads the file. On failure the previous snapshot stays live and false is returned.
    bool reload();

    void replace(const OrchestratorConfig& config);
    const std::string& source_path() const { return source_path_; }

private:
    std::string resolve_path() const;

    std::string explicit_path_;
    std::string source_path_;
    std::shared_ptr<const OrchestratorConfig> current_;
    mutable std::shared_mutex mutex_;
};

} // namespace merlt
