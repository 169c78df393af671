#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "agent/ExpertPool.hpp"
#include "feedback_processor.hpp"
#include "gating_network.hpp"
#include "LogManager.hpp"
#include "plan_router.hpp"
#include "synthesizer.hpp"

namespace merlt {

// Progress phases streamed to the caller: PLAN, EXPERTS, SYNTHESIS, FINAL.
using ProgressCallback = std::function<void(const std::string& phase, const nlohmann::json& payload)>;

class Orchestrator {
public:
    struct Components {
        std::shared_ptr<PlanRouter> router;
        std::shared_ptr<GatingNetwork> gating;
        std::shared_ptr<ExpertPool> experts;
        std::shared_ptr<Synthesizer> synthesizer;
        std::shared_ptr<FeedbackProcessor> feedback;
        std::shared_ptr<EmbeddingClient> embedder;
        std::shared_ptr<LogManager> traces;
    };

    Orchestrator(Components components, const OrchestratorSettings& settings);

    // Throws PlanGenerationFailed, MaxRetriesExceeded or InsufficientEvidence.
    SynthesizedAnswer handle_query(const QueryContext& query,
                                   const EnrichedContext& enriched,
                                   const ProgressCallback& progress = nullptr,
                                   std::shared_ptr<const CancellationToken> cancel = nullptr);

    FeedbackOutcome handle_feedback(const FeedbackRecord& record);

    const Components& components() const { return c_; }

    std::string new_trace_id();

    // Summary of a weak answer, handed to the router and the experts on the next iteration.
    static std::string refinement_notes(const SynthesizedAnswer& answer, double min_confidence);

private:
    Components c_;
    OrchestratorSettings settings_;
    std::atomic<uint64_t> trace_seq_{0};

    std::vector<float> embed_query(const QueryContext& query) const;
};

} // namespace merlt
