#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "authority_scorer.hpp"
#include "collaborators.hpp"
#include "config_manager.hpp"
#include "gating_network.hpp"
#include "LogManager.hpp"
#include "traversal_weights.hpp"

namespace merlt {

// Turns expert feedback into authority-weighted updates of the gate and the
// traversal weights. Records are applied one at a time; query handling keeps
// reading the published snapshots meanwhile.
class FeedbackProcessor {
public:
    struct Dependencies {
        std::shared_ptr<GatingNetwork> gating;
        std::shared_ptr<TraversalWeightStore> traversal;
        std::shared_ptr<AuthorityScorer> authority;
        std::shared_ptr<IdempotenceStore> idempotence;
        std::shared_ptr<FeedbackArchive> archive;       // optional
        std::shared_ptr<RolloutController> rollout;     // optional
        std::shared_ptr<LogManager> traces;             // optional, source of query embeddings
    };

    FeedbackProcessor(Dependencies deps, const FeedbackSettings& settings, const TraversalSettings& traversal);

    FeedbackOutcome ingest(const FeedbackRecord& record);

    // Correct experts 1, incorrect 0, unflagged keep `current`; then label smoothing.
    static GatingWeights build_target(const GatingWeights& current,
                                      const std::map<ExpertId, bool>& correctness,
                                      double smoothing);

    // Applied records counted towards the next candidate of a weight set.
    int pending(const std::string& weight_set) const;

    static std::string traversal_set(ExpertId id) { return "traversal." + to_string(id); }
    inline static const std::string kGatingSet = "gating";

private:
    Dependencies deps_;
    FeedbackSettings settings_;
    double traversal_lr_;
    std::map<std::string, int> counters_;
    mutable std::mutex writer_mutex_;

    bool apply_gating(const FeedbackRecord& record, double authority, FeedbackOutcome& out);
    void apply_traversal(const FeedbackRecord& record, double authority, FeedbackOutcome& out);
    void count_towards_rollout(const std::string& weight_set, uint64_t version, FeedbackOutcome& out);
};

} // namespace merlt
