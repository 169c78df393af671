#pragma once
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include "agent/ReasoningExpert.hpp"
#include "ThreadPool.hpp"

namespace merlt {

// Runs the experts a plan selects in parallel, each against its own deadline.
// Always returns one opinion per selected expert: late, failing or cancelled
// experts contribute a degraded opinion with confidence 0.
class ExpertPool {
public:
    ExpertPool(std::vector<std::shared_ptr<ReasoningExpert>> experts, const ExpertSettings& settings);

    std::vector<ExpertOpinion> run(const ExecutionPlan& plan,
                                   const QueryContext& query,
                                   const EnrichedContext& enriched,
                                   std::shared_ptr<const CancellationToken> request_cancel = nullptr,
                                   const std::string& refinement = "");

    bool has(ExpertId id) const { return experts_.count(id) > 0; }

    // Number of thread lanes currently alive. Grows when overrunning experts
    // from earlier requests still hold workers.
    size_t lane_count() const;

private:
    // A ThreadPool plus the number of its workers reserved by running requests.
    struct Lane {
        std::unique_ptr<ThreadPool> pool;
        size_t threads = 0;
        std::shared_ptr<std::atomic<size_t>> reserved;
    };

    Lane* reserve_lane(size_t jobs);

    std::map<ExpertId, std::shared_ptr<ReasoningExpert>> experts_;
    ExpertSettings settings_;
    std::vector<std::unique_ptr<Lane>> lanes_;
    mutable std::mutex lanes_mtx_;
};

} // namespace merlt
