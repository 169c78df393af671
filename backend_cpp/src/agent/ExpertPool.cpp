#include "agent/ExpertPool.hpp"
#include <algorithm>
#include <future>
#include <spdlog/spdlog.h>
#include "SystemMonitor.hpp"

namespace merlt {

namespace {

// Releases a lane slot when an expert job returns or throws.
struct SlotRelease {
    std::shared_ptr<std::atomic<size_t>> reserved;
    ~SlotRelease() { reserved->fetch_sub(1); }
};

}

ExpertPool::ExpertPool(std::vector<std::shared_ptr<ReasoningExpert>> experts, const ExpertSettings& settings)
    : settings_(settings) {
    for (auto& e : experts) {
        if (e) experts_[e->id()] = std::move(e);
    }
    reserve_lane(0);
    spdlog::info("🧵 Expert pool ready: {} experts, {} workers per lane", experts_.size(),
                 std::max(settings_.worker_threads, kExpertCount));
}

size_t ExpertPool::lane_count() const {
    std::lock_guard<std::mutex> lock(lanes_mtx_);
    return lanes_.size();
}

// Picks a lane with `jobs` idle workers so every expert of the request starts
// immediately. Experts that overran an earlier request keep their workers, so
// when no lane has room a new one is opened. Idle extra lanes are retired.
ExpertPool::Lane* ExpertPool::reserve_lane(size_t jobs) {
    std::lock_guard<std::mutex> lock(lanes_mtx_);

    for (size_t i = 1; i < lanes_.size();) {
        if (lanes_[i]->reserved->load() == 0) {
            lanes_.erase(lanes_.begin() + static_cast<std::ptrdiff_t>(i));
        } else {
            ++i;
        }
    }

    for (auto& lane : lanes_) {
        size_t busy = lane->reserved->load();
        if (lane->threads - std::min(busy, lane->threads) >= jobs) {
            lane->reserved->fetch_add(jobs);
            return lane.get();
        }
    }

    auto lane = std::make_unique<Lane>();
    lane->threads = std::max({settings_.worker_threads, kExpertCount, jobs});
    lane->pool = std::make_unique<ThreadPool>(lane->threads);
    lane->reserved = std::make_shared<std::atomic<size_t>>(jobs);
    if (!lanes_.empty()) {
        spdlog::warn("🧵 All expert workers busy, opening lane {} with {} workers", lanes_.size() + 1, lane->threads);
    }
    lanes_.push_back(std::move(lane));
    return lanes_.back().get();
}

std::vector<ExpertOpinion> ExpertPool::run(const ExecutionPlan& plan,
                                           const QueryContext& query,
                                           const EnrichedContext& enriched,
                                           std::shared_ptr<const CancellationToken> request_cancel,
                                           const std::string& refinement) {
    using Clock = ReasoningExpert::Clock;

    // Shared with the worker threads, which may outlive this call after a timeout.
    auto task = std::make_shared<const ExpertTask>(ExpertTask{query, enriched, plan, refinement});
    auto budget = std::chrono::milliseconds(settings_.timeout_ms);
    auto request_deadline = Clock::now() + budget;

    struct Pending {
        ExpertId id;
        std::shared_ptr<CancellationToken> token;
        std::future<ExpertOpinion> result;
    };
    std::vector<Pending> pending;
    std::vector<ExpertOpinion> opinions;

    std::vector<std::pair<ExpertId, std::shared_ptr<ReasoningExpert>>> selected;
    for (auto id : plan.experts) {
        auto it = experts_.find(id);
        if (it == experts_.end()) {
            spdlog::error("[{}] no expert registered for {}", query.trace_id, to_string(id));
            opinions.push_back(ExpertOpinion::degraded(id, kLimitExpertError, "expert not registered"));
            continue;
        }
        selected.emplace_back(id, it->second);
    }
    if (selected.empty()) return opinions;

    Lane* lane = reserve_lane(selected.size());
    for (const auto& entry : selected) {
        ExpertId id = entry.first;
        auto expert = entry.second;
        auto token = std::make_shared<CancellationToken>(request_cancel);
        SystemMonitor::global_expert_runs++;
        auto reserved = lane->reserved;
        try {
            pending.push_back({id, token, lane->pool->enqueue([expert, task, token, budget, request_deadline, reserved]() {
                SlotRelease release{reserved};
                // The budget runs from the moment the expert actually starts.
                auto deadline = std::min(Clock::now() + budget, request_deadline);
                return expert->run(*task, *token, deadline);
            })});
        } catch (const std::runtime_error& e) {
            reserved->fetch_sub(1);
            SystemMonitor::global_expert_errors++;
            spdlog::error("💥 [{}] could not schedule {}: {}", query.trace_id, to_string(id), e.what());
            opinions.push_back(ExpertOpinion::degraded(id, kLimitExpertError, e.what()));
        }
    }

    for (auto& p : pending) {
        if (p.result.wait_until(request_deadline) != std::future_status::ready) {
            p.token->cancel();
            SystemMonitor::global_expert_timeouts++;
            spdlog::warn("⏱️ [{}] {} missed its {} ms deadline", query.trace_id, to_string(p.id), settings_.timeout_ms);
            auto op = ExpertOpinion::degraded(p.id, kLimitTimedOut, "deadline of " + std::to_string(settings_.timeout_ms) + " ms exceeded");
            op.elapsed_ms = settings_.timeout_ms;
            opinions.push_back(std::move(op));
            continue;
        }
        try {
            auto op = p.result.get();
            if (op.has_limitation(kLimitTimedOut)) SystemMonitor::global_expert_timeouts++;
            opinions.push_back(std::move(op));
        } catch (const std::exception& e) {
            SystemMonitor::global_expert_errors++;
            spdlog::error("💥 [{}] {} failed: {}", query.trace_id, to_string(p.id), e.what());
            opinions.push_back(ExpertOpinion::degraded(p.id, kLimitExpertError, e.what()));
        }
    }

    return opinions;
}

} // namespace merlt
