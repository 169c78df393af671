#pragma once
#include <atomic>
#include <nlohmann/json.hpp>

namespace merlt {

struct TelemetryData {
    // Requests
    long long queries_total = 0;
    long long queries_failed = 0;
    long long plan_retries = 0;

    // Experts
    long long expert_runs = 0;
    long long expert_timeouts = 0;
    long long expert_errors = 0;
    long long tool_calls = 0;

    // Learning loop
    long long feedback_applied = 0;
    long long feedback_rejected = 0;
    long long rollout_candidates = 0;

    // Latency of the last request stages
    double plan_latency_ms = 0.0;
    double experts_latency_ms = 0.0;
    double synthesis_latency_ms = 0.0;
    double llm_latency_ms = 0.0;
    double retrieval_latency_ms = 0.0;
};

// Process-wide counters. Writers bump them lock-free; snapshot() is a best-effort read.
class SystemMonitor {
public:
    inline static std::atomic<long long> global_queries_total{0};
    inline static std::atomic<long long> global_queries_failed{0};
    inline static std::atomic<long long> global_plan_retries{0};
    inline static std::atomic<long long> global_expert_runs{0};
    inline static std::atomic<long long> global_expert_timeouts{0};
    inline static std::atomic<long long> global_expert_errors{0};
    inline static std::atomic<long long> global_tool_calls{0};
    inline static std::atomic<long long> global_feedback_applied{0};
    inline static std::atomic<long long> global_feedback_rejected{0};
    inline static std::atomic<long long> global_rollout_candidates{0};

    inline static std::atomic<double> global_plan_latency_ms{0.0};
    inline static std::atomic<double> global_experts_latency_ms{0.0};
    inline static std::atomic<double> global_synthesis_latency_ms{0.0};
    inline static std::atomic<double> global_llm_latency_ms{0.0};
    inline static std::atomic<double> global_retrieval_latency_ms{0.0};

    static TelemetryData snapshot() {
        TelemetryData d;
        d.queries_total = global_queries_total.load();
        d.queries_failed = global_queries_failed.load();
        d.plan_retries = global_plan_retries.load();
        d.expert_runs = global_expert_runs.load();
        d.expert_timeouts = global_expert_timeouts.load();
        d.expert_errors = global_expert_errors.load();
        d.tool_calls = global_tool_calls.load();
        d.feedback_applied = global_feedback_applied.load();
        d.feedback_rejected = global_feedback_rejected.load();
        d.rollout_candidates = global_rollout_candidates.load();
        d.plan_latency_ms = global_plan_latency_ms.load();
        d.experts_latency_ms = global_experts_latency_ms.load();
        d.synthesis_latency_ms = global_synthesis_latency_ms.load();
        d.llm_latency_ms = global_llm_latency_ms.load();
        d.retrieval_latency_ms = global_retrieval_latency_ms.load();
        return d;
    }

    static nlohmann::json snapshot_json() {
        auto d = snapshot();
        return nlohmann::json{
            {"queries_total", d.queries_total},
            {"queries_failed", d.queries_failed},
            {"plan_retries", d.plan_retries},
            {"expert_runs", d.expert_runs},
            {"expert_timeouts", d.expert_timeouts},
            {"expert_errors", d.expert_errors},
            {"tool_calls", d.tool_calls},
            {"feedback_applied", d.feedback_applied},
            {"feedback_rejected", d.feedback_rejected},
            {"rollout_candidates", d.rollout_candidates},
            {"plan_latency_ms", d.plan_latency_ms},
            {"experts_latency_ms", d.experts_latency_ms},
            {"synthesis_latency_ms", d.synthesis_latency_ms},
            {"llm_latency_ms", d.llm_latency_ms},
            {"retrieval_latency_ms", d.retrieval_latency_ms}
        };
    }
};

} // namespace merlt
