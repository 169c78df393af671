#include "orchestrator.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <optional>
#include <sstream>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "orchestrator_errors.hpp"
#include "SystemMonitor.hpp"

namespace merlt {

using json = nlohmann::json;

namespace {
long long now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

json opinions_summary(const std::vector<ExpertOpinion>& opinions) {
    json list = json::array();
    for (const auto& op : opinions) {
        list.push_back({
            {"expert", to_string(op.expert)},
            {"confidence", op.confidence},
            {"usable", op.usable()},
            {"limitations", op.limitations},
            {"tool_rounds", op.tool_rounds},
            {"elapsed_ms", op.elapsed_ms}
        });
    }
    return list;
}
}

Orchestrator::Orchestrator(Components components, const OrchestratorSettings& settings)
    : c_(std::move(components)), settings_(settings) {
    if (!c_.router || !c_.gating || !c_.experts || !c_.synthesizer || !c_.feedback) {
        throw std::invalid_argument("Orchestrator requires router, gating, experts, synthesizer and feedback components");
    }
    if (!c_.traces) c_.traces = std::make_shared<LogManager>(settings_.trace_capacity);
}

std::string Orchestrator::new_trace_id() {
    return fmt::format("q-{}-{}", now_ms(), trace_seq_.fetch_add(1));
}

std::vector<float> Orchestrator::embed_query(const QueryContext& query) const {
    size_t dim = c_.gating->input_dim();
    if (!c_.embedder) return std::vector<float>(dim, 0.0f);
    try {
        auto e = c_.embedder->embed(query.query_text);
        if (e.size() == dim) return e;
        spdlog::warn("[{}] Query embedding has {} dimensions, gate expects {}; routing on priors",
                     query.trace_id, e.size(), dim);
    } catch (const std::exception& e) {
        spdlog::warn("[{}] Query embedding failed ({}); routing on priors", query.trace_id, e.what());
    }
    return std::vector<float>(dim, 0.0f);
}

std::string Orchestrator::refinement_notes(const SynthesizedAnswer& answer, double min_confidence) {
    std::stringstream out;
    out << fmt::format("Iteration {} reached confidence {:.2f}, below the required {:.2f} ({} synthesis).\n",
                       answer.iterations, answer.confidence, min_confidence, to_string(answer.mode));
    for (const auto& op : answer.opinions) {
        out << "- " << to_string(op.expert) << fmt::format(": confidence {:.2f}", op.confidence);
        if (!op.limitations.empty()) {
            out << ", limitations:";
            for (const auto& l : op.limitations) out << " " << l;
        }
        out << "\n";
    }
    out << "Gather stronger evidence or involve experts that can close these gaps.";
    return out.str();
}

SynthesizedAnswer Orchestrator::handle_query(const QueryContext& query_in,
                                             const EnrichedContext& enriched,
                                             const ProgressCallback& progress,
                                             std::shared_ptr<const CancellationToken> cancel) {
    auto start = std::chrono::high_resolution_clock::now();
    SystemMonitor::global_queries_total++;

    QueryContext query = query_in;
    if (query.trace_id.empty()) query.trace_id = new_trace_id();

    auto emit = [&](const std::string& phase, const json& payload) {
        if (progress) progress(phase, payload);
    };

    QueryTrace trace;
    trace.timestamp = now_ms();
    trace.trace_id = query.trace_id;
    trace.query_text = query.query_text;

    auto finish = [&](const std::string& error) {
        auto end = std::chrono::high_resolution_clock::now();
        trace.duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
        trace.error = error;
        c_.traces->add_trace(trace);
    };

    spdlog::info("📥 [{}] Query: {}", query.trace_id, query.query_text);

    try {
        trace.query_embedding = embed_query(query);
        GatingWeights gating = c_.gating->route(trace.query_embedding);
        spdlog::info("🎛️ [{}] Gate: literal {:.2f}, systemic {:.2f}, principles {:.2f}, precedent {:.2f}",
                     query.trace_id, gating[0], gating[1], gating[2], gating[3]);

        std::optional<SynthesizedAnswer> best;
        std::string refinement;
        int max_iterations = 1;
        double min_confidence = 0.0;

        auto cancelled = [&]() { return cancel && cancel->cancelled(); };

        for (int iteration = 1; iteration <= max_iterations; ++iteration) {
            if (cancelled()) {
                if (!best) throw RequestCancelled("plan_generation", 0);
                break;
            }
            RoutingResult routing;
            try {
                routing = c_.router->route(query, enriched, refinement);
            } catch (const OrchestratorError& e) {
                if (!best) throw;
                spdlog::warn("[{}] Refinement plan failed ({}), keeping iteration {}", query.trace_id, e.what(), best->iterations);
                break;
            }
            if (cancelled()) {
                if (!best) throw RequestCancelled("plan_validation", routing.retry_count);
                break;
            }

            if (iteration == 1) {
                max_iterations = std::clamp(routing.plan.max_iterations, 1, std::max(1, settings_.max_iterations_cap));
                min_confidence = routing.plan.min_confidence;
                trace.plan = routing.plan.to_json();
            }
            emit("PLAN", {{"iteration", iteration}, {"retry_count", routing.retry_count}, {"plan", routing.plan.to_json()}});

            auto experts_start = std::chrono::high_resolution_clock::now();
            auto opinions = c_.experts->run(routing.plan, query, enriched, cancel, refinement);
            SystemMonitor::global_experts_latency_ms.store(std::chrono::duration<double, std::milli>(
                std::chrono::high_resolution_clock::now() - experts_start).count());
            emit("EXPERTS", {{"iteration", iteration}, {"opinions", opinions_summary(opinions)}});

            SynthesizedAnswer answer;
            try {
                answer = c_.synthesizer->synthesize(opinions, gating, query.trace_id, iteration);
            } catch (const InsufficientEvidence&) {
                if (!best) throw;
                spdlog::warn("[{}] Iteration {} produced no usable opinion, keeping iteration {}",
                             query.trace_id, iteration, best->iterations);
                break;
            }
            answer.plan = routing.plan;
            emit("SYNTHESIS", {{"iteration", iteration}, {"mode", to_string(answer.mode)},
                               {"confidence", answer.confidence}, {"min_agreement", answer.min_agreement}});

            if (!best || answer.confidence > best->confidence) best = std::move(answer);

            if (best->confidence >= min_confidence) break;
            if (cancelled()) break;
            if (iteration < max_iterations) {
                spdlog::info("🔁 [{}] Confidence {:.2f} below {:.2f}, refining", query.trace_id, best->confidence, min_confidence);
                refinement = refinement_notes(*best, min_confidence);
            }
        }

        trace.mode = to_string(best->mode);
        trace.confidence = best->confidence;
        trace.iterations = best->iterations;
        finish("");

        emit("FINAL", best->to_json());
        spdlog::info("📤 [{}] Answer ready: {} confidence {:.3f} after {} iteration(s)",
                     query.trace_id, to_string(best->mode), best->confidence, best->iterations);
        return *best;

    } catch (OrchestratorError& e) {
        e.set_trace_id(query.trace_id);
        SystemMonitor::global_queries_failed++;
        finish(e.kind());
        spdlog::error("❌ [{}] {}", query.trace_id, e.what());
        throw;
    }
}

FeedbackOutcome Orchestrator::handle_feedback(const FeedbackRecord& record) {
    return c_.feedback->ingest(record);
}

} // namespace merlt
