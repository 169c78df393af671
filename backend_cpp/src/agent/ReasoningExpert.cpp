#include "agent/ReasoningExpert.hpp"
#include "agent/EvidenceDigest.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace merlt {

using json = nlohmann::json;

namespace {
constexpr size_t kMaxCitedSources = 10;
constexpr size_t kObservationCap = 5000;
}

ReasoningExpert::ReasoningExpert(ExpertProfile profile,
                                 std::shared_ptr<LanguageModelClient> llm,
                                 std::shared_ptr<ToolRegistry> tools,
                                 const ExpertSettings& settings)
    : profile_(std::move(profile)), llm_(std::move(llm)), tools_(std::move(tools)), settings_(settings) {
    if (!llm_ || !tools_) throw std::invalid_argument("ReasoningExpert requires a language model and a tool registry");
    context_mgr_ = std::make_unique<ContextManager>(settings_.max_evidence_chars);
}

json ReasoningExpert::action_schema(const std::vector<std::string>& tools) {
    return {
        {"type", "object"},
        {"properties", {
            {"action", {{"type", "string"}, {"enum", json::array({"tool", "finalize"})}}},
            {"tool", {{"type", "string"}, {"enum", tools}}},
            {"parameters", {{"type", "object"}}}
        }},
        {"required", {"action"}}
    };
}

json ReasoningExpert::opinion_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"interpretation", {{"type", "string"}}},
            {"rationale", {
                {"type", "object"},
                {"properties", {
                    {"conclusion", {{"type", "string"}}},
                    {"reasoning", {{"type", "string"}}},
                    {"cited_urns", {{"type", "array"}, {"items", {{"type", "string"}}}}}
                }}
            }},
            {"confidence", {{"type", "number"}, {"minimum", 0}, {"maximum", 1}}},
            {"limitations", {{"type", "array"}, {"items", {{"type", "string"}}}}}
        }},
        {"required", {"interpretation", "rationale", "confidence"}}
    };
}

ExpertOpinion ReasoningExpert::parse_opinion(const json& reply, const ExpertSession& session) const {
    if (!reply.is_object() || !reply.contains("interpretation") || !reply["interpretation"].is_string() ||
        reply["interpretation"].get<std::string>().empty()) {
        throw std::runtime_error("malformed opinion: missing interpretation");
    }

    ExpertOpinion op;
    op.expert = profile_.id;
    op.interpretation = reply["interpretation"].get<std::string>();
    if (reply.contains("rationale")) {
        op.rationale = reply["rationale"].is_object() ? reply["rationale"]
                                                      : json{{"reasoning", reply["rationale"]}};
    }

    double c = 0.0;
    if (reply.contains("confidence") && reply["confidence"].is_number()) c = reply["confidence"].get<double>();
    op.confidence = std::isfinite(c) ? std::clamp(c, 0.0, 1.0) : 0.0;

    if (reply.contains("limitations") && reply["limitations"].is_array()) {
        for (const auto& l : reply["limitations"]) {
            if (l.is_string()) op.limitations.push_back(l.get<std::string>());
        }
    }

    for (const auto& e : EvidenceDigest::consolidate(session.evidence)) {
        if (op.sources.size() >= kMaxCitedSources) break;
        op.sources.push_back(e.to_source());
    }
    op.tool_rounds = session.tool_rounds;
    return op;
}

ExpertOpinion ReasoningExpert::run(const ExpertTask& task, const CancellationToken& cancel, Clock::time_point deadline) {
    auto started = Clock::now();
    const std::string who = to_string(profile_.id);
    const std::string& trace = task.query.trace_id;

    auto stop_reason = [&]() -> std::string {
        if (cancel.cancelled()) return kLimitCancelled;
        if (Clock::now() >= deadline) return kLimitTimedOut;
        return "";
    };
    auto stopped = [&](const std::string& flag, const ExpertSession& session) {
        spdlog::warn("⏹️ [{}] {} stopped after {} tool rounds: {}", trace, who, session.tool_rounds, flag);
        auto op = ExpertOpinion::degraded(profile_.id, flag, "stopped before finalization");
        op.tool_rounds = session.tool_rounds;
        op.elapsed_ms = std::chrono::duration<double, std::milli>(Clock::now() - started).count();
        return op;
    };

    ExpertSession session;
    auto available = tools_->available(profile_.tools, task.plan);
    auto manifest = tools_->get_manifest_json(available);
    auto schema = action_schema(available);

    ToolCall call{profile_.id, settings_.top_k, settings_.max_hops};
    bool incomplete = false;

    if (available.empty()) {
        spdlog::warn("[{}] {}: no tool enabled by the plan", trace, who);
        incomplete = true;
    }

    // DISPATCH -> (TOOL_CALL <-> TOOL_RESULT)* -> FINALIZE
    int step = 0;
    while (!available.empty()) {
        if (auto reason = stop_reason(); !reason.empty()) return stopped(reason, session);

        int rounds_left = settings_.max_tool_rounds - session.tool_rounds;
        json action = llm_->generate_structured(
            context_mgr_->step_prompt(profile_, task, manifest, session, std::max(rounds_left, 0)), schema);
        ++step;

        std::string kind = action.is_object() ? action.value("action", "") : "";
        if (kind == "finalize") break;

        if (kind != "tool" || !action.contains("tool") || !action["tool"].is_string()) {
            spdlog::warn("⚠️ [{}] {}: invalid action at step {}, sending corrective feedback", trace, who, step);
            session.history += "\nSYSTEM ERROR: the previous reply was not a valid action. "
                               "Use {\"action\":\"tool\",...} or {\"action\":\"finalize\"}.";
            // Invalid replies consume a round so the loop stays bounded.
            if (++session.tool_rounds >= settings_.max_tool_rounds) { incomplete = true; break; }
            continue;
        }

        if (session.tool_rounds >= settings_.max_tool_rounds) {
            spdlog::info("[{}] {}: tool budget of {} exhausted, forcing finalization", trace, who, settings_.max_tool_rounds);
            incomplete = true;
            break;
        }

        std::string tool_name = action["tool"].get<std::string>();
        json params = action.value("parameters", json::object());

        ToolResult result;
        if (std::find(available.begin(), available.end(), tool_name) == available.end()) {
            result = ToolResult::error("Tool '" + tool_name + "' is not available to this expert.");
        } else {
            spdlog::info("🔧 [{}] {} -> {}", trace, who, tool_name);
            result = tools_->dispatch(tool_name, params, call);
        }
        ++session.tool_rounds;

        std::string observation = result.observation.dump();
        if (observation.size() > kObservationCap) observation = observation.substr(0, kObservationCap) + "...";

        session.history += "\n[ROUND " + std::to_string(session.tool_rounds) + "] " + tool_name + " " + params.dump() +
                           "\nOUTPUT: " + observation;
        if (!result.ok) {
            session.history += "\nSYSTEM: the tool returned an error. Adapt the plan, do not repeat the same call.";
        }
        session.evidence.insert(session.evidence.end(),
                                std::make_move_iterator(result.evidence.begin()),
                                std::make_move_iterator(result.evidence.end()));
    }

    if (auto reason = stop_reason(); !reason.empty()) return stopped(reason, session);

    json reply = llm_->generate_structured(context_mgr_->finalize_prompt(profile_, task, session), opinion_schema());
    ExpertOpinion op = parse_opinion(reply, session);
    if (incomplete && !op.has_limitation(kLimitIncompleteEvidence)) {
        op.limitations.push_back(kLimitIncompleteEvidence);
    }
    op.elapsed_ms = std::chrono::duration<double, std::milli>(Clock::now() - started).count();

    spdlog::info("🧠 [{}] {} finalized: confidence {:.2f}, {} sources, {} rounds",
                 trace, who, op.confidence, op.sources.size(), op.tool_rounds);
    return op;
}

}
