#include "plan_router.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <set>
#include <spdlog/spdlog.h>
#include "orchestrator_errors.hpp"
#include "SystemMonitor.hpp"

namespace merlt {

using json = nlohmann::json;

std::string to_string(RouterState s) {
    switch (s) {
        case RouterState::Generate: return "GENERATE";
        case RouterState::Validate: return "VALIDATE";
        case RouterState::Done: return "DONE";
        case RouterState::Rejected: return "REJECTED";
    }
    return "UNKNOWN";
}

// --- Validation ---

PlanValidation PlanValidator::validate(const ExecutionPlan& plan, const QueryContext& query) const {
    if (!plan.any_retrieval_agent()) {
        return {false, "no retrieval agent enabled: enable at least one of kg_agent, api_agent, vectordb_agent"};
    }
    if (plan.experts.empty()) {
        return {false, "no reasoning expert selected"};
    }

    std::set<ExpertId> seen;
    for (auto id : plan.experts) {
        if (!seen.insert(id).second) {
            return {false, "expert '" + to_string(id) + "' selected more than once"};
        }
    }

    if (plan.max_iterations < 1) {
        return {false, "iteration.max_iterations must be at least 1"};
    }
    if (!std::isfinite(plan.min_confidence) || plan.min_confidence < 0.0 || plan.min_confidence > 1.0) {
        return {false, "iteration.min_confidence must be within [0,1]"};
    }

    for (const auto& intent : query.intents) {
        if (intent.confidence < settings_.min_intent_confidence) continue;
        auto rule = settings_.required_experts_by_intent.find(intent.name);
        if (rule == settings_.required_experts_by_intent.end()) continue;
        for (auto required : rule->second) {
            if (!plan.selects(required)) {
                return {false, "intent '" + intent.name + "' requires expert '" + to_string(required) + "'"};
            }
        }
    }
    return {true, ""};
}

// --- Router ---

PlanRouter::PlanRouter(std::shared_ptr<LanguageModelClient> llm, RouterSettings settings)
    : llm_(std::move(llm)), settings_(settings), validator_(settings) {
    if (!llm_) throw std::invalid_argument("PlanRouter requires a language model client");
}

json PlanRouter::plan_schema() {
    json agent = {{"type", "boolean"}};
    json expert_names = json::array();
    for (auto id : kAllExperts) expert_names.push_back(to_string(id));

    return {
        {"type", "object"},
        {"properties", {
            {"retrieval_agents", {
                {"type", "object"},
                {"properties", {{"kg_agent", agent}, {"api_agent", agent}, {"vectordb_agent", agent}}}
            }},
            {"experts", {{"type", "array"}, {"items", {{"type", "string"}, {"enum", expert_names}}}}},
            {"iteration", {
                {"type", "object"},
                {"properties", {
                    {"max_iterations", {{"type", "integer"}, {"minimum", 1}}},
                    {"min_confidence", {{"type", "number"}, {"minimum", 0}, {"maximum", 1}}}
                }}
            }},
            {"rationale", {{"type", "string"}}}
        }},
        {"required", {"retrieval_agents", "experts", "rationale"}}
    };
}

std::string PlanRouter::build_prompt(const QueryContext& query, const EnrichedContext& enriched,
                                     const std::vector<std::string>& rejection_reasons,
                                     const std::string& refinement) const {
    std::string prompt =
        "### ROLE\n"
        "You plan how an Italian legal question is answered. Choose the retrieval agents "
        "(kg_agent: knowledge graph, api_agent: official norm texts, vectordb_agent: semantic search) "
        "and the interpretive experts (literal, systemic, principles, precedent).\n\n"
        "### QUERY CONTEXT\n" + query.to_json().dump(2) + "\n\n"
        "### ENRICHED CONTEXT\n" + enriched.to_json().dump(2) + "\n\n"
        "### RULES\n"
        "- Enable at least one retrieval agent and select at least one expert, each at most once.\n"
        "- iteration.max_iterations >= 1, iteration.min_confidence within [0,1].\n";

    for (const auto& [intent, experts] : settings_.required_experts_by_intent) {
        std::string names;
        for (auto id : experts) names += (names.empty() ? "" : ", ") + to_string(id);
        prompt += "- Intent '" + intent + "' requires: " + names + ".\n";
    }

    if (!refinement.empty()) {
        prompt += "\n### REFINEMENT\nA previous answer was not good enough:\n" + refinement + "\n";
    }

    if (!rejection_reasons.empty()) {
        prompt += "\n### REJECTED PLANS\nYour previous plans were rejected. Fix every point:\n";
        for (size_t i = 0; i < rejection_reasons.size(); ++i) {
            prompt += std::to_string(i + 1) + ". " + rejection_reasons[i] + "\n";
        }
    }

    prompt += "\nReply with the plan as JSON only.";
    return prompt;
}

json PlanRouter::generate(const QueryContext& query, const EnrichedContext& enriched,
                          int retry_count, const std::vector<std::string>& rejection_reasons,
                          const std::string& refinement) {
    auto prompt = build_prompt(query, enriched, rejection_reasons, refinement);
    try {
        return llm_->generate_structured(prompt, plan_schema());
    } catch (const LanguageModelError& e) {
        throw PlanGenerationFailed(retry_count, e.what());
    } catch (const std::exception& e) {
        throw PlanGenerationFailed(retry_count, std::string("unexpected provider failure: ") + e.what());
    }
}

RoutingResult PlanRouter::route(const QueryContext& query, const EnrichedContext& enriched,
                                const std::string& refinement) {
    auto start = std::chrono::high_resolution_clock::now();
    RoutingResult result;
    RouterState state = RouterState::Generate;
    json raw;

    while (state != RouterState::Done && state != RouterState::Rejected) {
        switch (state) {
            case RouterState::Generate:
                spdlog::info("🗺️ [{}] Generating plan (retry {})", query.trace_id, result.retry_count);
                raw = generate(query, enriched, result.retry_count, result.rejection_reasons, refinement);
                state = RouterState::Validate;
                break;

            case RouterState::Validate: {
                PlanValidation v;
                try {
                    result.plan = ExecutionPlan::from_json(raw);
                    v = validator_.validate(result.plan, query);
                } catch (const std::invalid_argument& e) {
                    v = {false, std::string("malformed plan: ") + e.what()};
                } catch (const json::exception& e) {
                    v = {false, std::string("malformed plan: ") + e.what()};
                }

                if (v.valid) {
                    state = RouterState::Done;
                    break;
                }

                spdlog::warn("🚫 [{}] Plan rejected: {}", query.trace_id, v.reason);
                result.rejection_reasons.push_back(v.reason);
                if (result.retry_count >= settings_.max_retries) {
                    state = RouterState::Rejected;
                } else {
                    ++result.retry_count;
                    SystemMonitor::global_plan_retries++;
                    state = RouterState::Generate;
                }
                break;
            }

            default:
                break;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    SystemMonitor::global_plan_latency_ms.store(std::chrono::duration<double, std::milli>(end - start).count());

    if (state == RouterState::Rejected) {
        spdlog::error("❌ [{}] No valid plan after {} retries", query.trace_id, result.retry_count);
        throw MaxRetriesExceeded(result.retry_count, result.rejection_reasons.back());
    }

    std::string names;
    for (auto id : result.plan.experts) names += (names.empty() ? "" : ",") + to_string(id);
    spdlog::info("✅ [{}] Plan accepted after {} retries: experts [{}]", query.trace_id, result.retry_count, names);
    return result;
}

} // namespace merlt
