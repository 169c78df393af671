#pragma once
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "collaborators.hpp"
#include "config_manager.hpp"
#include "legal_types.hpp"

namespace merlt {

struct PlanValidation {
    bool valid = false;
    std::string reason;
};

class PlanValidator {
public:
    explicit PlanValidator(RouterSettings settings) : settings_(std::move(settings)) {}

    PlanValidation validate(const ExecutionPlan& plan, const QueryContext& query) const;

private:
    RouterSettings settings_;
};

enum class RouterState { Generate, Validate, Done, Rejected };
std::string to_string(RouterState s);

struct RoutingResult {
    ExecutionPlan plan;
    int retry_count = 0;
    std::vector<std::string> rejection_reasons;
};

// GENERATE -> VALIDATE -> {DONE | GENERATE}; REJECTED once the retry budget is spent.
// Never invents a fallback plan.
class PlanRouter {
public:
    PlanRouter(std::shared_ptr<LanguageModelClient> llm, RouterSettings settings);

    // Throws PlanGenerationFailed when the model call fails and MaxRetriesExceeded
    // when `max_retries` regenerations are all rejected.
    RoutingResult route(const QueryContext& query, const EnrichedContext& enriched,
                        const std::string& refinement = "");

    // One GENERATE step. Returns the raw model output.
    nlohmann::json generate(const QueryContext& query, const EnrichedContext& enriched,
                            int retry_count, const std::vector<std::string>& rejection_reasons,
                            const std::string& refinement);

    std::string build_prompt(const QueryContext& query, const EnrichedContext& enriched,
                             const std::vector<std::string>& rejection_reasons,
                             const std::string& refinement) const;

    static nlohmann::json plan_schema();

private:
    std::shared_ptr<LanguageModelClient> llm_;
    RouterSettings settings_;
    PlanValidator validator_;
};

} // namespace merlt
