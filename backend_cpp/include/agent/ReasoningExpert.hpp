#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "agent/ExpertTypes.hpp"
#include "agent/ContextManager.hpp"
#include "collaborators.hpp"
#include "config_manager.hpp"
#include "tools/ToolRegistry.hpp"

namespace merlt {

// One interpretive expert: a bounded tool loop followed by a structured opinion.
class ReasoningExpert {
public:
    using Clock = std::chrono::steady_clock;

    ReasoningExpert(ExpertProfile profile,
                    std::shared_ptr<LanguageModelClient> llm,
                    std::shared_ptr<ToolRegistry> tools,
                    const ExpertSettings& settings);

    // Returns a cancelled or timed-out opinion when the token fires or the
    // deadline passes between rounds. Provider and parsing failures throw.
    ExpertOpinion run(const ExpertTask& task, const CancellationToken& cancel, Clock::time_point deadline);

    ExpertId id() const { return profile_.id; }
    const ExpertProfile& profile() const { return profile_; }

    static nlohmann::json action_schema(const std::vector<std::string>& tools);
    static nlohmann::json opinion_schema();

    // Throws std::runtime_error when the reply has no interpretation.
    ExpertOpinion parse_opinion(const nlohmann::json& reply, const ExpertSession& session) const;

private:
    ExpertProfile profile_;
    std::shared_ptr<LanguageModelClient> llm_;
    std::shared_ptr<ToolRegistry> tools_;
    ExpertSettings settings_;
    std::unique_ptr<ContextManager> context_mgr_;
};

}
