#pragma once
#include <string>
#include <vector>
#include <algorithm>
#include <nlohmann/json.hpp>
#include "agent/ExpertTypes.hpp"
#include "agent/EvidenceDigest.hpp"

namespace merlt {

// Assembles the prompts of the expert loop.
class ContextManager {
    const size_t HISTORY_LIMIT = 6000;

public:
    explicit ContextManager(size_t max_evidence_chars = 24000) : digest_(max_evidence_chars) {}

    std::string render_query(const ExpertTask& task) const {
        std::string payload = "### QUESTION\n" + task.query.query_text + "\n";

        if (!task.query.entities.empty()) {
            payload += "### ENTITIES\n";
            for (const auto& e : task.query.entities) payload += "- " + e.text + " (" + e.label + ")\n";
        }
        if (!task.query.temporal_scope.empty()) {
            payload += "### TEMPORAL SCOPE\n" + task.query.temporal_scope + "\n";
        }
        if (!task.enriched.norms.empty()) {
            payload += "### CANDIDATE NORMS\n";
            for (const auto& n : task.enriched.norms) payload += "- " + n.urn + " " + n.title + "\n";
        }
        if (!task.enriched.concepts.empty()) {
            payload += "### CANDIDATE CONCEPTS\n";
            for (const auto& c : task.enriched.concepts) payload += "- " + c.label + "\n";
        }
        if (!task.refinement.empty()) {
            payload += "### PREVIOUS ATTEMPT\n" + task.refinement + "\n";
        }
        return payload;
    }

    std::string step_prompt(const ExpertProfile& profile, const ExpertTask& task,
                            const nlohmann::json& manifest, const ExpertSession& session,
                            int rounds_left) const {
        return "### ROLE\nYou are the " + profile.title + " of a legal reasoning panel.\n" +
               profile.instructions + "\n\n" +
               render_query(task) + "\n" +
               "### TOOLS\n" + manifest.dump(2) + "\n\n" +
               "### EVIDENCE SO FAR\n" + digest_.render(session.evidence) + "\n" +
               "### LOG\n" + tail(session.history) + "\n\n" +
               "### NEXT STEP\n"
               "Reply with JSON only. To call a tool: {\"action\":\"tool\",\"tool\":\"<name>\",\"parameters\":{...}}. "
               "When the evidence is sufficient: {\"action\":\"finalize\"}. "
               "Do not repeat a failing call with the same parameters. Tool calls left: " +
               std::to_string(rounds_left) + ".";
    }

    std::string finalize_prompt(const ExpertProfile& profile, const ExpertTask& task,
                                const ExpertSession& session) const {
        return "### ROLE\nYou are the " + profile.title + " of a legal reasoning panel.\n" +
               profile.instructions + "\n\n" +
               render_query(task) + "\n" +
               "### EVIDENCE\n" + digest_.render(session.evidence) + "\n" +
               "### TASK\n"
               "Write your interpretation of the question using only the evidence above. "
               "Put a one-sentence answer in rationale.conclusion, cite sources by URN, "
               "give a confidence in [0,1] and list any limitations of your analysis.";
    }

private:
    EvidenceDigest digest_;

    std::string tail(const std::string& history) const {
        size_t start_pos = (history.length() > HISTORY_LIMIT) ? (history.length() - HISTORY_LIMIT) : 0;
        return history.substr(start_pos);
    }
};

}
