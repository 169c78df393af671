#include "legal_types.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace merlt {

using json = nlohmann::json;

std::string to_string(ExpertId id) {
    switch (id) {
        case ExpertId::Literal: return "literal";
        case ExpertId::Systemic: return "systemic";
        case ExpertId::Principles: return "principles";
        case ExpertId::Precedent: return "precedent";
    }
    return "unknown";
}

std::optional<ExpertId> expert_from_string(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    // Accept the class-style names used by older plan prompts ("LiteralExpert")
    const std::string suffix = "expert";
    if (n.size() > suffix.size() && n.compare(n.size() - suffix.size(), suffix.size(), suffix) == 0) {
        n = n.substr(0, n.size() - suffix.size());
    }
    for (auto id : kAllExperts) {
        if (to_string(id) == n) return id;
    }
    return std::nullopt;
}

std::string to_string(SynthesisMode mode) {
    return mode == SynthesisMode::Convergent ? "convergent" : "divergent";
}

std::string to_string(FeedbackRejection r) {
    switch (r) {
        case FeedbackRejection::None: return "none";
        case FeedbackRejection::DuplicateFeedback: return "duplicate_feedback";
        case FeedbackRejection::UnknownUser: return "unknown_user";
        case FeedbackRejection::InvalidRecord: return "invalid_record";
        case FeedbackRejection::StoreUnavailable: return "store_unavailable";
    }
    return "unknown";
}

// --- QueryContext / EnrichedContext ---

json QueryContext::to_json() const {
    json ents = json::array();
    for (const auto& e : entities) ents.push_back({{"text", e.text}, {"label", e.label}});
    json ints = json::array();
    for (const auto& i : intents) ints.push_back({{"name", i.name}, {"confidence", i.confidence}});
    return json{
        {"trace_id", trace_id},
        {"query_text", query_text},
        {"entities", ents},
        {"intents", ints},
        {"complexity", complexity},
        {"temporal_scope", temporal_scope}
    };
}

QueryContext QueryContext::from_json(const json& j) {
    QueryContext ctx;
    ctx.trace_id = j.value("trace_id", "");
    ctx.query_text = j.value("query_text", "");
    ctx.complexity = std::clamp(j.value("complexity", 0.0), 0.0, 1.0);
    ctx.temporal_scope = j.value("temporal_scope", "");
    if (j.contains("entities")) {
        for (const auto& e : j["entities"]) {
            ctx.entities.push_back({e.value("text", ""), e.value("label", "")});
        }
    }
    if (j.contains("intents")) {
        for (const auto& i : j["intents"]) {
            ctx.intents.push_back({i.value("name", ""), i.value("confidence", 0.0)});
        }
    }
    return ctx;
}

json EnrichedContext::to_json() const {
    json cs = json::array();
    for (const auto& c : concepts) cs.push_back({{"id", c.id}, {"label", c.label}, {"score", c.score}});
    json ns = json::array();
    for (const auto& n : norms) ns.push_back({{"urn", n.urn}, {"title", n.title}, {"score", n.score}});
    return json{{"concepts", cs}, {"norms", ns}};
}

EnrichedContext EnrichedContext::from_json(const json& j) {
    EnrichedContext ctx;
    if (j.contains("concepts")) {
        for (const auto& c : j["concepts"]) {
            ctx.concepts.push_back({c.value("id", ""), c.value("label", ""), c.value("score", 0.0)});
        }
    }
    if (j.contains("norms")) {
        for (const auto& n : j["norms"]) {
            ctx.norms.push_back({n.value("urn", ""), n.value("title", ""), n.value("score", 0.0)});
        }
    }
    return ctx;
}

// --- ExecutionPlan ---

bool ExecutionPlan::selects(ExpertId id) const {
    return std::find(experts.begin(), experts.end(), id) != experts.end();
}

json ExecutionPlan::to_json() const {
    json names = json::array();
    for (auto e : experts) names.push_back(to_string(e));
    return json{
        {"retrieval_agents", {
            {"kg_agent", kg_agent},
            {"api_agent", api_agent},
            {"vectordb_agent", vectordb_agent}
        }},
        {"experts", names},
        {"iteration", {
            {"max_iterations", max_iterations},
            {"min_confidence", min_confidence}
        }},
        {"rationale", rationale}
    };
}

ExecutionPlan ExecutionPlan::from_json(const json& j) {
    if (!j.is_object()) throw std::invalid_argument("plan is not a JSON object");
    if (!j.contains("experts") || !j["experts"].is_array()) {
        throw std::invalid_argument("plan has no 'experts' array");
    }

    ExecutionPlan plan;
    if (j.contains("retrieval_agents")) {
        const auto& agents = j["retrieval_agents"];
        // Both {"kg_agent": true} and {"kg_agent": {"enabled": true}} are seen in model output
        auto flag = [&](const char* key) {
            if (!agents.contains(key)) return false;
            const auto& v = agents[key];
            if (v.is_boolean()) return v.get<bool>();
            if (v.is_object()) return v.value("enabled", false);
            return false;
        };
        plan.kg_agent = flag("kg_agent");
        plan.api_agent = flag("api_agent");
        plan.vectordb_agent = flag("vectordb_agent");
    }

    for (const auto& e : j["experts"]) {
        if (!e.is_string()) throw std::invalid_argument("expert identifiers must be strings");
        auto id = expert_from_string(e.get<std::string>());
        if (!id) throw std::invalid_argument("unknown expert '" + e.get<std::string>() + "'");
        plan.experts.push_back(*id);
    }

    if (j.contains("iteration")) {
        plan.max_iterations = j["iteration"].value("max_iterations", 1);
        plan.min_confidence = j["iteration"].value("min_confidence", 0.0);
    }
    plan.rationale = j.value("rationale", "");
    return plan;
}

// --- ExpertOpinion ---

bool ExpertOpinion::has_limitation(const std::string& flag) const {
    return std::find(limitations.begin(), limitations.end(), flag) != limitations.end();
}

bool ExpertOpinion::usable() const {
    return !has_limitation(kLimitTimedOut) && !has_limitation(kLimitExpertError) &&
           !has_limitation(kLimitCancelled);
}

std::string ExpertOpinion::conclusion() const {
    if (rationale.is_object() && rationale.contains("conclusion") && rationale["conclusion"].is_string()) {
        auto c = rationale["conclusion"].get<std::string>();
        if (!c.empty()) return c;
    }
    return interpretation;
}

json ExpertOpinion::to_json() const {
    json srcs = json::array();
    for (const auto& s : sources) {
        srcs.push_back({{"source_id", s.source_id}, {"relation", s.relation},
                        {"score", s.score}, {"excerpt", s.excerpt}});
    }
    return json{
        {"expert", to_string(expert)},
        {"interpretation", interpretation},
        {"rationale", rationale},
        {"confidence", confidence},
        {"sources", srcs},
        {"limitations", limitations},
        {"tool_rounds", tool_rounds},
        {"elapsed_ms", elapsed_ms}
    };
}

ExpertOpinion ExpertOpinion::degraded(ExpertId expert, const std::string& flag, const std::string& detail) {
    ExpertOpinion op;
    op.expert = expert;
    op.confidence = 0.0;
    op.limitations.push_back(flag);
    if (!detail.empty()) op.rationale["detail"] = detail;
    return op;
}

// --- SynthesizedAnswer ---

json SynthesizedAnswer::to_json() const {
    json contribs = json::array();
    for (const auto& c : contributions) {
        contribs.push_back({
            {"expert", to_string(c.expert)},
            {"gating_weight", c.gating_weight},
            {"normalized_weight", c.normalized_weight},
            {"confidence", c.confidence},
            {"weighted_confidence", c.weighted_confidence},
            {"included", c.included}
        });
    }
    json ops = json::array();
    for (const auto& o : opinions) ops.push_back(o.to_json());
    return json{
        {"trace_id", trace_id},
        {"text", text},
        {"mode", to_string(mode)},
        {"contributions", contribs},
        {"confidence", confidence},
        {"min_agreement", min_agreement},
        {"favoured_expert", favoured_expert ? json(to_string(*favoured_expert)) : json(nullptr)},
        {"iterations", iterations},
        {"plan", plan.to_json()},
        {"opinions", ops}
    };
}

// --- FeedbackRecord ---

json FeedbackRecord::to_json() const {
    json correctness = json::object();
    for (const auto& [id, ok] : expert_correctness) correctness[to_string(id)] = ok;
    json usefulness = json::object();
    for (const auto& [id, rels] : relation_usefulness) usefulness[to_string(id)] = rels;
    json j = {
        {"feedback_id", feedback_id},
        {"user_id", user_id},
        {"trace_id", trace_id},
        {"rating", rating},
        {"expert_correctness", correctness},
        {"relation_usefulness", usefulness}
    };
    if (!query_embedding.empty()) j["query_embedding"] = query_embedding;
    if (authority_score) j["authority_score"] = *authority_score;
    return j;
}

FeedbackRecord FeedbackRecord::from_json(const json& j) {
    FeedbackRecord r;
    r.feedback_id = j.value("feedback_id", "");
    r.user_id = j.value("user_id", "");
    r.trace_id = j.value("trace_id", "");
    r.rating = j.value("rating", 0);
    if (j.contains("expert_correctness")) {
        for (const auto& [name, ok] : j["expert_correctness"].items()) {
            auto id = expert_from_string(name);
            if (!id) throw std::invalid_argument("unknown expert '" + name + "' in expert_correctness");
            r.expert_correctness[*id] = ok.get<bool>();
        }
    }
    if (j.contains("relation_usefulness")) {
        for (const auto& [name, rels] : j["relation_usefulness"].items()) {
            auto id = expert_from_string(name);
            if (!id) throw std::invalid_argument("unknown expert '" + name + "' in relation_usefulness");
            r.relation_usefulness[*id] = rels.get<std::map<std::string, bool>>();
        }
    }
    if (j.contains("query_embedding")) r.query_embedding = j["query_embedding"].get<std::vector<float>>();
    if (j.contains("authority_score") && j["authority_score"].is_number()) {
        r.authority_score = j["authority_score"].get<double>();
    }
    return r;
}

json FeedbackOutcome::to_json() const {
    return json{
        {"accepted", accepted},
        {"rejection", to_string(rejection)},
        {"reason", reason},
        {"authority", authority},
        {"gating_updated", gating_updated},
        {"traversal_updates", traversal_updates},
        {"candidates", candidates}
    };
}

} // namespace merlt
