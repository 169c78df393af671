#include "config_manager.hpp"
#include <fstream>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace merlt {

namespace fs = std::filesystem;
using json = nlohmann::json;

OrchestratorConfig OrchestratorConfig::defaults() {
    OrchestratorConfig c;

    c.router.required_experts_by_intent = {
        {"bilanciamento_diritti", {ExpertId::Principles}},
        {"orientamento_giurisprudenziale", {ExpertId::Precedent}},
        {"evoluzione_normativa", {ExpertId::Systemic}},
        {"definizione", {ExpertId::Literal}},
    };

    // Mapped on the interpretive canons of art. 12-14 disp. prel. c.c.
    c.traversal.defaults[ExpertId::Literal] = {
        {"contiene", 0.95}, {"definisce", 0.95}, {"disciplina", 0.9}, {"rinvia", 0.9},
        {"modifica", 0.85}, {"abroga", 0.8}, {"cita", 0.75}, {"semantic", 0.7}
    };
    c.traversal.defaults[ExpertId::Systemic] = {
        {"connesso_a", 0.95}, {"modifica", 0.95}, {"abroga", 0.9}, {"deroga", 0.9},
        {"rinvia", 0.85}, {"disciplina", 0.8}, {"contiene", 0.75}, {"cita", 0.7}, {"semantic", 0.7}
    };
    c.traversal.defaults[ExpertId::Principles] = {
        {"attua", 0.95}, {"esprime", 0.95}, {"costituzionale", 0.95}, {"comunitario", 0.9},
        {"principio", 0.9}, {"finalita", 0.85}, {"ratio", 0.85}, {"tutela", 0.8},
        {"disciplina", 0.75}, {"semantic", 0.7}
    };
    c.traversal.defaults[ExpertId::Precedent] = {
        {"interpreta", 0.95}, {"applica", 0.95}, {"cita", 0.9}, {"conferma", 0.85},
        {"commenta", 0.85}, {"supera", 0.8}, {"contrasta", 0.75}, {"disciplina", 0.7},
        {"semantic", 0.7}
    };

    c.authority.roles = {
        {"magistrato", 1.0}, {"avvocato", 0.9}, {"docente", 0.9}, {"notaio", 0.85},
        {"praticante", 0.6}, {"studente", 0.4}, {"cittadino", 0.3}
    };
    return c;
}

namespace {

std::vector<ExpertId> parse_expert_list(const json& arr) {
    std::vector<ExpertId> out;
    for (const auto& e : arr) {
        auto id = expert_from_string(e.get<std::string>());
        if (!id) throw std::invalid_argument("unknown expert '" + e.get<std::string>() + "' in config");
        out.push_back(*id);
    }
    return out;
}

} // namespace

OrchestratorConfig OrchestratorConfig::from_json(const json& j) {
    OrchestratorConfig c = defaults();

    if (j.contains("router")) {
        const auto& r = j["router"];
        c.router.max_retries = r.value("max_retries", c.router.max_retries);
        c.router.min_intent_confidence = r.value("min_intent_confidence", c.router.min_intent_confidence);
        if (r.contains("required_experts_by_intent")) {
            for (const auto& [intent, experts] : r["required_experts_by_intent"].items()) {
                c.router.required_experts_by_intent[intent] = parse_expert_list(experts);
            }
        }
    }

    if (j.contains("experts")) {
        const auto& e = j["experts"];
        c.experts.timeout_ms = e.value("timeout_ms", c.experts.timeout_ms);
        c.experts.max_tool_rounds = e.value("max_tool_rounds", c.experts.max_tool_rounds);
        c.experts.top_k = e.value("top_k", c.experts.top_k);
        c.experts.max_hops = e.value("max_hops", c.experts.max_hops);
        c.experts.max_evidence_chars = e.value("max_evidence_chars", c.experts.max_evidence_chars);
        c.experts.worker_threads = e.value("worker_threads", c.experts.worker_threads);
    }

    if (j.contains("synthesizer")) {
        c.synthesizer.agreement_threshold =
            j["synthesizer"].value("agreement_threshold", c.synthesizer.agreement_threshold);
    }

    if (j.contains("gating")) {
        const auto& g = j["gating"];
        c.gating.input_dim = g.value("input_dim", c.gating.input_dim);
        c.gating.learning_rate = g.value("learning_rate", c.gating.learning_rate);
        c.gating.gradient_clip = g.value("gradient_clip", c.gating.gradient_clip);
        if (g.contains("priors")) {
            for (const auto& [name, v] : g["priors"].items()) {
                auto id = expert_from_string(name);
                if (!id) throw std::invalid_argument("unknown expert '" + name + "' in gating.priors");
                c.gating.priors[index_of(*id)] = v.get<double>();
            }
        }
    }

    if (j.contains("traversal")) {
        const auto& t = j["traversal"];
        c.traversal.learning_rate = t.value("learning_rate", c.traversal.learning_rate);
        c.traversal.max_logit = t.value("max_logit", c.traversal.max_logit);
        c.traversal.default_weight = t.value("default_weight", c.traversal.default_weight);
        if (t.contains("defaults")) {
            for (const auto& [name, rels] : t["defaults"].items()) {
                auto id = expert_from_string(name);
                if (!id) throw std::invalid_argument("unknown expert '" + name + "' in traversal.defaults");
                c.traversal.defaults[*id] = rels.get<std::map<std::string, double>>();
            }
        }
    }

    if (j.contains("authority")) {
        const auto& a = j["authority"];
        c.authority.role_weight = a.value("role_weight", c.authority.role_weight);
        c.authority.accuracy_weight = a.value("accuracy_weight", c.authority.accuracy_weight);
        c.authority.consensus_weight = a.value("consensus_weight", c.authority.consensus_weight);
        c.authority.reputation_weight = a.value("reputation_weight", c.authority.reputation_weight);
        c.authority.default_role_score = a.value("default_role_score", c.authority.default_role_score);
        c.authority.cache_ttl_seconds = a.value("cache_ttl_seconds", c.authority.cache_ttl_seconds);
        c.authority.cache_size = a.value("cache_size", c.authority.cache_size);
        if (a.contains("roles")) {
            for (const auto& [role, v] : a["roles"].items()) c.authority.roles[role] = v.get<double>();
        }
    }

    if (j.contains("feedback")) {
        const auto& f = j["feedback"];
        c.feedback.rollout_threshold = f.value("rollout_threshold", c.feedback.rollout_threshold);
        c.feedback.min_authority = f.value("min_authority", c.feedback.min_authority);
        c.feedback.label_smoothing = f.value("label_smoothing", c.feedback.label_smoothing);
    }

    if (j.contains("orchestrator")) {
        const auto& o = j["orchestrator"];
        c.orchestrator.max_iterations_cap = o.value("max_iterations_cap", c.orchestrator.max_iterations_cap);
        c.orchestrator.trace_capacity = o.value("trace_capacity", c.orchestrator.trace_capacity);
    }

    if (j.contains("llm")) {
        const auto& l = j["llm"];
        c.llm.base_url = l.value("base_url", c.llm.base_url);
        c.llm.embedding_model = l.value("embedding_model", c.llm.embedding_model);
        c.llm.request_timeout_ms = l.value("request_timeout_ms", c.llm.request_timeout_ms);
        c.llm.max_retries = l.value("max_retries", c.llm.max_retries);
        c.llm.temperature = l.value("temperature", c.llm.temperature);
    }

    c.log_level = j.value("log_level", c.log_level);
    c.weights_dir = j.value("weights_dir", c.weights_dir);
    c.rollout_endpoint = j.value("rollout_endpoint", c.rollout_endpoint);
    c.listen_address = j.value("listen_address", c.listen_address);
    c.users_path = j.value("users_path", c.users_path);
    c.index_dir = j.value("index_dir", c.index_dir);
    return c;
}

json OrchestratorConfig::to_json() const {
    json intents = json::object();
    for (const auto& [intent, experts] : router.required_experts_by_intent) {
        json names = json::array();
        for (auto e : experts) names.push_back(to_string(e));
        intents[intent] = names;
    }
    json priors = json::object();
    for (auto id : kAllExperts) priors[to_string(id)] = gating.priors[index_of(id)];
    json trav = json::object();
    for (const auto& [id, rels] : traversal.defaults) trav[to_string(id)] = rels;

    return json{
        {"router", {
            {"max_retries", router.max_retries},
            {"min_intent_confidence", router.min_intent_confidence},
            {"required_experts_by_intent", intents}
        }},
        {"experts", {
            {"timeout_ms", experts.timeout_ms},
            {"max_tool_rounds", experts.max_tool_rounds},
            {"top_k", experts.top_k},
            {"max_hops", experts.max_hops},
            {"max_evidence_chars", experts.max_evidence_chars},
            {"worker_threads", experts.worker_threads}
        }},
        {"synthesizer", {{"agreement_threshold", synthesizer.agreement_threshold}}},
        {"gating", {
            {"input_dim", gating.input_dim},
            {"learning_rate", gating.learning_rate},
            {"gradient_clip", gating.gradient_clip},
            {"priors", priors}
        }},
        {"traversal", {
            {"learning_rate", traversal.learning_rate},
            {"max_logit", traversal.max_logit},
            {"default_weight", traversal.default_weight},
            {"defaults", trav}
        }},
        {"authority", {
            {"role_weight", authority.role_weight},
            {"accuracy_weight", authority.accuracy_weight},
            {"consensus_weight", authority.consensus_weight},
            {"reputation_weight", authority.reputation_weight},
            {"default_role_score", authority.default_role_score},
            {"roles", authority.roles},
            {"cache_ttl_seconds", authority.cache_ttl_seconds},
            {"cache_size", authority.cache_size}
        }},
        {"feedback", {
            {"rollout_threshold", feedback.rollout_threshold},
            {"min_authority", feedback.min_authority},
            {"label_smoothing", feedback.label_smoothing}
        }},
        {"orchestrator", {
            {"max_iterations_cap", orchestrator.max_iterations_cap},
            {"trace_capacity", orchestrator.trace_capacity}
        }},
        {"llm", {
            {"base_url", llm.base_url},
            {"embedding_model", llm.embedding_model},
            {"request_timeout_ms", llm.request_timeout_ms},
            {"max_retries", llm.max_retries},
            {"temperature", llm.temperature}
        }},
        {"log_level", log_level},
        {"weights_dir", weights_dir},
        {"rollout_endpoint", rollout_endpoint},
        {"listen_address", listen_address},
        {"users_path", users_path},
        {"index_dir", index_dir}
    };
}

// --- ConfigManager ---

ConfigManager::ConfigManager(std::string explicit_path)
    : explicit_path_(std::move(explicit_path)),
      current_(std::make_shared<const OrchestratorConfig>(OrchestratorConfig::defaults())) {
    reload();
}

std::string ConfigManager::resolve_path() const {
    if (!explicit_path_.empty()) return explicit_path_;

    std::vector<std::string> search_paths = {
        "merlt.json",
        "../merlt.json",
        "config/merlt.json",
        "build/merlt.json",
        "../../merlt.json"
    };
    for (const auto& path : search_paths) {
        if (fs::exists(path)) return path;
    }
    return "";
}

std::shared_ptr<const OrchestratorConfig> ConfigManager::snapshot() const {
    std::shared_lock lock(mutex_);
    return current_;
}

bool ConfigManager::reload() {
    std::string path = resolve_path();
    if (path.empty()) {
        spdlog::warn("⚠️ merlt.json not found in any standard path, running on built-in defaults");
        return false;
    }

    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::error("Config file {} could not be opened", path);
        return false;
    }

    try {
        auto parsed = std::make_shared<const OrchestratorConfig>(OrchestratorConfig::from_json(json::parse(f)));
        {
            std::unique_lock lock(mutex_);
            current_ = parsed;
            source_path_ = path;
        }
        spdlog::info("🛰️ Configuration loaded from {} (max_retries={}, expert timeout={}ms)",
                     path, parsed->router.max_retries, parsed->experts.timeout_ms);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("💥 Failed to parse {}: {}. Keeping previous configuration.", path, e.what());
        return false;
    }
}

void ConfigManager::replace(const OrchestratorConfig& config) {
    auto next = std::make_shared<const OrchestratorConfig>(config);
    std::unique_lock lock(mutex_);
    current_ = next;
}

} // namespace merlt
