#include "tools/RetrievalTools.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace merlt {

using json = nlohmann::json;

std::string RetrievalTool::require_string(const json& args, const std::string& key) {
    if (!args.contains(key) || !args[key].is_string() || args[key].get<std::string>().empty()) {
        throw std::invalid_argument("'" + key + "' must be a non-empty string");
    }
    return args[key].get<std::string>();
}

int RetrievalTool::bounded_int(const json& args, const std::string& key, int fallback, int lo, int hi) {
    if (!args.contains(key)) return fallback;
    if (!args[key].is_number()) throw std::invalid_argument("'" + key + "' must be a number");
    double v = args[key].get<double>();
    if (!std::isfinite(v)) throw std::invalid_argument("'" + key + "' must be finite");
    return static_cast<int>(std::clamp(v, static_cast<double>(lo), static_cast<double>(hi)));
}

ToolResult RetrievalTool::package(std::vector<WeightedEvidence> evidence) {
    ToolResult r;
    json items = json::array();
    for (const auto& e : evidence) items.push_back(e.to_json());
    r.observation = {{"count", evidence.size()}, {"results", items}};
    r.evidence = std::move(evidence);
    return r;
}

ToolResult RetrievalTool::traverse_family(const json& args, const ToolCall& call,
                                          const std::vector<std::string>& relations) {
    std::string start = require_string(args, "start_node");
    int hops = bounded_int(args, "max_hops", call.max_hops, 1, std::max(1, call.max_hops));
    return package(engine_->traverse(call.expert, start, relations, hops, call.top_k));
}

ToolResult SemanticSearchTool::execute(const json& args, const ToolCall& call) {
    std::string query = require_string(args, "query");
    std::map<std::string, std::string> filters;
    if (args.contains("source_type") && args["source_type"].is_string()) {
        filters["source_type"] = args["source_type"].get<std::string>();
    }
    int k = bounded_int(args, "top_k", call.top_k, 1, std::max(1, call.top_k));
    return package(engine_->search(call.expert, query, filters, k));
}

ToolResult NormLookupTool::execute(const json& args, const ToolCall& call) {
    std::map<std::string, std::string> filters{{"source_type", "norma"}};
    std::string query;
    if (args.contains("urn") && args["urn"].is_string() && !args["urn"].get<std::string>().empty()) {
        query = args["urn"].get<std::string>();
        filters["urn_prefix"] = query;
    } else if (args.contains("query")) {
        query = require_string(args, "query");
    } else {
        throw std::invalid_argument("either 'urn' or 'query' is required");
    }
    return package(engine_->search(call.expert, query, filters, std::min(call.top_k, 3)));
}

ToolResult TraverseRelationsTool::execute(const json& args, const ToolCall& call) {
    std::vector<std::string> relations;
    if (args.contains("relation_types")) {
        if (!args["relation_types"].is_array()) throw std::invalid_argument("'relation_types' must be an array");
        relations = args["relation_types"].get<std::vector<std::string>>();
    }
    return traverse_family(args, call, relations);
}

ToolResult FindPrinciplesTool::execute(const json& args, const ToolCall& call) {
    if (args.contains("start_node")) {
        return traverse_family(args, call, RelationFamilies::kPrinciples);
    }
    std::string query = require_string(args, "query");
    return package(engine_->search(call.expert, query, {{"source_type", "principio"}}, call.top_k));
}

ToolResult FindCitationsTool::execute(const json& args, const ToolCall& call) {
    if (args.contains("start_node")) {
        return traverse_family(args, call, RelationFamilies::kCitations);
    }
    std::string query = require_string(args, "query");
    return package(engine_->search(call.expert, query, {{"source_type", "sentenza"}}, call.top_k));
}

void register_retrieval_tools(ToolRegistry& registry, const std::shared_ptr<RetrievalEngine>& engine) {
    registry.register_tool(std::make_unique<SemanticSearchTool>(engine));
    registry.register_tool(std::make_unique<NormLookupTool>(engine));
    registry.register_tool(std::make_unique<FindDefinitionsTool>(engine));
    registry.register_tool(std::make_unique<TraverseRelationsTool>(engine));
    registry.register_tool(std::make_unique<NormHistoryTool>(engine));
    registry.register_tool(std::make_unique<FindPrinciplesTool>(engine));
    registry.register_tool(std::make_unique<FindCitationsTool>(engine));
}

} // namespace merlt
