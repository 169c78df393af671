#pragma once
#include <memory>
#include <string>
#include <vector>
#include "tools/ToolRegistry.hpp"
#include "retrieval_engine.hpp"

namespace merlt {

// Relation families the specialised graph tools follow
struct RelationFamilies {
    inline static const std::vector<std::string> kDefinitions = {"definisce", "rinvia"};
    inline static const std::vector<std::string> kHistory = {"modifica", "abroga", "deroga", "sostituisce"};
    inline static const std::vector<std::string> kPrinciples = {"attua", "esprime", "costituzionale", "comunitario"};
    inline static const std::vector<std::string> kCitations = {"cita", "interpreta", "applica", "supera"};
};

class RetrievalTool : public ITool {
public:
    explicit RetrievalTool(std::shared_ptr<RetrievalEngine> engine) : engine_(std::move(engine)) {}
protected:
    std::shared_ptr<RetrievalEngine> engine_;

    static std::string require_string(const nlohmann::json& args, const std::string& key);
    static int bounded_int(const nlohmann::json& args, const std::string& key, int fallback, int lo, int hi);
    static ToolResult package(std::vector<WeightedEvidence> evidence);
    ToolResult traverse_family(const nlohmann::json& args, const ToolCall& call,
                               const std::vector<std::string>& relations);
};

class SemanticSearchTool : public RetrievalTool {
public:
    using RetrievalTool::RetrievalTool;
    ToolMetadata get_metadata() override {
        return {"semantic_search",
                "Semantic search over norms, rulings and doctrine. Input: {'query': string, 'source_type'?: string, 'top_k'?: number}",
                {{"type", "object"},
                 {"properties", {{"query", {{"type", "string"}}},
                                 {"source_type", {{"type", "string"}}},
                                 {"top_k", {{"type", "number"}}}}},
                 {"required", {"query"}}},
                RetrievalAgent::VectorDb};
    }
    ToolResult execute(const nlohmann::json& args, const ToolCall& call) override;
};

class NormLookupTool : public RetrievalTool {
public:
    using RetrievalTool::RetrievalTool;
    ToolMetadata get_metadata() override {
        return {"norm_lookup",
                "Fetches the text of a norm by URN or by citation. Input: {'urn'?: string, 'query'?: string}",
                {{"type", "object"},
                 {"properties", {{"urn", {{"type", "string"}}}, {"query", {{"type", "string"}}}}}},
                RetrievalAgent::Api};
    }
    ToolResult execute(const nlohmann::json& args, const ToolCall& call) override;
};

class FindDefinitionsTool : public RetrievalTool {
public:
    using RetrievalTool::RetrievalTool;
    ToolMetadata get_metadata() override {
        return {"find_definitions",
                "Follows definition and cross-reference links from a norm. Input: {'start_node': string, 'max_hops'?: number}",
                {{"type", "object"},
                 {"properties", {{"start_node", {{"type", "string"}}}, {"max_hops", {{"type", "number"}}}}},
                 {"required", {"start_node"}}},
                RetrievalAgent::KnowledgeGraph};
    }
    ToolResult execute(const nlohmann::json& args, const ToolCall& call) override {
        return traverse_family(args, call, RelationFamilies::kDefinitions);
    }
};

class TraverseRelationsTool : public RetrievalTool {
public:
    using RetrievalTool::RetrievalTool;
    ToolMetadata get_metadata() override {
        return {"traverse_relations",
                "Walks the legal knowledge graph from a node. Input: {'start_node': string, 'relation_types'?: [string], 'max_hops'?: number}",
                {{"type", "object"},
                 {"properties", {{"start_node", {{"type", "string"}}},
                                 {"relation_types", {{"type", "array"}, {"items", {{"type", "string"}}}}},
                                 {"max_hops", {{"type", "number"}}}}},
                 {"required", {"start_node"}}},
                RetrievalAgent::KnowledgeGraph};
    }
    ToolResult execute(const nlohmann::json& args, const ToolCall& call) override;
};

class NormHistoryTool : public RetrievalTool {
public:
    using RetrievalTool::RetrievalTool;
    ToolMetadata get_metadata() override {
        return {"norm_history",
                "Amendments, repeals and derogations affecting a norm. Input: {'start_node': string, 'max_hops'?: number}",
                {{"type", "object"},
                 {"properties", {{"start_node", {{"type", "string"}}}, {"max_hops", {{"type", "number"}}}}},
                 {"required", {"start_node"}}},
                RetrievalAgent::KnowledgeGraph};
    }
    ToolResult execute(const nlohmann::json& args, const ToolCall& call) override {
        return traverse_family(args, call, RelationFamilies::kHistory);
    }
};

class FindPrinciplesTool : public RetrievalTool {
public:
    using RetrievalTool::RetrievalTool;
    ToolMetadata get_metadata() override {
        return {"find_principles",
                "Constitutional and EU principles a norm implements, or principles matching a query. Input: {'start_node'?: string, 'query'?: string}",
                {{"type", "object"},
                 {"properties", {{"start_node", {{"type", "string"}}}, {"query", {{"type", "string"}}}}}},
                RetrievalAgent::KnowledgeGraph};
    }
    ToolResult execute(const nlohmann::json& args, const ToolCall& call) override;
};

class FindCitationsTool : public RetrievalTool {
public:
    using RetrievalTool::RetrievalTool;
    ToolMetadata get_metadata() override {
        return {"find_citations",
                "Rulings that cite, interpret or apply a norm, or rulings matching a query. Input: {'start_node'?: string, 'query'?: string}",
                {{"type", "object"},
                 {"properties", {{"start_node", {{"type", "string"}}}, {"query", {{"type", "string"}}}}}},
                RetrievalAgent::KnowledgeGraph};
    }
    ToolResult execute(const nlohmann::json& args, const ToolCall& call) override;
};

// Registers every retrieval tool above against one engine.
void register_retrieval_tools(ToolRegistry& registry, const std::shared_ptr<RetrievalEngine>& engine);

} // namespace merlt
