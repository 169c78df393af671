#pragma once
#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "legal_types.hpp"
#include "retrieval_engine.hpp"
#include "SystemMonitor.hpp"

namespace merlt {

// The retrieval agent a tool runs through. A tool is only offered when the plan enables its agent.
enum class RetrievalAgent { VectorDb, KnowledgeGraph, Api };

inline std::string to_string(RetrievalAgent a) {
    switch (a) {
        case RetrievalAgent::VectorDb: return "vectordb_agent";
        case RetrievalAgent::KnowledgeGraph: return "kg_agent";
        case RetrievalAgent::Api: return "api_agent";
    }
    return "unknown";
}

inline bool plan_enables(const ExecutionPlan& plan, RetrievalAgent a) {
    switch (a) {
        case RetrievalAgent::VectorDb: return plan.vectordb_agent;
        case RetrievalAgent::KnowledgeGraph: return plan.kg_agent;
        case RetrievalAgent::Api: return plan.api_agent;
    }
    return false;
}

struct ToolMetadata {
    std::string name;
    std::string description;
    nlohmann::json parameter_schema;
    RetrievalAgent agent = RetrievalAgent::VectorDb;
};

// Per-call context: whose weights apply and the retrieval bounds.
struct ToolCall {
    ExpertId expert = ExpertId::Literal;
    int top_k = 8;
    int max_hops = 2;
};

struct ToolResult {
    bool ok = true;
    nlohmann::json observation;
    std::vector<WeightedEvidence> evidence;

    static ToolResult error(const std::string& message) {
        ToolResult r;
        r.ok = false;
        r.observation = {{"error", message}};
        return r;
    }
};

class ITool {
public:
    virtual ~ITool() = default;
    virtual ToolMetadata get_metadata() = 0;
    // Throws std::invalid_argument on bad arguments.
    virtual ToolResult execute(const nlohmann::json& args, const ToolCall& call) = 0;
};

class GenericTool : public ITool {
    ToolMetadata meta_;
    std::function<ToolResult(const nlohmann::json&, const ToolCall&)> action_;
public:
    GenericTool(std::string name, std::string desc, nlohmann::json schema, RetrievalAgent agent,
                std::function<ToolResult(const nlohmann::json&, const ToolCall&)> action)
        : action_(std::move(action)) {
        meta_ = {std::move(name), std::move(desc), std::move(schema), agent};
    }
    ToolMetadata get_metadata() override { return meta_; }
    ToolResult execute(const nlohmann::json& args, const ToolCall& call) override { return action_(args, call); }
};

// Filled once at startup, read concurrently by every expert afterwards.
class ToolRegistry {
private:
    std::map<std::string, std::unique_ptr<ITool>> tools_;
public:
    void register_tool(std::unique_ptr<ITool> tool) {
        spdlog::info("🛰️ Tool registered: {} ({})", tool->get_metadata().name, to_string(tool->get_metadata().agent));
        tools_[tool->get_metadata().name] = std::move(tool);
    }

    bool has(const std::string& name) const { return tools_.count(name) > 0; }

    // Subset of `names` that exists and whose retrieval agent the plan enables.
    std::vector<std::string> available(const std::vector<std::string>& names, const ExecutionPlan& plan) const {
        std::vector<std::string> out;
        for (const auto& n : names) {
            auto it = tools_.find(n);
            if (it != tools_.end() && plan_enables(plan, it->second->get_metadata().agent)) out.push_back(n);
        }
        return out;
    }

    nlohmann::json get_manifest_json(const std::vector<std::string>& names) const {
        auto manifest = nlohmann::json::array();
        for (const auto& n : names) {
            auto it = tools_.find(n);
            if (it == tools_.end()) continue;
            auto meta = it->second->get_metadata();
            manifest.push_back({
                {"name", meta.name},
                {"description", meta.description},
                {"parameters", meta.parameter_schema}
            });
        }
        return manifest;
    }

    // Failures come back as an error observation for the model, never as an exception.
    ToolResult dispatch(const std::string& name, const nlohmann::json& args, const ToolCall& call) {
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            return ToolResult::error("Tool '" + name + "' not found.");
        }
        SystemMonitor::global_tool_calls++;
        auto start = std::chrono::high_resolution_clock::now();

        ToolResult res;
        try {
            res = it->second->execute(args.is_object() ? args : nlohmann::json::object(), call);
        } catch (const std::invalid_argument& e) {
            res = ToolResult::error(std::string("bad arguments: ") + e.what());
        } catch (const nlohmann::json::exception& e) {
            res = ToolResult::error(std::string("bad arguments: ") + e.what());
        } catch (const std::exception& e) {
            spdlog::warn("🔧 [{}] {} failed: {}", to_string(call.expert), name, e.what());
            res = ToolResult::error(std::string("tool failed: ") + e.what());
        }

        auto end = std::chrono::high_resolution_clock::now();
        double duration = std::chrono::duration<double, std::milli>(end - start).count();
        spdlog::debug("🔧 [{}] {} -> {} items in {:.2f} ms", to_string(call.expert), name, res.evidence.size(), duration);
        return res;
    }
};
}
