#pragma once
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace merlt {

// Fatal request errors. Each carries the stage and retry count it failed at so
// the failure can be replayed in a test.
class OrchestratorError : public std::runtime_error {
public:
    OrchestratorError(const std::string& kind, const std::string& stage, int retry_count,
                      const std::string& detail, std::string trace_id = "")
        : std::runtime_error(kind + " [" + stage + ", retry " + std::to_string(retry_count) + "]: " + detail),
          kind_(kind), stage_(stage), retry_count_(retry_count), detail_(detail), trace_id_(std::move(trace_id)) {}

    const std::string& kind() const { return kind_; }
    const std::string& stage() const { return stage_; }
    int retry_count() const { return retry_count_; }
    const std::string& detail() const { return detail_; }
    const std::string& trace_id() const { return trace_id_; }
    void set_trace_id(const std::string& id) { trace_id_ = id; }

    // True when the caller should report "degraded service" rather than "unable to answer".
    virtual bool degraded_service() const { return true; }

    nlohmann::json to_json() const {
        return nlohmann::json{
            {"error", kind_},
            {"stage", stage_},
            {"retry_count", retry_count_},
            {"detail", detail_},
            {"trace_id", trace_id_}
        };
    }

private:
    std::string kind_;
    std::string stage_;
    int retry_count_;
    std::string detail_;
    std::string trace_id_;
};

class PlanGenerationFailed : public OrchestratorError {
public:
    PlanGenerationFailed(int retry_count, const std::string& detail)
        : OrchestratorError("PlanGenerationFailed", "plan_generation", retry_count, detail) {}
};

class MaxRetriesExceeded : public OrchestratorError {
public:
    MaxRetriesExceeded(int retry_count, const std::string& last_reason)
        : OrchestratorError("MaxRetriesExceeded", "plan_validation", retry_count, last_reason) {}
};

class InsufficientEvidence : public OrchestratorError {
public:
    InsufficientEvidence(int iteration, const std::string& detail)
        : OrchestratorError("InsufficientEvidence", "synthesis", iteration, detail) {}
    bool degraded_service() const override { return false; }
};

// The caller went away (disconnect or deadline) before an answer was produced.
class RequestCancelled : public OrchestratorError {
public:
    RequestCancelled(const std::string& stage, int retry_count)
        : OrchestratorError("RequestCancelled", stage, retry_count, "request cancelled by caller") {}
    bool degraded_service() const override { return false; }
};

// Raised by a LanguageModelClient once its own key rotation and model fallback are exhausted.
class LanguageModelError : public std::runtime_error {
public:
    LanguageModelError(const std::string& msg, int status_code = 0)
        : std::runtime_error(msg), status_code_(status_code) {}
    int status_code() const { return status_code_; }
private:
    int status_code_;
};

} // namespace merlt
