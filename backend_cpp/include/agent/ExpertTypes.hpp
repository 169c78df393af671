#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include "legal_types.hpp"
#include "retrieval_engine.hpp"

namespace merlt {

struct ExpertProfile {
    ExpertId id = ExpertId::Literal;
    std::string title;          // name the model is addressed with
    std::string instructions;   // interpretive canon the expert applies
    std::vector<std::string> tools;
};

// Everything an expert needs for one request. Shared read-only between the experts of a request.
struct ExpertTask {
    QueryContext query;
    EnrichedContext enriched;
    ExecutionPlan plan;
    std::string refinement;     // notes from a previous iteration, empty on the first one
};

// Working memory of one expert run.
struct ExpertSession {
    std::vector<WeightedEvidence> evidence;
    std::string history;
    int tool_rounds = 0;
};

// Cooperative cancellation. A token is cancelled when it or any parent is.
class CancellationToken {
public:
    CancellationToken() = default;
    explicit CancellationToken(std::shared_ptr<const CancellationToken> parent) : parent_(std::move(parent)) {}

    void cancel() { flag_.store(true); }
    bool cancelled() const { return flag_.load() || (parent_ && parent_->cancelled()); }

private:
    std::atomic<bool> flag_{false};
    std::shared_ptr<const CancellationToken> parent_;
};

}
