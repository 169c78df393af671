#pragma once
#include <deque>
#include <mutex>
#include <string>
#include <cpr/cpr.h>
#include "collaborators.hpp"

namespace merlt {

// Announces candidate weight sets to the rollout service. Fire-and-forget:
// the POST runs asynchronously and failures are only logged.
class HttpRolloutController : public RolloutController {
public:
    explicit HttpRolloutController(std::string endpoint) : endpoint_(std::move(endpoint)) {}

    void candidate_ready(const std::string& weight_set_id) override;

private:
    std::string endpoint_;
    std::deque<cpr::AsyncResponse> in_flight_;
    std::mutex mtx_;

    void reap();
};

} // namespace merlt
