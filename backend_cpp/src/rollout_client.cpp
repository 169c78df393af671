#include "rollout_client.hpp"
#include <chrono>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace merlt {

void HttpRolloutController::reap() {
    while (!in_flight_.empty() &&
           in_flight_.front().wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        auto r = in_flight_.front().get();
        in_flight_.pop_front();
        if (r.status_code < 200 || r.status_code >= 300) {
            spdlog::error("💥 Rollout service answered {} for {}: {}", r.status_code, r.url.str(), r.error.message);
        }
    }
}

void HttpRolloutController::candidate_ready(const std::string& weight_set_id) {
    if (endpoint_.empty()) {
        spdlog::info("🚀 Rollout candidate {} (no rollout endpoint configured)", weight_set_id);
        return;
    }

    nlohmann::json payload = {
        {"weight_set_id", weight_set_id},
        {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch()).count()}
    };

    std::lock_guard<std::mutex> lock(mtx_);
    reap();
    in_flight_.push_back(cpr::PostAsync(cpr::Url{endpoint_},
                                        cpr::Body{payload.dump()},
                                        cpr::Header{{"Content-Type", "application/json"}}));
    spdlog::info("🚀 Rollout candidate {} sent to {}", weight_set_id, endpoint_);
}

} // namespace merlt
