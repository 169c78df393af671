#pragma once
#include <deque>
#include <mutex>
#include <optional>
#include <vector>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace merlt {

struct QueryTrace {
    long long timestamp = 0;
    std::string trace_id;
    std::string query_text;
    json plan;
    std::string mode;            // "convergent", "divergent" or empty on failure
    double confidence = 0.0;
    int iterations = 0;
    std::string error;           // error kind when the request failed
    std::vector<float> query_embedding;
    double duration_ms = 0.0;
};

// Bounded journal of recent requests. Feeds the telemetry RPC and lets the
// feedback path recover the query embedding a rating refers to.
class LogManager {
public:
    explicit LogManager(size_t capacity = 256) : capacity_(capacity == 0 ? 1 : capacity) {}

    void add_trace(const QueryTrace& trace) {
        std::lock_guard<std::mutex> lock(mtx_);
        traces_.push_back(trace);
        if (traces_.size() > capacity_) {
            traces_.pop_front();
        }
    }

    std::optional<QueryTrace> find(const std::string& trace_id) const {
        std::lock_guard<std::mutex> lock(mtx_);
        for (auto it = traces_.rbegin(); it != traces_.rend(); ++it) {
            if (it->trace_id == trace_id) return *it;
        }
        return std::nullopt;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return traces_.size();
    }

    json get_traces_json(size_t limit = 50) const {
        std::lock_guard<std::mutex> lock(mtx_);
        json j_list = json::array();
        // Newest first
        for (auto it = traces_.rbegin(); it != traces_.rend() && j_list.size() < limit; ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"trace_id", it->trace_id},
                {"query_text", it->query_text},
                {"plan", it->plan},
                {"mode", it->mode},
                {"confidence", it->confidence},
                {"iterations", it->iterations},
                {"error", it->error},
                {"duration_ms", it->duration_ms}
            });
        }
        return j_list;
    }

private:
    size_t capacity_;
    std::deque<QueryTrace> traces_;
    mutable std::mutex mtx_;
};

}
