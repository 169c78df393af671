#include "orchestrator_service.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "orchestrator_errors.hpp"
#include "SystemMonitor.hpp"

namespace merlt {

using json = nlohmann::json;

namespace {

// Raises `cancel` as soon as the RPC is cancelled or its deadline passes, so
// planning and running experts stop without waiting for the next phase.
class CancellationWatch {
public:
    CancellationWatch(grpc::ServerContext* context, std::shared_ptr<CancellationToken> cancel)
        : thread_([this, context, cancel]() {
              std::unique_lock<std::mutex> lock(mtx_);
              while (!done_) {
                  if (context->IsCancelled() || std::chrono::system_clock::now() > context->deadline()) {
                      spdlog::warn("🛑 Client cancelled or deadline passed, stopping request");
                      cancel->cancel();
                      return;
                  }
                  cv_.wait_for(lock, std::chrono::milliseconds(20));
              }
          }) {}

    ~CancellationWatch() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            done_ = true;
        }
        cv_.notify_all();
        thread_.join();
    }

    CancellationWatch(const CancellationWatch&) = delete;
    CancellationWatch& operator=(const CancellationWatch&) = delete;

private:
    std::mutex mtx_;
    std::condition_variable cv_;
    bool done_ = false;
    std::thread thread_;
};

}

grpc::Status OrchestratorServiceImpl::HandleQuery(grpc::ServerContext* context,
                                                  const QueryRequest* request,
                                                  grpc::ServerWriter<QueryEvent>* writer) {
    QueryContext query;
    EnrichedContext enriched;
    try {
        query = QueryContext::from_json(json::parse(request->query_context_json()));
        if (!request->enriched_context_json().empty()) {
            enriched = EnrichedContext::from_json(json::parse(request->enriched_context_json()));
        }
    } catch (const std::exception& e) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, std::string("bad query payload: ") + e.what());
    }
    if (query.query_text.empty()) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "query_text is required");
    }
    if (query.trace_id.empty()) query.trace_id = orchestrator_->new_trace_id();

    auto cancel = std::make_shared<CancellationToken>();
    auto start = std::chrono::high_resolution_clock::now();

    auto progress = [&](const std::string& phase, const json& payload) {
        if (cancel->cancelled()) return;
        QueryEvent ev;
        ev.set_phase(phase);
        ev.set_payload(payload.dump(-1, ' ', false, json::error_handler_t::replace));
        ev.set_trace_id(query.trace_id);
        ev.set_elapsed_ms(std::chrono::duration<double, std::milli>(
            std::chrono::high_resolution_clock::now() - start).count());
        if (!writer->Write(ev)) cancel->cancel();
    };

    CancellationWatch watch(context, cancel);
    try {
        orchestrator_->handle_query(query, enriched, progress, cancel);
        return grpc::Status::OK;
    } catch (const RequestCancelled& e) {
        return grpc::Status(grpc::StatusCode::CANCELLED, e.to_json().dump());
    } catch (const OrchestratorError& e) {
        auto code = e.degraded_service() ? grpc::StatusCode::UNAVAILABLE : grpc::StatusCode::FAILED_PRECONDITION;
        return grpc::Status(code, e.to_json().dump());
    }
}

grpc::Status OrchestratorServiceImpl::SubmitFeedback(grpc::ServerContext* /*context*/,
                                                     const FeedbackRequest* request,
                                                     FeedbackReply* reply) {
    FeedbackRecord record;
    try {
        record = FeedbackRecord::from_json(json::parse(request->feedback_json()));
    } catch (const std::exception& e) {
        SystemMonitor::global_feedback_rejected++;
        reply->set_accepted(false);
        reply->set_rejection(to_string(FeedbackRejection::InvalidRecord));
        reply->set_outcome_json(FeedbackOutcome::rejected(FeedbackRejection::InvalidRecord, e.what()).to_json().dump());
        return grpc::Status::OK;
    }

    try {
        auto outcome = orchestrator_->handle_feedback(record);
        reply->set_accepted(outcome.accepted);
        reply->set_rejection(to_string(outcome.rejection));
        reply->set_outcome_json(outcome.to_json().dump(-1, ' ', false, json::error_handler_t::replace));
        return grpc::Status::OK;
    } catch (const std::exception& e) {
        spdlog::error("💥 Feedback {} failed: {}", record.feedback_id, e.what());
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
}

grpc::Status OrchestratorServiceImpl::GetTelemetry(grpc::ServerContext* /*context*/,
                                                   const TelemetryRequest* request,
                                                   TelemetryReply* reply) {
    const auto& c = orchestrator_->components();
    size_t limit = request->trace_limit() > 0 ? request->trace_limit() : 50;

    reply->set_metrics_json(SystemMonitor::snapshot_json().dump());
    reply->set_traces_json(c.traces->get_traces_json(limit).dump(-1, ' ', false, json::error_handler_t::replace));

    json weights = {{"gating_version", c.gating->version()}};
    if (traversal_) weights["traversal"] = traversal_->to_json();
    reply->set_weights_json(weights.dump());
    return grpc::Status::OK;
}

} // namespace merlt
