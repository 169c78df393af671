#pragma once
#include <memory>
#include <grpcpp/grpcpp.h>
#include "orchestrator.grpc.pb.h"
#include "orchestrator.hpp"
#include "traversal_weights.hpp"

namespace merlt {

class OrchestratorServiceImpl final : public OrchestratorService::Service {
public:
    OrchestratorServiceImpl(std::shared_ptr<Orchestrator> orchestrator,
                            std::shared_ptr<TraversalWeightStore> traversal)
        : orchestrator_(std::move(orchestrator)), traversal_(std::move(traversal)) {}

    grpc::Status HandleQuery(grpc::ServerContext* context,
                             const QueryRequest* request,
                             grpc::ServerWriter<QueryEvent>* writer) override;

    grpc::Status SubmitFeedback(grpc::ServerContext* context,
                                const FeedbackRequest* request,
                                FeedbackReply* reply) override;

    grpc::Status GetTelemetry(grpc::ServerContext* context,
                              const TelemetryRequest* request,
                              TelemetryReply* reply) override;

private:
    std::shared_ptr<Orchestrator> orchestrator_;
    std::shared_ptr<TraversalWeightStore> traversal_;
};

} // namespace merlt
