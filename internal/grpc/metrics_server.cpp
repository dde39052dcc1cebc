#include "metrics_server.hpp"

#include "grpc_error.hpp"
#include "partial_success.hpp"

namespace semconv::grpc {

MetricsServer::MetricsServer(std::shared_ptr<semconv::service::ComplianceService> svc) : service_(std::move(svc)) {
}

::grpc::Status MetricsServer::Export(::grpc::ServerContext* ctx,
                                     const semconv::checker::v1::ExportMetricsServiceRequest* req,
                                     semconv::checker::v1::ExportMetricsServiceResponse* resp) {
  try {
    auto reply = service_->Export(req, [ctx] { return ctx != nullptr && ctx->IsCancelled(); });
    if (!reply.status.ok() && reply.response.has_partial_success()) {
      AttachPartialSuccess(ctx, reply.response.partial_success());
    }
    if (resp != nullptr) {
      *resp = std::move(reply.response);
    }
    return reply.status;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace semconv::grpc
