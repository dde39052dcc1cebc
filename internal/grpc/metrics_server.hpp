#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "semconv/checker/v1.hpp"
#include "internal/service/compliance_service.hpp"

namespace semconv::grpc {

/*
  OTLP MetricsService endpoint. Thin adapter over ComplianceService.
*/
class MetricsServer final : public opentelemetry::proto::collector::metrics::v1::MetricsService::Service {
public:
  explicit MetricsServer(std::shared_ptr<semconv::service::ComplianceService> svc);

  ::grpc::Status Export(::grpc::ServerContext*,
                        const semconv::checker::v1::ExportMetricsServiceRequest*,
                        semconv::checker::v1::ExportMetricsServiceResponse*) override;

private:
  std::shared_ptr<semconv::service::ComplianceService> service_;
};

}
