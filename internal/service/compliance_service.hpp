#pragma once

#include "internal/check/compliance_checker.hpp"
#include "internal/check/verdict.hpp"
#include "service_context.hpp"
#include "semconv/checker/v1.hpp"

namespace semconv::service {

class ComplianceService {
public:
  explicit ComplianceService(ServiceContext ctx);

  // Checks one export call and shapes the reply. In one-shot mode the
  // verdict is also offered to the gate.
  check::ExportReply
  Export(const semconv::checker::v1::ExportMetricsServiceRequest* req,
         const check::ComplianceChecker::CancelCheck& cancelled = {});

private:
  ServiceContext ctx_;
};

}
