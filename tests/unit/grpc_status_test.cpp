#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/factory.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/metrics_server.hpp"
#include "internal/grpc/partial_success.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/compliance_service.hpp"
#include "internal/service/service_context.hpp"
#include "test_fixtures.hpp"

namespace {

using namespace semconv::testing;
using semconv::checker::v1::ExportMetricsServiceRequest;
using semconv::checker::v1::ExportMetricsServiceResponse;
using semconv::checker::v1::MetricsService;

semconv::grpc::MetricsServer BuildServer() {
  semconv::service::ServiceContext ctx;
  ctx.checker = MakeChecker(HttpRules(), HttpCatalog());
  return semconv::grpc::MetricsServer(std::make_shared<semconv::service::ComplianceService>(ctx));
}

void TestMissingAttributesReturnFailedPrecondition() {
  LogCapture logs;
  auto       server = BuildServer();

  ExportMetricsServiceRequest req;
  AddGauge(AddScope(AddResource(req, {"service.name"}), "io.opentelemetry.http"), "http.server.duration", {{"http.method"}});

  ExportMetricsServiceResponse resp;
  ::grpc::ServerContext        grpc_ctx;

  const auto status = server.Export(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(status.error_message() == "missing attributes: [io.opentelemetry.http]");
  assert(resp.partial_success().rejected_data_points() == 1);
  assert(resp.partial_success().error_message() == "missing attributes");
}

void TestCompliantExportReturnsOk() {
  LogCapture logs;
  auto       server = BuildServer();

  ExportMetricsServiceRequest req;
  AddGauge(AddScope(AddResource(req, {"service.name"}), "io.opentelemetry.http"), "http.server.duration", {{"http.method", "http.status_code"}});

  ExportMetricsServiceResponse resp;
  ::grpc::ServerContext        grpc_ctx;

  assert(server.Export(&grpc_ctx, &req, &resp).ok());
  assert(!resp.has_partial_success());

  ExportMetricsServiceResponse empty_resp;
  assert(server.Export(&grpc_ctx, nullptr, &empty_resp).ok());
}

void TestExceptionsMapToStatusCodes() {
  assert(semconv::grpc::ToStatus(semconv::util::Cancelled("gone")).error_code() == ::grpc::StatusCode::CANCELLED);
  assert(semconv::grpc::ToStatus(semconv::util::UnknownGroup("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(semconv::grpc::ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(semconv::grpc::ToStatus(std::runtime_error("boom")).error_message() == "boom");
}

void TestOneShotRoundTripOverLoopback() {
  LogCapture logs;

  const auto registry_dir = std::filesystem::temp_directory_path() / "semconv_grpc_status_tests";
  std::filesystem::create_directories(registry_dir);
  {
    std::ofstream out(registry_dir / "registry.yaml");
    out << R"(groups:
  - id: service
    prefix: service
    attributes:
      - id: name
  - id: attributes.http.server
    prefix: http
    attributes:
      - id: method
      - id: status_code
)";
  }

  auto config = HttpRules();
  config.mutable_server()->set_bind_address("127.0.0.1:0");
  config.mutable_catalog()->add_paths(registry_dir.string());
  config.mutable_catalog()->set_schema_url(kSchemaUrl);
  config.mutable_resource()->clear_ignore();
  config.set_one_shot(true);

  auto app = semconv::factory::Build(config);
  assert(app.one_shot != nullptr);

  semconv::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));
  server.Start();
  assert(server.port() > 0);

  auto channel = ::grpc::CreateChannel("127.0.0.1:" + std::to_string(server.port()), ::grpc::InsecureChannelCredentials());
  auto stub    = MetricsService::NewStub(channel);

  ExportMetricsServiceRequest req;
  AddGauge(AddScope(AddResource(req, {"service.name"}), "io.opentelemetry.http"), "http.server.duration", {{"http.method"}});

  ::grpc::ClientContext client_ctx;
  client_ctx.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(10));
  ExportMetricsServiceResponse resp;

  const auto status = stub->Export(&client_ctx, req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(status.error_message() == "missing attributes: [io.opentelemetry.http]");
  // the body is dropped with a non-OK status; the count travels in the trailer
  assert(!resp.has_partial_success());
  const auto partial = semconv::grpc::ReadPartialSuccess(client_ctx);
  assert(partial.has_value());
  assert(partial->rejected_data_points() == 1);
  assert(partial->error_message() == "missing attributes");

  ExportMetricsServiceRequest clean_req;
  AddGauge(AddScope(AddResource(clean_req, {"service.name"}), "io.opentelemetry.http"), "http.server.duration", {{"http.method", "http.status_code"}});

  ::grpc::ClientContext clean_ctx;
  clean_ctx.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(10));
  ExportMetricsServiceResponse clean_resp;
  assert(stub->Export(&clean_ctx, clean_req, &clean_resp).ok());
  assert(!semconv::grpc::ReadPartialSuccess(clean_ctx).has_value());

  const auto verdict = app.one_shot->WaitFor(std::chrono::seconds(5));
  assert(verdict.has_value());
  assert(semconv::check::ExitCode(*verdict) == semconv::check::kExitViolation);

  server.Stop();
}

} // namespace

int main() {
  TestMissingAttributesReturnFailedPrecondition();
  TestCompliantExportReturnsOk();
  TestExceptionsMapToStatusCodes();
  TestOneShotRoundTripOverLoopback();

  std::cout << "semconv_unit_grpc_status: pass\n";
  return 0;
}
