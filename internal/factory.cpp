#include "factory.hpp"

#include <string>
#include <utility>

#include "internal/check/match_table.hpp"
#include "internal/grpc/metrics_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/compliance_service.hpp"
#include "internal/service/service_context.hpp"

namespace semconv::factory {

using semconv::observability::IntField;
using semconv::observability::StringField;

std::shared_ptr<const check::ComplianceChecker> BuildChecker(const semconv::runtime::config::RuntimeConfig& config,
                                                             const catalog::Catalog&                        catalog) {
  std::shared_ptr<const check::MatchTable>     table    = std::make_shared<check::MatchTable>(check::MatchTable::Build(config.metrics(), catalog));
  std::shared_ptr<const check::ResourceSchema> resource = std::make_shared<check::ResourceSchema>(check::BuildResourceSchema(config.resource(), catalog));

  SEMCONV_LOG_INFO("match table compiled",
                   {IntField("rules", static_cast<std::int64_t>(table->rules().size())),
                    IntField("resource_attributes", static_cast<std::int64_t>(resource->required.size())),
                    StringField("schema_url", resource->expected_version)});

  return std::make_shared<check::ComplianceChecker>(std::move(table), std::move(resource), config.report_unmatched());
}

/*
    Build full application dependency graph
*/
Application Build(const semconv::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Schema catalog
  // ------------------------------------------------------------------
  std::vector<std::string> paths(config.catalog().paths().begin(), config.catalog().paths().end());
  const auto catalog = catalog::Catalog::LoadFromYaml(paths, config.catalog().schema_url());
  SEMCONV_LOG_INFO("semantic convention catalog loaded",
                   {IntField("groups", static_cast<std::int64_t>(catalog.size())), StringField("schema_url", catalog.Version())});

  // ------------------------------------------------------------------
  // Checker
  // ------------------------------------------------------------------
  app.checker = BuildChecker(config, catalog);
  if (config.one_shot()) {
    app.one_shot = std::make_shared<runtime::OneShotGate>();
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.checker  = app.checker;
  ctx.one_shot = app.one_shot;

  auto compliance_service = std::make_shared<service::ComplianceService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::MetricsServer>(compliance_service));

  return app;
}

} // namespace semconv::factory
