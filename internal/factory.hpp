#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/catalog/catalog.hpp"
#include "internal/check/compliance_checker.hpp"
#include "internal/runtime/one_shot_gate.hpp"

namespace semconv::factory {

/*
  Application

  Owns everything the server needs for the lifetime of the process.
  one_shot is null in service mode.
*/
struct Application {
  std::shared_ptr<const check::ComplianceChecker> checker;
  std::shared_ptr<runtime::OneShotGate> one_shot;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Compiles the match table and resource schema against the catalog.
  Throws util::ConfigError (invalid pattern, unknown group).
*/
std::shared_ptr<const check::ComplianceChecker> BuildChecker(
    const semconv::runtime::config::RuntimeConfig& config,
    const catalog::Catalog& catalog);

/*
  Build

  Composition root: loads the catalog, builds the checker and the gRPC
  services. Any configuration problem throws before a single call is served.
*/
Application Build(const semconv::runtime::config::RuntimeConfig& config);

}
