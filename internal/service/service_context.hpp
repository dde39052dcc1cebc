#pragma once

#include <memory>

namespace semconv::check { class ComplianceChecker; }
namespace semconv::runtime { class OneShotGate; }

namespace semconv::service {

/*
  Dependency container shared by all services.

  one_shot is null unless the process runs in one-shot mode.
*/
struct ServiceContext {
  std::shared_ptr<const semconv::check::ComplianceChecker> checker;
  std::shared_ptr<semconv::runtime::OneShotGate> one_shot;
};

}
