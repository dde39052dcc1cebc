#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace semconv::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace semconv::util;

  if (dynamic_cast<const Cancelled*>(&e)) {
    return {::grpc::StatusCode::CANCELLED, e.what()};
  }
  if (dynamic_cast<const ConfigError*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace semconv::grpc
