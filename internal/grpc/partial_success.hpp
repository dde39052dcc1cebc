#pragma once

#include <optional>
#include <string>

#include <grpcpp/grpcpp.h>

#include "semconv/checker/v1.hpp"

namespace semconv::grpc {

/*
  A non-OK status drops the response body, so a rejecting reply carries its
  ExportMetricsPartialSuccess in binary trailing metadata instead.
  Header-only so semconvctl can decode it without the checker core.
*/

inline constexpr const char* kPartialSuccessTrailer = "semconv-partial-success-bin";

inline void AttachPartialSuccess(::grpc::ServerContext* ctx, const semconv::checker::v1::ExportMetricsPartialSuccess& partial) {
  if (ctx != nullptr) {
    ctx->AddTrailingMetadata(kPartialSuccessTrailer, partial.SerializeAsString());
  }
}

inline std::optional<semconv::checker::v1::ExportMetricsPartialSuccess> ReadPartialSuccess(const ::grpc::ClientContext& ctx) {
  const auto& trailers = ctx.GetServerTrailingMetadata();
  const auto  it       = trailers.find(kPartialSuccessTrailer);
  if (it == trailers.end()) {
    return std::nullopt;
  }

  semconv::checker::v1::ExportMetricsPartialSuccess partial;
  if (!partial.ParseFromArray(it->second.data(), static_cast<int>(it->second.size()))) {
    return std::nullopt;
  }
  return partial;
}

} // namespace semconv::grpc
