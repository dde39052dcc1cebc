#pragma once

#include "opentelemetry/proto/common/v1/common.pb.h"
#include "opentelemetry/proto/resource/v1/resource.pb.h"
#include "opentelemetry/proto/metrics/v1/metrics.pb.h"

#include "opentelemetry/proto/collector/metrics/v1/metrics_service.pb.h"
#include "opentelemetry/proto/collector/metrics/v1/metrics_service.grpc.pb.h"

namespace semconv::checker::v1 {
using namespace ::opentelemetry::proto::common::v1;
using namespace ::opentelemetry::proto::resource::v1;
using namespace ::opentelemetry::proto::metrics::v1;
using namespace ::opentelemetry::proto::collector::metrics::v1;
}
