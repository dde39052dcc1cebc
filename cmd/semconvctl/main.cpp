#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include "internal/grpc/partial_success.hpp"
#include "semconv/checker/v1.hpp"

using namespace semconv::checker::v1;

static constexpr int kExitOk        = 0;
static constexpr int kExitFailure   = 1;
static constexpr int kExitViolation = 100;

static void Usage() {
  std::cout << "Usage:\n"
            << "  semconvctl <addr> export <request.json|request.pb> [timeout_ms]\n"
            << "\n"
            << "Sends one ExportMetricsServiceRequest to a semconv checker.\n"
            << "Exit status: 0 accepted, 100 missing attributes, 1 any other failure.\n";
}

static bool EndsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static std::optional<ExportMetricsServiceRequest> ReadRequest(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "cannot open " << path << "\n";
    return std::nullopt;
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();

  ExportMetricsServiceRequest req;
  if (EndsWith(path, ".json")) {
    auto status = google::protobuf::util::JsonStringToMessage(buffer.str(), &req);
    if (!status.ok()) {
      std::cerr << "invalid request JSON: " << status.message() << "\n";
      return std::nullopt;
    }
    return req;
  }

  if (!req.ParseFromString(buffer.str())) {
    std::cerr << "invalid request protobuf in " << path << "\n";
    return std::nullopt;
  }
  return req;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return kExitFailure;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  // ------------------------------------------------------------

  if (cmd == "export") {
    if (argc < 4) {
      Usage();
      return kExitFailure;
    }

    auto req = ReadRequest(argv[3]);
    if (!req) {
      return kExitFailure;
    }

    long timeout_ms = 10'000;
    if (argc >= 5) {
      try {
        timeout_ms = std::stol(argv[4]);
      } catch (const std::exception&) {
        std::cerr << "invalid timeout: " << argv[4] << "\n";
        return kExitFailure;
      }
    }

    auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
    auto stub    = MetricsService::NewStub(channel);

    grpc::ClientContext ctx;
    ctx.set_deadline(std::chrono::system_clock::now() + std::chrono::milliseconds(timeout_ms));

    ExportMetricsServiceResponse resp;
    auto                         status = stub->Export(&ctx, *req, &resp);

    if (status.ok()) {
      std::cout << "accepted\n";
      return kExitOk;
    }

    std::cerr << "status=" << status.error_code() << " " << status.error_message();
    if (const auto partial = semconv::grpc::ReadPartialSuccess(ctx)) {
      std::cerr << " rejected=" << partial->rejected_data_points() << " message=\"" << partial->error_message() << "\"";
    }
    std::cerr << "\n";
    return status.error_code() == grpc::StatusCode::FAILED_PRECONDITION ? kExitViolation : kExitFailure;
  }

  Usage();
  return kExitFailure;
}
