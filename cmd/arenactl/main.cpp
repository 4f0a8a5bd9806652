#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "arena/services/v1/arena_service.grpc.pb.h"
#include "arena/v1.hpp"

using namespace arena::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  arenactl <addr> validate <file.bid>\n"
            << "  arenactl <addr> create <impressions.csv> <name>=<file.bid>[:budget] ...\n"
            << "  arenactl <addr> start <run_id>\n"
            << "  arenactl <addr> cancel <run_id>\n"
            << "  arenactl <addr> get <run_id>\n"
            << "  arenactl <addr> results <run_id> [start_offset] [max_results]\n"
            << "  arenactl <addr> stream <run_id> [start_offset]\n"
            << "  arenactl <addr> scoreboard <run_id>\n";
}

static bool ReadFile(const std::string& path, std::string* out) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "cannot read " << path << "\n";
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  *out = buffer.str();
  return true;
}

static std::string ToJson(const google::protobuf::Message& message) {
  std::string                              out;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  if (!google::protobuf::util::MessageToJsonString(message, &out, options).ok()) {
    return "<unprintable>";
  }
  return out;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = ArenaService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "validate") {
    ValidateStrategyRequest req;
    if (!ReadFile(argv[3], req.mutable_source())) return 1;

    ValidateStrategyResponse resp;

    auto status = stub->ValidateStrategy(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (resp.result().accepted()) {
      std::cout << "accepted\n";
      return 0;
    }
    std::cout << "rejected: " << resp.result().reason() << "\n";
    return 3;
  }

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    CreateRunRequest req;
    req.set_impressions_csv_path(argv[3]);

    for (int i = 4; i < argc; ++i) {
      const std::string arg = argv[i];
      const auto        eq  = arg.find('=');
      if (eq == std::string::npos || eq == 0) {
        std::cerr << "bad strategy '" << arg << "', expected name=path[:budget]\n";
        return 1;
      }

      auto* strategy = req.add_strategies();
      strategy->set_name(arg.substr(0, eq));

      auto       path  = arg.substr(eq + 1);
      const auto colon = path.rfind(':');
      if (colon != std::string::npos) {
        try {
          strategy->set_starting_budget(std::stod(path.substr(colon + 1)));
        } catch (const std::exception&) {
          std::cerr << "bad budget in '" << arg << "'\n";
          return 1;
        }
        path.resize(colon);
      }
      if (!ReadFile(path, strategy->mutable_source())) return 1;
    }

    CreateRunResponse resp;

    auto status = stub->CreateRun(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "run_id=" << resp.run_id() << "\n";
    for (const auto& registration : resp.registrations()) {
      std::cout << registration.name() << "="
                << (registration.validation().accepted() ? std::string("accepted")
                                                         : "rejected (" + registration.validation().reason() + ")")
                << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "start") {
    StartRunRequest req;
    req.set_run_id(argv[3]);

    google::protobuf::Empty resp;

    auto status = stub->StartRun(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "started\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    CancelRunRequest req;
    req.set_run_id(argv[3]);

    google::protobuf::Empty resp;

    auto status = stub->CancelRun(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "cancelled\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    GetRunRequest req;
    req.set_run_id(argv[3]);

    RunInfo resp;

    auto status = stub->GetRun(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << ToJson(resp) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "results") {
    ListRunResultsRequest req;
    req.set_run_id(argv[3]);
    if (argc >= 5) req.set_start_offset(std::stoull(argv[4]));
    if (argc >= 6) req.set_max_results(static_cast<std::uint32_t>(std::stoul(argv[5])));

    ListRunResultsResponse resp;

    auto status = stub->ListRunResults(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& result : resp.results()) {
      std::cout << ToJson(result) << "\n";
    }
    std::cerr << "next_offset=" << resp.next_offset() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stream") {
    StreamRunResultsRequest req;
    req.set_run_id(argv[3]);
    if (argc >= 5) req.set_start_offset(std::stoull(argv[4]));

    auto reader = stub->StreamRunResults(&ctx, req);

    arena::core::v1::RunResult result;
    while (reader->Read(&result)) {
      std::cout << ToJson(result) << "\n";
    }

    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "scoreboard") {
    GetScoreboardRequest req;
    req.set_run_id(argv[3]);

    arena::core::v1::ScoreboardSnapshot resp;

    auto status = stub->GetScoreboard(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << ToJson(resp) << "\n";
    return 0;
  }

  Usage();
  return 1;
}
