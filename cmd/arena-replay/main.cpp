#include <google/protobuf/util/json_util.h>

#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/replay/impression_source.hpp"
#include "internal/replay/replay_engine.hpp"
#include "internal/scoreboard/scoreboard.hpp"
#include "internal/util/uuid.hpp"

namespace {

arena::replay::ReplayEngine* g_engine = nullptr;

void HandleSignal(int) {
  if (g_engine) g_engine->Cancel();
}

void Usage() {
  std::cerr << "Usage: arena-replay --impressions <file.csv> --strategy <name>=<file.bid>[:budget] ...\n"
            << "                    [--config <config.yaml>] [--scoreboard-only]\n"
            << "\n"
            << "Writes one JSON Run Result per line to stdout, then the final scoreboard.\n";
}

std::string ReadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot read " + path);
  }
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

// name=path[:budget]
arena::replay::StrategySubmission ParseStrategyArg(const std::string& arg) {
  const auto eq = arg.find('=');
  if (eq == std::string::npos || eq == 0 || eq + 1 == arg.size()) {
    throw std::runtime_error("bad --strategy '" + arg + "', expected name=path[:budget]");
  }

  arena::replay::StrategySubmission submission;
  submission.name = arg.substr(0, eq);

  auto       path  = arg.substr(eq + 1);
  const auto colon = path.rfind(':');
  if (colon != std::string::npos) {
    const auto budget = path.substr(colon + 1);
    std::size_t consumed = 0;
    try {
      submission.starting_budget = std::stod(budget, &consumed);
    } catch (const std::exception&) {
      throw std::runtime_error("bad budget '" + budget + "' in --strategy '" + arg + "'");
    }
    if (consumed != budget.size()) {
      throw std::runtime_error("bad budget '" + budget + "' in --strategy '" + arg + "'");
    }
    path.resize(colon);
  }

  submission.source = ReadFile(path);
  return submission;
}

std::string ToJson(const google::protobuf::Message& message) {
  std::string                             out;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  auto status = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) {
    throw std::runtime_error("json encoding failed: " + std::string(status.message()));
  }
  return out;
}

} // namespace

int main(int argc, char** argv) {
  std::string                                    config_path;
  std::string                                    impressions_path;
  std::vector<std::string>                       strategy_args;
  bool                                           scoreboard_only = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--impressions" && i + 1 < argc) {
      impressions_path = argv[++i];
    } else if (arg == "--strategy" && i + 1 < argc) {
      strategy_args.emplace_back(argv[++i]);
    } else if (arg == "--scoreboard-only") {
      scoreboard_only = true;
    } else {
      Usage();
      return 1;
    }
  }
  if (impressions_path.empty() || strategy_args.empty()) {
    Usage();
    return 1;
  }

  try {
    arena::runtime::config::RuntimeConfig config;
    if (!config_path.empty()) {
      config = arena::config::ConfigLoader::LoadFromYaml(config_path);
    }

    arena::observability::InitializeTracing(config);
    arena::observability::InitializeMetrics(config);
    arena::observability::InitializeLogging(config, arena::observability::LogSink::kStderr);

    const auto run_id = arena::util::NewRunId();
    arena::replay::ReplayEngine engine(run_id, config.run());

    arena::scoreboard::Scoreboard scoreboard(engine.config().history_interval());

    for (const auto& arg : strategy_args) {
      auto submission = ParseStrategyArg(arg);
      auto validation = engine.Register(submission);
      if (!validation.accepted()) {
        std::cerr << "rejected " << submission.name << ": " << validation.reason() << "\n";
        scoreboard.RecordRejection(submission.name, validation);
      }
    }

    engine.Attach(std::make_shared<arena::replay::CsvImpressionSource>(impressions_path));

    g_engine = &engine;
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    auto summary = engine.Run([&](const arena::core::v1::RunResult& result) {
      scoreboard.Update(result);
      if (!scoreboard_only) std::cout << ToJson(result) << "\n";
    });

    g_engine = nullptr;

    std::cout << ToJson(scoreboard.Snapshot()) << std::endl;

    if (summary.state == arena::model::RunState::kAborted) {
      std::cerr << "run aborted: " << summary.abort_reason << "\n";
    }

    arena::observability::ShutdownLogging();
    arena::observability::ShutdownMetrics();
    arena::observability::ShutdownTracing();
    return summary.state == arena::model::RunState::kCompleted ? 0 : 3;
  } catch (const std::exception& e) {
    g_engine = nullptr;
    std::cerr << "arena-replay: " << e.what() << "\n";
    arena::observability::ShutdownLogging();
    arena::observability::ShutdownMetrics();
    arena::observability::ShutdownTracing();
    return 2;
  }
}
