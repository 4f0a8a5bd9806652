#pragma once

#include <cstdint>
#include <string>

#include "arena/core/v1/types.pb.h"
#include "config/config.pb.h"

namespace arena::db::model {

/*
  Persistent run row. Run Results live in their own table keyed by
  (run_id, offset).
*/
struct RunRecord {
  std::string id;

  arena::core::v1::RunState state = arena::core::v1::RUN_STATE_INITIALIZED;
  std::string               abort_reason;

  // Resolved run configuration (defaults applied).
  arena::runtime::config::RunConfig config;
  arena::core::v1::StrategyRoster   roster;

  std::uint64_t created_at_ms  = 0;
  // 0 while the run has not finished
  std::uint64_t finished_at_ms = 0;
};

} // namespace arena::db::model
