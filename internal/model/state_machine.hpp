#pragma once

#include <cstdint>
#include <string_view>

#include "arena/core/v1/types.pb.h"

namespace arena::model {

/*
  Run lifecycle:

      Initialized -> Running -> Completed
                  \          \-> Aborted
                   \-> Aborted
*/
enum class RunState : std::uint8_t {
  kInitialized = 1,
  kRunning     = 2,
  kCompleted   = 3,
  kAborted     = 4,
};

constexpr bool IsTerminal(RunState state) {
  return state == RunState::kCompleted || state == RunState::kAborted;
}

constexpr bool CanTransition(RunState from, RunState to) {
  if (IsTerminal(from)) {
    return false;
  }
  switch (to) {
    case RunState::kRunning: return from == RunState::kInitialized;
    case RunState::kCompleted: return from == RunState::kRunning;
    case RunState::kAborted: return true;
    default: return false;
  }
}

constexpr arena::core::v1::RunState ToProto(RunState state) {
  switch (state) {
    case RunState::kInitialized: return arena::core::v1::RUN_STATE_INITIALIZED;
    case RunState::kRunning: return arena::core::v1::RUN_STATE_RUNNING;
    case RunState::kCompleted: return arena::core::v1::RUN_STATE_COMPLETED;
    case RunState::kAborted: return arena::core::v1::RUN_STATE_ABORTED;
  }
  return arena::core::v1::RUN_STATE_UNSPECIFIED;
}

constexpr RunState FromProto(arena::core::v1::RunState state) {
  switch (state) {
    case arena::core::v1::RUN_STATE_RUNNING: return RunState::kRunning;
    case arena::core::v1::RUN_STATE_COMPLETED: return RunState::kCompleted;
    case arena::core::v1::RUN_STATE_ABORTED: return RunState::kAborted;
    default: return RunState::kInitialized;
  }
}

constexpr std::string_view ToString(RunState state) {
  switch (state) {
    case RunState::kInitialized:
      return "initialized";
    case RunState::kRunning:
      return "running";
    case RunState::kCompleted:
      return "completed";
    case RunState::kAborted:
      return "aborted";
  }
  return "unspecified";
}

} // namespace arena::model
