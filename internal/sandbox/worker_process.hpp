#pragma once

#include <sys/types.h>

#include <cstdint>

namespace arena::sandbox {

/*
  Body of a forked sandbox worker. Never returns.

  Before serving any request the worker:
      - dies with its parent (PR_SET_PDEATHSIG)
      - drops every inherited descriptor except the channel
      - sets PR_SET_NO_NEW_PRIVS
      - caps file size, process count and core size at zero
      - caps its address space at current usage + memory_limit_bytes + slack

  Then it answers LoadProgram / Invocation frames on the channel until the
  parent closes it. The worker never logs.
*/
[[noreturn]] void RunWorkerProcess(int channel_fd, pid_t parent_pid, std::uint64_t memory_limit_bytes);

} // namespace arena::sandbox
