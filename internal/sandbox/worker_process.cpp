#include "internal/sandbox/worker_process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <unistd.h>

#include <cstdlib>
#include <exception>
#include <memory>
#include <new>

#include "arena/sandbox/v1/worker.pb.h"
#include "internal/sandbox/evaluation.hpp"
#include "internal/sandbox/wire.hpp"
#include "internal/script/parser.hpp"
#include "internal/script/script_error.hpp"

namespace arena::sandbox {

namespace {

// Headroom for the interpreter's own bookkeeping on top of the script budget.
constexpr std::uint64_t kAddressSpaceSlack = 64ull * 1024 * 1024;
constexpr int           kMaxDescriptorScan = 1 << 16;

std::uint64_t CurrentAddressSpaceBytes() {
  const int fd = ::open("/proc/self/statm", O_RDONLY | O_CLOEXEC);
  if (fd < 0) return 0;
  char          buffer[128] = {};
  const ssize_t n           = ::read(fd, buffer, sizeof(buffer) - 1);
  ::close(fd);
  if (n <= 0) return 0;
  const unsigned long long pages = std::strtoull(buffer, nullptr, 10);
  return pages * static_cast<std::uint64_t>(::sysconf(_SC_PAGESIZE));
}

void SetLimit(int resource, rlim_t value) {
  rlimit limit{value, value};
  // Lowering a limit cannot fail for an unprivileged process; a failure
  // here means the hard limit was already lower, which is stricter still.
  (void)::setrlimit(resource, &limit);
}

void RestrictProcess(int channel_fd, pid_t parent_pid, std::uint64_t memory_limit_bytes) {
  ::prctl(PR_SET_PDEATHSIG, SIGKILL);
  if (::getppid() != parent_pid) {
    ::_exit(0);
  }

  const std::uint64_t address_space = CurrentAddressSpaceBytes();

  const int null_fd = ::open("/dev/null", O_RDWR);
  if (null_fd >= 0) {
    ::dup2(null_fd, STDIN_FILENO);
    ::dup2(null_fd, STDOUT_FILENO);
    ::dup2(null_fd, STDERR_FILENO);
  }

  rlimit files{};
  if (::getrlimit(RLIMIT_NOFILE, &files) != 0) {
    files.rlim_cur = RLIM_INFINITY;
  }
  const int max_fd = files.rlim_cur == RLIM_INFINITY || files.rlim_cur > static_cast<rlim_t>(kMaxDescriptorScan)
                         ? kMaxDescriptorScan
                         : static_cast<int>(files.rlim_cur);
  for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) {
    if (fd != channel_fd) ::close(fd);
  }

  ::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
  SetLimit(RLIMIT_FSIZE, 0);
  SetLimit(RLIMIT_NPROC, 0);
  SetLimit(RLIMIT_CORE, 0);
  if (memory_limit_bytes > 0 && address_space > 0) {
    SetLimit(RLIMIT_AS, static_cast<rlim_t>(address_space + memory_limit_bytes + kAddressSpaceSlack));
  }
}

void Serve(int channel_fd) {
  using arena::sandbox::v1::WorkerRequest;
  using arena::sandbox::v1::WorkerResponse;

  std::unique_ptr<script::Interpreter> interpreter;
  std::uint64_t                        memory_limit = 0;

  while (true) {
    WorkerRequest request;
    if (wire::ReadFrame(channel_fd, request) != wire::ReadStatus::kOk) {
      return;
    }

    WorkerResponse response;
    if (request.has_load()) {
      try {
        auto program = std::make_shared<const script::Program>(script::Parse(request.load().source()));
        interpreter  = std::make_unique<script::Interpreter>(std::move(program), ToScriptLimits(request.load().limits()));
        memory_limit = request.load().limits().memory_limit_bytes();
        response.mutable_loaded();
      } catch (const script::ScriptError& e) {
        response.mutable_fault()->set_kind(arena::core::v1::FAULT_KIND_RUNTIME_EXCEPTION);
        response.mutable_fault()->set_reason(e.what());
      }
    } else if (request.has_invoke()) {
      if (!interpreter) {
        response.set_invocation_id(request.invoke().invocation_id());
        response.mutable_fault()->set_kind(arena::core::v1::FAULT_KIND_RUNTIME_EXCEPTION);
        response.mutable_fault()->set_reason("no program loaded");
      } else {
        response = Evaluate(*interpreter, request.invoke(), memory_limit);
      }
    } else {
      return;
    }

    if (!wire::WriteFrame(channel_fd, response)) {
      return;
    }
  }
}

} // namespace

void RunWorkerProcess(int channel_fd, pid_t parent_pid, std::uint64_t memory_limit_bytes) {
  RestrictProcess(channel_fd, parent_pid, memory_limit_bytes);

  int status = 0;
  try {
    Serve(channel_fd);
  } catch (const std::bad_alloc&) {
    // Address-space cap hit outside the interpreter's accounting.
    arena::sandbox::v1::WorkerResponse response;
    response.mutable_fault()->set_kind(arena::core::v1::FAULT_KIND_RESOURCE_EXCEEDED);
    response.mutable_fault()->set_reason("out of memory");
    (void)wire::WriteFrame(channel_fd, response);
    status = 3;
  } catch (const std::exception&) {
    status = 1;
  }
  ::_exit(status);
}

} // namespace arena::sandbox
