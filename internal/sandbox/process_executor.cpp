#include "internal/sandbox/process_executor.hpp"

#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/sandbox/evaluation.hpp"
#include "internal/sandbox/wire.hpp"
#include "internal/sandbox/worker_process.hpp"
#include "internal/script/parser.hpp"
#include "internal/script/script_error.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace arena::sandbox {

namespace {

using arena::sandbox::v1::WorkerRequest;
using arena::sandbox::v1::WorkerResponse;

constexpr std::chrono::milliseconds kLoadGrace{1000};
constexpr std::chrono::milliseconds kReapGrace{100};

std::string DescribeStatus(int status) {
  if (WIFSIGNALED(status)) {
    return "worker terminated by signal " + std::to_string(WTERMSIG(status));
  }
  if (WIFEXITED(status)) {
    return "worker exited with status " + std::to_string(WEXITSTATUS(status));
  }
  return "worker stopped";
}

pid_t WaitFor(pid_t pid, int* status, int flags) {
  while (true) {
    const pid_t rc = ::waitpid(pid, status, flags);
    if (rc < 0 && errno == EINTR) continue;
    return rc;
  }
}

} // namespace

ProcessExecutor::ProcessExecutor(arena::sandbox::v1::Limits limits) : limits_(std::move(limits)) {
  // Touch the generated descriptors before any fork so children never need
  // protobuf's lazy-initialisation locks.
  WorkerRequest::default_instance();
  WorkerResponse::default_instance();
}

ProcessExecutor::~ProcessExecutor() {
  std::unordered_map<StrategyId, std::shared_ptr<Worker>> workers;
  {
    std::lock_guard lock(mutex_);
    workers.swap(workers_);
  }
  for (auto& [id, worker] : workers) {
    std::lock_guard lock(worker->mutex);
    Stop(*worker, true);
  }
}

void ProcessExecutor::Load(StrategyId id, const std::string& source) {
  try {
    (void)script::Parse(source);
  } catch (const script::ScriptError& e) {
    throw util::InvalidArgument(std::string("strategy source does not parse: ") + e.what());
  }

  auto worker    = std::make_shared<Worker>();
  worker->source = source;

  std::shared_ptr<Worker> replaced;
  {
    std::lock_guard lock(mutex_);
    auto&           slot = workers_[id];
    replaced             = std::move(slot);
    slot                 = std::move(worker);
  }
  if (replaced) {
    std::lock_guard lock(replaced->mutex);
    Stop(*replaced, true);
  }
}

void ProcessExecutor::Unload(StrategyId id) {
  std::shared_ptr<Worker> worker;
  {
    std::lock_guard lock(mutex_);
    auto            it = workers_.find(id);
    if (it == workers_.end()) return;
    worker = std::move(it->second);
    workers_.erase(it);
  }
  std::lock_guard lock(worker->mutex);
  Stop(*worker, true);
}

std::shared_ptr<ProcessExecutor::Worker> ProcessExecutor::Find(StrategyId id) {
  std::lock_guard lock(mutex_);
  auto            it = workers_.find(id);
  if (it == workers_.end()) {
    throw util::NotFound("strategy " + std::to_string(id) + " is not loaded");
  }
  return it->second;
}

std::optional<InvocationOutcome> ProcessExecutor::EnsureRunning(StrategyId id, Worker& worker) {
  if (worker.pid > 0) {
    return std::nullopt;
  }

  int fds[2];
  if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
    throw util::InfrastructureError(std::string("socketpair failed: ") + std::strerror(errno));
  }

  const pid_t parent = ::getpid();
  const pid_t pid    = ::fork();
  if (pid < 0) {
    const int err = errno;
    ::close(fds[0]);
    ::close(fds[1]);
    throw util::InfrastructureError(std::string("fork failed: ") + std::strerror(err));
  }
  if (pid == 0) {
    ::close(fds[0]);
    RunWorkerProcess(fds[1], parent, limits_.memory_limit_bytes());
  }

  ::close(fds[1]);
  worker.pid = pid;
  worker.fd  = fds[0];

  WorkerRequest request;
  auto*         load = request.mutable_load();
  load->set_source(worker.source);
  *load->mutable_limits() = limits_;

  const auto deadline = util::SteadyClock::now() + std::chrono::milliseconds(limits_.timeout_ms()) + kLoadGrace;

  WorkerResponse response;
  if (wire::WriteFrame(worker.fd, request) && wire::ReadFrame(worker.fd, response, deadline) == wire::ReadStatus::kOk &&
      response.has_loaded()) {
    ARENA_LOG_DEBUG("sandbox worker started", {observability::IntField("strategy", id), observability::IntField("pid", pid)});
    return std::nullopt;
  }

  std::string reason = response.has_fault() ? response.fault().reason() : Stop(worker, false).description;
  if (worker.pid > 0) Stop(worker, true);
  observability::Metrics::Instance().RecordWorkerRestart("load_failed");
  ARENA_LOG_WARN("sandbox worker failed to load", {observability::IntField("strategy", id), observability::StringField("reason", reason)});
  return InvocationOutcome::Fault(arena::core::v1::FAULT_KIND_RUNTIME_EXCEPTION, "worker failed to load program: " + reason);
}

ProcessExecutor::Ending ProcessExecutor::Stop(Worker& worker, bool kill_first) {
  Ending ending;
  if (worker.fd >= 0) {
    ::close(worker.fd);
    worker.fd = -1;
  }
  if (worker.pid <= 0) {
    ending.description = "worker not running";
    return ending;
  }

  int status = 0;
  if (!kill_first) {
    const auto give_up = util::SteadyClock::now() + kReapGrace;
    while (util::SteadyClock::now() < give_up) {
      if (WaitFor(worker.pid, &status, WNOHANG) == worker.pid) {
        ending.exited_on_its_own = true;
        ending.description       = DescribeStatus(status);
        worker.pid               = -1;
        return ending;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }

  ::kill(worker.pid, SIGKILL);
  WaitFor(worker.pid, &status, 0);
  worker.pid         = -1;
  ending.description = "worker killed";
  return ending;
}

InvocationOutcome ProcessExecutor::Invoke(StrategyId id, const arena::sandbox::v1::Invocation& invocation) {
  auto            worker = Find(id);
  std::lock_guard lock(worker->mutex);
  auto            start = util::SteadyClock::now();

  auto finish = [&](InvocationOutcome outcome) {
    outcome.latency_ms = util::ElapsedMs(start);
    return outcome;
  };

  if (auto fault = EnsureRunning(id, *worker)) {
    return finish(std::move(*fault));
  }
  // Spawning and loading a fresh worker is not the strategy's time.
  start = util::SteadyClock::now();

  const std::uint64_t invocation_id = worker->next_id++;
  WorkerRequest       request;
  *request.mutable_invoke() = invocation;
  request.mutable_invoke()->set_invocation_id(invocation_id);

  if (!wire::WriteFrame(worker->fd, request)) {
    auto ending = Stop(*worker, false);
    observability::Metrics::Instance().RecordWorkerRestart("crashed");
    ARENA_LOG_WARN("sandbox worker lost", {observability::IntField("strategy", id), observability::StringField("reason", ending.description)});
    return finish(InvocationOutcome::Fault(arena::core::v1::FAULT_KIND_RUNTIME_EXCEPTION, ending.description));
  }

  std::optional<util::SteadyClock::time_point> deadline;
  if (limits_.timeout_ms() > 0) {
    deadline = start + std::chrono::milliseconds(limits_.timeout_ms());
  }

  WorkerResponse response;
  switch (wire::ReadFrame(worker->fd, response, deadline)) {
    case wire::ReadStatus::kOk:
      break;
    case wire::ReadStatus::kTimeout: {
      Stop(*worker, true);
      observability::Metrics::Instance().RecordWorkerRestart("timeout");
      ARENA_LOG_WARN("sandbox worker killed after timeout",
                     {observability::IntField("strategy", id), observability::IntField("timeout_ms", limits_.timeout_ms())});
      return finish(InvocationOutcome::Fault(arena::core::v1::FAULT_KIND_TIMEOUT,
                                             "invocation exceeded " + std::to_string(limits_.timeout_ms()) + " ms"));
    }
    case wire::ReadStatus::kMalformed: {
      auto ending = Stop(*worker, false);
      observability::Metrics::Instance().RecordWorkerRestart(ending.exited_on_its_own ? "crashed" : "malformed");
      if (ending.exited_on_its_own) {
        return finish(InvocationOutcome::Fault(arena::core::v1::FAULT_KIND_RUNTIME_EXCEPTION, ending.description));
      }
      return finish(InvocationOutcome::Fault(arena::core::v1::FAULT_KIND_MALFORMED_BID, "malformed worker response"));
    }
    case wire::ReadStatus::kClosed:
    case wire::ReadStatus::kError: {
      auto ending = Stop(*worker, false);
      observability::Metrics::Instance().RecordWorkerRestart("crashed");
      ARENA_LOG_WARN("sandbox worker lost", {observability::IntField("strategy", id), observability::StringField("reason", ending.description)});
      return finish(InvocationOutcome::Fault(arena::core::v1::FAULT_KIND_RUNTIME_EXCEPTION, ending.description));
    }
  }

  if (response.invocation_id() != invocation_id) {
    // Only a dying worker answers with a foreign id, and only with a fault.
    const bool dying = response.has_fault();
    Stop(*worker, !dying);
    if (dying) {
      return finish(FromResponse(response));
    }
    return finish(InvocationOutcome::Fault(arena::core::v1::FAULT_KIND_MALFORMED_BID, "worker answered a different invocation"));
  }

  return finish(FromResponse(response));
}

} // namespace arena::sandbox
