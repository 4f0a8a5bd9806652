#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/arena_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/service/arena_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"

namespace {

std::shared_ptr<arena::service::ArenaService> BuildService() {
  arena::service::ServiceContext ctx;
  ctx.repository = std::make_shared<arena::db::memory::MemoryRepository>();

  arena::runtime::config::RunConfig run;
  run.set_isolation(arena::runtime::config::ISOLATION_MODE_IN_PROCESS);
  ctx.run_defaults = arena::config::ConfigLoader::WithDefaults(run);
  return std::make_shared<arena::service::ArenaService>(std::move(ctx));
}

void TestExceptionMapping() {
  using arena::grpc::ToStatus;
  assert(ToStatus(arena::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(arena::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(arena::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(arena::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(arena::util::ConfigError("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(arena::util::InfrastructureError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);

  const auto status = ToStatus(arena::util::NotFound("run 42 not found"));
  assert(status.error_message() == "run 42 not found");
}

void TestGetMissingRunReturnsNotFound() {
  arena::grpc::ArenaServer server(BuildService());

  arena::services::v1::GetRunRequest req;
  req.set_run_id("missing-run");
  arena::services::v1::RunInfo resp;
  ::grpc::ServerContext        grpc_ctx;

  const auto status = server.GetRun(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestCreateRunWithoutStrategiesReturnsInvalidArgument() {
  arena::grpc::ArenaServer server(BuildService());

  arena::services::v1::CreateRunRequest req;
  req.mutable_inline_impressions();
  arena::services::v1::CreateRunResponse resp;
  ::grpc::ServerContext                  grpc_ctx;

  const auto status = server.CreateRun(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestValidateStrategyReturnsOk() {
  arena::grpc::ArenaServer server(BuildService());

  arena::services::v1::ValidateStrategyRequest req;
  req.set_source("fn bidding_strategy(ctx, state) { return none; }");
  arena::services::v1::ValidateStrategyResponse resp;
  ::grpc::ServerContext                         grpc_ctx;

  const auto status = server.ValidateStrategy(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.result().accepted());
}

} // namespace

int main() {
  TestExceptionMapping();
  TestGetMissingRunReturnsNotFound();
  TestCreateRunWithoutStrategiesReturnsInvalidArgument();
  TestValidateStrategyReturnsOk();
  std::cout << "arena_unit_grpc_status: pass\n";
  return 0;
}
