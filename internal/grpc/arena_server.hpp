#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "arena/services/v1/arena_service.grpc.pb.h"
#include "internal/service/arena_service.hpp"

namespace arena::grpc {

/*
  Thin transport adapter: unpacks the call, delegates to ArenaService and
  maps exceptions to status codes.
*/
class ArenaServer final : public arena::services::v1::ArenaService::Service {
 public:
  explicit ArenaServer(std::shared_ptr<arena::service::ArenaService> svc);

  ::grpc::Status ValidateStrategy(::grpc::ServerContext*, const arena::services::v1::ValidateStrategyRequest*,
                                  arena::services::v1::ValidateStrategyResponse*) override;

  ::grpc::Status CreateRun(::grpc::ServerContext*, const arena::services::v1::CreateRunRequest*,
                           arena::services::v1::CreateRunResponse*) override;

  ::grpc::Status StartRun(::grpc::ServerContext*, const arena::services::v1::StartRunRequest*,
                          google::protobuf::Empty*) override;

  ::grpc::Status CancelRun(::grpc::ServerContext*, const arena::services::v1::CancelRunRequest*,
                           google::protobuf::Empty*) override;

  ::grpc::Status GetRun(::grpc::ServerContext*, const arena::services::v1::GetRunRequest*,
                        arena::services::v1::RunInfo*) override;

  ::grpc::Status ListRunResults(::grpc::ServerContext*, const arena::services::v1::ListRunResultsRequest*,
                                arena::services::v1::ListRunResultsResponse*) override;

  ::grpc::Status StreamRunResults(::grpc::ServerContext*, const arena::services::v1::StreamRunResultsRequest*,
                                  ::grpc::ServerWriter<arena::core::v1::RunResult>*) override;

  ::grpc::Status GetScoreboard(::grpc::ServerContext*, const arena::services::v1::GetScoreboardRequest*,
                               arena::core::v1::ScoreboardSnapshot*) override;

 private:
  std::shared_ptr<arena::service::ArenaService> service_;
};

} // namespace arena::grpc
