#include "arena_server.hpp"

#include "grpc_error.hpp"

namespace arena::grpc {

using namespace arena::services::v1;

ArenaServer::ArenaServer(std::shared_ptr<arena::service::ArenaService> svc) : service_(std::move(svc)) {
}

::grpc::Status ArenaServer::ValidateStrategy(::grpc::ServerContext*, const ValidateStrategyRequest* req,
                                             ValidateStrategyResponse* resp) {
  try {
    *resp = service_->ValidateStrategy(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ArenaServer::CreateRun(::grpc::ServerContext*, const CreateRunRequest* req, CreateRunResponse* resp) {
  try {
    *resp = service_->CreateRun(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ArenaServer::StartRun(::grpc::ServerContext*, const StartRunRequest* req, google::protobuf::Empty*) {
  try {
    service_->StartRun(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ArenaServer::CancelRun(::grpc::ServerContext*, const CancelRunRequest* req, google::protobuf::Empty*) {
  try {
    service_->CancelRun(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ArenaServer::GetRun(::grpc::ServerContext*, const GetRunRequest* req, RunInfo* resp) {
  try {
    *resp = service_->GetRun(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ArenaServer::ListRunResults(::grpc::ServerContext*, const ListRunResultsRequest* req,
                                           ListRunResultsResponse* resp) {
  try {
    *resp = service_->ListRunResults(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ArenaServer::StreamRunResults(::grpc::ServerContext* context, const StreamRunResultsRequest* req,
                                             ::grpc::ServerWriter<arena::core::v1::RunResult>* writer) {
  try {
    service_->StreamRunResults(
        *req, [writer](const arena::core::v1::RunResult& result) { return writer->Write(result); },
        [context] { return context->IsCancelled(); });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ArenaServer::GetScoreboard(::grpc::ServerContext*, const GetScoreboardRequest* req,
                                          arena::core::v1::ScoreboardSnapshot* resp) {
  try {
    *resp = service_->GetScoreboard(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace arena::grpc
