#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/service/arena_service.hpp"

namespace arena::factory {

/*
  Long-lived objects of the server process.
*/
struct Application {
  std::shared_ptr<db::Repository>          repository;
  std::shared_ptr<service::ArenaService>   arena_service;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

// Memory unless database.sqlite is configured. The sqlite schema is created
// when missing.
std::shared_ptr<db::Repository> BuildRepository(const arena::runtime::config::RuntimeConfig& config);

/*
  Composition root. The only place that knows concrete repository types.
*/
Application Build(const arena::runtime::config::RuntimeConfig& config);

} // namespace arena::factory
