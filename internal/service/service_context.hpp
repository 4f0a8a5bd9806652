#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"

namespace arena::db {
class Repository;
}

namespace arena::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<arena::db::Repository> repository;

  // Server-wide run configuration; CreateRun overlays the request's fields.
  arena::runtime::config::RunConfig run_defaults;

  // CSV impression files are only opened from inside this directory. Empty
  // means unrestricted.
  std::string impressions_dir;
};

} // namespace arena::service
