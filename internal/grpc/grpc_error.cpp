#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace arena::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace arena::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  // ConfigError derives from InfrastructureError; a bad config in a request is the caller's fault.
  if (dynamic_cast<const ConfigError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const InfrastructureError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace arena::grpc
