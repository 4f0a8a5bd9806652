#include "internal/db/api/repository.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

namespace arena::db {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not found";
    case ErrorCode::AlreadyExists: return "already exists";
    case ErrorCode::Conflict: return "conflict";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::ConstraintViolation: return "constraint violation";
    case ErrorCode::IOError: return "io error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::InternalError: return "internal error";
  }
  return "unknown";
}

std::string SerializeRunResult(const arena::core::v1::RunResult& result) {
  std::string out;
  {
    google::protobuf::io::StringOutputStream raw(&out);
    google::protobuf::io::CodedOutputStream  coded(&raw);
    coded.SetSerializationDeterministic(true);
    result.SerializeToCodedStream(&coded);
  }
  return out;
}

} // namespace arena::db
