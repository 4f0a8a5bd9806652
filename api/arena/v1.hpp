#pragma once

#include "arena/core/v1/types.pb.h"

#include "arena/services/v1/arena_service.pb.h"
#include "arena/services/v1/arena_service.grpc.pb.h"

namespace arena::v1 {
using namespace ::arena::core::v1;
using namespace ::arena::services::v1;
} // namespace arena::v1
