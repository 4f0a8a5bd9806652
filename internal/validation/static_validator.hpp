#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "arena/core/v1/types.pb.h"
#include "internal/script/parser.hpp"

namespace arena::validation {

inline constexpr std::string_view kEntryPointName  = "bidding_strategy";
inline constexpr std::size_t      kEntryPointArity = 2;

/*
  Static gate in front of the sandbox.

  Checks, in order and stopping at the first failure:
      1. the source parses as BidScript
      2. no capability-granting construct is named (filesystem, network,
         process, dynamic import, reflection, dunder names, imports other
         than math, unconditional self-recursion)
      3. exactly one bidding_strategy(ctx, state) exists

  Never executes any part of the source.
*/
class StaticValidator {
 public:
  explicit StaticValidator(script::ParseLimits limits = {});

  arena::core::v1::ValidationResult Validate(std::string_view source) const;

 private:
  script::ParseLimits limits_;
};

// Removes a surrounding Markdown code fence (```lang ... ```) if present.
std::string StripCodeFences(std::string_view source);

arena::core::v1::ValidationResult Accepted();
arena::core::v1::ValidationResult Rejected(arena::core::v1::ValidationErrorKind kind, std::string detail);

bool IsDeniedName(std::string_view name);

} // namespace arena::validation
