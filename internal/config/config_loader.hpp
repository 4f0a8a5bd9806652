#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace arena::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Enum values may be
  written in short form (clearing_rule: second_price, isolation: in_process,
  transport: http). All errors are util::ConfigError.
*/
class ConfigLoader {
 public:
  static arena::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static arena::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills unset run fields with the built-in defaults.
  static arena::runtime::config::RunConfig WithDefaults(const arena::runtime::config::RunConfig& run);

  // Overlays the fields set in `overrides` on top of `base`.
  static arena::runtime::config::RunConfig Merge(const arena::runtime::config::RunConfig& base,
                                                 const arena::runtime::config::RunConfig& overrides);

  static void ValidateRunConfig(const arena::runtime::config::RunConfig& run);
};

inline constexpr double        kDefaultStartingBudget         = 1000.0;
inline constexpr std::uint32_t kDefaultDisqualifyAfterNFaults = 3;
inline constexpr std::uint32_t kDefaultInvocationTimeoutMs    = 100;
inline constexpr std::uint64_t kDefaultInvocationMemoryBytes  = 64ull << 20;
inline constexpr std::uint64_t kDefaultMaxSteps               = 1'000'000;
inline constexpr std::uint32_t kDefaultMaxCallDepth           = 32;
inline constexpr std::uint32_t kDefaultHistoryInterval        = 50;

} // namespace arena::config
