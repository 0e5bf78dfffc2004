#pragma once

namespace fleetcap::core::errors {

// Process-exit contract for the fleetcap CLI.
//
// 0/1/2 keep their conventional meaning (success, command failure, usage).
// The remaining values separate the session-level structural failures so host
// scripts can tell a broken config from a network or disk problem.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kDiscoveryFailed = 20,
  kStorageFailed = 21,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace fleetcap::core::errors
