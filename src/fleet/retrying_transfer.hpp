#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace fleetcap::core::logging {
class Logger;
}

namespace fleetcap::fleet {

constexpr std::uint32_t kDefaultTransferAttempts = 3U;

// A fallible transfer step. Returns false with `error` populated on failure.
using TransferOp = std::function<bool(std::string& error)>;

struct RetryPolicy {
  std::uint32_t max_attempts = kDefaultTransferAttempts;
  // Delay between attempts. Zero retries immediately.
  std::chrono::milliseconds backoff{0};
};

struct TransferAttemptResult {
  bool succeeded = false;
  std::uint32_t attempts_used = 0;
  // Set when retrying stopped early because the failure cannot clear on its
  // own (see devices::IsStructuralTransferError).
  bool structural_failure = false;
  std::string error;
};

// Runs `op` until it succeeds or the attempt budget is spent. Structural
// failures end the loop early. Every failed attempt is logged at WARN with
// `operation`, `device_id` and the attempt count.
TransferAttemptResult AttemptWithRetry(const TransferOp& op, const RetryPolicy& policy,
                                       core::logging::Logger& logger,
                                       std::string_view operation,
                                       std::string_view device_id);

// Plain form: true on the first success, false once `max_attempts` calls
// failed. Errors are not logged.
bool Attempt(const TransferOp& op, std::uint32_t max_attempts = kDefaultTransferAttempts);

} // namespace fleetcap::fleet
