#include "fleet/retrying_transfer.hpp"

#include "core/logging/logger.hpp"
#include "devices/error_mapper.hpp"

#include <thread>

namespace fleetcap::fleet {

namespace {

TransferAttemptResult RunAttempts(const TransferOp& op, const RetryPolicy& policy,
                                  core::logging::Logger* logger, std::string_view operation,
                                  std::string_view device_id) {
  TransferAttemptResult result;
  if (policy.max_attempts == 0U) {
    result.error = "no transfer attempts allowed";
    return result;
  }

  for (std::uint32_t attempt = 1; attempt <= policy.max_attempts; ++attempt) {
    ++result.attempts_used;
    std::string attempt_error;
    if (op(attempt_error)) {
      result.succeeded = true;
      result.error.clear();
      return result;
    }

    result.error = attempt_error;
    result.structural_failure = devices::IsStructuralTransferError(attempt_error);
    if (logger != nullptr) {
      logger->Warn("transfer attempt failed",
                   {{"operation", operation},
                    {"device_id", device_id},
                    {"attempt", std::to_string(attempt)},
                    {"max_attempts", std::to_string(policy.max_attempts)},
                    {"retryable", result.structural_failure ? "false" : "true"},
                    {"error", attempt_error}});
    }
    if (result.structural_failure) {
      return result;
    }
    if (attempt < policy.max_attempts && policy.backoff.count() > 0) {
      std::this_thread::sleep_for(policy.backoff);
    }
  }

  return result;
}

} // namespace

TransferAttemptResult AttemptWithRetry(const TransferOp& op, const RetryPolicy& policy,
                                       core::logging::Logger& logger,
                                       std::string_view operation,
                                       std::string_view device_id) {
  return RunAttempts(op, policy, &logger, operation, device_id);
}

bool Attempt(const TransferOp& op, const std::uint32_t max_attempts) {
  return RunAttempts(op, RetryPolicy{.max_attempts = max_attempts}, nullptr, "", "").succeeded;
}

} // namespace fleetcap::fleet
