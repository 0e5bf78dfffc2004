#include "core/logging/logger.hpp"
#include "fleet/retrying_transfer.hpp"
#include "../common/assertions.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <string>

namespace {

using fleetcap::core::logging::LogLevel;
using fleetcap::core::logging::Logger;
using fleetcap::fleet::Attempt;
using fleetcap::fleet::AttemptWithRetry;
using fleetcap::fleet::RetryPolicy;
using fleetcap::fleet::TransferAttemptResult;
using fleetcap::tests::common::AssertContains;
using fleetcap::tests::common::AssertEq;
using fleetcap::tests::common::Fail;

void TestAlwaysFailingOpUsesEveryAttempt() {
  int calls = 0;
  const bool ok = Attempt(
      [&calls](std::string& error) {
        ++calls;
        error = "timed out";
        return false;
      },
      3);
  if (ok) {
    Fail("always-failing op must not succeed");
  }
  AssertEq(calls, 3, "calls for always-failing op");
}

void TestSucceedsOnSecondAttempt() {
  int calls = 0;
  const bool ok = Attempt(
      [&calls](std::string& error) {
        ++calls;
        if (calls < 2) {
          error = "connection reset by peer";
          return false;
        }
        return true;
      },
      3);
  if (!ok) {
    Fail("op succeeding on attempt 2 must succeed");
  }
  AssertEq(calls, 2, "calls for op succeeding on attempt 2");
}

void TestZeroAttemptsNeverCalls() {
  int calls = 0;
  const bool ok = Attempt(
      [&calls](std::string&) {
        ++calls;
        return true;
      },
      0);
  if (ok || calls != 0) {
    Fail("zero attempts must not call the op");
  }
}

void TestFailedAttemptsAreLogged() {
  std::ostringstream logs;
  Logger logger(LogLevel::kInfo, logs);
  int calls = 0;
  const TransferAttemptResult result = AttemptWithRetry(
      [&calls](std::string& error) {
        ++calls;
        error = "HTTP 503";
        return false;
      },
      RetryPolicy{.max_attempts = 2}, logger, "download_artifact", "d1");

  if (result.succeeded || result.attempts_used != 2U || result.structural_failure) {
    Fail("unexpected retry result for transient failures");
  }
  AssertEq(result.error, std::string("HTTP 503"), "last error");
  const std::string text = logs.str();
  AssertContains(text, "operation=\"download_artifact\"");
  AssertContains(text, "device_id=\"d1\"");
  AssertContains(text, "attempt=\"2\"");
}

void TestStructuralFailureStopsRetrying() {
  std::ostringstream logs;
  Logger logger(LogLevel::kInfo, logs);
  int calls = 0;
  const TransferAttemptResult result = AttemptWithRetry(
      [&calls](std::string& error) {
        ++calls;
        error = "write failed: No space left on device";
        return false;
      },
      RetryPolicy{.max_attempts = 5}, logger, "download_artifact", "d1");

  AssertEq(calls, 1, "calls before structural stop");
  if (!result.structural_failure || result.succeeded) {
    Fail("disk full must be reported as structural");
  }
  AssertContains(logs.str(), "retryable=\"false\"");
}

void TestBackoffDelaysRetries() {
  std::ostringstream logs;
  Logger logger(LogLevel::kInfo, logs);
  const auto started = std::chrono::steady_clock::now();
  const TransferAttemptResult result = AttemptWithRetry(
      [](std::string& error) {
        error = "timed out";
        return false;
      },
      RetryPolicy{.max_attempts = 3, .backoff = std::chrono::milliseconds(30)}, logger,
      "download_metadata", "d2");
  if (result.attempts_used != 3U) {
    Fail("expected three attempts");
  }
  // Two gaps between three attempts.
  if (std::chrono::steady_clock::now() - started < std::chrono::milliseconds(60)) {
    Fail("backoff was not applied between attempts");
  }
}

} // namespace

int main() {
  TestAlwaysFailingOpUsesEveryAttempt();
  TestSucceedsOnSecondAttempt();
  TestZeroAttemptsNeverCalls();
  TestFailedAttemptsAreLogged();
  TestStructuralFailureStopsRetrying();
  TestBackoffDelaysRetries();
  std::cout << "retrying_transfer_smoke: ok\n";
  return 0;
}
