#include "discovery/device_discovery.hpp"

#include "core/logging/logger.hpp"
#include "devices/error_mapper.hpp"

#include <algorithm>
#include <set>

namespace fleetcap::discovery {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds ElapsedSince(const Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

// Stops the listener on every exit path.
class ListenerSession {
public:
  explicit ListenerSession(IDiscoveryListener& listener) : listener_(listener) {}
  ~ListenerSession() {
    listener_.Stop();
  }

  ListenerSession(const ListenerSession&) = delete;
  ListenerSession& operator=(const ListenerSession&) = delete;

private:
  IDiscoveryListener& listener_;
};

} // namespace

devices::DeviceIdentifier StripServiceSuffix(std::string_view advertised_name) {
  const std::size_t dot = advertised_name.find('.');
  return devices::DeviceIdentifier(advertised_name.substr(0, dot));
}

bool DiscoverDevices(IDiscoveryListener& listener, const DiscoveryOptions& options,
                     core::logging::Logger& logger, DiscoveryResult& result, std::string& error) {
  using devices::FleetErrorCode;
  using devices::FormatFleetError;

  result = DiscoveryResult{};

  if (options.quiescence_timeout.count() <= 0) {
    error = FormatFleetError(FleetErrorCode::kDiscovery, "discovery", "",
                             "quiescence timeout must be positive");
    return false;
  }

  std::string start_error;
  if (!listener.Start(options.service_type, start_error)) {
    error = FormatFleetError(FleetErrorCode::kDiscovery, "start_listener", "", start_error);
    return false;
  }
  const ListenerSession stop_on_exit(listener);

  logger.Info("device discovery started",
              {{"service_type", options.service_type},
               {"quiescence_timeout_ms", std::to_string(options.quiescence_timeout.count())}});

  const Clock::time_point started_at = Clock::now();
  Clock::time_point last_new_at = started_at;
  std::set<devices::DeviceIdentifier> seen;

  while (true) {
    const Clock::time_point now = Clock::now();
    const auto quiet_for = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_new_at);
    if (quiet_for >= options.quiescence_timeout) {
      break;
    }

    std::chrono::milliseconds wait_for = options.quiescence_timeout - quiet_for;
    if (options.max_window.count() > 0) {
      const auto window_used = ElapsedSince(started_at);
      if (window_used >= options.max_window) {
        logger.Warn("device discovery hit its maximum window",
                    {{"max_window_ms", std::to_string(options.max_window.count())},
                     {"devices_found", std::to_string(result.identifiers.size())}});
        break;
      }
      wait_for = std::min(wait_for, options.max_window - window_used);
    }

    std::string advertised_name;
    std::string wait_error;
    const ListenerWaitStatus status = listener.WaitNext(wait_for, advertised_name, wait_error);
    if (status == ListenerWaitStatus::kTimeout) {
      continue;
    }
    if (status == ListenerWaitStatus::kError) {
      result.elapsed = ElapsedSince(started_at);
      error = FormatFleetError(FleetErrorCode::kDiscovery, "wait_advertisement", "", wait_error);
      return false;
    }

    ++result.advertisements_seen;
    devices::DeviceIdentifier identifier = StripServiceSuffix(advertised_name);
    if (identifier.empty()) {
      logger.Debug("ignoring advertisement without identifier", {{"name", advertised_name}});
      continue;
    }
    if (!seen.insert(identifier).second) {
      continue;
    }

    last_new_at = Clock::now();
    logger.Info("device discovered", {{"device_id", identifier}, {"name", advertised_name}});
    result.identifiers.push_back(std::move(identifier));
  }

  result.elapsed = ElapsedSince(started_at);
  logger.Info("device discovery finished",
              {{"devices_found", std::to_string(result.identifiers.size())},
               {"advertisements_seen", std::to_string(result.advertisements_seen)},
               {"elapsed_ms", std::to_string(result.elapsed.count())}});
  error.clear();
  return true;
}

} // namespace fleetcap::discovery
