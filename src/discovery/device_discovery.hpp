#pragma once

#include "devices/device_types.hpp"
#include "discovery/discovery_listener.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace fleetcap::core::logging {
class Logger;
}

namespace fleetcap::discovery {

// mDNS service type advertised by wired action cameras.
inline constexpr std::string_view kDefaultServiceType = "_gopro-web._tcp.local.";

struct DiscoveryOptions {
  std::string service_type = std::string(kDefaultServiceType);
  // Discovery ends once no new identifier arrived for this long.
  std::chrono::milliseconds quiescence_timeout{2'000};
  // Hard cap on total discovery time. Zero disables the cap.
  std::chrono::milliseconds max_window{0};
};

struct DiscoveryResult {
  // Distinct identifiers in first-seen order.
  std::vector<devices::DeviceIdentifier> identifiers;
  std::size_t advertisements_seen = 0;
  std::chrono::milliseconds elapsed{0};
};

// Bare identifier of an advertised name: everything before the first '.'.
devices::DeviceIdentifier StripServiceSuffix(std::string_view advertised_name);

// Collects distinct device identifiers until the quiescence window expires.
//
// The window restarts only when a previously unseen identifier arrives;
// repeated advertisements of known devices do not extend it. Finding zero
// devices is a successful result. Returns false with a DISCOVERY_ERROR only
// when the listener cannot be started or reports a transport error.
bool DiscoverDevices(IDiscoveryListener& listener, const DiscoveryOptions& options,
                     core::logging::Logger& logger, DiscoveryResult& result, std::string& error);

} // namespace fleetcap::discovery
