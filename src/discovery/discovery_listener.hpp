#pragma once

#include <chrono>
#include <string>

namespace fleetcap::discovery {

enum class ListenerWaitStatus {
  kAdvertisement,
  kTimeout,
  kError,
};

// Service-advertisement source (mDNS browser or a simulated fleet).
//
// Yields raw advertised names such as "GP12345678._gopro-web._tcp.local.";
// the same device may be advertised repeatedly (IPv4 and IPv6 records).
class IDiscoveryListener {
public:
  virtual ~IDiscoveryListener() = default;

  // Begins browsing for `service_type`. Failure is fatal to discovery.
  virtual bool Start(const std::string& service_type, std::string& error) = 0;

  // Blocks up to `timeout` for the next advertisement.
  virtual ListenerWaitStatus WaitNext(std::chrono::milliseconds timeout,
                                      std::string& advertised_name,
                                      std::string& error) = 0;

  // Ends browsing. Safe to call when not started.
  virtual void Stop() = 0;
};

} // namespace fleetcap::discovery
