#pragma once

#include "devices/device_transport.hpp"
#include "devices/device_types.hpp"
#include "discovery/discovery_listener.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace fleetcap::backends::sim {

// One simulated camera and its fault injection knobs.
struct SimDeviceSpec {
  devices::DeviceIdentifier name;
  // Raw advertised names. Empty means the camera advertises
  // "<name>._gopro-web._tcp.local." twice (IPv4 and IPv6 records).
  std::vector<std::string> advertisements;
  devices::MediaInventory initial_media;
  // Files the camera finalizes each time a recording stops.
  std::uint32_t files_per_recording = 1;
  // Camera is still recording when the session connects.
  bool recording_at_start = false;

  bool fail_open = false;
  bool fail_preset = false;
  bool fail_set_clock = false;
  bool fail_shutter_on = false;
  bool fail_shutter_off = false;
  bool fail_list_media = false;
  // Leading attempts of every file download that fail with a transient error.
  std::uint32_t download_failures = 0;
  // Added to every control command.
  std::chrono::milliseconds command_latency{0};
};

struct SimFleetConfig {
  std::vector<SimDeviceSpec> devices;
  // Listener Start() fails, as when the mDNS socket cannot be bound.
  bool fail_listener_start = false;
};

namespace detail {
struct SimFleetState;
}

// Deterministic, hardware-free fleet of cameras.
//
// Listeners and transports created here share the fleet's device state, so a
// file "recorded" through one transport shows up in a later ListMedia call.
// Every transport call is appended to a journal ("d1:shutter_off") that tests
// use to check command ordering across devices.
class SimFleet {
public:
  explicit SimFleet(SimFleetConfig config);

  std::unique_ptr<discovery::IDiscoveryListener> CreateListener() const;
  devices::DeviceTransportFactory TransportFactory() const;

  std::vector<std::string> Journal() const;
  // Current on-camera inventory; empty for unknown devices.
  devices::MediaInventory Media(const devices::DeviceIdentifier& name) const;
  bool IsRecording(const devices::DeviceIdentifier& name) const;
  bool IsOpen(const devices::DeviceIdentifier& name) const;

private:
  std::shared_ptr<detail::SimFleetState> state_;
};

// Advertised names a device spec produces, with defaults applied.
std::vector<std::string> AdvertisementsFor(const SimDeviceSpec& spec);

} // namespace fleetcap::backends::sim
