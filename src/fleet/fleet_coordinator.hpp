#pragma once

#include "devices/device_controller.hpp"
#include "devices/device_transport.hpp"
#include "discovery/device_discovery.hpp"
#include "discovery/discovery_listener.hpp"
#include "events/event_model.hpp"
#include "fleet/fan_out.hpp"
#include "fleet/fleet_session.hpp"
#include "fleet/inventory_differ.hpp"
#include "fleet/media_download.hpp"
#include "fleet/retrying_transfer.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fleetcap::core::logging {
class Logger;
}

namespace fleetcap::fleet {

enum class SessionState {
  kIdle,
  kArmed,
  kRecording,
  kEnded,
};

const char* ToString(SessionState state);

struct CoordinatorOptions {
  discovery::DiscoveryOptions discovery;
  devices::DeviceControllerOptions controller;
  std::size_t max_parallel = kDefaultMaxParallel;
  RetryPolicy retry;
  // Pull new media off the cameras after the manifest is written.
  bool download_after_session = false;
};

struct DeviceOutcome {
  devices::DeviceIdentifier device_id;
  bool ok = false;
  std::string error;
};

// Per-device results of one fan-out round, sorted by device id.
struct PhaseReport {
  std::string phase;
  std::vector<DeviceOutcome> outcomes;

  std::size_t succeeded() const;
  std::size_t failed() const;
};

struct ArmReport {
  discovery::DiscoveryResult discovery;
  PhaseReport connect;
  PhaseReport safety_stop;
  PhaseReport baseline;
};

struct EndReport {
  PhaseReport stop;
  PhaseReport inventory;
  InventoryDiff diff;
  std::filesystem::path manifest_path;
  std::vector<TransferResult> transfers;
};

// Drives the fleet through Idle -> Armed -> Recording -> Ended.
//
// Each entry point blocks until its fan-out rounds completed. Phases run in
// strict order; inside a phase, devices are commanded concurrently and one
// device's failure never rolls back or blocks another. Calling an entry point
// out of order fails with STATE_CONFLICT and changes nothing.
class FleetCoordinator {
public:
  FleetCoordinator(CoordinatorOptions options,
                   std::unique_ptr<discovery::IDiscoveryListener> listener,
                   devices::DeviceTransportFactory transport_factory,
                   std::filesystem::path storage_dir, core::logging::Logger& logger);
  ~FleetCoordinator();

  FleetCoordinator(const FleetCoordinator&) = delete;
  FleetCoordinator& operator=(const FleetCoordinator&) = delete;

  // Idle -> Armed. Creates the storage directory, discovers and connects the
  // fleet, stops any device left recording, then captures each device's
  // baseline inventory. Returns false only on structural failures (storage,
  // discovery); per-device failures drop that device and are reported.
  bool Arm(ArmReport& report, std::string& error);

  // Armed -> Recording. Enables every shutter concurrently.
  bool StartRecording(PhaseReport& report, std::string& error);

  // Recording -> Ended. Stops every shutter, then reads every inventory,
  // diffs against the baseline, writes the manifest, optionally downloads
  // new media, and closes all devices.
  bool EndSession(EndReport& report, std::string& error);

  // Closes every device of the current session. Safe at any point; an armed
  // or recording session moves to Ended and cannot be resumed.
  void Shutdown();

  SessionState state() const;
  std::vector<devices::DeviceIdentifier> ConnectedDevices() const;
  InventoryMap PreSessionInventory() const;

  const std::filesystem::path& storage_dir() const {
    return storage_dir_;
  }

private:
  bool RequireState(SessionState expected, const char* operation, std::string& error) const;
  void ConnectFleet(const std::vector<devices::DeviceIdentifier>& identifiers,
                    PhaseReport& report);
  void ShutterRound(bool enabled, PhaseReport& report);
  InventoryMap InventoryRound(PhaseReport& report);
  void DropDevices(const std::vector<devices::DeviceIdentifier>& identifiers);
  std::vector<TransferResult> DownloadRound(const InventoryDiff& diff);
  void Emit(events::EventType type, std::map<std::string, std::string> payload);

  const CoordinatorOptions options_;
  std::unique_ptr<discovery::IDiscoveryListener> listener_;
  devices::DeviceTransportFactory transport_factory_;
  const std::filesystem::path storage_dir_;
  core::logging::Logger& logger_;

  // Serializes the entry points against each other.
  std::mutex phase_mu_;

  // Guards state_, session_ and appends to session_->controllers.
  mutable std::mutex mu_;
  SessionState state_ = SessionState::kIdle;
  std::unique_ptr<FleetSession> session_;
};

} // namespace fleetcap::fleet
