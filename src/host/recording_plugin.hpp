#pragma once

#include "devices/device_transport.hpp"
#include "discovery/discovery_listener.hpp"
#include "fleet/fleet_coordinator.hpp"
#include "host/host_session.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace fleetcap::core::logging {
class Logger;
}

namespace fleetcap::host {

inline constexpr std::string_view kRecordingPluginName = "FleetRecordingPlugin";
// Subdirectory of the host storage root that receives the manifest, the
// session timeline and downloaded media.
inline constexpr std::string_view kVideosDirName = "Videos";

struct RecordingPluginDependencies {
  std::unique_ptr<discovery::IDiscoveryListener> listener;
  devices::DeviceTransportFactory transport_factory;
  fleet::CoordinatorOptions options;
};

// Binds a FleetCoordinator to the host session lifecycle.
class RecordingPlugin final : public IRecordingPlugin {
public:
  // Creates the plugin and arms the fleet: storage directory, discovery,
  // connect, safety stop, baseline inventory. Returns nullptr with `error`
  // set when arming failed structurally.
  static std::unique_ptr<RecordingPlugin> OnPluginInit(const IHostSession& host,
                                                       RecordingPluginDependencies deps,
                                                       core::logging::Logger& logger,
                                                       std::string& error);

  std::string Name() const override;
  bool OnSessionStart(std::string& error) override;
  bool OnSessionEnd(std::string& error) override;

  const fleet::FleetCoordinator& coordinator() const {
    return *coordinator_;
  }
  const fleet::ArmReport& arm_report() const {
    return arm_report_;
  }
  const fleet::EndReport& end_report() const {
    return end_report_;
  }

private:
  RecordingPlugin(std::unique_ptr<fleet::FleetCoordinator> coordinator,
                  core::logging::Logger& logger);

  std::unique_ptr<fleet::FleetCoordinator> coordinator_;
  core::logging::Logger& logger_;
  fleet::ArmReport arm_report_;
  fleet::PhaseReport start_report_;
  fleet::EndReport end_report_;
};

// `<host storage>/Videos`
std::filesystem::path ResolveVideosDirectory(const IHostSession& host);

} // namespace fleetcap::host
