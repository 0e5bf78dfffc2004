#include "host/recording_plugin.hpp"

#include "core/logging/logger.hpp"

#include <utility>

namespace fleetcap::host {

std::filesystem::path ResolveVideosDirectory(const IHostSession& host) {
  return host.StorageDirectory() / std::string(kVideosDirName);
}

std::unique_ptr<RecordingPlugin> RecordingPlugin::OnPluginInit(const IHostSession& host,
                                                               RecordingPluginDependencies deps,
                                                               core::logging::Logger& logger,
                                                               std::string& error) {
  logger.SetSessionId(host.SessionId());
  const std::filesystem::path videos_dir = ResolveVideosDirectory(host);

  auto coordinator = std::make_unique<fleet::FleetCoordinator>(
      std::move(deps.options), std::move(deps.listener), std::move(deps.transport_factory),
      videos_dir, logger);
  std::unique_ptr<RecordingPlugin> plugin(new RecordingPlugin(std::move(coordinator), logger));

  if (!plugin->coordinator_->Arm(plugin->arm_report_, error)) {
    logger.Error("plugin init failed", {{"plugin", std::string(kRecordingPluginName)},
                                        {"error", error}});
    return nullptr;
  }
  logger.Info("plugin initialized", {{"plugin", std::string(kRecordingPluginName)},
                                     {"storage_dir", videos_dir.string()}});
  return plugin;
}

RecordingPlugin::RecordingPlugin(std::unique_ptr<fleet::FleetCoordinator> coordinator,
                                 core::logging::Logger& logger)
    : coordinator_(std::move(coordinator)), logger_(logger) {}

std::string RecordingPlugin::Name() const {
  return std::string(kRecordingPluginName);
}

bool RecordingPlugin::OnSessionStart(std::string& error) {
  if (!coordinator_->StartRecording(start_report_, error)) {
    logger_.Error("session start rejected", {{"error", error}});
    return false;
  }
  return true;
}

bool RecordingPlugin::OnSessionEnd(std::string& error) {
  if (!coordinator_->EndSession(end_report_, error)) {
    logger_.Error("session end failed", {{"error", error}});
    return false;
  }
  return true;
}

} // namespace fleetcap::host
