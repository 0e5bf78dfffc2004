#include "fleet/fleet_coordinator.hpp"

#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "devices/error_mapper.hpp"
#include "events/jsonl_writer.hpp"
#include "fleet/manifest_writer.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <set>
#include <utility>

namespace fleetcap::fleet {

namespace {

using devices::DeviceController;
using devices::DeviceIdentifier;
using devices::FleetErrorCode;
using devices::FormatFleetError;

void SortOutcomes(PhaseReport& report) {
  std::sort(report.outcomes.begin(), report.outcomes.end(),
            [](const DeviceOutcome& lhs, const DeviceOutcome& rhs) {
              return lhs.device_id < rhs.device_id;
            });
}

} // namespace

const char* ToString(const SessionState state) {
  switch (state) {
  case SessionState::kIdle:
    return "idle";
  case SessionState::kArmed:
    return "armed";
  case SessionState::kRecording:
    return "recording";
  case SessionState::kEnded:
    return "ended";
  }
  return "idle";
}

std::size_t PhaseReport::succeeded() const {
  return static_cast<std::size_t>(
      std::count_if(outcomes.begin(), outcomes.end(), [](const DeviceOutcome& o) { return o.ok; }));
}

std::size_t PhaseReport::failed() const {
  return outcomes.size() - succeeded();
}

FleetCoordinator::FleetCoordinator(CoordinatorOptions options,
                                   std::unique_ptr<discovery::IDiscoveryListener> listener,
                                   devices::DeviceTransportFactory transport_factory,
                                   std::filesystem::path storage_dir,
                                   core::logging::Logger& logger)
    : options_(std::move(options)),
      listener_(std::move(listener)),
      transport_factory_(std::move(transport_factory)),
      storage_dir_(std::move(storage_dir)),
      logger_(logger) {}

FleetCoordinator::~FleetCoordinator() {
  Shutdown();
}

bool FleetCoordinator::Arm(ArmReport& report, std::string& error) {
  std::lock_guard<std::mutex> phase_lock(phase_mu_);
  report = ArmReport{};
  if (!RequireState(SessionState::kIdle, "arm", error)) {
    return false;
  }

  std::string storage_error;
  if (!core::EnsureDirectory(storage_dir_, storage_error)) {
    error = FormatFleetError(FleetErrorCode::kStorage, "prepare_storage", "", storage_error);
    logger_.Error("storage directory unavailable", {{"error", error}});
    return false;
  }

  if (listener_ == nullptr) {
    error = FormatFleetError(FleetErrorCode::kDiscovery, "discovery", "",
                             "no discovery listener configured");
    return false;
  }
  if (!discovery::DiscoverDevices(*listener_, options_.discovery, logger_, report.discovery,
                                  error)) {
    logger_.Error("device discovery failed", {{"error", error}});
    return false;
  }
  Emit(events::EventType::kDiscoveryFinished,
       {{"devices_found", std::to_string(report.discovery.identifiers.size())},
        {"advertisements_seen", std::to_string(report.discovery.advertisements_seen)},
        {"elapsed_ms", std::to_string(report.discovery.elapsed.count())}});

  {
    std::lock_guard<std::mutex> lock(mu_);
    session_ = std::make_unique<FleetSession>();
    session_->storage_dir = storage_dir_;
  }

  ConnectFleet(report.discovery.identifiers, report.connect);
  if (ConnectedDevices().empty()) {
    logger_.Warn("no devices connected; the session will record nothing",
                 {{"devices_discovered", std::to_string(report.discovery.identifiers.size())}});
  }

  // A camera may still be recording after an earlier crashed session.
  ShutterRound(false, report.safety_stop);

  // Baselines are complete before StartRecording can issue any shutter-on.
  const InventoryMap baseline = InventoryRound(report.baseline);
  std::vector<DeviceIdentifier> without_baseline;
  for (const DeviceOutcome& outcome : report.baseline.outcomes) {
    if (!outcome.ok) {
      without_baseline.push_back(outcome.device_id);
    }
  }
  if (!without_baseline.empty()) {
    // New files of a device without a baseline cannot be attributed.
    DropDevices(without_baseline);
  }

  std::size_t armed_devices = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    session_->pre_inventory = baseline;
    armed_devices = session_->controllers.size();
    state_ = SessionState::kArmed;
  }

  logger_.Info("fleet armed", {{"devices", std::to_string(armed_devices)},
                               {"storage_dir", storage_dir_.string()}});
  Emit(events::EventType::kSessionArmed, {{"devices", std::to_string(armed_devices)}});
  error.clear();
  return true;
}

bool FleetCoordinator::StartRecording(PhaseReport& report, std::string& error) {
  std::lock_guard<std::mutex> phase_lock(phase_mu_);
  report = PhaseReport{};
  if (!RequireState(SessionState::kArmed, "start_recording", error)) {
    return false;
  }

  ShutterRound(true, report);
  {
    std::lock_guard<std::mutex> lock(mu_);
    state_ = SessionState::kRecording;
  }

  logger_.Info("recording started", {{"devices_recording", std::to_string(report.succeeded())},
                                     {"devices_failed", std::to_string(report.failed())}});
  Emit(events::EventType::kRecordingStarted,
       {{"devices_recording", std::to_string(report.succeeded())},
        {"devices_failed", std::to_string(report.failed())}});
  error.clear();
  return true;
}

bool FleetCoordinator::EndSession(EndReport& report, std::string& error) {
  std::lock_guard<std::mutex> phase_lock(phase_mu_);
  report = EndReport{};
  if (!RequireState(SessionState::kRecording, "end_session", error)) {
    return false;
  }

  // Every shutter is off before any inventory is read; reading while a
  // camera still records would miss the file it is about to finalize.
  ShutterRound(false, report.stop);
  Emit(events::EventType::kRecordingStopped,
       {{"devices_stopped", std::to_string(report.stop.succeeded())},
        {"devices_failed", std::to_string(report.stop.failed())}});

  const InventoryMap post = InventoryRound(report.inventory);

  InventoryMap pre;
  {
    std::lock_guard<std::mutex> lock(mu_);
    pre = session_->pre_inventory;
  }
  report.diff = DiffInventories(pre, post);
  for (const InventoryInconsistency& inconsistency : report.diff.inconsistencies) {
    const std::string detail = FormatFleetError(FleetErrorCode::kInventoryInconsistency,
                                                "diff_inventory", inconsistency.device_id,
                                                inconsistency.message);
    logger_.Error("inventory inconsistency", {{"device_id", inconsistency.device_id},
                                              {"error", detail}});
    Emit(events::EventType::kInventoryInconsistency,
         {{"device_id", inconsistency.device_id}, {"error", detail}});
  }

  // The manifest goes out before any download so a failed transfer can
  // still be recovered by hand from the listed files.
  const bool manifest_written = WriteManifest(storage_dir_, report.diff, report.manifest_path, error);
  if (manifest_written) {
    logger_.Info("manifest written",
                 {{"path", report.manifest_path.string()},
                  {"new_files", std::to_string(report.diff.TotalNewFiles())}});
    Emit(events::EventType::kManifestWritten,
         {{"path", report.manifest_path.string()},
          {"new_files", std::to_string(report.diff.TotalNewFiles())}});
  } else {
    logger_.Error("manifest write failed", {{"error", error}});
  }

  if (options_.download_after_session) {
    report.transfers = DownloadRound(report.diff);
  }

  std::unique_ptr<FleetSession> finished;
  {
    std::lock_guard<std::mutex> lock(mu_);
    finished = std::move(session_);
    state_ = SessionState::kEnded;
  }
  finished->CloseAll();

  logger_.Info("session ended", {{"devices", std::to_string(finished->controllers.size())},
                                 {"new_files", std::to_string(report.diff.TotalNewFiles())}});
  Emit(events::EventType::kSessionEnded,
       {{"new_files", std::to_string(report.diff.TotalNewFiles())},
        {"manifest_written", manifest_written ? "true" : "false"}});

  if (!manifest_written) {
    return false;
  }
  error.clear();
  return true;
}

void FleetCoordinator::Shutdown() {
  std::lock_guard<std::mutex> phase_lock(phase_mu_);
  std::unique_ptr<FleetSession> session;
  {
    std::lock_guard<std::mutex> lock(mu_);
    session = std::move(session_);
    // A session cut short cannot be resumed; later entry points see Ended.
    if (state_ == SessionState::kArmed || state_ == SessionState::kRecording) {
      state_ = SessionState::kEnded;
    }
  }
  if (session != nullptr) {
    session->CloseAll();
    logger_.Info("fleet shut down", {{"devices", std::to_string(session->controllers.size())}});
  }
}

SessionState FleetCoordinator::state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

std::vector<DeviceIdentifier> FleetCoordinator::ConnectedDevices() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<DeviceIdentifier> identifiers;
  if (session_ == nullptr) {
    return identifiers;
  }
  for (const auto& controller : session_->controllers) {
    identifiers.push_back(controller->identifier());
  }
  return identifiers;
}

InventoryMap FleetCoordinator::PreSessionInventory() const {
  std::lock_guard<std::mutex> lock(mu_);
  return session_ == nullptr ? InventoryMap{} : session_->pre_inventory;
}

bool FleetCoordinator::RequireState(const SessionState expected, const char* operation,
                                    std::string& error) const {
  std::lock_guard<std::mutex> lock(mu_);
  const bool needs_session = expected == SessionState::kArmed || expected == SessionState::kRecording;
  if (state_ == expected && (!needs_session || session_ != nullptr)) {
    return true;
  }
  error = FormatFleetError(FleetErrorCode::kStateConflict, operation, "",
                           std::string("session is ") + ToString(state_) + ", expected " +
                               ToString(expected));
  return false;
}

void FleetCoordinator::ConnectFleet(const std::vector<DeviceIdentifier>& identifiers,
                                    PhaseReport& report) {
  report.phase = "connect";
  report.outcomes.resize(identifiers.size());

  RunBounded(identifiers.size(), options_.max_parallel, [&](const std::size_t index) {
    const DeviceIdentifier& identifier = identifiers[index];
    DeviceOutcome& outcome = report.outcomes[index];
    outcome.device_id = identifier;

    std::unique_ptr<devices::IDeviceTransport> transport =
        transport_factory_ ? transport_factory_(identifier) : nullptr;
    auto controller = std::make_unique<DeviceController>(identifier, std::move(transport),
                                                         options_.controller, logger_);
    if (!controller->Connect(outcome.error)) {
      logger_.Warn("dropping device that failed to connect",
                   {{"device_id", identifier}, {"error", outcome.error}});
      return;
    }

    outcome.ok = true;
    std::lock_guard<std::mutex> lock(mu_);
    session_->controllers.push_back(std::move(controller));
  });

  {
    // Connect order is arbitrary; later rounds and reports use id order.
    std::lock_guard<std::mutex> lock(mu_);
    std::sort(session_->controllers.begin(), session_->controllers.end(),
              [](const auto& lhs, const auto& rhs) {
                return lhs->identifier() < rhs->identifier();
              });
  }
  SortOutcomes(report);

  for (const DeviceOutcome& outcome : report.outcomes) {
    if (outcome.ok) {
      Emit(events::EventType::kDeviceConnected, {{"device_id", outcome.device_id}});
    } else {
      Emit(events::EventType::kDeviceDropped,
           {{"device_id", outcome.device_id}, {"phase", "connect"}, {"error", outcome.error}});
    }
  }
}

void FleetCoordinator::ShutterRound(const bool enabled, PhaseReport& report) {
  report.phase = enabled ? "shutter_on" : "shutter_off";
  FleetSession* session = nullptr;
  {
    std::lock_guard<std::mutex> lock(mu_);
    session = session_.get();
  }
  if (session == nullptr) {
    return;
  }

  const auto& controllers = session->controllers;
  report.outcomes.resize(controllers.size());
  RunBounded(controllers.size(), options_.max_parallel, [&](const std::size_t index) {
    DeviceController& controller = *controllers[index];
    DeviceOutcome& outcome = report.outcomes[index];
    outcome.device_id = controller.identifier();
    outcome.ok = controller.SetShutter(enabled, outcome.error);
    if (!outcome.ok) {
      logger_.Warn("shutter command failed", {{"device_id", outcome.device_id},
                                              {"operation", report.phase},
                                              {"error", outcome.error}});
    }
  });

  for (const DeviceOutcome& outcome : report.outcomes) {
    if (!outcome.ok) {
      Emit(events::EventType::kShutterFailed, {{"device_id", outcome.device_id},
                                               {"operation", report.phase},
                                               {"error", outcome.error}});
    }
  }
}

InventoryMap FleetCoordinator::InventoryRound(PhaseReport& report) {
  report.phase = "list_media";
  FleetSession* session = nullptr;
  {
    std::lock_guard<std::mutex> lock(mu_);
    session = session_.get();
  }
  InventoryMap inventories;
  if (session == nullptr) {
    return inventories;
  }

  const auto& controllers = session->controllers;
  std::vector<devices::MediaInventory> listed(controllers.size());
  report.outcomes.resize(controllers.size());
  RunBounded(controllers.size(), options_.max_parallel, [&](const std::size_t index) {
    DeviceController& controller = *controllers[index];
    DeviceOutcome& outcome = report.outcomes[index];
    outcome.device_id = controller.identifier();
    outcome.ok = controller.ListMedia(listed[index], outcome.error);
    if (!outcome.ok) {
      logger_.Warn("media inventory read failed",
                   {{"device_id", outcome.device_id}, {"error", outcome.error}});
    }
  });

  for (std::size_t i = 0; i < controllers.size(); ++i) {
    if (report.outcomes[i].ok) {
      logger_.Debug("media inventory captured",
                    {{"device_id", report.outcomes[i].device_id},
                     {"files", std::to_string(listed[i].size())}});
      inventories.emplace(report.outcomes[i].device_id, std::move(listed[i]));
    }
  }
  return inventories;
}

void FleetCoordinator::DropDevices(const std::vector<DeviceIdentifier>& identifiers) {
  const std::set<DeviceIdentifier> to_drop(identifiers.begin(), identifiers.end());
  std::vector<std::unique_ptr<DeviceController>> dropped;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto& controllers = session_->controllers;
    auto keep_end = std::stable_partition(
        controllers.begin(), controllers.end(),
        [&to_drop](const auto& controller) { return to_drop.count(controller->identifier()) == 0U; });
    std::move(keep_end, controllers.end(), std::back_inserter(dropped));
    controllers.erase(keep_end, controllers.end());
  }

  for (const auto& controller : dropped) {
    logger_.Warn("dropping device without baseline inventory",
                 {{"device_id", controller->identifier()}});
    Emit(events::EventType::kDeviceDropped,
         {{"device_id", controller->identifier()}, {"phase", "baseline"}});
    controller->Close();
  }
}

std::vector<TransferResult> FleetCoordinator::DownloadRound(const InventoryDiff& diff) {
  FleetSession* session = nullptr;
  {
    std::lock_guard<std::mutex> lock(mu_);
    session = session_.get();
  }
  std::vector<TransferResult> all_results;
  if (session == nullptr) {
    return all_results;
  }

  const auto& controllers = session->controllers;
  std::vector<std::vector<TransferResult>> per_device(controllers.size());
  RunBounded(controllers.size(), options_.max_parallel, [&](const std::size_t index) {
    DeviceController& controller = *controllers[index];
    const auto files = diff.new_files.find(controller.identifier());
    if (files == diff.new_files.end() || files->second.empty()) {
      return;
    }
    per_device[index] =
        DownloadNewMedia(controller, files->second, storage_dir_, options_.retry, logger_);
  });

  for (auto& results : per_device) {
    for (TransferResult& result : results) {
      std::map<std::string, std::string> payload = {
          {"device_id", result.device_id},
          {"file", result.filename},
          {"downloaded", result.downloaded ? "true" : "false"},
          {"metadata_downloaded", result.metadata_downloaded ? "true" : "false"},
          {"artifact_attempts", std::to_string(result.artifact_attempts)},
      };
      const bool complete = result.downloaded && result.metadata_downloaded;
      if (!complete) {
        payload["error"] = result.error;
      }
      Emit(complete ? events::EventType::kTransferSucceeded : events::EventType::kTransferFailed,
           std::move(payload));
      all_results.push_back(std::move(result));
    }
  }
  return all_results;
}

void FleetCoordinator::Emit(const events::EventType type,
                            std::map<std::string, std::string> payload) {
  events::Event event;
  event.ts = std::chrono::system_clock::now();
  event.type = type;
  event.payload = std::move(payload);

  std::filesystem::path written_path;
  std::string error;
  if (!events::AppendEventJsonl(event, storage_dir_, written_path, error)) {
    logger_.Warn("session timeline write failed",
                 {{"event", events::ToJson(type)}, {"error", error}});
  }
}

} // namespace fleetcap::fleet
