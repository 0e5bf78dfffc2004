#include "devices/device_controller.hpp"

#include "core/logging/logger.hpp"

#include <condition_variable>
#include <exception>
#include <utility>

namespace fleetcap::devices {

namespace {

// Rendezvous between the caller and the worker for one command. The worker
// owns a shared reference, so a caller that gave up on a timeout can return
// while the command keeps running.
struct PendingCommand {
  std::mutex mu;
  std::condition_variable cv;
  bool completed = false;
  bool abandoned = false;
  bool ok = false;
  std::string detail;
};

std::string TimeoutDetail(std::chrono::milliseconds timeout) {
  return "no response within " + std::to_string(timeout.count()) + " ms";
}

} // namespace

DeviceController::DeviceController(DeviceIdentifier identifier,
                                   std::unique_ptr<IDeviceTransport> transport,
                                   DeviceControllerOptions options,
                                   core::logging::Logger& logger)
    : identifier_(std::move(identifier)),
      transport_(std::move(transport)),
      options_(options),
      logger_(logger) {
  handle_.identifier = identifier_;
}

DeviceController::~DeviceController() {
  Close();
}

bool DeviceController::Connect(std::string& error) {
  {
    std::lock_guard<std::mutex> lock(state_mu_);
    if (handle_.state == DeviceState::kReady || handle_.state == DeviceState::kRecording) {
      error.clear();
      return true;
    }
    if (handle_.state == DeviceState::kClosed) {
      error = FormatFleetError(FleetErrorCode::kStateConflict, "connect", identifier_,
                               "controller is closed");
      return false;
    }
    handle_.state = DeviceState::kConnecting;
  }

  if (transport_ == nullptr) {
    SetState(DeviceState::kDisconnected);
    error = FormatFleetError(FleetErrorCode::kConnection, "open", identifier_,
                             "no transport available for device");
    return false;
  }

  if (!Execute("open", FleetErrorCode::kConnection, options_.command_timeout,
               [](IDeviceTransport& transport, std::string& detail) {
                 return transport.Open(detail);
               },
               error)) {
    CloseTransportOnWorker();
    SetState(DeviceState::kDisconnected);
    return false;
  }

  // Without the video preset group the shutter would not record video, so
  // this step decides whether the device joins the session.
  if (!Execute("load_video_preset_group", FleetErrorCode::kConnection, options_.command_timeout,
               [](IDeviceTransport& transport, std::string& detail) {
                 return transport.LoadVideoPresetGroup(detail);
               },
               error)) {
    CloseTransportOnWorker();
    SetState(DeviceState::kDisconnected);
    return false;
  }

  // Recording is refused while turbo mode is on.
  if (!Execute("disable_turbo_mode", FleetErrorCode::kConnection, options_.command_timeout,
               [](IDeviceTransport& transport, std::string& detail) {
                 return transport.SetTurboMode(false, detail);
               },
               error)) {
    CloseTransportOnWorker();
    SetState(DeviceState::kDisconnected);
    return false;
  }

  // Cameras lose their clock across power cycles; a failed sync only costs
  // accurate file timestamps.
  std::string clock_error;
  if (!Execute("set_date_time", FleetErrorCode::kCommand, options_.command_timeout,
               [](IDeviceTransport& transport, std::string& detail) {
                 return transport.SetDateTime(std::chrono::system_clock::now(), detail);
               },
               clock_error)) {
    logger_.Warn("device clock sync failed; continuing",
                 {{"device_id", identifier_}, {"operation", "set_date_time"},
                  {"error", clock_error}});
  }

  {
    std::lock_guard<std::mutex> lock(state_mu_);
    if (handle_.state == DeviceState::kClosed) {
      error = FormatFleetError(FleetErrorCode::kStateConflict, "connect", identifier_,
                               "controller closed while connecting");
      return false;
    }
    handle_.state = DeviceState::kReady;
    handle_.turbo_enabled = false;
  }
  logger_.Info("device connected", {{"device_id", identifier_}});
  error.clear();
  return true;
}

bool DeviceController::SetShutter(const bool enabled, std::string& error) {
  const std::string_view operation = enabled ? "shutter_on" : "shutter_off";
  if (!RequireConnected(operation, error)) {
    return false;
  }

  if (!Execute(operation, FleetErrorCode::kCommand, options_.command_timeout,
               [enabled](IDeviceTransport& transport, std::string& detail) {
                 return transport.SetShutter(enabled, detail);
               },
               error)) {
    return false;
  }

  SetState(enabled ? DeviceState::kRecording : DeviceState::kReady);
  return true;
}

bool DeviceController::ListMedia(MediaInventory& inventory, std::string& error) {
  if (!RequireConnected("list_media", error)) {
    return false;
  }

  // Filled on the worker; only read here after the command completed.
  auto listed = std::make_shared<MediaInventory>();
  if (!Execute("list_media", FleetErrorCode::kCommand, options_.command_timeout,
               [listed](IDeviceTransport& transport, std::string& detail) {
                 return transport.ListMedia(*listed, detail);
               },
               error)) {
    return false;
  }

  inventory = std::move(*listed);
  return true;
}

bool DeviceController::SetTurboMode(const bool enabled, std::string& error) {
  const std::string_view operation = enabled ? "enable_turbo_mode" : "disable_turbo_mode";
  if (!RequireConnected(operation, error)) {
    return false;
  }

  if (!Execute(operation, FleetErrorCode::kCommand, options_.command_timeout,
               [enabled](IDeviceTransport& transport, std::string& detail) {
                 return transport.SetTurboMode(enabled, detail);
               },
               error)) {
    return false;
  }

  std::lock_guard<std::mutex> lock(state_mu_);
  handle_.turbo_enabled = enabled;
  return true;
}

bool DeviceController::DownloadArtifact(const std::string& filename,
                                        const std::filesystem::path& dest_path,
                                        std::string& error) {
  if (!RequireConnected("download_artifact", error)) {
    return false;
  }
  return Execute("download_artifact", FleetErrorCode::kTransfer, options_.transfer_timeout,
                 [filename, dest_path](IDeviceTransport& transport, std::string& detail) {
                   return transport.DownloadFile(filename, dest_path, detail);
                 },
                 error);
}

bool DeviceController::DownloadMetadata(const std::string& filename,
                                        const std::filesystem::path& dest_path,
                                        std::string& error) {
  if (!RequireConnected("download_metadata", error)) {
    return false;
  }
  return Execute("download_metadata", FleetErrorCode::kTransfer, options_.transfer_timeout,
                 [filename, dest_path](IDeviceTransport& transport, std::string& detail) {
                   return transport.DownloadMetadata(filename, dest_path, detail);
                 },
                 error);
}

void DeviceController::Close() {
  {
    std::lock_guard<std::mutex> lock(state_mu_);
    if (handle_.state == DeviceState::kClosed) {
      return;
    }
    handle_.state = DeviceState::kClosed;
  }

  CloseTransportOnWorker();
  worker_.Stop();
  logger_.Debug("device controller closed", {{"device_id", identifier_}});
}

DeviceHandle DeviceController::Snapshot() const {
  std::lock_guard<std::mutex> lock(state_mu_);
  return handle_;
}

DeviceState DeviceController::state() const {
  std::lock_guard<std::mutex> lock(state_mu_);
  return handle_.state;
}

bool DeviceController::Execute(std::string_view operation, const FleetErrorCode failure_code,
                               const std::chrono::milliseconds timeout, Command command,
                               std::string& error) {
  if (unresponsive_.load()) {
    error = FormatFleetError(FleetErrorCode::kCommandTimeout, operation, identifier_,
                             "device unresponsive; an earlier command is still in flight");
    return false;
  }

  auto pending = std::make_shared<PendingCommand>();
  const bool posted = worker_.Post([this, pending, command = std::move(command)]() {
    bool ok = false;
    std::string detail;
    try {
      ok = command(*transport_, detail);
    } catch (const std::exception& ex) {
      ok = false;
      detail = std::string("transport threw: ") + ex.what();
    }

    {
      std::lock_guard<std::mutex> lock(pending->mu);
      pending->completed = true;
      pending->ok = ok;
      pending->detail = std::move(detail);
      if (pending->abandoned) {
        unresponsive_.store(false);
      }
    }
    pending->cv.notify_all();
  });

  if (!posted) {
    error = FormatFleetError(FleetErrorCode::kStateConflict, operation, identifier_,
                             "controller is closed");
    return false;
  }

  std::unique_lock<std::mutex> lock(pending->mu);
  if (timeout.count() > 0) {
    pending->cv.wait_for(lock, timeout, [&pending]() { return pending->completed; });
  } else {
    pending->cv.wait(lock, [&pending]() { return pending->completed; });
  }

  if (!pending->completed) {
    // The worker clears the flag under the same lock once the call returns.
    pending->abandoned = true;
    unresponsive_.store(true);
    error = FormatFleetError(FleetErrorCode::kCommandTimeout, operation, identifier_,
                             TimeoutDetail(timeout));
    return false;
  }

  if (!pending->ok) {
    error = FormatFleetError(failure_code, operation, identifier_,
                             pending->detail.empty() ? "device reported failure"
                                                     : pending->detail);
    return false;
  }

  error.clear();
  return true;
}

bool DeviceController::RequireConnected(std::string_view operation, std::string& error) const {
  std::lock_guard<std::mutex> lock(state_mu_);
  if (handle_.state == DeviceState::kReady || handle_.state == DeviceState::kRecording) {
    return true;
  }
  error = FormatFleetError(FleetErrorCode::kStateConflict, operation, identifier_,
                           std::string("device is ") + ToString(handle_.state));
  return false;
}

void DeviceController::CloseTransportOnWorker() {
  if (transport_ == nullptr) {
    return;
  }
  // Queued behind any in-flight command so Close never overlaps another call.
  // Post only fails after Close() already queued the same call.
  (void)worker_.Post([this]() { transport_->Close(); });
}

void DeviceController::SetState(const DeviceState state) {
  std::lock_guard<std::mutex> lock(state_mu_);
  if (handle_.state == DeviceState::kClosed) {
    return;
  }
  handle_.state = state;
}

} // namespace fleetcap::devices
