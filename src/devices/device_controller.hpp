#pragma once

#include "devices/command_worker.hpp"
#include "devices/device_transport.hpp"
#include "devices/device_types.hpp"
#include "devices/error_mapper.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace fleetcap::core::logging {
class Logger;
}

namespace fleetcap::devices {

struct DeviceControllerOptions {
  // Upper bound for one control command. Zero waits indefinitely.
  std::chrono::milliseconds command_timeout{10'000};
  // Upper bound for one download call. Zero waits indefinitely.
  std::chrono::milliseconds transfer_timeout{0};
};

// Owns one device's transport and serializes every call to it on a private
// CommandWorker. Public methods block the calling thread until the command
// finished or timed out; callers fan out across controllers for concurrency.
//
// All failures are returned as FormatFleetError text so the stable code
// travels with the message into logs and phase reports.
class DeviceController {
public:
  DeviceController(DeviceIdentifier identifier, std::unique_ptr<IDeviceTransport> transport,
                   DeviceControllerOptions options, core::logging::Logger& logger);
  ~DeviceController();

  DeviceController(const DeviceController&) = delete;
  DeviceController& operator=(const DeviceController&) = delete;

  // Opens the channel, selects the video preset group and disables turbo
  // mode; any of those failing is a CONNECTION_ERROR and leaves the channel
  // closed. The clock sync that follows is best effort. Connecting an
  // already-connected controller is a no-op.
  bool Connect(std::string& error);

  // Idempotent: enabling an already-recording device is forwarded and is not
  // an error.
  bool SetShutter(bool enabled, std::string& error);

  bool ListMedia(MediaInventory& inventory, std::string& error);

  bool SetTurboMode(bool enabled, std::string& error);

  bool DownloadArtifact(const std::string& filename, const std::filesystem::path& dest_path,
                        std::string& error);

  bool DownloadMetadata(const std::string& filename, const std::filesystem::path& dest_path,
                        std::string& error);

  // Releases the channel and stops the worker. Safe to call repeatedly.
  void Close();

  const DeviceIdentifier& identifier() const {
    return identifier_;
  }

  DeviceHandle Snapshot() const;
  DeviceState state() const;

  // True while a timed-out command is still blocking the channel.
  bool unresponsive() const {
    return unresponsive_.load();
  }

private:
  using Command = std::function<bool(IDeviceTransport&, std::string&)>;

  bool Execute(std::string_view operation, FleetErrorCode failure_code,
               std::chrono::milliseconds timeout, Command command, std::string& error);
  bool RequireConnected(std::string_view operation, std::string& error) const;
  void CloseTransportOnWorker();
  void SetState(DeviceState state);

  const DeviceIdentifier identifier_;
  std::unique_ptr<IDeviceTransport> transport_;
  const DeviceControllerOptions options_;
  core::logging::Logger& logger_;

  mutable std::mutex state_mu_;
  DeviceHandle handle_;

  std::atomic<bool> unresponsive_{false};

  // Declared last so the worker is joined before the members it uses go away.
  CommandWorker worker_;
};

} // namespace fleetcap::devices
