#pragma once

#include "devices/device_types.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace fleetcap::devices {

// Vendor control channel of one camera.
//
// Every call is a blocking network round-trip. Implementations are not
// required to be thread-safe: DeviceController guarantees that at most one
// call is in flight per transport instance.
class IDeviceTransport {
public:
  virtual ~IDeviceTransport() = default;

  // Opens the control channel.
  virtual bool Open(std::string& error) = 0;

  // Selects the video preset group so the shutter records video.
  virtual bool LoadVideoPresetGroup(std::string& error) = 0;

  virtual bool SetTurboMode(bool enabled, std::string& error) = 0;

  // Sets the camera clock to `now` (local wall-clock).
  virtual bool SetDateTime(std::chrono::system_clock::time_point now, std::string& error) = 0;

  virtual bool SetShutter(bool enabled, std::string& error) = 0;

  virtual bool ListMedia(MediaInventory& inventory, std::string& error) = 0;

  // Copies `camera_file` into `local_file`.
  virtual bool DownloadFile(const std::string& camera_file,
                            const std::filesystem::path& local_file,
                            std::string& error) = 0;

  // Copies the telemetry/metadata track of `camera_file` into `local_file`.
  virtual bool DownloadMetadata(const std::string& camera_file,
                                const std::filesystem::path& local_file,
                                std::string& error) = 0;

  // Releases the channel. Must tolerate being called on a never-opened or
  // already-closed transport.
  virtual void Close() = 0;
};

// Creates the transport for a discovered device. May return nullptr when the
// device cannot be addressed; the controller reports that as a connect error.
using DeviceTransportFactory =
    std::function<std::unique_ptr<IDeviceTransport>(const DeviceIdentifier& identifier)>;

} // namespace fleetcap::devices
