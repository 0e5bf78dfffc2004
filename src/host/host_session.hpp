#pragma once

#include <filesystem>
#include <string>

namespace fleetcap::host {

// Session facts the host exposes to its plugins.
class IHostSession {
public:
  virtual ~IHostSession() = default;

  // Per-session storage root owned by the host. Plugins write below it.
  virtual std::filesystem::path StorageDirectory() const = 0;
  virtual std::string SessionId() const = 0;
};

// Lifecycle callbacks the host drives. Each call is synchronous from the
// host's point of view and returns once the plugin finished its work.
class IRecordingPlugin {
public:
  virtual ~IRecordingPlugin() = default;

  virtual std::string Name() const = 0;
  virtual bool OnSessionStart(std::string& error) = 0;
  virtual bool OnSessionEnd(std::string& error) = 0;
};

} // namespace fleetcap::host
