#pragma once

#include <string>
#include <vector>

namespace fleetcap::devices {

// Bare device name taken from the advertised service name, e.g. "GP12345678"
// from "GP12345678._gopro-web._tcp.local.". Join key between inventories.
using DeviceIdentifier = std::string;

// Filenames reported by a device at one point in time, in device order.
using MediaInventory = std::vector<std::string>;

enum class DeviceState {
  kDisconnected,
  kConnecting,
  kReady,
  kRecording,
  kClosed,
};

inline const char* ToString(DeviceState state) {
  switch (state) {
  case DeviceState::kDisconnected:
    return "disconnected";
  case DeviceState::kConnecting:
    return "connecting";
  case DeviceState::kReady:
    return "ready";
  case DeviceState::kRecording:
    return "recording";
  case DeviceState::kClosed:
    return "closed";
  }
  return "disconnected";
}

// Point-in-time view of one controlled device.
struct DeviceHandle {
  DeviceIdentifier identifier;
  DeviceState state = DeviceState::kDisconnected;
  bool turbo_enabled = false;
};

} // namespace fleetcap::devices
