#pragma once

#include <chrono>
#include <map>
#include <string>

namespace fleetcap::events {

// Session timeline categories. The string forms are part of the
// events.jsonl format, so existing values must not be renamed.
enum class EventType {
  kDiscoveryFinished,
  kDeviceConnected,
  kDeviceDropped,
  kSessionArmed,
  kShutterFailed,
  kRecordingStarted,
  kRecordingStopped,
  kInventoryInconsistency,
  kManifestWritten,
  kTransferSucceeded,
  kTransferFailed,
  kSessionEnded,
  kInfo,
  kWarning,
  kError,
};

// One timeline entry: when it happened, what it was, and string attributes
// such as device_id or file.
struct Event {
  std::chrono::system_clock::time_point ts{};
  EventType type = EventType::kInfo;
  std::map<std::string, std::string> payload;
};

std::string ToJson(EventType event_type);
std::string ToJson(const Event& event);

} // namespace fleetcap::events
