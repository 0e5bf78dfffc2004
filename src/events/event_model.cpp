#include "events/event_model.hpp"

#include "core/time_utils.hpp"

#include <string_view>

namespace fleetcap::events {

namespace {

void AppendEscapedJson(std::string& out, std::string_view input) {
  static constexpr char kHexDigits[] = "0123456789abcdef";
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default: {
      const auto byte = static_cast<unsigned char>(ch);
      if (byte < 0x20U) {
        out += "\\u00";
        out += kHexDigits[byte >> 4U];
        out += kHexDigits[byte & 0x0FU];
      } else {
        out += ch;
      }
      break;
    }
    }
  }
}

void AppendQuoted(std::string& out, std::string_view value) {
  out += '"';
  AppendEscapedJson(out, value);
  out += '"';
}

} // namespace

std::string ToJson(EventType event_type) {
  switch (event_type) {
  case EventType::kDiscoveryFinished:
    return "DISCOVERY_FINISHED";
  case EventType::kDeviceConnected:
    return "DEVICE_CONNECTED";
  case EventType::kDeviceDropped:
    return "DEVICE_DROPPED";
  case EventType::kSessionArmed:
    return "SESSION_ARMED";
  case EventType::kShutterFailed:
    return "SHUTTER_FAILED";
  case EventType::kRecordingStarted:
    return "RECORDING_STARTED";
  case EventType::kRecordingStopped:
    return "RECORDING_STOPPED";
  case EventType::kInventoryInconsistency:
    return "INVENTORY_INCONSISTENCY";
  case EventType::kManifestWritten:
    return "MANIFEST_WRITTEN";
  case EventType::kTransferSucceeded:
    return "TRANSFER_SUCCEEDED";
  case EventType::kTransferFailed:
    return "TRANSFER_FAILED";
  case EventType::kSessionEnded:
    return "SESSION_ENDED";
  case EventType::kInfo:
    return "info";
  case EventType::kWarning:
    return "warning";
  case EventType::kError:
    return "error";
  }

  return "unknown";
}

std::string ToJson(const Event& event) {
  std::string out = "{\"ts_utc\":";
  AppendQuoted(out, core::FormatUtcTimestamp(event.ts));
  out += ",\"type\":";
  AppendQuoted(out, ToJson(event.type));
  out += ",\"payload\":{";

  // std::map iteration keeps keys sorted, so lines diff cleanly.
  bool first = true;
  for (const auto& [key, value] : event.payload) {
    if (!first) {
      out += ',';
    }
    AppendQuoted(out, key);
    out += ':';
    AppendQuoted(out, value);
    first = false;
  }

  out += "}}";
  return out;
}

} // namespace fleetcap::events
