#include "devices/error_mapper.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>
#include <string>

namespace fleetcap::devices {

namespace {

constexpr std::array<FleetErrorCode, 8> kAllCodes = {
    FleetErrorCode::kDiscovery,
    FleetErrorCode::kConnection,
    FleetErrorCode::kCommand,
    FleetErrorCode::kCommandTimeout,
    FleetErrorCode::kTransfer,
    FleetErrorCode::kInventoryInconsistency,
    FleetErrorCode::kStorage,
    FleetErrorCode::kStateConflict,
};

std::string ToLowerAscii(std::string_view value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

std::string CollapseWhitespace(std::string_view text) {
  std::string normalized;
  normalized.reserve(text.size());
  bool previous_was_space = true;
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      if (!previous_was_space) {
        normalized.push_back(' ');
      }
      previous_was_space = true;
      continue;
    }
    normalized.push_back(c);
    previous_was_space = false;
  }
  if (!normalized.empty() && normalized.back() == ' ') {
    normalized.pop_back();
  }
  return normalized;
}

bool ContainsAny(std::string_view haystack, std::initializer_list<std::string_view> needles) {
  return std::any_of(needles.begin(), needles.end(), [haystack](std::string_view needle) {
    return !needle.empty() && haystack.find(needle) != std::string_view::npos;
  });
}

} // namespace

std::string_view ToStableErrorCode(const FleetErrorCode code) {
  switch (code) {
  case FleetErrorCode::kDiscovery:
    return "DISCOVERY_ERROR";
  case FleetErrorCode::kConnection:
    return "CONNECTION_ERROR";
  case FleetErrorCode::kCommand:
    return "COMMAND_ERROR";
  case FleetErrorCode::kCommandTimeout:
    return "COMMAND_TIMEOUT";
  case FleetErrorCode::kTransfer:
    return "TRANSFER_ERROR";
  case FleetErrorCode::kInventoryInconsistency:
    return "INVENTORY_INCONSISTENCY";
  case FleetErrorCode::kStorage:
    return "STORAGE_ERROR";
  case FleetErrorCode::kStateConflict:
    return "STATE_CONFLICT";
  }
  return "COMMAND_ERROR";
}

std::string FormatFleetError(const FleetErrorCode code, std::string_view operation,
                             std::string_view device_id, std::string_view detail) {
  std::string formatted(ToStableErrorCode(code));
  formatted += ": ";
  formatted += operation.empty() ? std::string("operation") : std::string(operation);
  formatted += " failed";
  if (!device_id.empty()) {
    formatted += " device: ";
    formatted += device_id;
  }
  const std::string normalized_detail = CollapseWhitespace(detail);
  if (!normalized_detail.empty()) {
    formatted += " detail: ";
    formatted += normalized_detail;
  }
  return formatted;
}

FleetErrorCode ParseFleetErrorCode(std::string_view formatted, const FleetErrorCode fallback) {
  for (const FleetErrorCode code : kAllCodes) {
    const std::string_view prefix = ToStableErrorCode(code);
    if (formatted.size() > prefix.size() && formatted.substr(0, prefix.size()) == prefix &&
        formatted[prefix.size()] == ':') {
      return code;
    }
  }
  return fallback;
}

bool IsStructuralTransferError(std::string_view detail) {
  if (detail.empty()) {
    return false;
  }
  const std::string normalized = ToLowerAscii(detail);
  return ContainsAny(normalized, {"no space left", "disk full", "disk quota", "quota exceeded",
                                  "read-only file system", "permission denied",
                                  "access denied", "not writable"});
}

} // namespace fleetcap::devices
