#pragma once

#include <string>
#include <string_view>

namespace fleetcap::devices {

// Stable failure classes for fleet operations. Log lines and phase reports
// carry these codes so an operator can grep for e.g. TRANSFER_ERROR and know
// which files need manual retrieval.
enum class FleetErrorCode {
  kDiscovery,
  kConnection,
  kCommand,
  kCommandTimeout,
  kTransfer,
  kInventoryInconsistency,
  kStorage,
  kStateConflict,
};

std::string_view ToStableErrorCode(FleetErrorCode code);

// Returns single-line text:
//   "<CODE>: <operation> failed device: <device_id> detail: <detail>"
// The device and detail suffixes are omitted when empty.
std::string FormatFleetError(FleetErrorCode code, std::string_view operation,
                             std::string_view device_id, std::string_view detail);

// Recovers the code from text produced by FormatFleetError. Text without a
// known prefix maps to `fallback`.
FleetErrorCode ParseFleetErrorCode(std::string_view formatted, FleetErrorCode fallback);

// True when a transfer failure cannot succeed on retry (disk full, read-only
// destination, missing permissions). Everything else is treated as transient.
bool IsStructuralTransferError(std::string_view detail);

} // namespace fleetcap::devices
