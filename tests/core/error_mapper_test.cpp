#include "devices/error_mapper.hpp"

#include <catch2/catch.hpp>

#include <string>

using fleetcap::devices::FleetErrorCode;
using fleetcap::devices::FormatFleetError;
using fleetcap::devices::IsStructuralTransferError;
using fleetcap::devices::ParseFleetErrorCode;
using fleetcap::devices::ToStableErrorCode;

TEST_CASE("Fleet error codes have stable names", "[devices][errors]") {
  REQUIRE(ToStableErrorCode(FleetErrorCode::kDiscovery) == "DISCOVERY_ERROR");
  REQUIRE(ToStableErrorCode(FleetErrorCode::kConnection) == "CONNECTION_ERROR");
  REQUIRE(ToStableErrorCode(FleetErrorCode::kCommand) == "COMMAND_ERROR");
  REQUIRE(ToStableErrorCode(FleetErrorCode::kCommandTimeout) == "COMMAND_TIMEOUT");
  REQUIRE(ToStableErrorCode(FleetErrorCode::kTransfer) == "TRANSFER_ERROR");
  REQUIRE(ToStableErrorCode(FleetErrorCode::kInventoryInconsistency) ==
          "INVENTORY_INCONSISTENCY");
  REQUIRE(ToStableErrorCode(FleetErrorCode::kStorage) == "STORAGE_ERROR");
  REQUIRE(ToStableErrorCode(FleetErrorCode::kStateConflict) == "STATE_CONFLICT");
}

TEST_CASE("Formatted errors carry code, operation, device and detail", "[devices][errors]") {
  REQUIRE(FormatFleetError(FleetErrorCode::kTransfer, "download_artifact", "GP1",
                           "connection\n  reset\tby peer ") ==
          "TRANSFER_ERROR: download_artifact failed device: GP1 detail: connection reset by peer");
  REQUIRE(FormatFleetError(FleetErrorCode::kStorage, "write_manifest", "", "") ==
          "STORAGE_ERROR: write_manifest failed");
  REQUIRE(FormatFleetError(FleetErrorCode::kCommand, "", "d1", "x") ==
          "COMMAND_ERROR: operation failed device: d1 detail: x");
}

TEST_CASE("Error codes round-trip through formatted text", "[devices][errors]") {
  const std::string text =
      FormatFleetError(FleetErrorCode::kCommandTimeout, "shutter_on", "d2", "no response");
  REQUIRE(ParseFleetErrorCode(text, FleetErrorCode::kCommand) == FleetErrorCode::kCommandTimeout);
  REQUIRE(ParseFleetErrorCode("DISCOVERY_ERROR: start_listener failed",
                              FleetErrorCode::kCommand) == FleetErrorCode::kDiscovery);
  REQUIRE(ParseFleetErrorCode("something else", FleetErrorCode::kStorage) ==
          FleetErrorCode::kStorage);
  REQUIRE(ParseFleetErrorCode("STORAGE_ERRORS: x", FleetErrorCode::kCommand) ==
          FleetErrorCode::kCommand);
}

TEST_CASE("Structural transfer errors are recognized", "[devices][errors]") {
  REQUIRE(IsStructuralTransferError("write failed: No space left on device"));
  REQUIRE(IsStructuralTransferError("Read-only file system"));
  REQUIRE(IsStructuralTransferError("permission denied: directory is not writable '/x'"));
  REQUIRE_FALSE(IsStructuralTransferError("connection reset by peer"));
  REQUIRE_FALSE(IsStructuralTransferError("HTTP 503"));
  REQUIRE_FALSE(IsStructuralTransferError(""));
}
