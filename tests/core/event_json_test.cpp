#include "events/event_model.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <string>

TEST_CASE("EventType maps to stable string values", "[core][events][json]") {
  using fleetcap::events::EventType;
  using fleetcap::events::ToJson;
  REQUIRE(ToJson(EventType::kDiscoveryFinished) == "DISCOVERY_FINISHED");
  REQUIRE(ToJson(EventType::kDeviceConnected) == "DEVICE_CONNECTED");
  REQUIRE(ToJson(EventType::kDeviceDropped) == "DEVICE_DROPPED");
  REQUIRE(ToJson(EventType::kShutterFailed) == "SHUTTER_FAILED");
  REQUIRE(ToJson(EventType::kInventoryInconsistency) == "INVENTORY_INCONSISTENCY");
  REQUIRE(ToJson(EventType::kManifestWritten) == "MANIFEST_WRITTEN");
  REQUIRE(ToJson(EventType::kTransferFailed) == "TRANSFER_FAILED");
  REQUIRE(ToJson(EventType::kSessionEnded) == "SESSION_ENDED");
  REQUIRE(ToJson(EventType::kInfo) == "info");
  REQUIRE(ToJson(EventType::kWarning) == "warning");
  REQUIRE(ToJson(EventType::kError) == "error");
}

TEST_CASE("Event JSON serialization includes timestamp type and payload", "[core][events][json]") {
  fleetcap::events::Event event;
  event.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(2'000));
  event.type = fleetcap::events::EventType::kDeviceConnected;
  event.payload = {
      {"device_id", "GP1"},
      {"phase", "connect"},
  };

  const std::string json = fleetcap::events::ToJson(event);
  REQUIRE(
      json ==
      R"({"ts_utc":"1970-01-01T00:00:02.000Z","type":"DEVICE_CONNECTED","payload":{"device_id":"GP1","phase":"connect"}})");
}

TEST_CASE("Event JSON escapes control characters and quotes", "[core][events][json]") {
  fleetcap::events::Event event;
  event.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(0));
  event.type = fleetcap::events::EventType::kError;
  event.payload = {{"error", "line1\nline2\t\"q\"\\\x01"}};

  const std::string json = fleetcap::events::ToJson(event);
  REQUIRE(json.find(R"("error":"line1\nline2\t\"q\"\\\u0001")") != std::string::npos);
}

TEST_CASE("Event with empty payload serializes an empty object", "[core][events][json]") {
  fleetcap::events::Event event;
  event.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(1));
  event.type = fleetcap::events::EventType::kSessionArmed;
  REQUIRE(fleetcap::events::ToJson(event) ==
          R"({"ts_utc":"1970-01-01T00:00:00.001Z","type":"SESSION_ARMED","payload":{}})");
}
