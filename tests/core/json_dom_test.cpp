#include "core/json_dom.hpp"

#include <catch2/catch.hpp>

#include <cstdint>
#include <string>

using fleetcap::core::json::Value;

namespace {

Value ParseOrFail(const std::string& text) {
  Value root;
  std::string error;
  INFO(error);
  REQUIRE(fleetcap::core::json::Parse(text, root, error));
  return root;
}

} // namespace

TEST_CASE("Parser builds nested objects and arrays", "[core][json]") {
  const Value root = ParseOrFail(
      R"({"sim": {"devices": [{"name": "GP1", "fail_open": true, "latency": 12}]}, "x": null})");
  const Value* devices = fleetcap::core::json::FindPath(root, {"sim", "devices"});
  REQUIRE(devices != nullptr);
  REQUIRE(devices->type == Value::Type::kArray);
  REQUIRE(devices->array_value.size() == 1U);

  const Value& device = devices->array_value[0];
  REQUIRE(device.Find("name")->string_value == "GP1");
  REQUIRE(device.Find("fail_open")->bool_value);
  REQUIRE(root.Find("x")->type == Value::Type::kNull);
  REQUIRE(root.Find("missing") == nullptr);
  REQUIRE(fleetcap::core::json::FindPath(root, {"sim", "nope", "deeper"}) == nullptr);
}

TEST_CASE("Non-negative integers are validated", "[core][json]") {
  const Value root = ParseOrFail(R"({"a": 5, "b": -1, "c": 2.5, "d": "7", "e": 1e3})");
  std::uint64_t out = 0;
  REQUIRE(fleetcap::core::json::TryGetNonNegativeInteger(*root.Find("a"), out));
  REQUIRE(out == 5U);
  REQUIRE_FALSE(fleetcap::core::json::TryGetNonNegativeInteger(*root.Find("b"), out));
  REQUIRE_FALSE(fleetcap::core::json::TryGetNonNegativeInteger(*root.Find("c"), out));
  REQUIRE_FALSE(fleetcap::core::json::TryGetNonNegativeInteger(*root.Find("d"), out));
  REQUIRE(fleetcap::core::json::TryGetNonNegativeInteger(*root.Find("e"), out));
  REQUIRE(out == 1000U);
}

TEST_CASE("Integers at or beyond 2^64 are out of range", "[core][json]") {
  const Value root = ParseOrFail(
      R"({"two64": 18446744073709551616, "max": 18446744073709551615, "huge": 1e30, "safe": 9007199254740992})");
  std::uint64_t out = 0;
  // Both literals parse to the same double, 2^64.
  REQUIRE_FALSE(fleetcap::core::json::TryGetNonNegativeInteger(*root.Find("two64"), out));
  REQUIRE_FALSE(fleetcap::core::json::TryGetNonNegativeInteger(*root.Find("max"), out));
  REQUIRE_FALSE(fleetcap::core::json::TryGetNonNegativeInteger(*root.Find("huge"), out));
  REQUIRE(fleetcap::core::json::TryGetNonNegativeInteger(*root.Find("safe"), out));
  REQUIRE(out == 9007199254740992ULL);
}

TEST_CASE("String escapes decode to UTF-8", "[core][json]") {
  const Value root = ParseOrFail(R"({"s": "tab\tquote\"slash\/eé"})");
  REQUIRE(root.Find("s")->string_value == "tab\tquote\"slash/e\xc3\xa9");
}

TEST_CASE("Malformed input reports line and column", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE_FALSE(fleetcap::core::json::Parse("{\n  \"a\": ,\n}", root, error));
  REQUIRE(error.find("line 2") != std::string::npos);

  REQUIRE_FALSE(fleetcap::core::json::Parse(R"({"a": 1, "a": 2})", root, error));
  REQUIRE(error.find("duplicate") != std::string::npos);

  REQUIRE_FALSE(fleetcap::core::json::Parse("{} trailing", root, error));
  REQUIRE_FALSE(fleetcap::core::json::Parse("", root, error));
}

TEST_CASE("Nesting depth is bounded", "[core][json]") {
  const std::string deep = std::string(100, '[') + std::string(100, ']');
  Value root;
  std::string error;
  REQUIRE_FALSE(fleetcap::core::json::Parse(deep, root, error));
  REQUIRE(error.find("depth") != std::string::npos);
}
