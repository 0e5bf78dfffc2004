#include "config/fleet_config.hpp"

#include "core/json_dom.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace fleetcap::config {

namespace {

using JsonValue = core::json::Value;

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

std::string Join(const std::string& prefix, std::string_view key) {
  return prefix.empty() ? std::string(key) : prefix + "." + std::string(key);
}

// Optional section: absent is fine, present must be an object.
const JsonValue* GetSection(const JsonValue& root, std::string_view key,
                            ValidationReport& report) {
  const JsonValue* section = root.Find(key);
  if (section == nullptr) {
    return nullptr;
  }
  if (!section->IsObject()) {
    AddIssue(report, std::string(key), "must be an object");
    return nullptr;
  }
  return section;
}

void ReadMilliseconds(const JsonValue& section, const std::string& prefix, std::string_view key,
                      bool allow_zero, std::chrono::milliseconds& out, ValidationReport& report) {
  const JsonValue* field = section.Find(key);
  if (field == nullptr) {
    return;
  }
  std::uint64_t parsed = 0;
  if (!core::json::TryGetNonNegativeInteger(*field, parsed)) {
    AddIssue(report, Join(prefix, key), "must be a non-negative integer (milliseconds)");
    return;
  }
  if (!allow_zero && parsed == 0U) {
    AddIssue(report, Join(prefix, key), "must be greater than 0");
    return;
  }
  if (parsed > kMaxDurationMs) {
    AddIssue(report, Join(prefix, key),
             "must be at most " + std::to_string(kMaxDurationMs) + " (24 hours)");
    return;
  }
  out = std::chrono::milliseconds(static_cast<std::int64_t>(parsed));
}

template <typename Int>
void ReadCount(const JsonValue& section, const std::string& prefix, std::string_view key,
               bool allow_zero, Int& out, ValidationReport& report) {
  const JsonValue* field = section.Find(key);
  if (field == nullptr) {
    return;
  }
  std::uint64_t parsed = 0;
  if (!core::json::TryGetNonNegativeInteger(*field, parsed) ||
      parsed > static_cast<std::uint64_t>(UINT32_MAX)) {
    AddIssue(report, Join(prefix, key), "must be a non-negative integer");
    return;
  }
  if (!allow_zero && parsed == 0U) {
    AddIssue(report, Join(prefix, key), "must be greater than 0");
    return;
  }
  out = static_cast<Int>(parsed);
}

void ReadBool(const JsonValue& section, const std::string& prefix, std::string_view key,
              bool& out, ValidationReport& report) {
  const JsonValue* field = section.Find(key);
  if (field == nullptr) {
    return;
  }
  if (field->type != JsonValue::Type::kBool) {
    AddIssue(report, Join(prefix, key), "must be a boolean");
    return;
  }
  out = field->bool_value;
}

void ReadStringList(const JsonValue& section, const std::string& prefix, std::string_view key,
                    std::vector<std::string>& out, ValidationReport& report) {
  const JsonValue* field = section.Find(key);
  if (field == nullptr) {
    return;
  }
  if (field->type != JsonValue::Type::kArray) {
    AddIssue(report, Join(prefix, key), "must be an array of strings");
    return;
  }
  out.clear();
  for (std::size_t i = 0; i < field->array_value.size(); ++i) {
    const JsonValue& item = field->array_value[i];
    if (item.type != JsonValue::Type::kString || item.string_value.empty()) {
      AddIssue(report, Join(prefix, key) + "[" + std::to_string(i) + "]",
               "must be a non-empty string");
      continue;
    }
    out.push_back(item.string_value);
  }
}

void ReadDiscovery(const JsonValue& root, discovery::DiscoveryOptions& options,
                   ValidationReport& report) {
  const JsonValue* section = GetSection(root, "discovery", report);
  if (section == nullptr) {
    return;
  }
  if (const JsonValue* service_type = section->Find("service_type"); service_type != nullptr) {
    if (service_type->type != JsonValue::Type::kString || service_type->string_value.empty()) {
      AddIssue(report, "discovery.service_type", "must be a non-empty string");
    } else {
      options.service_type = service_type->string_value;
    }
  }
  ReadMilliseconds(*section, "discovery", "quiescence_timeout_ms", false,
                   options.quiescence_timeout, report);
  ReadMilliseconds(*section, "discovery", "max_window_ms", true, options.max_window, report);
}

void ReadCoordinator(const JsonValue& root, fleet::CoordinatorOptions& options,
                     ValidationReport& report) {
  const JsonValue* section = GetSection(root, "coordinator", report);
  if (section == nullptr) {
    return;
  }
  ReadCount(*section, "coordinator", "max_parallel", false, options.max_parallel, report);
  ReadMilliseconds(*section, "coordinator", "command_timeout_ms", false,
                   options.controller.command_timeout, report);
  ReadMilliseconds(*section, "coordinator", "transfer_timeout_ms", true,
                   options.controller.transfer_timeout, report);
  ReadBool(*section, "coordinator", "download_after_session", options.download_after_session,
           report);
}

void ReadRetry(const JsonValue& root, fleet::RetryPolicy& policy, ValidationReport& report) {
  const JsonValue* section = GetSection(root, "retry", report);
  if (section == nullptr) {
    return;
  }
  ReadCount(*section, "retry", "max_attempts", false, policy.max_attempts, report);
  ReadMilliseconds(*section, "retry", "backoff_ms", true, policy.backoff, report);
}

void ReadSimDevice(const JsonValue& item, const std::string& prefix,
                   backends::sim::SimDeviceSpec& spec, ValidationReport& report) {
  const JsonValue* name = item.Find("name");
  if (name == nullptr) {
    AddIssue(report, Join(prefix, "name"), "is required");
  } else if (name->type != JsonValue::Type::kString || name->string_value.empty()) {
    AddIssue(report, Join(prefix, "name"), "must be a non-empty string");
  } else if (name->string_value.find('.') != std::string::npos) {
    AddIssue(report, Join(prefix, "name"), "must not contain '.'");
  } else {
    spec.name = name->string_value;
  }

  ReadStringList(item, prefix, "advertisements", spec.advertisements, report);
  ReadStringList(item, prefix, "initial_media", spec.initial_media, report);
  ReadCount(item, prefix, "files_per_recording", true, spec.files_per_recording, report);
  ReadBool(item, prefix, "recording_at_start", spec.recording_at_start, report);
  ReadBool(item, prefix, "fail_open", spec.fail_open, report);
  ReadBool(item, prefix, "fail_preset", spec.fail_preset, report);
  ReadBool(item, prefix, "fail_set_clock", spec.fail_set_clock, report);
  ReadBool(item, prefix, "fail_shutter_on", spec.fail_shutter_on, report);
  ReadBool(item, prefix, "fail_shutter_off", spec.fail_shutter_off, report);
  ReadBool(item, prefix, "fail_list_media", spec.fail_list_media, report);
  ReadCount(item, prefix, "download_failures", true, spec.download_failures, report);
  ReadMilliseconds(item, prefix, "command_latency_ms", true, spec.command_latency, report);
}

void ReadSim(const JsonValue& root, backends::sim::SimFleetConfig& sim,
             ValidationReport& report) {
  const JsonValue* section = GetSection(root, "sim", report);
  if (section == nullptr) {
    return;
  }
  ReadBool(*section, "sim", "fail_listener_start", sim.fail_listener_start, report);

  const JsonValue* devices = section->Find("devices");
  if (devices == nullptr) {
    return;
  }
  if (devices->type != JsonValue::Type::kArray) {
    AddIssue(report, "sim.devices", "must be an array of device objects");
    return;
  }

  std::set<std::string> names;
  for (std::size_t i = 0; i < devices->array_value.size(); ++i) {
    const std::string prefix = "sim.devices[" + std::to_string(i) + "]";
    const JsonValue& item = devices->array_value[i];
    if (!item.IsObject()) {
      AddIssue(report, prefix, "must be an object");
      continue;
    }
    backends::sim::SimDeviceSpec spec;
    ReadSimDevice(item, prefix, spec, report);
    if (!spec.name.empty() && !names.insert(spec.name).second) {
      AddIssue(report, prefix + ".name", "duplicates device '" + spec.name + "'");
      continue;
    }
    sim.devices.push_back(std::move(spec));
  }
}

} // namespace

bool LoadFleetConfigText(std::string_view json_text, FleetConfig& config,
                         ValidationReport& report, std::string& error) {
  report = ValidationReport{};
  config = FleetConfig{};
  error.clear();

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$",
             parse_error + " (fix JSON syntax and rerun 'fleetcap validate <config.json>')");
    return true;
  }
  if (!root.IsObject()) {
    AddIssue(report, "$", "config must be a JSON object");
    return true;
  }

  ReadDiscovery(root, config.coordinator.discovery, report);
  ReadCoordinator(root, config.coordinator, report);
  ReadRetry(root, config.coordinator.retry, report);
  ReadSim(root, config.sim, report);

  report.valid = report.issues.empty();
  return true;
}

bool LoadFleetConfigFile(const std::string& config_path, FleetConfig& config,
                         ValidationReport& report, std::string& error) {
  std::ifstream file(fs::path(config_path), std::ios::binary);
  if (!file) {
    error = "unable to read config file: " + config_path;
    return false;
  }

  const std::string contents((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
  if (contents.empty()) {
    report = ValidationReport{};
    AddIssue(report, "$", "config file is empty; provide a valid JSON object");
    return true;
  }
  return LoadFleetConfigText(contents, config, report, error);
}

std::string FormatIssues(const ValidationReport& report) {
  std::ostringstream out;
  for (const ValidationIssue& issue : report.issues) {
    out << issue.path << ": " << issue.message << "\n";
  }
  return out.str();
}

} // namespace fleetcap::config
