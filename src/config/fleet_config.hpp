#pragma once

#include "backends/sim/sim_fleet.hpp"
#include "fleet/fleet_coordinator.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace fleetcap::config {

// Upper bound for every `*_ms` field (24 h). Larger values would overflow the
// clock arithmetic behind timed waits.
inline constexpr std::uint64_t kMaxDurationMs = 86'400'000U;

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
};

// Everything a fleet config file controls. Absent keys keep the defaults of
// the underlying option structs.
struct FleetConfig {
  fleet::CoordinatorOptions coordinator;
  backends::sim::SimFleetConfig sim;
};

// Parses and validates fleet config JSON text.
//
// Contract:
// - Returns true when validation completed (even if the config is invalid).
// - Populates `report`; `config` is only meaningful when `report.valid`.
// - Parse errors are reported as a single issue under path `$`.
bool LoadFleetConfigText(std::string_view json_text, FleetConfig& config,
                         ValidationReport& report, std::string& error);

// Reads `config_path` and forwards to LoadFleetConfigText. Returns false with
// `error` set only when the file cannot be read.
bool LoadFleetConfigFile(const std::string& config_path, FleetConfig& config,
                         ValidationReport& report, std::string& error);

// "path: message" lines, one per issue.
std::string FormatIssues(const ValidationReport& report);

} // namespace fleetcap::config
