#pragma once

#include "core/logging/logger.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace fleetcap::cli {

// Options of one `fleetcap run` invocation.
struct RunOptions {
  std::string config_path;
  std::filesystem::path storage_root;
  // How long the fleet records between start and stop.
  std::chrono::milliseconds record_duration{5'000};
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Outputs of a completed run, for callers that chain follow-up steps.
struct FleetRunResult {
  std::string session_id;
  std::filesystem::path videos_dir;
  std::filesystem::path manifest_path;
  std::size_t devices = 0;
  std::size_t new_files = 0;
};

// Executes one full session (arm, record, end) against the simulated fleet
// described by the config file. Returns a process exit code.
int ExecuteFleetRun(const RunOptions& options, FleetRunResult* run_result);

// Routes `fleetcap` subcommands and returns process exit codes with a stable
// contract for scripts:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => config file invalid
//   20 => discovery failed
//   21 => storage directory or manifest could not be written
int Dispatch(int argc, char** argv);

} // namespace fleetcap::cli
