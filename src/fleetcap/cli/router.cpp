#include "fleetcap/cli/router.hpp"

#include "backends/sim/sim_fleet.hpp"
#include "config/fleet_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/time_utils.hpp"
#include "devices/error_mapper.hpp"
#include "discovery/device_discovery.hpp"
#include "host/host_session.hpp"
#include "host/recording_plugin.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace fleetcap::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitDiscoveryFailed =
    core::errors::ToInt(core::errors::ExitCode::kDiscoveryFailed);
constexpr int kExitStorageFailed = core::errors::ToInt(core::errors::ExitCode::kStorageFailed);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  fleetcap run <config.json> --storage <dir> [--record-ms <ms>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  fleetcap discover <config.json> [--log-level <debug|info|warn|error>]\n"
      << "  fleetcap validate <config.json>\n"
      << "  fleetcap version\n";
}

// Host session backed by a plain directory, used when fleetcap runs
// standalone instead of inside a recording host.
class DirectoryHostSession final : public host::IHostSession {
public:
  DirectoryHostSession(fs::path storage_root, std::string session_id)
      : storage_root_(std::move(storage_root)), session_id_(std::move(session_id)) {}

  fs::path StorageDirectory() const override {
    return storage_root_ / session_id_;
  }

  std::string SessionId() const override {
    return session_id_;
  }

private:
  fs::path storage_root_;
  std::string session_id_;
};

int ExitCodeForFleetError(const std::string& error) {
  switch (devices::ParseFleetErrorCode(error, devices::FleetErrorCode::kCommand)) {
  case devices::FleetErrorCode::kDiscovery:
    return kExitDiscoveryFailed;
  case devices::FleetErrorCode::kStorage:
    return kExitStorageFailed;
  default:
    return kExitFailure;
  }
}

bool ParseLogLevelOption(const std::vector<std::string_view>& args, std::size_t& i,
                         core::logging::LogLevel& level, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for --log-level";
    return false;
  }
  if (!core::logging::ParseLogLevel(args[i + 1], level, error)) {
    return false;
  }
  ++i;
  return true;
}

// Loads the config and prints issues. Returns kExitSuccess or the exit code
// the command should end with.
int LoadConfigOrReport(const std::string& config_path, config::FleetConfig& fleet_config) {
  std::string error;
  config::ValidationReport report;
  if (!config::LoadFleetConfigFile(config_path, fleet_config, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (!report.valid) {
    std::cerr << "invalid config: " << config_path << '\n';
    for (const auto& issue : report.issues) {
      std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
    }
    return kExitConfigInvalid;
  }
  return kExitSuccess;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "fleetcap 0.1.0\n";
  return kExitSuccess;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate requires exactly 1 argument: <config.json>\n";
    return kExitUsage;
  }

  const std::string config_path(args.front());
  config::FleetConfig fleet_config;
  const int load_code = LoadConfigOrReport(config_path, fleet_config);
  if (load_code != kExitSuccess) {
    return load_code;
  }

  std::cout << "valid: " << config_path << '\n';
  return kExitSuccess;
}

int CommandDiscover(const std::vector<std::string_view>& args) {
  std::string config_path;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  std::string error;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--log-level") {
      if (!ParseLogLevelOption(args, i, log_level, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      continue;
    }
    if ((!token.empty() && token.front() == '-') || !config_path.empty()) {
      std::cerr << "error: discover requires exactly 1 argument: <config.json>\n";
      return kExitUsage;
    }
    config_path = std::string(token);
  }
  if (config_path.empty()) {
    std::cerr << "error: discover requires exactly 1 argument: <config.json>\n";
    return kExitUsage;
  }

  config::FleetConfig fleet_config;
  const int load_code = LoadConfigOrReport(config_path, fleet_config);
  if (load_code != kExitSuccess) {
    return load_code;
  }

  core::logging::Logger logger(log_level);
  const backends::sim::SimFleet fleet(fleet_config.sim);
  std::unique_ptr<discovery::IDiscoveryListener> listener = fleet.CreateListener();

  discovery::DiscoveryResult result;
  if (!discovery::DiscoverDevices(*listener, fleet_config.coordinator.discovery, logger, result,
                                  error)) {
    std::cerr << "error: " << error << '\n';
    return kExitDiscoveryFailed;
  }

  for (const auto& identifier : result.identifiers) {
    std::cout << identifier << '\n';
  }
  return kExitSuccess;
}

bool ParseRunOptions(const std::vector<std::string_view>& args, RunOptions& options,
                     std::string& error) {
  bool has_storage = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--storage") {
      if (i + 1 >= args.size()) {
        error = "missing value for --storage";
        return false;
      }
      options.storage_root = fs::path(args[i + 1]);
      has_storage = true;
      ++i;
      continue;
    }
    if (token == "--record-ms") {
      if (i + 1 >= args.size()) {
        error = "missing value for --record-ms";
        return false;
      }
      const std::string_view value = args[i + 1];
      std::uint64_t parsed = 0;
      const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
      if (ec != std::errc() || ptr != value.data() + value.size()) {
        error = "--record-ms must be a non-negative integer";
        return false;
      }
      if (parsed > config::kMaxDurationMs) {
        error = "--record-ms must be at most " + std::to_string(config::kMaxDurationMs);
        return false;
      }
      options.record_duration = std::chrono::milliseconds(static_cast<std::int64_t>(parsed));
      ++i;
      continue;
    }
    if (token == "--log-level") {
      if (!ParseLogLevelOption(args, i, options.log_level, error)) {
        return false;
      }
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.config_path.empty()) {
      error = "run accepts exactly 1 config path";
      return false;
    }
    options.config_path = std::string(token);
  }

  if (options.config_path.empty()) {
    error = "run requires exactly 1 argument: <config.json>";
    return false;
  }
  if (!has_storage || options.storage_root.empty()) {
    error = "run requires --storage <dir>";
    return false;
  }
  return true;
}

int CommandRun(const std::vector<std::string_view>& args) {
  RunOptions options;
  std::string error;
  if (!ParseRunOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  return ExecuteFleetRun(options, nullptr);
}

} // namespace

int ExecuteFleetRun(const RunOptions& options, FleetRunResult* run_result) {
  if (run_result != nullptr) {
    *run_result = FleetRunResult{};
  }

  config::FleetConfig fleet_config;
  const int load_code = LoadConfigOrReport(options.config_path, fleet_config);
  if (load_code != kExitSuccess) {
    return load_code;
  }

  core::logging::Logger logger(options.log_level);
  const DirectoryHostSession host_session(options.storage_root,
                                          core::BuildSessionId(std::chrono::system_clock::now()));
  logger.Info("run execution requested",
              {{"config_path", options.config_path},
               {"storage_root", options.storage_root.string()},
               {"record_ms", std::to_string(options.record_duration.count())}});

  const backends::sim::SimFleet fleet(fleet_config.sim);
  host::RecordingPluginDependencies deps;
  deps.listener = fleet.CreateListener();
  deps.transport_factory = fleet.TransportFactory();
  deps.options = fleet_config.coordinator;

  std::string error;
  std::unique_ptr<host::RecordingPlugin> plugin =
      host::RecordingPlugin::OnPluginInit(host_session, std::move(deps), logger, error);
  if (plugin == nullptr) {
    std::cerr << "error: " << error << '\n';
    return ExitCodeForFleetError(error);
  }

  if (!plugin->OnSessionStart(error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  std::this_thread::sleep_for(options.record_duration);
  if (!plugin->OnSessionEnd(error)) {
    std::cerr << "error: " << error << '\n';
    return ExitCodeForFleetError(error);
  }

  const fleet::EndReport& end_report = plugin->end_report();
  // Devices still in the session at the end; connect and baseline drops
  // are excluded.
  const std::size_t device_count = end_report.inventory.outcomes.size();
  if (run_result != nullptr) {
    run_result->session_id = host_session.SessionId();
    run_result->videos_dir = host::ResolveVideosDirectory(host_session);
    run_result->manifest_path = end_report.manifest_path;
    run_result->devices = device_count;
    run_result->new_files = end_report.diff.TotalNewFiles();
  }

  std::cout << "session: " << host_session.SessionId() << '\n'
            << "devices: " << device_count << '\n'
            << "new files: " << end_report.diff.TotalNewFiles() << '\n'
            << "manifest: " << end_report.manifest_path.string() << '\n';
  return kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "validate") {
    return CommandValidate(args);
  }

  if (command == "discover") {
    return CommandDiscover(args);
  }

  if (command == "run") {
    return CommandRun(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace fleetcap::cli
