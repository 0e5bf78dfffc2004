#pragma once

#include "devices/device_types.hpp"
#include "fleet/retrying_transfer.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fleetcap::core::logging {
class Logger;
}

namespace fleetcap::devices {
class DeviceController;
}

namespace fleetcap::fleet {

// Per-artifact download outcome. Reporting only; not persisted beyond the
// session timeline.
struct TransferResult {
  devices::DeviceIdentifier device_id;
  std::string filename;
  bool downloaded = false;
  bool metadata_downloaded = false;
  std::uint32_t artifact_attempts = 0;
  std::uint32_t metadata_attempts = 0;
  std::filesystem::path artifact_path;
  std::filesystem::path metadata_path;
  std::string error;
};

// `<storage_dir>/<device_id>_<basename>`
std::filesystem::path BuildArtifactPath(const std::filesystem::path& storage_dir,
                                        const devices::DeviceIdentifier& device_id,
                                        const std::string& camera_file);

// `<storage_dir>/<device_id>_<basename stem>.gpmf`
std::filesystem::path BuildMetadataPath(const std::filesystem::path& storage_dir,
                                        const devices::DeviceIdentifier& device_id,
                                        const std::string& camera_file);

// Downloads each file and then its metadata track, each under `policy`.
// A file whose video download finally fails skips its metadata download; the
// remaining files are still processed. Turbo mode is switched on for the
// duration of the transfers and back off afterwards, both best effort.
std::vector<TransferResult> DownloadNewMedia(devices::DeviceController& controller,
                                             const std::vector<std::string>& files,
                                             const std::filesystem::path& storage_dir,
                                             const RetryPolicy& policy,
                                             core::logging::Logger& logger);

} // namespace fleetcap::fleet
