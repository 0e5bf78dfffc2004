#include "fleet/media_download.hpp"

#include "core/logging/logger.hpp"
#include "devices/device_controller.hpp"

namespace fleetcap::fleet {

namespace fs = std::filesystem;

fs::path BuildArtifactPath(const fs::path& storage_dir, const devices::DeviceIdentifier& device_id,
                           const std::string& camera_file) {
  const fs::path basename = fs::path(camera_file).filename();
  return storage_dir / (device_id + "_" + basename.string());
}

fs::path BuildMetadataPath(const fs::path& storage_dir, const devices::DeviceIdentifier& device_id,
                           const std::string& camera_file) {
  const fs::path stem = fs::path(camera_file).filename().stem();
  return storage_dir / (device_id + "_" + stem.string() + ".gpmf");
}

std::vector<TransferResult> DownloadNewMedia(devices::DeviceController& controller,
                                             const std::vector<std::string>& files,
                                             const fs::path& storage_dir,
                                             const RetryPolicy& policy,
                                             core::logging::Logger& logger) {
  std::vector<TransferResult> results;
  if (files.empty()) {
    return results;
  }

  const devices::DeviceIdentifier& device_id = controller.identifier();

  // Turbo speeds up transfers and shows the transfer screen on the camera.
  std::string turbo_error;
  if (!controller.SetTurboMode(true, turbo_error)) {
    logger.Warn("could not enable turbo mode for transfer",
                {{"device_id", device_id}, {"error", turbo_error}});
  }

  results.reserve(files.size());
  for (const std::string& camera_file : files) {
    TransferResult result;
    result.device_id = device_id;
    result.filename = camera_file;
    result.artifact_path = BuildArtifactPath(storage_dir, device_id, camera_file);
    result.metadata_path = BuildMetadataPath(storage_dir, device_id, camera_file);

    logger.Info("downloading artifact",
                {{"device_id", device_id}, {"file", camera_file},
                 {"dest", result.artifact_path.string()}});

    const TransferAttemptResult artifact = AttemptWithRetry(
        [&](std::string& error) {
          return controller.DownloadArtifact(camera_file, result.artifact_path, error);
        },
        policy, logger, "download_artifact", device_id);
    result.artifact_attempts = artifact.attempts_used;
    result.downloaded = artifact.succeeded;

    if (!artifact.succeeded) {
      result.error = artifact.error;
      logger.Error("artifact download failed; skipping its metadata",
                   {{"device_id", device_id}, {"file", camera_file},
                    {"attempts", std::to_string(artifact.attempts_used)},
                    {"error", artifact.error}});
      results.push_back(std::move(result));
      continue;
    }

    const TransferAttemptResult metadata = AttemptWithRetry(
        [&](std::string& error) {
          return controller.DownloadMetadata(camera_file, result.metadata_path, error);
        },
        policy, logger, "download_metadata", device_id);
    result.metadata_attempts = metadata.attempts_used;
    result.metadata_downloaded = metadata.succeeded;
    if (!metadata.succeeded) {
      result.error = metadata.error;
      logger.Error("metadata download failed",
                   {{"device_id", device_id}, {"file", camera_file},
                    {"attempts", std::to_string(metadata.attempts_used)},
                    {"error", metadata.error}});
    }
    results.push_back(std::move(result));
  }

  if (!controller.SetTurboMode(false, turbo_error)) {
    logger.Warn("could not disable turbo mode after transfer",
                {{"device_id", device_id}, {"error", turbo_error}});
  }
  return results;
}

} // namespace fleetcap::fleet
