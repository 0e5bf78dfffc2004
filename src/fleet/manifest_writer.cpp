#include "fleet/manifest_writer.hpp"

#include "core/fs_utils.hpp"
#include "devices/error_mapper.hpp"

namespace fleetcap::fleet {

std::string RenderManifest(const InventoryDiff& diff) {
  std::string text;
  for (const auto& [device_id, files] : diff.new_files) {
    if (files.empty()) {
      continue;
    }
    text += device_id;
    text += ":\n";
    for (const std::string& filename : files) {
      text += '\t';
      text += filename;
      text += '\n';
    }
  }
  return text;
}

bool WriteManifest(const std::filesystem::path& storage_dir, const InventoryDiff& diff,
                   std::filesystem::path& written_path, std::string& error) {
  written_path = storage_dir / kManifestFileName;

  std::string write_error;
  if (!core::WriteTextFileAtomic(written_path, RenderManifest(diff), write_error)) {
    error = devices::FormatFleetError(devices::FleetErrorCode::kStorage, "write_manifest", "",
                                      write_error);
    return false;
  }
  return true;
}

} // namespace fleetcap::fleet
