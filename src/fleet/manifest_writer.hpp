#pragma once

#include "fleet/inventory_differ.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace fleetcap::fleet {

inline constexpr std::string_view kManifestFileName = "recordedFiles.txt";

// Manifest text: for every device with at least one new file
//
//   <device_id>:
//   \t<filename>
//
// Devices without new files are omitted, so a zero-device session renders an
// empty string.
std::string RenderManifest(const InventoryDiff& diff);

// Writes `<storage_dir>/recordedFiles.txt` atomically, creating the directory
// if needed. Returns false with a STORAGE_ERROR on failure.
bool WriteManifest(const std::filesystem::path& storage_dir, const InventoryDiff& diff,
                   std::filesystem::path& written_path, std::string& error);

} // namespace fleetcap::fleet
