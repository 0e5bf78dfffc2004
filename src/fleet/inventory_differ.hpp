#pragma once

#include "devices/device_types.hpp"

#include <map>
#include <string>
#include <vector>

namespace fleetcap::fleet {

using InventoryMap = std::map<devices::DeviceIdentifier, devices::MediaInventory>;

// A device reported a post-session inventory without a pre-session baseline,
// so its new files cannot be computed.
struct InventoryInconsistency {
  devices::DeviceIdentifier device_id;
  std::string message;
};

struct InventoryDiff {
  // Newly created files per device, in post-session order. Devices whose
  // inventory did not grow map to an empty list.
  std::map<devices::DeviceIdentifier, std::vector<std::string>> new_files;
  std::vector<InventoryInconsistency> inconsistencies;

  bool consistent() const {
    return inconsistencies.empty();
  }

  std::size_t TotalNewFiles() const;
};

// Files in `post` that are absent from `pre`, keeping `post` order. Files that
// disappeared from the device are ignored, never reported.
std::vector<std::string> NewFilesBetween(const devices::MediaInventory& pre,
                                         const devices::MediaInventory& post);

// Per-device set difference post - pre. Devices present only in `pre` (their
// post-session read failed) produce no entry.
InventoryDiff DiffInventories(const InventoryMap& pre, const InventoryMap& post);

} // namespace fleetcap::fleet
