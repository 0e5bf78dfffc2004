#include "fleet/inventory_differ.hpp"

#include <unordered_set>

namespace fleetcap::fleet {

std::size_t InventoryDiff::TotalNewFiles() const {
  std::size_t total = 0;
  for (const auto& [device_id, files] : new_files) {
    total += files.size();
  }
  return total;
}

std::vector<std::string> NewFilesBetween(const devices::MediaInventory& pre,
                                         const devices::MediaInventory& post) {
  const std::unordered_set<std::string> before(pre.begin(), pre.end());
  std::vector<std::string> added;
  for (const std::string& filename : post) {
    if (before.count(filename) == 0U) {
      added.push_back(filename);
    }
  }
  return added;
}

InventoryDiff DiffInventories(const InventoryMap& pre, const InventoryMap& post) {
  InventoryDiff diff;
  for (const auto& [device_id, post_files] : post) {
    const auto baseline = pre.find(device_id);
    if (baseline == pre.end()) {
      diff.inconsistencies.push_back(
          {.device_id = device_id,
           .message = "post-session inventory has no pre-session baseline (" +
                      std::to_string(post_files.size()) + " files unattributed)"});
      continue;
    }
    diff.new_files[device_id] = NewFilesBetween(baseline->second, post_files);
  }
  return diff;
}

} // namespace fleetcap::fleet
