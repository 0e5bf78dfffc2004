#pragma once

#include "devices/device_controller.hpp"
#include "fleet/inventory_differ.hpp"

#include <filesystem>
#include <memory>
#include <vector>

namespace fleetcap::fleet {

// State of one recording session, created when the fleet is armed and
// destroyed when the session ends. `controllers` is appended to only while
// connecting; every later phase iterates it without mutation.
struct FleetSession {
  std::filesystem::path storage_dir;
  std::vector<std::unique_ptr<devices::DeviceController>> controllers;
  InventoryMap pre_inventory;

  void CloseAll() {
    for (const auto& controller : controllers) {
      controller->Close();
    }
  }
};

} // namespace fleetcap::fleet
