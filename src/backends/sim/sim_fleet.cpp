#include "backends/sim/sim_fleet.hpp"

#include "discovery/device_discovery.hpp"

#include <algorithm>
#include <cstdio>
#include <deque>
#include <fstream>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace fleetcap::backends::sim {

namespace detail {

struct SimDeviceState {
  SimDeviceSpec spec;
  devices::MediaInventory media;
  bool open = false;
  bool recording = false;
  bool turbo = false;
  std::uint32_t next_file_index = 1;
  std::map<std::string, std::uint32_t> download_failures_left;
};

struct SimFleetState {
  bool fail_listener_start = false;
  std::vector<devices::DeviceIdentifier> order;

  mutable std::mutex mu;
  std::map<devices::DeviceIdentifier, SimDeviceState> devices;
  std::vector<std::string> journal;

  void Record(const devices::DeviceIdentifier& name, const std::string& entry) {
    journal.push_back(name + ":" + entry);
  }
};

} // namespace detail

namespace {

using detail::SimDeviceState;
using detail::SimFleetState;

std::string FormatRecordingName(const std::uint32_t index) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "GX01%04u.MP4", index);
  return buffer;
}

bool Contains(const devices::MediaInventory& media, const std::string& name) {
  for (const std::string& existing : media) {
    if (existing == name) {
      return true;
    }
  }
  return false;
}

void FinalizeRecording(SimDeviceState& device) {
  for (std::uint32_t i = 0; i < device.spec.files_per_recording; ++i) {
    std::string name = FormatRecordingName(device.next_file_index++);
    while (Contains(device.media, name)) {
      name = FormatRecordingName(device.next_file_index++);
    }
    device.media.push_back(std::move(name));
  }
}

bool WritePlaceholder(const std::filesystem::path& path, const std::string& content,
                      std::string& error) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    error = "cannot open local file: " + path.string();
    return false;
  }
  out << content;
  if (!out) {
    error = "write failed: " + path.string();
    return false;
  }
  return true;
}

class SimDiscoveryListener final : public discovery::IDiscoveryListener {
public:
  explicit SimDiscoveryListener(std::shared_ptr<SimFleetState> state) : state_(std::move(state)) {}

  bool Start(const std::string& service_type, std::string& error) override {
    if (state_->fail_listener_start) {
      error = "cannot bind mDNS socket for " + service_type;
      return false;
    }

    pending_.clear();
    std::vector<std::vector<std::string>> per_device;
    std::size_t longest = 0;
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      for (const auto& name : state_->order) {
        per_device.push_back(AdvertisementsFor(state_->devices.at(name).spec));
        longest = std::max(longest, per_device.back().size());
      }
    }
    // Interleave so repeats of one device arrive between other devices.
    for (std::size_t round = 0; round < longest; ++round) {
      for (const auto& advertisements : per_device) {
        if (round < advertisements.size()) {
          pending_.push_back(advertisements[round]);
        }
      }
    }
    started_ = true;
    return true;
  }

  discovery::ListenerWaitStatus WaitNext(const std::chrono::milliseconds timeout,
                                         std::string& advertised_name,
                                         std::string& error) override {
    if (!started_) {
      error = "listener is not started";
      return discovery::ListenerWaitStatus::kError;
    }
    if (pending_.empty()) {
      std::this_thread::sleep_for(timeout);
      return discovery::ListenerWaitStatus::kTimeout;
    }
    advertised_name = std::move(pending_.front());
    pending_.pop_front();
    return discovery::ListenerWaitStatus::kAdvertisement;
  }

  void Stop() override {
    started_ = false;
    pending_.clear();
  }

private:
  std::shared_ptr<SimFleetState> state_;
  std::deque<std::string> pending_;
  bool started_ = false;
};

class SimDeviceTransport final : public devices::IDeviceTransport {
public:
  SimDeviceTransport(std::shared_ptr<SimFleetState> state, devices::DeviceIdentifier name)
      : state_(std::move(state)), name_(std::move(name)) {}

  bool Open(std::string& error) override {
    return Command("open", error, [](SimDeviceState& device, std::string& err) {
      if (device.spec.fail_open) {
        err = "connection refused";
        return false;
      }
      device.open = true;
      return true;
    });
  }

  bool LoadVideoPresetGroup(std::string& error) override {
    return Command("load_preset", error, [](SimDeviceState& device, std::string& err) {
      if (device.spec.fail_preset) {
        err = "preset group rejected";
        return false;
      }
      return true;
    });
  }

  bool SetTurboMode(const bool enabled, std::string& error) override {
    return Command(enabled ? "turbo_on" : "turbo_off", error,
                   [enabled](SimDeviceState& device, std::string&) {
                     device.turbo = enabled;
                     return true;
                   });
  }

  bool SetDateTime(std::chrono::system_clock::time_point, std::string& error) override {
    return Command("set_clock", error, [](SimDeviceState& device, std::string& err) {
      if (device.spec.fail_set_clock) {
        err = "date/time setting not supported";
        return false;
      }
      return true;
    });
  }

  bool SetShutter(const bool enabled, std::string& error) override {
    return Command(enabled ? "shutter_on" : "shutter_off", error,
                   [enabled](SimDeviceState& device, std::string& err) {
                     if (enabled && device.spec.fail_shutter_on) {
                       err = "camera busy";
                       return false;
                     }
                     if (!enabled && device.spec.fail_shutter_off) {
                       err = "camera busy";
                       return false;
                     }
                     if (enabled) {
                       device.recording = true;
                     } else if (device.recording) {
                       device.recording = false;
                       FinalizeRecording(device);
                     }
                     return true;
                   });
  }

  bool ListMedia(devices::MediaInventory& inventory, std::string& error) override {
    return Command("list_media", error, [&inventory](SimDeviceState& device, std::string& err) {
      if (device.spec.fail_list_media) {
        err = "media list request failed";
        return false;
      }
      inventory = device.media;
      return true;
    });
  }

  bool DownloadFile(const std::string& camera_file, const std::filesystem::path& local_file,
                    std::string& error) override {
    std::string content;
    const bool ok = Command(
        "download:" + camera_file, error,
        [this, &camera_file, &content](SimDeviceState& device, std::string& err) {
          return PrepareDownload(device, camera_file, "video", content, err);
        });
    return ok && WritePlaceholder(local_file, content, error);
  }

  bool DownloadMetadata(const std::string& camera_file, const std::filesystem::path& local_file,
                        std::string& error) override {
    std::string content;
    const bool ok = Command(
        "download_metadata:" + camera_file, error,
        [this, &camera_file, &content](SimDeviceState& device, std::string& err) {
          return PrepareDownload(device, camera_file, "gpmf", content, err);
        });
    return ok && WritePlaceholder(local_file, content, error);
  }

  void Close() override {
    std::lock_guard<std::mutex> lock(state_->mu);
    auto it = state_->devices.find(name_);
    if (it == state_->devices.end()) {
      return;
    }
    it->second.open = false;
    state_->Record(name_, "close");
  }

private:
  template <typename Fn>
  bool Command(const std::string& entry, std::string& error, Fn&& fn) {
    std::chrono::milliseconds latency{0};
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      auto it = state_->devices.find(name_);
      if (it != state_->devices.end()) {
        latency = it->second.spec.command_latency;
      }
    }
    if (latency.count() > 0) {
      std::this_thread::sleep_for(latency);
    }

    std::lock_guard<std::mutex> lock(state_->mu);
    auto it = state_->devices.find(name_);
    if (it == state_->devices.end()) {
      error = "no such device on the network";
      return false;
    }
    state_->Record(name_, entry);
    if (entry != "open" && !it->second.open) {
      error = "control channel is not open";
      return false;
    }
    return fn(it->second, error);
  }

  bool PrepareDownload(SimDeviceState& device, const std::string& camera_file,
                       const std::string& kind, std::string& content, std::string& error) {
    if (!Contains(device.media, camera_file)) {
      error = "404 not found: " + camera_file;
      return false;
    }
    auto [it, inserted] =
        device.download_failures_left.emplace(kind + ":" + camera_file, device.spec.download_failures);
    (void)inserted;
    if (it->second > 0U) {
      --it->second;
      error = "connection reset by peer";
      return false;
    }
    content = "sim " + kind + " " + name_ + " " + camera_file + "\n";
    return true;
  }

  std::shared_ptr<SimFleetState> state_;
  const devices::DeviceIdentifier name_;
};

} // namespace

std::vector<std::string> AdvertisementsFor(const SimDeviceSpec& spec) {
  if (!spec.advertisements.empty()) {
    return spec.advertisements;
  }
  const std::string advertised = spec.name + "." + std::string(discovery::kDefaultServiceType);
  return {advertised, advertised};
}

SimFleet::SimFleet(SimFleetConfig config) : state_(std::make_shared<SimFleetState>()) {
  state_->fail_listener_start = config.fail_listener_start;
  for (SimDeviceSpec& spec : config.devices) {
    SimDeviceState device;
    device.media = spec.initial_media;
    device.recording = spec.recording_at_start;
    device.spec = std::move(spec);
    const devices::DeviceIdentifier name = device.spec.name;
    if (state_->devices.emplace(name, std::move(device)).second) {
      state_->order.push_back(name);
    }
  }
}

std::unique_ptr<discovery::IDiscoveryListener> SimFleet::CreateListener() const {
  return std::make_unique<SimDiscoveryListener>(state_);
}

devices::DeviceTransportFactory SimFleet::TransportFactory() const {
  std::shared_ptr<SimFleetState> state = state_;
  return [state](const devices::DeviceIdentifier& identifier)
             -> std::unique_ptr<devices::IDeviceTransport> {
    return std::make_unique<SimDeviceTransport>(state, identifier);
  };
}

std::vector<std::string> SimFleet::Journal() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->journal;
}

devices::MediaInventory SimFleet::Media(const devices::DeviceIdentifier& name) const {
  std::lock_guard<std::mutex> lock(state_->mu);
  const auto it = state_->devices.find(name);
  return it == state_->devices.end() ? devices::MediaInventory{} : it->second.media;
}

bool SimFleet::IsRecording(const devices::DeviceIdentifier& name) const {
  std::lock_guard<std::mutex> lock(state_->mu);
  const auto it = state_->devices.find(name);
  return it != state_->devices.end() && it->second.recording;
}

bool SimFleet::IsOpen(const devices::DeviceIdentifier& name) const {
  std::lock_guard<std::mutex> lock(state_->mu);
  const auto it = state_->devices.find(name);
  return it != state_->devices.end() && it->second.open;
}

} // namespace fleetcap::backends::sim
