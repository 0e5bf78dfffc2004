#ifndef FLEETCAP_TESTS_COMMON_FAKE_DEVICES_HPP_
#define FLEETCAP_TESTS_COMMON_FAKE_DEVICES_HPP_

#include "devices/device_transport.hpp"
#include "discovery/discovery_listener.hpp"

#include <algorithm>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace fleetcap::tests::common {

// Thread-safe record of transport calls across devices ("d1:open").
// Also tracks how many calls are in flight per device at once.
class CallJournal {
public:
  void Begin(const std::string& device, const std::string& operation) {
    std::lock_guard<std::mutex> lock(mu_);
    entries_.push_back(device + ":" + operation);
    int& active = in_flight_[device];
    ++active;
    max_in_flight_[device] = std::max(max_in_flight_[device], active);
  }

  void End(const std::string& device) {
    std::lock_guard<std::mutex> lock(mu_);
    --in_flight_[device];
  }

  std::vector<std::string> Entries() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_;
  }

  int MaxInFlight(const std::string& device) const {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = max_in_flight_.find(device);
    return it == max_in_flight_.end() ? 0 : it->second;
  }

  // Index of the first entry equal to `entry`, or -1.
  int IndexOf(const std::string& entry) const {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = std::find(entries_.begin(), entries_.end(), entry);
    return it == entries_.end() ? -1 : static_cast<int>(it - entries_.begin());
  }

  int Count(const std::string& entry) const {
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<int>(std::count(entries_.begin(), entries_.end(), entry));
  }

private:
  mutable std::mutex mu_;
  std::vector<std::string> entries_;
  std::map<std::string, int> in_flight_;
  std::map<std::string, int> max_in_flight_;
};

// Per-device behavior of a FakeTransport.
struct FakeTransportScript {
  // Operations ("open", "load_preset", "turbo_off", "set_clock", "shutter_on",
  // "shutter_off", "list_media", "download", "download_metadata") that fail.
  std::set<std::string> failing;
  // Operation that blocks for `stall_for` before succeeding.
  std::string stall_operation;
  std::chrono::milliseconds stall_for{0};
  // Sleep added to every call, to widen race windows.
  std::chrono::milliseconds latency{0};
  // Inventory before recording, and the files a stopped recording adds.
  devices::MediaInventory media;
  devices::MediaInventory recorded_files;
  // Leading download attempts per file that fail.
  int download_failures = 0;
};

class FakeTransport final : public devices::IDeviceTransport {
public:
  FakeTransport(std::string device, FakeTransportScript script,
                std::shared_ptr<CallJournal> journal)
      : device_(std::move(device)), script_(std::move(script)), journal_(std::move(journal)) {}

  bool Open(std::string& error) override {
    return Call("open", error);
  }
  bool LoadVideoPresetGroup(std::string& error) override {
    return Call("load_preset", error);
  }
  bool SetTurboMode(bool enabled, std::string& error) override {
    return Call(enabled ? "turbo_on" : "turbo_off", error);
  }
  bool SetDateTime(std::chrono::system_clock::time_point, std::string& error) override {
    return Call("set_clock", error);
  }
  bool SetShutter(bool enabled, std::string& error) override {
    if (!Call(enabled ? "shutter_on" : "shutter_off", error)) {
      return false;
    }
    std::lock_guard<std::mutex> lock(mu_);
    if (enabled) {
      recording_ = true;
    } else if (recording_) {
      recording_ = false;
      script_.media.insert(script_.media.end(), script_.recorded_files.begin(),
                           script_.recorded_files.end());
    }
    return true;
  }
  bool ListMedia(devices::MediaInventory& inventory, std::string& error) override {
    if (!Call("list_media", error)) {
      return false;
    }
    std::lock_guard<std::mutex> lock(mu_);
    inventory = script_.media;
    return true;
  }
  bool DownloadFile(const std::string& camera_file, const std::filesystem::path&,
                    std::string& error) override {
    return Download("download", camera_file, error);
  }
  bool DownloadMetadata(const std::string& camera_file, const std::filesystem::path&,
                        std::string& error) override {
    return Download("download_metadata", camera_file, error);
  }
  void Close() override {
    journal_->Begin(device_, "close");
    journal_->End(device_);
  }

private:
  bool Call(const std::string& operation, std::string& error) {
    journal_->Begin(device_, operation);
    if (script_.latency.count() > 0) {
      std::this_thread::sleep_for(script_.latency);
    }
    if (operation == script_.stall_operation) {
      std::this_thread::sleep_for(script_.stall_for);
    }
    journal_->End(device_);
    if (script_.failing.count(operation) != 0U) {
      error = operation + " rejected by camera";
      return false;
    }
    return true;
  }

  bool Download(const std::string& operation, const std::string& camera_file,
                std::string& error) {
    if (!Call(operation, error)) {
      return false;
    }
    std::lock_guard<std::mutex> lock(mu_);
    int& failures = download_failures_[operation + ":" + camera_file];
    if (failures < script_.download_failures) {
      ++failures;
      error = "connection reset by peer";
      return false;
    }
    return true;
  }

  const std::string device_;
  std::mutex mu_;
  FakeTransportScript script_;
  bool recording_ = false;
  std::map<std::string, int> download_failures_;
  std::shared_ptr<CallJournal> journal_;
};

// Transport factory over per-device scripts. Devices without a script get a
// default (always succeeding, empty inventory) one.
inline devices::DeviceTransportFactory MakeFakeFactory(
    std::map<std::string, FakeTransportScript> scripts, std::shared_ptr<CallJournal> journal) {
  auto shared_scripts =
      std::make_shared<const std::map<std::string, FakeTransportScript>>(std::move(scripts));
  return [shared_scripts, journal](const devices::DeviceIdentifier& identifier)
             -> std::unique_ptr<devices::IDeviceTransport> {
    const auto it = shared_scripts->find(identifier);
    FakeTransportScript script = it == shared_scripts->end() ? FakeTransportScript{} : it->second;
    return std::make_unique<FakeTransport>(identifier, std::move(script), journal);
  };
}

// One scripted listener event: after `delay`, deliver `name` (or fail).
struct ListenerStep {
  std::chrono::milliseconds delay{0};
  std::string name;
  bool error = false;
};

// Replays steps against the caller's WaitNext timeouts. A step whose delay
// exceeds the timeout is carried over, so quiescence expiry is exercised the
// same way a silent network would.
class ScriptedListener final : public discovery::IDiscoveryListener {
public:
  explicit ScriptedListener(std::vector<ListenerStep> steps, bool fail_start = false)
      : steps_(steps.begin(), steps.end()), fail_start_(fail_start) {}

  bool Start(const std::string& service_type, std::string& error) override {
    started_service_type_ = service_type;
    if (fail_start_) {
      error = "cannot bind mDNS socket";
      return false;
    }
    return true;
  }

  discovery::ListenerWaitStatus WaitNext(std::chrono::milliseconds timeout,
                                         std::string& advertised_name,
                                         std::string& error) override {
    ++wait_calls_;
    if (steps_.empty()) {
      std::this_thread::sleep_for(timeout);
      return discovery::ListenerWaitStatus::kTimeout;
    }
    ListenerStep& next = steps_.front();
    if (next.delay > timeout) {
      std::this_thread::sleep_for(timeout);
      next.delay -= timeout;
      return discovery::ListenerWaitStatus::kTimeout;
    }
    std::this_thread::sleep_for(next.delay);
    const ListenerStep step = std::move(next);
    steps_.pop_front();
    if (step.error) {
      error = "mDNS socket closed";
      return discovery::ListenerWaitStatus::kError;
    }
    advertised_name = step.name;
    return discovery::ListenerWaitStatus::kAdvertisement;
  }

  void Stop() override {
    ++stop_calls_;
  }

  const std::string& started_service_type() const {
    return started_service_type_;
  }
  int stop_calls() const {
    return stop_calls_;
  }
  int wait_calls() const {
    return wait_calls_;
  }

private:
  std::deque<ListenerStep> steps_;
  bool fail_start_ = false;
  std::string started_service_type_;
  int stop_calls_ = 0;
  int wait_calls_ = 0;
};

} // namespace fleetcap::tests::common

#endif // FLEETCAP_TESTS_COMMON_FAKE_DEVICES_HPP_
