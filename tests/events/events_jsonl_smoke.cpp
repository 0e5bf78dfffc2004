#include "events/event_model.hpp"
#include "events/jsonl_writer.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace {

void Fail(std::string_view message) {
  std::cerr << message << '\n';
  std::abort();
}

void AssertContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) == std::string_view::npos) {
    std::cerr << "expected to find: " << needle << '\n';
    std::cerr << "actual text: " << text << '\n';
    std::abort();
  }
}

} // namespace

int main() {
  using fleetcap::events::Event;
  using fleetcap::events::EventType;

  const fs::path root = fs::temp_directory_path() / "fleetcap-events-jsonl-smoke";
  std::error_code cleanup_ec;
  fs::remove_all(root, cleanup_ec);
  // The writer creates missing directories on first append.
  const fs::path out_dir = root / "session" / "Videos";

  Event first;
  first.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(1'000));
  first.type = EventType::kDeviceConnected;
  first.payload = {
      {"device_id", "GP1"},
  };

  Event second;
  second.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(2'000));
  second.type = EventType::kShutterFailed;
  second.payload = {
      {"device_id", "GP2"},
      {"error", "COMMAND_ERROR: shutter_on failed device: GP2 detail: camera \"busy\""},
  };

  Event third;
  third.ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(3'000));
  third.type = EventType::kManifestWritten;
  third.payload = {
      {"new_files", "3"},
      {"path", "/data/Videos/recordedFiles.txt"},
  };

  fs::path written_path;
  std::string error;
  for (const Event* event : {&first, &second, &third}) {
    if (!fleetcap::events::AppendEventJsonl(*event, out_dir, written_path, error)) {
      Fail("failed to append event: " + error);
    }
  }
  if (written_path != out_dir / "events.jsonl") {
    Fail("unexpected events path: " + written_path.string());
  }

  std::ifstream input(written_path, std::ios::binary);
  if (!input) {
    Fail("failed to open events.jsonl");
  }

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(input, line)) {
    if (!line.empty()) {
      lines.push_back(line);
    }
  }

  if (lines.size() != 3U) {
    Fail("expected exactly three event lines");
  }

  AssertContains(lines[0], "\"ts_utc\":\"1970-01-01T00:00:01.000Z\"");
  AssertContains(lines[0], "\"type\":\"DEVICE_CONNECTED\"");
  AssertContains(lines[0], "\"device_id\":\"GP1\"");

  AssertContains(lines[1], "\"type\":\"SHUTTER_FAILED\"");
  AssertContains(lines[1], "detail: camera \\\"busy\\\"");

  AssertContains(lines[2], "\"ts_utc\":\"1970-01-01T00:00:03.000Z\"");
  AssertContains(lines[2], "\"type\":\"MANIFEST_WRITTEN\"");
  AssertContains(lines[2], "\"new_files\":\"3\"");

  // A file where the directory should be makes the append fail, not throw.
  const fs::path blocked = root / "blocked";
  std::ofstream(blocked) << "x";
  if (fleetcap::events::AppendEventJsonl(first, blocked, written_path, error)) {
    Fail("append into a file path must fail");
  }
  AssertContains(error, "STORAGE_ERROR: append_event failed");

  fs::remove_all(root, cleanup_ec);
  std::cout << "events_jsonl_smoke: ok\n";
  return 0;
}
