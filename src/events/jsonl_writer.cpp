#include "events/jsonl_writer.hpp"

#include "core/fs_utils.hpp"
#include "devices/error_mapper.hpp"

#include <fstream>

namespace fleetcap::events {

namespace {

bool TimelineError(std::string_view detail, std::string& error) {
  error = devices::FormatFleetError(devices::FleetErrorCode::kStorage, "append_event", "", detail);
  return false;
}

} // namespace

bool AppendEventJsonl(const Event& event, const std::filesystem::path& output_dir,
                      std::filesystem::path& written_path, std::string& error) {
  std::string dir_error;
  if (!core::EnsureDirectory(output_dir, dir_error)) {
    return TimelineError(dir_error, error);
  }

  written_path = output_dir / kEventsFileName;
  // Serialize first so a formatting problem never leaves a partial line.
  const std::string line = ToJson(event) + "\n";

  std::ofstream timeline(written_path, std::ios::binary | std::ios::app);
  if (!timeline) {
    return TimelineError("cannot open '" + written_path.string() + "' for append", error);
  }
  timeline.write(line.data(), static_cast<std::streamsize>(line.size()));
  timeline.flush();
  if (!timeline) {
    return TimelineError("short write to '" + written_path.string() + "'", error);
  }

  error.clear();
  return true;
}

} // namespace fleetcap::events
