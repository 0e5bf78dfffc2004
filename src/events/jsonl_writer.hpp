#pragma once

#include "events/event_model.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace fleetcap::events {

inline constexpr std::string_view kEventsFileName = "events.jsonl";

// Appends one JSON line to `<output_dir>/events.jsonl`, creating the
// directory on first use. Returns false with `error` populated on failure.
bool AppendEventJsonl(const Event& event, const std::filesystem::path& output_dir,
                      std::filesystem::path& written_path, std::string& error);

} // namespace fleetcap::events
