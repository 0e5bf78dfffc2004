#ifndef FLEETCAP_CORE_TIME_UTILS_HPP_
#define FLEETCAP_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace fleetcap::core {

namespace detail {

inline bool ToUtcTm(std::chrono::system_clock::time_point timestamp, std::tm& utc_time) {
  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
#if defined(_WIN32)
  return gmtime_s(&utc_time, &epoch_seconds) == 0;
#else
  return gmtime_r(&epoch_seconds, &utc_time) != nullptr;
#endif
}

} // namespace detail

// UTC timestamp with millisecond precision, shared by the logger and the
// session timeline: 2024-01-31T12:00:00.250Z
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  std::tm utc_time{};
  if (!detail::ToUtcTm(timestamp, utc_time)) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Session ids are derived from the creation time so storage folders and log
// lines sort chronologically: session-20240131T120000Z
inline std::string BuildSessionId(std::chrono::system_clock::time_point created_at) {
  std::tm utc_time{};
  if (!detail::ToUtcTm(created_at, utc_time)) {
    return "session-unknown";
  }

  std::ostringstream out;
  out << "session-" << std::put_time(&utc_time, "%Y%m%dT%H%M%SZ");
  return out.str();
}

} // namespace fleetcap::core

#endif // FLEETCAP_CORE_TIME_UTILS_HPP_
