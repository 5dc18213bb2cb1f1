#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace snapwatch::util {

// Append s to out as a quoted JSON string.
void json_append_string(std::string& out, std::string_view s);

// ISO-8601 UTC with millisecond precision, e.g. 2026-10-17T08:15:02.123Z
[[nodiscard]] std::string format_utc(std::chrono::system_clock::time_point tp);

// Quoted UTC timestamp, or null when absent.
void json_append_time(std::string& out, const std::optional<std::chrono::system_clock::time_point>& tp);

} // namespace snapwatch::util
