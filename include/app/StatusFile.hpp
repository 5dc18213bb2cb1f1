#pragma once
#include <filesystem>
#include <string>
#include "model/Status.hpp"

namespace snapwatch::app {

// {"timestamp_utc":...,"watcher_running":...,"webcam_online":...,
//  "last_alarm_utc":...,"last_webcam_change_utc":...,"known_files_count":...}
[[nodiscard]] std::string status_to_json(const snapwatch::model::StatusSnapshot& s);

// Write status_to_json(s) to path via a temp file and rename, creating the
// parent directory. Returns false (and logs) on failure.
bool write_status_file(const std::filesystem::path& path, const snapwatch::model::StatusSnapshot& s);

} // namespace snapwatch::app
