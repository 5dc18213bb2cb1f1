#include "app/StatusFile.hpp"
#include "util/Json.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <unistd.h>

namespace snapwatch::app {

std::string status_to_json(const snapwatch::model::StatusSnapshot& s) {
  std::string out = "{\"timestamp_utc\":";
  util::json_append_string(out, util::format_utc(s.timestamp));
  out += ",\"watcher_running\":";
  out += s.watcher_running ? "true" : "false";
  out += ",\"webcam_online\":";
  out += s.webcam_online ? (*s.webcam_online ? "true" : "false") : "null";
  out += ",\"last_alarm_utc\":";
  util::json_append_time(out, s.last_alarm);
  out += ",\"last_webcam_change_utc\":";
  util::json_append_time(out, s.last_webcam_change);
  out += ",\"known_files_count\":";
  out += std::to_string(s.known_files_count);
  out += "}";
  return out;
}

bool write_status_file(const std::filesystem::path& path, const snapwatch::model::StatusSnapshot& s) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      std::fprintf(stderr, "snapwatch: warning: status file: failed to create %s: %s\n",
                   path.parent_path().c_str(), ec.message().c_str());
      return false;
    }
  }
  auto tmp = path;
  tmp += ".tmp." + std::to_string(::getpid());
  {
    std::ofstream f(tmp, std::ios::trunc);
    if (!f) {
      std::fprintf(stderr, "snapwatch: warning: status file: failed to open %s: %s\n",
                   tmp.c_str(), std::strerror(errno));
      return false;
    }
    auto body = status_to_json(s);
    f.write(body.data(), static_cast<std::streamsize>(body.size()));
    f.flush();
    if (!f) {
      std::fprintf(stderr, "snapwatch: warning: status file: write to %s failed\n", tmp.c_str());
      std::filesystem::remove(tmp, ec);
      return false;
    }
  }
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::fprintf(stderr, "snapwatch: warning: status file: rename to %s failed: %s\n",
                 path.c_str(), ec.message().c_str());
    std::error_code rm_ec;
    std::filesystem::remove(tmp, rm_ec);
    return false;
  }
  return true;
}

} // namespace snapwatch::app
