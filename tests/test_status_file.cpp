#include "minitest.hpp"
#include "app/StatusFile.hpp"
#include "util/Json.hpp"
#include "fakes.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace std::chrono;
using snapwatch::app::status_to_json;
using snapwatch::app::write_status_file;
using snapwatch::model::StatusSnapshot;

static system_clock::time_point at(long long ms_since_epoch) {
  return system_clock::time_point(duration_cast<system_clock::duration>(milliseconds(ms_since_epoch)));
}

TEST(json_format_utc_millis) {
  // 2021-01-01T00:00:00.042Z
  ASSERT_EQ(snapwatch::util::format_utc(at(1609459200042LL)), "2021-01-01T00:00:00.042Z");
}

TEST(json_string_escapes) {
  std::string out;
  snapwatch::util::json_append_string(out, "a\"b\\c\nd\x01");
  ASSERT_EQ(out, "\"a\\\"b\\\\c\\nd\\u0001\"");
}

TEST(status_json_unknown_fields_are_null) {
  StatusSnapshot s;
  s.timestamp = at(1609459200000LL);
  auto j = status_to_json(s);
  ASSERT_EQ(j, "{\"timestamp_utc\":\"2021-01-01T00:00:00.000Z\",\"watcher_running\":false,"
               "\"webcam_online\":null,\"last_alarm_utc\":null,\"last_webcam_change_utc\":null,"
               "\"known_files_count\":0}");
}

TEST(status_json_populated) {
  StatusSnapshot s;
  s.timestamp = at(1609459200000LL);
  s.watcher_running = true;
  s.webcam_online = false;
  s.last_alarm = at(1609459201500LL);
  s.last_webcam_change = at(1609459202000LL);
  s.known_files_count = 12;
  auto j = status_to_json(s);
  ASSERT_TRUE(j.find("\"watcher_running\":true") != std::string::npos);
  ASSERT_TRUE(j.find("\"webcam_online\":false") != std::string::npos);
  ASSERT_TRUE(j.find("\"last_alarm_utc\":\"2021-01-01T00:00:01.500Z\"") != std::string::npos);
  ASSERT_TRUE(j.find("\"last_webcam_change_utc\":\"2021-01-01T00:00:02.000Z\"") != std::string::npos);
  ASSERT_TRUE(j.find("\"known_files_count\":12}") != std::string::npos);
}

TEST(status_file_written_atomically) {
  auto dir = snapwatch::test::temp_dir("statusfile");
  auto path = dir / "nested" / "status.json";
  StatusSnapshot s;
  s.known_files_count = 3;
  ASSERT_TRUE(write_status_file(path, s));
  std::ifstream in(path);
  std::stringstream buf;
  buf << in.rdbuf();
  ASSERT_EQ(buf.str(), status_to_json(s));
  int entries = 0;
  for (const auto& e : std::filesystem::directory_iterator(dir / "nested")) { (void)e; ++entries; }
  ASSERT_EQ(entries, 1);
  std::filesystem::remove_all(dir);
}
