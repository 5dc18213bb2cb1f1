#pragma once
#include <chrono>
#include <string>
#include <string_view>
#include "app/Monitor.hpp"

namespace snapwatch::app {

struct HttpResponse {
  int status{200};
  std::string content_type{"application/json"};
  std::string body;
};

// Maps control routes onto Monitor operations and renders JSON replies.
// Transport agnostic: ControlServer feeds it parsed request lines.
class ControlApi {
public:
  explicit ControlApi(Monitor& monitor,
                      std::chrono::milliseconds stop_timeout = std::chrono::seconds(5));

  [[nodiscard]] HttpResponse handle(std::string_view method, std::string_view path);

private:
  Monitor& monitor_;
  std::chrono::milliseconds stop_timeout_;
};

// "GET /status?x=1 HTTP/1.1" -> method "GET", path "/status". False if malformed.
[[nodiscard]] bool parse_request_line(std::string_view line, std::string_view& method,
                                      std::string_view& path);

// Status line and headers (Connection: close) for r, ending with the blank line.
[[nodiscard]] std::string response_headers(const HttpResponse& r);

} // namespace snapwatch::app
