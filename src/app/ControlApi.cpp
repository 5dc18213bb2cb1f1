#include "app/ControlApi.hpp"
#include "app/StatusFile.hpp"

namespace snapwatch::app {

static const char* reason_phrase(int status) {
  switch (status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 503: return "Service Unavailable";
    default:  return "Internal Server Error";
  }
}

static HttpResponse json(std::string body) {
  HttpResponse r;
  r.body = std::move(body);
  r.body.push_back('\n');
  return r;
}

static HttpResponse error(int status, std::string_view msg) {
  HttpResponse r;
  r.status = status;
  r.content_type = "text/plain";
  r.body = std::string(msg) + "\n";
  return r;
}

static const char* flag(bool b) { return b ? "true" : "false"; }

ControlApi::ControlApi(Monitor& monitor, std::chrono::milliseconds stop_timeout)
    : monitor_(monitor), stop_timeout_(stop_timeout) {}

HttpResponse ControlApi::handle(std::string_view method, std::string_view path) {
  const bool get = method == "GET";
  const bool post = method == "POST";

  if (path == "/") {
    if (!get) return error(405, "405 Method Not Allowed");
    return error(200, "snapwatch: GET /status, POST /start /stop /test_notify /clear_images");
  }
  if (path == "/status") {
    if (!get) return error(405, "405 Method Not Allowed");
    return json(status_to_json(monitor_.status()));
  }
  if (path == "/start" || path == "/stop") {
    if (!post) return error(405, "405 Method Not Allowed");
    bool ok = (path == "/start") ? monitor_.start() : monitor_.stop(stop_timeout_);
    return json(std::string("{\"ok\":") + flag(ok) + ",\"running\":" + flag(monitor_.is_running()) + "}");
  }
  if (path == "/test_notify") {
    if (!post) return error(405, "405 Method Not Allowed");
    auto res = monitor_.test_notify();
    return json(std::string("{\"ok\":") + flag(res.ok) + "}");
  }
  if (path == "/clear_images") {
    if (!post) return error(405, "405 Method Not Allowed");
    auto res = monitor_.clear_images();
    return json("{\"ok\":true,\"deleted\":" + std::to_string(res.deleted) +
                ",\"failed\":" + std::to_string(res.failed) + "}");
  }
  return error(404, "404 Not Found");
}

bool parse_request_line(std::string_view line, std::string_view& method, std::string_view& path) {
  auto sp1 = line.find(' ');
  if (sp1 == std::string_view::npos || sp1 == 0) return false;
  auto sp2 = line.find(' ', sp1 + 1);
  method = line.substr(0, sp1);
  path = line.substr(sp1 + 1, sp2 == std::string_view::npos ? std::string_view::npos : sp2 - sp1 - 1);
  if (path.empty() || path.front() != '/') return false;
  if (auto q = path.find('?'); q != std::string_view::npos) path = path.substr(0, q);
  return true;
}

std::string response_headers(const HttpResponse& r) {
  std::string h = "HTTP/1.1 " + std::to_string(r.status) + " " + reason_phrase(r.status) + "\r\n";
  h += "Content-Type: " + r.content_type + "\r\n";
  h += "Connection: close\r\n";
  h += "Content-Length: " + std::to_string(r.body.size()) + "\r\n\r\n";
  return h;
}

} // namespace snapwatch::app
