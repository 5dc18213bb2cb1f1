#include "app/NotifyMessage.hpp"
#include <cctype>

namespace snapwatch::app {

using snapwatch::model::Event;
using snapwatch::model::EventKind;
using snapwatch::model::MonitorConfig;
using snapwatch::model::NotifyConfig;
using snapwatch::model::NotifyTemplate;

static const std::string* lookup(const TemplateVars& vars, std::string_view name) {
  for (auto it = vars.rbegin(); it != vars.rend(); ++it)
    if (it->first == name) return &it->second;
  return nullptr;
}

std::string render_template(std::string_view tpl, const TemplateVars& vars) {
  std::string out;
  out.reserve(tpl.size());
  auto fail = [&](const std::string& why) {
    return std::string(tpl) + " (format error: " + why + ")";
  };
  for (size_t i = 0; i < tpl.size(); ++i) {
    char c = tpl[i];
    if (c == '{') {
      if (i + 1 < tpl.size() && tpl[i + 1] == '{') { out.push_back('{'); ++i; continue; }
      auto close = tpl.find('}', i + 1);
      if (close == std::string_view::npos) return fail("unmatched '{'");
      auto name = tpl.substr(i + 1, close - i - 1);
      const auto* v = lookup(vars, name);
      if (!v) return fail("unknown field '" + std::string(name) + "'");
      out += *v;
      i = close;
    } else if (c == '}') {
      if (i + 1 < tpl.size() && tpl[i + 1] == '}') { out.push_back('}'); ++i; continue; }
      return fail("single '}'");
    } else {
      out.push_back(c);
    }
  }
  return out;
}

TemplateVars template_vars(const Event& e, const MonitorConfig& cfg) {
  TemplateVars v = cfg.vars;
  v.emplace_back("watch_dir", cfg.watch_dir.string());
  v.emplace_back("web_url", cfg.web_url);
  v.emplace_back("probe_target",
                 cfg.probe.mode == snapwatch::model::ProbeMode::Ping ? cfg.probe.host : cfg.probe.url);
  v.emplace_back("hysteresis", std::to_string(cfg.hysteresis));
  v.emplace_back("event", snapwatch::model::to_string(e.kind));
  if (e.kind == EventKind::Motion) {
    std::string joined;
    for (const auto& f : e.files) {
      if (!joined.empty()) joined += ", ";
      joined += f;
    }
    v.emplace_back("files", joined);
    v.emplace_back("count", std::to_string(e.files.size()));
  }
  if (e.kind == EventKind::Cleared) {
    v.emplace_back("deleted", std::to_string(e.deleted));
    v.emplace_back("failed", std::to_string(e.failed));
    v.emplace_back("error", e.error);
  }
  return v;
}

static std::string_view strip(std::string_view s, char ch) {
  while (!s.empty() && (s.front() == ch || std::isspace(static_cast<unsigned char>(s.front())))) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ch || std::isspace(static_cast<unsigned char>(s.back())))) s.remove_suffix(1);
  return s;
}

std::string ntfy_url(const NotifyConfig& cfg) {
  std::string_view server = cfg.server;
  while (!server.empty() && server.back() == '/') server.remove_suffix(1);
  return std::string(server) + "/" + std::string(strip(cfg.topic, '/'));
}

std::string template_name(const Event& e, const NotifyConfig& cfg) {
  if (e.kind == EventKind::Cleared && e.failed > 0 && cfg.templates.count("cleared_partial"))
    return "cleared_partial";
  return snapwatch::model::to_string(e.kind);
}

std::optional<NotifyMessage> build_message(const Event& e, const MonitorConfig& cfg) {
  auto it = cfg.notify.templates.find(template_name(e, cfg.notify));
  if (it == cfg.notify.templates.end()) return std::nullopt;
  const NotifyTemplate& tpl = it->second;
  const NotifyTemplate& def = cfg.notify.defaults;

  auto vars = template_vars(e, cfg);
  NotifyMessage m;
  m.url = ntfy_url(cfg.notify);
  m.body = render_template(tpl.message.value_or(def.message.value_or("")), vars);
  m.title = tpl.title.value_or(def.title.value_or(""));
  m.priority = tpl.priority ? tpl.priority : def.priority;
  for (const auto& t : tpl.tags.value_or(def.tags.value_or(std::vector<std::string>{}))) {
    auto s = strip(t, ' ');
    if (!s.empty()) m.tags.emplace_back(s);
  }
  return m;
}

} // namespace snapwatch::app
