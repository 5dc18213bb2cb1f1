#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "model/Config.hpp"
#include "model/Event.hpp"

namespace snapwatch::app {

// Rendered ntfy request, ready for the transport.
struct NotifyMessage {
  std::string url;
  std::string title;
  std::optional<int> priority;
  std::vector<std::string> tags;
  std::string body;
};

// Later entries win on duplicate names.
using TemplateVars = std::vector<std::pair<std::string, std::string>>;

// Replace {name} placeholders; {{ and }} are literal braces. An unknown field
// or stray brace leaves the template unrendered with a "(format error: ...)" note.
[[nodiscard]] std::string render_template(std::string_view tpl, const TemplateVars& vars);

// [vars] section, then built-ins, then the event payload.
[[nodiscard]] TemplateVars template_vars(const snapwatch::model::Event& e,
                                         const snapwatch::model::MonitorConfig& cfg);

// <server>/<topic> with redundant slashes removed.
[[nodiscard]] std::string ntfy_url(const snapwatch::model::NotifyConfig& cfg);

// Template name for an event; partial clears prefer "cleared_partial".
[[nodiscard]] std::string template_name(const snapwatch::model::Event& e,
                                        const snapwatch::model::NotifyConfig& cfg);

// nullopt when no template is configured for the event.
[[nodiscard]] std::optional<NotifyMessage> build_message(const snapwatch::model::Event& e,
                                                         const snapwatch::model::MonitorConfig& cfg);

} // namespace snapwatch::app
