#pragma once

#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace snapwatch::util {

// Reader for the flat TOML subset snapwatch uses: [dotted.sections],
// key = value pairs, quoted strings, one-line string arrays and # comments.
class TomlReader {
public:
  bool load(const std::string& path) {
    sections_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string current_section;
    std::string line;
    while (std::getline(in, line)) {
      auto sv = trim(strip_comment(line));
      if (sv.empty()) continue;
      if (sv.front() == '[' && sv.back() == ']' && sv.find('=') == std::string_view::npos) {
        current_section = std::string(sv.substr(1, sv.size() - 2));
        trim_inplace(current_section);
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      std::string val(trim(sv.substr(eq + 1)));
      // Strip surrounding quotes from string values
      if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
        val = val.substr(1, val.size() - 2);
      ensure_section(current_section).set(key, val);
    }
    return true;
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                        const std::string& def = "") const {
    const auto* s = find_section(section);
    return s ? s->get(key, def) : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    try { return std::stoi(val); } catch (const std::exception&) { return def; }
  }

  [[nodiscard]] double get_double(std::string_view section, std::string_view key, double def = 0.0) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    try { return std::stod(val); } catch (const std::exception&) { return def; }
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    // Case-insensitive true/false
    if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
    if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
    return def;
  }

  // Accepts ["a", "b"] or a bare comma separated string "a, b".
  [[nodiscard]] std::vector<std::string> get_list(std::string_view section, std::string_view key) const {
    std::vector<std::string> out;
    const auto* s = find_section(section);
    if (!s) return out;
    auto raw = s->get(key, "");
    std::string_view sv = trim(raw);
    if (sv.size() >= 2 && sv.front() == '[' && sv.back() == ']') sv = sv.substr(1, sv.size() - 2);
    std::string item;
    bool in_quotes = false;
    auto flush = [&]{
      auto t = trim(item);
      if (t.size() >= 2 && t.front() == '"' && t.back() == '"') t = t.substr(1, t.size() - 2);
      if (!t.empty()) out.emplace_back(t);
      item.clear();
    };
    for (char c : sv) {
      if (c == '"') in_quotes = !in_quotes;
      if (c == ',' && !in_quotes) { flush(); continue; }
      item.push_back(c);
    }
    flush();
    return out;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s && s->has(key);
  }

  // Key/value pairs of one section in file order; empty if the section is absent.
  [[nodiscard]] std::vector<std::pair<std::string, std::string>> entries(std::string_view section) const {
    const auto* s = find_section(section);
    return s ? s->entries : std::vector<std::pair<std::string, std::string>>{};
  }

  // Names of sections directly below `parent` (e.g. "ntfy.templates" -> "motion").
  [[nodiscard]] std::vector<std::string> child_sections(std::string_view parent) const {
    std::vector<std::string> out;
    std::string prefix = std::string(parent) + ".";
    for (const auto& [n, s] : sections_) {
      if (n.size() <= prefix.size() || n.compare(0, prefix.size(), prefix) != 0) continue;
      auto rest = n.substr(prefix.size());
      if (rest.find('.') == std::string::npos) out.push_back(rest);
    }
    return out;
  }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    [[nodiscard]] std::string get(std::string_view key, const std::string& def) const {
      for (const auto& [k, v] : entries)
        if (k == key) return v;
      return def;
    }

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }

    [[nodiscard]] bool has(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return true;
      return false;
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const Section* find_section(std::string_view name) const {
    for (const auto& [n, s] : sections_)
      if (n == name) return &s;
    return nullptr;
  }

  // Drop a trailing "# ..." that is not inside a quoted string.
  static std::string_view strip_comment(std::string_view sv) {
    bool in_quotes = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"') in_quotes = !in_quotes;
      else if (sv[i] == '#' && !in_quotes) return sv.substr(0, i);
    }
    return sv;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  static void trim_inplace(std::string& s) {
    auto sv = trim(std::string_view(s));
    s = std::string(sv);
  }
};

} // namespace snapwatch::util
