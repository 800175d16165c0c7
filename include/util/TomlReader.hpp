#pragma once

#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace netneighbor::util {

// Flat `[section] key = value` subset of TOML, enough for config.toml.
class TomlReader {
public:
  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::stringstream ss;
    ss << in.rdbuf();
    parse(ss.str());
    return true;
  }

  void parse(std::string_view text) {
    sections_.clear();
    std::string current_section;
    size_t start = 0;
    while (start <= text.size()) {
      size_t nl = text.find('\n', start);
      if (nl == std::string_view::npos) nl = text.size();
      auto sv = trim(strip_comment(text.substr(start, nl - start)));
      start = nl + 1;
      if (sv.empty()) continue;
      if (sv.front() == '[' && sv.back() == ']') {
        current_section = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      std::string val(trim(sv.substr(eq + 1)));
      if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') && val.back() == val.front())
        val = val.substr(1, val.size() - 2);
      ensure_section(current_section).set(key, val);
    }
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const {
    auto v = find(section, key);
    return v ? *v : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    auto v = find(section, key);
    if (!v || v->empty()) return def;
    try {
      size_t used = 0;
      int r = std::stoi(*v, &used);
      return used == v->size() ? r : def;
    } catch (...) { return def; }
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    auto v = find(section, key);
    if (!v) return def;
    if (*v == "true" || *v == "True" || *v == "TRUE" || *v == "1") return true;
    if (*v == "false" || *v == "False" || *v == "FALSE" || *v == "0") return false;
    return def;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return find(section, key).has_value();
  }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] std::optional<std::string> find(std::string_view section, std::string_view key) const {
    for (const auto& [n, s] : sections_) {
      if (n != section) continue;
      for (const auto& [k, v] : s.entries)
        if (k == key) return v;
    }
    return std::nullopt;
  }

  // Drop a trailing `# ...` that is not inside a quoted value
  static std::string_view strip_comment(std::string_view sv) {
    char quote = 0;
    for (size_t i = 0; i < sv.size(); ++i) {
      char c = sv[i];
      if (quote) { if (c == quote) quote = 0; continue; }
      if (c == '"' || c == '\'') quote = c;
      else if (c == '#') return sv.substr(0, i);
    }
    return sv;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace netneighbor::util
