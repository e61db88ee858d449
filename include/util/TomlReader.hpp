#pragma once

#include <cctype>
#include <charconv>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace hostpulse::util {

// Flat TOML subset: [section] headers and key = value lines with string,
// integer or bare values. Trailing "# comment" on unquoted values is ignored.
class TomlReader {
public:
  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    parse(text);
    return true;
  }

  void parse(std::string_view text) {
    sections_.clear();
    std::string current_section;
    size_t start = 0;
    while (start <= text.size()) {
      size_t end = text.find('\n', start);
      if (end == std::string_view::npos) end = text.size();
      auto sv = trim(text.substr(start, end - start));
      start = end + 1;
      if (sv.empty() || sv[0] == '#') continue;
      if (sv.front() == '[' && sv.back() == ']') {
        current_section = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      auto raw = trim(sv.substr(eq + 1));
      std::string val;
      if (raw.size() >= 2 && raw.front() == '"') {
        auto close = raw.find('"', 1);
        val = std::string(raw.substr(1, close == std::string_view::npos ? raw.size() - 1 : close - 1));
      } else {
        auto hash = raw.find('#');
        val = std::string(trim(raw.substr(0, hash)));
      }
      ensure_section(current_section).set(key, val);
    }
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
    int out = 0;
    auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), out);
    if (ec != std::errc{} || ptr != val.data() + val.size()) return def;
    return out;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s && s->has(key);
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

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace hostpulse::util
