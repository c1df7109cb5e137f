#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace decorr {

// Minimal INI parser for run configuration:
// - Sections: [section]
// - Key: key = value
// - Comments: lines starting with '#' or ';'
// - Values: raw strings; surrounding quotes (single/double) are stripped.
class IniConfig {
public:
  explicit IniConfig(const std::filesystem::path& file) : file_(file) {
    parse_();
  }

  const std::filesystem::path& file_path() const { return file_; }
  std::filesystem::path base_dir() const { return file_.parent_path(); }

  bool has_section(const std::string& section) const {
    return data_.find(section) != data_.end();
  }

  bool has_key(const std::string& section, const std::string& key) const {
    auto it = data_.find(section);
    if (it == data_.end()) return false;
    return it->second.find(key) != it->second.end();
  }

  std::string get_string(const std::string& section, const std::string& key,
                         const std::optional<std::string>& def = std::nullopt) const {
    if (auto v = get_raw_(section, key)) return *v;
    if (def) return *def;
    throw std::runtime_error(err_prefix_() + "missing required key '" + key + "' in section [" + section + "]");
  }

  std::size_t get_size(const std::string& section, const std::string& key,
                       const std::optional<std::size_t>& def = std::nullopt) const {
    if (!has_key(section, key) && def) return *def;
    return parse_size_(section, key, get_string(section, key));
  }

  double get_double(const std::string& section, const std::string& key,
                    const std::optional<double>& def = std::nullopt) const {
    if (!has_key(section, key) && def) return *def;
    return parse_double_(section, key, get_string(section, key));
  }

  bool get_bool(const std::string& section, const std::string& key,
                const std::optional<bool>& def = std::nullopt) const {
    if (!has_key(section, key) && def) return *def;
    auto s = get_string(section, key);
    for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    throw std::runtime_error(err_prefix_() + "failed to parse bool for " + section + "." + key + " from value: '" + s + "'");
  }

  // Absent key (or the literal "none") -> nullopt. Used for optional bounds.
  std::optional<double> get_optional_double(const std::string& section, const std::string& key) const {
    auto v = get_raw_(section, key);
    if (!v || is_none_(*v)) return std::nullopt;
    return parse_double_(section, key, *v);
  }

  std::optional<std::size_t> get_optional_size(const std::string& section, const std::string& key) const {
    auto v = get_raw_(section, key);
    if (!v || is_none_(*v)) return std::nullopt;
    return parse_size_(section, key, *v);
  }

  // Fail on keys outside `allowed`, so a misspelled option is not silently ignored.
  void require_known_keys(const std::string& section, std::initializer_list<const char*> allowed) const {
    auto it = data_.find(section);
    if (it == data_.end()) return;
    std::vector<std::string> unknown;
    for (const auto& kv : it->second) {
      const bool ok = std::any_of(allowed.begin(), allowed.end(), [&](const char* a) { return kv.first == a; });
      if (!ok) unknown.push_back(kv.first);
    }
    if (unknown.empty()) return;
    std::sort(unknown.begin(), unknown.end());
    std::string msg = err_prefix_() + "unknown key(s) in [" + section + "]:";
    for (const auto& k : unknown) msg += " " + k;
    throw std::runtime_error(msg);
  }

private:
  std::filesystem::path file_;
  std::unordered_map<std::string, std::unordered_map<std::string, std::string>> data_;

  static std::string trim_(std::string s) {
    auto is_ws = [](unsigned char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; };
    std::size_t b = 0;
    while (b < s.size() && is_ws(static_cast<unsigned char>(s[b]))) ++b;
    std::size_t e = s.size();
    while (e > b && is_ws(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
  }

  static std::string strip_quotes_(std::string s) {
    if (s.size() >= 2) {
      const char a = s.front();
      const char b = s.back();
      if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
        return s.substr(1, s.size() - 2);
      }
    }
    return s;
  }

  static bool is_none_(std::string s) {
    for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    return s.empty() || s == "none";
  }

  std::size_t parse_size_(const std::string& section, const std::string& key, const std::string& s) const {
    try {
      if (!s.empty() && s[0] == '-') throw std::invalid_argument("negative");
      std::size_t pos = 0;
      unsigned long long v = std::stoull(s, &pos);
      if (pos != s.size()) throw std::invalid_argument("trailing chars");
      return static_cast<std::size_t>(v);
    } catch (const std::logic_error&) {
      throw std::runtime_error(err_prefix_() + "failed to parse size for " + section + "." + key + " from value: '" + s + "'");
    }
  }

  double parse_double_(const std::string& section, const std::string& key, const std::string& s) const {
    try {
      std::size_t pos = 0;
      double v = std::stod(s, &pos);
      if (pos != s.size()) throw std::invalid_argument("trailing chars");
      return v;
    } catch (const std::logic_error&) {
      throw std::runtime_error(err_prefix_() + "failed to parse double for " + section + "." + key + " from value: '" + s + "'");
    }
  }

  std::string err_prefix_() const {
    return std::string("IniConfig[") + file_.string() + "]: ";
  }

  std::optional<std::string> get_raw_(const std::string& section, const std::string& key) const {
    auto it = data_.find(section);
    if (it == data_.end()) return std::nullopt;
    auto it2 = it->second.find(key);
    if (it2 == it->second.end()) return std::nullopt;
    return it2->second;
  }

  void parse_() {
    std::ifstream ifs(file_);
    if (!ifs) {
      throw std::runtime_error(err_prefix_() + "failed to open config");
    }

    std::string section;
    std::string line;
    std::size_t lineno = 0;

    while (std::getline(ifs, line)) {
      ++lineno;
      std::string s = trim_(line);
      if (s.empty()) continue;
      if (s[0] == '#' || s[0] == ';') continue;

      if (s.front() == '[' && s.back() == ']') {
        section = trim_(s.substr(1, s.size() - 2));
        if (section.empty()) {
          throw std::runtime_error(err_prefix_() + "empty section header at line " + std::to_string(lineno));
        }
        (void)data_[section];
        continue;
      }

      auto eq = s.find('=');
      if (eq == std::string::npos) {
        throw std::runtime_error(err_prefix_() + "expected key=value at line " + std::to_string(lineno) + ": " + s);
      }

      std::string key = trim_(s.substr(0, eq));
      std::string val = strip_quotes_(trim_(s.substr(eq + 1)));
      if (key.empty()) {
        throw std::runtime_error(err_prefix_() + "empty key at line " + std::to_string(lineno));
      }
      if (section.empty()) {
        throw std::runtime_error(err_prefix_() + "key outside any section at line " + std::to_string(lineno) + ": " + key);
      }

      data_[section][key] = val;
    }
  }
};

} // namespace decorr
