#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <filesystem>
#include <fstream>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace matdim::config {

// Minimal INI reader:
// - sections: [name]
// - entries: key = value
// - comments: lines starting with '#' or ';'
// - values are raw strings; surrounding single/double quotes are stripped
//
// Every error message names the source (file path or "<string>").
class IniConfig {
public:
  explicit IniConfig(const std::filesystem::path& file) : source_(file.string()) {
    std::ifstream ifs(file);
    if (!ifs) throw std::runtime_error(err_prefix_() + "failed to open config");
    parse_(ifs);
  }

  IniConfig(std::istream& in, std::string source) : source_(std::move(source)) { parse_(in); }

  static IniConfig from_string(const std::string& text, std::string source = "<string>") {
    std::istringstream in(text);
    return IniConfig(in, std::move(source));
  }

  const std::string& source() const { return source_; }

  bool has_section(const std::string& section) const { return data_.find(section) != data_.end(); }

  std::vector<std::string> section_names() const {
    std::vector<std::string> out;
    for (const auto& kv : data_) out.push_back(kv.first);
    return out;
  }

  bool has_key(const std::string& section, const std::string& key) const { return get_raw_(section, key).has_value(); }

  std::string get_string(const std::string& section, const std::string& key,
                         const std::optional<std::string>& def = std::nullopt) const {
    if (auto v = get_raw_(section, key)) return *v;
    if (def) return *def;
    missing_(section, key);
  }

  std::int64_t get_int64(const std::string& section, const std::string& key,
                         const std::optional<std::int64_t>& def = std::nullopt) const {
    auto raw = get_raw_(section, key);
    if (!raw) {
      if (def) return *def;
      missing_(section, key);
    }
    try {
      std::size_t pos = 0;
      const long long v = std::stoll(*raw, &pos);
      if (pos != raw->size()) throw std::invalid_argument("trailing characters");
      return static_cast<std::int64_t>(v);
    } catch (const std::logic_error&) {
      throw std::runtime_error(err_prefix_() + "failed to parse integer for [" + section + "] " + key +
                               " from value: '" + *raw + "'");
    }
  }

  double get_double(const std::string& section, const std::string& key,
                    const std::optional<double>& def = std::nullopt) const {
    auto raw = get_raw_(section, key);
    if (!raw) {
      if (def) return *def;
      missing_(section, key);
    }
    try {
      std::size_t pos = 0;
      const double v = std::stod(*raw, &pos);
      if (pos != raw->size()) throw std::invalid_argument("trailing characters");
      return v;
    } catch (const std::logic_error&) {
      throw std::runtime_error(err_prefix_() + "failed to parse number for [" + section + "] " + key +
                               " from value: '" + *raw + "'");
    }
  }

  bool get_bool(const std::string& section, const std::string& key,
                const std::optional<bool>& def = std::nullopt) const {
    auto raw = get_raw_(section, key);
    if (!raw) {
      if (def) return *def;
      missing_(section, key);
    }
    std::string s = *raw;
    for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    throw std::runtime_error(err_prefix_() + "failed to parse bool for [" + section + "] " + key +
                             " from value: '" + *raw + "'");
  }

  // Reject sections and keys that are not listed. Typos in a config file
  // otherwise silently fall back to defaults.
  void require_known(const std::map<std::string, std::set<std::string>>& allowed) const {
    for (const auto& [section, entries] : data_) {
      auto it = allowed.find(section);
      if (it == allowed.end()) {
        throw std::runtime_error(err_prefix_() + "unknown section [" + section + "]");
      }
      for (const auto& kv : entries) {
        if (it->second.count(kv.first) == 0) {
          throw std::runtime_error(err_prefix_() + "unknown key '" + kv.first + "' in section [" + section + "]");
        }
      }
    }
  }

private:
  std::string source_;
  std::map<std::string, std::map<std::string, std::string>> data_;

  static std::string trim_(const std::string& s) {
    auto is_ws = [](unsigned char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; };
    std::size_t b = 0;
    while (b < s.size() && is_ws(static_cast<unsigned char>(s[b]))) ++b;
    std::size_t e = s.size();
    while (e > b && is_ws(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
  }

  static std::string strip_quotes_(const std::string& s) {
    if (s.size() >= 2) {
      const char a = s.front();
      const char b = s.back();
      if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) return s.substr(1, s.size() - 2);
    }
    return s;
  }

  std::string err_prefix_() const { return "IniConfig[" + source_ + "]: "; }

  [[noreturn]] void missing_(const std::string& section, const std::string& key) const {
    throw std::runtime_error(err_prefix_() + "missing required key '" + key + "' in section [" + section + "]");
  }

  std::optional<std::string> get_raw_(const std::string& section, const std::string& key) const {
    auto it = data_.find(section);
    if (it == data_.end()) return std::nullopt;
    auto it2 = it->second.find(key);
    if (it2 == it->second.end()) return std::nullopt;
    return it2->second;
  }

  void parse_(std::istream& in) {
    std::string section;
    std::string line;
    std::size_t lineno = 0;
    while (std::getline(in, line)) {
      ++lineno;
      const std::string s = trim_(line);
      if (s.empty() || s[0] == '#' || s[0] == ';') continue;

      if (s.front() == '[' && s.back() == ']') {
        section = trim_(s.substr(1, s.size() - 2));
        if (section.empty()) {
          throw std::runtime_error(err_prefix_() + "empty section header at line " + std::to_string(lineno));
        }
        (void)data_[section];
        continue;
      }

      const auto eq = s.find('=');
      if (eq == std::string::npos) {
        throw std::runtime_error(err_prefix_() + "expected key = value at line " + std::to_string(lineno) + ": " + s);
      }
      const std::string key = trim_(s.substr(0, eq));
      if (key.empty()) throw std::runtime_error(err_prefix_() + "empty key at line " + std::to_string(lineno));
      if (section.empty()) {
        throw std::runtime_error(err_prefix_() + "key outside any section at line " + std::to_string(lineno) + ": " + key);
      }
      if (data_[section].count(key)) {
        throw std::runtime_error(err_prefix_() + "duplicate key '" + key + "' in section [" + section + "] at line " +
                                 std::to_string(lineno));
      }
      data_[section][key] = strip_quotes_(trim_(s.substr(eq + 1)));
    }
  }
};

} // namespace matdim::config
