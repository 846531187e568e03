#pragma once

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace batch_newton {

/**
 * @brief Flat `key: value` configuration file.
 * @details Blank lines and lines starting with '#' are skipped; values may be quoted.
 *          Lookups fall back to the supplied default when a key is missing or malformed.
 */
class SimpleConfig {
public:
  static SimpleConfig load(const std::string &path) {
    SimpleConfig cfg;
    std::ifstream in(path);
    if (!in) {
      return cfg;
    }
    cfg.loaded_ = true;

    std::string line;
    while (std::getline(in, line)) {
      cfg.parseLine(line);
    }
    return cfg;
  }

  /// @brief Parse configuration text held in memory.
  static SimpleConfig parse(const std::string &text) {
    SimpleConfig cfg;
    cfg.loaded_ = true;
    std::size_t start = 0;
    while (start <= text.size()) {
      std::size_t end = text.find('\n', start);
      if (end == std::string::npos) end = text.size();
      cfg.parseLine(text.substr(start, end - start));
      start = end + 1;
    }
    return cfg;
  }

  bool loaded() const { return loaded_; }

  bool has(const std::string &key) const { return values_.count(key) > 0; }

  int getInt(const std::string &key, int fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
      return fallback;
    }
    try {
      return std::stoi(it->second);
    } catch (const std::logic_error &) {
      warnMalformed(key, it->second);
      return fallback;
    }
  }

  double getDouble(const std::string &key, double fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
      return fallback;
    }
    try {
      return std::stod(it->second);
    } catch (const std::logic_error &) {
      warnMalformed(key, it->second);
      return fallback;
    }
  }

  bool getBool(const std::string &key, bool fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
      return fallback;
    }
    std::string v = it->second;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    warnMalformed(key, it->second);
    return fallback;
  }

  std::string getString(const std::string &key, const std::string &fallback) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
      return fallback;
    }
    return it->second;
  }

private:
  void parseLine(const std::string &line) {
    std::string trimmed = trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      return;
    }
    std::size_t sep = trimmed.find(':');
    if (sep == std::string::npos) {
      return;
    }
    std::string key = trim(trimmed.substr(0, sep));
    std::string value = trim(trimmed.substr(sep + 1));
    if (value.size() >= 2) {
      char first = value.front();
      char last = value.back();
      if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
        value = value.substr(1, value.size() - 2);
      }
    }
    if (!key.empty()) {
      values_[key] = value;
    }
  }

  static void warnMalformed(const std::string &key, const std::string &value) {
    std::cerr << "Warning: ignoring malformed value '" << value << "' for config key '" << key << "'." << std::endl;
  }

  static std::string trim(const std::string &input) {
    std::size_t start = 0;
    while (start < input.size() && std::isspace(static_cast<unsigned char>(input[start]))) {
      ++start;
    }
    if (start == input.size()) {
      return "";
    }
    std::size_t end = input.size();
    while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1]))) {
      --end;
    }
    return input.substr(start, end - start);
  }

  bool loaded_ = false;
  std::unordered_map<std::string, std::string> values_;
};

} // namespace batch_newton
