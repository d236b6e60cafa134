#include "config.hpp"
#include "file_reader.hpp"
#include "str_util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iterator>

static bool parse_count(const std::string& s, size_t& out) {
  if (s.empty()) return false;
  bool ok = std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
  if (!ok) return false;
  size_t v = 0;
  try { v = static_cast<size_t>(std::stoul(s)); } catch (const std::exception&) { return false; }
  if (v < 1) return false;
  out = v;
  return true;
}

bool apply_config_line(RegistryConfig& cfg, const std::string& line, std::string& msg) {
  std::string s = trim(line);
  if (!s.empty() && s[0] == ':') s.erase(s.begin());
  std::vector<std::string> parts = split_ws(s);
  if (parts.size() < 2 || parts[0] != "set") { msg = "unknown directive: " + s; return false; }

  std::string key = parts[1];
  std::string value;
  size_t eq = key.find('=');
  if (eq != std::string::npos) {
    value = key.substr(eq + 1);
    key = key.substr(0, eq);
  } else if (parts.size() >= 3) {
    value = parts[2];
  }
  if (value.empty()) { msg = "set " + key + ": missing value"; return false; }

  if (key == "history") {
    if (!parse_count(value, cfg.history_limit)) { msg = "set history: value must be a number >= 1"; return false; }
  } else if (key == "results") {
    if (!parse_count(value, cfg.result_limit)) { msg = "set results: value must be a number >= 1"; return false; }
  } else if (key == "sentinel") {
    if (value.size() != 1 || is_space(value[0])) { msg = "set sentinel: value must be one character"; return false; }
    cfg.shortcut_sentinel = value[0];
  } else if (key == "loglevel") {
    static const char* levels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    std::string v = to_lower(value);
    bool ok = std::any_of(std::begin(levels), std::end(levels), [&](const char* l){ return v == l; });
    if (!ok) { msg = "set loglevel: unknown level " + value; return false; }
    cfg.log_level = v;
  } else if (key == "logfile") {
    cfg.log_file = value;
  } else {
    msg = "unknown option: " + key;
    return false;
  }
  msg = key + "=" + value;
  return true;
}

bool load_config_file(const std::filesystem::path& path, RegistryConfig& cfg,
                      std::vector<std::string>& warnings, std::string& msg) {
  std::vector<std::string> lines;
  if (!mmap_readlines(path, lines, msg)) return false;
  int lineno = 0;
  for (const auto& raw : lines) {
    lineno++;
    std::string s = trim(raw);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    std::string m;
    if (!apply_config_line(cfg, s, m)) warnings.push_back(path.string() + ":" + std::to_string(lineno) + ": " + m);
  }
  msg = "loaded " + path.string();
  return true;
}

std::filesystem::path default_config_path() {
  const char* home = std::getenv("HOME");
  if (!home) return {};
  return std::filesystem::path(home) / ".cmdpalrc";
}
