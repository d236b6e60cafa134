#pragma once
/*
 * RegistryConfig
 *
 * Purpose: tunables for the registry and the palette front end.
 * Source: rc file ($HOME/.cmdpalrc or a path on the command line), one
 *         directive per line: "set <key> <value>" or "set <key>=<value>".
 *         Lines starting with '#', '"' or '//' are comments.
 */
#include <filesystem>
#include <string>
#include <vector>

struct RegistryConfig {
  size_t history_limit = 50;
  size_t result_limit = 10;
  char shortcut_sentinel = ':';
  std::string log_level = "info";
  std::string log_file = "cmdpal.log";
};

// Applies one directive. Returns false with msg for unknown keys or bad values.
bool apply_config_line(RegistryConfig& cfg, const std::string& line, std::string& msg);

// Loads an rc file. Returns false only when the file can not be read;
// per-line problems are appended to warnings and loading continues.
bool load_config_file(const std::filesystem::path& path, RegistryConfig& cfg,
                      std::vector<std::string>& warnings, std::string& msg);

// $HOME/.cmdpalrc, or empty when HOME is unset.
std::filesystem::path default_config_path();
