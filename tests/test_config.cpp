#include "config.hpp"
#include "file_reader.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static fs::path scratch_dir() {
  const char* d = std::getenv("CMDPAL_TEST_DIR");
  return d ? fs::path(d) : fs::temp_directory_path();
}

static fs::path write_file(const std::string& name, const std::string& content) {
  fs::path p = scratch_dir() / name;
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  out << content;
  return p;
}

static void test_apply_line() {
  RegistryConfig cfg;
  std::string msg;
  assert(apply_config_line(cfg, "set history 20", msg));
  assert(cfg.history_limit == 20);
  assert(apply_config_line(cfg, ":set results=5", msg));
  assert(cfg.result_limit == 5);
  assert(apply_config_line(cfg, "  set sentinel /  ", msg));
  assert(cfg.shortcut_sentinel == '/');
  assert(apply_config_line(cfg, "set loglevel DEBUG", msg));
  assert(cfg.log_level == "debug");
  assert(apply_config_line(cfg, "set logfile /tmp/palette.log", msg));
  assert(cfg.log_file == "/tmp/palette.log");

  assert(!apply_config_line(cfg, "set history 0", msg));
  assert(!apply_config_line(cfg, "set history -3", msg));
  assert(!apply_config_line(cfg, "set history ten", msg));
  assert(cfg.history_limit == 20);
  assert(!apply_config_line(cfg, "set sentinel ::", msg));
  assert(cfg.shortcut_sentinel == '/');
  assert(!apply_config_line(cfg, "set loglevel loud", msg));
  assert(msg == "set loglevel: unknown level loud");
  assert(!apply_config_line(cfg, "set results", msg));
  assert(msg == "set results: missing value");
  assert(!apply_config_line(cfg, "set colour blue", msg));
  assert(msg == "unknown option: colour");
  assert(!apply_config_line(cfg, "map jj <esc>", msg));
}

static void test_load_file() {
  fs::path p = write_file("cmdpal_test_rc",
                          "# palette settings\r\n"
                          "\" vim style comment\r\n"
                          "// c style comment\r\n"
                          "\r\n"
                          "set history 7\r\n"
                          "set bogus 1\r\n"
                          "set results=3\r\n"
                          "set sentinel ;");
  std::vector<std::string> lines;
  std::string msg;
  assert(mmap_readlines(p, lines, msg));
  assert(lines.size() == 8);
  assert(lines[4] == "set history 7");
  assert(lines[7] == "set sentinel ;");

  RegistryConfig cfg;
  std::vector<std::string> warnings;
  assert(load_config_file(p, cfg, warnings, msg));
  assert(cfg.history_limit == 7);
  assert(cfg.result_limit == 3);
  assert(cfg.shortcut_sentinel == ';');
  assert(warnings.size() == 1);
  assert(warnings[0] == p.string() + ":6: unknown option: bogus");
  fs::remove(p);
}

static void test_empty_and_missing() {
  fs::path p = write_file("cmdpal_test_empty", "");
  std::vector<std::string> lines{"stale"};
  std::string msg;
  assert(mmap_readlines(p, lines, msg));
  assert(lines.empty());
  fs::remove(p);

  p = write_file("cmdpal_test_newline", "a\n\nb\n");
  assert(mmap_readlines(p, lines, msg));
  assert((lines == std::vector<std::string>{"a", "", "b"}));
  fs::remove(p);

  RegistryConfig cfg;
  std::vector<std::string> warnings;
  assert(!load_config_file(scratch_dir() / "cmdpal_no_such_rc", cfg, warnings, msg));
  assert(!msg.empty());
  assert(cfg.history_limit == 50);
  assert(warnings.empty());
}

int main() {
  test_apply_line();
  test_load_file();
  test_empty_and_missing();
  return 0;
}
