#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "palette.hpp"
#include "core_commands.hpp"
#include "config.hpp"
#include "logger.hpp"
#include <filesystem>
#include <iostream>

static void run_palette(CommandRegistry& registry, Workspace& ws, bool& should_quit) {
  Terminal session;
  NcursesTerminal term;
  auto theme_id = registry.on_execute([&term, &ws](const ExecuteEvent& ev){
    if (ev.command && ev.command->category == "appearance") term.setDark(ws.dark);
  });
  CommandPalette palette(registry);
  while (!should_quit) {
    palette.render(term);
    int key = term.read_key();
    if (key == kKeyResize || key == kKeyNone) continue;
    if (!palette.handle_key(key)) break;
  }
  registry.remove_listener(theme_id);
}

int main(int argc, char** argv) {
  RegistryConfig cfg;
  std::filesystem::path rc = (argc >= 2) ? std::filesystem::path(argv[1]) : default_config_path();
  std::vector<std::string> warnings;
  std::string msg;
  std::error_code ec;
  if (!rc.empty() && std::filesystem::exists(rc, ec)) {
    if (!load_config_file(rc, cfg, warnings, msg)) std::cerr << msg << "\n";
  } else if (argc >= 2) {
    std::cerr << "can not open file: " << rc.string() << "\n";
    return 1;
  }
  if (!init_file_logging(cfg.log_file, msg)) std::cerr << msg << "\n";
  for (const auto& w : warnings) cmdpal_log()->warn("{}", w);

  CommandRegistry registry;
  registry.init(cfg);
  Workspace ws;
  bool should_quit = false;
  try {
    register_core_commands(registry, ws, should_quit);
  } catch (const CommandError& e) {
    std::cerr << "command setup failed: " << e.what() << "\n";
    return 1;
  }

  try {
    run_palette(registry, ws, should_quit);
  } catch (const std::runtime_error& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  return 0;
}
