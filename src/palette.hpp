#pragma once
/*
 * CommandPalette
 *
 * Purpose: interactive front end over CommandRegistry: query line, ranked
 *          results, selection and execution.
 * Keys: printable chars edit the query, Up/Down move the selection, Tab
 *       completes the selected name, Enter executes, Esc clears or exits.
 * Constraint: draws only through ITerminal; key codes are backend neutral.
 */
#include <string>
#include <vector>
#include "cmd_registry.hpp"
#include "iterminal.hpp"

class CommandPalette {
public:
  explicit CommandPalette(CommandRegistry& registry);

  // Returns false once the palette wants to close.
  bool handle_key(int ch);
  void render(ITerminal& term) const;

  // Text that Enter would execute right now.
  std::string resolve_input() const;

  const std::string& query() const { return query_; }
  void set_query(const std::string& q);
  const std::vector<const Command*>& results() const { return results_; }
  int selected() const { return selected_; }
  const std::string& message() const { return message_; }
  bool message_is_error() const { return message_is_error_; }

private:
  void update();
  void run(const std::string& input);

  CommandRegistry& registry_;
  std::string query_;
  std::vector<const Command*> results_;
  int selected_ = 0;
  std::string message_;
  bool message_is_error_ = false;
};
