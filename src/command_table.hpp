#pragma once
/*
 * CommandTable
 *
 * Purpose: own the registered commands plus the alias map and category index.
 * Design: name -> Command (ordered), alias -> name, category -> names in
 *         registration order. Names and aliases share one case-insensitive
 *         namespace (the parser matches without case); a registration that
 *         would collide is rejected before any mutation.
 */
#include <map>
#include <string>
#include <unordered_map>
#include <vector>
#include "types.hpp"

class CommandTable {
public:
  // Throws CommandError(InvalidCommand); applies description/category/icon defaults.
  void register_command(Command cmd);
  void register_commands(std::vector<Command> cmds);
  bool unregister_command(const std::string& name);

  const Command* get(const std::string& name_or_alias) const;
  bool has(const std::string& name_or_alias) const { return get(name_or_alias) != nullptr; }

  std::vector<const Command*> get_all() const;
  std::vector<const Command*> get_by_category(const std::string& category) const;
  std::vector<std::string> categories() const;
  std::vector<std::string> names_and_aliases() const;

  size_t size() const { return commands_.size(); }
  size_t alias_count() const { return aliases_.size(); }
  size_t category_count() const { return categories_.size(); }

  // Every command regardless of condition, in name order.
  const std::map<std::string, Command>& commands() const { return commands_; }

private:
  void check_collisions(const Command& cmd) const;

  std::map<std::string, Command> commands_;
  std::unordered_map<std::string, std::string> aliases_;
  // lower-cased name or alias -> owning command name
  std::unordered_map<std::string, std::string> folded_;
  std::map<std::string, std::vector<std::string>> categories_;
};
