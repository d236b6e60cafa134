#include "command_table.hpp"
#include "command_error.hpp"
#include "logger.hpp"
#include "str_util.hpp"
#include <algorithm>
#include <unordered_set>

void CommandTable::check_collisions(const Command& cmd) const {
  if (cmd.name.empty()) throw CommandError(ErrorKind::InvalidCommand, "Command must have name and handler");
  if (!cmd.effect) throw CommandError(ErrorKind::InvalidCommand, "Command must have name and handler");
  auto taken = [this](const std::string& key) -> const std::string* {
    auto it = folded_.find(to_lower(key));
    return it != folded_.end() ? &it->second : nullptr;
  };
  if (const std::string* owner = taken(cmd.name)) {
    throw CommandError(ErrorKind::InvalidCommand,
                       "Command name \"" + cmd.name + "\" clashes with \"" + *owner + "\"");
  }
  std::unordered_set<std::string> seen{to_lower(cmd.name)};
  for (const auto& a : cmd.aliases) {
    if (a.empty()) throw CommandError(ErrorKind::InvalidCommand, "Command \"" + cmd.name + "\" has an empty alias");
    if (!seen.insert(to_lower(a)).second) {
      throw CommandError(ErrorKind::InvalidCommand, "Command \"" + cmd.name + "\" repeats alias \"" + a + "\"");
    }
    if (const std::string* owner = taken(a)) {
      throw CommandError(ErrorKind::InvalidCommand, "Alias \"" + a + "\" clashes with \"" + *owner + "\"");
    }
  }
}

void CommandTable::register_command(Command cmd) {
  check_collisions(cmd);
  if (cmd.description.empty()) cmd.description = "Execute " + cmd.name;
  if (cmd.category.empty()) cmd.category = "general";
  if (cmd.icon.empty()) cmd.icon = "*";

  folded_[to_lower(cmd.name)] = cmd.name;
  for (const auto& a : cmd.aliases) {
    aliases_[a] = cmd.name;
    folded_[to_lower(a)] = cmd.name;
  }
  categories_[cmd.category].push_back(cmd.name);
  cmdpal_log()->info("registered \"{}\" ({} aliases, category {})", cmd.name, cmd.aliases.size(), cmd.category);
  std::string key = cmd.name;
  commands_.emplace(std::move(key), std::move(cmd));
}

void CommandTable::register_commands(std::vector<Command> cmds) {
  for (auto& c : cmds) register_command(std::move(c));
}

bool CommandTable::unregister_command(const std::string& name) {
  auto it = commands_.find(name);
  if (it == commands_.end()) return false;
  const Command& cmd = it->second;
  folded_.erase(to_lower(name));
  for (const auto& a : cmd.aliases) {
    aliases_.erase(a);
    folded_.erase(to_lower(a));
  }
  auto cit = categories_.find(cmd.category);
  if (cit != categories_.end()) {
    auto& names = cit->second;
    names.erase(std::remove(names.begin(), names.end(), name), names.end());
    if (names.empty()) categories_.erase(cit);
  }
  commands_.erase(it);
  cmdpal_log()->debug("unregistered \"{}\"", name);
  return true;
}

const Command* CommandTable::get(const std::string& name_or_alias) const {
  auto ait = aliases_.find(name_or_alias);
  const std::string& actual = (ait != aliases_.end()) ? ait->second : name_or_alias;
  auto it = commands_.find(actual);
  return it != commands_.end() ? &it->second : nullptr;
}

std::vector<const Command*> CommandTable::get_all() const {
  std::vector<const Command*> out;
  out.reserve(commands_.size());
  // std::map iterates in name order already
  for (const auto& [name, cmd] : commands_) {
    if (cmd.available()) out.push_back(&cmd);
  }
  return out;
}

std::vector<const Command*> CommandTable::get_by_category(const std::string& category) const {
  std::vector<const Command*> out;
  auto cit = categories_.find(category);
  if (cit == categories_.end()) return out;
  for (const auto& name : cit->second) {
    auto it = commands_.find(name);
    if (it != commands_.end() && it->second.available()) out.push_back(&it->second);
  }
  std::sort(out.begin(), out.end(), [](const Command* a, const Command* b){ return a->name < b->name; });
  return out;
}

std::vector<std::string> CommandTable::categories() const {
  std::vector<std::string> out;
  out.reserve(categories_.size());
  for (const auto& kv : categories_) out.push_back(kv.first);
  return out;
}

std::vector<std::string> CommandTable::names_and_aliases() const {
  std::vector<std::string> out;
  out.reserve(commands_.size() + aliases_.size());
  for (const auto& kv : commands_) out.push_back(kv.first);
  for (const auto& kv : aliases_) out.push_back(kv.first);
  return out;
}
