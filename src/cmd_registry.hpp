#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register, search and dispatch palette commands.
 * Design: owns the table, parser, ranker and history; execute() parses the
 *         raw input, resolves it by name or alias, validates declared
 *         parameters, records history and invokes the effect.
 * Errors: CommandError for the registry's own failures; exceptions thrown by
 *         an effect pass through untouched. Every failure is reported to the
 *         error listeners before it is rethrown.
 * Threading: single caller; no locking.
 */
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "types.hpp"
#include "config.hpp"
#include "command_error.hpp"
#include "command_table.hpp"
#include "command_parser.hpp"
#include "command_ranker.hpp"
#include "history_ledger.hpp"

struct ExecuteEvent {
  const Command* command = nullptr;
  std::vector<std::string> args;
  CommandResult result;
};

struct ErrorEvent {
  std::string input;
  std::string error;
  std::optional<ErrorKind> kind; // empty when the effect itself failed
};

struct RegistryStats {
  size_t total_commands = 0;
  size_t total_aliases = 0;
  size_t total_categories = 0;
  size_t history_length = 0;
  size_t available_commands = 0;
};

class CommandRegistry {
public:
  using ExecuteListener = std::function<void(const ExecuteEvent&)>;
  using ErrorListener = std::function<void(const ErrorEvent&)>;
  using ListenerId = size_t;

  CommandRegistry();
  CommandRegistry(const CommandRegistry&) = delete;
  CommandRegistry& operator=(const CommandRegistry&) = delete;

  void init(const RegistryConfig& cfg);

  void register_command(Command cmd) { table_.register_command(std::move(cmd)); }
  void register_commands(std::vector<Command> cmds) { table_.register_commands(std::move(cmds)); }
  bool unregister_command(const std::string& name) { return table_.unregister_command(name); }

  const Command* get(const std::string& name_or_alias) const { return table_.get(name_or_alias); }
  bool has(const std::string& name_or_alias) const { return table_.has(name_or_alias); }
  std::vector<const Command*> get_all() const { return table_.get_all(); }
  std::vector<const Command*> get_by_category(const std::string& category) const { return table_.get_by_category(category); }
  std::vector<std::string> categories() const { return table_.categories(); }
  size_t size() const { return table_.size(); }

  ParseResult parse(const std::string& input) const { return parser_.parse(input); }
  std::vector<const Command*> search(const std::string& query) const { return ranker_.search(query); }
  const CommandRanker& ranker() const { return ranker_; }

  CommandResult execute(const std::string& input);
  // Deferred: the work runs on the thread that calls get().
  std::future<CommandResult> execute_async(const std::string& input);

  // Throws CommandError(MissingParameters / InvalidParameterType).
  static void validate_parameters(const Command& cmd, const std::vector<std::string>& args);
  static bool validate_parameter_type(const std::string& value, ParamType type);

  std::vector<std::string> history() const { return history_.all(); }
  void clear_history() { history_.clear(); }

  ListenerId on_execute(ExecuteListener l);
  ListenerId on_error(ErrorListener l);
  bool remove_listener(ListenerId id);

  RegistryStats stats() const;

private:
  void emit_error(const std::string& input, const std::string& error, std::optional<ErrorKind> kind);

  CommandTable table_;
  CommandParser parser_;
  CommandRanker ranker_;
  HistoryLedger history_;
  std::vector<std::pair<ListenerId, ExecuteListener>> execute_listeners_;
  std::vector<std::pair<ListenerId, ErrorListener>> error_listeners_;
  ListenerId next_listener_id_ = 1;
};
