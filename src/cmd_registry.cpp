#include "cmd_registry.hpp"
#include "logger.hpp"
#include "str_util.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>

CommandRegistry::CommandRegistry()
  : parser_(table_), ranker_(table_, parser_) {}

void CommandRegistry::init(const RegistryConfig& cfg) {
  parser_.set_sentinel(cfg.shortcut_sentinel);
  ranker_.set_limit(cfg.result_limit);
  history_.set_limit(cfg.history_limit);
  if (!set_log_level(cfg.log_level)) cmdpal_log()->warn("unknown log level \"{}\"", cfg.log_level);
  cmdpal_log()->info("registry ready: history={} results={} sentinel='{}'",
                     cfg.history_limit, cfg.result_limit, cfg.shortcut_sentinel);
}

bool CommandRegistry::validate_parameter_type(const std::string& value, ParamType type) {
  switch (type) {
    case ParamType::Number: {
      double d = 0;
      return parse_number(value, d) && !std::isnan(d);
    }
    case ParamType::Boolean: {
      static const char* accepted[] = {"true", "false", "1", "0", "yes", "no"};
      std::string v = to_lower(value);
      return std::any_of(std::begin(accepted), std::end(accepted), [&](const char* a){ return v == a; });
    }
    case ParamType::String:
      return true;
  }
  return true;
}

void CommandRegistry::validate_parameters(const Command& cmd, const std::vector<std::string>& args) {
  std::vector<const ParamSpec*> required;
  for (const auto& p : cmd.parameters) if (p.required) required.push_back(&p);

  if (args.size() < required.size()) {
    std::string missing;
    for (size_t i = args.size(); i < required.size(); ++i) {
      if (!missing.empty()) missing += ", ";
      missing += required[i]->name;
    }
    throw CommandError(ErrorKind::MissingParameters, "Missing required parameters: " + missing);
  }

  for (size_t i = 0; i < cmd.parameters.size() && i < args.size(); ++i) {
    const ParamSpec& p = cmd.parameters[i];
    if (!validate_parameter_type(args[i], p.type)) {
      throw CommandError(ErrorKind::InvalidParameterType,
                         "Parameter \"" + p.name + "\" must be of type " + param_type_name(p.type));
    }
  }
}

CommandResult CommandRegistry::execute(const std::string& input) {
  const Command* cmd = nullptr;
  ParseResult parsed;
  try {
    parsed = parser_.parse(input);
    cmd = table_.get(parsed.name);
    if (!cmd) {
      throw CommandError(ErrorKind::CommandNotFound, "Command \"" + parsed.name + "\" not found");
    }
    if (!cmd->available()) {
      throw CommandError(ErrorKind::CommandUnavailable,
                         "Command \"" + parsed.name + "\" is not available in current context");
    }
    if (!cmd->parameters.empty()) validate_parameters(*cmd, parsed.args);
  } catch (const CommandError& e) {
    cmdpal_log()->warn("execute \"{}\" rejected: {} ({})", input, e.what(), error_kind_name(e.kind()));
    emit_error(input, e.what(), e.kind());
    throw;
  }

  history_.record(input);

  // the effect may unregister its own command; keep what we need by value
  std::string name = cmd->name;
  Command::Effect effect = cmd->effect;
  CommandResult result;
  try {
    result = effect(parsed.args, parsed);
  } catch (const std::exception& e) {
    cmdpal_log()->error("command \"{}\" failed: {}", name, e.what());
    emit_error(input, e.what(), std::nullopt);
    throw;
  } catch (...) {
    cmdpal_log()->error("command \"{}\" failed with a non-standard exception", name);
    emit_error(input, "unknown error", std::nullopt);
    throw;
  }

  cmdpal_log()->info("executed \"{}\" ({} args): {}", name, parsed.args.size(), result.message);
  ExecuteEvent ev{table_.get(name), parsed.args, result};
  // copy: a listener may unsubscribe while being notified
  auto listeners = execute_listeners_;
  for (const auto& [id, l] : listeners) l(ev);
  return result;
}

std::future<CommandResult> CommandRegistry::execute_async(const std::string& input) {
  return std::async(std::launch::deferred, [this, input]{ return execute(input); });
}

void CommandRegistry::emit_error(const std::string& input, const std::string& error, std::optional<ErrorKind> kind) {
  ErrorEvent ev{input, error, kind};
  auto listeners = error_listeners_;
  for (const auto& [id, l] : listeners) l(ev);
}

CommandRegistry::ListenerId CommandRegistry::on_execute(ExecuteListener l) {
  ListenerId id = next_listener_id_++;
  execute_listeners_.emplace_back(id, std::move(l));
  return id;
}

CommandRegistry::ListenerId CommandRegistry::on_error(ErrorListener l) {
  ListenerId id = next_listener_id_++;
  error_listeners_.emplace_back(id, std::move(l));
  return id;
}

bool CommandRegistry::remove_listener(ListenerId id) {
  auto match = [id](const auto& p){ return p.first == id; };
  auto eit = std::find_if(execute_listeners_.begin(), execute_listeners_.end(), match);
  if (eit != execute_listeners_.end()) { execute_listeners_.erase(eit); return true; }
  auto rit = std::find_if(error_listeners_.begin(), error_listeners_.end(), match);
  if (rit != error_listeners_.end()) { error_listeners_.erase(rit); return true; }
  return false;
}

RegistryStats CommandRegistry::stats() const {
  RegistryStats s;
  s.total_commands = table_.size();
  s.total_aliases = table_.alias_count();
  s.total_categories = table_.category_count();
  s.history_length = history_.size();
  s.available_commands = table_.get_all().size();
  return s;
}
