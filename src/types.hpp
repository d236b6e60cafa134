#pragma once
/*
 * Types
 *
 * Purpose: shared command records (Command/ParamSpec/ParseResult/CommandResult).
 * Principle: carry plain data; registry logic lives in the table/parser/ranker.
 */
#include <functional>
#include <memory>
#include <string>
#include <vector>

enum class ParamType { String, Number, Boolean };

const char* param_type_name(ParamType t);

struct ParamSpec {
  std::string name;
  bool required = false;
  ParamType type = ParamType::String;
  std::string description;
};

struct ParseResult {
  std::string name;
  std::vector<std::string> args;
  std::string raw_input;
  std::string clean_input;
};

struct CommandResult {
  bool success = true;
  std::string message;
};

// Availability check evaluated at query and execute time.
class ICondition {
public:
  virtual ~ICondition() = default;
  virtual bool is_available() const = 0;
};

// Condition backed by a flag owned elsewhere (e.g. "document open").
class FlagCondition : public ICondition {
public:
  explicit FlagCondition(const bool& flag) : flag_(flag) {}
  FlagCondition(bool&&) = delete;
  bool is_available() const override { return flag_; }
private:
  const bool& flag_;
};

struct Command {
  using Effect = std::function<CommandResult(const std::vector<std::string>&, const ParseResult&)>;

  std::string name;
  std::string description;
  std::string category;
  std::string icon;
  std::string shortcut;
  std::vector<std::string> aliases;
  std::vector<ParamSpec> parameters;
  std::shared_ptr<const ICondition> condition;
  Effect effect;

  bool available() const { return !condition || condition->is_available(); }
};
