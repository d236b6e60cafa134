#pragma once
/*
 * CommandParser
 *
 * Purpose: split free text into {name, args} against the known names/aliases.
 * Design: longest candidate first so "search advanced" wins over "search";
 *         unresolvable input falls back to a plain whitespace split, so parse
 *         never fails and unknown names surface at dispatch time.
 */
#include <string>
#include "types.hpp"
#include "command_table.hpp"

class CommandParser {
public:
  explicit CommandParser(const CommandTable& table, char sentinel = ':') : table_(table), sentinel_(sentinel) {}

  ParseResult parse(const std::string& input) const;

  char sentinel() const { return sentinel_; }
  void set_sentinel(char s) { sentinel_ = s; }

private:
  const CommandTable& table_;
  char sentinel_;
};
