#pragma once
/*
 * CommandRanker
 *
 * Purpose: score every available command against a palette query and return
 *          the best matches.
 * Scoring (additive, lower-cased query):
 *   name exact 1000 | prefix 800 | substring 600
 *   multi-word: all query words prefix a name word 750, else 400 + 100*k
 *   first name word starts with query 550
 *   per alias: exact 900 | prefix 700 | substring 500
 *   description 200, category 100
 *   nothing matched and query >= 2 chars: subsequence on name 300, else description 100
 * Shortcut queries (leading sentinel) only match an alias exactly, scored 2000.
 */
#include <string>
#include <vector>
#include "types.hpp"
#include "command_table.hpp"
#include "command_parser.hpp"

// Case-insensitive subsequence test: every query char appears in text in order.
bool fuzzy_match(const std::string& text, const std::string& query);

class CommandRanker {
public:
  static constexpr int kShortcutExactScore = 2000;
  static constexpr size_t kDefaultLimit = 10;

  CommandRanker(const CommandTable& table, const CommandParser& parser) : table_(table), parser_(parser) {}

  std::vector<const Command*> search(const std::string& query) const;

  // Score of one command for an already trimmed, lower-cased query.
  int score(const Command& cmd, const std::string& query) const;
  int shortcut_score(const Command& cmd, const std::string& token) const;

  size_t limit() const { return limit_; }
  void set_limit(size_t n) { limit_ = n; }

private:
  const CommandTable& table_;
  const CommandParser& parser_;
  size_t limit_ = kDefaultLimit;
};
