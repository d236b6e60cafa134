#pragma once
/*
 * HistoryLedger
 *
 * Purpose: most-recently-used list of executed raw inputs.
 * Rule: re-recording an input moves it to the front; the oldest entries are
 *       dropped once the limit is exceeded.
 */
#include <deque>
#include <string>
#include <vector>

class HistoryLedger {
public:
  static constexpr size_t kDefaultLimit = 50;

  explicit HistoryLedger(size_t limit = kDefaultLimit) : limit_(limit) {}

  void record(const std::string& input);
  std::vector<std::string> all() const;
  void clear();
  size_t size() const { return entries_.size(); }
  size_t limit() const { return limit_; }
  void set_limit(size_t limit);

private:
  void truncate();

  std::deque<std::string> entries_;
  size_t limit_;
};
