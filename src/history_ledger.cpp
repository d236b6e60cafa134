#include "history_ledger.hpp"
#include <algorithm>

void HistoryLedger::record(const std::string& input) {
  auto it = std::find(entries_.begin(), entries_.end(), input);
  if (it != entries_.end()) entries_.erase(it);
  entries_.push_front(input);
  truncate();
}

std::vector<std::string> HistoryLedger::all() const {
  return std::vector<std::string>(entries_.begin(), entries_.end());
}

void HistoryLedger::clear() { entries_.clear(); }

void HistoryLedger::set_limit(size_t limit) {
  limit_ = limit;
  truncate();
}

void HistoryLedger::truncate() {
  while (entries_.size() > limit_) entries_.pop_back();
}
