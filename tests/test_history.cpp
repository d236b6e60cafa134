#include "history_ledger.hpp"
#include <cassert>
#include <string>
#include <vector>

using Lines = std::vector<std::string>;

int main() {
  HistoryLedger h;
  assert(h.limit() == 50);
  h.record("a");
  h.record("b");
  h.record("a");
  assert((h.all() == Lines{"a", "b"}));

  h.record("c");
  assert((h.all() == Lines{"c", "a", "b"}));
  Lines snapshot = h.all();
  h.record("d");
  assert(snapshot.size() == 3);

  h.clear();
  assert(h.size() == 0);
  assert(h.all().empty());

  for (int i = 0; i < 60; ++i) h.record("cmd " + std::to_string(i));
  assert(h.size() == 50);
  Lines all = h.all();
  assert(all.front() == "cmd 59");
  assert(all.back() == "cmd 10");

  // promoting an old entry does not evict anything
  h.record("cmd 10");
  assert(h.size() == 50);
  assert(h.all().front() == "cmd 10");
  assert(h.all().back() == "cmd 11");

  h.set_limit(3);
  assert((h.all() == Lines{"cmd 10", "cmd 59", "cmd 58"}));

  HistoryLedger small(2);
  small.record("x");
  small.record("y");
  small.record("z");
  assert((small.all() == Lines{"z", "y"}));
  return 0;
}
