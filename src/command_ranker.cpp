#include "command_ranker.hpp"
#include "str_util.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>

bool fuzzy_match(const std::string& text, const std::string& query) {
  size_t ti = 0, qi = 0;
  while (ti < text.size() && qi < query.size()) {
    if (std::tolower(static_cast<unsigned char>(text[ti])) == std::tolower(static_cast<unsigned char>(query[qi]))) qi++;
    ti++;
  }
  return qi == query.size();
}

int CommandRanker::shortcut_score(const Command& cmd, const std::string& token) const {
  for (const auto& a : cmd.aliases) {
    if (to_lower(a) == token) return kShortcutExactScore;
  }
  return 0;
}

int CommandRanker::score(const Command& cmd, const std::string& query) const {
  if (query.empty()) return 0;
  int s = 0;
  std::string name = to_lower(cmd.name);
  std::string desc = to_lower(cmd.description);
  std::string cat = to_lower(cmd.category);

  if (name == query) s += 1000;
  else if (starts_with(name, query)) s += 800;
  else if (contains(name, query)) s += 600;

  std::vector<std::string> name_words = split_ws(name);
  std::vector<std::string> query_words = split_ws(query);
  if (query_words.size() > 1 && name_words.size() > 1) {
    size_t matching = 0;
    for (const auto& qw : query_words) {
      bool hit = std::any_of(name_words.begin(), name_words.end(), [&](const std::string& nw){ return starts_with(nw, qw); });
      if (hit) matching++;
    }
    if (matching == query_words.size()) s += 750;
    else if (matching > 0) s += 400 + 100 * static_cast<int>(matching);
  }

  if (!name_words.empty() && starts_with(name_words[0], query)) s += 550;

  for (const auto& a : cmd.aliases) {
    std::string al = to_lower(a);
    if (al == query) s += 900;
    else if (starts_with(al, query)) s += 700;
    else if (contains(al, query)) s += 500;
  }

  if (contains(desc, query)) s += 200;
  if (contains(cat, query)) s += 100;

  if (s == 0 && query.size() >= 2) {
    if (fuzzy_match(name, query)) s += 300;
    else if (fuzzy_match(desc, query)) s += 100;
  }
  return s;
}

std::vector<const Command*> CommandRanker::search(const std::string& query) const {
  std::string q = to_lower(trim(query));
  if (q.empty()) {
    auto all = table_.get_all();
    if (all.size() > limit_) all.resize(limit_);
    return all;
  }

  bool shortcut = q[0] == parser_.sentinel();
  std::string token;
  if (shortcut) token = to_lower(parser_.parse(q).name);

  struct Scored { const Command* cmd; int score; };
  std::vector<Scored> scored;
  for (const auto& [name, cmd] : table_.commands()) {
    if (!cmd.available()) continue;
    int sc = shortcut ? shortcut_score(cmd, token) : score(cmd, q);
    if (sc > 0) scored.push_back({&cmd, sc});
  }
  std::stable_sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b){
    if (a.score != b.score) return a.score > b.score;
    return a.cmd->name < b.cmd->name;
  });
  if (scored.size() > limit_) scored.resize(limit_);

  std::vector<const Command*> out;
  out.reserve(scored.size());
  for (const auto& s : scored) out.push_back(s.cmd);
  cmdpal_log()->debug("search \"{}\" -> {} results", query, out.size());
  return out;
}
