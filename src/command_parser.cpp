#include "command_parser.hpp"
#include "str_util.hpp"
#include "logger.hpp"
#include <algorithm>

ParseResult CommandParser::parse(const std::string& input) const {
  ParseResult res;
  res.raw_input = input;
  std::string trimmed = trim(input);
  bool shortcut = !trimmed.empty() && trimmed[0] == sentinel_;
  std::string text = shortcut ? trimmed.substr(1) : trimmed;
  res.clean_input = text;

  std::vector<std::string> cands = table_.names_and_aliases();
  std::sort(cands.begin(), cands.end(), [](const std::string& a, const std::string& b){
    if (a.size() != b.size()) return a.size() > b.size();
    return a < b;
  });

  for (const auto& cand : cands) {
    std::string check = (shortcut && !cand.empty() && cand[0] == sentinel_) ? cand.substr(1) : cand;
    if (check.empty() || !istarts_with(text, check)) continue;
    std::string rest = text.substr(check.size());
    if (!rest.empty() && !is_space(rest[0])) continue;
    res.name = cand;
    res.args = split_ws(rest);
    cmdpal_log()->debug("parse \"{}\" -> \"{}\" ({} args)", input, res.name, res.args.size());
    return res;
  }

  std::vector<std::string> parts = split_ws(text);
  if (!parts.empty()) {
    res.name = shortcut ? std::string(1, sentinel_) + parts[0] : parts[0];
    res.args.assign(parts.begin() + 1, parts.end());
  } else if (shortcut) {
    res.name = std::string(1, sentinel_);
  }
  cmdpal_log()->debug("parse \"{}\" -> unresolved \"{}\"", input, res.name);
  return res;
}
