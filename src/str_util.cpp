#include "str_util.hpp"
#include <cctype>
#include <charconv>
#include <cmath>
#include <system_error>

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

std::string trim(const std::string& s) {
  size_t i = 0; while (i < s.size() && is_space(s[i])) i++;
  size_t j = s.size(); while (j > i && is_space(s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

std::string to_lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::vector<std::string> split_ws(const std::string& s) {
  std::vector<std::string> out;
  size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && is_space(s[i])) i++;
    size_t st = i;
    while (i < s.size() && !is_space(s[i])) i++;
    if (i > st) out.emplace_back(s.substr(st, i - st));
  }
  return out;
}

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool istarts_with(const std::string& s, const std::string& prefix) {
  if (s.size() < prefix.size()) return false;
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(prefix[i]))) return false;
  }
  return true;
}

bool contains(const std::string& s, const std::string& needle) {
  return s.find(needle) != std::string::npos;
}

bool parse_number(const std::string& s, double& out) {
  const char* first = s.data();
  const char* last = s.data() + s.size();
  if (first != last && *first == '+' && last - first > 1 && first[1] != '-') first++;
  if (first == last) return false;
  double v = 0;
  auto [ptr, ec] = std::from_chars(first, last, v);
  if (ptr != last) return false;
  if (ec == std::errc::result_out_of_range) {
    bool negative = *first == '-';
    size_t e = s.find_last_of("eE");
    bool tiny = e != std::string::npos && e + 1 < s.size() && s[e + 1] == '-';
    v = tiny ? 0.0 : HUGE_VAL;
    if (negative) v = -v;
  } else if (ec != std::errc()) {
    return false;
  }
  out = v;
  return true;
}
