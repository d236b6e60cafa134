#include "command_table.hpp"
#include "command_parser.hpp"
#include <cassert>
#include <string>
#include <vector>

static void add(CommandTable& t, const std::string& name, std::vector<std::string> aliases = {}) {
  Command c;
  c.name = name;
  c.aliases = std::move(aliases);
  c.effect = [](const std::vector<std::string>&, const ParseResult&){ return CommandResult{}; };
  t.register_command(std::move(c));
}

using Args = std::vector<std::string>;

int main() {
  CommandTable t;
  add(t, "search", {":f"});
  add(t, "search advanced", {":sa"});
  add(t, "test", {"t"});
  add(t, "toggle theme", {":tt"});
  CommandParser p(t);

  // longest name wins over its single-word prefix
  ParseResult r = p.parse("search advanced now");
  assert(r.name == "search advanced");
  assert((r.args == Args{"now"}));
  r = p.parse("search advanced");
  assert(r.name == "search advanced");
  assert(r.args.empty());
  r = p.parse("search  foo   bar ");
  assert(r.name == "search");
  assert((r.args == Args{"foo", "bar"}));

  // a candidate must end at a word boundary
  r = p.parse("searching");
  assert(r.name == "searching");
  assert(r.args.empty());
  r = p.parse("tests x");
  assert(r.name == "tests");
  assert((r.args == Args{"x"}));

  r = p.parse("  test arg1 arg2  ");
  assert(r.name == "test");
  assert((r.args == Args{"arg1", "arg2"}));
  assert(r.raw_input == "  test arg1 arg2  ");
  assert(r.clean_input == "test arg1 arg2");

  // plain aliases and case-insensitive matching keep the canonical spelling
  r = p.parse("t 1");
  assert(r.name == "t");
  assert((r.args == Args{"1"}));
  r = p.parse("Toggle Theme");
  assert(r.name == "toggle theme");

  // sentinel input: aliases compare without the sentinel, names still resolve
  r = p.parse(":tt");
  assert(r.name == ":tt");
  assert(r.clean_input == "tt");
  r = p.parse(":f needle");
  assert(r.name == ":f");
  assert((r.args == Args{"needle"}));
  r = p.parse(":test a");
  assert(r.name == "test");
  assert((r.args == Args{"a"}));

  // unresolvable input falls back to a whitespace split
  r = p.parse("unknown a b");
  assert(r.name == "unknown");
  assert((r.args == Args{"a", "b"}));
  r = p.parse(":zz q");
  assert(r.name == ":zz");
  assert((r.args == Args{"q"}));
  r = p.parse("   ");
  assert(r.name.empty());
  assert(r.args.empty());
  r = p.parse("");
  assert(r.name.empty());

  // custom sentinel
  CommandParser slash(t, '/');
  r = slash.parse("/test x");
  assert(r.name == "test");
  assert((r.args == Args{"x"}));
  return 0;
}
