#include "command_table.hpp"
#include "command_error.hpp"
#include <cassert>
#include <string>
#include <type_traits>
#include <vector>

// conditions keep a reference to the flag, so temporaries are refused
static_assert(std::is_constructible_v<FlagCondition, bool&>);
static_assert(!std::is_constructible_v<FlagCondition, bool>);

static Command make(const std::string& name, const std::string& category = "",
                    std::vector<std::string> aliases = {}) {
  Command c;
  c.name = name;
  c.category = category;
  c.aliases = std::move(aliases);
  c.effect = [](const std::vector<std::string>&, const ParseResult&){ return CommandResult{true, "ok"}; };
  return c;
}

static bool throws_invalid(CommandTable& t, Command c) {
  try { t.register_command(std::move(c)); } catch (const CommandError& e) { return e.kind() == ErrorKind::InvalidCommand; }
  return false;
}

static std::vector<std::string> names(const std::vector<const Command*>& cs) {
  std::vector<std::string> out;
  for (const auto* c : cs) out.push_back(c->name);
  return out;
}

int main() {
  CommandTable t;
  t.register_command(make("test", "document", {"t"}));
  const Command* c = t.get("test");
  assert(c != nullptr);
  assert(c->description == "Execute test");
  assert(c->icon == "*");
  assert(t.get("t") == c);
  assert(t.has("t"));
  assert(t.get("nope") == nullptr);

  // defaults
  t.register_command(make("plain"));
  assert(t.get("plain")->category == "general");

  // rejected registrations leave the table untouched
  Command no_effect = make("broken");
  no_effect.effect = nullptr;
  assert(throws_invalid(t, no_effect));
  assert(throws_invalid(t, make("")));
  assert(throws_invalid(t, make("test")));
  assert(throws_invalid(t, make("t")));
  assert(throws_invalid(t, make("other", "", {"t"})));
  assert(throws_invalid(t, make("other", "", {"test"})));
  assert(throws_invalid(t, make("other", "", {":o", ":o"})));
  assert(throws_invalid(t, make("other", "", {""})));
  // names and aliases collide regardless of case
  assert(throws_invalid(t, make("Test")));
  assert(throws_invalid(t, make("T")));
  assert(throws_invalid(t, make("other", "", {"TEST"})));
  assert(throws_invalid(t, make("other", "", {":O", ":o"})));
  assert(throws_invalid(t, make("other", "", {"Other"})));
  assert(!t.has("other"));
  assert(!t.has("broken"));
  assert(!t.has("Test"));
  assert(t.size() == 2);
  assert(t.alias_count() == 1);

  // listing is name-sorted and condition-filtered
  bool ready = false;
  Command gated = make("archive", "document", {":ar"});
  gated.condition = std::make_shared<FlagCondition>(ready);
  t.register_command(gated);
  t.register_command(make("new document", "document", {":n"}));
  assert((names(t.get_all()) == std::vector<std::string>{"new document", "plain", "test"}));
  assert((names(t.get_by_category("document")) == std::vector<std::string>{"new document", "test"}));
  ready = true;
  assert((names(t.get_all()) == std::vector<std::string>{"archive", "new document", "plain", "test"}));
  assert(t.get("archive") != nullptr);
  assert((t.categories() == std::vector<std::string>{"document", "general"}));

  // unregister symmetry
  assert(t.unregister_command("new document"));
  assert(t.get(":n") == nullptr);
  assert(t.get("new document") == nullptr);
  assert((names(t.get_by_category("document")) == std::vector<std::string>{"archive", "test"}));
  assert((names(t.get_all()) == std::vector<std::string>{"archive", "plain", "test"}));
  assert(!t.unregister_command("new document"));

  // emptied category disappears
  assert(t.unregister_command("plain"));
  assert((t.categories() == std::vector<std::string>{"document"}));
  assert(t.get_by_category("general").empty());

  // an unregistered alias can be reused, in any case
  t.register_command(make("notes", "", {":N"}));
  assert(t.get(":N")->name == "notes");
  assert(throws_invalid(t, make("more notes", "", {":n"})));
  assert(t.unregister_command("notes"));
  t.register_command(make("notes", "", {":n"}));
  assert(t.get(":n")->name == "notes");

  // register_commands stops at the first failure
  try {
    t.register_commands({make("one"), make("test"), make("two")});
    assert(false);
  } catch (const CommandError& e) {
    assert(e.kind() == ErrorKind::InvalidCommand);
  }
  assert(t.has("one"));
  assert(!t.has("two"));
  return 0;
}
