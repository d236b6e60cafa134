#include "palette.hpp"
#include "core_commands.hpp"
#include "headless_terminal.hpp"
#include "workspace.hpp"
#include <cassert>
#include <string>
#include <vector>

static void type(CommandPalette& p, const std::string& s) {
  for (char c : s) {
    bool open = p.handle_key((unsigned char)c);
    assert(open);
  }
}

static bool lists(const CommandPalette& p, const std::string& name) {
  for (const auto* c : p.results()) if (c->name == name) return true;
  return false;
}

int main() {
  CommandRegistry reg;
  Workspace ws;
  bool quit = false;
  register_core_commands(reg, ws, quit);
  CommandPalette pal(reg);
  HeadlessTerminal term(12, 80);
  assert(term.getSize().rows == 12 && term.getSize().cols == 80);

  // empty query lists available commands by name
  assert(pal.results().size() == 10);
  assert(pal.results()[0]->name == "clear history");
  assert(!lists(pal, "save"));
  pal.render(term);
  assert(term.line(0) == ">");
  assert(term.line(1) == "^ clear history  (:ch)  - Forget recent commands");
  assert(term.highlights().size() == 1);
  assert(term.highlights()[0].row == 1);
  assert(term.colored(kPairAccent).size() == 1);
  assert(term.refresh_count() == 1);

  // typing narrows the results; args run as typed
  type(pal, "new");
  assert(pal.results().front()->name == "new");
  type(pal, " Notes");
  pal.render(term);
  assert(term.line(0) == "> new Notes");
  assert(term.cursor().rows == 0 && term.cursor().cols == 11);
  assert(pal.resolve_input() == "new Notes");
  assert(pal.handle_key(kKeyEnter));
  assert(pal.message() == "created Notes");
  assert(!pal.message_is_error());
  assert(pal.query().empty());
  assert(ws.active() && ws.active()->title == "Notes");
  pal.render(term);
  assert(term.line(11) == "created Notes");

  // document commands appear once a document is open
  type(pal, "save");
  assert(pal.results().front()->name == "save");
  assert(pal.handle_key(kKeyEsc));
  assert(pal.query().empty());

  // shortcut query with arguments
  type(pal, ":hd 2 Intro");
  assert(pal.results().size() == 1);
  assert(pal.results()[0]->name == "heading");
  assert(pal.handle_key(kKeyEnter));
  assert(pal.message() == "heading added");
  assert(ws.active()->lines.back() == "## Intro");

  // a partial query runs the selected command
  type(pal, "outl");
  assert(pal.resolve_input() == "outline");
  pal.handle_key(kKeyEnter);
  assert(pal.message() == "# Notes (1) | ## Intro (3)");

  // out-of-range levels are rejected by the command, not by the parser
  type(pal, "heading 1e999 Big");
  pal.handle_key(kKeyEnter);
  assert(pal.message_is_error());
  assert(pal.message() == "heading: level must be 1-6");
  CommandResult tiny = reg.execute("heading 1e-400 Small");
  assert(!tiny.success && tiny.message == "heading: level must be 1-6");
  assert(ws.active()->lines.back() == "## Intro");

  // help shows the signature and what each parameter means
  CommandResult h = reg.execute("help :hd");
  assert(h.message == "heading: Append a heading to the current document <level:number> <text:string>"
                      "  params: level: Heading level (1-6); text: Heading text  aliases: :hd");

  // validation errors are shown, not thrown
  type(pal, "heading x y");
  pal.handle_key(kKeyEnter);
  assert(pal.message_is_error());
  assert(pal.message() == "Parameter \"level\" must be of type number");
  pal.render(term);
  assert(term.colored(kPairError).size() == 1);
  assert(term.colored(kPairError)[0].row == 11);

  type(pal, "zzz");
  assert(pal.results().empty());
  pal.render(term);
  assert(term.line(1) == "no matching commands");
  pal.handle_key(kKeyEnter);
  assert(pal.message() == "Command \"zzz\" not found");

  // selection wraps; tab completes the selected name
  type(pal, "toggle th");
  assert(pal.results().front()->name == "toggle theme");
  size_t n = pal.results().size();
  assert(n >= 2);
  pal.handle_key(kKeyDown);
  assert(pal.selected() == 1);
  pal.handle_key(kKeyUp);
  pal.handle_key(kKeyUp);
  assert(pal.selected() == (int)n - 1);
  pal.handle_key(kKeyDown);
  assert(pal.selected() == 0);
  pal.handle_key(kKeyTab);
  assert(pal.query() == "toggle theme ");
  pal.handle_key(kKeyEnter);
  assert(ws.dark);
  assert(pal.message() == "theme=dark");

  // backspace edits, esc clears then closes
  type(pal, "ab");
  pal.handle_key(kKeyBackspace);
  assert(pal.query() == "a");
  assert(pal.handle_key(kKeyEsc));
  assert(pal.query().empty());
  assert(!pal.handle_key(kKeyEsc));

  // scripted keys through the terminal backend
  term.push_keys("help");
  term.push_key(kKeyEnter);
  for (int k = term.read_key(); k != kKeyNone; k = term.read_key()) {
    bool open = pal.handle_key(k);
    assert(open);
  }
  assert(pal.message() == "categories: appearance, document, editing, general, info, navigation");

  type(pal, ":q");
  pal.handle_key(kKeyEnter);
  assert(quit);
  assert(pal.message() == "bye");

  std::vector<std::string> hist = reg.history();
  assert(hist.front() == ":q");
  assert(hist.size() == 9);
  return 0;
}
