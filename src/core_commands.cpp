#include "core_commands.hpp"
#include "str_util.hpp"
#include <memory>
#include <sstream>
#include <string>

static std::string join_args(const std::vector<std::string>& args, size_t from = 0) {
  std::string out;
  for (size_t i = from; i < args.size(); ++i) {
    if (!out.empty()) out += ' ';
    out += args[i];
  }
  return out;
}

static bool parse_bool(const std::string& v) {
  std::string s = to_lower(v);
  return s == "true" || s == "1" || s == "yes";
}

static CommandResult ok(std::string msg) { return {true, std::move(msg)}; }
static CommandResult fail(std::string msg) { return {false, std::move(msg)}; }

void register_core_commands(CommandRegistry& registry, Workspace& ws, bool& should_quit) {
  auto doc_open = std::make_shared<FlagCondition>(ws.has_active_flag());
  std::vector<Command> cmds;

  // document
  cmds.push_back({"new", "Create a new document", "document", "+", "Ctrl+N", {":n"},
    {{"title", false, ParamType::String, "Document title"}}, nullptr,
    [&ws](const std::vector<std::string>& args, const ParseResult&){
      MdDocument& d = ws.create(join_args(args));
      return ok("created " + d.title);
    }});
  cmds.push_back({"open", "Open a document", "document", ">", "Ctrl+O", {":o"},
    {{"filter", false, ParamType::String, "Title filter"}}, nullptr,
    [&ws](const std::vector<std::string>& args, const ParseResult&){
      std::string msg;
      bool ok_ = ws.open(join_args(args), msg);
      return CommandResult{ok_, msg};
    }});
  cmds.push_back({"save", "Save the current document", "document", "S", "Ctrl+S", {":s", ":w"}, {}, doc_open,
    [&ws](const std::vector<std::string>&, const ParseResult&){
      std::string msg;
      bool ok_ = ws.save(msg);
      return CommandResult{ok_, msg};
    }});
  cmds.push_back({"close", "Close the current document", "document", "x", "", {":c"}, {}, doc_open,
    [&ws](const std::vector<std::string>&, const ParseResult&){
      std::string msg;
      bool ok_ = ws.close(msg);
      return CommandResult{ok_, msg};
    }});
  cmds.push_back({"append", "Append a line of markdown to the current document", "editing", "", "", {":a"},
    {{"text", true, ParamType::String, "Line to append"}}, doc_open,
    [&ws](const std::vector<std::string>& args, const ParseResult&){
      MdDocument* d = ws.active();
      d->lines.push_back(join_args(args));
      d->modified = true;
      return ok("appended to " + d->title);
    }});
  cmds.push_back({"heading", "Append a heading to the current document", "editing", "#", "", {":hd"},
    {{"level", true, ParamType::Number, "Heading level (1-6)"},
     {"text", true, ParamType::String, "Heading text"}}, doc_open,
    [&ws](const std::vector<std::string>& args, const ParseResult&){
      double lv = 0;
      if (!parse_number(args[0], lv) || !(lv >= 1 && lv <= 6)) return fail("heading: level must be 1-6");
      int level = static_cast<int>(lv);
      MdDocument* d = ws.active();
      d->lines.push_back(std::string(level, '#') + " " + join_args(args, 1));
      d->modified = true;
      return ok("heading added");
    }});
  cmds.push_back({"tag", "Add, remove or list document tags", "document", "@", "", {":tag"},
    {{"action", true, ParamType::String, "add, remove or list"},
     {"tag", false, ParamType::String, "Tag name"}}, doc_open,
    [&ws](const std::vector<std::string>& args, const ParseResult&){
      MdDocument* d = ws.active();
      const std::string& action = args[0];
      if (action == "list") return ok(d->tags.empty() ? "no tags" : "tags: " + join_args(d->tags));
      if (args.size() < 2) return fail("tag " + action + ": tag name required");
      const std::string& t = args[1];
      if (action == "add") {
        for (const auto& x : d->tags) if (x == t) return ok("already tagged " + t);
        d->tags.push_back(t);
        return ok("tagged " + t);
      }
      if (action == "remove") {
        for (auto it = d->tags.begin(); it != d->tags.end(); ++it) {
          if (*it == t) { d->tags.erase(it); return ok("untagged " + t); }
        }
        return fail("no tag " + t);
      }
      return fail("tag: use add|remove|list");
    }});

  // navigation
  cmds.push_back({"documents", "List open documents", "navigation", "=", "", {":d"},
    {{"filter", false, ParamType::String, "Filter documents"}}, nullptr,
    [&ws](const std::vector<std::string>& args, const ParseResult&){
      std::string f = to_lower(join_args(args));
      std::string out;
      for (const auto& d : ws.documents()) {
        if (!f.empty() && !contains(to_lower(d.title), f)) continue;
        if (!out.empty()) out += ", ";
        out += d.title + (d.modified ? "*" : "");
      }
      return ok(out.empty() ? "no documents" : out);
    }});
  cmds.push_back({"outline", "Show the heading outline", "navigation", "~", "", {":l"}, {}, doc_open,
    [&ws](const std::vector<std::string>&, const ParseResult&){
      std::ostringstream oss;
      for (const auto& h : Workspace::outline(*ws.active())) {
        if (oss.tellp() > 0) oss << " | ";
        oss << std::string(h.level, '#') << ' ' << h.text << " (" << h.line << ")";
      }
      std::string s = oss.str();
      return ok(s.empty() ? "no headings" : s);
    }});
  cmds.push_back({"toggle sidebar", "Show or hide the sidebar", "navigation", "|", "Ctrl+B", {":ts"},
    {{"visible", false, ParamType::Boolean, "true or false"}}, nullptr,
    [&ws](const std::vector<std::string>& args, const ParseResult&){
      ws.sidebar_visible = args.empty() ? !ws.sidebar_visible : parse_bool(args[0]);
      return ok(ws.sidebar_visible ? "sidebar on" : "sidebar off");
    }});

  // appearance
  cmds.push_back({"theme", "Set the color theme", "appearance", "%", "", {":t"},
    {{"theme", true, ParamType::String, "light, dark or a custom theme name"}}, nullptr,
    [&ws](const std::vector<std::string>& args, const ParseResult&){
      ws.theme = to_lower(args[0]);
      ws.dark = ws.theme == "dark";
      return ok("theme=" + ws.theme);
    }});
  cmds.push_back({"toggle theme", "Switch between light and dark theme", "appearance", "%", "Ctrl+T", {":tt"}, {}, nullptr,
    [&ws](const std::vector<std::string>&, const ParseResult&){
      ws.dark = !ws.dark;
      ws.theme = ws.dark ? "dark" : "light";
      return ok("theme=" + ws.theme);
    }});

  // info
  cmds.push_back({"word count", "Count words in the current document", "info", "W", "", {":wc"}, {}, doc_open,
    [&ws](const std::vector<std::string>&, const ParseResult&){
      return ok(std::to_string(Workspace::word_count(*ws.active())) + " words");
    }});
  cmds.push_back({"help", "Describe a command or list categories", "info", "?", "F1", {":h"},
    {{"command", false, ParamType::String, "Command name or alias"}}, nullptr,
    [&registry](const std::vector<std::string>& args, const ParseResult&){
      if (args.empty()) {
        std::string cats;
        for (const auto& c : registry.categories()) { if (!cats.empty()) cats += ", "; cats += c; }
        return ok("categories: " + cats);
      }
      const Command* c = registry.get(join_args(args));
      if (!c) return fail("help: unknown command " + join_args(args));
      std::string s = c->name + ": " + c->description;
      for (const auto& p : c->parameters) {
        s += p.required ? " <" : " [";
        s += p.name + ":" + param_type_name(p.type);
        s += p.required ? ">" : "]";
      }
      std::string params;
      for (const auto& p : c->parameters) {
        if (p.description.empty()) continue;
        if (!params.empty()) params += "; ";
        params += p.name + ": " + p.description;
      }
      if (!params.empty()) s += "  params: " + params;
      if (!c->aliases.empty()) s += "  aliases: " + join_args(c->aliases);
      if (!c->shortcut.empty()) s += "  key: " + c->shortcut;
      return ok(s);
    }});
  cmds.push_back({"history", "Show recent commands", "info", "^", "", {":hist"}, {}, nullptr,
    [&registry](const std::vector<std::string>&, const ParseResult&){
      // the running "history" entry is already recorded at the front
      std::vector<std::string> h = registry.history();
      if (h.size() <= 1) return ok("history is empty");
      h.erase(h.begin());
      return ok(join_args(h));
    }});
  cmds.push_back({"clear history", "Forget recent commands", "info", "^", "", {":ch"}, {}, nullptr,
    [&registry](const std::vector<std::string>&, const ParseResult&){
      registry.clear_history();
      return ok("history cleared");
    }});

  cmds.push_back({"quit", "Leave the palette", "general", "q", "Esc", {":q"}, {}, nullptr,
    [&should_quit](const std::vector<std::string>&, const ParseResult&){
      should_quit = true;
      return ok("bye");
    }});

  registry.register_commands(std::move(cmds));
}
