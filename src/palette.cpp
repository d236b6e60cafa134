#include "palette.hpp"
#include "str_util.hpp"
#include <algorithm>

CommandPalette::CommandPalette(CommandRegistry& registry) : registry_(registry) { update(); }

void CommandPalette::set_query(const std::string& q) {
  query_ = q;
  update();
}

void CommandPalette::update() {
  results_ = registry_.search(query_);
  selected_ = std::clamp(selected_, 0, std::max(0, (int)results_.size() - 1));
}

std::string CommandPalette::resolve_input() const {
  std::string q = trim(query_);
  const Command* sel = (selected_ < (int)results_.size()) ? results_[selected_] : nullptr;
  if (q.empty()) return sel ? sel->name : std::string();
  // typed text that already names a command (maybe with args) runs as typed
  if (registry_.get(registry_.parse(q).name)) return q;
  return sel ? sel->name : q;
}

void CommandPalette::run(const std::string& input) {
  if (input.empty()) return;
  try {
    CommandResult r = registry_.execute(input);
    message_ = r.message;
    message_is_error_ = !r.success;
  } catch (const std::exception& e) {
    // already logged and broadcast by the registry; the palette only shows it
    message_ = e.what();
    message_is_error_ = true;
  }
  query_.clear();
  selected_ = 0;
  update();
}

bool CommandPalette::handle_key(int ch) {
  switch (ch) {
    case kKeyEsc:
      if (query_.empty()) return false;
      query_.clear(); selected_ = 0; update();
      return true;
    case kKeyEnter: case '\r':
      run(resolve_input());
      return true;
    case kKeyBackspace: case '\b':
      if (!query_.empty()) { query_.pop_back(); selected_ = 0; update(); }
      return true;
    case kKeyTab:
      if (selected_ < (int)results_.size()) { query_ = results_[selected_]->name + " "; update(); }
      return true;
    case kKeyUp:
      if (!results_.empty()) selected_ = (selected_ + (int)results_.size() - 1) % (int)results_.size();
      return true;
    case kKeyDown:
      if (!results_.empty()) selected_ = (selected_ + 1) % (int)results_.size();
      return true;
    default:
      break;
  }
  if (ch >= 32 && ch <= 126) {
    query_.push_back((char)ch);
    selected_ = 0;
    update();
  }
  return true;
}

void CommandPalette::render(ITerminal& term) const {
  TermSize sz = term.getSize();
  term.clear();
  std::string prompt = "> " + query_;
  term.draw_colored(0, 0, "> ", kPairAccent);
  term.draw_text(0, 2, query_);
  term.clear_to_eol(0, (int)prompt.size());

  int max_rows = std::max(0, sz.rows - 2);
  int shown = std::min(max_rows, (int)results_.size());
  for (int i = 0; i < shown; ++i) {
    const Command* c = results_[i];
    std::string line = c->icon + " " + c->name;
    if (!c->aliases.empty()) line += "  (" + c->aliases.front() + ")";
    line += "  - " + c->description;
    if (!c->shortcut.empty()) line += "  [" + c->shortcut + "]";
    if ((int)line.size() > sz.cols) line.resize(std::max(0, sz.cols));
    if (i == selected_) term.draw_highlighted(i + 1, 0, line, 0, (int)line.size());
    else term.draw_text(i + 1, 0, line);
  }
  if (results_.empty() && !trim(query_).empty()) term.draw_text(1, 0, "no matching commands");

  int status_row = sz.rows - 1;
  if (status_row > 0 && !message_.empty()) {
    std::string msg = message_;
    if ((int)msg.size() > sz.cols) msg.resize(std::max(0, sz.cols));
    if (message_is_error_) term.draw_colored(status_row, 0, msg, kPairError);
    else term.draw_text(status_row, 0, msg);
  }
  term.move_cursor(0, std::min((int)prompt.size(), std::max(0, sz.cols - 1)));
  term.refresh();
}
