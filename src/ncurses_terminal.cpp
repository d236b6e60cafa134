#include "ncurses_terminal.hpp"
#include <algorithm>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) {
      init_pair(kPairAccent, COLOR_CYAN, -1);
      init_pair(kPairDefault, -1, -1);
      init_pair(kPairError, COLOR_RED, -1);
    } else {
      init_pair(kPairAccent, COLOR_CYAN, COLOR_BLACK); // fallback
      init_pair(kPairDefault, COLOR_WHITE, COLOR_BLACK);
      init_pair(kPairError, COLOR_RED, COLOR_BLACK);
    }
  }
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (has_colors()) attron(COLOR_PAIR(kPairDefault));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(kPairDefault));
}

void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = (int)text.size();
  hl_start = std::clamp(hl_start, 0, len);
  int hl_end = std::clamp(hl_start + std::max(0, hl_len), hl_start, len);
  if (hl_start > 0) {
    mvaddnstr(row, col, text.c_str(), hl_start);
    col += hl_start;
  }
  if (hl_end > hl_start) {
    attron(A_REVERSE);
    mvaddnstr(row, col, text.c_str() + hl_start, hl_end - hl_start);
    attroff(A_REVERSE);
    col += hl_end - hl_start;
  }
  if (hl_end < len) mvaddnstr(row, col, text.c_str() + hl_end, len - hl_end);
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (has_colors()) attron(COLOR_PAIR(color_pair_id));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(color_pair_id));
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

int NcursesTerminal::read_key() {
  int ch = getch();
  switch (ch) {
    case ERR: return kKeyNone;
    case KEY_UP: return kKeyUp;
    case KEY_DOWN: return kKeyDown;
    case KEY_ENTER: case '\r': return kKeyEnter;
    case KEY_BACKSPACE: case '\b': return kKeyBackspace;
    case KEY_RESIZE: return kKeyResize;
    default: return ch;
  }
}

void NcursesTerminal::setDark(bool dark) {
  if (!has_colors()) return;
  short bg = dark ? COLOR_BLACK : -1;
  init_pair(kPairDefault, dark ? COLOR_WHITE : -1, bg);
  init_pair(kPairAccent, dark ? COLOR_YELLOW : COLOR_CYAN, bg);
  init_pair(kPairError, COLOR_RED, bg);
  wbkgd(stdscr, COLOR_PAIR(kPairDefault));
  erase();
}
