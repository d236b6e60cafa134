#include "terminal.hpp"
#include <clocale>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

Terminal::Terminal() {
  // ncurses only needs the character set; numbers stay in the C locale
  std::setlocale(LC_CTYPE, "");
  // newterm reports failure instead of exiting like initscr
  screen_ = newterm(nullptr, stdout, stdin);
  if (!screen_) {
    const char* term = std::getenv("TERM");
    throw std::runtime_error(std::string("can not start curses on terminal \"") + (term ? term : "") + "\"");
  }
  set_term(screen_);
  cbreak();
  noecho();
  keypad(stdscr, TRUE);
  set_escdelay(25);
  curs_set(1);
}

Terminal::~Terminal() {
  endwin();
  delscreen(screen_);
}
