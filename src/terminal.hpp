#pragma once
/*
 * Terminal
 *
 * Purpose: RAII ncurses session for the palette (newterm on stdin/stdout).
 * Usage: construct in main before any NcursesTerminal; the destructor ends
 *        curses mode and frees the screen.
 * Errors: throws std::runtime_error when stdout is not a usable terminal.
 * Note: cbreak (not raw) so Ctrl+C still interrupts a hung command effect.
 */
#include <ncurses.h>

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

private:
  SCREEN* screen_ = nullptr;
};
