#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend for the palette: size, drawing, cursor,
 *          refresh and key input.
 * Goal: keep the palette independent of ncurses so it can be driven headless in tests.
 * Keys: read_key() returns printable ASCII as is and the TermKey codes below
 *       for everything the palette reacts to; backends translate their own codes.
 */
#include <string>

struct TermSize { int rows; int cols; };

enum TermKey {
  kKeyNone = -1,
  kKeyTab = '\t',
  kKeyEnter = '\n',
  kKeyEsc = 27,
  kKeyBackspace = 127,
  kKeyUp = 0x1000,
  kKeyDown = 0x1001,
  kKeyResize = 0x1002
};

// Color pairs understood by every backend.
enum ColorPair { kPairDefault = 2, kPairAccent = 1, kPairError = 3 };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  // Draws text with [hl_start, hl_start + hl_len) in reverse video.
  virtual void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
  // Blocks for the next key; kKeyNone when no more input is available.
  virtual int read_key() = 0;
};
