#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal that records the screen as rows of text plus
 *          highlighted spans, and replays scripted keys, for automated
 *          palette tests.
 */
#include "iterminal.hpp"
#include <deque>
#include <string>
#include <vector>

class HeadlessTerminal : public ITerminal {
public:
  struct Span { int row; int col; int len; };

  HeadlessTerminal(int rows, int cols);

  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override { cursor_ = {row, col}; }
  void refresh() override { refreshes_++; }
  void clear_to_eol(int row, int col) override;
  int read_key() override;

  // Queue scripted input for read_key().
  void push_keys(const std::string& text);
  void push_key(int key) { keys_.push_back(key); }

  // Row contents with trailing blanks removed.
  std::string line(int row) const;
  const std::vector<Span>& highlights() const { return highlights_; }
  const std::vector<Span>& colored(int color_pair_id) const;
  TermSize cursor() const { return cursor_; }
  int refresh_count() const { return refreshes_; }

private:
  void put(int row, int col, const std::string& text);

  int rows_;
  int cols_;
  std::vector<std::string> screen_;
  std::vector<Span> highlights_;
  std::vector<Span> accent_;
  std::vector<Span> error_;
  std::vector<Span> none_;
  std::deque<int> keys_;
  TermSize cursor_{0, 0};
  int refreshes_ = 0;
};
