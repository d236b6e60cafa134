#include "headless_terminal.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
  : rows_(rows), cols_(cols), screen_(rows, std::string(cols, ' ')) {}

void HeadlessTerminal::clear() {
  for (auto& r : screen_) r.assign(cols_, ' ');
  highlights_.clear();
  accent_.clear();
  error_.clear();
}

void HeadlessTerminal::put(int row, int col, const std::string& text) {
  if (row < 0 || row >= rows_ || col >= cols_) return;
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + (int)i;
    if (c < 0) continue;
    if (c >= cols_) break;
    screen_[row][c] = text[i];
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) { put(row, col, text); }

void HeadlessTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  put(row, col, text);
  int len = (int)text.size();
  int s = std::clamp(hl_start, 0, len);
  int e = std::clamp(hl_start + std::max(0, hl_len), s, len);
  if (e > s) highlights_.push_back({row, col + s, e - s});
}

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  put(row, col, text);
  if (color_pair_id == kPairAccent) accent_.push_back({row, col, (int)text.size()});
  else if (color_pair_id == kPairError) error_.push_back({row, col, (int)text.size()});
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_ || col >= cols_) return;
  col = std::max(col, 0);
  screen_[row].replace(col, cols_ - col, cols_ - col, ' ');
}

std::string HeadlessTerminal::line(int row) const {
  if (row < 0 || row >= rows_) return std::string();
  const std::string& r = screen_[row];
  size_t end = r.find_last_not_of(' ');
  return end == std::string::npos ? std::string() : r.substr(0, end + 1);
}

const std::vector<HeadlessTerminal::Span>& HeadlessTerminal::colored(int color_pair_id) const {
  if (color_pair_id == kPairAccent) return accent_;
  if (color_pair_id == kPairError) return error_;
  return none_;
}

int HeadlessTerminal::read_key() {
  if (keys_.empty()) return kKeyNone;
  int k = keys_.front();
  keys_.pop_front();
  return k;
}

void HeadlessTerminal::push_keys(const std::string& text) {
  for (char c : text) keys_.push_back((unsigned char)c);
}
