#include "workspace.hpp"
#include "str_util.hpp"

void Workspace::set_active(int idx) {
  active_ = idx;
  has_active_ = idx >= 0 && idx < (int)docs_.size();
}

MdDocument& Workspace::create(const std::string& title) {
  MdDocument d;
  d.title = title.empty() ? "Untitled" : title;
  d.lines = {"# " + d.title, ""};
  d.modified = true;
  docs_.push_back(std::move(d));
  set_active((int)docs_.size() - 1);
  return docs_.back();
}

bool Workspace::open(const std::string& filter, std::string& msg) {
  std::string f = to_lower(filter);
  for (size_t i = 0; i < docs_.size(); ++i) {
    if (contains(to_lower(docs_[i].title), f)) {
      set_active((int)i);
      msg = "opened " + docs_[i].title;
      return true;
    }
  }
  msg = "no document matches \"" + filter + "\"";
  return false;
}

bool Workspace::save(std::string& msg) {
  MdDocument* d = active();
  if (!d) { msg = "no document open"; return false; }
  d->modified = false;
  msg = "saved " + d->title;
  return true;
}

bool Workspace::close(std::string& msg) {
  if (!active()) { msg = "no document open"; return false; }
  msg = "closed " + docs_[active_].title;
  set_active(-1);
  return true;
}

MdDocument* Workspace::active() { return has_active_ ? &docs_[active_] : nullptr; }
const MdDocument* Workspace::active() const { return has_active_ ? &docs_[active_] : nullptr; }

size_t Workspace::word_count(const MdDocument& doc) {
  size_t n = 0;
  for (const auto& l : doc.lines) {
    for (const auto& w : split_ws(l)) {
      // heading markers and list bullets are not words
      if (w.find_first_not_of("#*-+>") != std::string::npos) n++;
    }
  }
  return n;
}

std::vector<Heading> Workspace::outline(const MdDocument& doc) {
  std::vector<Heading> out;
  bool in_fence = false;
  for (size_t i = 0; i < doc.lines.size(); ++i) {
    const std::string& l = doc.lines[i];
    if (starts_with(l, "```")) { in_fence = !in_fence; continue; }
    if (in_fence) continue;
    size_t lv = 0;
    while (lv < l.size() && l[lv] == '#') lv++;
    if (lv == 0 || lv > 6) continue;
    if (lv < l.size() && !is_space(l[lv])) continue;
    out.push_back({(int)lv, trim(l.substr(lv)), (int)i + 1});
  }
  return out;
}
