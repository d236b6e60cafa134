#pragma once
/*
 * Workspace
 *
 * Purpose: in-memory markdown documents and view toggles the built-in
 *          commands act on. No persistence; "save" only clears the modified flag.
 */
#include <string>
#include <vector>

struct MdDocument {
  std::string title;
  std::vector<std::string> lines;
  std::vector<std::string> tags;
  bool modified = false;
};

struct Heading {
  int level = 0;
  std::string text;
  int line = 0;
};

class Workspace {
public:
  MdDocument& create(const std::string& title);
  // Opens the first document whose title contains filter (case-insensitive).
  bool open(const std::string& filter, std::string& msg);
  bool save(std::string& msg);
  bool close(std::string& msg);

  MdDocument* active();
  const MdDocument* active() const;
  const std::vector<MdDocument>& documents() const { return docs_; }

  // Flag read by FlagCondition for commands that need an open document.
  const bool& has_active_flag() const { return has_active_; }

  static size_t word_count(const MdDocument& doc);
  static std::vector<Heading> outline(const MdDocument& doc);

  std::string theme = "light";
  bool dark = false;
  bool sidebar_visible = true;

private:
  void set_active(int idx);

  std::vector<MdDocument> docs_;
  int active_ = -1;
  bool has_active_ = false;
};
