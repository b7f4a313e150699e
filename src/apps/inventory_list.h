#pragma once

#include <stddef.h>

#include <string>
#include <vector>

// Contents of the inventory text file plus a scroll position. Up/Down move
// by one line within [0, max(0, lines - visibleRows)].
class InventoryList {
 public:
  InventoryList(const std::string &path, size_t visibleRows);

  // Rereads the file and scrolls back to the top. A missing file shows how
  // to create one; other failures show "ERROR: <reason>".
  void reload();
  void scrollUp();
  void scrollDown();

  void setVisibleRows(size_t rows);

  const std::vector<std::string> &lines() const { return lines_; }
  size_t offset() const { return offset_; }
  size_t visibleRows() const { return visibleRows_; }
  size_t maxOffset() const;
  const std::string &path() const { return path_; }

 private:
  std::string path_;
  size_t visibleRows_;
  std::vector<std::string> lines_;
  size_t offset_ = 0;
};
