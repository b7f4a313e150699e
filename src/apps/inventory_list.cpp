#include "inventory_list.h"

#include "../core/log.h"
#include "../core/text_file.h"

InventoryList::InventoryList(const std::string &path, size_t visibleRows)
    : path_(path), visibleRows_(visibleRows) {}

void InventoryList::reload() {
  offset_ = 0;

  std::vector<std::string> lines;
  std::string err;
  if (loadTextLines(path_, lines, &err)) {
    lines_.swap(lines);
    return;
  }

  lines_.clear();
  if (err == "not found") {
    lines_.push_back("[ " + path_ + " not found ]");
    lines_.push_back("");
    lines_.push_back("Create " + path_ + " in");
    lines_.push_back("the working directory");
    lines_.push_back("to populate your");
    lines_.push_back("inventory.");
    return;
  }

  logErrorf("[inv] %s: %s\n", path_.c_str(), err.c_str());
  lines_.push_back("ERROR: " + err);
}

size_t InventoryList::maxOffset() const {
  if (lines_.size() <= visibleRows_) {
    return 0;
  }
  return lines_.size() - visibleRows_;
}

void InventoryList::scrollUp() {
  if (offset_ > 0) {
    --offset_;
  }
}

void InventoryList::scrollDown() {
  if (offset_ < maxOffset()) {
    ++offset_;
  }
}

void InventoryList::setVisibleRows(size_t rows) {
  visibleRows_ = rows;
  if (offset_ > maxOffset()) {
    offset_ = maxOffset();
  }
}
