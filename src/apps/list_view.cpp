#include "list_view.h"

namespace {

constexpr size_t kNameMaxChars = 18;
constexpr size_t kNameKeepChars = 15;

// Largest cut <= maxBytes that does not land inside a UTF-8 sequence.
size_t utf8Cut(const std::string &text, size_t maxBytes) {
  size_t cut = maxBytes;
  while (cut > 0 && cut < text.size() &&
         (static_cast<unsigned char>(text[cut]) & 0xC0U) == 0x80U) {
    --cut;
  }
  return cut;
}

}  // namespace

size_t autoScrollOffset(size_t cursor, size_t visibleRows) {
  if (visibleRows == 0 || cursor < visibleRows) {
    return 0;
  }
  return cursor - visibleRows + 1;
}

ScrollThumb scrollThumb(int trackTop, int trackBottom, size_t itemCount, size_t visibleRows,
                        size_t offset, int minThumb) {
  ScrollThumb thumb;
  const int trackHeight = trackBottom - trackTop;
  if (trackHeight <= 0 || itemCount == 0) {
    return thumb;
  }

  int height = static_cast<int>(static_cast<long>(trackHeight) * static_cast<long>(visibleRows) /
                                static_cast<long>(itemCount));
  if (height < minThumb) {
    height = minThumb;
  }
  if (height > trackHeight) {
    height = trackHeight;
  }

  size_t range = itemCount > visibleRows ? itemCount - visibleRows : 0;
  if (range == 0) {
    range = 1;
  }
  if (offset > range) {
    offset = range;
  }
  thumb.top = trackTop + static_cast<int>(static_cast<long>(trackHeight - height) *
                                          static_cast<long>(offset) / static_cast<long>(range));
  thumb.height = height;
  return thumb;
}

std::string truncateName(const std::string &name) {
  if (name.size() <= kNameMaxChars) {
    return name;
  }
  return name.substr(0, utf8Cut(name, kNameKeepChars)) + "...";
}

std::string clipLine(const std::string &line, size_t maxChars) {
  if (line.size() <= maxChars) {
    return line;
  }
  return line.substr(0, utf8Cut(line, maxChars));
}
