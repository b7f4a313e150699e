#pragma once

#include <stddef.h>

#include <string>

struct ScrollThumb {
  int top = 0;
  int height = 0;
};

// First visible row so that the cursor stays on screen.
size_t autoScrollOffset(size_t cursor, size_t visibleRows);

// Thumb of a scrollbar spanning [trackTop, trackBottom). Only meaningful when
// itemCount > visibleRows.
ScrollThumb scrollThumb(int trackTop, int trackBottom, size_t itemCount, size_t visibleRows,
                        size_t offset, int minThumb);

// Names longer than 18 bytes keep 15 and gain "...". Cuts never split a
// UTF-8 sequence, so a few bytes fewer may be kept.
std::string truncateName(const std::string &name);
std::string clipLine(const std::string &line, size_t maxChars);
