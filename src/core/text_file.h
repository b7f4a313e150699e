#pragma once

#include <string>
#include <vector>

// Reads a text file as lines. "\r\n" endings are accepted. A missing file
// fails with error "not found" so callers can tell it from a read error.
bool loadTextLines(const std::string &path, std::vector<std::string> &lines,
                   std::string *error = nullptr);
