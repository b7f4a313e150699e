#include "text_file.h"

#include <errno.h>
#include <string.h>
#include <sys/stat.h>

#include <fstream>

bool loadTextLines(const std::string &path, std::vector<std::string> &lines, std::string *error) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0) {
    if (error) {
      *error = errno == ENOENT ? std::string("not found") : std::string(strerror(errno));
    }
    return false;
  }
  if (S_ISDIR(st.st_mode)) {
    if (error) {
      *error = strerror(EISDIR);
    }
    return false;
  }

  std::ifstream in(path.c_str());
  if (!in) {
    if (error) {
      *error = "open failed";
    }
    return false;
  }

  std::vector<std::string> parsed;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line[line.size() - 1] == '\r') {
      line.erase(line.size() - 1);
    }
    parsed.push_back(line);
  }
  if (in.bad()) {
    if (error) {
      *error = "read failed";
    }
    return false;
  }

  lines.swap(parsed);
  return true;
}
