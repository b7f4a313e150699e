#include "media_library.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

#include "log.h"

namespace fs = std::filesystem;

namespace {

const char *const kTrackExtensions[] = {".mp3", ".ogg", ".wav"};

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

}  // namespace

bool isTrackFileName(const std::string &name) {
  const std::string lower = toLower(name);
  for (const char *ext : kTrackExtensions) {
    const std::string suffix(ext);
    if (lower.size() > suffix.size() &&
        lower.compare(lower.size() - suffix.size(), suffix.size(), suffix) == 0) {
      return true;
    }
  }
  return false;
}

std::string joinPath(const std::string &dir, const std::string &name) {
  if (dir.empty()) {
    return name;
  }
  if (dir[dir.size() - 1] == '/') {
    return dir + name;
  }
  return dir + "/" + name;
}

std::vector<std::string> listTracks(const std::string &dir) {
  std::vector<std::string> tracks;
  std::error_code ec;

  if (!fs::is_directory(dir, ec)) {
    fs::create_directories(dir, ec);
    if (ec) {
      logErrorf("[radio] cannot create %s: %s\n", dir.c_str(), ec.message().c_str());
    }
    return tracks;
  }

  fs::directory_iterator it(dir, ec);
  if (ec) {
    logErrorf("[radio] cannot list %s: %s\n", dir.c_str(), ec.message().c_str());
    return tracks;
  }

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      logErrorf("[radio] listing %s stopped: %s\n", dir.c_str(), ec.message().c_str());
      break;
    }
    std::error_code typeErr;
    if (!it->is_regular_file(typeErr)) {
      continue;
    }
    const std::string name = it->path().filename().string();
    if (isTrackFileName(name)) {
      tracks.push_back(name);
    }
  }

  std::sort(tracks.begin(), tracks.end());
  return tracks;
}
