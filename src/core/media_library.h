#pragma once

#include <string>
#include <vector>

// File names (not paths) of playable tracks in dir, sorted. The directory is
// created when missing. Any filesystem error yields an empty list.
std::vector<std::string> listTracks(const std::string &dir);

bool isTrackFileName(const std::string &name);
std::string joinPath(const std::string &dir, const std::string &name);
