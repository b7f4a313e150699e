#include <stdlib.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "fakes.h"

TempDir::TempDir() {
  std::string pattern = (std::filesystem::temp_directory_path() / "pipmini-test-XXXXXX").string();
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');
  if (!mkdtemp(buf.data())) {
    throw std::runtime_error("mkdtemp failed");
  }
  path_ = buf.data();
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempDir::write(const std::string &name, const std::string &content) const {
  std::ofstream out(file(name).c_str(), std::ios::out | std::ios::trunc | std::ios::binary);
  out << content;
}
