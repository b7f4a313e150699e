#include "ui_theme.h"

#include <sys/stat.h>

#include "../core/log.h"
#include "../core/media_library.h"

namespace {

#if LV_USE_TINY_TTF && LV_TINY_TTF_FILE_SUPPORT
// Pixel sizes per role, tuned for a 128 px panel.
const int kTtfSizes[kUiFontRoleCount] = {11, 9, 8, 26};

const char *const kSystemFonts[] = {
    "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf",
    "/usr/share/fonts/truetype/liberation/LiberationMono-Regular.ttf",
    "/usr/share/fonts/truetype/freefont/FreeMono.ttf",
};

bool isFile(const std::string &path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

std::string findFontFile(const std::string &fontDir, const std::string &fileName) {
  const std::string local = joinPath(fontDir, fileName);
  if (isFile(local)) {
    return local;
  }
  if (isFile(fileName)) {
    return fileName;
  }
  for (const char *candidate : kSystemFonts) {
    if (isFile(candidate)) {
      return candidate;
    }
  }
  return std::string();
}
#endif

}  // namespace

UiFontSet::UiFontSet() {
  for (uint8_t i = 0; i < kUiFontRoleCount; ++i) {
    owned_[i] = nullptr;
  }
  useBuiltin();
}

UiFontSet::~UiFontSet() {
  release();
}

void UiFontSet::useBuiltin() {
  fonts_[static_cast<uint8_t>(UiFontRole::Title)] = &lv_font_montserrat_12;
  fonts_[static_cast<uint8_t>(UiFontRole::Body)] = &lv_font_montserrat_10;
  fonts_[static_cast<uint8_t>(UiFontRole::Small)] = &lv_font_montserrat_8;
  fonts_[static_cast<uint8_t>(UiFontRole::Big)] = &lv_font_montserrat_28;
  truetype_ = false;
  source_ = "builtin";
}

void UiFontSet::load(const std::string &fontDir, const std::string &fileName) {
  release();

#if LV_USE_TINY_TTF && LV_TINY_TTF_FILE_SUPPORT
  const std::string path = findFontFile(fontDir, fileName);
  if (path.empty()) {
    logPrintf("[ui] no TrueType font found, using builtin\n");
    return;
  }

  std::string lvPath = std::string(1, static_cast<char>(LV_FS_STDIO_LETTER)) + ":" + path;
  for (uint8_t i = 0; i < kUiFontRoleCount; ++i) {
    owned_[i] = lv_tiny_ttf_create_file(lvPath.c_str(), kTtfSizes[i]);
    if (!owned_[i]) {
      logErrorf("[ui] font load failed: %s (size %d)\n", path.c_str(), kTtfSizes[i]);
      release();
      return;
    }
  }
  for (uint8_t i = 0; i < kUiFontRoleCount; ++i) {
    fonts_[i] = owned_[i];
  }
  truetype_ = true;
  source_ = path;
  logPrintf("[ui] font=%s\n", path.c_str());
#else
  (void)fontDir;
  (void)fileName;
  logPrintf("[ui] TrueType support disabled, using builtin fonts\n");
#endif
}

void UiFontSet::release() {
  for (uint8_t i = 0; i < kUiFontRoleCount; ++i) {
    if (owned_[i]) {
#if LV_USE_TINY_TTF
      lv_tiny_ttf_destroy(owned_[i]);
#endif
      owned_[i] = nullptr;
    }
  }
  useBuiltin();
}

const lv_font_t *UiFontSet::font(UiFontRole role) const {
  return fonts_[static_cast<uint8_t>(role)];
}
