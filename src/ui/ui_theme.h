#pragma once

#include <lvgl.h>

#include <stdint.h>

#include <string>

// Pip-Boy green on black.
constexpr uint32_t kClrBg = 0x000000;
constexpr uint32_t kClrGreen = 0x00FF00;
constexpr uint32_t kClrGreenDim = 0x008C00;
constexpr uint32_t kClrGreenMid = 0x00C800;
constexpr uint32_t kClrAmber = 0xFFBF00;
constexpr uint32_t kClrCyan = 0x00C8C8;
constexpr uint32_t kClrRowStripe = 0x000C00;
constexpr uint32_t kClrRowCursor = 0x001E0A;
constexpr uint32_t kClrAmberPanel = 0x140A00;

enum class UiFontRole : uint8_t {
  Title = 0,
  Body = 1,
  Small = 2,
  Big = 3,
};

constexpr uint8_t kUiFontRoleCount = 4;

// Monospace TrueType faces when one can be found, LVGL's built-in Montserrat
// otherwise. Font trouble is never fatal.
class UiFontSet {
 public:
  UiFontSet();
  ~UiFontSet();

  UiFontSet(const UiFontSet &) = delete;
  UiFontSet &operator=(const UiFontSet &) = delete;

  // Search order: fontDir/fileName, then common system monospace fonts.
  void load(const std::string &fontDir, const std::string &fileName);
  void release();

  const lv_font_t *font(UiFontRole role) const;
  bool truetype() const { return truetype_; }
  const std::string &source() const { return source_; }

 private:
  void useBuiltin();

  const lv_font_t *fonts_[kUiFontRoleCount];
  lv_font_t *owned_[kUiFontRoleCount];
  bool truetype_ = false;
  std::string source_;
};
