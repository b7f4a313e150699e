#pragma once

#include <stddef.h>
#include <stdint.h>

#include <vector>

// One full screen of 24-bit RGB pixels, row-major, 3 bytes per pixel.
class Frame {
 public:
  Frame();
  Frame(uint16_t width, uint16_t height);

  uint16_t width() const { return width_; }
  uint16_t height() const { return height_; }
  bool empty() const { return rgb_.empty(); }

  void fill(uint8_t r, uint8_t g, uint8_t b);
  void fillRect(int x, int y, int w, int h, uint8_t r, uint8_t g, uint8_t b);
  void setPixel(int x, int y, uint8_t r, uint8_t g, uint8_t b);
  void pixel(int x, int y, uint8_t &r, uint8_t &g, uint8_t &b) const;

  const uint8_t *data() const { return rgb_.data(); }
  size_t size() const { return rgb_.size(); }

 private:
  uint16_t width_;
  uint16_t height_;
  std::vector<uint8_t> rgb_;
};

// 5/6/5 truncation: red>>3, green>>2, blue>>3.
uint16_t packRgb565(uint8_t r, uint8_t g, uint8_t b);
void unpackRgb565(uint16_t packed, uint8_t &r, uint8_t &g, uint8_t &b);

// Whole frame as big-endian RGB565 words, row-major.
std::vector<uint8_t> serializeRgb565(const Frame &frame);
