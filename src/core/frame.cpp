#include "frame.h"

Frame::Frame() : width_(0), height_(0) {}

Frame::Frame(uint16_t width, uint16_t height)
    : width_(width),
      height_(height),
      rgb_(static_cast<size_t>(width) * height * 3U, 0) {}

void Frame::fill(uint8_t r, uint8_t g, uint8_t b) {
  for (size_t i = 0; i + 2 < rgb_.size(); i += 3) {
    rgb_[i] = r;
    rgb_[i + 1] = g;
    rgb_[i + 2] = b;
  }
}

void Frame::fillRect(int x, int y, int w, int h, uint8_t r, uint8_t g, uint8_t b) {
  for (int row = y; row < y + h; ++row) {
    for (int col = x; col < x + w; ++col) {
      setPixel(col, row, r, g, b);
    }
  }
}

void Frame::setPixel(int x, int y, uint8_t r, uint8_t g, uint8_t b) {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) {
    return;
  }
  const size_t offset = (static_cast<size_t>(y) * width_ + static_cast<size_t>(x)) * 3U;
  rgb_[offset] = r;
  rgb_[offset + 1] = g;
  rgb_[offset + 2] = b;
}

void Frame::pixel(int x, int y, uint8_t &r, uint8_t &g, uint8_t &b) const {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) {
    r = g = b = 0;
    return;
  }
  const size_t offset = (static_cast<size_t>(y) * width_ + static_cast<size_t>(x)) * 3U;
  r = rgb_[offset];
  g = rgb_[offset + 1];
  b = rgb_[offset + 2];
}

uint16_t packRgb565(uint8_t r, uint8_t g, uint8_t b) {
  return static_cast<uint16_t>(((r >> 3) << 11) | ((g >> 2) << 5) | (b >> 3));
}

void unpackRgb565(uint16_t packed, uint8_t &r, uint8_t &g, uint8_t &b) {
  r = static_cast<uint8_t>(((packed >> 11) & 0x1FU) << 3);
  g = static_cast<uint8_t>(((packed >> 5) & 0x3FU) << 2);
  b = static_cast<uint8_t>((packed & 0x1FU) << 3);
}

std::vector<uint8_t> serializeRgb565(const Frame &frame) {
  const size_t pixels = static_cast<size_t>(frame.width()) * frame.height();
  std::vector<uint8_t> out;
  out.reserve(pixels * 2U);

  const uint8_t *src = frame.data();
  for (size_t i = 0; i < pixels; ++i) {
    const uint16_t word = packRgb565(src[i * 3U], src[i * 3U + 1U], src[i * 3U + 2U]);
    out.push_back(static_cast<uint8_t>(word >> 8));
    out.push_back(static_cast<uint8_t>(word & 0xFFU));
  }
  return out;
}
