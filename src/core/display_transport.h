#pragma once

#include <stdint.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "frame.h"
#include "gpio_backend.h"
#include "spi_channel.h"

// ST7735/ST7789 command set used by the panel.
namespace panelcmd {

constexpr uint8_t kSwReset = 0x01;
constexpr uint8_t kSleepOut = 0x11;
constexpr uint8_t kInversionOn = 0x21;
constexpr uint8_t kDisplayOn = 0x29;
constexpr uint8_t kColumnAddressSet = 0x2A;
constexpr uint8_t kRowAddressSet = 0x2B;
constexpr uint8_t kMemoryWrite = 0x2C;
constexpr uint8_t kMemoryAccessControl = 0x36;
constexpr uint8_t kPixelFormatSet = 0x3A;

constexpr uint8_t kPixelFormat16bpp = 0x55;

}  // namespace panelcmd

struct DisplayPanelConfig {
  uint16_t width = 0;
  uint16_t height = 0;
  uint16_t colStart = 0;
  uint16_t rowStart = 0;
  uint8_t madctl = 0;
  bool invertColors = false;
  unsigned resetPin = 0;
  unsigned dcPin = 0;
  unsigned backlightPin = 0;
  bool backlightActiveHigh = true;
};

// Owns the SPI channel and the reset, data/command and backlight lines.
// Commands go out with D/C low, their payload and pixel data with D/C high.
class DisplayTransport {
 public:
  using DelayFn = std::function<void(unsigned long)>;

  DisplayTransport(GpioBackend &gpio,
                   std::unique_ptr<SpiChannel> spi,
                   const DisplayPanelConfig &panel,
                   DelayFn delay = DelayFn());
  ~DisplayTransport();

  DisplayTransport(const DisplayTransport &) = delete;
  DisplayTransport &operator=(const DisplayTransport &) = delete;

  bool initialize(std::string *error = nullptr);
  bool sendCommand(uint8_t opcode,
                   const std::vector<uint8_t> &payload = std::vector<uint8_t>(),
                   std::string *error = nullptr);
  bool blit(const Frame &frame, std::string *error = nullptr);
  bool blank(std::string *error = nullptr);
  void setBacklight(bool on);
  void cleanup();

  bool ready() const { return ready_; }
  const DisplayPanelConfig &panel() const { return panel_; }

 private:
  bool claimLines(std::string *error);
  bool driveDc(bool data, std::string *error);
  bool writeChunked(const uint8_t *data, size_t length, std::string *error);
  bool setWindow(std::string *error);
  void pause(unsigned long ms);

  GpioBackend &gpio_;
  std::unique_ptr<SpiChannel> spi_;
  DisplayPanelConfig panel_;
  DelayFn delay_;
  bool linesClaimed_ = false;
  bool ready_ = false;
};
