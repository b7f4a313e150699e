#include "display_transport.h"

#include <algorithm>

#include "clock.h"
#include "log.h"

namespace {

constexpr unsigned long kResetPulseMs = 100UL;
constexpr unsigned long kResetSettleMs = 100UL;
constexpr unsigned long kSwResetSettleMs = 150UL;
constexpr unsigned long kSleepOutSettleMs = 150UL;

std::vector<uint8_t> addressWindow(uint16_t start, uint16_t length) {
  const uint16_t end = static_cast<uint16_t>(start + length - 1U);
  std::vector<uint8_t> payload;
  payload.push_back(static_cast<uint8_t>(start >> 8));
  payload.push_back(static_cast<uint8_t>(start & 0xFFU));
  payload.push_back(static_cast<uint8_t>(end >> 8));
  payload.push_back(static_cast<uint8_t>(end & 0xFFU));
  return payload;
}

}  // namespace

DisplayTransport::DisplayTransport(GpioBackend &gpio,
                                   std::unique_ptr<SpiChannel> spi,
                                   const DisplayPanelConfig &panel,
                                   DelayFn delay)
    : gpio_(gpio), spi_(std::move(spi)), panel_(panel), delay_(std::move(delay)) {
  if (!delay_) {
    delay_ = delayMs;
  }
}

DisplayTransport::~DisplayTransport() {
  cleanup();
}

void DisplayTransport::pause(unsigned long ms) {
  delay_(ms);
}

bool DisplayTransport::claimLines(std::string *error) {
  if (linesClaimed_) {
    return true;
  }

  std::string claimErr;
  if (!gpio_.claimOutput(panel_.resetPin, true, &claimErr)) {
    if (error) {
      *error = "reset line: " + claimErr;
    }
    return false;
  }
  if (!gpio_.claimOutput(panel_.dcPin, false, &claimErr)) {
    gpio_.release(panel_.resetPin);
    if (error) {
      *error = "D/C line: " + claimErr;
    }
    return false;
  }
  if (!gpio_.claimOutput(panel_.backlightPin, !panel_.backlightActiveHigh, &claimErr)) {
    gpio_.release(panel_.resetPin);
    gpio_.release(panel_.dcPin);
    if (error) {
      *error = "backlight line: " + claimErr;
    }
    return false;
  }

  linesClaimed_ = true;
  return true;
}

bool DisplayTransport::initialize(std::string *error) {
  if (!spi_) {
    if (error) {
      *error = "no SPI channel";
    }
    return false;
  }
  if (panel_.width == 0 || panel_.height == 0) {
    if (error) {
      *error = "panel geometry not set";
    }
    return false;
  }
  if (!claimLines(error)) {
    return false;
  }

  if (!gpio_.write(panel_.resetPin, false)) {
    if (error) {
      *error = "reset line write failed";
    }
    return false;
  }
  pause(kResetPulseMs);
  if (!gpio_.write(panel_.resetPin, true)) {
    if (error) {
      *error = "reset line write failed";
    }
    return false;
  }
  pause(kResetSettleMs);

  if (!sendCommand(panelcmd::kSwReset, std::vector<uint8_t>(), error)) {
    return false;
  }
  pause(kSwResetSettleMs);
  if (!sendCommand(panelcmd::kSleepOut, std::vector<uint8_t>(), error)) {
    return false;
  }
  pause(kSleepOutSettleMs);

  if (!sendCommand(panelcmd::kPixelFormatSet,
                   std::vector<uint8_t>(1, panelcmd::kPixelFormat16bpp), error)) {
    return false;
  }
  if (!sendCommand(panelcmd::kMemoryAccessControl,
                   std::vector<uint8_t>(1, panel_.madctl), error)) {
    return false;
  }
  if (panel_.invertColors &&
      !sendCommand(panelcmd::kInversionOn, std::vector<uint8_t>(), error)) {
    return false;
  }
  if (!sendCommand(panelcmd::kDisplayOn, std::vector<uint8_t>(), error)) {
    return false;
  }

  setBacklight(true);
  ready_ = true;
  logPrintf("[disp] panel %ux%u ready (madctl=0x%02X invert=%d)\n",
            static_cast<unsigned int>(panel_.width),
            static_cast<unsigned int>(panel_.height),
            static_cast<unsigned int>(panel_.madctl),
            panel_.invertColors ? 1 : 0);
  return true;
}

bool DisplayTransport::writeChunked(const uint8_t *data, size_t length, std::string *error) {
  const size_t chunk = spi_->maxTransfer();
  if (chunk == 0) {
    if (error) {
      *error = "SPI max transfer is zero";
    }
    return false;
  }

  for (size_t offset = 0; offset < length; offset += chunk) {
    const size_t n = std::min(chunk, length - offset);
    if (!spi_->write(data + offset, n, error)) {
      return false;
    }
  }
  return true;
}

bool DisplayTransport::driveDc(bool data, std::string *error) {
  if (gpio_.write(panel_.dcPin, data)) {
    return true;
  }
  if (error) {
    *error = "D/C line write failed";
  }
  return false;
}

bool DisplayTransport::sendCommand(uint8_t opcode,
                                   const std::vector<uint8_t> &payload,
                                   std::string *error) {
  if (!spi_ || !linesClaimed_) {
    if (error) {
      *error = "display transport not initialized";
    }
    return false;
  }

  if (!driveDc(false, error) || !spi_->write(&opcode, 1, error)) {
    return false;
  }
  if (payload.empty()) {
    return true;
  }

  if (!driveDc(true, error)) {
    return false;
  }
  return writeChunked(payload.data(), payload.size(), error);
}

bool DisplayTransport::setWindow(std::string *error) {
  if (!sendCommand(panelcmd::kColumnAddressSet,
                   addressWindow(panel_.colStart, panel_.width), error)) {
    return false;
  }
  return sendCommand(panelcmd::kRowAddressSet,
                     addressWindow(panel_.rowStart, panel_.height), error);
}

bool DisplayTransport::blit(const Frame &frame, std::string *error) {
  if (!ready_) {
    if (error) {
      *error = "display not ready";
    }
    return false;
  }
  if (frame.width() != panel_.width || frame.height() != panel_.height) {
    if (error) {
      *error = "frame " + std::to_string(frame.width()) + "x" + std::to_string(frame.height()) +
               " does not match panel";
    }
    return false;
  }

  const std::vector<uint8_t> pixels = serializeRgb565(frame);

  if (!setWindow(error)) {
    return false;
  }
  if (!sendCommand(panelcmd::kMemoryWrite, std::vector<uint8_t>(), error)) {
    return false;
  }
  if (!driveDc(true, error)) {
    return false;
  }
  return writeChunked(pixels.data(), pixels.size(), error);
}

bool DisplayTransport::blank(std::string *error) {
  return blit(Frame(panel_.width, panel_.height), error);
}

void DisplayTransport::setBacklight(bool on) {
  if (!linesClaimed_) {
    return;
  }
  if (!gpio_.write(panel_.backlightPin, on == panel_.backlightActiveHigh)) {
    logErrorf("[disp] backlight write failed\n");
  }
}

void DisplayTransport::cleanup() {
  if (linesClaimed_) {
    setBacklight(false);
  }
  ready_ = false;

  if (spi_) {
    spi_->close();
  }

  if (linesClaimed_) {
    gpio_.release(panel_.resetPin);
    gpio_.release(panel_.dcPin);
    gpio_.release(panel_.backlightPin);
    linesClaimed_ = false;
  }
}
