#include <gtest/gtest.h>

#include <memory>

#include "core/display_transport.h"
#include "fakes.h"

namespace {

constexpr unsigned kResetPin = 27;
constexpr unsigned kDcPin = 25;
constexpr unsigned kBacklightPin = 24;
constexpr uint16_t kWidth = 128;
constexpr uint16_t kHeight = 128;

DisplayPanelConfig testPanel() {
  DisplayPanelConfig panel;
  panel.width = kWidth;
  panel.height = kHeight;
  panel.colStart = 1;
  panel.rowStart = 0;
  panel.madctl = 0x60;
  panel.invertColors = true;
  panel.resetPin = kResetPin;
  panel.dcPin = kDcPin;
  panel.backlightPin = kBacklightPin;
  panel.backlightActiveHigh = true;
  return panel;
}

class DisplayTransportTest : public ::testing::Test {
 protected:
  void build(size_t maxTransfer = 4096, const DisplayPanelConfig &panel = testPanel()) {
    log = std::make_shared<SpiLog>();
    std::unique_ptr<SpiChannel> spi(new RecordingSpiChannel(gpio, kDcPin, maxTransfer, log));
    transport.reset(new DisplayTransport(gpio, std::move(spi), panel,
                                         [this](unsigned long ms) { delays.push_back(ms); }));
  }

  std::vector<uint8_t> dataBytes(size_t from) const {
    std::vector<uint8_t> out;
    for (size_t i = from; i < log->writes.size(); ++i) {
      if (log->writes[i].dcHigh) {
        out.insert(out.end(), log->writes[i].bytes.begin(), log->writes[i].bytes.end());
      }
    }
    return out;
  }

  FakeGpioBackend gpio;
  std::shared_ptr<SpiLog> log;
  std::vector<unsigned long> delays;
  std::unique_ptr<DisplayTransport> transport;
};

TEST_F(DisplayTransportTest, InitializeSendsPowerUpSequence) {
  build();
  ASSERT_TRUE(transport->initialize());

  const std::vector<uint8_t> expected = {0x01, 0x11, 0x3A, 0x36, 0x21, 0x29};
  EXPECT_EQ(log->commands(), expected);

  // Reset pulse, then backlight on.
  EXPECT_EQ(gpio.writesTo(kResetPin), std::vector<bool>({false, true}));
  EXPECT_TRUE(gpio.levels[kBacklightPin]);
  EXPECT_EQ(delays, std::vector<unsigned long>({100, 100, 150, 150}));
  EXPECT_TRUE(transport->ready());
}

TEST_F(DisplayTransportTest, PayloadGoesOutWithDcHigh) {
  build();
  ASSERT_TRUE(transport->initialize());

  // 0x3A opcode (low), 0x55 (high), 0x36 opcode (low), 0x60 (high)
  const std::vector<SpiWrite> &w = log->writes;
  ASSERT_GE(w.size(), 6u);
  EXPECT_FALSE(w[2].dcHigh);
  EXPECT_EQ(w[2].bytes, std::vector<uint8_t>({0x3A}));
  EXPECT_TRUE(w[3].dcHigh);
  EXPECT_EQ(w[3].bytes, std::vector<uint8_t>({0x55}));
  EXPECT_FALSE(w[4].dcHigh);
  EXPECT_EQ(w[4].bytes, std::vector<uint8_t>({0x36}));
  EXPECT_TRUE(w[5].dcHigh);
  EXPECT_EQ(w[5].bytes, std::vector<uint8_t>({0x60}));
}

TEST_F(DisplayTransportTest, InversionIsOptional) {
  DisplayPanelConfig panel = testPanel();
  panel.invertColors = false;
  build(4096, panel);
  ASSERT_TRUE(transport->initialize());

  const std::vector<uint8_t> expected = {0x01, 0x11, 0x3A, 0x36, 0x29};
  EXPECT_EQ(log->commands(), expected);
}

TEST_F(DisplayTransportTest, ChipSelectIsNeverClaimed) {
  build();
  ASSERT_TRUE(transport->initialize());
  EXPECT_EQ(gpio.claimed, std::set<unsigned>({kResetPin, kDcPin, kBacklightPin}));
}

TEST_F(DisplayTransportTest, BusyLineFailsInitialize) {
  gpio.busy.insert(kDcPin);
  build();
  std::string err;
  EXPECT_FALSE(transport->initialize(&err));
  EXPECT_NE(err.find("busy"), std::string::npos);
  EXPECT_FALSE(transport->ready());
  EXPECT_TRUE(gpio.claimed.empty());
}

TEST_F(DisplayTransportTest, BlitProgramsFullWindow) {
  build();
  ASSERT_TRUE(transport->initialize());
  const size_t start = log->writes.size();

  ASSERT_TRUE(transport->blit(Frame(kWidth, kHeight)));

  const std::vector<SpiWrite> &w = log->writes;
  EXPECT_EQ(w[start].bytes, std::vector<uint8_t>({0x2A}));
  EXPECT_EQ(w[start + 1].bytes, std::vector<uint8_t>({0x00, 0x01, 0x00, 0x80}));
  EXPECT_EQ(w[start + 2].bytes, std::vector<uint8_t>({0x2B}));
  EXPECT_EQ(w[start + 3].bytes, std::vector<uint8_t>({0x00, 0x00, 0x00, 0x7F}));
  EXPECT_EQ(w[start + 4].bytes, std::vector<uint8_t>({0x2C}));
  EXPECT_FALSE(w[start + 4].dcHigh);
}

TEST_F(DisplayTransportTest, PixelStreamIsChunkedAndLossless) {
  build();
  ASSERT_TRUE(transport->initialize());

  Frame frame(kWidth, kHeight);
  for (int y = 0; y < kHeight; ++y) {
    for (int x = 0; x < kWidth; ++x) {
      frame.setPixel(x, y, static_cast<uint8_t>(x * 2), static_cast<uint8_t>(y * 2),
                     static_cast<uint8_t>(x + y));
    }
  }

  const size_t start = log->writes.size();
  ASSERT_TRUE(transport->blit(frame));

  // CASET, payload, RASET, payload, RAMWR, then 32 KiB of pixels in 8 chunks.
  const size_t pixelStart = start + 5;
  ASSERT_EQ(log->writes.size() - pixelStart, 8u);
  for (size_t i = pixelStart; i < log->writes.size(); ++i) {
    EXPECT_TRUE(log->writes[i].dcHigh);
    EXPECT_LE(log->writes[i].bytes.size(), 4096u);
  }
  EXPECT_EQ(dataBytes(pixelStart), serializeRgb565(frame));
}

TEST_F(DisplayTransportTest, OddTransferLimitStillCoversEveryByte) {
  build(1000);
  ASSERT_TRUE(transport->initialize());

  Frame frame(kWidth, kHeight);
  frame.fillRect(10, 10, 50, 70, 255, 128, 7);

  const size_t start = log->writes.size();
  ASSERT_TRUE(transport->blit(frame));

  const size_t pixelStart = start + 5;
  EXPECT_EQ(log->writes.size() - pixelStart, 33u);
  EXPECT_EQ(log->writes.back().bytes.size(), 32768u % 1000u);
  EXPECT_EQ(dataBytes(pixelStart), serializeRgb565(frame));
}

TEST_F(DisplayTransportTest, WrongFrameSizeIsRejected) {
  build();
  ASSERT_TRUE(transport->initialize());
  const size_t start = log->writes.size();

  std::string err;
  EXPECT_FALSE(transport->blit(Frame(64, 64), &err));
  EXPECT_FALSE(err.empty());
  EXPECT_EQ(log->writes.size(), start);
}

TEST_F(DisplayTransportTest, BlitBeforeInitializeFails) {
  build();
  EXPECT_FALSE(transport->blit(Frame(kWidth, kHeight)));
  EXPECT_TRUE(log->writes.empty());
}

TEST_F(DisplayTransportTest, BlankSendsBlackFrame) {
  build();
  ASSERT_TRUE(transport->initialize());
  const size_t start = log->writes.size();

  ASSERT_TRUE(transport->blank());
  const std::vector<uint8_t> pixels = dataBytes(start + 5);
  ASSERT_EQ(pixels.size(), 32768u);
  for (size_t i = 0; i < pixels.size(); ++i) {
    ASSERT_EQ(pixels[i], 0u);
  }
}

TEST_F(DisplayTransportTest, CleanupTurnsOffBacklightAndReleases) {
  build();
  ASSERT_TRUE(transport->initialize());

  transport->cleanup();
  EXPECT_EQ(gpio.writesTo(kBacklightPin).back(), false);
  EXPECT_TRUE(log->closed);
  EXPECT_TRUE(gpio.claimed.empty());
  EXPECT_FALSE(transport->ready());

  const size_t released = gpio.released.size();
  transport->cleanup();
  EXPECT_EQ(gpio.released.size(), released);
}

TEST_F(DisplayTransportTest, ActiveLowBacklight) {
  DisplayPanelConfig panel = testPanel();
  panel.backlightActiveHigh = false;
  build(4096, panel);
  ASSERT_TRUE(transport->initialize());
  EXPECT_FALSE(gpio.levels[kBacklightPin]);
  transport->cleanup();
  EXPECT_TRUE(gpio.writesTo(kBacklightPin).back());
}

}  // namespace
