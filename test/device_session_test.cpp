#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "apps/device_session.h"
#include "core/frame.h"
#include "fakes.h"

namespace {

constexpr unsigned kResetPin = 27;
constexpr unsigned kDcPin = 25;
constexpr unsigned kBacklightPin = 24;
constexpr unsigned kSelectPin = 13;
constexpr unsigned kKey1Pin = 21;
constexpr unsigned kKey2Pin = 20;
constexpr uint16_t kPanelSize = 4;
constexpr unsigned long kConfirmMs = 3000;

DisplayPanelConfig smallPanel() {
  DisplayPanelConfig panel;
  panel.width = kPanelSize;
  panel.height = kPanelSize;
  panel.resetPin = kResetPin;
  panel.dcPin = kDcPin;
  panel.backlightPin = kBacklightPin;
  panel.backlightActiveHigh = true;
  return panel;
}

class ThrowingScreen : public Screen {
 public:
  const char *title() const override { return "BAD"; }
  void handleEvent(ButtonEvent event) override {
    (void)event;
    throw std::runtime_error("screen fault");
  }
  Frame render() override { return Frame(kPanelSize, kPanelSize); }
};

class DeviceSessionTest : public ::testing::Test {
 protected:
  DeviceSessionTest() : spiLog(std::make_shared<SpiLog>()) {}

  void open(DeviceSession &session, std::unique_ptr<Screen> screen) {
    session.gpio.reset(new GpioHandle(gpio));

    std::unique_ptr<SpiChannel> spi(new RecordingSpiChannel(gpio, kDcPin, 4096, spiLog));
    session.display.reset(new DisplayTransport(*session.gpio, std::move(spi), smallPanel(),
                                               [](unsigned long) {}));
    ASSERT_TRUE(session.display->initialize());

    std::vector<InputBinding> bindings;
    bindings.push_back({kSelectPin, ButtonEvent::Select});
    bindings.push_back({kKey1Pin, ButtonEvent::Key1});
    bindings.push_back({kKey2Pin, ButtonEvent::Key2});
    session.input.reset(new InputSampler(*session.gpio, bindings, 0));
    ASSERT_TRUE(session.input->begin());

    session.playback.reset(new PlaybackHandle(playback));
    session.radio.reset(new RadioPlayer(*session.playback, "music"));
    session.radio->setTracks(std::vector<std::string>(1, "a.mp3"));
    session.radio->selectAndPlay(0);
    ASSERT_TRUE(playback.isBusy());

    std::vector<unsigned> combo;
    combo.push_back(kKey1Pin);
    combo.push_back(kKey2Pin);
    session.apps.reset(new AppStateMachine(*session.input, combo, kConfirmMs, &overlay));
    session.apps->addScreen(std::move(screen));
  }

  void expectCleanedUp() {
    ASSERT_FALSE(spiLog->writes.empty());
    const SpiWrite &last = spiLog->writes.back();
    EXPECT_TRUE(last.dcHigh);
    EXPECT_EQ(last.bytes, std::vector<uint8_t>(kPanelSize * kPanelSize * 2, 0));

    const std::vector<bool> backlight = gpio.writesTo(kBacklightPin);
    ASSERT_FALSE(backlight.empty());
    EXPECT_FALSE(backlight.back());

    EXPECT_EQ(gpio.releaseAllCalls, 1);
    EXPECT_TRUE(gpio.claimed.empty());
    EXPECT_TRUE(spiLog->closed);
    EXPECT_FALSE(playback.isBusy());
  }

  FakeGpioBackend gpio;
  FakePlayback playback;
  FakeOverlay overlay;
  ScreenRecord record;
  std::shared_ptr<SpiLog> spiLog;
};

TEST_F(DeviceSessionTest, StepPushesTheRenderedFrame) {
  DeviceSession session;
  open(session, std::unique_ptr<Screen>(new FakeScreen("STAT", &record)));

  EXPECT_EQ(session.step(0), TickOutcome::Continue);
  EXPECT_EQ(record.renders, 1);

  const std::vector<uint8_t> &pixels = spiLog->writes.back().bytes;
  ASSERT_EQ(pixels.size(), static_cast<size_t>(kPanelSize * kPanelSize * 2));
  const uint16_t green = packRgb565(0, 255, 0);
  EXPECT_EQ(pixels[0], static_cast<uint8_t>(green >> 8));
  EXPECT_EQ(pixels[1], static_cast<uint8_t>(green & 0xFF));
}

TEST_F(DeviceSessionTest, ExceptionInTheLoopStillCleansUp) {
  bool threw = false;
  try {
    DeviceSession session;
    open(session, std::unique_ptr<Screen>(new ThrowingScreen()));
    gpio.press(kSelectPin);
    session.step(0);
  } catch (const std::runtime_error &) {
    threw = true;
  }

  EXPECT_TRUE(threw);
  expectCleanedUp();
}

TEST_F(DeviceSessionTest, ConfirmedPowerOffThenCleanup) {
  {
    DeviceSession session;
    open(session, std::unique_ptr<Screen>(new FakeScreen("STAT", &record)));
    gpio.press(kKey1Pin);
    gpio.press(kKey2Pin);

    EXPECT_EQ(session.step(0), TickOutcome::Continue);
    EXPECT_EQ(session.step(1000), TickOutcome::Continue);
    EXPECT_EQ(session.step(kConfirmMs), TickOutcome::PowerOff);
    EXPECT_TRUE(record.events.empty());
  }

  expectCleanedUp();
  EXPECT_EQ(record.shutdowns, 1);
}

TEST_F(DeviceSessionTest, TeardownRunsOnce) {
  {
    DeviceSession session;
    open(session, std::unique_ptr<Screen>(new FakeScreen("STAT", &record)));
    session.teardown();
    session.teardown();
  }

  expectCleanedUp();
  EXPECT_EQ(record.shutdowns, 1);
}

TEST(LoopSleepTest, SleepsTheRestOfThePeriod) {
  EXPECT_EQ(loopSleepMs(100, 30), 70u);
  EXPECT_EQ(loopSleepMs(100, 0), 100u);
}

TEST(LoopSleepTest, OverrunClampsToZero) {
  EXPECT_EQ(loopSleepMs(100, 100), 0u);
  EXPECT_EQ(loopSleepMs(100, 250), 0u);
}

}  // namespace
