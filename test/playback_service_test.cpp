#include <gtest/gtest.h>

#include "core/clock.h"
#include "core/playback_service.h"
#include "fakes.h"

namespace {

TEST(PlaybackServiceTest, SplitsCommandOnWhitespace) {
  const std::vector<std::string> parts = splitCommandLine("  play   -q ");
  EXPECT_EQ(parts, std::vector<std::string>({"play", "-q"}));
  EXPECT_TRUE(splitCommandLine("").empty());
}

TEST(PlaybackServiceTest, UnknownPlayerFallsBackToNull) {
  std::unique_ptr<PlaybackService> service =
      makePlaybackService("pipmini-no-such-player-binary --flag");
  ASSERT_TRUE(service);
  EXPECT_STREQ(service->name(), "null");
}

TEST(PlaybackServiceTest, NullServiceNeverPlays) {
  NullPlaybackService service;
  std::string err;
  EXPECT_FALSE(service.load("music/a.mp3", &err));
  EXPECT_FALSE(err.empty());
  EXPECT_FALSE(service.play());
  EXPECT_FALSE(service.isBusy());
}

TEST(PlaybackServiceTest, LoadRejectsUnreadableTrack) {
  TempDir dir;
  ProcessPlaybackService service("true");
  std::string err;
  EXPECT_FALSE(service.load(dir.file("missing.mp3"), &err));
  EXPECT_FALSE(err.empty());
}

TEST(PlaybackServiceTest, ChildRunsUntilStopped) {
  TempDir dir;
  dir.write("t.wav", "");
  // "tail -f <track>" never exits on its own.
  ProcessPlaybackService service("tail -f");
  ASSERT_TRUE(service.load(dir.file("t.wav")));
  ASSERT_TRUE(service.play());
  EXPECT_TRUE(service.isBusy());

  service.pause();
  EXPECT_FALSE(service.isBusy());
  service.unpause();
  EXPECT_TRUE(service.isBusy());

  service.stop();
  EXPECT_FALSE(service.isBusy());
}

TEST(PlaybackServiceTest, PlayerErrorExitIsReportedAsFailure) {
  TempDir dir;
  dir.write("t.mp3", "");
  ProcessPlaybackService service("false");
  ASSERT_TRUE(service.load(dir.file("t.mp3")));
  ASSERT_TRUE(service.play());

  bool busy = true;
  for (int i = 0; i < 200 && busy; ++i) {
    busy = service.isBusy();
    if (busy) {
      delayMs(10);
    }
  }
  EXPECT_FALSE(busy);
  EXPECT_TRUE(service.lastPlayFailed());
}

TEST(PlaybackServiceTest, StoppedChildIsNotAFailure) {
  TempDir dir;
  dir.write("t.wav", "");
  ProcessPlaybackService service("tail -f");
  ASSERT_TRUE(service.load(dir.file("t.wav")));
  ASSERT_TRUE(service.play());
  service.stop();
  EXPECT_FALSE(service.isBusy());
  EXPECT_FALSE(service.lastPlayFailed());
}

TEST(PlaybackServiceTest, FinishedChildIsNotBusy) {
  TempDir dir;
  dir.write("t.wav", "");
  ProcessPlaybackService service("true");
  ASSERT_TRUE(service.load(dir.file("t.wav")));
  ASSERT_TRUE(service.play());

  bool busy = true;
  for (int i = 0; i < 200 && busy; ++i) {
    busy = service.isBusy();
    if (busy) {
      delayMs(10);
    }
  }
  EXPECT_FALSE(busy);
  EXPECT_FALSE(service.lastPlayFailed());
}

}  // namespace
