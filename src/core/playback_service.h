#pragma once

#include <sys/types.h>

#include <memory>
#include <string>
#include <vector>

// Single-track audio output. load() only records the track; play() starts it
// from the beginning. isBusy() is true only while sound is coming out: it
// drops when the track ends on its own, is stopped or is paused.
class PlaybackService {
 public:
  virtual ~PlaybackService() = default;

  virtual const char *name() const = 0;

  virtual bool load(const std::string &path, std::string *error = nullptr) = 0;
  virtual bool play(std::string *error = nullptr) = 0;
  virtual void pause() = 0;
  virtual void unpause() = 0;
  virtual void stop() = 0;
  virtual bool isBusy() = 0;
  // True when the last play() ended on its own with an error (undecodable
  // track, player crash) rather than finishing or being stopped.
  virtual bool lastPlayFailed() const = 0;
};

// Plays through an external command line player, one child process per track.
// Pause and resume are SIGSTOP and SIGCONT on the child.
class ProcessPlaybackService : public PlaybackService {
 public:
  explicit ProcessPlaybackService(const std::string &command);
  ~ProcessPlaybackService() override;

  ProcessPlaybackService(const ProcessPlaybackService &) = delete;
  ProcessPlaybackService &operator=(const ProcessPlaybackService &) = delete;

  const char *name() const override { return "process"; }

  bool load(const std::string &path, std::string *error = nullptr) override;
  bool play(std::string *error = nullptr) override;
  void pause() override;
  void unpause() override;
  void stop() override;
  bool isBusy() override;
  bool lastPlayFailed() const override { return failed_; }

 private:
  bool reap(bool block);

  std::vector<std::string> argv_;
  std::string track_;
  pid_t child_ = -1;
  bool paused_ = false;
  bool stopping_ = false;
  bool failed_ = false;
};

// Used when no player is installed. Nothing loads, nothing plays.
class NullPlaybackService : public PlaybackService {
 public:
  const char *name() const override { return "null"; }

  bool load(const std::string &path, std::string *error = nullptr) override;
  bool play(std::string *error = nullptr) override;
  void pause() override {}
  void unpause() override {}
  void stop() override {}
  bool isBusy() override { return false; }
  bool lastPlayFailed() const override { return false; }
};

std::vector<std::string> splitCommandLine(const std::string &command);

// Picks the process player when its binary resolves on PATH, else the null
// service. Audio trouble never stops the UI from starting.
std::unique_ptr<PlaybackService> makePlaybackService(const std::string &command);
