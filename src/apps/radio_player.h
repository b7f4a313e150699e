#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "../core/playback_service.h"

enum class RadioState : uint8_t {
  Stopped = 0,
  Playing = 1,
  Paused = 2,
};

// Track list, cursor and transport state for the RADIO page. The cursor only
// moves with Up/Down (and follows Next); playback position is separate.
class RadioPlayer {
 public:
  RadioPlayer(PlaybackService &playback, const std::string &musicDir);

  RadioPlayer(const RadioPlayer &) = delete;
  RadioPlayer &operator=(const RadioPlayer &) = delete;

  // Snapshot of the music directory.
  void rescan();
  void setTracks(const std::vector<std::string> &tracks);

  void cursorUp();
  void cursorDown();
  void playSelected();
  void selectAndPlay(size_t index);
  void togglePause();
  void next();
  void stop();

  // Moves on to the next track once the current one has finished.
  void backgroundTick();

  RadioState state() const { return state_; }
  const std::vector<std::string> &tracks() const { return tracks_; }
  size_t current() const { return current_; }
  size_t cursor() const { return cursor_; }
  bool empty() const { return tracks_.empty(); }

 private:
  PlaybackService &playback_;
  std::string musicDir_;
  std::vector<std::string> tracks_;
  size_t current_ = 0;
  size_t cursor_ = 0;
  RadioState state_ = RadioState::Stopped;
};

const char *radioStateName(RadioState state);
