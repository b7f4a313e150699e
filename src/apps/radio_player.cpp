#include "radio_player.h"

#include "../core/log.h"
#include "../core/media_library.h"

RadioPlayer::RadioPlayer(PlaybackService &playback, const std::string &musicDir)
    : playback_(playback), musicDir_(musicDir) {}

void RadioPlayer::rescan() {
  setTracks(listTracks(musicDir_));
  logPrintf("[radio] %u tracks in %s\n", static_cast<unsigned>(tracks_.size()), musicDir_.c_str());
}

void RadioPlayer::setTracks(const std::vector<std::string> &tracks) {
  stop();
  tracks_ = tracks;
  current_ = 0;
  cursor_ = 0;
}

void RadioPlayer::cursorUp() {
  if (tracks_.empty()) {
    return;
  }
  cursor_ = (cursor_ + tracks_.size() - 1) % tracks_.size();
}

void RadioPlayer::cursorDown() {
  if (tracks_.empty()) {
    return;
  }
  cursor_ = (cursor_ + 1) % tracks_.size();
}

void RadioPlayer::playSelected() {
  selectAndPlay(cursor_);
}

void RadioPlayer::selectAndPlay(size_t index) {
  if (tracks_.empty()) {
    return;
  }

  stop();
  current_ = index % tracks_.size();

  const std::string path = joinPath(musicDir_, tracks_[current_]);
  std::string err;
  if (!playback_.load(path, &err) || !playback_.play(&err)) {
    logErrorf("[radio] cannot play %s: %s\n", tracks_[current_].c_str(), err.c_str());
    state_ = RadioState::Stopped;
    return;
  }
  state_ = RadioState::Playing;
}

void RadioPlayer::togglePause() {
  if (tracks_.empty()) {
    return;
  }

  switch (state_) {
    case RadioState::Stopped:
      selectAndPlay(current_);
      break;
    case RadioState::Playing:
      playback_.pause();
      state_ = RadioState::Paused;
      break;
    case RadioState::Paused:
      playback_.unpause();
      state_ = RadioState::Playing;
      break;
  }
}

void RadioPlayer::next() {
  if (tracks_.empty()) {
    return;
  }
  selectAndPlay(current_ + 1);
  cursor_ = current_;
}

void RadioPlayer::stop() {
  playback_.stop();
  state_ = RadioState::Stopped;
}

void RadioPlayer::backgroundTick() {
  if (state_ != RadioState::Playing || tracks_.empty()) {
    return;
  }
  if (playback_.isBusy()) {
    return;
  }
  if (playback_.lastPlayFailed()) {
    logErrorf("[radio] playback of %s failed, stopping\n", tracks_[current_].c_str());
    state_ = RadioState::Stopped;
    return;
  }
  logPrintf("[radio] track finished: %s\n", tracks_[current_].c_str());
  next();
}

const char *radioStateName(RadioState state) {
  switch (state) {
    case RadioState::Stopped:
      return "STOPPED";
    case RadioState::Playing:
      return "PLAYING";
    case RadioState::Paused:
      return "PAUSED";
  }
  return "STOPPED";
}
