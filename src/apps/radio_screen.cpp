#include "radio_screen.h"

#include <string>

#include "list_view.h"

namespace {

constexpr int kStatusY = 18;
constexpr int kListTop = kStatusY + 25;
constexpr int kFooterReserve = 15;
constexpr int kRowHeight = 10;
constexpr int kMinThumb = 6;

}  // namespace

RadioScreen::RadioScreen(UiCanvas &canvas, RadioPlayer &player)
    : CanvasScreen(canvas), player_(player) {}

void RadioScreen::handleEvent(ButtonEvent event) {
  if (player_.empty()) {
    return;
  }

  switch (event) {
    case ButtonEvent::Up:
      player_.cursorUp();
      break;
    case ButtonEvent::Down:
      player_.cursorDown();
      break;
    case ButtonEvent::Select:
      player_.playSelected();
      break;
    case ButtonEvent::Key1:
      player_.togglePause();
      break;
    case ButtonEvent::Key2:
      player_.next();
      break;
    case ButtonEvent::Key3:
      player_.stop();
      break;
    default:
      break;
  }
}

void RadioScreen::backgroundTick() {
  player_.backgroundTick();
}

void RadioScreen::onShutdown() {
  player_.stop();
}

Frame RadioScreen::render() {
  const std::vector<std::string> &tracks = player_.tracks();
  const int w = canvas_.width();

  if (tracks.empty()) {
    beginScreen("");
    canvas_.text(8, 40, "No audio files found", kClrGreenDim, UiFontRole::Body);
    canvas_.text(8, 52, "Put .mp3/.ogg/.wav", kClrGreenDim, UiFontRole::Body);
    canvas_.text(8, 64, "into the music dir", kClrGreenDim, UiFontRole::Body);
    return canvas_.finish();
  }

  beginScreen("K1:play K2:next K3:stop");

  const RadioState state = player_.state();
  const uint32_t statusColor = state == RadioState::Playing ? kClrGreen
                               : state == RadioState::Paused ? kClrAmber
                                                             : kClrGreenDim;
  canvas_.text(4, kStatusY, std::string("[") + radioStateName(state) + "]", statusColor,
               UiFontRole::Body);
  canvas_.text(4, kStatusY + 10, truncateName(tracks[player_.current()]), kClrCyan,
               UiFontRole::Body, w - 8);
  canvas_.divider(kStatusY + 22);

  int visible = (canvas_.height() - kFooterReserve - kListTop) / kRowHeight;
  if (visible < 1) {
    visible = 1;
  }
  const size_t rows = static_cast<size_t>(visible);
  const size_t scroll = autoScrollOffset(player_.cursor(), rows);

  for (size_t i = 0; i < rows; ++i) {
    const size_t idx = scroll + i;
    if (idx >= tracks.size()) {
      break;
    }
    const int y = kListTop + static_cast<int>(i) * kRowHeight;
    const bool selected = idx == player_.cursor();
    const bool playing = idx == player_.current() && state == RadioState::Playing;

    if (selected) {
      canvas_.rect(1, y - 1, w - 2, kRowHeight - 1, kClrRowCursor);
    }

    const char *prefix = playing ? "> " : selected ? "* " : "  ";
    uint32_t color = selected ? kClrGreen : kClrGreenDim;
    if (playing) {
      color = kClrCyan;
    }
    canvas_.text(3, y, prefix + truncateName(tracks[idx]), color, UiFontRole::Small, w - 8);
  }

  if (tracks.size() > rows) {
    const int trackBottom = canvas_.height() - kFooterReserve;
    const ScrollThumb thumb = scrollThumb(kListTop, trackBottom, tracks.size(), rows, scroll,
                                          kMinThumb);
    canvas_.scrollbar(kListTop, trackBottom, thumb.top, thumb.height);
  }

  return canvas_.finish();
}
