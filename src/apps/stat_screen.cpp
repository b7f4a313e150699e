#include "stat_screen.h"

#include <string>
#include <utility>
#include <vector>

namespace {

constexpr int kFirstRowY = 19;
constexpr int kRowHeight = 12;
constexpr int kLabelX = 4;
constexpr int kValueGap = 2;
constexpr int kNoteHeight = 17;

}  // namespace

StatScreen::StatScreen(UiCanvas &canvas, SystemMetrics &metrics)
    : CanvasScreen(canvas), metrics_(metrics) {
  // Baseline sample so the first visible frame can already show a figure.
  metrics_.cpuPercent();
}

void StatScreen::handleEvent(ButtonEvent event) {
  (void)event;
}

Frame StatScreen::render() {
  beginScreen("<> switch screen");

  std::vector<std::pair<const char *, std::string>> rows;
  rows.push_back(std::make_pair("CPU", metrics_.cpuPercent()));
  rows.push_back(std::make_pair("RAM", metrics_.ramUsage()));
  rows.push_back(std::make_pair("DISK", metrics_.diskUsage()));
  rows.push_back(std::make_pair("IP", metrics_.ipAddress()));
  rows.push_back(std::make_pair("UP", metrics_.uptime()));
  rows.push_back(std::make_pair("TEMP", metrics_.cpuTemperature()));
  rows.push_back(std::make_pair("BATT", std::string("SEE X306 LEDS")));

  int y = kFirstRowY;
  for (size_t i = 0; i < rows.size(); ++i) {
    lv_obj_t *label = canvas_.text(kLabelX, y, std::string(rows[i].first) + ":", kClrGreenDim,
                                   UiFontRole::Body);
    const int valueX = kLabelX + canvas_.measure(label) + kValueGap;
    canvas_.text(valueX, y, rows[i].second, kClrGreen, UiFontRole::Body,
                 canvas_.width() - valueX - 1);
    y += kRowHeight;
  }

  // Battery note only where the panel is tall enough to hold it.
  canvas_.divider(y - 2);
  y += 2;
  if (y + kNoteHeight <= canvas_.bodyBottom()) {
    canvas_.frameRect(2, y, canvas_.width() - 4, kNoteHeight, kClrAmber, kClrAmberPanel);
    canvas_.text(5, y + 1, "BATT: Read X306", kClrAmber, UiFontRole::Small);
    canvas_.text(5, y + 8, "4 blue LEDs on board", kClrAmber, UiFontRole::Small);
  }

  return canvas_.finish();
}
