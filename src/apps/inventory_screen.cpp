#include "inventory_screen.h"

#include "list_view.h"

namespace {

constexpr int kListTop = 18;
constexpr int kBodyTop = 17;
constexpr int kFooterReserve = 15;
constexpr int kRowHeight = 10;
constexpr int kMinThumb = 8;
constexpr size_t kLineChars = 20;

}  // namespace

size_t inventoryVisibleRows(int screenHeight) {
  const int rows = (screenHeight - kFooterReserve - kBodyTop) / kRowHeight;
  return rows > 0 ? static_cast<size_t>(rows) : 1;
}

InventoryScreen::InventoryScreen(UiCanvas &canvas, const std::string &path)
    : CanvasScreen(canvas), list_(path, inventoryVisibleRows(canvas.height())) {
  list_.reload();
}

void InventoryScreen::handleEvent(ButtonEvent event) {
  switch (event) {
    case ButtonEvent::Up:
      list_.scrollUp();
      break;
    case ButtonEvent::Down:
      list_.scrollDown();
      break;
    case ButtonEvent::Select:
      list_.reload();
      break;
    default:
      break;
  }
}

Frame InventoryScreen::render() {
  beginScreen("^v scroll  SEL reload");

  const std::vector<std::string> &lines = list_.lines();
  const size_t visible = list_.visibleRows();
  const int w = canvas_.width();

  int y = kListTop;
  for (size_t i = 0; i < visible; ++i) {
    const size_t idx = list_.offset() + i;
    if (idx >= lines.size()) {
      break;
    }
    if (i % 2 == 0) {
      canvas_.rect(1, y - 1, w - 2, kRowHeight - 1, kClrRowStripe);
    }
    canvas_.text(3, y, clipLine(lines[idx], kLineChars), kClrGreen, UiFontRole::Body, w - 8);
    y += kRowHeight;
  }

  if (lines.size() > visible) {
    const int trackTop = kListTop;
    const int trackBottom = canvas_.height() - kFooterReserve;
    const ScrollThumb thumb =
        scrollThumb(trackTop, trackBottom, lines.size(), visible, list_.offset(), kMinThumb);
    canvas_.scrollbar(trackTop, trackBottom, thumb.top, thumb.height);
  }

  return canvas_.finish();
}
