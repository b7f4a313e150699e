#pragma once

#include <string>

#include "../ui/ui_canvas.h"
#include "screen.h"

// Screen drawn through the shared canvas, with the standard header/footer.
class CanvasScreen : public Screen {
 public:
  explicit CanvasScreen(UiCanvas &canvas) : canvas_(canvas) {}

  void onAttach(int index, int count) override {
    index_ = index;
    count_ = count;
  }

 protected:
  void beginScreen(const std::string &footer) {
    canvas_.beginScreen(title(), index_, count_, footer);
  }

  UiCanvas &canvas_;
  int index_ = 0;
  int count_ = 1;
};
