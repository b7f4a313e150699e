#pragma once

#include "canvas_screen.h"
#include "radio_player.h"

// Music player page over RadioPlayer.
//   Up/Down  move the cursor     SEL  play the cursor
//   K1       play/pause          K2   next (cursor follows)
//   K3       stop
class RadioScreen : public CanvasScreen {
 public:
  RadioScreen(UiCanvas &canvas, RadioPlayer &player);

  const char *title() const override { return "RADIO"; }
  void handleEvent(ButtonEvent event) override;
  Frame render() override;
  void backgroundTick() override;
  void onShutdown() override;

 private:
  RadioPlayer &player_;
};
