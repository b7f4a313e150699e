#pragma once

#include <string>

#include "canvas_screen.h"
#include "inventory_list.h"

// Scrollable view of the inventory text file. Select rereads the file.
class InventoryScreen : public CanvasScreen {
 public:
  InventoryScreen(UiCanvas &canvas, const std::string &path);

  const char *title() const override { return "INV"; }
  void handleEvent(ButtonEvent event) override;
  Frame render() override;

  const InventoryList &list() const { return list_; }

 private:
  InventoryList list_;
};

size_t inventoryVisibleRows(int screenHeight);
