#include "button_event.h"

const char *buttonEventName(ButtonEvent event) {
  switch (event) {
    case ButtonEvent::Up:
      return "UP";
    case ButtonEvent::Down:
      return "DOWN";
    case ButtonEvent::Left:
      return "LEFT";
    case ButtonEvent::Right:
      return "RIGHT";
    case ButtonEvent::Select:
      return "SELECT";
    case ButtonEvent::Key1:
      return "KEY1";
    case ButtonEvent::Key2:
      return "KEY2";
    case ButtonEvent::Key3:
      return "KEY3";
  }
  return "?";
}
