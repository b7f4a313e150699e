#pragma once

#include <stdint.h>

enum class ButtonEvent : uint8_t {
  Up = 0,
  Down = 1,
  Left = 2,
  Right = 3,
  Select = 4,
  Key1 = 5,
  Key2 = 6,
  Key3 = 7,
};

const char *buttonEventName(ButtonEvent event);
