#pragma once

#include <stdint.h>

#include "user_config.h"
#include "../hal/board_config.h"

namespace boardpins {

// Display control lines. The chip select is listed for reference only: it is
// driven by the spidev driver and claiming it fails with "GPIO busy".
constexpr unsigned kTftCs = HAL_PIN_TFT_CS;
constexpr unsigned kTftDc = HAL_PIN_TFT_DC;
constexpr unsigned kTftReset = HAL_PIN_TFT_RST;
constexpr unsigned kTftBacklight = HAL_PIN_TFT_BACKLIGHT;

// Joystick
constexpr unsigned kJoyUp = HAL_PIN_JOY_UP;
constexpr unsigned kJoyDown = HAL_PIN_JOY_DOWN;
constexpr unsigned kJoyLeft = HAL_PIN_JOY_LEFT;
constexpr unsigned kJoyRight = HAL_PIN_JOY_RIGHT;
constexpr unsigned kJoyPress = HAL_PIN_JOY_PRESS;

// Context keys
constexpr unsigned kKey1 = HAL_PIN_KEY1;
constexpr unsigned kKey2 = HAL_PIN_KEY2;
constexpr unsigned kKey3 = HAL_PIN_KEY3;

// Panel geometry
constexpr uint16_t kDisplayWidth = HAL_DISPLAY_WIDTH;
constexpr uint16_t kDisplayHeight = HAL_DISPLAY_HEIGHT;
constexpr uint16_t kDisplayColStart = HAL_DISPLAY_COL_START;
constexpr uint16_t kDisplayRowStart = HAL_DISPLAY_ROW_START;

}  // namespace boardpins
