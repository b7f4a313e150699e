#pragma once

// ============================================================================
// PipMini Hardware Abstraction Layer (HAL) - Board Configuration
// ============================================================================
//
// This header selects the correct board-specific pin map and capability flags
// based on the BOARD_* preprocessor define passed by CMake (-DPIPMINI_BOARD=).
//
// To add a new board:
//   1. Create src/hal/boards/my_board.h  (copy an existing one as template)
//   2. Add a #elif for your BOARD_xxx define below
//   3. Add the board name to the PIPMINI_BOARD choices in CMakeLists.txt
// ============================================================================

#if defined(BOARD_WAVESHARE_LCD_HAT_144)
  #include "boards/waveshare_lcd_hat_144.h"
#elif defined(BOARD_WAVESHARE_LCD_HAT_13)
  #include "boards/waveshare_lcd_hat_13.h"
#else
  // Default: Waveshare 1.44" LCD HAT
  #define BOARD_WAVESHARE_LCD_HAT_144
  #include "boards/waveshare_lcd_hat_144.h"
#endif

// ============================================================================
// Sanity checks - every board header must define these mandatory symbols.
// ============================================================================
#ifndef HAL_BOARD_NAME
  #error "Board header must define HAL_BOARD_NAME"
#endif
#ifndef HAL_HOST
  #error "Board header must define HAL_HOST"
#endif
#if !defined(HAL_PIN_TFT_DC) || !defined(HAL_PIN_TFT_RST) || !defined(HAL_PIN_TFT_BACKLIGHT)
  #error "Board header must define the TFT control pins"
#endif
#if !defined(HAL_PIN_KEY1) || !defined(HAL_PIN_KEY2) || !defined(HAL_PIN_KEY3)
  #error "Board header must define KEY1..KEY3"
#endif

// Display defaults
#ifndef HAL_DISPLAY_WIDTH
  #define HAL_DISPLAY_WIDTH 0
#endif
#ifndef HAL_DISPLAY_HEIGHT
  #define HAL_DISPLAY_HEIGHT 0
#endif
#ifndef HAL_DISPLAY_COL_START
  #define HAL_DISPLAY_COL_START 0
#endif
#ifndef HAL_DISPLAY_ROW_START
  #define HAL_DISPLAY_ROW_START 0
#endif
#ifndef HAL_DISPLAY_MADCTL
  #define HAL_DISPLAY_MADCTL 0x00
#endif
#ifndef HAL_TFT_INVERSION_ON
  #define HAL_TFT_INVERSION_ON 0
#endif
#ifndef HAL_TFT_BACKLIGHT_ACTIVE_HIGH
  #define HAL_TFT_BACKLIGHT_ACTIVE_HIGH 1
#endif

// SPI defaults
#ifndef HAL_SPI_DEVICE
  #define HAL_SPI_DEVICE "/dev/spidev0.0"
#endif
#ifndef HAL_SPI_FREQUENCY
  #define HAL_SPI_FREQUENCY 40000000
#endif
#ifndef HAL_SPI_MAX_TRANSFER
  #define HAL_SPI_MAX_TRANSFER 4096
#endif

// GPIO defaults
#ifndef HAL_GPIO_CHIP
  #define HAL_GPIO_CHIP "/dev/gpiochip0"
#endif
// Offset added to BCM numbers for the legacy sysfs interface (512 on 6.6+ kernels).
#ifndef HAL_GPIO_SYSFS_BASE
  #define HAL_GPIO_SYSFS_BASE 0
#endif
