#pragma once

// ============================================================================
// Waveshare 1.3" LCD HAT
// Host: Raspberry Pi (40-pin header)  |  Display: ST7789 240x240
// Same header wiring as the 1.44" HAT; only the panel differs.
// ============================================================================

#define HAL_BOARD_NAME        "Waveshare 1.3in LCD HAT"
#define HAL_HOST              "Raspberry Pi"

// --- Display (ST7789, spidev) ---
#define HAL_DISPLAY_WIDTH     240
#define HAL_DISPLAY_HEIGHT    240
#define HAL_DISPLAY_COL_START 0
#define HAL_DISPLAY_ROW_START 0
// MX | MV | ML, RGB order.
#define HAL_DISPLAY_MADCTL    0x70
#define HAL_TFT_INVERSION_ON  1
#define HAL_SPI_DEVICE        "/dev/spidev0.0"
#define HAL_SPI_FREQUENCY     40000000
#define HAL_SPI_MAX_TRANSFER  4096
#define HAL_PIN_TFT_CS        8
#define HAL_PIN_TFT_DC        25
#define HAL_PIN_TFT_RST       27
#define HAL_PIN_TFT_BACKLIGHT 24

// --- Joystick + keys ---
#define HAL_GPIO_CHIP         "/dev/gpiochip0"
#define HAL_PIN_JOY_UP        6
#define HAL_PIN_JOY_DOWN      19
#define HAL_PIN_JOY_LEFT      5
#define HAL_PIN_JOY_RIGHT     26
#define HAL_PIN_JOY_PRESS     13
#define HAL_PIN_KEY1          21
#define HAL_PIN_KEY2          20
#define HAL_PIN_KEY3          16
