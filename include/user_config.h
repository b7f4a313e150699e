#pragma once

// Include HAL board config first so board-specific pin defines are available.
#include "hal/board_config.h"

// ============================================================================
// PipMini User Configuration
// ============================================================================
// These are compile-time default seeds. Values are used only when no JSON
// config file is found. Board-specific hardware pins are defined in the HAL
// board headers (src/hal/boards/*.h) and should NOT be changed here.
// ============================================================================

// --- Config file lookup ---
#define USER_CONFIG_ENV_VAR "PIPMINI_CONFIG"
#define USER_CONFIG_LOCAL_PATH "pipmini.json"
#define USER_CONFIG_SYSTEM_PATH "/etc/pipmini/pipmini.json"

// --- Content paths (relative to the working directory) ---
#define USER_MUSIC_DIR "music"
#define USER_INVENTORY_FILE "inv.txt"
#define USER_FONT_DIR "fonts"
#define USER_FONT_FILE "DejaVuSansMono.ttf"

// --- Timing ---
#define USER_INPUT_DEBOUNCE_MS 150U
#define USER_REFRESH_RATE_HZ 10U
#define USER_SHUTDOWN_CONFIRM_SECONDS 3U

// --- GPIO backend seed: "auto", "cdev" or "sysfs" ---
#define USER_GPIO_BACKEND "auto"

// --- Audio ---
// Player command; the track path is appended as the last argument.
#define USER_PLAYER_COMMAND "play -q"

// --- Power ---
#define USER_POWER_OFF_COMMAND "systemctl poweroff"

// --- Logging ---
#define USER_VERBOSE_LOG 0
