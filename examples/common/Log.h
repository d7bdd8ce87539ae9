/**
 * @file Log.h
 * @brief printf-style console logging for the examples.
 *
 * NOT part of the library API. Example-only.
 */

#pragma once

#include <Arduino.h>

#ifndef LOG_USE_COLOR
#define LOG_USE_COLOR 1
#endif

#if LOG_USE_COLOR
#define LOG_COLOR_RESET "\033[0m"
#define LOG_COLOR_RED "\033[31m"
#define LOG_COLOR_GREEN "\033[32m"
#define LOG_COLOR_YELLOW "\033[33m"
#define LOG_COLOR_CYAN "\033[36m"
#else
#define LOG_COLOR_RESET ""
#define LOG_COLOR_RED ""
#define LOG_COLOR_GREEN ""
#define LOG_COLOR_YELLOW ""
#define LOG_COLOR_CYAN ""
#endif

/// Green on success, red otherwise
#define LOG_COLOR_RESULT(ok) ((ok) ? LOG_COLOR_GREEN : LOG_COLOR_RED)

/// Green when healthy, yellow while degraded, red when offline
#define LOG_COLOR_STATE(online, failures) \
  (!(online) ? LOG_COLOR_RED : ((failures) > 0 ? LOG_COLOR_YELLOW : LOG_COLOR_GREEN))

#define LOGE(fmt, ...) \
  Serial.printf(LOG_COLOR_RED "[E] " fmt LOG_COLOR_RESET "\n", ##__VA_ARGS__)
#define LOGW(fmt, ...) \
  Serial.printf(LOG_COLOR_YELLOW "[W] " fmt LOG_COLOR_RESET "\n", ##__VA_ARGS__)
#define LOGI(fmt, ...) Serial.printf("[I] " fmt "\n", ##__VA_ARGS__)

#ifdef LOG_DEBUG
#define LOGD(fmt, ...) \
  Serial.printf(LOG_COLOR_CYAN "[D] " fmt LOG_COLOR_RESET "\n", ##__VA_ARGS__)
#else
#define LOGD(fmt, ...) \
  do {                 \
  } while (0)
#endif

inline const char* log_bool_str(bool value) {
  return value ? "true" : "false";
}
