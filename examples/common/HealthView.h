#pragma once

#include <Arduino.h>

#include "Log.h"

/**
 * @brief Print link health counters of a driver exposing the CometBlue health API.
 */
template <typename DriverT>
inline void printHealthView(const DriverT& driver) {
  const bool online = driver.isOnline();
  Serial.printf("state=%s%d%s online=%s failures=%u totalFail=%lu totalOk=%lu auth=%s\n",
                LOG_COLOR_STATE(online, driver.consecutiveFailures()),
                static_cast<int>(driver.state()), LOG_COLOR_RESET, log_bool_str(online),
                static_cast<unsigned>(driver.consecutiveFailures()),
                static_cast<unsigned long>(driver.totalFailures()),
                static_cast<unsigned long>(driver.totalSuccess()),
                log_bool_str(driver.isAuthenticated()));
  const auto last = driver.lastError();
  if (!last.ok()) {
    Serial.printf("lastError=%s (detail=%ld)\n", last.msg ? last.msg : "",
                  static_cast<long>(last.detail));
  }
}
