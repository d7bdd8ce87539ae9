/**
 * @file Config.h
 * @brief Configuration for the CometBlue thermostat driver
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "Status.h"

namespace CometBlue {

/// @brief Open a GATT connection to the device at address ("XX:XX:XX:XX:XX:XX").
using BleConnectFn = Status (*)(const char* address, uint32_t timeoutMs, void* user);

/// @brief Close the GATT connection. Must be safe to call when not connected.
using BleDisconnectFn = Status (*)(void* user);

/// @brief Read a characteristic by UUID into rx (capacity rxCap), storing the length in rxLen.
/// @note A value longer than rxCap is a payload fault: return MALFORMED_DATA, not TRANSPORT_ERROR.
using BleReadFn = Status (*)(const char* uuid, uint8_t* rx, size_t rxCap, size_t* rxLen,
                             uint32_t timeoutMs, void* user);

/// @brief Write data to a characteristic by UUID.
using BleWriteFn = Status (*)(const char* uuid, const uint8_t* data, size_t len,
                              uint32_t timeoutMs, void* user);

/// @brief Wall clock in Unix seconds (UTC). Return 0 if unknown.
using ClockFn = uint32_t (*)(void* user);

/**
 * @struct Config
 * @brief Thermostat connection parameters
 *
 * All Bluetooth resources are application-provided. The library never
 * scans, pairs or selects an adapter.
 */
struct Config {
  /// @brief Connect callback (required).
  BleConnectFn connect = nullptr;

  /// @brief Disconnect callback (required).
  BleDisconnectFn disconnect = nullptr;

  /// @brief Characteristic read callback (required).
  BleReadFn read = nullptr;

  /// @brief Characteristic write callback (required).
  BleWriteFn write = nullptr;

  /// @brief User context passed to transport callbacks (e.g., NimBLEClient*).
  void* transportUser = nullptr;

  /// @brief Device MAC address, "XX:XX:XX:XX:XX:XX" (required).
  const char* address = nullptr;

  /// @brief Send pin right after connecting (default: false)
  /// @note Without a PIN only the device information strings are readable.
  bool hasPin = false;

  /// @brief Device PIN (factory default is 0)
  uint32_t pin = 0;

  /// @brief Timeout for each transport operation in milliseconds (default: 5000ms)
  /// @note Passed to the transport callback. Must be > 0.
  uint32_t timeoutMs = 5000;

  /// @brief Consecutive failure threshold before transitioning to OFFLINE
  /// @note Default: 5. DEGRADED = [1, offlineThreshold-1], OFFLINE >= offlineThreshold.
  ///       Values < 1 are clamped to 1 during begin().
  uint8_t offlineThreshold = 5;

  /// @brief Optional wall clock; restore() sets the device time from it when known
  ClockFn clock = nullptr;

  /// @brief User context passed to the clock callback.
  void* clockUser = nullptr;
};

}  // namespace CometBlue
