/**
 * @file CommandTable.h
 * @brief Comet Blue GATT characteristic table, wire sizes and sentinels.
 *
 * The thermostat exposes one GATT service with fixed-layout characteristics.
 * The layout was reverse-engineered; there is no version field.
 *
 * @note Table characteristics (days, holidays) occupy consecutive UUIDs:
 *       row n lives at the base UUID with n added to its first field.
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

namespace CometBlue {

namespace cmd {

// ========== Standard GATT Device Information ==========

/// @brief Device name (GAP, read-only ASCII)
static constexpr const char* UUID_DEVICE_NAME = "00002a00-0000-1000-8000-00805f9b34fb";

/// @brief Model number string (read-only ASCII)
static constexpr const char* UUID_MODEL_NUMBER = "00002a24-0000-1000-8000-00805f9b34fb";

/// @brief Firmware revision string (read-only ASCII)
static constexpr const char* UUID_FIRMWARE_REVISION = "00002a26-0000-1000-8000-00805f9b34fb";

/// @brief Software revision string (read-only ASCII)
static constexpr const char* UUID_SOFTWARE_REVISION = "00002a28-0000-1000-8000-00805f9b34fb";

/// @brief Manufacturer name string (read-only ASCII)
static constexpr const char* UUID_MANUFACTURER_NAME = "00002a29-0000-1000-8000-00805f9b34fb";

// ========== Vendor Service (PIN-protected) ==========

/// @brief Date/time: minute, hour, day, month, year-2000
static constexpr const char* UUID_DATETIME = "47e9ee01-47e9-11e4-8939-164230d1df67";

/// @brief Day schedule table base (Monday). Rows 0-6 = Monday-Sunday
static constexpr const char* UUID_DAY_BASE = "47e9ee10-47e9-11e4-8939-164230d1df67";

/// @brief Holiday table base (holiday 1). Rows 0-7 = holidays 1-8
static constexpr const char* UUID_HOLIDAY_BASE = "47e9ee20-47e9-11e4-8939-164230d1df67";

/// @brief Status flags (opaque bitmask)
static constexpr const char* UUID_FLAGS = "47e9ee2a-47e9-11e4-8939-164230d1df67";

/// @brief Temperature settings block
static constexpr const char* UUID_TEMPERATURES = "47e9ee2b-47e9-11e4-8939-164230d1df67";

/// @brief Battery charge in percent
static constexpr const char* UUID_BATTERY = "47e9ee2c-47e9-11e4-8939-164230d1df67";

/// @brief Secondary firmware revision string
static constexpr const char* UUID_FIRMWARE_REVISION2 = "47e9ee2d-47e9-11e4-8939-164230d1df67";

/// @brief LCD backlight timer
static constexpr const char* UUID_LCD_TIMER = "47e9ee2e-47e9-11e4-8939-164230d1df67";

/// @brief PIN (write-only). Must be written before protected access.
static constexpr const char* UUID_PIN = "47e9ee30-47e9-11e4-8939-164230d1df67";

/// @brief Length of a textual UUID without terminator
static constexpr size_t UUID_STRING_LEN = 36;

// ========== Table Sizes ==========

static constexpr uint8_t DAY_COUNT = 7;
static constexpr uint8_t HOLIDAY_COUNT = 8;
static constexpr uint8_t PERIODS_PER_DAY = 4;

// ========== Wire Sizes (bytes) ==========

static constexpr size_t TEMPERATURE_LEN = 1;
static constexpr size_t DATETIME_LEN = 5;
static constexpr size_t PERIOD_LEN = 4;
static constexpr size_t DAY_LEN = PERIOD_LEN * PERIODS_PER_DAY;  // 16
static constexpr size_t HOLIDAY_LEN = DATETIME_LEN * 2 + TEMPERATURE_LEN;  // 11
static constexpr size_t TEMPERATURES_LEN = 7;
static constexpr size_t PIN_LEN = 4;
static constexpr size_t BATTERY_LEN = 1;
static constexpr size_t FLAGS_LEN = 1;
static constexpr size_t LCD_TIMER_LEN = 1;

/// @brief Longest ASCII string accepted from the device information characteristics
static constexpr size_t MAX_STRING_LEN = 32;

/// @brief Largest payload any characteristic returns
static constexpr size_t MAX_PAYLOAD_LEN = MAX_STRING_LEN;

// ========== Temperatures Block Layout (offsets) ==========

static constexpr size_t TEMPS_CURRENT = 0;       ///< Measured, read-only
static constexpr size_t TEMPS_MANUAL = 1;        ///< Manual-mode setpoint
static constexpr size_t TEMPS_TARGET_LOW = 2;    ///< Eco / night setpoint
static constexpr size_t TEMPS_TARGET_HIGH = 3;   ///< Comfort / day setpoint
static constexpr size_t TEMPS_OFFSET = 4;        ///< Sensor offset
static constexpr size_t TEMPS_WINDOW_DETECT = 5; ///< Window-open detection sensitivity
static constexpr size_t TEMPS_WINDOW_MINUTES = 6;///< Window-open duration

// ========== Sentinels ==========

/// @brief Temperature / signed setting sentinel: "not set" on read, "leave unchanged" on write
static constexpr uint8_t TEMP_UNSET = 0x80;

/// @brief Unset byte for date/time, period slots and battery
static constexpr uint8_t BYTE_UNSET = 0xFF;

// ========== Field Limits ==========

static constexpr uint16_t YEAR_BASE = 2000;
static constexpr uint16_t YEAR_MAX = 2255;
static constexpr uint16_t MINUTES_PER_DAY = 24 * 60;
static constexpr int16_t TEMP_HALF_DEGREES_MIN = -127;
static constexpr int16_t TEMP_HALF_DEGREES_MAX = 127;
static constexpr uint8_t BATTERY_MAX_PERCENT = 100;

}  // namespace cmd

}  // namespace CometBlue
