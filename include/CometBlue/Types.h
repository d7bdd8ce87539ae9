/**
 * @file Types.h
 * @brief Domain values decoded from and encoded to Comet Blue characteristics
 *
 * Fields the device can report as "not configured" carry an explicit
 * present flag instead of a magic number. A default-constructed value is
 * absent.
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "CommandTable.h"

namespace CometBlue {

/**
 * @struct Temperature
 * @brief Temperature in half-degree Celsius steps
 *
 * Stored as an integer half-degree count so repeated decode/encode cycles
 * never drift. Convert to Celsius only for presentation.
 */
struct Temperature {
  bool present = false;     ///< false = not set / disabled on the device
  int16_t halfDegrees = 0;  ///< Value in 0.5 C steps (46 = 23.0 C)

  static constexpr Temperature absent() { return Temperature{}; }

  static constexpr Temperature fromHalfDegrees(int16_t half) {
    return Temperature{true, half};
  }

  /**
   * @brief Build from degrees Celsius, rounding to the nearest half degree
   * @note Half-way values round away from zero. Non-finite input yields an
   *       absent value; use codec::encodeTemperatureC() to get an error instead.
   */
  static Temperature fromCelsius(float celsius);

  float celsius() const { return static_cast<float>(halfDegrees) / 2.0f; }

  bool operator==(const Temperature& other) const {
    return present == other.present && (!present || halfDegrees == other.halfDegrees);
  }
  bool operator!=(const Temperature& other) const { return !(*this == other); }
};

/**
 * @struct DateTime
 * @brief Minute-resolution calendar time as stored by the thermostat
 *
 * Year range is 2000-2255 (one byte offset from 2000).
 */
struct DateTime {
  bool present = false;  ///< false = unset (all-0xFF on the wire)
  uint16_t year = 0;     ///< Full year (2000-2255)
  uint8_t month = 0;     ///< Month (1-12)
  uint8_t day = 0;       ///< Day of month (1-31)
  uint8_t hour = 0;      ///< Hour (0-23)
  uint8_t minute = 0;    ///< Minute (0-59)

  static constexpr DateTime absent() { return DateTime{}; }

  static constexpr DateTime make(uint16_t y, uint8_t mo, uint8_t d, uint8_t h, uint8_t mi) {
    return DateTime{true, y, mo, d, h, mi};
  }

  bool operator==(const DateTime& other) const {
    if (present != other.present) return false;
    if (!present) return true;
    return year == other.year && month == other.month && day == other.day &&
           hour == other.hour && minute == other.minute;
  }
  bool operator!=(const DateTime& other) const { return !(*this == other); }
};

/**
 * @struct Period
 * @brief One heating period of a weekday schedule
 *
 * start < end is not required; the device accepts either order.
 */
struct Period {
  uint16_t startMinute = 0;  ///< Minutes since midnight (0-1439)
  uint16_t endMinute = 0;    ///< Minutes since midnight (0-1439)

  bool operator==(const Period& other) const {
    return startMinute == other.startMinute && endMinute == other.endMinute;
  }
  bool operator!=(const Period& other) const { return !(*this == other); }
};

/**
 * @struct DaySchedule
 * @brief Up to four periods for one weekday, kept in slot order
 */
struct DaySchedule {
  Period periods[cmd::PERIODS_PER_DAY];
  uint8_t count = 0;

  /// @brief Append a period. Returns false when all four slots are used.
  bool add(uint16_t startMinute, uint16_t endMinute) {
    if (count >= cmd::PERIODS_PER_DAY) {
      return false;
    }
    periods[count].startMinute = startMinute;
    periods[count].endMinute = endMinute;
    ++count;
    return true;
  }

  void clear() { count = 0; }

  bool operator==(const DaySchedule& other) const {
    if (count != other.count) return false;
    for (uint8_t i = 0; i < count && i < cmd::PERIODS_PER_DAY; ++i) {
      if (periods[i] != other.periods[i]) return false;
    }
    return true;
  }
  bool operator!=(const DaySchedule& other) const { return !(*this == other); }
};

/**
 * @struct Holiday
 * @brief Holiday (vacation) override: a date range with its own setpoint
 */
struct Holiday {
  uint8_t index = 1;          ///< Holiday slot (1-8); not part of the payload
  DateTime start;             ///< First hour of the holiday
  DateTime end;               ///< Last hour of the holiday
  Temperature temperature;    ///< Setpoint while the holiday is active

  /// @brief A holiday with neither start nor end is cleared.
  bool isCleared() const { return !start.present && !end.present; }
};

/**
 * @struct Setting
 * @brief Raw signed byte setting with the 0x80 "not set" sentinel
 */
struct Setting {
  bool present = false;
  int8_t value = 0;

  static constexpr Setting absent() { return Setting{}; }
  static constexpr Setting of(int8_t v) { return Setting{true, v}; }

  bool operator==(const Setting& other) const {
    return present == other.present && (!present || value == other.value);
  }
  bool operator!=(const Setting& other) const { return !(*this == other); }
};

/**
 * @struct Temperatures
 * @brief Temperature settings block
 *
 * On write, absent fields mean "leave unchanged". The current temperature is
 * measured by the device and never written.
 */
struct Temperatures {
  Temperature current;            ///< Measured room temperature (read-only)
  Temperature manual;             ///< Manual-mode setpoint
  Temperature targetLow;          ///< Eco setpoint
  Temperature targetHigh;         ///< Comfort setpoint
  Temperature offset;             ///< Sensor calibration offset
  Setting windowOpenDetection;    ///< Window-open detection sensitivity
  Setting windowOpenMinutes;      ///< Heating pause after window-open detection
};

/**
 * @struct Flags
 * @brief Status flags byte
 *
 * Bit meanings are undocumented; the byte is passed through unchanged.
 */
struct Flags {
  uint8_t raw = 0;
};

/**
 * @struct Battery
 * @brief Battery charge; absent when the device reports 0xFF
 */
struct Battery {
  bool present = false;
  uint8_t percent = 0;
};

/**
 * @struct LcdTimer
 * @brief LCD backlight timeout
 */
struct LcdTimer {
  uint8_t value = 0;
};

/**
 * @struct DeviceString
 * @brief Device information string with padding stripped
 */
struct DeviceString {
  char text[cmd::MAX_STRING_LEN + 1] = {0};
  size_t length = 0;
};

/**
 * @struct Snapshot
 * @brief Every restorable device setting
 *
 * has* flags mark which parts were captured; restore writes only those.
 * Date/time is deliberately excluded.
 */
struct Snapshot {
  bool hasTemperatures = false;
  Temperatures temperatures;

  bool hasLcdTimer = false;
  LcdTimer lcdTimer;

  bool hasFlags = false;
  Flags flags;

  bool hasDay[cmd::DAY_COUNT] = {false, false, false, false, false, false, false};
  DaySchedule days[cmd::DAY_COUNT];

  bool hasHoliday[cmd::HOLIDAY_COUNT] = {false, false, false, false,
                                         false, false, false, false};
  Holiday holidays[cmd::HOLIDAY_COUNT];
};

}  // namespace CometBlue
