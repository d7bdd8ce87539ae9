/**
 * @file Codec.h
 * @brief Encode/decode routines for Comet Blue characteristic payloads
 *
 * Pure functions: no state, no I/O, no allocation. Safe to call from any
 * number of threads.
 *
 * Decoders validate the whole buffer before touching the output. Encoders
 * validate every field before writing the first output byte, so a failed
 * encode never leaves a partial payload behind.
 *
 * @par Example
 * @code
 * uint8_t raw = 0;
 * CometBlue::Status st = CometBlue::codec::encodeTemperatureC(23.0f, raw);
 * // st.ok(), raw == 0x2E
 *
 * CometBlue::Temperature t;
 * st = CometBlue::codec::decodeTemperature(raw, t);
 * // t.present, t.halfDegrees == 46
 * @endcode
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "CommandTable.h"
#include "Status.h"
#include "Types.h"

namespace CometBlue {
namespace codec {

// ===== Primitives =====

/**
 * @brief Decode one temperature byte
 *
 * @param raw Wire byte (signed, value*2)
 * @param[out] out Decoded temperature; absent for 0x80
 * @return Always OK (every byte is a valid temperature or the sentinel)
 */
Status decodeTemperature(uint8_t raw, Temperature& out);

/**
 * @brief Encode one temperature byte
 *
 * @param value Temperature; absent encodes to 0x80
 * @param[out] out Wire byte
 * @return OUT_OF_RANGE if the half-degree count is outside -127..127
 */
Status encodeTemperature(const Temperature& value, uint8_t& out);

/**
 * @brief Encode a Celsius value, rounding to the nearest half degree
 * @return OUT_OF_RANGE for NaN, infinity or values beyond +-63.5 C
 */
Status encodeTemperatureC(float celsius, uint8_t& out);

/**
 * @brief Encode the numeric PIN as 4 little-endian bytes
 *
 * @param pin PIN value (0-4294967295)
 * @param[out] out 4-byte buffer
 * @return INVALID_PIN if pin is negative or wider than 32 bits
 */
Status encodePin(int64_t pin, uint8_t out[cmd::PIN_LEN]);

/// @brief Decode a signed setting byte (0x80 = absent)
Status decodeSetting(uint8_t raw, Setting& out);

/// @brief Encode a signed setting byte; a present -128 is rejected with OUT_OF_RANGE
Status encodeSetting(const Setting& value, uint8_t& out);

// ===== Date/Time =====

/**
 * @brief Decode a 5-byte date/time
 *
 * The all-0xFF pattern is recognized before any field is examined, so a
 * 0xFF year byte inside that pattern is never read as year 2255.
 *
 * @return MALFORMED_DATA on wrong length or any field out of range
 */
Status decodeDateTime(const uint8_t* data, size_t len, DateTime& out);

/**
 * @brief Encode a date/time into 5 bytes
 * @return OUT_OF_RANGE if year is outside 2000-2255 or any field is invalid
 */
Status encodeDateTime(const DateTime& value, uint8_t out[cmd::DATETIME_LEN]);

/// @brief Check date/time field ranges (ignores the present flag)
bool isValidDateTime(const DateTime& value);

/**
 * @brief Convert Unix seconds (UTC) to a device date/time
 * @return false if the timestamp falls before 2000-01-01
 */
bool unixToDateTime(uint32_t ts, DateTime& out);

// ===== Day Schedule =====

/**
 * @brief Decode a 16-byte day schedule
 *
 * Unset slots are skipped; used slots keep their relative order.
 *
 * @return MALFORMED_DATA on wrong length, hour > 23, minute > 59 or a
 *         partially unset slot
 */
Status decodeDay(const uint8_t* data, size_t len, DaySchedule& out);

/**
 * @brief Encode periods into a 16-byte day schedule
 *
 * Slot i receives period i; remaining slots are padded with 0xFF.
 *
 * @return TOO_MANY_PERIODS if count > 4, OUT_OF_RANGE if a minute is > 1439
 */
Status encodeDay(const Period* periods, size_t count, uint8_t out[cmd::DAY_LEN]);

Status encodeDay(const DaySchedule& day, uint8_t out[cmd::DAY_LEN]);

/**
 * @brief Parse a weekday name or number
 *
 * Accepts full names ("monday"), three-letter abbreviations ("mon") and
 * the digits 1-7, case-insensitive.
 *
 * @param[out] day 0 = Monday ... 6 = Sunday
 * @return false if the text is not a weekday
 */
bool parseWeekday(const char* text, uint8_t& day);

/// @brief Lowercase full weekday name for day 0-6, nullptr otherwise
const char* weekdayName(uint8_t day);

// ===== Holiday =====

/**
 * @brief Decode an 11-byte holiday
 *
 * A holiday with both dates unset is cleared; its temperature byte is
 * ignored and decoded as absent. out.index is left unchanged.
 */
Status decodeHoliday(const uint8_t* data, size_t len, Holiday& out);

/**
 * @brief Encode a holiday into 11 bytes
 * @note Clearing a holiday always writes the 0x80 temperature sentinel.
 */
Status encodeHoliday(const Holiday& value, uint8_t out[cmd::HOLIDAY_LEN]);

// ===== Scalars =====

Status decodeTemperatures(const uint8_t* data, size_t len, Temperatures& out);

/**
 * @brief Encode the temperature settings block
 * @note The current temperature is always written as 0x80 (leave unchanged).
 */
Status encodeTemperatures(const Temperatures& value, uint8_t out[cmd::TEMPERATURES_LEN]);

/// @brief Decode battery percent; 0xFF is absent, 101-254 is MALFORMED_DATA
Status decodeBattery(const uint8_t* data, size_t len, Battery& out);

Status decodeFlags(const uint8_t* data, size_t len, Flags& out);
Status encodeFlags(const Flags& value, uint8_t out[cmd::FLAGS_LEN]);

Status decodeLcdTimer(const uint8_t* data, size_t len, LcdTimer& out);
Status encodeLcdTimer(const LcdTimer& value, uint8_t out[cmd::LCD_TIMER_LEN]);

/**
 * @brief Decode a NUL or space padded ASCII string
 * @return MALFORMED_DATA if longer than 32 bytes or not printable ASCII
 */
Status decodeString(const uint8_t* data, size_t len, DeviceString& out);

}  // namespace codec
}  // namespace CometBlue
