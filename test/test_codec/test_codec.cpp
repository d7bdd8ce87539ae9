#include <stddef.h>
#include <stdint.h>
#include <cstring>
#include <math.h>
#include <unity.h>

#include "CometBlue/Codec.h"
#include "CometBlue/CommandTable.h"

using CometBlue::Err;
using CometBlue::Status;
namespace codec = CometBlue::codec;
namespace cmd = CometBlue::cmd;

inline void assertErr(Err expected, const Status& st) {
  TEST_ASSERT_EQUAL_UINT8(static_cast<uint8_t>(expected), static_cast<uint8_t>(st.code));
}

void setUp() {}
void tearDown() {}

// ===== Temperature =====

void test_temperature_23c_is_0x2e() {
  uint8_t raw = 0;
  Status st = codec::encodeTemperatureC(23.0f, raw);
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_EQUAL_HEX8(0x2E, raw);

  CometBlue::Temperature t;
  st = codec::decodeTemperature(0x2E, t);
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_TRUE(t.present);
  TEST_ASSERT_EQUAL_INT16(46, t.halfDegrees);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 23.0f, t.celsius());
}

void test_temperature_roundtrip_all_half_degrees() {
  for (int16_t half = cmd::TEMP_HALF_DEGREES_MIN; half <= cmd::TEMP_HALF_DEGREES_MAX; ++half) {
    const CometBlue::Temperature in = CometBlue::Temperature::fromHalfDegrees(half);
    uint8_t raw = 0;
    TEST_ASSERT_TRUE(codec::encodeTemperature(in, raw).ok());
    CometBlue::Temperature out;
    TEST_ASSERT_TRUE(codec::decodeTemperature(raw, out).ok());
    TEST_ASSERT_TRUE(out == in);
  }
}

void test_temperature_sentinel_is_absent_not_minus_64() {
  CometBlue::Temperature t = CometBlue::Temperature::fromHalfDegrees(10);
  TEST_ASSERT_TRUE(codec::decodeTemperature(0x80, t).ok());
  TEST_ASSERT_FALSE(t.present);

  uint8_t raw = 0;
  TEST_ASSERT_TRUE(codec::encodeTemperature(t, raw).ok());
  TEST_ASSERT_EQUAL_HEX8(0x80, raw);
}

void test_temperature_negative_values() {
  CometBlue::Temperature t;
  TEST_ASSERT_TRUE(codec::decodeTemperature(0xFF, t).ok());
  TEST_ASSERT_TRUE(t.present);
  TEST_ASSERT_FLOAT_WITHIN(0.001f, -0.5f, t.celsius());

  TEST_ASSERT_TRUE(codec::decodeTemperature(0x81, t).ok());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, -63.5f, t.celsius());
}

void test_temperature_out_of_range_is_rejected() {
  uint8_t raw = 0x11;
  Status st = codec::encodeTemperature(CometBlue::Temperature::fromHalfDegrees(128), raw);
  assertErr(Err::OUT_OF_RANGE, st);
  TEST_ASSERT_EQUAL_HEX8(0x11, raw);

  st = codec::encodeTemperature(CometBlue::Temperature::fromHalfDegrees(-128), raw);
  assertErr(Err::OUT_OF_RANGE, st);

  st = codec::encodeTemperatureC(64.0f, raw);
  assertErr(Err::OUT_OF_RANGE, st);

  st = codec::encodeTemperatureC(NAN, raw);
  assertErr(Err::OUT_OF_RANGE, st);

  st = codec::encodeTemperatureC(63.5f, raw);
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_EQUAL_HEX8(0x7F, raw);
}

void test_temperature_rounds_to_nearest_half_degree() {
  TEST_ASSERT_EQUAL_INT16(43, CometBlue::Temperature::fromCelsius(21.3f).halfDegrees);
  TEST_ASSERT_EQUAL_INT16(42, CometBlue::Temperature::fromCelsius(21.2f).halfDegrees);
  TEST_ASSERT_EQUAL_INT16(-5, CometBlue::Temperature::fromCelsius(-2.4f).halfDegrees);
  TEST_ASSERT_FALSE(CometBlue::Temperature::fromCelsius(INFINITY).present);
}

// ===== PIN =====

void test_pin_is_little_endian() {
  uint8_t out[cmd::PIN_LEN] = {0};
  TEST_ASSERT_TRUE(codec::encodePin(0x12345678, out).ok());
  const uint8_t expected[] = {0x78, 0x56, 0x34, 0x12};
  TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, out, 4);

  TEST_ASSERT_TRUE(codec::encodePin(0, out).ok());
  const uint8_t zero[] = {0, 0, 0, 0};
  TEST_ASSERT_EQUAL_HEX8_ARRAY(zero, out, 4);

  TEST_ASSERT_TRUE(codec::encodePin(4294967295LL, out).ok());
  const uint8_t max[] = {0xFF, 0xFF, 0xFF, 0xFF};
  TEST_ASSERT_EQUAL_HEX8_ARRAY(max, out, 4);
}

void test_pin_out_of_range_is_rejected() {
  uint8_t out[cmd::PIN_LEN] = {0};
  assertErr(Err::INVALID_PIN, codec::encodePin(-1, out));
  assertErr(Err::INVALID_PIN, codec::encodePin(4294967296LL, out));
}

// ===== Date/Time =====

void test_datetime_scenario_bytes() {
  const CometBlue::DateTime dt = CometBlue::DateTime::make(2014, 8, 27, 23, 56);
  uint8_t out[cmd::DATETIME_LEN] = {0};
  TEST_ASSERT_TRUE(codec::encodeDateTime(dt, out).ok());
  const uint8_t expected[] = {56, 23, 27, 8, 14};
  TEST_ASSERT_EQUAL_UINT8_ARRAY(expected, out, 5);

  CometBlue::DateTime back;
  TEST_ASSERT_TRUE(codec::decodeDateTime(out, sizeof(out), back).ok());
  TEST_ASSERT_TRUE(back == dt);
}

void test_datetime_unset_pattern() {
  const uint8_t unset[] = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
  CometBlue::DateTime dt = CometBlue::DateTime::make(2020, 1, 1, 0, 0);
  TEST_ASSERT_TRUE(codec::decodeDateTime(unset, sizeof(unset), dt).ok());
  TEST_ASSERT_FALSE(dt.present);

  uint8_t out[cmd::DATETIME_LEN] = {0};
  TEST_ASSERT_TRUE(codec::encodeDateTime(CometBlue::DateTime::absent(), out).ok());
  TEST_ASSERT_EQUAL_HEX8_ARRAY(unset, out, 5);
}

void test_datetime_year_bytes() {
  const uint8_t y2000[] = {0, 0, 1, 1, 0x00};
  CometBlue::DateTime dt;
  TEST_ASSERT_TRUE(codec::decodeDateTime(y2000, sizeof(y2000), dt).ok());
  TEST_ASSERT_TRUE(dt.present);
  TEST_ASSERT_EQUAL_UINT16(2000, dt.year);

  // 0xFF year alone is a real year, only the full pattern is unset
  const uint8_t y2255[] = {59, 23, 31, 12, 0xFF};
  TEST_ASSERT_TRUE(codec::decodeDateTime(y2255, sizeof(y2255), dt).ok());
  TEST_ASSERT_TRUE(dt.present);
  TEST_ASSERT_EQUAL_UINT16(2255, dt.year);

  uint8_t out[cmd::DATETIME_LEN] = {0};
  TEST_ASSERT_TRUE(codec::encodeDateTime(dt, out).ok());
  TEST_ASSERT_EQUAL_UINT8_ARRAY(y2255, out, 5);
}

void test_datetime_malformed_fields() {
  CometBlue::DateTime dt;
  const uint8_t badMinute[] = {60, 0, 1, 1, 20};
  assertErr(Err::MALFORMED_DATA, codec::decodeDateTime(badMinute, 5, dt));
  const uint8_t badHour[] = {0, 24, 1, 1, 20};
  assertErr(Err::MALFORMED_DATA, codec::decodeDateTime(badHour, 5, dt));
  const uint8_t badDay[] = {0, 0, 0, 1, 20};
  assertErr(Err::MALFORMED_DATA, codec::decodeDateTime(badDay, 5, dt));
  const uint8_t badMonth[] = {0, 0, 1, 13, 20};
  assertErr(Err::MALFORMED_DATA, codec::decodeDateTime(badMonth, 5, dt));
  const uint8_t nearlyUnset[] = {0xFF, 0xFF, 0xFF, 0xFF, 0x00};
  assertErr(Err::MALFORMED_DATA, codec::decodeDateTime(nearlyUnset, 5, dt));
  assertErr(Err::MALFORMED_DATA, codec::decodeDateTime(badMinute, 4, dt));
}

void test_datetime_encode_rejects_year() {
  uint8_t out[cmd::DATETIME_LEN] = {1, 2, 3, 4, 5};
  const uint8_t untouched[] = {1, 2, 3, 4, 5};
  assertErr(Err::OUT_OF_RANGE,
            codec::encodeDateTime(CometBlue::DateTime::make(1999, 12, 31, 23, 59), out));
  assertErr(Err::OUT_OF_RANGE,
            codec::encodeDateTime(CometBlue::DateTime::make(2256, 1, 1, 0, 0), out));
  assertErr(Err::OUT_OF_RANGE,
            codec::encodeDateTime(CometBlue::DateTime::make(2020, 2, 1, 0, 60), out));
  TEST_ASSERT_EQUAL_UINT8_ARRAY(untouched, out, 5);
}

void test_unix_to_datetime() {
  CometBlue::DateTime dt;
  TEST_ASSERT_TRUE(codec::unixToDateTime(946684800UL, dt));
  TEST_ASSERT_TRUE(dt == CometBlue::DateTime::make(2000, 1, 1, 0, 0));

  TEST_ASSERT_TRUE(codec::unixToDateTime(1582979696UL, dt));
  TEST_ASSERT_TRUE(dt == CometBlue::DateTime::make(2020, 2, 29, 12, 34));

  TEST_ASSERT_FALSE(codec::unixToDateTime(946684799UL, dt));
}

// ===== Day Schedule =====

void test_day_single_period_scenario() {
  const CometBlue::Period periods[] = {{0, 240}};
  uint8_t out[cmd::DAY_LEN] = {0};
  TEST_ASSERT_TRUE(codec::encodeDay(periods, 1, out).ok());

  const uint8_t expected[] = {0, 0, 4, 0,
                              0xFF, 0xFF, 0xFF, 0xFF,
                              0xFF, 0xFF, 0xFF, 0xFF,
                              0xFF, 0xFF, 0xFF, 0xFF};
  TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, out, 16);

  CometBlue::DaySchedule day;
  TEST_ASSERT_TRUE(codec::decodeDay(out, sizeof(out), day).ok());
  TEST_ASSERT_EQUAL_UINT8(1, day.count);
  TEST_ASSERT_EQUAL_UINT16(0, day.periods[0].startMinute);
  TEST_ASSERT_EQUAL_UINT16(240, day.periods[0].endMinute);
}

void test_day_roundtrip_preserves_count_and_order() {
  const CometBlue::Period periods[] = {
    {1320, 1380}, {360, 480}, {900, 600}, {720, 720}
  };
  for (size_t n = 0; n <= 4; ++n) {
    uint8_t out[cmd::DAY_LEN] = {0};
    TEST_ASSERT_TRUE(codec::encodeDay(periods, n, out).ok());
    CometBlue::DaySchedule day;
    TEST_ASSERT_TRUE(codec::decodeDay(out, sizeof(out), day).ok());
    TEST_ASSERT_EQUAL_UINT8(n, day.count);
    for (size_t i = 0; i < n; ++i) {
      TEST_ASSERT_TRUE(day.periods[i] == periods[i]);
    }
  }
}

void test_day_too_many_periods() {
  const CometBlue::Period periods[] = {{0, 10}, {20, 30}, {40, 50}, {60, 70}, {80, 90}};
  uint8_t out[cmd::DAY_LEN];
  std::memset(out, 0x5A, sizeof(out));
  assertErr(Err::TOO_MANY_PERIODS, codec::encodeDay(periods, 5, out));
  TEST_ASSERT_EACH_EQUAL_HEX8(0x5A, out, 16);

  CometBlue::DaySchedule day;
  day.count = 5;
  assertErr(Err::TOO_MANY_PERIODS, codec::encodeDay(day, out));

  TEST_ASSERT_TRUE(day.count == 5);
  day.clear();
  for (int i = 0; i < 4; ++i) {
    TEST_ASSERT_TRUE(day.add(static_cast<uint16_t>(i * 60), static_cast<uint16_t>(i * 60 + 30)));
  }
  TEST_ASSERT_FALSE(day.add(1000, 1100));
}

void test_day_minute_out_of_range() {
  const CometBlue::Period periods[] = {{0, 1440}};
  uint8_t out[cmd::DAY_LEN];
  assertErr(Err::OUT_OF_RANGE, codec::encodeDay(periods, 1, out));
}

void test_day_decode_skips_unset_slots() {
  const uint8_t raw[] = {0xFF, 0xFF, 0xFF, 0xFF,
                         6, 30, 8, 0,
                         0xFF, 0xFF, 0xFF, 0xFF,
                         17, 0, 22, 15};
  CometBlue::DaySchedule day;
  TEST_ASSERT_TRUE(codec::decodeDay(raw, sizeof(raw), day).ok());
  TEST_ASSERT_EQUAL_UINT8(2, day.count);
  TEST_ASSERT_EQUAL_UINT16(390, day.periods[0].startMinute);
  TEST_ASSERT_EQUAL_UINT16(480, day.periods[0].endMinute);
  TEST_ASSERT_EQUAL_UINT16(1020, day.periods[1].startMinute);
  TEST_ASSERT_EQUAL_UINT16(1335, day.periods[1].endMinute);
}

void test_day_decode_malformed() {
  CometBlue::DaySchedule day;
  uint8_t raw[cmd::DAY_LEN];
  std::memset(raw, 0xFF, sizeof(raw));
  raw[0] = 24;
  raw[1] = 0;
  raw[2] = 1;
  raw[3] = 0;
  assertErr(Err::MALFORMED_DATA, codec::decodeDay(raw, sizeof(raw), day));

  std::memset(raw, 0xFF, sizeof(raw));
  raw[4] = 6;  // half-written slot
  assertErr(Err::MALFORMED_DATA, codec::decodeDay(raw, sizeof(raw), day));

  assertErr(Err::MALFORMED_DATA, codec::decodeDay(raw, 8, day));
}

void test_parse_weekday() {
  uint8_t day = 0xFF;
  TEST_ASSERT_TRUE(codec::parseWeekday("monday", day));
  TEST_ASSERT_EQUAL_UINT8(0, day);
  TEST_ASSERT_TRUE(codec::parseWeekday("Sun", day));
  TEST_ASSERT_EQUAL_UINT8(6, day);
  TEST_ASSERT_TRUE(codec::parseWeekday("3", day));
  TEST_ASSERT_EQUAL_UINT8(2, day);
  TEST_ASSERT_FALSE(codec::parseWeekday("8", day));
  TEST_ASSERT_FALSE(codec::parseWeekday("mo", day));
  TEST_ASSERT_FALSE(codec::parseWeekday("", day));
  TEST_ASSERT_EQUAL_STRING("friday", codec::weekdayName(4));
  TEST_ASSERT_NULL(codec::weekdayName(7));
}

// ===== Holiday =====

void test_holiday_clear_forces_temperature_sentinel() {
  CometBlue::Holiday h;
  h.index = 3;
  h.temperature = CometBlue::Temperature::fromCelsius(18.0f);
  uint8_t out[cmd::HOLIDAY_LEN] = {0};
  TEST_ASSERT_TRUE(codec::encodeHoliday(h, out).ok());
  TEST_ASSERT_EACH_EQUAL_HEX8(0xFF, out, 10);
  TEST_ASSERT_EQUAL_HEX8(0x80, out[10]);
}

void test_holiday_cleared_ignores_temperature_byte() {
  uint8_t raw[cmd::HOLIDAY_LEN];
  std::memset(raw, 0xFF, sizeof(raw));
  raw[10] = 0x22;
  CometBlue::Holiday h;
  h.index = 5;
  TEST_ASSERT_TRUE(codec::decodeHoliday(raw, sizeof(raw), h).ok());
  TEST_ASSERT_TRUE(h.isCleared());
  TEST_ASSERT_FALSE(h.temperature.present);
  TEST_ASSERT_EQUAL_UINT8(5, h.index);
}

void test_holiday_roundtrip() {
  CometBlue::Holiday h;
  h.start = CometBlue::DateTime::make(2024, 12, 24, 10, 0);
  h.end = CometBlue::DateTime::make(2025, 1, 2, 18, 30);
  h.temperature = CometBlue::Temperature::fromCelsius(16.5f);

  uint8_t out[cmd::HOLIDAY_LEN] = {0};
  TEST_ASSERT_TRUE(codec::encodeHoliday(h, out).ok());
  const uint8_t expected[] = {0, 10, 24, 12, 24, 30, 18, 2, 1, 25, 33};
  TEST_ASSERT_EQUAL_UINT8_ARRAY(expected, out, 11);

  CometBlue::Holiday back;
  TEST_ASSERT_TRUE(codec::decodeHoliday(out, sizeof(out), back).ok());
  TEST_ASSERT_TRUE(back.start == h.start);
  TEST_ASSERT_TRUE(back.end == h.end);
  TEST_ASSERT_TRUE(back.temperature == h.temperature);
  TEST_ASSERT_FALSE(back.isCleared());
}

void test_holiday_errors() {
  CometBlue::Holiday h;
  uint8_t raw[cmd::HOLIDAY_LEN] = {0};
  assertErr(Err::MALFORMED_DATA, codec::decodeHoliday(raw, 10, h));

  h.start = CometBlue::DateTime::make(2024, 1, 1, 0, 0);
  h.end = CometBlue::DateTime::make(2024, 1, 2, 0, 0);
  h.temperature = CometBlue::Temperature::fromHalfDegrees(300);
  assertErr(Err::OUT_OF_RANGE, codec::encodeHoliday(h, raw));
}

// ===== Scalars =====

void test_temperatures_block() {
  const uint8_t raw[] = {41, 42, 34, 42, 0xFE, 4, 10};
  CometBlue::Temperatures t;
  TEST_ASSERT_TRUE(codec::decodeTemperatures(raw, sizeof(raw), t).ok());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 20.5f, t.current.celsius());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 21.0f, t.manual.celsius());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 17.0f, t.targetLow.celsius());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 21.0f, t.targetHigh.celsius());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, -1.0f, t.offset.celsius());
  TEST_ASSERT_EQUAL_INT8(4, t.windowOpenDetection.value);
  TEST_ASSERT_EQUAL_INT8(10, t.windowOpenMinutes.value);

  uint8_t out[cmd::TEMPERATURES_LEN] = {0};
  TEST_ASSERT_TRUE(codec::encodeTemperatures(t, out).ok());
  const uint8_t expected[] = {0x80, 42, 34, 42, 0xFE, 4, 10};
  TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, out, 7);

  CometBlue::Temperatures partial;
  partial.targetHigh = CometBlue::Temperature::fromCelsius(22.0f);
  TEST_ASSERT_TRUE(codec::encodeTemperatures(partial, out).ok());
  const uint8_t partialExpected[] = {0x80, 0x80, 0x80, 44, 0x80, 0x80, 0x80};
  TEST_ASSERT_EQUAL_HEX8_ARRAY(partialExpected, out, 7);

  assertErr(Err::MALFORMED_DATA, codec::decodeTemperatures(raw, 6, t));
}

void test_battery() {
  CometBlue::Battery b;
  const uint8_t pct[] = {85};
  TEST_ASSERT_TRUE(codec::decodeBattery(pct, 1, b).ok());
  TEST_ASSERT_TRUE(b.present);
  TEST_ASSERT_EQUAL_UINT8(85, b.percent);

  const uint8_t unknown[] = {0xFF};
  TEST_ASSERT_TRUE(codec::decodeBattery(unknown, 1, b).ok());
  TEST_ASSERT_FALSE(b.present);

  const uint8_t bad[] = {101, 0};
  assertErr(Err::MALFORMED_DATA, codec::decodeBattery(bad, 1, b));
  assertErr(Err::MALFORMED_DATA, codec::decodeBattery(bad, 2, b));
}

void test_flags_and_lcd_timer_pass_through() {
  const uint8_t raw[] = {0xA5};
  CometBlue::Flags f;
  TEST_ASSERT_TRUE(codec::decodeFlags(raw, 1, f).ok());
  TEST_ASSERT_EQUAL_HEX8(0xA5, f.raw);
  uint8_t out[1] = {0};
  TEST_ASSERT_TRUE(codec::encodeFlags(f, out).ok());
  TEST_ASSERT_EQUAL_HEX8(0xA5, out[0]);

  CometBlue::LcdTimer lcd;
  TEST_ASSERT_TRUE(codec::decodeLcdTimer(raw, 1, lcd).ok());
  TEST_ASSERT_EQUAL_UINT8(0xA5, lcd.value);
  lcd.value = 30;
  TEST_ASSERT_TRUE(codec::encodeLcdTimer(lcd, out).ok());
  TEST_ASSERT_EQUAL_UINT8(30, out[0]);

  assertErr(Err::MALFORMED_DATA, codec::decodeFlags(raw, 0, f));
  assertErr(Err::MALFORMED_DATA, codec::decodeLcdTimer(raw, 3, lcd));
}

void test_strings() {
  const uint8_t padded[] = {'C', 'o', 'm', 'e', 't', ' ', 'B', 'l', 'u', 'e', ' ', 0, 0};
  CometBlue::DeviceString s;
  TEST_ASSERT_TRUE(codec::decodeString(padded, sizeof(padded), s).ok());
  TEST_ASSERT_EQUAL_STRING("Comet Blue", s.text);
  TEST_ASSERT_EQUAL_UINT32(10, static_cast<uint32_t>(s.length));

  const uint8_t binary[] = {'A', 0x01, 'B'};
  assertErr(Err::MALFORMED_DATA, codec::decodeString(binary, sizeof(binary), s));

  uint8_t tooLong[cmd::MAX_STRING_LEN + 1];
  std::memset(tooLong, 'x', sizeof(tooLong));
  assertErr(Err::MALFORMED_DATA, codec::decodeString(tooLong, sizeof(tooLong), s));

  TEST_ASSERT_TRUE(codec::decodeString(padded, 0, s).ok());
  TEST_ASSERT_EQUAL_STRING("", s.text);
}

void test_setting_sentinel() {
  CometBlue::Setting s;
  TEST_ASSERT_TRUE(codec::decodeSetting(0x80, s).ok());
  TEST_ASSERT_FALSE(s.present);
  uint8_t raw = 0;
  TEST_ASSERT_TRUE(codec::encodeSetting(s, raw).ok());
  TEST_ASSERT_EQUAL_HEX8(0x80, raw);
  assertErr(Err::OUT_OF_RANGE, codec::encodeSetting(CometBlue::Setting::of(-128), raw));
}

int main(int, char**) {
  UNITY_BEGIN();
  RUN_TEST(test_temperature_23c_is_0x2e);
  RUN_TEST(test_temperature_roundtrip_all_half_degrees);
  RUN_TEST(test_temperature_sentinel_is_absent_not_minus_64);
  RUN_TEST(test_temperature_negative_values);
  RUN_TEST(test_temperature_out_of_range_is_rejected);
  RUN_TEST(test_temperature_rounds_to_nearest_half_degree);
  RUN_TEST(test_pin_is_little_endian);
  RUN_TEST(test_pin_out_of_range_is_rejected);
  RUN_TEST(test_datetime_scenario_bytes);
  RUN_TEST(test_datetime_unset_pattern);
  RUN_TEST(test_datetime_year_bytes);
  RUN_TEST(test_datetime_malformed_fields);
  RUN_TEST(test_datetime_encode_rejects_year);
  RUN_TEST(test_unix_to_datetime);
  RUN_TEST(test_day_single_period_scenario);
  RUN_TEST(test_day_roundtrip_preserves_count_and_order);
  RUN_TEST(test_day_too_many_periods);
  RUN_TEST(test_day_minute_out_of_range);
  RUN_TEST(test_day_decode_skips_unset_slots);
  RUN_TEST(test_day_decode_malformed);
  RUN_TEST(test_parse_weekday);
  RUN_TEST(test_holiday_clear_forces_temperature_sentinel);
  RUN_TEST(test_holiday_cleared_ignores_temperature_byte);
  RUN_TEST(test_holiday_roundtrip);
  RUN_TEST(test_holiday_errors);
  RUN_TEST(test_temperatures_block);
  RUN_TEST(test_battery);
  RUN_TEST(test_flags_and_lcd_timer_pass_through);
  RUN_TEST(test_strings);
  RUN_TEST(test_setting_sentinel);
  return UNITY_END();
}
