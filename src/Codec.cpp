/**
 * @file Codec.cpp
 * @brief Implementation of Comet Blue characteristic codecs
 */

#include "CometBlue/Codec.h"

#include <cctype>
#include <cmath>
#include <cstring>

namespace CometBlue {

namespace {
constexpr uint32_t kEpoch2000 = 946684800UL;  // 2000-01-01 00:00:00 UTC

const char* const kWeekdayNames[cmd::DAY_COUNT] = {
  "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday"
};

bool isLeapYear(uint16_t year) {
  return (year % 4 == 0) && ((year % 100 != 0) || (year % 400 == 0));
}

uint8_t daysInMonth(uint16_t year, uint8_t month) {
  static constexpr uint8_t kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && isLeapYear(year)) {
    return 29;
  }
  if (month == 0 || month > 12) {
    return 0;
  }
  return kDays[month - 1];
}

bool isAllUnset(const uint8_t* data, size_t len) {
  for (size_t i = 0; i < len; ++i) {
    if (data[i] != cmd::BYTE_UNSET) {
      return false;
    }
  }
  return true;
}

bool equalsIgnoreCase(const char* a, const char* b) {
  while (*a && *b) {
    if (std::tolower(static_cast<unsigned char>(*a)) !=
        std::tolower(static_cast<unsigned char>(*b))) {
      return false;
    }
    ++a;
    ++b;
  }
  return *a == *b;
}
}  // namespace

Temperature Temperature::fromCelsius(float celsius) {
  if (!std::isfinite(celsius)) {
    return Temperature::absent();
  }
  float half = std::round(celsius * 2.0f);
  if (half > 32767.0f) half = 32767.0f;
  if (half < -32768.0f) half = -32768.0f;
  return Temperature::fromHalfDegrees(static_cast<int16_t>(half));
}

namespace codec {

// ===== Primitives =====

Status decodeTemperature(uint8_t raw, Temperature& out) {
  if (raw == cmd::TEMP_UNSET) {
    out = Temperature::absent();
    return Status::Ok();
  }
  out = Temperature::fromHalfDegrees(static_cast<int8_t>(raw));
  return Status::Ok();
}

Status encodeTemperature(const Temperature& value, uint8_t& out) {
  if (!value.present) {
    out = cmd::TEMP_UNSET;
    return Status::Ok();
  }
  // -128 is the sentinel, so the usable span is symmetric
  if (value.halfDegrees < cmd::TEMP_HALF_DEGREES_MIN ||
      value.halfDegrees > cmd::TEMP_HALF_DEGREES_MAX) {
    return Status::Error(Err::OUT_OF_RANGE, "Temperature not representable",
                         value.halfDegrees);
  }
  out = static_cast<uint8_t>(static_cast<int8_t>(value.halfDegrees));
  return Status::Ok();
}

Status encodeTemperatureC(float celsius, uint8_t& out) {
  if (!std::isfinite(celsius)) {
    return Status::Error(Err::OUT_OF_RANGE, "Temperature is not a finite number");
  }
  return encodeTemperature(Temperature::fromCelsius(celsius), out);
}

Status encodePin(int64_t pin, uint8_t out[cmd::PIN_LEN]) {
  if (out == nullptr) {
    return Status::Error(Err::INVALID_PARAM, "PIN output buffer is null");
  }
  if (pin < 0 || pin > static_cast<int64_t>(UINT32_MAX)) {
    return Status::Error(Err::INVALID_PIN, "PIN must fit in 32 bits unsigned");
  }
  const uint32_t v = static_cast<uint32_t>(pin);
  out[0] = static_cast<uint8_t>(v & 0xFFu);
  out[1] = static_cast<uint8_t>((v >> 8) & 0xFFu);
  out[2] = static_cast<uint8_t>((v >> 16) & 0xFFu);
  out[3] = static_cast<uint8_t>((v >> 24) & 0xFFu);
  return Status::Ok();
}

Status decodeSetting(uint8_t raw, Setting& out) {
  if (raw == cmd::TEMP_UNSET) {
    out = Setting::absent();
  } else {
    out = Setting::of(static_cast<int8_t>(raw));
  }
  return Status::Ok();
}

Status encodeSetting(const Setting& value, uint8_t& out) {
  if (!value.present) {
    out = cmd::TEMP_UNSET;
    return Status::Ok();
  }
  if (static_cast<uint8_t>(value.value) == cmd::TEMP_UNSET) {
    return Status::Error(Err::OUT_OF_RANGE, "Setting value collides with sentinel", value.value);
  }
  out = static_cast<uint8_t>(value.value);
  return Status::Ok();
}

// ===== Date/Time =====

bool isValidDateTime(const DateTime& value) {
  if (value.year < cmd::YEAR_BASE || value.year > cmd::YEAR_MAX) {
    return false;
  }
  if (value.month < 1 || value.month > 12) {
    return false;
  }
  if (value.day < 1 || value.day > 31) {
    return false;
  }
  if (value.hour > 23 || value.minute > 59) {
    return false;
  }
  return true;
}

Status decodeDateTime(const uint8_t* data, size_t len, DateTime& out) {
  if (data == nullptr || len != cmd::DATETIME_LEN) {
    return Status::Error(Err::MALFORMED_DATA, "Date/time must be 5 bytes",
                         static_cast<int32_t>(len));
  }
  // Must be checked first: 0xFF is also a legal year byte (2255)
  if (isAllUnset(data, len)) {
    out = DateTime::absent();
    return Status::Ok();
  }

  DateTime dt = DateTime::make(static_cast<uint16_t>(cmd::YEAR_BASE + data[4]),
                               data[3], data[2], data[1], data[0]);
  if (!isValidDateTime(dt)) {
    return Status::Error(Err::MALFORMED_DATA, "Date/time field out of range");
  }
  out = dt;
  return Status::Ok();
}

Status encodeDateTime(const DateTime& value, uint8_t out[cmd::DATETIME_LEN]) {
  if (out == nullptr) {
    return Status::Error(Err::INVALID_PARAM, "Date/time output buffer is null");
  }
  if (!value.present) {
    std::memset(out, cmd::BYTE_UNSET, cmd::DATETIME_LEN);
    return Status::Ok();
  }
  if (value.year < cmd::YEAR_BASE || value.year > cmd::YEAR_MAX) {
    return Status::Error(Err::OUT_OF_RANGE, "Year must be 2000-2255", value.year);
  }
  if (!isValidDateTime(value)) {
    return Status::Error(Err::OUT_OF_RANGE, "Invalid date/time values");
  }

  out[0] = value.minute;
  out[1] = value.hour;
  out[2] = value.day;
  out[3] = value.month;
  out[4] = static_cast<uint8_t>(value.year - cmd::YEAR_BASE);
  return Status::Ok();
}

bool unixToDateTime(uint32_t ts, DateTime& out) {
  if (ts < kEpoch2000) {
    return false;
  }

  uint32_t days = (ts - kEpoch2000) / 86400UL;
  uint32_t rem = ts % 86400UL;

  uint16_t year = cmd::YEAR_BASE;
  for (; year <= cmd::YEAR_MAX; ++year) {
    uint16_t daysInYear = isLeapYear(year) ? 366 : 365;
    if (days < daysInYear) {
      break;
    }
    days -= daysInYear;
  }
  if (year > cmd::YEAR_MAX) {
    return false;
  }

  uint8_t month = 1;
  for (; month <= 12; ++month) {
    uint8_t dim = daysInMonth(year, month);
    if (days < dim) {
      break;
    }
    days -= dim;
  }
  if (month > 12) {
    return false;
  }

  out.present = true;
  out.year = year;
  out.month = month;
  out.day = static_cast<uint8_t>(days + 1);
  out.hour = static_cast<uint8_t>(rem / 3600UL);
  rem %= 3600UL;
  out.minute = static_cast<uint8_t>(rem / 60UL);
  return true;
}

// ===== Day Schedule =====

Status decodeDay(const uint8_t* data, size_t len, DaySchedule& out) {
  if (data == nullptr || len != cmd::DAY_LEN) {
    return Status::Error(Err::MALFORMED_DATA, "Day schedule must be 16 bytes",
                         static_cast<int32_t>(len));
  }

  DaySchedule day;
  for (size_t slot = 0; slot < cmd::PERIODS_PER_DAY; ++slot) {
    const uint8_t* p = data + slot * cmd::PERIOD_LEN;
    if (isAllUnset(p, cmd::PERIOD_LEN)) {
      continue;
    }
    const uint8_t startH = p[0];
    const uint8_t startM = p[1];
    const uint8_t endH = p[2];
    const uint8_t endM = p[3];
    if (startH > 23 || startM > 59 || endH > 23 || endM > 59) {
      return Status::Error(Err::MALFORMED_DATA, "Period time out of range",
                           static_cast<int32_t>(slot));
    }
    day.add(static_cast<uint16_t>(startH * 60u + startM),
            static_cast<uint16_t>(endH * 60u + endM));
  }
  out = day;
  return Status::Ok();
}

Status encodeDay(const Period* periods, size_t count, uint8_t out[cmd::DAY_LEN]) {
  if (out == nullptr || (periods == nullptr && count > 0)) {
    return Status::Error(Err::INVALID_PARAM, "Day schedule buffer is null");
  }
  if (count > cmd::PERIODS_PER_DAY) {
    return Status::Error(Err::TOO_MANY_PERIODS, "At most 4 periods per day",
                         static_cast<int32_t>(count));
  }
  for (size_t i = 0; i < count; ++i) {
    if (periods[i].startMinute >= cmd::MINUTES_PER_DAY ||
        periods[i].endMinute >= cmd::MINUTES_PER_DAY) {
      return Status::Error(Err::OUT_OF_RANGE, "Period minute must be 0-1439",
                           static_cast<int32_t>(i));
    }
  }

  std::memset(out, cmd::BYTE_UNSET, cmd::DAY_LEN);
  for (size_t i = 0; i < count; ++i) {
    uint8_t* p = out + i * cmd::PERIOD_LEN;
    p[0] = static_cast<uint8_t>(periods[i].startMinute / 60u);
    p[1] = static_cast<uint8_t>(periods[i].startMinute % 60u);
    p[2] = static_cast<uint8_t>(periods[i].endMinute / 60u);
    p[3] = static_cast<uint8_t>(periods[i].endMinute % 60u);
  }
  return Status::Ok();
}

Status encodeDay(const DaySchedule& day, uint8_t out[cmd::DAY_LEN]) {
  return encodeDay(day.periods, day.count, out);
}

bool parseWeekday(const char* text, uint8_t& day) {
  if (text == nullptr || text[0] == '\0') {
    return false;
  }
  if (text[0] >= '1' && text[0] <= '7' && text[1] == '\0') {
    day = static_cast<uint8_t>(text[0] - '1');
    return true;
  }
  for (uint8_t i = 0; i < cmd::DAY_COUNT; ++i) {
    char abbrev[4] = {kWeekdayNames[i][0], kWeekdayNames[i][1], kWeekdayNames[i][2], '\0'};
    if (equalsIgnoreCase(text, kWeekdayNames[i]) || equalsIgnoreCase(text, abbrev)) {
      day = i;
      return true;
    }
  }
  return false;
}

const char* weekdayName(uint8_t day) {
  if (day >= cmd::DAY_COUNT) {
    return nullptr;
  }
  return kWeekdayNames[day];
}

// ===== Holiday =====

Status decodeHoliday(const uint8_t* data, size_t len, Holiday& out) {
  if (data == nullptr || len != cmd::HOLIDAY_LEN) {
    return Status::Error(Err::MALFORMED_DATA, "Holiday must be 11 bytes",
                         static_cast<int32_t>(len));
  }

  DateTime start;
  DateTime end;
  Status st = decodeDateTime(data, cmd::DATETIME_LEN, start);
  if (!st.ok()) return st;
  st = decodeDateTime(data + cmd::DATETIME_LEN, cmd::DATETIME_LEN, end);
  if (!st.ok()) return st;

  Temperature temp;
  if (start.present || end.present) {
    st = decodeTemperature(data[cmd::DATETIME_LEN * 2], temp);
    if (!st.ok()) return st;
  }

  out.start = start;
  out.end = end;
  out.temperature = temp;
  return Status::Ok();
}

Status encodeHoliday(const Holiday& value, uint8_t out[cmd::HOLIDAY_LEN]) {
  if (out == nullptr) {
    return Status::Error(Err::INVALID_PARAM, "Holiday output buffer is null");
  }

  uint8_t buf[cmd::HOLIDAY_LEN];
  Status st = encodeDateTime(value.start, buf);
  if (!st.ok()) return st;
  st = encodeDateTime(value.end, buf + cmd::DATETIME_LEN);
  if (!st.ok()) return st;

  if (value.isCleared()) {
    buf[cmd::DATETIME_LEN * 2] = cmd::TEMP_UNSET;
  } else {
    st = encodeTemperature(value.temperature, buf[cmd::DATETIME_LEN * 2]);
    if (!st.ok()) return st;
  }

  std::memcpy(out, buf, sizeof(buf));
  return Status::Ok();
}

// ===== Scalars =====

Status decodeTemperatures(const uint8_t* data, size_t len, Temperatures& out) {
  if (data == nullptr || len != cmd::TEMPERATURES_LEN) {
    return Status::Error(Err::MALFORMED_DATA, "Temperatures must be 7 bytes",
                         static_cast<int32_t>(len));
  }
  Temperatures t;
  Temperature* const temps[] = {&t.current, &t.manual, &t.targetLow, &t.targetHigh, &t.offset};
  for (size_t i = 0; i < sizeof(temps) / sizeof(temps[0]); ++i) {
    Status st = decodeTemperature(data[cmd::TEMPS_CURRENT + i], *temps[i]);
    if (!st.ok()) return st;
  }
  Status st = decodeSetting(data[cmd::TEMPS_WINDOW_DETECT], t.windowOpenDetection);
  if (!st.ok()) return st;
  st = decodeSetting(data[cmd::TEMPS_WINDOW_MINUTES], t.windowOpenMinutes);
  if (!st.ok()) return st;
  out = t;
  return Status::Ok();
}

Status encodeTemperatures(const Temperatures& value, uint8_t out[cmd::TEMPERATURES_LEN]) {
  if (out == nullptr) {
    return Status::Error(Err::INVALID_PARAM, "Temperatures output buffer is null");
  }

  uint8_t buf[cmd::TEMPERATURES_LEN];
  buf[cmd::TEMPS_CURRENT] = cmd::TEMP_UNSET;
  Status st = encodeTemperature(value.manual, buf[cmd::TEMPS_MANUAL]);
  if (!st.ok()) return st;
  st = encodeTemperature(value.targetLow, buf[cmd::TEMPS_TARGET_LOW]);
  if (!st.ok()) return st;
  st = encodeTemperature(value.targetHigh, buf[cmd::TEMPS_TARGET_HIGH]);
  if (!st.ok()) return st;
  st = encodeTemperature(value.offset, buf[cmd::TEMPS_OFFSET]);
  if (!st.ok()) return st;
  st = encodeSetting(value.windowOpenDetection, buf[cmd::TEMPS_WINDOW_DETECT]);
  if (!st.ok()) return st;
  st = encodeSetting(value.windowOpenMinutes, buf[cmd::TEMPS_WINDOW_MINUTES]);
  if (!st.ok()) return st;

  std::memcpy(out, buf, sizeof(buf));
  return Status::Ok();
}

Status decodeBattery(const uint8_t* data, size_t len, Battery& out) {
  if (data == nullptr || len != cmd::BATTERY_LEN) {
    return Status::Error(Err::MALFORMED_DATA, "Battery must be 1 byte",
                         static_cast<int32_t>(len));
  }
  if (data[0] == cmd::BYTE_UNSET) {
    out.present = false;
    out.percent = 0;
    return Status::Ok();
  }
  if (data[0] > cmd::BATTERY_MAX_PERCENT) {
    return Status::Error(Err::MALFORMED_DATA, "Battery percent out of range", data[0]);
  }
  out.present = true;
  out.percent = data[0];
  return Status::Ok();
}

Status decodeFlags(const uint8_t* data, size_t len, Flags& out) {
  if (data == nullptr || len != cmd::FLAGS_LEN) {
    return Status::Error(Err::MALFORMED_DATA, "Flags must be 1 byte",
                         static_cast<int32_t>(len));
  }
  out.raw = data[0];
  return Status::Ok();
}

Status encodeFlags(const Flags& value, uint8_t out[cmd::FLAGS_LEN]) {
  if (out == nullptr) {
    return Status::Error(Err::INVALID_PARAM, "Flags output buffer is null");
  }
  out[0] = value.raw;
  return Status::Ok();
}

Status decodeLcdTimer(const uint8_t* data, size_t len, LcdTimer& out) {
  if (data == nullptr || len != cmd::LCD_TIMER_LEN) {
    return Status::Error(Err::MALFORMED_DATA, "LCD timer must be 1 byte",
                         static_cast<int32_t>(len));
  }
  out.value = data[0];
  return Status::Ok();
}

Status encodeLcdTimer(const LcdTimer& value, uint8_t out[cmd::LCD_TIMER_LEN]) {
  if (out == nullptr) {
    return Status::Error(Err::INVALID_PARAM, "LCD timer output buffer is null");
  }
  out[0] = value.value;
  return Status::Ok();
}

Status decodeString(const uint8_t* data, size_t len, DeviceString& out) {
  if (data == nullptr && len > 0) {
    return Status::Error(Err::MALFORMED_DATA, "String buffer is null");
  }
  if (len > cmd::MAX_STRING_LEN) {
    return Status::Error(Err::MALFORMED_DATA, "String too long", static_cast<int32_t>(len));
  }

  size_t end = len;
  while (end > 0 && (data[end - 1] == '\0' || data[end - 1] == ' ')) {
    --end;
  }
  for (size_t i = 0; i < end; ++i) {
    if (data[i] < 0x20 || data[i] > 0x7E) {
      return Status::Error(Err::MALFORMED_DATA, "String is not printable ASCII",
                           static_cast<int32_t>(i));
    }
  }

  if (end > 0) {
    std::memcpy(out.text, data, end);
  }
  out.text[end] = '\0';
  out.length = end;
  return Status::Ok();
}

}  // namespace codec
}  // namespace CometBlue
