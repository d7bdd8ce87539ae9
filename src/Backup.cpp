/**
 * @file Backup.cpp
 * @brief JSON backup mapping built on ArduinoJson
 */

#include "CometBlue/Backup.h"

#include <ArduinoJson.h>

#include <cstdio>
#include <cstring>

#include "CometBlue/Codec.h"
#include "CometBlue/CommandTable.h"

namespace CometBlue {
namespace backup {

namespace {
const char* const kDayKeys[cmd::DAY_COUNT] = {
  "day_monday", "day_tuesday", "day_wednesday", "day_thursday",
  "day_friday", "day_saturday", "day_sunday"
};

const char* const kHolidayKeys[cmd::HOLIDAY_COUNT] = {
  "holiday_1", "holiday_2", "holiday_3", "holiday_4",
  "holiday_5", "holiday_6", "holiday_7", "holiday_8"
};

constexpr const char* kDayPrefix = "day_";
constexpr const char* kHolidayPrefix = "holiday_";

Status badValue(const char* msg) {
  return Status::Error(Err::INVALID_BACKUP, msg);
}

// ----- Writers -----

void putTemperature(JsonObject obj, const char* key, const Temperature& t) {
  if (t.present) {
    obj[key] = t.celsius();
  } else {
    obj[key] = nullptr;
  }
}

void putSetting(JsonObject obj, const char* key, const Setting& s) {
  if (s.present) {
    obj[key] = s.value;
  } else {
    obj[key] = nullptr;
  }
}

void putDateTime(JsonObject obj, const char* key, const DateTime& dt) {
  if (!dt.present) {
    obj[key] = nullptr;
    return;
  }
  char text[24];
  std::snprintf(text, sizeof(text), "%04u-%02u-%02u %02u:%02u",
                static_cast<unsigned>(dt.year), static_cast<unsigned>(dt.month),
                static_cast<unsigned>(dt.day), static_cast<unsigned>(dt.hour),
                static_cast<unsigned>(dt.minute));
  obj[key] = text;
}

void putMinute(JsonObject obj, const char* key, uint16_t minute) {
  char text[8];
  std::snprintf(text, sizeof(text), "%02u:%02u", static_cast<unsigned>(minute / 60u),
                static_cast<unsigned>(minute % 60u));
  obj[key] = text;
}

// ----- Readers -----

Status readTemperature(JsonVariantConst v, Temperature& out) {
  if (v.isNull()) {
    out = Temperature::absent();
    return Status::Ok();
  }
  if (!v.is<float>()) {
    return badValue("Temperature must be a number or null");
  }
  out = Temperature::fromCelsius(v.as<float>());
  if (!out.present) {
    return badValue("Temperature is not finite");
  }
  return Status::Ok();
}

Status readSetting(JsonVariantConst v, Setting& out) {
  if (v.isNull()) {
    out = Setting::absent();
    return Status::Ok();
  }
  if (!v.is<int8_t>()) {
    return badValue("Setting must be an integer -128..127 or null");
  }
  out = Setting::of(v.as<int8_t>());
  return Status::Ok();
}

Status readByte(JsonVariantConst v, uint8_t& out) {
  if (!v.is<uint8_t>()) {
    return badValue("Value must be an integer 0..255");
  }
  out = v.as<uint8_t>();
  return Status::Ok();
}

Status readMinute(JsonVariantConst v, uint16_t& out) {
  const char* text = v.as<const char*>();
  if (text == nullptr) {
    return badValue("Period time must be a \"HH:MM\" string");
  }
  unsigned h = 0;
  unsigned m = 0;
  char tail = '\0';
  if (std::sscanf(text, "%2u:%2u%c", &h, &m, &tail) != 2 || h > 23 || m > 59) {
    return badValue("Period time must be HH:MM");
  }
  out = static_cast<uint16_t>(h * 60u + m);
  return Status::Ok();
}

Status readDateTime(JsonVariantConst v, DateTime& out) {
  if (v.isNull()) {
    out = DateTime::absent();
    return Status::Ok();
  }
  const char* text = v.as<const char*>();
  if (text == nullptr) {
    return badValue("Date/time must be a string or null");
  }
  unsigned y = 0, mo = 0, d = 0, h = 0, mi = 0;
  char tail = '\0';
  if (std::sscanf(text, "%4u-%2u-%2u%*1[ T]%2u:%2u%c", &y, &mo, &d, &h, &mi, &tail) != 5) {
    return badValue("Date/time must be YYYY-MM-DD HH:MM");
  }
  if (y > cmd::YEAR_MAX || mo > 12 || d > 31 || h > 23 || mi > 59) {
    return badValue("Date/time field out of range");
  }
  DateTime dt = DateTime::make(static_cast<uint16_t>(y), static_cast<uint8_t>(mo),
                               static_cast<uint8_t>(d), static_cast<uint8_t>(h),
                               static_cast<uint8_t>(mi));
  if (!codec::isValidDateTime(dt)) {
    return badValue("Date/time field out of range");
  }
  out = dt;
  return Status::Ok();
}

Status readTemperatures(JsonVariantConst v, Temperatures& out) {
  JsonObjectConst obj = v.as<JsonObjectConst>();
  if (obj.isNull()) {
    return badValue("\"temperatures\" must be an object");
  }
  Temperatures t;
  Status st = readTemperature(obj["manual"], t.manual);
  if (!st.ok()) return st;
  st = readTemperature(obj["target_low"], t.targetLow);
  if (!st.ok()) return st;
  st = readTemperature(obj["target_high"], t.targetHigh);
  if (!st.ok()) return st;
  st = readTemperature(obj["offset"], t.offset);
  if (!st.ok()) return st;
  st = readSetting(obj["window_open_detection"], t.windowOpenDetection);
  if (!st.ok()) return st;
  st = readSetting(obj["window_open_minutes"], t.windowOpenMinutes);
  if (!st.ok()) return st;
  out = t;
  return Status::Ok();
}

Status readDay(JsonVariantConst v, DaySchedule& out) {
  JsonArrayConst arr = v.as<JsonArrayConst>();
  if (arr.isNull()) {
    return badValue("Day schedule must be an array");
  }
  if (arr.size() > cmd::PERIODS_PER_DAY) {
    return Status::Error(Err::TOO_MANY_PERIODS, "At most 4 periods per day",
                         static_cast<int32_t>(arr.size()));
  }
  DaySchedule day;
  for (JsonVariantConst item : arr) {
    JsonObjectConst p = item.as<JsonObjectConst>();
    if (p.isNull()) {
      return badValue("Period must be an object");
    }
    uint16_t start = 0;
    uint16_t end = 0;
    Status st = readMinute(p["start"], start);
    if (!st.ok()) return st;
    st = readMinute(p["end"], end);
    if (!st.ok()) return st;
    if (!day.add(start, end)) {
      return Status::Error(Err::TOO_MANY_PERIODS, "At most 4 periods per day");
    }
  }
  out = day;
  return Status::Ok();
}

Status readHoliday(JsonVariantConst v, uint8_t index, Holiday& out) {
  JsonObjectConst obj = v.as<JsonObjectConst>();
  if (obj.isNull()) {
    return badValue("Holiday must be an object");
  }
  Holiday h;
  h.index = index;
  Status st = readDateTime(obj["start"], h.start);
  if (!st.ok()) return st;
  st = readDateTime(obj["end"], h.end);
  if (!st.ok()) return st;
  st = readTemperature(obj["temperature"], h.temperature);
  if (!st.ok()) return st;
  out = h;
  return Status::Ok();
}

bool startsWith(const char* text, const char* prefix) {
  return std::strncmp(text, prefix, std::strlen(prefix)) == 0;
}
}  // namespace

Status toJson(const Snapshot& snapshot, char* out, size_t cap, size_t& written) {
  if (out == nullptr || cap == 0) {
    return Status::Error(Err::INVALID_PARAM, "Output buffer is null");
  }

  JsonDocument doc;
  JsonObject root = doc.to<JsonObject>();

  if (snapshot.hasTemperatures) {
    const Temperatures& t = snapshot.temperatures;
    JsonObject obj = root["temperatures"].to<JsonObject>();
    putTemperature(obj, "manual", t.manual);
    putTemperature(obj, "target_low", t.targetLow);
    putTemperature(obj, "target_high", t.targetHigh);
    putTemperature(obj, "offset", t.offset);
    putSetting(obj, "window_open_detection", t.windowOpenDetection);
    putSetting(obj, "window_open_minutes", t.windowOpenMinutes);
  }
  if (snapshot.hasLcdTimer) {
    root["lcd_timer"] = snapshot.lcdTimer.value;
  }
  if (snapshot.hasFlags) {
    root["flags"] = snapshot.flags.raw;
  }

  for (uint8_t d = 0; d < cmd::DAY_COUNT; ++d) {
    if (!snapshot.hasDay[d]) continue;
    const DaySchedule& day = snapshot.days[d];
    if (day.count > cmd::PERIODS_PER_DAY) {
      return Status::Error(Err::TOO_MANY_PERIODS, "At most 4 periods per day", day.count);
    }
    JsonArray arr = root[kDayKeys[d]].to<JsonArray>();
    for (uint8_t i = 0; i < day.count; ++i) {
      JsonObject p = arr.add<JsonObject>();
      putMinute(p, "start", day.periods[i].startMinute);
      putMinute(p, "end", day.periods[i].endMinute);
    }
  }

  for (uint8_t h = 0; h < cmd::HOLIDAY_COUNT; ++h) {
    if (!snapshot.hasHoliday[h]) continue;
    const Holiday& hol = snapshot.holidays[h];
    JsonObject obj = root[kHolidayKeys[h]].to<JsonObject>();
    putDateTime(obj, "start", hol.start);
    putDateTime(obj, "end", hol.end);
    if (hol.isCleared()) {
      obj["temperature"] = nullptr;
    } else {
      putTemperature(obj, "temperature", hol.temperature);
    }
  }

  if (doc.overflowed()) {
    return Status::Error(Err::BUFFER_TOO_SMALL, "JSON document allocation failed");
  }
  const size_t needed = measureJson(doc);
  if (needed + 1 > cap) {
    return Status::Error(Err::BUFFER_TOO_SMALL, "Backup does not fit output buffer",
                         static_cast<int32_t>(needed + 1));
  }
  written = serializeJson(doc, out, cap);
  return Status::Ok();
}

Status fromJson(const char* json, size_t len, Snapshot& out) {
  if (json == nullptr) {
    return Status::Error(Err::INVALID_PARAM, "Backup text is null");
  }

  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, json, len);
  if (err) {
    return Status::Error(Err::INVALID_BACKUP, "Backup is not valid JSON",
                         static_cast<int32_t>(err.code()));
  }
  JsonObjectConst root = doc.as<JsonObjectConst>();
  if (root.isNull()) {
    return badValue("Backup root must be an object");
  }

  Snapshot s;
  for (JsonPairConst kv : root) {
    const char* key = kv.key().c_str();
    JsonVariantConst value = kv.value();
    Status st = Status::Ok();

    if (std::strcmp(key, "temperatures") == 0) {
      st = readTemperatures(value, s.temperatures);
      s.hasTemperatures = st.ok();
    } else if (std::strcmp(key, "lcd_timer") == 0) {
      st = readByte(value, s.lcdTimer.value);
      s.hasLcdTimer = st.ok();
    } else if (std::strcmp(key, "flags") == 0) {
      st = readByte(value, s.flags.raw);
      s.hasFlags = st.ok();
    } else if (startsWith(key, kDayPrefix)) {
      uint8_t day = 0;
      if (!codec::parseWeekday(key + std::strlen(kDayPrefix), day)) {
        continue;  // unknown key
      }
      st = readDay(value, s.days[day]);
      s.hasDay[day] = st.ok();
    } else if (startsWith(key, kHolidayPrefix)) {
      const char* num = key + std::strlen(kHolidayPrefix);
      if (num[0] < '1' || num[0] > '8' || num[1] != '\0') {
        continue;  // unknown key
      }
      const uint8_t index = static_cast<uint8_t>(num[0] - '0');
      st = readHoliday(value, index, s.holidays[index - 1]);
      s.hasHoliday[index - 1] = st.ok();
    }

    if (!st.ok()) {
      return st;
    }
  }

  for (uint8_t h = 0; h < cmd::HOLIDAY_COUNT; ++h) {
    s.holidays[h].index = static_cast<uint8_t>(h + 1);
  }
  out = s;
  return Status::Ok();
}

}  // namespace backup
}  // namespace CometBlue
