/**
 * @file CometBlue.cpp
 * @brief Implementation of the Comet Blue thermostat driver
 */

#include "CometBlue/CometBlue.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace CometBlue {

// Implementation-only constants (not part of public API)
namespace {
constexpr size_t kUuidFirstFieldLen = 8;

bool isTransportFailure(const Status& st) {
  return st.code == Err::TRANSPORT_ERROR || st.code == Err::TIMEOUT;
}

/// @brief Encoded payloads of a snapshot, built before any write.
struct EncodedSnapshot {
  uint8_t temperatures[cmd::TEMPERATURES_LEN];
  uint8_t lcdTimer[cmd::LCD_TIMER_LEN];
  uint8_t flags[cmd::FLAGS_LEN];
  uint8_t days[cmd::DAY_COUNT][cmd::DAY_LEN];
  uint8_t holidays[cmd::HOLIDAY_COUNT][cmd::HOLIDAY_LEN];
};

Status encodeSnapshot(const Snapshot& s, EncodedSnapshot& out) {
  Status st = Status::Ok();
  if (s.hasTemperatures) {
    st = codec::encodeTemperatures(s.temperatures, out.temperatures);
    if (!st.ok()) return st;
  }
  if (s.hasLcdTimer) {
    st = codec::encodeLcdTimer(s.lcdTimer, out.lcdTimer);
    if (!st.ok()) return st;
  }
  if (s.hasFlags) {
    st = codec::encodeFlags(s.flags, out.flags);
    if (!st.ok()) return st;
  }
  for (uint8_t d = 0; d < cmd::DAY_COUNT; ++d) {
    if (!s.hasDay[d]) continue;
    st = codec::encodeDay(s.days[d], out.days[d]);
    if (!st.ok()) return st;
  }
  for (uint8_t h = 0; h < cmd::HOLIDAY_COUNT; ++h) {
    if (!s.hasHoliday[h]) continue;
    st = codec::encodeHoliday(s.holidays[h], out.holidays[h]);
    if (!st.ok()) return st;
  }
  return Status::Ok();
}
}  // namespace

// ===== Lifecycle Functions =====

Status CometBlue::begin(const Config& config) {
  if (_initialized) {
    end();
  }

  // Validate configuration before touching any state
  if (!config.connect || !config.disconnect || !config.read || !config.write) {
    return Status::Error(Err::INVALID_CONFIG, "Transport callbacks are null");
  }
  if (config.address == nullptr || config.address[0] == '\0') {
    return Status::Error(Err::INVALID_CONFIG, "Device address is empty");
  }
  if (config.timeoutMs == 0) {
    return Status::Error(Err::INVALID_CONFIG, "Transport timeout must be > 0");
  }

  resetState();
  _config = config;
  if (_config.offlineThreshold < 1) {
    _config.offlineThreshold = 1;
  }
  _beginInProgress = true;

  // Connection attempts during begin() do not count against health
  Status st = _config.connect(_config.address, _config.timeoutMs, _config.transportUser);
  if (!st.ok()) {
    _beginInProgress = false;
    return st;
  }
  _connected = true;

  if (_config.hasPin) {
    st = authenticate(_config.pin);
    if (!st.ok()) {
      Status dst = _config.disconnect(_config.transportUser);
      if (!dst.ok()) {
        _lastError = dst;
      }
      _connected = false;
      _beginInProgress = false;
      return st;
    }
  }

  _initialized = true;
  _driverState = DriverState::READY;
  _beginInProgress = false;
  return Status::Ok();
}

void CometBlue::end() {
  if (_connected && _config.disconnect) {
    Status st = _config.disconnect(_config.transportUser);
    if (!st.ok()) {
      // Considered disconnected anyway
      _lastError = st;
    }
  }
  const Status last = _lastError;
  resetState();
  _lastError = last;
}

void CometBlue::resetState() {
  _initialized = false;
  _beginInProgress = false;
  _connected = false;
  _authenticated = false;
  _driverState = DriverState::UNINIT;
  _lastError = Status::Ok();
  _consecutiveFailures = 0;
  _totalFailures = 0;
  _totalSuccess = 0;
}

// ===== Transport Wrappers =====

Status CometBlue::_checkAccess(bool pinRequired) const {
  if (!_initialized && !_beginInProgress) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }
  if (!_connected) {
    return Status::Error(Err::NOT_CONNECTED, "Not connected");
  }
  if (pinRequired && !_authenticated) {
    return Status::Error(Err::PIN_REQUIRED, "PIN required");
  }
  return Status::Ok();
}

Status CometBlue::_readRaw(const char* uuid, uint8_t* buf, size_t cap, size_t& len) {
  size_t got = 0;
  Status st = _config.read(uuid, buf, cap, &got, _config.timeoutMs, _config.transportUser);
  if (!st.ok()) {
    return st;
  }
  if (got > cap) {
    return Status::Error(Err::TRANSPORT_ERROR, "Transport overran read buffer",
                         static_cast<int32_t>(got));
  }
  len = got;
  return Status::Ok();
}

Status CometBlue::_writeRaw(const char* uuid, const uint8_t* data, size_t len) {
  return _config.write(uuid, data, len, _config.timeoutMs, _config.transportUser);
}

Status CometBlue::_updateHealth(const Status& st) {
  if (st.ok()) {
    _consecutiveFailures = 0;
    if (_totalSuccess < UINT32_MAX) {
      ++_totalSuccess;
    }
    if (_initialized &&
        (_driverState == DriverState::DEGRADED || _driverState == DriverState::OFFLINE)) {
      _driverState = DriverState::READY;
    }
    return st;
  }

  // Only transport failures say something about the link
  if (!isTransportFailure(st)) {
    return st;
  }

  _lastError = st;
  if (_consecutiveFailures < 0xFFu) {
    ++_consecutiveFailures;
  }
  if (_totalFailures < UINT32_MAX) {
    ++_totalFailures;
  }
  if (_initialized) {
    if (_consecutiveFailures == 1 && _driverState == DriverState::READY) {
      _driverState = DriverState::DEGRADED;
    }
    if (_consecutiveFailures >= _config.offlineThreshold) {
      _driverState = DriverState::OFFLINE;
    }
  }
  return st;
}

Status CometBlue::readCharacteristic(const char* uuid, bool pinRequired, uint8_t* buf,
                                     size_t cap, size_t& len) {
  Status st = _checkAccess(pinRequired);
  if (!st.ok()) {
    return st;
  }
  return _updateHealth(_readRaw(uuid, buf, cap, len));
}

Status CometBlue::writeCharacteristic(const char* uuid, const uint8_t* data, size_t len) {
  Status st = _checkAccess(true);
  if (!st.ok()) {
    return st;
  }
  return _updateHealth(_writeRaw(uuid, data, len));
}

Status CometBlue::readString(const char* uuid, bool pinRequired, DeviceString& out) {
  uint8_t buf[cmd::MAX_PAYLOAD_LEN];
  size_t len = 0;
  Status st = readCharacteristic(uuid, pinRequired, buf, sizeof(buf), len);
  if (!st.ok()) return st;
  return codec::decodeString(buf, len, out);
}

// ===== Authentication =====

Status CometBlue::authenticate(int64_t pin) {
  Status st = _checkAccess(false);
  if (!st.ok()) {
    return st;
  }

  uint8_t buf[cmd::PIN_LEN];
  st = codec::encodePin(pin, buf);
  if (!st.ok()) {
    return st;
  }

  _authenticated = false;
  st = _updateHealth(_writeRaw(cmd::UUID_PIN, buf, sizeof(buf)));
  if (st.code == Err::TRANSPORT_ERROR) {
    // The device answers a wrong PIN with a failed write
    return Status::Error(Err::PIN_REQUIRED, "PIN rejected by device", st.detail);
  }
  if (!st.ok()) {
    return st;
  }
  _authenticated = true;
  return Status::Ok();
}

// ===== Device Information =====

Status CometBlue::readDeviceName(DeviceString& out) {
  return readString(cmd::UUID_DEVICE_NAME, false, out);
}

Status CometBlue::readModelNumber(DeviceString& out) {
  return readString(cmd::UUID_MODEL_NUMBER, false, out);
}

Status CometBlue::readFirmwareRevision(DeviceString& out) {
  return readString(cmd::UUID_FIRMWARE_REVISION, false, out);
}

Status CometBlue::readFirmwareRevision2(DeviceString& out) {
  return readString(cmd::UUID_FIRMWARE_REVISION2, true, out);
}

Status CometBlue::readSoftwareRevision(DeviceString& out) {
  return readString(cmd::UUID_SOFTWARE_REVISION, false, out);
}

Status CometBlue::readManufacturerName(DeviceString& out) {
  return readString(cmd::UUID_MANUFACTURER_NAME, false, out);
}

// ===== Clock =====

Status CometBlue::readDateTime(DateTime& out) {
  uint8_t buf[cmd::MAX_PAYLOAD_LEN];
  size_t len = 0;
  Status st = readCharacteristic(cmd::UUID_DATETIME, true, buf, sizeof(buf), len);
  if (!st.ok()) return st;
  return codec::decodeDateTime(buf, len, out);
}

Status CometBlue::setDateTime(const DateTime& value) {
  uint8_t buf[cmd::DATETIME_LEN];
  Status st = codec::encodeDateTime(value, buf);
  if (!st.ok()) return st;
  return writeCharacteristic(cmd::UUID_DATETIME, buf, sizeof(buf));
}

Status CometBlue::syncClock() {
  if (!_config.clock) {
    return Status::Error(Err::INVALID_CONFIG, "No clock configured");
  }
  const uint32_t now = _config.clock(_config.clockUser);
  if (now == 0) {
    return Status::Error(Err::INVALID_CONFIG, "Clock time unknown");
  }
  return _syncClockAt(now);
}

Status CometBlue::_syncClockAt(uint32_t now) {
  DateTime dt;
  if (!codec::unixToDateTime(now, dt)) {
    return Status::Error(Err::OUT_OF_RANGE, "Clock time not representable",
                         static_cast<int32_t>(now));
  }
  return setDateTime(dt);
}

// ===== Settings =====

Status CometBlue::readFlags(Flags& out) {
  uint8_t buf[cmd::MAX_PAYLOAD_LEN];
  size_t len = 0;
  Status st = readCharacteristic(cmd::UUID_FLAGS, true, buf, sizeof(buf), len);
  if (!st.ok()) return st;
  return codec::decodeFlags(buf, len, out);
}

Status CometBlue::setFlags(const Flags& value) {
  uint8_t buf[cmd::FLAGS_LEN];
  Status st = codec::encodeFlags(value, buf);
  if (!st.ok()) return st;
  return writeCharacteristic(cmd::UUID_FLAGS, buf, sizeof(buf));
}

Status CometBlue::readTemperatures(Temperatures& out) {
  uint8_t buf[cmd::MAX_PAYLOAD_LEN];
  size_t len = 0;
  Status st = readCharacteristic(cmd::UUID_TEMPERATURES, true, buf, sizeof(buf), len);
  if (!st.ok()) return st;
  return codec::decodeTemperatures(buf, len, out);
}

Status CometBlue::setTemperatures(const Temperatures& value) {
  uint8_t buf[cmd::TEMPERATURES_LEN];
  Status st = codec::encodeTemperatures(value, buf);
  if (!st.ok()) return st;
  return writeCharacteristic(cmd::UUID_TEMPERATURES, buf, sizeof(buf));
}

Status CometBlue::readBattery(Battery& out) {
  uint8_t buf[cmd::MAX_PAYLOAD_LEN];
  size_t len = 0;
  Status st = readCharacteristic(cmd::UUID_BATTERY, true, buf, sizeof(buf), len);
  if (!st.ok()) return st;
  return codec::decodeBattery(buf, len, out);
}

Status CometBlue::readLcdTimer(LcdTimer& out) {
  uint8_t buf[cmd::MAX_PAYLOAD_LEN];
  size_t len = 0;
  Status st = readCharacteristic(cmd::UUID_LCD_TIMER, true, buf, sizeof(buf), len);
  if (!st.ok()) return st;
  return codec::decodeLcdTimer(buf, len, out);
}

Status CometBlue::setLcdTimer(const LcdTimer& value) {
  uint8_t buf[cmd::LCD_TIMER_LEN];
  Status st = codec::encodeLcdTimer(value, buf);
  if (!st.ok()) return st;
  return writeCharacteristic(cmd::UUID_LCD_TIMER, buf, sizeof(buf));
}

// ===== Weekly Schedule =====

Status CometBlue::readDay(uint8_t day, DaySchedule& out) {
  char uuid[cmd::UUID_STRING_LEN + 1];
  if (day >= cmd::DAY_COUNT || !tableUuid(cmd::UUID_DAY_BASE, day, uuid)) {
    return Status::Error(Err::INVALID_PARAM, "Day must be 0-6", day);
  }
  uint8_t buf[cmd::MAX_PAYLOAD_LEN];
  size_t len = 0;
  Status st = readCharacteristic(uuid, true, buf, sizeof(buf), len);
  if (!st.ok()) return st;
  return codec::decodeDay(buf, len, out);
}

Status CometBlue::setDay(uint8_t day, const DaySchedule& value) {
  char uuid[cmd::UUID_STRING_LEN + 1];
  if (day >= cmd::DAY_COUNT || !tableUuid(cmd::UUID_DAY_BASE, day, uuid)) {
    return Status::Error(Err::INVALID_PARAM, "Day must be 0-6", day);
  }
  uint8_t buf[cmd::DAY_LEN];
  Status st = codec::encodeDay(value, buf);
  if (!st.ok()) return st;
  return writeCharacteristic(uuid, buf, sizeof(buf));
}

Status CometBlue::readDays(DaySchedule (&out)[cmd::DAY_COUNT]) {
  for (uint8_t d = 0; d < cmd::DAY_COUNT; ++d) {
    Status st = readDay(d, out[d]);
    if (!st.ok()) return st;
  }
  return Status::Ok();
}

Status CometBlue::setDays(const DaySchedule (&value)[cmd::DAY_COUNT]) {
  // Reject the whole week before writing any day
  uint8_t scratch[cmd::DAY_LEN];
  for (uint8_t d = 0; d < cmd::DAY_COUNT; ++d) {
    Status st = codec::encodeDay(value[d], scratch);
    if (!st.ok()) return st;
  }
  for (uint8_t d = 0; d < cmd::DAY_COUNT; ++d) {
    Status st = setDay(d, value[d]);
    if (!st.ok()) return st;
  }
  return Status::Ok();
}

// ===== Holidays =====

Status CometBlue::readHoliday(uint8_t index, Holiday& out) {
  char uuid[cmd::UUID_STRING_LEN + 1];
  if (index < 1 || index > cmd::HOLIDAY_COUNT ||
      !tableUuid(cmd::UUID_HOLIDAY_BASE, static_cast<uint8_t>(index - 1), uuid)) {
    return Status::Error(Err::INVALID_PARAM, "Holiday index must be 1-8", index);
  }
  uint8_t buf[cmd::MAX_PAYLOAD_LEN];
  size_t len = 0;
  Status st = readCharacteristic(uuid, true, buf, sizeof(buf), len);
  if (!st.ok()) return st;

  Holiday h;
  st = codec::decodeHoliday(buf, len, h);
  if (!st.ok()) return st;
  h.index = index;
  out = h;
  return Status::Ok();
}

Status CometBlue::setHoliday(const Holiday& value) {
  char uuid[cmd::UUID_STRING_LEN + 1];
  if (value.index < 1 || value.index > cmd::HOLIDAY_COUNT ||
      !tableUuid(cmd::UUID_HOLIDAY_BASE, static_cast<uint8_t>(value.index - 1), uuid)) {
    return Status::Error(Err::INVALID_PARAM, "Holiday index must be 1-8", value.index);
  }
  uint8_t buf[cmd::HOLIDAY_LEN];
  Status st = codec::encodeHoliday(value, buf);
  if (!st.ok()) return st;
  return writeCharacteristic(uuid, buf, sizeof(buf));
}

Status CometBlue::readHolidays(Holiday (&out)[cmd::HOLIDAY_COUNT]) {
  for (uint8_t i = 0; i < cmd::HOLIDAY_COUNT; ++i) {
    Status st = readHoliday(static_cast<uint8_t>(i + 1), out[i]);
    if (!st.ok()) return st;
  }
  return Status::Ok();
}

Status CometBlue::setHolidays(const Holiday (&value)[cmd::HOLIDAY_COUNT]) {
  uint8_t scratch[cmd::HOLIDAY_LEN];
  for (uint8_t i = 0; i < cmd::HOLIDAY_COUNT; ++i) {
    Status st = codec::encodeHoliday(value[i], scratch);
    if (!st.ok()) return st;
  }
  for (uint8_t i = 0; i < cmd::HOLIDAY_COUNT; ++i) {
    Holiday h = value[i];
    h.index = static_cast<uint8_t>(i + 1);
    Status st = setHoliday(h);
    if (!st.ok()) return st;
  }
  return Status::Ok();
}

// ===== Backup / Restore =====

Status CometBlue::backup(Snapshot& out) {
  Snapshot s;

  Status st = readTemperatures(s.temperatures);
  if (!st.ok()) return st;
  s.hasTemperatures = true;

  st = readLcdTimer(s.lcdTimer);
  if (!st.ok()) return st;
  s.hasLcdTimer = true;

  st = readFlags(s.flags);
  if (!st.ok()) return st;
  s.hasFlags = true;

  st = readDays(s.days);
  if (!st.ok()) return st;
  for (uint8_t d = 0; d < cmd::DAY_COUNT; ++d) {
    s.hasDay[d] = true;
  }

  st = readHolidays(s.holidays);
  if (!st.ok()) return st;
  for (uint8_t h = 0; h < cmd::HOLIDAY_COUNT; ++h) {
    s.hasHoliday[h] = true;
  }

  out = s;
  return Status::Ok();
}

Status CometBlue::restore(const Snapshot& snapshot) {
  Status st = _checkAccess(true);
  if (!st.ok()) {
    return st;
  }

  EncodedSnapshot enc;
  st = encodeSnapshot(snapshot, enc);
  if (!st.ok()) {
    return st;
  }

  char uuid[cmd::UUID_STRING_LEN + 1];
  if (snapshot.hasTemperatures) {
    st = writeCharacteristic(cmd::UUID_TEMPERATURES, enc.temperatures, sizeof(enc.temperatures));
    if (!st.ok()) return st;
  }
  if (snapshot.hasLcdTimer) {
    st = writeCharacteristic(cmd::UUID_LCD_TIMER, enc.lcdTimer, sizeof(enc.lcdTimer));
    if (!st.ok()) return st;
  }
  if (snapshot.hasFlags) {
    st = writeCharacteristic(cmd::UUID_FLAGS, enc.flags, sizeof(enc.flags));
    if (!st.ok()) return st;
  }
  for (uint8_t d = 0; d < cmd::DAY_COUNT; ++d) {
    if (!snapshot.hasDay[d]) continue;
    if (!tableUuid(cmd::UUID_DAY_BASE, d, uuid)) {
      return Status::Error(Err::INVALID_PARAM, "Bad day UUID", d);
    }
    st = writeCharacteristic(uuid, enc.days[d], cmd::DAY_LEN);
    if (!st.ok()) return st;
  }
  for (uint8_t h = 0; h < cmd::HOLIDAY_COUNT; ++h) {
    if (!snapshot.hasHoliday[h]) continue;
    if (!tableUuid(cmd::UUID_HOLIDAY_BASE, h, uuid)) {
      return Status::Error(Err::INVALID_PARAM, "Bad holiday UUID", h);
    }
    st = writeCharacteristic(uuid, enc.holidays[h], cmd::HOLIDAY_LEN);
    if (!st.ok()) return st;
  }

  if (!_config.clock) {
    return Status::Ok();
  }
  // A clock that does not know the time yet leaves the device clock alone
  const uint32_t now = _config.clock(_config.clockUser);
  if (now == 0) {
    return Status::Ok();
  }
  return _syncClockAt(now);
}

// ===== Static Utility Functions =====

bool CometBlue::tableUuid(const char* base, uint8_t row, char (&out)[cmd::UUID_STRING_LEN + 1]) {
  if (base == nullptr || std::strlen(base) != cmd::UUID_STRING_LEN ||
      base[kUuidFirstFieldLen] != '-') {
    return false;
  }

  char field[kUuidFirstFieldLen + 1];
  std::memcpy(field, base, kUuidFirstFieldLen);
  field[kUuidFirstFieldLen] = '\0';
  char* endp = nullptr;
  const unsigned long first = std::strtoul(field, &endp, 16);
  if (endp != field + kUuidFirstFieldLen) {
    return false;
  }

  const unsigned long shifted = (first + row) & 0xFFFFFFFFUL;
  std::snprintf(out, sizeof(out), "%08lx%s", shifted, base + kUuidFirstFieldLen);
  return true;
}

}  // namespace CometBlue
