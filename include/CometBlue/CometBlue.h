/**
 * @file CometBlue.h
 * @brief Driver for the Comet Blue Bluetooth LE radiator thermostat
 *
 * The thermostat (sold as Eurotronic Comet Blue and under several other
 * brands) exposes its settings as fixed-layout GATT characteristics:
 * - Clock, temperature setpoints and sensor offset
 * - Weekly schedule (four heating periods per weekday)
 * - Eight holiday overrides
 * - Battery level, LCD timer and an undocumented flags byte
 *
 * The library does not own a Bluetooth stack. Connect/read/write are
 * application-provided callbacks in Config; the driver only sequences the
 * PIN write and runs the payload codecs.
 *
 * @par Thread Safety
 * Not thread-safe. External synchronization required for multi-threaded access.
 * The codec functions in Codec.h are reentrant.
 *
 * @par Usage Example
 * @code
 * #include "CometBlue/CometBlue.h"
 *
 * CometBlue::CometBlue valve;
 *
 * CometBlue::Config cfg;
 * cfg.connect = transport::bleConnect;
 * cfg.disconnect = transport::bleDisconnect;
 * cfg.read = transport::bleRead;
 * cfg.write = transport::bleWrite;
 * cfg.transportUser = client;
 * cfg.address = "E0:E5:CF:12:34:56";
 * cfg.hasPin = true;
 * cfg.pin = 0;
 *
 * CometBlue::Status st = valve.begin(cfg);
 * if (!st.ok()) {
 *   Serial.printf("Connect failed: %s\n", st.msg);
 *   return;
 * }
 *
 * CometBlue::Temperatures temps;
 * if (valve.readTemperatures(temps).ok() && temps.current.present) {
 *   Serial.printf("Room: %.1f C\n", temps.current.celsius());
 * }
 * valve.end();
 * @endcode
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "Codec.h"
#include "CommandTable.h"
#include "Config.h"
#include "Status.h"
#include "Types.h"

namespace CometBlue {

/**
 * @enum DriverState
 * @brief Connection health as seen by the driver
 */
enum class DriverState : uint8_t {
  UNINIT,    ///< begin() not called or end() called
  READY,     ///< Connected, last transport operation succeeded
  DEGRADED,  ///< 1 .. offlineThreshold-1 consecutive transport failures
  OFFLINE    ///< offlineThreshold or more consecutive transport failures
};

/**
 * @class CometBlue
 * @brief Thermostat driver following the begin/end lifecycle pattern
 *
 * @par Error Handling
 * All errors returned as Status. Codec failures (malformed payloads, values
 * that cannot be encoded) do not count against connection health; transport
 * failures do.
 *
 * @par Memory
 * No heap allocation. Payload buffers live on the stack.
 */
class CometBlue {
 public:
  /**
   * @brief Connect to the thermostat and send the PIN if configured
   *
   * @param config Transport and device configuration
   * @return OK when connected (and authenticated if config.hasPin),
   *         PIN_REQUIRED if the device rejected the PIN, error otherwise
   * @note On PIN rejection the connection is closed again.
   */
  Status begin(const Config& config);

  /**
   * @brief Disconnect and reset driver state
   *
   * @note Safe to call repeatedly. Disconnect errors are recorded in lastError().
   */
  void end();

  bool isInitialized() const { return _initialized; }

  /// @brief true after a PIN write succeeded on the current connection
  bool isAuthenticated() const { return _authenticated; }

  const Config& getConfig() const { return _config; }

  // ===== Driver State and Health =====

  DriverState state() const { return _driverState; }

  bool isOnline() const {
    return _driverState == DriverState::READY || _driverState == DriverState::DEGRADED;
  }

  uint8_t consecutiveFailures() const { return _consecutiveFailures; }
  uint32_t totalFailures() const { return _totalFailures; }
  uint32_t totalSuccess() const { return _totalSuccess; }

  /// @brief Last transport failure (OK if none since begin())
  Status lastError() const { return _lastError; }

  // ===== Authentication =====

  /**
   * @brief Write the PIN characteristic
   *
   * @param pin Device PIN (0-4294967295)
   * @return INVALID_PIN if not representable, PIN_REQUIRED if the device
   *         rejected the write, OK otherwise
   * @note Must succeed before any protected read or any write.
   */
  Status authenticate(int64_t pin);

  // ===== Device Information (no PIN required, except revision #2) =====

  Status readDeviceName(DeviceString& out);
  Status readModelNumber(DeviceString& out);
  Status readFirmwareRevision(DeviceString& out);
  Status readFirmwareRevision2(DeviceString& out);
  Status readSoftwareRevision(DeviceString& out);
  Status readManufacturerName(DeviceString& out);

  // ===== Clock =====

  /**
   * @brief Read the device clock
   * @param[out] out Date/time; absent if the clock was never set
   */
  Status readDateTime(DateTime& out);

  /**
   * @brief Set the device clock
   * @return OUT_OF_RANGE if the value cannot be encoded (nothing written)
   */
  Status setDateTime(const DateTime& value);

  /**
   * @brief Set the device clock from Config::clock
   * @return INVALID_CONFIG if no clock is configured or it reports 0,
   *         OUT_OF_RANGE if the time predates 2000
   */
  Status syncClock();

  // ===== Settings =====

  Status readFlags(Flags& out);
  Status setFlags(const Flags& value);

  /**
   * @brief Read the temperature settings block
   * @note Absent setpoints are disabled on the device.
   */
  Status readTemperatures(Temperatures& out);

  /**
   * @brief Write the temperature settings block
   * @note Absent fields are left unchanged by the device; current is never written.
   */
  Status setTemperatures(const Temperatures& value);

  Status readBattery(Battery& out);

  Status readLcdTimer(LcdTimer& out);
  Status setLcdTimer(const LcdTimer& value);

  // ===== Weekly Schedule =====

  /**
   * @brief Read one weekday schedule
   * @param day 0 = Monday ... 6 = Sunday
   */
  Status readDay(uint8_t day, DaySchedule& out);

  /**
   * @brief Write one weekday schedule
   * @param day 0 = Monday ... 6 = Sunday
   * @return TOO_MANY_PERIODS / OUT_OF_RANGE without writing on invalid input
   */
  Status setDay(uint8_t day, const DaySchedule& value);

  Status readDays(DaySchedule (&out)[cmd::DAY_COUNT]);
  Status setDays(const DaySchedule (&value)[cmd::DAY_COUNT]);

  // ===== Holidays =====

  /**
   * @brief Read one holiday
   * @param index Holiday slot 1-8
   */
  Status readHoliday(uint8_t index, Holiday& out);

  /**
   * @brief Write a holiday to slot value.index
   * @note A cleared holiday is written with the temperature sentinel.
   */
  Status setHoliday(const Holiday& value);

  Status readHolidays(Holiday (&out)[cmd::HOLIDAY_COUNT]);
  Status setHolidays(const Holiday (&value)[cmd::HOLIDAY_COUNT]);

  // ===== Backup / Restore =====

  /**
   * @brief Capture every restorable setting
   *
   * Reads temperatures, LCD timer, flags, all days and all holidays.
   * The clock is not part of a backup.
   */
  Status backup(Snapshot& out);

  /**
   * @brief Write the captured parts of a snapshot back to the device
   *
   * Every present field is encoded before the first write; an encode error
   * aborts with nothing written. Fields without their has* flag are left
   * untouched. When Config::clock is set and reports a time, the device
   * clock is synced last; a clock reporting 0 skips the sync.
   */
  Status restore(const Snapshot& snapshot);

  // ===== Static Utility Functions =====

  /**
   * @brief Derive the UUID of a table row
   *
   * @param base Row 0 UUID (cmd::UUID_DAY_BASE or cmd::UUID_HOLIDAY_BASE)
   * @param row Row number added to the first UUID field
   * @param[out] out Buffer for the 36-character UUID plus terminator
   * @return false if base is not a well-formed UUID
   */
  static bool tableUuid(const char* base, uint8_t row, char (&out)[cmd::UUID_STRING_LEN + 1]);

 private:
  Config _config;
  bool _initialized = false;
  bool _beginInProgress = false;
  bool _connected = false;
  bool _authenticated = false;

  DriverState _driverState = DriverState::UNINIT;
  Status _lastError = Status::Ok();
  uint8_t _consecutiveFailures = 0;
  uint32_t _totalFailures = 0;
  uint32_t _totalSuccess = 0;

  // Transport wrappers
  Status _readRaw(const char* uuid, uint8_t* buf, size_t cap, size_t& len);
  Status _writeRaw(const char* uuid, const uint8_t* data, size_t len);
  Status _updateHealth(const Status& st);
  Status _checkAccess(bool pinRequired) const;
  Status _syncClockAt(uint32_t now);

  Status readCharacteristic(const char* uuid, bool pinRequired, uint8_t* buf, size_t cap,
                            size_t& len);
  Status writeCharacteristic(const char* uuid, const uint8_t* data, size_t len);
  Status readString(const char* uuid, bool pinRequired, DeviceString& out);
  void resetState();
};

}  // namespace CometBlue
