/**
 * @file Status.h
 * @brief Error status codes for the CometBlue thermostat library
 */

#pragma once

#include <stdint.h>

namespace CometBlue {

/**
 * @enum Err
 * @brief Error codes returned by library operations
 */
enum class Err : uint8_t {
  OK = 0,            ///< Operation successful
  NOT_INITIALIZED,   ///< Driver not initialized (call begin() first)
  INVALID_CONFIG,    ///< Invalid configuration parameter
  INVALID_PARAM,     ///< Invalid parameter value (row number, null buffer)
  NOT_CONNECTED,     ///< No open connection to the thermostat
  PIN_REQUIRED,      ///< Operation needs a successful PIN write first
  TRANSPORT_ERROR,   ///< GATT read/write/connect failed
  TIMEOUT,           ///< Transport operation timed out
  MALFORMED_DATA,    ///< Wire buffer has wrong length or a field out of range
  OUT_OF_RANGE,      ///< Domain value cannot be represented on the wire
  TOO_MANY_PERIODS,  ///< More than 4 periods supplied for one day
  INVALID_PIN,       ///< PIN not representable as unsigned 32-bit
  INVALID_BACKUP,    ///< Backup document cannot be parsed or has a bad value
  BUFFER_TOO_SMALL   ///< Caller output buffer cannot hold the result
};

/**
 * @struct Status
 * @brief Status result from library operations
 *
 * All library functions return Status to indicate success or failure.
 * Check status.ok() to determine if operation succeeded.
 */
struct Status {
  Err code = Err::OK;      ///< Error category
  int32_t detail = 0;      ///< Transport error code or offending field value
  const char* msg = "";    ///< Static error message (never heap-allocated)

  constexpr Status() = default;

  constexpr Status(Err c, int32_t d, const char* m) : code(c), detail(d), msg(m) {}

  /**
   * @brief Check if operation succeeded
   * @return true if code == Err::OK
   */
  constexpr bool ok() const { return code == Err::OK; }

  static constexpr Status Ok() { return Status{Err::OK, 0, "OK"}; }

  /**
   * @brief Create error status
   * @param err Error code
   * @param message Static error message
   * @param detailCode Optional detail code
   */
  static constexpr Status Error(Err err, const char* message, int32_t detailCode = 0) {
    return Status{err, detailCode, message};
  }
};

}  // namespace CometBlue
