/**
 * @file Backup.h
 * @brief JSON mapping of a thermostat Snapshot for backup files
 *
 * Document layout (every top-level key is optional):
 * @code
 * {
 *   "temperatures": {"manual": 21.0, "target_low": 17.0, "target_high": 21.0,
 *                    "offset": 0.0, "window_open_detection": 4,
 *                    "window_open_minutes": 10},
 *   "lcd_timer": 10,
 *   "flags": 0,
 *   "day_monday": [{"start": "06:00", "end": "08:30"}],
 *   ...
 *   "day_sunday": [],
 *   "holiday_1": {"start": "2024-12-24 10:00", "end": "2025-01-02 18:00",
 *                 "temperature": 16.5},
 *   ...
 *   "holiday_8": {"start": null, "end": null, "temperature": null}
 * }
 * @endcode
 *
 * null means "not set" (absent). Unknown keys are ignored so newer files
 * restore on older builds. A missing key leaves the matching has* flag
 * false, which restore() treats as "do not touch".
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "Status.h"
#include "Types.h"

namespace CometBlue {
namespace backup {

/**
 * @brief Serialize the captured parts of a snapshot
 *
 * @param snapshot Source snapshot
 * @param[out] out Destination buffer, NUL-terminated on success
 * @param cap Capacity of out in bytes
 * @param[out] written Bytes written, excluding the terminator
 * @return BUFFER_TOO_SMALL if the document does not fit
 */
Status toJson(const Snapshot& snapshot, char* out, size_t cap, size_t& written);

/**
 * @brief Parse a backup document
 *
 * @param json Document text (need not be NUL-terminated)
 * @param len Length of json in bytes
 * @param[out] out Snapshot; replaced only on success
 * @return INVALID_BACKUP on syntax errors or wrongly typed values,
 *         TOO_MANY_PERIODS if a day lists more than 4 periods
 */
Status fromJson(const char* json, size_t len, Snapshot& out);

}  // namespace backup
}  // namespace CometBlue
