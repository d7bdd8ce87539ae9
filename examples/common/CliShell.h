#pragma once

#include <Arduino.h>

namespace cli_shell {

/// Longest accepted line; restore takes a whole JSON backup on one line
static constexpr size_t MAX_LINE_LEN = 4096;

/**
 * @brief Collect console input until end of line.
 *
 * @param outLine Trimmed line when true is returned
 * @return true when a non-empty line is complete
 * @note Over-long lines are dropped with a warning.
 */
inline bool readLine(String& outLine) {
  static String buffer;
  static bool overflow = false;
  while (Serial.available() > 0) {
    const char c = static_cast<char>(Serial.read());
    if (c == '\r' || c == '\n') {
      if (overflow) {
        Serial.printf("Line longer than %u bytes ignored\n", static_cast<unsigned>(MAX_LINE_LEN));
        buffer = "";
        overflow = false;
        continue;
      }
      if (buffer.length() == 0) {
        continue;
      }
      outLine = buffer;
      buffer = "";
      outLine.trim();
      return outLine.length() > 0;
    }
    if (c == '\b' || c == 0x7F) {
      if (buffer.length() > 0) {
        buffer.remove(buffer.length() - 1);
      }
      continue;
    }
    if (buffer.length() >= MAX_LINE_LEN) {
      overflow = true;
      continue;
    }
    buffer += c;
  }
  return false;
}

/// Split "cmd rest of line" at the first space.
inline void splitCommand(const String& line, String& cmd, String& args) {
  const int spaceIdx = line.indexOf(' ');
  cmd = (spaceIdx >= 0) ? line.substring(0, spaceIdx) : line;
  args = (spaceIdx >= 0) ? line.substring(spaceIdx + 1) : String();
  args.trim();
}

}  // namespace cli_shell
