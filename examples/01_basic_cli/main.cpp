/**
 * @file main.cpp
 * @brief Interactive CLI example for the Comet Blue thermostat
 *
 * Demonstrates complete thermostat functionality over NimBLE:
 * - Connect with PIN, device information strings
 * - Clock read/set and sync from the ESP32 wall clock
 * - Temperature setpoints, battery, LCD timer and flags
 * - Weekly schedule and holiday overrides
 * - JSON backup to and restore from the console
 *
 * Type 'help' for available commands.
 */

#include <Arduino.h>
#include <NimBLEDevice.h>
#include <sys/time.h>
#include <time.h>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "examples/common/BleTransport.h"
#include "examples/common/CliShell.h"
#include "examples/common/HealthView.h"
#include "examples/common/Log.h"
#include "CometBlue/Backup.h"
#include "CometBlue/CometBlue.h"

static CometBlue::CometBlue g_valve;
static NimBLEClient* g_client = nullptr;
static String g_address = "";
static bool g_verbose = false;

/// Backups are printed as one line, restore reads one line back
static char g_json[cli_shell::MAX_LINE_LEN + 1];

static const char* stateToStr(CometBlue::DriverState state) {
  switch (state) {
    case CometBlue::DriverState::UNINIT:   return "UNINIT";
    case CometBlue::DriverState::READY:    return "READY";
    case CometBlue::DriverState::DEGRADED: return "DEGRADED";
    case CometBlue::DriverState::OFFLINE:  return "OFFLINE";
    default: return "UNKNOWN";
  }
}

/**
 * @brief Convert Err enum to string.
 */
static const char* errToStr(CometBlue::Err code) {
  switch (code) {
    case CometBlue::Err::OK:               return "OK";
    case CometBlue::Err::NOT_INITIALIZED:  return "NOT_INITIALIZED";
    case CometBlue::Err::INVALID_CONFIG:   return "INVALID_CONFIG";
    case CometBlue::Err::INVALID_PARAM:    return "INVALID_PARAM";
    case CometBlue::Err::NOT_CONNECTED:    return "NOT_CONNECTED";
    case CometBlue::Err::PIN_REQUIRED:     return "PIN_REQUIRED";
    case CometBlue::Err::TRANSPORT_ERROR:  return "TRANSPORT_ERROR";
    case CometBlue::Err::TIMEOUT:          return "TIMEOUT";
    case CometBlue::Err::MALFORMED_DATA:   return "MALFORMED_DATA";
    case CometBlue::Err::OUT_OF_RANGE:     return "OUT_OF_RANGE";
    case CometBlue::Err::TOO_MANY_PERIODS: return "TOO_MANY_PERIODS";
    case CometBlue::Err::INVALID_PIN:      return "INVALID_PIN";
    case CometBlue::Err::INVALID_BACKUP:   return "INVALID_BACKUP";
    case CometBlue::Err::BUFFER_TOO_SMALL: return "BUFFER_TOO_SMALL";
    default: return "UNKNOWN";
  }
}

static void report(const char* op, const CometBlue::Status& st) {
  if (!st.ok()) {
    LOGE("%s failed: %s (code=%s, detail=%ld)", op, st.msg ? st.msg : "",
         errToStr(st.code), static_cast<long>(st.detail));
  }
  if (g_verbose) {
    Serial.printf("  %s -> %s%s%s, state=%s\n", op, LOG_COLOR_RESULT(st.ok()),
                  st.ok() ? "OK" : "FAILED", LOG_COLOR_RESET, stateToStr(g_valve.state()));
  }
}

/// Wall clock for Config::clock; 0 until the ESP32 time is set
static uint32_t wallClock(void*) {
  const time_t now = time(nullptr);
  if (now < static_cast<time_t>(946684800)) {
    return 0;
  }
  return static_cast<uint32_t>(now);
}

// ===== Formatting =====

static void print_temperature(const char* label, const CometBlue::Temperature& t) {
  if (t.present) {
    Serial.printf("  %-12s %.1f C\n", label, static_cast<double>(t.celsius()));
  } else {
    Serial.printf("  %-12s -\n", label);
  }
}

static void print_datetime(const CometBlue::DateTime& dt) {
  if (!dt.present) {
    Serial.print("-");
    return;
  }
  Serial.printf("%04u-%02u-%02u %02u:%02u", dt.year, dt.month, dt.day, dt.hour, dt.minute);
}

static void print_day(uint8_t day, const CometBlue::DaySchedule& s) {
  Serial.printf("  %-10s", CometBlue::codec::weekdayName(day));
  if (s.count == 0) {
    Serial.print(" (off)");
  }
  for (uint8_t i = 0; i < s.count; ++i) {
    const CometBlue::Period& p = s.periods[i];
    Serial.printf(" %02u:%02u-%02u:%02u", p.startMinute / 60u, p.startMinute % 60u,
                  p.endMinute / 60u, p.endMinute % 60u);
  }
  Serial.println();
}

static void print_holiday(const CometBlue::Holiday& h) {
  Serial.printf("  holiday %u: ", h.index);
  if (h.isCleared()) {
    Serial.println("(cleared)");
    return;
  }
  print_datetime(h.start);
  Serial.print(" .. ");
  print_datetime(h.end);
  if (h.temperature.present) {
    Serial.printf(" at %.1f C", static_cast<double>(h.temperature.celsius()));
  }
  Serial.println();
}

// ===== Parsing =====

/// "21.5" or "none"
static bool parse_temperature(const String& text, CometBlue::Temperature& out) {
  if (text == "none" || text == "-") {
    out = CometBlue::Temperature::absent();
    return true;
  }
  char* end = nullptr;
  const float value = strtof(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0') {
    return false;
  }
  out = CometBlue::Temperature::fromCelsius(value);
  return out.present;
}

/// "YYYY-MM-DD HH:MM"; consumes two whitespace-separated tokens
static bool parse_datetime(const char* text, CometBlue::DateTime& out, int* consumed) {
  unsigned y = 0, mo = 0, d = 0, h = 0, mi = 0;
  int n = 0;
  if (sscanf(text, "%4u-%2u-%2u %2u:%2u%n", &y, &mo, &d, &h, &mi, &n) != 5) {
    return false;
  }
  out = CometBlue::DateTime::make(static_cast<uint16_t>(y), static_cast<uint8_t>(mo),
                                  static_cast<uint8_t>(d), static_cast<uint8_t>(h),
                                  static_cast<uint8_t>(mi));
  *consumed = n;
  return CometBlue::codec::isValidDateTime(out);
}

// ===== Commands =====

static void print_help() {
  Serial.println();
  Serial.println(F("=== Comet Blue CLI ==="));
  Serial.println(F("Connection:"));
  Serial.println(F("  connect ADDR [PIN]       - Connect (and authenticate)"));
  Serial.println(F("  disconnect               - Close the connection"));
  Serial.println(F("  pin N                    - Send PIN on the open connection"));
  Serial.println(F("  drv                      - Driver health"));
  Serial.println(F("  verbose 0|1              - Per-command result output"));
  Serial.println(F("Device:"));
  Serial.println(F("  info                     - Name, model, revisions, manufacturer"));
  Serial.println(F("  time                     - Read clock"));
  Serial.println(F("  settime YYYY-MM-DD HH:MM - Set clock"));
  Serial.println(F("  sync [UNIX]              - Set clock from ESP32 time (optionally set it first)"));
  Serial.println(F("  temps                    - Read temperature settings"));
  Serial.println(F("  settemp FIELD C|none     - FIELD: manual low high offset"));
  Serial.println(F("  window DETECT MINUTES    - Window-open detection settings"));
  Serial.println(F("  battery                  - Battery level"));
  Serial.println(F("  lcd [SECONDS]            - Read/set LCD timer"));
  Serial.println(F("  flags [N]                - Read/set status flags"));
  Serial.println(F("Schedule:"));
  Serial.println(F("  days                     - Show all weekdays"));
  Serial.println(F("  day DAY [HH:MM-HH:MM ...]- Show/set one weekday (max 4 periods)"));
  Serial.println(F("  holidays                 - Show all holidays"));
  Serial.println(F("  holiday N clear          - Clear holiday N (1-8)"));
  Serial.println(F("  holiday N START END C    - START/END as YYYY-MM-DD HH:MM"));
  Serial.println(F("Backup:"));
  Serial.println(F("  backup                   - Print settings as JSON"));
  Serial.println(F("  restore {json}           - Write settings from JSON"));
  Serial.println();
}

static void cmd_connect(const String& args) {
  String addr = args;
  String pinText;
  const int spaceIdx = args.indexOf(' ');
  if (spaceIdx >= 0) {
    addr = args.substring(0, spaceIdx);
    pinText = args.substring(spaceIdx + 1);
    pinText.trim();
  }
  if (addr.length() == 0) {
    LOGE("Usage: connect ADDR [PIN]");
    return;
  }
  g_address = addr;

  CometBlue::Config cfg;
  cfg.connect = transport::bleConnect;
  cfg.disconnect = transport::bleDisconnect;
  cfg.read = transport::bleRead;
  cfg.write = transport::bleWrite;
  cfg.transportUser = g_client;
  cfg.address = g_address.c_str();
  cfg.clock = wallClock;
  if (pinText.length() > 0) {
    char* end = nullptr;
    const long long pin = strtoll(pinText.c_str(), &end, 10);
    if (*end != '\0' || pin < 0 || pin > 4294967295LL) {
      LOGE("PIN must be 0-4294967295");
      return;
    }
    cfg.hasPin = true;
    cfg.pin = static_cast<uint32_t>(pin);
  }

  LOGI("Connecting to %s...", cfg.address);
  const CometBlue::Status st = g_valve.begin(cfg);
  report("connect", st);
  if (st.ok()) {
    LOGI("Connected%s", g_valve.isAuthenticated() ? " and authenticated" : " (no PIN sent)");
  }
}

static void cmd_pin(const String& args) {
  char* end = nullptr;
  const long long pin = strtoll(args.c_str(), &end, 10);
  if (args.length() == 0 || *end != '\0') {
    LOGE("Usage: pin N");
    return;
  }
  const CometBlue::Status st = g_valve.authenticate(pin);
  report("authenticate", st);
  if (st.ok()) {
    LOGI("PIN accepted");
  }
}

static void cmd_info() {
  struct Entry {
    const char* label;
    CometBlue::Status (CometBlue::CometBlue::*read)(CometBlue::DeviceString&);
  };
  static const Entry entries[] = {
    {"name", &CometBlue::CometBlue::readDeviceName},
    {"model", &CometBlue::CometBlue::readModelNumber},
    {"firmware", &CometBlue::CometBlue::readFirmwareRevision},
    {"firmware2", &CometBlue::CometBlue::readFirmwareRevision2},
    {"software", &CometBlue::CometBlue::readSoftwareRevision},
    {"manufacturer", &CometBlue::CometBlue::readManufacturerName},
  };
  for (const Entry& e : entries) {
    CometBlue::DeviceString s;
    const CometBlue::Status st = (g_valve.*e.read)(s);
    if (st.ok()) {
      Serial.printf("  %-12s %s\n", e.label, s.text);
    } else {
      Serial.printf("  %-12s <%s>\n", e.label, errToStr(st.code));
    }
  }
}

static void cmd_time() {
  CometBlue::DateTime dt;
  const CometBlue::Status st = g_valve.readDateTime(dt);
  report("readDateTime", st);
  if (!st.ok()) return;
  Serial.print("  ");
  print_datetime(dt);
  Serial.println();
}

static void cmd_settime(const String& args) {
  CometBlue::DateTime dt;
  int consumed = 0;
  if (!parse_datetime(args.c_str(), dt, &consumed)) {
    LOGE("Usage: settime YYYY-MM-DD HH:MM");
    return;
  }
  const CometBlue::Status st = g_valve.setDateTime(dt);
  report("setDateTime", st);
  if (st.ok()) LOGI("Clock set");
}

static void cmd_sync(const String& args) {
  if (args.length() > 0) {
    struct timeval tv = {};
    tv.tv_sec = static_cast<time_t>(strtoul(args.c_str(), nullptr, 10));
    settimeofday(&tv, nullptr);
  }
  const CometBlue::Status st = g_valve.syncClock();
  report("syncClock", st);
  if (st.ok()) LOGI("Clock synced");
}

static void cmd_temps() {
  CometBlue::Temperatures t;
  const CometBlue::Status st = g_valve.readTemperatures(t);
  report("readTemperatures", st);
  if (!st.ok()) return;
  print_temperature("current", t.current);
  print_temperature("manual", t.manual);
  print_temperature("target_low", t.targetLow);
  print_temperature("target_high", t.targetHigh);
  print_temperature("offset", t.offset);
  Serial.printf("  %-12s %d\n", "window_det", t.windowOpenDetection.present ? t.windowOpenDetection.value : -1);
  Serial.printf("  %-12s %d\n", "window_min", t.windowOpenMinutes.present ? t.windowOpenMinutes.value : -1);
}

static void cmd_settemp(const String& args) {
  const int spaceIdx = args.indexOf(' ');
  if (spaceIdx < 0) {
    LOGE("Usage: settemp manual|low|high|offset C|none");
    return;
  }
  const String field = args.substring(0, spaceIdx);
  String valueText = args.substring(spaceIdx + 1);
  valueText.trim();

  CometBlue::Temperature value;
  if (!parse_temperature(valueText, value)) {
    LOGE("Temperature must be a number or 'none'");
    return;
  }

  // Untouched fields stay absent and are left alone by the device
  CometBlue::Temperatures t;
  if (field == "manual") {
    t.manual = value;
  } else if (field == "low") {
    t.targetLow = value;
  } else if (field == "high") {
    t.targetHigh = value;
  } else if (field == "offset") {
    t.offset = value;
  } else {
    LOGE("Unknown field '%s'", field.c_str());
    return;
  }
  const CometBlue::Status st = g_valve.setTemperatures(t);
  report("setTemperatures", st);
  if (st.ok()) LOGI("%s updated", field.c_str());
}

static void cmd_window(const String& args) {
  int detect = 0;
  int minutes = 0;
  if (sscanf(args.c_str(), "%d %d", &detect, &minutes) != 2 ||
      detect < -127 || detect > 127 || minutes < -127 || minutes > 127) {
    LOGE("Usage: window DETECT MINUTES (-127..127)");
    return;
  }
  CometBlue::Temperatures t;
  t.windowOpenDetection = CometBlue::Setting::of(static_cast<int8_t>(detect));
  t.windowOpenMinutes = CometBlue::Setting::of(static_cast<int8_t>(minutes));
  const CometBlue::Status st = g_valve.setTemperatures(t);
  report("setTemperatures", st);
}

static void cmd_battery() {
  CometBlue::Battery b;
  const CometBlue::Status st = g_valve.readBattery(b);
  report("readBattery", st);
  if (!st.ok()) return;
  if (b.present) {
    Serial.printf("  battery %u%%\n", b.percent);
  } else {
    Serial.println("  battery unknown");
  }
}

static void cmd_lcd(const String& args) {
  CometBlue::LcdTimer lcd;
  if (args.length() == 0) {
    const CometBlue::Status st = g_valve.readLcdTimer(lcd);
    report("readLcdTimer", st);
    if (st.ok()) Serial.printf("  lcd timer %u\n", lcd.value);
    return;
  }
  const long value = strtol(args.c_str(), nullptr, 10);
  if (value < 0 || value > 255) {
    LOGE("LCD timer must be 0-255");
    return;
  }
  lcd.value = static_cast<uint8_t>(value);
  report("setLcdTimer", g_valve.setLcdTimer(lcd));
}

static void cmd_flags(const String& args) {
  CometBlue::Flags flags;
  if (args.length() == 0) {
    const CometBlue::Status st = g_valve.readFlags(flags);
    report("readFlags", st);
    if (st.ok()) Serial.printf("  flags 0x%02X\n", flags.raw);
    return;
  }
  const long value = strtol(args.c_str(), nullptr, 0);
  if (value < 0 || value > 255) {
    LOGE("Flags must be 0-255");
    return;
  }
  flags.raw = static_cast<uint8_t>(value);
  report("setFlags", g_valve.setFlags(flags));
}

static void cmd_days() {
  CometBlue::DaySchedule week[CometBlue::cmd::DAY_COUNT];
  const CometBlue::Status st = g_valve.readDays(week);
  report("readDays", st);
  if (!st.ok()) return;
  for (uint8_t d = 0; d < CometBlue::cmd::DAY_COUNT; ++d) {
    print_day(d, week[d]);
  }
}

static void cmd_day(const String& args) {
  String dayText = args;
  String periods;
  const int spaceIdx = args.indexOf(' ');
  if (spaceIdx >= 0) {
    dayText = args.substring(0, spaceIdx);
    periods = args.substring(spaceIdx + 1);
  }
  uint8_t day = 0;
  if (!CometBlue::codec::parseWeekday(dayText.c_str(), day)) {
    LOGE("Unknown weekday '%s'", dayText.c_str());
    return;
  }

  CometBlue::DaySchedule schedule;
  if (periods.length() == 0) {
    const CometBlue::Status st = g_valve.readDay(day, schedule);
    report("readDay", st);
    if (st.ok()) print_day(day, schedule);
    return;
  }

  const char* p = periods.c_str();
  while (*p != '\0') {
    unsigned sh = 0, sm = 0, eh = 0, em = 0;
    int n = 0;
    if (sscanf(p, " %2u:%2u-%2u:%2u%n", &sh, &sm, &eh, &em, &n) != 4 ||
        sh > 23 || sm > 59 || eh > 23 || em > 59) {
      LOGE("Periods must be HH:MM-HH:MM");
      return;
    }
    if (!schedule.add(static_cast<uint16_t>(sh * 60 + sm), static_cast<uint16_t>(eh * 60 + em))) {
      LOGE("At most %u periods per day", static_cast<unsigned>(CometBlue::cmd::PERIODS_PER_DAY));
      return;
    }
    p += n;
    while (*p == ' ') ++p;
  }
  const CometBlue::Status st = g_valve.setDay(day, schedule);
  report("setDay", st);
  if (st.ok()) print_day(day, schedule);
}

static void cmd_holidays() {
  CometBlue::Holiday holidays[CometBlue::cmd::HOLIDAY_COUNT];
  const CometBlue::Status st = g_valve.readHolidays(holidays);
  report("readHolidays", st);
  if (!st.ok()) return;
  for (const CometBlue::Holiday& h : holidays) {
    print_holiday(h);
  }
}

static void cmd_holiday(const String& args) {
  char* rest = nullptr;
  const long index = strtol(args.c_str(), &rest, 10);
  if (rest == args.c_str() || index < 1 || index > CometBlue::cmd::HOLIDAY_COUNT) {
    LOGE("Usage: holiday N [clear | START END C]");
    return;
  }
  while (*rest == ' ') ++rest;

  CometBlue::Holiday h;
  if (*rest == '\0') {
    const CometBlue::Status st = g_valve.readHoliday(static_cast<uint8_t>(index), h);
    report("readHoliday", st);
    if (st.ok()) print_holiday(h);
    return;
  }

  h.index = static_cast<uint8_t>(index);
  if (strcmp(rest, "clear") != 0) {
    int used = 0;
    if (!parse_datetime(rest, h.start, &used)) {
      LOGE("START must be YYYY-MM-DD HH:MM");
      return;
    }
    rest += used;
    while (*rest == ' ') ++rest;
    if (!parse_datetime(rest, h.end, &used)) {
      LOGE("END must be YYYY-MM-DD HH:MM");
      return;
    }
    rest += used;
    while (*rest == ' ') ++rest;
    if (!parse_temperature(String(rest), h.temperature)) {
      LOGE("Temperature must be a number");
      return;
    }
  }
  const CometBlue::Status st = g_valve.setHoliday(h);
  report("setHoliday", st);
  if (st.ok()) print_holiday(h);
}

static void cmd_backup() {
  CometBlue::Snapshot snapshot;
  CometBlue::Status st = g_valve.backup(snapshot);
  report("backup", st);
  if (!st.ok()) return;

  size_t written = 0;
  st = CometBlue::backup::toJson(snapshot, g_json, sizeof(g_json), written);
  report("toJson", st);
  if (!st.ok()) return;
  Serial.println(g_json);
  LOGI("Backup: %u bytes", static_cast<unsigned>(written));
}

static void cmd_restore(const String& args) {
  if (args.length() == 0) {
    LOGE("Usage: restore {json on one line}");
    return;
  }
  CometBlue::Snapshot snapshot;
  CometBlue::Status st = CometBlue::backup::fromJson(args.c_str(), args.length(), snapshot);
  report("fromJson", st);
  if (!st.ok()) return;

  st = g_valve.restore(snapshot);
  report("restore", st);
  if (st.ok()) LOGI("Restore complete");
}

static void cmd_verbose(const String& args) {
  g_verbose = (args == "1" || args == "on");
  LOGI("Verbose %s", g_verbose ? "on" : "off");
}

/**
 * @brief Process command string.
 */
static void process_command(const String& line) {
  String cmd;
  String args;
  cli_shell::splitCommand(line, cmd, args);

  if (cmd == "help" || cmd == "?") {
    print_help();
  } else if (cmd == "connect") {
    cmd_connect(args);
  } else if (cmd == "disconnect") {
    g_valve.end();
    LOGI("Disconnected");
  } else if (cmd == "pin") {
    cmd_pin(args);
  } else if (cmd == "drv") {
    printHealthView(g_valve);
  } else if (cmd == "verbose") {
    cmd_verbose(args);
  } else if (cmd == "info") {
    cmd_info();
  } else if (cmd == "time") {
    cmd_time();
  } else if (cmd == "settime") {
    cmd_settime(args);
  } else if (cmd == "sync") {
    cmd_sync(args);
  } else if (cmd == "temps") {
    cmd_temps();
  } else if (cmd == "settemp") {
    cmd_settemp(args);
  } else if (cmd == "window") {
    cmd_window(args);
  } else if (cmd == "battery") {
    cmd_battery();
  } else if (cmd == "lcd") {
    cmd_lcd(args);
  } else if (cmd == "flags") {
    cmd_flags(args);
  } else if (cmd == "days") {
    cmd_days();
  } else if (cmd == "day") {
    cmd_day(args);
  } else if (cmd == "holidays") {
    cmd_holidays();
  } else if (cmd == "holiday") {
    cmd_holiday(args);
  } else if (cmd == "backup") {
    cmd_backup();
  } else if (cmd == "restore") {
    cmd_restore(args);
  } else {
    LOGW("Unknown command: '%s'. Type 'help' for available commands.", cmd.c_str());
  }
}

void setup() {
  delay(1000);  // USB-CDC enumeration delay
  Serial.begin(115200);
  while (!Serial && millis() < 4000) {
    delay(10);
  }

  print_help();

  LOGI("Initializing NimBLE...");
  g_client = transport::initBle();
  if (g_client == nullptr) {
    LOGE("NimBLE client creation failed");
    return;
  }

  LOGI("Type 'connect E0:E5:CF:xx:xx:xx 0' to start");
  Serial.print("> ");
}

void loop() {
  String line;
  if (cli_shell::readLine(line)) {
    process_command(line);
    Serial.print("> ");
  }

  delay(10);
}
