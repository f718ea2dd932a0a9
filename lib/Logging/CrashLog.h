/**
 * @file CrashLog.h
 * @brief Persistent event log for critical events (LittleFS)
 *
 * USAGE:
 * ------
 * After mounting LittleFS:
 *   CrashLog::begin(LittleFS);
 *   CrashLog::logResetReason();
 *
 * Then from anywhere:
 *   CrashLog::logCritical("ALERT", "Radiator 66.2C > 65.0C");
 *
 * Entries are one line each, "[timestamp] CATEGORY: message". The file is
 * truncated and restarted once it exceeds Storage::EVENT_LOG_MAX_BYTES. If
 * the filesystem is unavailable, entries still go to Serial.
 */

#ifndef CRASH_LOG_H
#define CRASH_LOG_H

#include <Arduino.h>
#include <FS.h>

class CrashLog {
  public:
    /**
     * @brief Attach to a mounted filesystem
     * @return true if the log file can be opened for append
     */
    static bool begin(fs::FS &fs);

    static void logCritical(const char *message);
    static void logCritical(const char *category, const char *message);

    static void dumpToSerial();
    static void clear();

    static bool isAvailable() { return _fs != nullptr; }

    /**
     * @brief Record why the chip last reset (watchdog, brownout, ...)
     */
    static void logResetReason();

    static const char *getResetReasonString();

  private:
    static fs::FS *_fs;
    static constexpr size_t MAX_ENTRY_SIZE = 160;
};

#endif // CRASH_LOG_H
