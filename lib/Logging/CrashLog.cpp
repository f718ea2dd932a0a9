/**
 * @file CrashLog.cpp
 * @brief LittleFS-backed event log
 */

#include "CrashLog.h"
#include "TimeService.h"
#include "config.h"
#include <cstring>
#include <esp_system.h>

fs::FS *CrashLog::_fs = nullptr;

bool CrashLog::begin(fs::FS &fs) {
    File f = fs.open(Storage::EVENT_LOG_PATH, FILE_APPEND);
    if (!f) {
        Serial.println("CrashLog: cannot open event log, serial only");
        return false;
    }
    f.close();
    _fs = &fs;
    return true;
}

const char *CrashLog::getResetReasonString() {
    switch (esp_reset_reason()) {
    case ESP_RST_POWERON:
        return "Power-on";
    case ESP_RST_EXT:
        return "External reset";
    case ESP_RST_SW:
        return "Software reset";
    case ESP_RST_PANIC:
        return "Exception/panic";
    case ESP_RST_INT_WDT:
        return "Interrupt watchdog";
    case ESP_RST_TASK_WDT:
        return "Task watchdog";
    case ESP_RST_WDT:
        return "Other watchdog";
    case ESP_RST_DEEPSLEEP:
        return "Deep sleep wake";
    case ESP_RST_BROWNOUT:
        return "Brownout";
    default:
        return "Unknown";
    }
}

void CrashLog::logResetReason() {
    logCritical("BOOT", getResetReasonString());
}

void CrashLog::logCritical(const char *message) {
    logCritical("EVENT", message);
}

void CrashLog::logCritical(const char *category, const char *message) {
    char entry[MAX_ENTRY_SIZE];
    char stamp[24];
    TimeService::formatTimestamp(stamp, sizeof(stamp));
    snprintf(entry, sizeof(entry), "[%s] %s: %s", stamp, category, message);

    Serial.printf("CRASH %s\n", entry);

    if (_fs == nullptr)
        return;

    File f = _fs->open(Storage::EVENT_LOG_PATH, FILE_APPEND);
    if (!f)
        return;
    if (f.size() + strlen(entry) + 1 > Storage::EVENT_LOG_MAX_BYTES) {
        f.close();
        f = _fs->open(Storage::EVENT_LOG_PATH, FILE_WRITE);
        if (!f)
            return;
        f.println("[log truncated]");
    }
    f.println(entry);
    f.close();
}

void CrashLog::dumpToSerial() {
    Serial.println("=== EVENT LOG ===");
    if (_fs == nullptr) {
        Serial.println("(unavailable)");
        return;
    }
    File f = _fs->open(Storage::EVENT_LOG_PATH, FILE_READ);
    if (!f) {
        Serial.println("(empty)");
        return;
    }
    while (f.available()) {
        Serial.write(f.read());
    }
    f.close();
    Serial.println("=== END EVENT LOG ===");
}

void CrashLog::clear() {
    if (_fs != nullptr)
        _fs->remove(Storage::EVENT_LOG_PATH);
}
