/**
 * @file TimeService.cpp
 * @brief Implementation of one-shot WiFi + NTP time synchronization
 */

#include "TimeService.h"
#include "config.h"

#include <WiFi.h>
#include <time.h>

#if __has_include("env.h")
#include "env.h"
#define TIME_SERVICE_HAS_WIFI_CREDS 1
#else
#define TIME_SERVICE_HAS_WIFI_CREDS 0
#endif

namespace {
bool wall_time_valid = false;

void report(TimeLogCallback cb, const char *msg) {
    if (cb != nullptr)
        cb(msg, false);
}

#if TIME_SERVICE_HAS_WIFI_CREDS
// Consider wall time valid if epoch is after 2024-01-01.
constexpr time_t VALID_EPOCH_THRESHOLD = 1704067200;
constexpr unsigned long POLL_MS = 200;

void radioOff() {
    WiFi.disconnect(true, true);
    WiFi.mode(WIFI_OFF);
}

bool waitUntil(bool (*done)(), unsigned long timeout_ms) {
    unsigned long start = millis();
    while (!done()) {
        if (millis() - start >= timeout_ms)
            return false;
        delay(POLL_MS);
    }
    return true;
}

bool isConnected() { return WiFi.status() == WL_CONNECTED; }
bool isEpochValid() { return time(nullptr) > VALID_EPOCH_THRESHOLD; }
#endif
} // namespace

namespace TimeService {

bool trySyncFromWifi(TimeLogCallback logCb) {
#if !TIME_SERVICE_HAS_WIFI_CREDS
    report(logCb, "Time sync skipped (no env.h)");
    return false;
#else
    using namespace WiFiTimeSync;

    if (WIFI_SSID == nullptr || WIFI_SSID[0] == '\0') {
        report(logCb, "Time sync skipped (SSID empty)");
        return false;
    }

    report(logCb, "Wi-Fi time sync...");
    wall_time_valid = false;
    WiFi.mode(WIFI_STA);
    WiFi.disconnect(true, true);
    WiFi.begin(WIFI_SSID, WIFI_PASSWORD);

    if (!waitUntil(isConnected, WIFI_CONNECT_TIMEOUT_MS)) {
        radioOff();
        report(logCb, "Time sync failed (connect timeout)");
        return false;
    }

    if (TIME_TZ_STRING != nullptr && TIME_TZ_STRING[0] != '\0') {
        configTzTime(TIME_TZ_STRING, NTP_SERVER_1, NTP_SERVER_2);
    } else {
        configTime(TIME_GMT_OFFSET_SEC, TIME_DAYLIGHT_OFFSET_SEC, NTP_SERVER_1,
                   NTP_SERVER_2);
    }

    wall_time_valid = waitUntil(isEpochValid, NTP_SYNC_TIMEOUT_MS);
    radioOff();

    report(logCb, wall_time_valid ? "Time sync OK"
                                  : "Time sync failed (NTP timeout)");
    return wall_time_valid;
#endif
}

bool isWallTimeValid() { return wall_time_valid; }

const char *getIsoTimestamp() {
    if (!wall_time_valid)
        return nullptr;

    static char buf[24];
    time_t now = time(nullptr);
    struct tm tm_local;
    localtime_r(&now, &tm_local);
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_local);
    return buf;
}

void formatTimestamp(char *buf, size_t size) {
    const char *iso = getIsoTimestamp();
    if (iso != nullptr) {
        snprintf(buf, size, "%s", iso);
        return;
    }
    unsigned long s = millis() / 1000UL;
    snprintf(buf, size, "+%03lu:%02lu:%02lu", s / 3600UL, (s / 60UL) % 60UL,
             s % 60UL);
}

} // namespace TimeService
