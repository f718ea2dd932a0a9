/**
 * @file TimeService.h
 * @brief One-shot WiFi + NTP time synchronization and timestamps
 *
 * TimeService provides:
 * - A bounded, boot-time attempt to sync wall clock time via WiFi + NTP
 * - A validity flag indicating whether wall time is available
 * - Timestamps for logs, telemetry rows and the event log, falling back to
 *   uptime when wall time is not available
 */

#ifndef TIME_SERVICE_H
#define TIME_SERVICE_H

#include <Arduino.h>

using TimeLogCallback = void (*)(const char *message, bool serialOnly);

namespace TimeService {

/**
 * @brief Attempt to sync time using home WiFi + NTP.
 *
 * Uses WIFI_SSID / WIFI_PASSWORD from env.h when available. Bounded by the
 * WiFiTimeSync timeouts in config.h.
 *
 * @param logCb Optional logging sink for progress messages
 * @return true if wall time became valid
 */
bool trySyncFromWifi(TimeLogCallback logCb = nullptr);

bool isWallTimeValid();

/**
 * @brief Current local time as YYYY-MM-DDTHH:MM:SS, or nullptr before sync
 */
const char *getIsoTimestamp();

/**
 * @brief Write the wall time, or "+HHH:MM:SS" uptime before sync
 */
void formatTimestamp(char *buf, size_t size);

} // namespace TimeService

#endif // TIME_SERVICE_H
