/**
 * @file TelemetryLog.h
 * @brief Per-cycle CSV telemetry on LittleFS
 *
 * One row per completed control cycle, appended to Storage::TELEMETRY_PATH.
 * The header row is written when the file is created. When the file grows
 * past Storage::TELEMETRY_MAX_BYTES it is moved to
 * Storage::TELEMETRY_ROTATED_PATH (replacing the previous one) and a fresh
 * file is started.
 *
 * The reward column holds the reward learned during that cycle and is empty
 * when nothing was learned (first cycle in next-state mode, first cycle after
 * a failed sample). In next-state mode it scores the previous cycle's action,
 * which the reward_fan_rad/reward_fan_storage columns name.
 *
 * Write failures are logged once per failure streak and never stop the
 * controller.
 */

#ifndef TELEMETRY_LOG_H
#define TELEMETRY_LOG_H

#include "Collaborators.h"
#include "Logger.h"
#include <Arduino.h>
#include <FS.h>

constexpr const char *TELEMETRY_CSV_HEADER =
    "timestamp,temp_rad_avg,temp_storage_avg,state_rad,state_storage,fan_rad,"
    "fan_storage,reward,reward_fan_rad,reward_fan_storage,epsilon,q_states,"
    "override,actuation_ok";
constexpr size_t MAX_TELEMETRY_ROW_LEN = 160;

class TelemetryLog : public TelemetrySink {
  public:
    TelemetryLog(Logger &logger, fs::FS &fs);

    void setAvailable(bool available) { _available = available; }

    void record(const CycleTelemetry &row) override;

    unsigned long getRowsWritten() const { return _rows_written; }

    /**
     * @brief Format one CSV row (no trailing newline)
     * @return length written, as snprintf
     */
    static int formatRow(char *buf, size_t size, const char *timestamp,
                         const CycleTelemetry &row);

  private:
    bool appendLine(const char *line);
    void rotateIfNeeded();

    Logger &_logger;
    fs::FS &_fs;
    bool _available;
    bool _failing;
    unsigned long _rows_written;
};

#endif // TELEMETRY_LOG_H
