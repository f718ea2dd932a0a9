/**
 * @file TelemetryLog.cpp
 * @brief Implementation of the CSV telemetry sink
 */

#include "TelemetryLog.h"
#include "TimeService.h"
#include "config.h"
#include <cstdio>

TelemetryLog::TelemetryLog(Logger &logger, fs::FS &fs)
    : _logger(logger), _fs(fs), _available(false), _failing(false),
      _rows_written(0) {}

int TelemetryLog::formatRow(char *buf, size_t size, const char *timestamp,
                            const CycleTelemetry &row) {
    char reward[32];
    if (row.has_reward) {
        snprintf(reward, sizeof(reward), "%.3f,%d,%d", row.reward,
                 row.rewarded_action.radiator_pct,
                 row.rewarded_action.storage_pct);
    } else {
        snprintf(reward, sizeof(reward), ",,");
    }
    return snprintf(buf, size, "%s,%.2f,%.2f,%d,%d,%d,%d,%s,%.4f,%u,%d,%d",
                    timestamp, row.radiator_mean, row.storage_mean,
                    row.state.radiator_bucket, row.state.storage_bucket,
                    row.action.radiator_pct, row.action.storage_pct, reward,
                    row.epsilon, static_cast<unsigned>(row.q_states),
                    row.override_active ? 1 : 0, row.actuation_ok ? 1 : 0);
}

void TelemetryLog::rotateIfNeeded() {
    File f = _fs.open(Storage::TELEMETRY_PATH, FILE_READ);
    if (!f)
        return;
    size_t size = f.size();
    f.close();
    if (size < Storage::TELEMETRY_MAX_BYTES)
        return;

    _fs.remove(Storage::TELEMETRY_ROTATED_PATH);
    if (_fs.rename(Storage::TELEMETRY_PATH, Storage::TELEMETRY_ROTATED_PATH)) {
        _logger.log("Telemetry rotated", true);
    } else {
        // Could not keep the old data; start over rather than grow forever
        _fs.remove(Storage::TELEMETRY_PATH);
        _logger.log("WARN: Telemetry rotation failed, log restarted");
    }
}

bool TelemetryLog::appendLine(const char *line) {
    rotateIfNeeded();

    bool is_new = !_fs.exists(Storage::TELEMETRY_PATH);
    File f = _fs.open(Storage::TELEMETRY_PATH, FILE_APPEND);
    if (!f)
        return false;
    if (is_new) {
        f.println(TELEMETRY_CSV_HEADER);
    }
    f.println(line);
    bool ok = f.getWriteError() == 0;
    f.close();
    return ok;
}

void TelemetryLog::record(const CycleTelemetry &row) {
    if (!_available)
        return;

    char timestamp[24];
    TimeService::formatTimestamp(timestamp, sizeof(timestamp));
    char line[MAX_TELEMETRY_ROW_LEN];
    formatRow(line, sizeof(line), timestamp, row);

    if (appendLine(line)) {
        _rows_written++;
        if (_failing) {
            _failing = false;
            _logger.log("Telemetry writes resumed");
        }
    } else if (!_failing) {
        _failing = true;
        _logger.log("WARN: Telemetry write failed");
    }
}
