/**
 * @file AlertNotifier.cpp
 * @brief Implementation of operator notifications
 */

#include "AlertNotifier.h"
#include "CrashLog.h"

AlertNotifier::AlertNotifier(Logger &logger)
    : _logger(logger), _alert_count(0) {}

void AlertNotifier::notify(const char *subject, const char *message) {
    _alert_count++;
    _logger.logf(false, "ALERT: %s", subject);
    _logger.logf(true, "ALERT: %s - %s", subject, message);

    char entry[128];
    snprintf(entry, sizeof(entry), "%s - %s", subject, message);
    CrashLog::logCritical("ALERT", entry);
}
