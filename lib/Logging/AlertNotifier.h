/**
 * @file AlertNotifier.h
 * @brief Operator notifications: live log + persistent event log
 *
 * Every alert is shown on the screen log area, printed to Serial and kept in
 * the CrashLog file so it survives a reset. Never blocks.
 */

#ifndef ALERT_NOTIFIER_H
#define ALERT_NOTIFIER_H

#include "Collaborators.h"
#include "Logger.h"

class AlertNotifier : public NotificationSink {
  public:
    explicit AlertNotifier(Logger &logger);

    void notify(const char *subject, const char *message) override;

    unsigned long alertCount() const { return _alert_count; }

  private:
    Logger &_logger;
    unsigned long _alert_count;
};

#endif // ALERT_NOTIFIER_H
