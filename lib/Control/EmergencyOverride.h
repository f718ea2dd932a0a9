/**
 * @file EmergencyOverride.h
 * @brief Forces maximum cooling when any zone reading is critical
 *
 * Checked every completed sampling cycle before the policy, using the most
 * recent instantaneous reading of each zone (not the smoothed mean, so a
 * spike is acted on immediately).
 *
 * - Either reading strictly above its critical threshold: the action is the
 *   all-maximum pair and the policy is not consulted.
 * - The operator is notified once per entry into the critical condition.
 *   Another notification is only possible after both readings have dropped
 *   below (critical - rearm_margin), so a probe sitting on the threshold
 *   cannot flood the operator.
 */

#ifndef EMERGENCY_OVERRIDE_H
#define EMERGENCY_OVERRIDE_H

#include "Collaborators.h"
#include "ControllerConfig.h"
#include "Logger.h"

struct OverrideDecision {
    bool active;  // Action must be forced this cycle
    bool entered; // Critical condition started this cycle
    Action action;
};

class EmergencyOverride {
  public:
    EmergencyOverride(Logger &logger, NotificationSink &notifier,
                      const EmergencyConfig &config, const Action &max_action);

    OverrideDecision check(float radiator_c, float storage_c);

    bool isActive() const { return _active; }
    bool isArmed() const { return _armed; }
    const char *getLastReason() const { return _last_reason; }

  private:
    Logger &_logger;
    NotificationSink &_notifier;
    EmergencyConfig _config;
    Action _max_action;

    bool _active; // Above threshold on the last check
    bool _armed;  // Next entry will notify
    char _last_reason[64];
};

#endif // EMERGENCY_OVERRIDE_H
