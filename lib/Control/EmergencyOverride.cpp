/**
 * @file EmergencyOverride.cpp
 * @brief Implementation of the critical-temperature guard
 */

#include "EmergencyOverride.h"
#include <cstdio>

EmergencyOverride::EmergencyOverride(Logger &logger,
                                     NotificationSink &notifier,
                                     const EmergencyConfig &config,
                                     const Action &max_action)
    : _logger(logger), _notifier(notifier), _config(config),
      _max_action(max_action), _active(false), _armed(true) {
    _last_reason[0] = '\0';
}

OverrideDecision EmergencyOverride::check(float radiator_c, float storage_c) {
    bool rad_critical = radiator_c > _config.radiator_critical;
    bool sto_critical = storage_c > _config.storage_critical;
    bool critical = rad_critical || sto_critical;

    OverrideDecision decision = {critical, false, _max_action};

    if (critical) {
        if (rad_critical) {
            snprintf(_last_reason, sizeof(_last_reason),
                     "Radiator %.1fC > %.1fC", radiator_c,
                     _config.radiator_critical);
        } else {
            snprintf(_last_reason, sizeof(_last_reason),
                     "Storage %.1fC > %.1fC", storage_c,
                     _config.storage_critical);
        }

        if (!_active) {
            decision.entered = true;
            _logger.logf(false, "CRIT: %s, fans forced to max", _last_reason);
            if (_armed) {
                _notifier.notify("Critical temperature", _last_reason);
                _armed = false;
            }
        }
    } else {
        if (_active) {
            _logger.logf("Emergency cleared (R %.1fC, S %.1fC)", radiator_c,
                         storage_c);
        }
        if (!_armed &&
            radiator_c < _config.radiator_critical - _config.rearm_margin &&
            storage_c < _config.storage_critical - _config.rearm_margin) {
            _armed = true;
        }
    }

    _active = critical;
    return decision;
}
