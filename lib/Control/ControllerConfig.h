/**
 * @file ControllerConfig.h
 * @brief Runtime configuration record for the fan controller
 *
 * Built from the config.h defaults with fromBuildDefaults(), optionally
 * adjusted (tests do this), then checked once by validate() before the
 * controller starts. An invalid record keeps the controller from starting.
 */

#ifndef CONTROLLER_CONFIG_H
#define CONTROLLER_CONFIG_H

#include "ControlTypes.h"
#include "LearningTypes.h"
#include <cstddef>

struct EmergencyConfig {
    float radiator_critical;
    float storage_critical;
    float rearm_margin;
};

struct LoopTiming {
    unsigned long interval_ms;
    unsigned long retry_interval_ms;
    unsigned long save_interval_cycles;
    unsigned int sensor_failsafe_cycles;
    unsigned int actuation_failure_limit;
};

struct ControllerConfig {
    FanRange radiator_fans;
    FanRange storage_fans;
    RewardConfig reward;
    LearningConfig learning;
    float bucket_step;
    size_t history_length;
    EmergencyConfig emergency;
    LoopTiming timing;
    NextStateMode next_state_mode;
    bool reset_qtable; // Ignore any persisted table on start

    static ControllerConfig fromBuildDefaults();

    /**
     * @brief Check every option for range and consistency
     * @param reason Receives a short description of the first problem found
     * @return true if the record is usable
     */
    bool validate(char *reason, size_t reason_size) const;
};

#endif // CONTROLLER_CONFIG_H
