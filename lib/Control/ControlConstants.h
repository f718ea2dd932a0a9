/**
 * @file ControlConstants.h
 * @brief Implementation constants for ControlLoop
 *
 * This file contains constants that are implementation details and
 * typically don't need modification during tuning:
 * - Derived values (calculated from config.h values)
 * - Capacity validation of the build-time defaults
 * - Display line IDs
 *
 * For tunable parameters (targets, learning rates, timing), see config.h
 */

#ifndef CONTROL_CONSTANTS_H
#define CONTROL_CONSTANTS_H

#include "ActionSpace.h"
#include "ControlTypes.h"
#include "HistoryBuffer.h"
#include "config.h"

// =============================================================================
// Derived Constants (calculated from config.h values)
// =============================================================================

constexpr size_t axisSteps(int min_pct, int max_pct, int step_pct) {
    return static_cast<size_t>((max_pct - min_pct) / step_pct) + 1;
}

constexpr size_t DEFAULT_ACTION_COUNT =
    axisSteps(Fans::RADIATOR_MIN_PCT, Fans::RADIATOR_MAX_PCT,
              Fans::RADIATOR_STEP_PCT) *
    axisSteps(Fans::STORAGE_MIN_PCT, Fans::STORAGE_MAX_PCT,
              Fans::STORAGE_STEP_PCT);

constexpr float MAX_TOTAL_SPEED_PCT =
    static_cast<float>(Fans::RADIATOR_MAX_PCT + Fans::STORAGE_MAX_PCT);

// =============================================================================
// Build-time validation of the defaults
// =============================================================================

static_assert(Fans::RADIATOR_STEP_PCT > 0 && Fans::STORAGE_STEP_PCT > 0,
              "Fan step must be positive");
static_assert(Fans::RADIATOR_MAX_PCT <= 100 && Fans::STORAGE_MAX_PCT <= 100,
              "Fan duty cannot exceed 100%");
static_assert((Fans::RADIATOR_MAX_PCT - Fans::RADIATOR_MIN_PCT) %
                          Fans::RADIATOR_STEP_PCT ==
                      0 &&
                  (Fans::STORAGE_MAX_PCT - Fans::STORAGE_MIN_PCT) %
                          Fans::STORAGE_STEP_PCT ==
                      0,
              "Fan max must be a whole number of steps above min");
static_assert(DEFAULT_ACTION_COUNT <= MAX_ACTIONS,
              "Default fan grid exceeds the action space capacity");
static_assert(StateBucketing::HISTORY_LENGTH >= 1 &&
                  StateBucketing::HISTORY_LENGTH <= MAX_HISTORY_LENGTH,
              "History length exceeds the history buffer capacity");
static_assert(QLearning::EPSILON_MIN <= QLearning::EPSILON_START,
              "Epsilon floor above its starting value");
static_assert(Emergency::RADIATOR_CRITICAL_C > Targets::RADIATOR_C &&
                  Emergency::STORAGE_CRITICAL_C > Targets::STORAGE_C,
              "Critical thresholds must sit above the targets");
static_assert(MainLoop::SAVE_INTERVAL_CYCLES >= 1,
              "Save interval must be at least one cycle");

// =============================================================================
// Display Line IDs
// =============================================================================

namespace LineId {
constexpr const char *STATE = "CL_STATE";
constexpr const char *RADIATOR = "CL_RAD";
constexpr const char *STORAGE = "CL_STO";
constexpr const char *FANS = "CL_FANS";
constexpr const char *EPSILON = "CL_EPS";
constexpr const char *REWARD = "CL_RWD";
constexpr const char *QSTATES = "CL_QS";
} // namespace LineId

#endif // CONTROL_CONSTANTS_H
