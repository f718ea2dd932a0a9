/**
 * @file ControllerConfig.cpp
 * @brief Build defaults and validation for the controller configuration
 */

#include "ControllerConfig.h"
#include "ActionSpace.h"
#include "ControlConstants.h"
#include "HistoryBuffer.h"
#include "QTable.h"
#include "StateEncoder.h"
#include "config.h"
#include <cstdio>

ControllerConfig ControllerConfig::fromBuildDefaults() {
    ControllerConfig c;

    c.radiator_fans = {Fans::RADIATOR_MIN_PCT, Fans::RADIATOR_MAX_PCT,
                       Fans::RADIATOR_STEP_PCT};
    c.storage_fans = {Fans::STORAGE_MIN_PCT, Fans::STORAGE_MAX_PCT,
                      Fans::STORAGE_STEP_PCT};

    namespace Rad = RewardZones::Radiator;
    namespace Sto = RewardZones::Storage;
    c.reward.radiator = {Targets::RADIATOR_C,  Hysteresis::RADIATOR_C,
                         Rad::EXCELLENT_BAND_C, Rad::GOOD_BAND_C,
                         Rad::PERFECT_BASE,     Rad::PERFECT_SLOPE,
                         Rad::EXCELLENT_BASE,   Rad::EXCELLENT_SLOPE,
                         Rad::GOOD_BASE,        Rad::GOOD_SLOPE,
                         Rad::FAR_SLOPE,        Rad::FAR_EXPONENT};
    c.reward.storage = {Targets::STORAGE_C,   Hysteresis::STORAGE_C,
                        Sto::EXCELLENT_BAND_C, Sto::GOOD_BAND_C,
                        Sto::PERFECT_BASE,     Sto::PERFECT_SLOPE,
                        Sto::EXCELLENT_BASE,   Sto::EXCELLENT_SLOPE,
                        Sto::GOOD_BASE,        Sto::GOOD_SLOPE,
                        Sto::FAR_SLOPE,        Sto::FAR_EXPONENT};
    c.reward.noise_penalty = QLearning::NOISE_PENALTY;
    c.reward.efficiency_bonus = RewardZones::EFFICIENCY_BONUS;
    c.reward.below_target_bonus = RewardZones::BELOW_TARGET_BONUS;
    c.reward.max_total_speed = MAX_TOTAL_SPEED_PCT;

    c.learning = {QLearning::ALPHA, QLearning::GAMMA, QLearning::EPSILON_START,
                  QLearning::EPSILON_MIN, QLearning::EPSILON_DECAY};

    c.bucket_step = StateBucketing::STEP_C;
    c.history_length = StateBucketing::HISTORY_LENGTH;

    c.emergency = {Emergency::RADIATOR_CRITICAL_C,
                   Emergency::STORAGE_CRITICAL_C, Emergency::REARM_MARGIN_C};

    c.timing = {MainLoop::INTERVAL_MS, MainLoop::RETRY_INTERVAL_MS,
                MainLoop::SAVE_INTERVAL_CYCLES,
                MainLoop::SENSOR_FAILSAFE_CYCLES,
                MainLoop::ACTUATION_FAILURE_LIMIT};

    c.next_state_mode = FEATURE_SELF_TRANSITION_UPDATE
                            ? NextStateMode::SELF_TRANSITION
                            : NextStateMode::NEXT_STATE;
    c.reset_qtable = Storage::RESET_QTABLE_ON_BOOT;
    return c;
}

static bool fail(char *reason, size_t size, const char *msg) {
    if (reason != nullptr && size > 0)
        snprintf(reason, size, "%s", msg);
    return false;
}

// The maximum must be a grid point: the override and failsafe drive it
static bool validRange(const FanRange &r) {
    return r.step_pct > 0 && r.min_pct >= 0 && r.max_pct <= 100 &&
           r.min_pct <= r.max_pct && (r.max_pct - r.min_pct) % r.step_pct == 0;
}

static bool validZone(const ZoneReward &z) {
    return z.hysteresis >= 0.0f && z.hysteresis <= z.excellent_band &&
           z.excellent_band <= z.good_band && z.far_slope >= 0.0f &&
           z.far_exponent > 0.0f;
}

bool ControllerConfig::validate(char *reason, size_t reason_size) const {
    if (!validRange(radiator_fans))
        return fail(reason, reason_size, "radiator fan range invalid");
    if (!validRange(storage_fans))
        return fail(reason, reason_size, "storage fan range invalid");
    if (ActionSpace::axisSize(radiator_fans) *
            ActionSpace::axisSize(storage_fans) >
        MAX_ACTIONS)
        return fail(reason, reason_size, "fan grid too large");

    if (!validZone(reward.radiator))
        return fail(reason, reason_size, "radiator reward bands invalid");
    if (!validZone(reward.storage))
        return fail(reason, reason_size, "storage reward bands invalid");
    if (reward.noise_penalty < 0.0f || reward.efficiency_bonus < 0.0f ||
        reward.below_target_bonus < 0.0f)
        return fail(reason, reason_size, "reward weights negative");
    if (reward.max_total_speed <= 0.0f)
        return fail(reason, reason_size, "max total speed not positive");

    if (!(learning.alpha > 0.0f && learning.alpha <= 1.0f))
        return fail(reason, reason_size, "alpha out of (0,1]");
    if (!(learning.gamma >= 0.0f && learning.gamma < 1.0f))
        return fail(reason, reason_size, "gamma out of [0,1)");
    if (!(learning.epsilon_min >= 0.0f &&
          learning.epsilon_min <= learning.epsilon_start &&
          learning.epsilon_start <= 1.0f))
        return fail(reason, reason_size, "epsilon bounds invalid");
    if (!(learning.epsilon_decay > 0.0f && learning.epsilon_decay <= 1.0f))
        return fail(reason, reason_size, "epsilon decay out of (0,1]");

    if (!(bucket_step > 0.0f))
        return fail(reason, reason_size, "bucket step not positive");
    // Every plausible state must fit the Q-table at least once
    float axis = StateEncoder::axisBuckets(Limits::MIN_VALID_C,
                                           Limits::MAX_VALID_C, bucket_step);
    if (axis * axis > static_cast<float>(MAX_QTABLE_ENTRIES))
        return fail(reason, reason_size, "bucket step too fine");
    if (history_length < 1 || history_length > MAX_HISTORY_LENGTH)
        return fail(reason, reason_size, "history length out of range");

    if (emergency.radiator_critical <= reward.radiator.target ||
        emergency.storage_critical <= reward.storage.target)
        return fail(reason, reason_size, "critical below target");
    if (emergency.rearm_margin < 0.0f)
        return fail(reason, reason_size, "rearm margin negative");

    if (timing.interval_ms == 0 || timing.retry_interval_ms == 0)
        return fail(reason, reason_size, "loop interval zero");
    if (timing.save_interval_cycles == 0)
        return fail(reason, reason_size, "save interval zero");
    if (timing.sensor_failsafe_cycles == 0 ||
        timing.actuation_failure_limit == 0)
        return fail(reason, reason_size, "failure limits zero");

    if (reason != nullptr && reason_size > 0)
        reason[0] = '\0';
    return true;
}
