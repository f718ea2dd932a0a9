/**
 * @file RewardModel.h
 * @brief Scores a control outcome as a scalar reward
 *
 * Reward = radiator zone term + storage zone term - noise term + bonuses.
 *
 * Zone term, by absolute error e from the zone target:
 *   PERFECT   e <= hysteresis       perfect_base   - perfect_slope * e
 *   EXCELLENT e <= excellent_band   excellent_base - excellent_slope * e
 *   GOOD      e <= good_band        good_base      - good_slope * e
 *   FAR       otherwise             -far_slope * e^far_exponent
 *
 * Noise term: noise_penalty * (rad + sto) / max_total_speed.
 * Efficiency bonus (both zones PERFECT or EXCELLENT):
 *   efficiency_bonus * (max_total_speed - rad - sto) / max_total_speed,
 * plus below_target_bonus when both readings are also at or below target.
 *
 * Pure: no state, no I/O.
 */

#ifndef REWARD_MODEL_H
#define REWARD_MODEL_H

#include "LearningTypes.h"

/**
 * @brief Which piece of the zone curve a reading fell into
 */
enum class RewardBand { PERFECT, EXCELLENT, GOOD, FAR };

inline const char *bandToString(RewardBand band) {
    switch (band) {
    case RewardBand::PERFECT:
        return "PERFECT";
    case RewardBand::EXCELLENT:
        return "EXCELLENT";
    case RewardBand::GOOD:
        return "GOOD";
    case RewardBand::FAR:
        return "FAR";
    default:
        return "???";
    }
}

/**
 * @brief Breakdown of one score, mainly for logging and tests
 */
struct RewardBreakdown {
    float radiator_term;
    float storage_term;
    float noise_term;
    float bonus_term;
    RewardBand radiator_band;
    RewardBand storage_band;
    float total;
};

class RewardModel {
  public:
    explicit RewardModel(const RewardConfig &config);

    float score(float radiator_c, float storage_c, int radiator_pct,
                int storage_pct) const;

    RewardBreakdown breakdown(float radiator_c, float storage_c,
                              int radiator_pct, int storage_pct) const;

    static RewardBand classify(const ZoneReward &zone, float reading_c);
    static float zoneTerm(const ZoneReward &zone, float reading_c);

    const RewardConfig &config() const { return _config; }

  private:
    RewardConfig _config;
};

#endif // REWARD_MODEL_H
