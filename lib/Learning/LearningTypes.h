/**
 * @file LearningTypes.h
 * @brief Value types shared by the learning modules
 *
 * Plain data only. Nothing here depends on Arduino so the learning code can be
 * exercised on any target.
 */

#ifndef LEARNING_TYPES_H
#define LEARNING_TYPES_H

#include <cstddef>
#include <cstdint>

/**
 * @brief Temperature zones handled by the controller
 */
enum class Zone { RADIATOR, STORAGE };

constexpr size_t ZONE_COUNT = 2;

inline size_t zoneIndex(Zone zone) { return static_cast<size_t>(zone); }

inline const char *zoneToString(Zone zone) {
    switch (zone) {
    case Zone::RADIATOR:
        return "radiator";
    case Zone::STORAGE:
        return "storage";
    default:
        return "???";
    }
}

/**
 * @brief Discretized environment state (one bucket index per zone)
 */
struct State {
    int16_t radiator_bucket;
    int16_t storage_bucket;
};

inline bool operator==(const State &a, const State &b) {
    return a.radiator_bucket == b.radiator_bucket &&
           a.storage_bucket == b.storage_bucket;
}

inline bool operator!=(const State &a, const State &b) { return !(a == b); }

/**
 * @brief Fan duty pair, percent per group
 *
 * Ordered radiator first, then storage. That order matches the ActionSpace
 * enumeration and is the greedy tie-break order.
 */
struct Action {
    int16_t radiator_pct;
    int16_t storage_pct;
};

inline bool operator==(const Action &a, const Action &b) {
    return a.radiator_pct == b.radiator_pct && a.storage_pct == b.storage_pct;
}

inline bool operator!=(const Action &a, const Action &b) { return !(a == b); }

inline bool operator<(const Action &a, const Action &b) {
    if (a.radiator_pct != b.radiator_pct)
        return a.radiator_pct < b.radiator_pct;
    return a.storage_pct < b.storage_pct;
}

/**
 * @brief Allowed duty grid for one fan group
 */
struct FanRange {
    int min_pct;
    int max_pct;
    int step_pct;
};

/**
 * @brief Reward shaping for a single zone
 */
struct ZoneReward {
    float target;
    float hysteresis; // Perfect band half-width
    float excellent_band;
    float good_band;
    float perfect_base;
    float perfect_slope;
    float excellent_base;
    float excellent_slope;
    float good_base;
    float good_slope;
    float far_slope;
    float far_exponent;
};

struct RewardConfig {
    ZoneReward radiator;
    ZoneReward storage;
    float noise_penalty;
    float efficiency_bonus;
    float below_target_bonus;
    float max_total_speed; // Sum of both groups at full duty
};

/**
 * @brief Learning rates and exploration schedule
 */
struct LearningConfig {
    float alpha;
    float gamma;
    float epsilon_start;
    float epsilon_min;
    float epsilon_decay;
};

#endif // LEARNING_TYPES_H
