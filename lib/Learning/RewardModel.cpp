/**
 * @file RewardModel.cpp
 * @brief Implementation of the piecewise reward curve
 */

#include "RewardModel.h"
#include <cmath>

RewardModel::RewardModel(const RewardConfig &config) : _config(config) {}

RewardBand RewardModel::classify(const ZoneReward &zone, float reading_c) {
    float error = std::fabs(reading_c - zone.target);
    if (error <= zone.hysteresis)
        return RewardBand::PERFECT;
    if (error <= zone.excellent_band)
        return RewardBand::EXCELLENT;
    if (error <= zone.good_band)
        return RewardBand::GOOD;
    return RewardBand::FAR;
}

float RewardModel::zoneTerm(const ZoneReward &zone, float reading_c) {
    float error = std::fabs(reading_c - zone.target);
    switch (classify(zone, reading_c)) {
    case RewardBand::PERFECT:
        return zone.perfect_base - zone.perfect_slope * error;
    case RewardBand::EXCELLENT:
        return zone.excellent_base - zone.excellent_slope * error;
    case RewardBand::GOOD:
        return zone.good_base - zone.good_slope * error;
    case RewardBand::FAR:
    default:
        if (zone.far_exponent == 1.0f)
            return -zone.far_slope * error;
        return -zone.far_slope * std::pow(error, zone.far_exponent);
    }
}

RewardBreakdown RewardModel::breakdown(float radiator_c, float storage_c,
                                       int radiator_pct,
                                       int storage_pct) const {
    RewardBreakdown out;
    out.radiator_band = classify(_config.radiator, radiator_c);
    out.storage_band = classify(_config.storage, storage_c);
    out.radiator_term = zoneTerm(_config.radiator, radiator_c);
    out.storage_term = zoneTerm(_config.storage, storage_c);

    float combined = static_cast<float>(radiator_pct + storage_pct);
    out.noise_term = _config.noise_penalty * combined / _config.max_total_speed;

    out.bonus_term = 0.0f;
    bool rad_close = out.radiator_band == RewardBand::PERFECT ||
                     out.radiator_band == RewardBand::EXCELLENT;
    bool sto_close = out.storage_band == RewardBand::PERFECT ||
                     out.storage_band == RewardBand::EXCELLENT;
    if (rad_close && sto_close) {
        out.bonus_term = _config.efficiency_bonus *
                         (_config.max_total_speed - combined) /
                         _config.max_total_speed;
        if (radiator_c <= _config.radiator.target &&
            storage_c <= _config.storage.target) {
            out.bonus_term += _config.below_target_bonus;
        }
    }

    out.total = out.radiator_term + out.storage_term - out.noise_term +
                out.bonus_term;
    return out;
}

float RewardModel::score(float radiator_c, float storage_c, int radiator_pct,
                         int storage_pct) const {
    return breakdown(radiator_c, storage_c, radiator_pct, storage_pct).total;
}
