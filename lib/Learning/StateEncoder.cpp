/**
 * @file StateEncoder.cpp
 * @brief Implementation of temperature bucketing
 */

#include "StateEncoder.h"
#include <cmath>
#include <cstdint>

StateEncoder::StateEncoder(float bucket_step) : _bucket_step(bucket_step) {}

int16_t StateEncoder::bucket(float temperature_c, float bucket_step) {
    float b = std::floor(temperature_c / bucket_step);
    if (b >= static_cast<float>(INT16_MAX))
        return INT16_MAX;
    if (b <= static_cast<float>(INT16_MIN))
        return INT16_MIN;
    return static_cast<int16_t>(b);
}

float StateEncoder::axisBuckets(float min_c, float max_c, float bucket_step) {
    return std::floor(max_c / bucket_step) - std::floor(min_c / bucket_step) +
           1.0f;
}

State StateEncoder::encode(float radiator_c, float storage_c) const {
    return {bucket(radiator_c, _bucket_step), bucket(storage_c, _bucket_step)};
}
