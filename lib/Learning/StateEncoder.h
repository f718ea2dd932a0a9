/**
 * @file StateEncoder.h
 * @brief Discretizes smoothed zone temperatures into a State
 *
 * bucket(t) = floor(t / step). Temperatures at or below zero are valid and
 * give zero or negative buckets; rejecting implausible values is the
 * sampler's job. Results saturate at the int16_t limits.
 */

#ifndef STATE_ENCODER_H
#define STATE_ENCODER_H

#include "LearningTypes.h"

class StateEncoder {
  public:
    explicit StateEncoder(float bucket_step);

    State encode(float radiator_c, float storage_c) const;

    static int16_t bucket(float temperature_c, float bucket_step);

    /**
     * @brief Buckets covering [min_c, max_c] on one axis
     *
     * Computed in float so a tiny step reports a huge count instead of
     * overflowing.
     */
    static float axisBuckets(float min_c, float max_c, float bucket_step);

    float bucketStep() const { return _bucket_step; }

  private:
    float _bucket_step;
};

#endif // STATE_ENCODER_H
