/**
 * @file RandomSource.h
 * @brief Source of uniform random draws for action selection
 *
 * The policy only needs two kinds of draw. On the board HardwareRandom backs
 * this with the ESP32 RNG; tests script the sequence.
 */

#ifndef RANDOM_SOURCE_H
#define RANDOM_SOURCE_H

#include <cstddef>

class RandomSource {
  public:
    virtual ~RandomSource() {}

    /**
     * @brief Uniform float in [0, 1)
     */
    virtual float uniform() = 0;

    /**
     * @brief Uniform index in [0, count), count > 0
     */
    virtual size_t index(size_t count) = 0;
};

#endif // RANDOM_SOURCE_H
