/**
 * @file HardwareRandom.h
 * @brief RandomSource backed by the ESP32 hardware RNG
 */

#ifndef HARDWARE_RANDOM_H
#define HARDWARE_RANDOM_H

#include "RandomSource.h"
#include <Arduino.h>

class HardwareRandom : public RandomSource {
  public:
    float uniform() override {
        // 24 random bits map exactly onto float precision, result < 1.0
        return static_cast<float>(esp_random() >> 8) / 16777216.0f;
    }

    size_t index(size_t count) override {
        if (count == 0)
            return 0;
        return static_cast<size_t>(esp_random() % count);
    }
};

#endif // HARDWARE_RANDOM_H
