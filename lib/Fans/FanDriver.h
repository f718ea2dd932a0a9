/**
 * @file FanDriver.h
 * @brief PWM outputs for the radiator and storage fan groups
 *
 * One LEDC channel per group at 25 kHz (4-wire PC fan PWM input). begin()
 * drives both groups to 100% before anything else runs, so a reset or a
 * controller that never starts leaves the machine fully cooled.
 *
 * USAGE:
 * ------
 * FanDriver fans(logger);
 * fans.begin();
 * fans.setSpeed(FanGroup::RADIATOR, 40);
 */

#ifndef FAN_DRIVER_H
#define FAN_DRIVER_H

#include "Collaborators.h"
#include "Logger.h"
#include <Arduino.h>

class FanDriver : public Actuator {
  public:
    explicit FanDriver(Logger &logger);

    /**
     * @brief Configure both channels and drive them to 100%
     * @return false if a channel could not be configured
     */
    bool begin();

    ActuationStatus setSpeed(FanGroup group, int percent) override;

    int getSpeed(FanGroup group) const;

  private:
    struct Output {
        int pin;
        uint8_t channel;
        bool ready;
        int percent;
    };

    Output &output(FanGroup group);
    const Output &output(FanGroup group) const;
    bool setupOutput(Output &out, const char *name);
    static uint32_t dutyFor(int percent);

    Logger &_logger;
    Output _radiator;
    Output _storage;
};

#endif // FAN_DRIVER_H
