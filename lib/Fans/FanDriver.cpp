/**
 * @file FanDriver.cpp
 * @brief Implementation of LEDC fan PWM outputs
 */

#include "FanDriver.h"
#include "config.h"

FanDriver::FanDriver(Logger &logger)
    : _logger(logger),
      _radiator{PIN_FAN_RADIATOR_PWM, Fans::RADIATOR_LEDC_CHANNEL, false, 0},
      _storage{PIN_FAN_STORAGE_PWM, Fans::STORAGE_LEDC_CHANNEL, false, 0} {}

FanDriver::Output &FanDriver::output(FanGroup group) {
    return group == FanGroup::RADIATOR ? _radiator : _storage;
}

const FanDriver::Output &FanDriver::output(FanGroup group) const {
    return group == FanGroup::RADIATOR ? _radiator : _storage;
}

uint32_t FanDriver::dutyFor(int percent) {
    const uint32_t full_scale = (1UL << Fans::PWM_RESOLUTION_BITS) - 1;
    return (full_scale * static_cast<uint32_t>(percent) + 50) / 100;
}

bool FanDriver::setupOutput(Output &out, const char *name) {
    // ledcSetup returns the achieved frequency, 0 on failure
    if (ledcSetup(out.channel, Fans::PWM_FREQUENCY_HZ,
                  Fans::PWM_RESOLUTION_BITS) == 0) {
        _logger.logf(false, "CRIT: %s fan PWM setup failed", name);
        return false;
    }
    ledcAttachPin(out.pin, out.channel);
    ledcWrite(out.channel, dutyFor(100));
    out.percent = 100;
    out.ready = true;
    return true;
}

bool FanDriver::begin() {
    bool rad_ok = setupOutput(_radiator, "Radiator");
    bool sto_ok = setupOutput(_storage, "Storage");
    if (rad_ok && sto_ok) {
        _logger.log("Fans: 100% until first decision");
    }
    return rad_ok && sto_ok;
}

ActuationStatus FanDriver::setSpeed(FanGroup group, int percent) {
    Output &out = output(group);
    if (!out.ready)
        return ActuationStatus::NOT_READY;
    if (percent < 0 || percent > 100)
        return ActuationStatus::OUT_OF_RANGE;

    ledcWrite(out.channel, dutyFor(percent));
    out.percent = percent;
    return ActuationStatus::OK;
}

int FanDriver::getSpeed(FanGroup group) const { return output(group).percent; }
