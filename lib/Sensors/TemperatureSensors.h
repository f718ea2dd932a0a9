/**
 * @file TemperatureSensors.h
 * @brief Radiator and storage probes on one OneWire bus
 *
 * This class owns the bus and all DS18B20 probes (addresses in pins.h):
 * - one radiator outlet probe
 * - STORAGE_PROBE_COUNT drive bay probes
 *
 * It runs non-blocking bus-wide conversions from update() and serves the
 * latest values to the control loop through the Sampler interface:
 * - a probe that never answered or is in error is UNAVAILABLE
 * - a value older than Limits::SAMPLE_MAX_AGE_MS is STALE
 * - a value outside [Limits::MIN_VALID_C, Limits::MAX_VALID_C] is IMPLAUSIBLE
 * Storage probes failing any of these are left out of the storage list.
 *
 * USAGE:
 * ------
 * TemperatureSensors sensors(logger);
 * sensors.begin();
 *
 * // In loop:
 * sensors.update();
 */

#ifndef TEMPERATURE_SENSORS_H
#define TEMPERATURE_SENSORS_H

#include "Collaborators.h"
#include "DS18B20.h"
#include "Logger.h"
#include "config.h"
#include <DallasTemperature.h>
#include <OneWire.h>

class TemperatureSensors : public Sampler {
  public:
    explicit TemperatureSensors(Logger &logger);

    void begin();

    /**
     * @brief Advance the conversion cycle (call in main loop)
     */
    void update();

    SampleStatus sampleRadiator(TemperatureSample &out) override;
    size_t sampleStorage(StorageReading *out, size_t max) override;

    const DS18B20Probe &getRadiatorProbe() const { return _radiator; }

  private:
    SampleStatus check(const DS18B20Probe &probe, unsigned long now) const;
    void logSummary();

    Logger &_logger;

    // OneWire bus (owned)
    OneWire _oneWire;
    DallasTemperature _dallasSensors;

    // Probes (owned)
    DS18B20Probe _radiator;
    DS18B20Probe _storage0;
    DS18B20Probe _storage1;
    DS18B20Probe _storage2;
    DS18B20Probe *_storage[STORAGE_PROBE_COUNT];

    bool _conversion_pending;
    unsigned long _conversion_start;
    unsigned long _last_summary_time;
};

#endif // TEMPERATURE_SENSORS_H
