/**
 * @file TemperatureSensors.cpp
 * @brief Implementation of the OneWire probe set and Sampler
 */

#include "TemperatureSensors.h"
#include <cstdio>

static_assert(STORAGE_PROBE_COUNT == 3,
              "TemperatureSensors wires exactly three storage probes");

TemperatureSensors::TemperatureSensors(Logger &logger)
    : _logger(logger), _oneWire(PIN_DS18B20), _dallasSensors(&_oneWire),
      _radiator(logger, _dallasSensors, RADIATOR_PROBE_ADDRESS, "RAD"),
      _storage0(logger, _dallasSensors, STORAGE_PROBE_ADDRESSES[0], "SSD0"),
      _storage1(logger, _dallasSensors, STORAGE_PROBE_ADDRESSES[1], "SSD1"),
      _storage2(logger, _dallasSensors, STORAGE_PROBE_ADDRESSES[2], "SSD2"),
      _storage{&_storage0, &_storage1, &_storage2}, _conversion_pending(false),
      _conversion_start(0), _last_summary_time(0) {}

void TemperatureSensors::begin() {
    _dallasSensors.begin();
    _dallasSensors.setWaitForConversion(false);
    _logger.logf("OneWire: %u devices found",
                 static_cast<unsigned>(_dallasSensors.getDeviceCount()));

    _radiator.begin();
    for (size_t i = 0; i < STORAGE_PROBE_COUNT; i++) {
        _storage[i]->begin();
    }

    _dallasSensors.requestTemperatures();
    _conversion_pending = true;
    _conversion_start = millis();
}

void TemperatureSensors::update() {
    unsigned long now = millis();

    if (!_conversion_pending) {
        if (now - _conversion_start < Intervals::DS18B20_UPDATE_INTERVAL_MS)
            return;
        _dallasSensors.requestTemperatures();
        _conversion_start = now;
        _conversion_pending = true;
        return;
    }

    if (now - _conversion_start < Intervals::DS18B20_CONVERSION_TIME_MS)
        return;
    _conversion_pending = false;

    _radiator.read(now);
    for (size_t i = 0; i < STORAGE_PROBE_COUNT; i++) {
        _storage[i]->read(now);
    }

    if (now - _last_summary_time >= Intervals::SENSOR_SUMMARY_LOG_INTERVAL_MS) {
        _last_summary_time = now;
        logSummary();
    }
}

SampleStatus TemperatureSensors::check(const DS18B20Probe &probe,
                                       unsigned long now) const {
    if (!probe.isConnected())
        return SampleStatus::UNAVAILABLE;
    if (now - probe.getLastReadTime() > Limits::SAMPLE_MAX_AGE_MS)
        return SampleStatus::STALE;
    float t = probe.getTemperature();
    if (t < Limits::MIN_VALID_C || t > Limits::MAX_VALID_C)
        return SampleStatus::IMPLAUSIBLE;
    return SampleStatus::OK;
}

SampleStatus TemperatureSensors::sampleRadiator(TemperatureSample &out) {
    SampleStatus status = check(_radiator, millis());
    if (status == SampleStatus::OK) {
        out.value = _radiator.getTemperature();
        out.timestamp = _radiator.getLastReadTime();
    }
    return status;
}

size_t TemperatureSensors::sampleStorage(StorageReading *out, size_t max) {
    unsigned long now = millis();
    size_t count = 0;
    for (size_t i = 0; i < STORAGE_PROBE_COUNT && count < max; i++) {
        if (check(*_storage[i], now) != SampleStatus::OK)
            continue;
        snprintf(out[count].device_id, sizeof(out[count].device_id), "%s",
                 _storage[i]->getLabel());
        out[count].value = _storage[i]->getTemperature();
        count++;
    }
    return count;
}

void TemperatureSensors::logSummary() {
    char line[96];
    int len = snprintf(line, sizeof(line), "Probes: RAD %.1f",
                       _radiator.getTemperature());
    for (size_t i = 0; i < STORAGE_PROBE_COUNT && len > 0 &&
                       static_cast<size_t>(len) < sizeof(line);
         i++) {
        const DS18B20Probe &p = *_storage[i];
        if (p.isConnected()) {
            len += snprintf(line + len, sizeof(line) - len, " %s %.1f",
                            p.getLabel(), p.getTemperature());
        } else {
            len += snprintf(line + len, sizeof(line) - len, " %s --",
                            p.getLabel());
        }
    }
    _logger.log(line, true);
}
