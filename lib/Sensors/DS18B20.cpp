#include "DS18B20.h"
#include <cstring>

DS18B20Probe::DS18B20Probe(Logger &logger, DallasTemperature &bus,
                           const uint8_t *address, const char *label)
    : _logger(logger), _bus(bus), _label(label), _last_temperature(0.0f),
      _last_read_time(0), _ever_read(false), _in_error_state(false) {
    memcpy(_address, address, sizeof(_address));
}

void DS18B20Probe::begin() {
    if (!_bus.setResolution(_address, RESOLUTION_BITS)) {
        _logger.logf(false, "DS18B20 %s not found", _label);
        _in_error_state = true;
    }
}

bool DS18B20Probe::isValidReading(float temp_c, bool connected) {
    if (temp_c == DEVICE_DISCONNECTED_C || temp_c == TEMP_ERROR_VALUE)
        return false;
    // 85.0 is the scratchpad after a power-on reset, before the first
    // conversion. Once the probe is answering it is a real temperature.
    return connected || temp_c != POWER_ON_RESET_VALUE;
}

bool DS18B20Probe::read(unsigned long now) {
    float temp_c = _bus.getTempC(_address);

    if (!isValidReading(temp_c, isConnected())) {
        if (!_in_error_state) {
            _in_error_state = true;
            _logger.logf(false, "WARN: DS18B20 %s error", _label);
        }
        return false;
    }

    if (_in_error_state || !_ever_read) {
        _logger.logf(false, "DS18B20 %s %s (%.2fC)", _label,
                     _ever_read ? "recovered" : "online", temp_c);
    }
    _in_error_state = false;
    _ever_read = true;
    _last_temperature = temp_c;
    _last_read_time = now;
    return true;
}
