/**
 * @file DS18B20.h
 * @brief One DS18B20 probe on a shared OneWire bus
 *
 * Conversions are bus-wide and owned by TemperatureSensors: it calls
 * requestTemperatures() once, waits out the conversion time without
 * blocking, then calls read() on every probe. A probe only tracks its own
 * last good value, when that value was read, and whether it is currently
 * answering. Connection changes are logged once per transition.
 */

#ifndef DS18B20_H
#define DS18B20_H

#include "Logger.h"
#include <DallasTemperature.h>
#include <OneWire.h>

class DS18B20Probe {
  public:
    DS18B20Probe(Logger &logger, DallasTemperature &bus,
                 const uint8_t *address, const char *label);

    /**
     * @brief Configure resolution (bus must be started)
     */
    void begin();

    /**
     * @brief Fetch the result of the last bus-wide conversion
     * @return true if the probe answered with a valid value
     */
    bool read(unsigned long now);

    /**
     * @brief Classify a raw getTempC() value
     * @param connected true if the probe has answered since it last
     *                  (re)connected; 85.0 is only trusted then
     */
    static bool isValidReading(float temp_c, bool connected);

    float getTemperature() const { return _last_temperature; }
    unsigned long getLastReadTime() const { return _last_read_time; }
    bool hasReading() const { return _ever_read; }
    bool isConnected() const { return _ever_read && !_in_error_state; }
    const char *getLabel() const { return _label; }

  private:
    Logger &_logger;
    DallasTemperature &_bus;
    uint8_t _address[8];
    const char *_label;
    float _last_temperature;
    unsigned long _last_read_time;
    bool _ever_read;
    bool _in_error_state;

    static constexpr float TEMP_ERROR_VALUE = -127.0f;
    static constexpr float POWER_ON_RESET_VALUE = 85.0f;
    static constexpr uint8_t RESOLUTION_BITS = 12;
};

#endif // DS18B20_H
