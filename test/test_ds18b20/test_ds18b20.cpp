#include "DS18B20.h"
#include <Arduino.h>
#include <unity.h>

void setUp(void) {}

void tearDown(void) {}

// Test: Bus error codes are never temperatures
void test_error_codes_rejected(void) {
    TEST_ASSERT_FALSE(
        DS18B20Probe::isValidReading(DEVICE_DISCONNECTED_C, true));
    TEST_ASSERT_FALSE(DS18B20Probe::isValidReading(-127.0f, false));
}

// Test: 85C straight after power-up is the reset scratchpad
void test_power_on_value_before_first_read(void) {
    TEST_ASSERT_FALSE(DS18B20Probe::isValidReading(85.0f, false));
}

// Test: 85C from a probe that is already answering is a hot drive
void test_power_on_value_after_first_read(void) {
    TEST_ASSERT_TRUE(DS18B20Probe::isValidReading(85.0f, true));
}

// Test: Ordinary readings pass either way
void test_normal_readings(void) {
    TEST_ASSERT_TRUE(DS18B20Probe::isValidReading(61.5f, false));
    TEST_ASSERT_TRUE(DS18B20Probe::isValidReading(-3.25f, true));
    TEST_ASSERT_TRUE(DS18B20Probe::isValidReading(84.9375f, false));
}

void setup() {
    delay(2000); // Wait for serial monitor

    UNITY_BEGIN();

    RUN_TEST(test_error_codes_rejected);
    RUN_TEST(test_power_on_value_before_first_read);
    RUN_TEST(test_power_on_value_after_first_read);
    RUN_TEST(test_normal_readings);

    UNITY_END();
}

void loop() {
    // Nothing here
}
