/**
 * @file pins.h
 * @brief Hardware pin definitions and sensor addresses
 *
 * This file contains all GPIO pin mappings and hardware-specific addresses.
 * Separate from config.h to keep hardware mapping distinct from tunable
 * behavior.
 */

#ifndef PINS_H
#define PINS_H

#include <cstddef>
#include <cstdint>

// =============================================================================
// Display Pins (directly mapped to GPIO)
// =============================================================================
#define TFT_DC 3   // GPIO3 - Data/Command selection
#define TFT_CS 18  // GPIO18 - Display chip select
#define TFT_RST 38 // GPIO38 - Display reset
#define LCD_BL 21  // GPIO21 - Backlight control

// =============================================================================
// Sensor Pins
// =============================================================================
constexpr int PIN_DS18B20 = 8; // GPIO8 - DS18B20 OneWire data

// =============================================================================
// Fan PWM outputs (one pin per fan group, fans wired in parallel)
// =============================================================================
constexpr int PIN_FAN_RADIATOR_PWM = 4; // GPIO4 - radiator fan group
constexpr int PIN_FAN_STORAGE_PWM = 5;  // GPIO5 - storage bay fan group

// =============================================================================
// Buttons
// =============================================================================
constexpr int PIN_SHUTDOWN_BUTTON = 47; // GPIO47 - user key, active low

// =============================================================================
// DS18B20 Sensor Addresses
// =============================================================================
// Radiator outlet probe (strapped to the coolant line after the radiator)
constexpr uint8_t RADIATOR_PROBE_ADDRESS[8] = {0x28, 0xFF, 0x64, 0x1F,
                                               0x75, 0xA8, 0xDD, 0x0C};

// Storage bay probes, one glued to each drive
constexpr size_t STORAGE_PROBE_COUNT = 3;
constexpr uint8_t STORAGE_PROBE_ADDRESSES[STORAGE_PROBE_COUNT][8] = {
    {0x28, 0xFF, 0x64, 0x1F, 0x75, 0xB8, 0x5F, 0xD0},
    {0x28, 0xFF, 0x64, 0x1F, 0x75, 0xB7, 0x33, 0x0E},
    {0x28, 0xFF, 0x64, 0x1F, 0x75, 0xC2, 0x14, 0x7A}};

/** ============================================================================
 * Available, unused GPIO pins
 * ============================================================================
 * - A2 (GPIO6)   - ADC capable, general purpose
 * - A4 (GPIO10)  - general purpose
 * - A5 (GPIO11)  - ADC capable, general purpose
 * - D5 (GPIO7)   - FCS font chip (directly usable if not using font library)
 * - D11 (GPIO13) - INT pin (unused, no touch on DFR0928)
 * - D12 (GPIO12) - TCS pin (unused, no touch on DFR0928)
 * - TX (GPIO43) / RX (GPIO44) - UART, free
 */

/** ============================================================================
 * Unavailable/used GPIO pins
 * ============================================================================
 * In use:
 * - A0 (GPIO4)   - Radiator fan PWM
 * - A1 (GPIO5)   - Storage fan PWM
 * - A3 (GPIO8)   - DS18B20 OneWire data
 * - D14 (GPIO47) - User key (shutdown button)
 * - SCK (GPIO17) / MOSI (GPIO15) / MISO (GPIO16) - display SPI
 *
 * Display (directly connected via GDI FPC - DFR0928 non-touch):
 * - D2 (GPIO3)   - LCD_DC
 * - D3 (GPIO38)  - LCD_RST
 * - D6 (GPIO18)  - LCD_CS
 * - D13 (GPIO21) - LCD_BL (backlight)
 * - D7 (GPIO9)   - SD_CS (directly connected to screen)
 * - D10 (GPIO14) - BUSY (tear sync, directly connected)
 *
 * System/Special (avoid):
 * - D9 (GPIO0)   - Boot button, strapping pin
 * - GPIO19       - USB D-
 * - GPIO20       - USB D+
 * - GPIO46       - Strapping pin
 */

#endif // PINS_H
