/**
 * @file config.h
 * @brief Tunable configuration parameters
 *
 * Only namespaced configuration values live here. Use the namespaces directly
 * (e.g., `Targets::RADIATOR_C`, `QLearning::ALPHA`). The runtime copy that the
 * controller validates and consumes is built by
 * `ControllerConfig::fromBuildDefaults()`.
 */

#ifndef CONFIG_H
#define CONFIG_H

#include "pins.h"
#include <cstddef>

// =============================================================================
// Feature Flags (0=disabled, 1=enabled)
// =============================================================================
// Can be overridden from build flags, e.g. `-D FEATURE_WIFI_TIME_SYNC=1`.
#ifndef FEATURE_WIFI_TIME_SYNC
#define FEATURE_WIFI_TIME_SYNC 0
#endif

// Discard the persisted Q-table on boot and start learning from scratch.
#ifndef FEATURE_RESET_QTABLE
#define FEATURE_RESET_QTABLE 0
#endif

// Learn from (s, a, r, s) instead of waiting one cycle for the observed
// next state. Converges slower; kept for comparison runs.
#ifndef FEATURE_SELF_TRANSITION_UPDATE
#define FEATURE_SELF_TRANSITION_UPDATE 0
#endif

// =============================================================================
// Sensor Update Intervals
// =============================================================================
namespace Intervals {
constexpr unsigned long DS18B20_UPDATE_INTERVAL_MS =
    1000; // 12-bit resolution needs 750ms conversion
constexpr unsigned long DS18B20_CONVERSION_TIME_MS =
    750; // 12-bit resolution conversion time
constexpr unsigned long SENSOR_SUMMARY_LOG_INTERVAL_MS = 60000;
} // namespace Intervals

// =============================================================================
// Temperature Targets (Celsius)
// =============================================================================
namespace Targets {
constexpr float RADIATOR_C = 35.0f; // Coolant leaving the radiator
constexpr float STORAGE_C = 60.0f;  // Hottest drive in the storage bay
} // namespace Targets

namespace Hysteresis {
constexpr float RADIATOR_C = 2.0f;
constexpr float STORAGE_C = 3.0f;
} // namespace Hysteresis

// =============================================================================
// Reward shaping
// =============================================================================
// Each zone is scored by absolute error from target:
//   error <= hysteresis      -> PERFECT_BASE   - PERFECT_SLOPE   * error
//   error <= EXCELLENT_BAND  -> EXCELLENT_BASE - EXCELLENT_SLOPE * error
//   error <= GOOD_BAND       -> GOOD_BASE      - GOOD_SLOPE      * error
//   otherwise                -> -FAR_SLOPE * error^FAR_EXPONENT
namespace RewardZones {
namespace Radiator {
constexpr float EXCELLENT_BAND_C = 6.0f;
constexpr float GOOD_BAND_C = 10.0f;
constexpr float PERFECT_BASE = 30.0f;
constexpr float PERFECT_SLOPE = 1.0f;
constexpr float EXCELLENT_BASE = 20.0f;
constexpr float EXCELLENT_SLOPE = 0.5f;
constexpr float GOOD_BASE = 10.0f;
constexpr float GOOD_SLOPE = 1.0f;
constexpr float FAR_SLOPE = 2.0f;
constexpr float FAR_EXPONENT = 1.0f;
} // namespace Radiator

namespace Storage {
constexpr float EXCELLENT_BAND_C = 10.0f;
constexpr float GOOD_BAND_C = 15.0f;
constexpr float PERFECT_BASE = 25.0f;
constexpr float PERFECT_SLOPE = 1.0f;
constexpr float EXCELLENT_BASE = 18.0f;
constexpr float EXCELLENT_SLOPE = 0.3f;
constexpr float GOOD_BASE = 8.0f;
constexpr float GOOD_SLOPE = 0.8f;
constexpr float FAR_SLOPE = 1.5f;
constexpr float FAR_EXPONENT = 1.0f;
} // namespace Storage

// Paid when both zones are inside their excellent band, scaled by how much
// fan headroom is left unused.
constexpr float EFFICIENCY_BONUS = 12.0f;
// Extra bonus on top of the efficiency bonus when both zones are at or below
// target.
constexpr float BELOW_TARGET_BONUS = 8.0f;
} // namespace RewardZones

// =============================================================================
// Fan groups (percent duty)
// =============================================================================
namespace Fans {
constexpr int RADIATOR_MIN_PCT = 30;
constexpr int RADIATOR_MAX_PCT = 100;
constexpr int RADIATOR_STEP_PCT = 10;
constexpr int STORAGE_MIN_PCT = 30;
constexpr int STORAGE_MAX_PCT = 100;
constexpr int STORAGE_STEP_PCT = 10;

// LEDC PWM output (4-wire PC fans expect 25 kHz)
constexpr uint32_t PWM_FREQUENCY_HZ = 25000;
constexpr uint8_t PWM_RESOLUTION_BITS = 10;
constexpr uint8_t RADIATOR_LEDC_CHANNEL = 0;
constexpr uint8_t STORAGE_LEDC_CHANNEL = 1;
} // namespace Fans

// =============================================================================
// Q-learning
// =============================================================================
namespace QLearning {
constexpr float ALPHA = 0.1f;  // Learning rate
constexpr float GAMMA = 0.9f;  // Discount factor
constexpr float EPSILON_START = 0.15f;
constexpr float EPSILON_MIN = 0.05f;
constexpr float EPSILON_DECAY = 0.995f; // Applied once per control cycle
constexpr float NOISE_PENALTY = 3.0f;   // Scaled by combined fan duty
} // namespace QLearning

// =============================================================================
// State discretization
// =============================================================================
namespace StateBucketing {
constexpr float STEP_C = 3.0f;        // Bucket width
constexpr size_t HISTORY_LENGTH = 5;  // Samples averaged per zone
} // namespace StateBucketing

// =============================================================================
// Emergency override
// =============================================================================
namespace Emergency {
constexpr float RADIATOR_CRITICAL_C = 65.0f;
constexpr float STORAGE_CRITICAL_C = 80.0f;
// Both zones must fall this far below critical before another critical
// notification can be sent.
constexpr float REARM_MARGIN_C = 2.0f;
} // namespace Emergency

// =============================================================================
// Main control loop
// =============================================================================
namespace MainLoop {
constexpr unsigned long INTERVAL_MS = 10000;      // Normal cycle period
constexpr unsigned long RETRY_INTERVAL_MS = 3000; // After a failed sample
constexpr unsigned long SAVE_INTERVAL_CYCLES = 30;
// Consecutive failed samples before both fan groups are forced to maximum
constexpr unsigned int SENSOR_FAILSAFE_CYCLES = 6;
// Consecutive cycles with failed actuation before the controller stops
constexpr unsigned int ACTUATION_FAILURE_LIMIT = 30;
} // namespace MainLoop

// =============================================================================
// Persistent storage (LittleFS)
// =============================================================================
namespace Storage {
constexpr const char *QTABLE_PATH = "/qtable.txt";
constexpr const char *TELEMETRY_PATH = "/telemetry.csv";
constexpr const char *TELEMETRY_ROTATED_PATH = "/telemetry.old.csv";
constexpr const char *EVENT_LOG_PATH = "/events.log";
constexpr size_t TELEMETRY_MAX_BYTES = 256UL * 1024UL;
constexpr size_t EVENT_LOG_MAX_BYTES = 16UL * 1024UL;
constexpr bool RESET_QTABLE_ON_BOOT = FEATURE_RESET_QTABLE != 0;
} // namespace Storage

// =============================================================================
// Display and Logging Settings
// =============================================================================
namespace Display {
constexpr unsigned long DISPLAY_INTERVAL_MS = 100;
constexpr unsigned long SPINNER_UPDATE_MS = 100;
constexpr int LOG_AREA_LINES = 2; // Lines reserved for live logs
} // namespace Display

namespace Labels {
constexpr const char *STATE = "State";
constexpr const char *RADIATOR = "Radiator";
constexpr const char *STORAGE = "Storage";
constexpr const char *FANS = "Fans R/S";
constexpr const char *EPSILON = "Epsilon";
constexpr const char *REWARD = "Reward";
constexpr const char *QSTATES = "Q states";
} // namespace Labels

namespace Units {
constexpr const char *TEMP = "C";
} // namespace Units

// =============================================================================
// Watchdog Configuration
// =============================================================================
namespace Watchdog {
constexpr unsigned long TIMEOUT_SECONDS = 10; // Task WDT timeout
} // namespace Watchdog

// =============================================================================
// WiFi Time Sync (boot-time, optional)
// =============================================================================
namespace WiFiTimeSync {
// If WIFI_SSID from env.h is present and reachable, the system will connect
// briefly on boot, sync wall time via NTP, then disconnect.
constexpr unsigned long WIFI_CONNECT_TIMEOUT_MS = 10000;
constexpr unsigned long NTP_SYNC_TIMEOUT_MS = 8000;

constexpr const char *NTP_SERVER_1 = "pool.ntp.org";
constexpr const char *NTP_SERVER_2 = "time.nist.gov";

// POSIX TZ rule. If empty, the plain offsets below are used instead.
constexpr const char *TIME_TZ_STRING = "CET-1CEST,M3.5.0/2,M10.5.0/3";
constexpr long TIME_GMT_OFFSET_SEC = 0;
constexpr int TIME_DAYLIGHT_OFFSET_SEC = 0;
} // namespace WiFiTimeSync

// =============================================================================
// Limits (sensor sanity)
// =============================================================================
namespace Limits {
// Readings outside this window are treated as a probe fault, not a temperature
constexpr float MIN_VALID_C = -20.0f;
constexpr float MAX_VALID_C = 110.0f;
// A reading older than this is stale (covers a wedged OneWire bus)
constexpr unsigned long SAMPLE_MAX_AGE_MS = 5000;
} // namespace Limits

// =============================================================================
// Shutdown button
// =============================================================================
namespace Buttons {
constexpr unsigned long SHUTDOWN_HOLD_MS = 2000; // Hold to stop the controller
} // namespace Buttons

#endif // CONFIG_H
