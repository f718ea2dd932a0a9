/**
 * @file main.cpp
 * @brief Adaptive fan controller - learns radiator and storage fan speeds
 *
 * IMPORTANT: NEVER use Serial.print/println directly in this application.
 * Always use logger.log() for all output - it handles both display and Serial.
 *
 * Architecture:
 * - Logger: TFT display (status lines + live log area) and Serial output
 * - TemperatureSensors: DS18B20 probes on one OneWire bus (radiator outlet,
 *   storage drives), serves readings to the controller
 * - FanDriver: LEDC PWM for the radiator and storage fan groups
 * - ControlLoop: epsilon-greedy Q-learning controller with emergency override
 *   - LittleFsQTableStore: learned table, saved periodically and on stop
 *   - TelemetryLog: per-cycle CSV on LittleFS
 *   - AlertNotifier: operator alerts (screen + persistent event log)
 *
 * SAFETY:
 * - Task Watchdog Timer (WDT) enabled - resets if loop() takes >10 seconds
 * - Fans boot at 100% and stay there if the controller cannot start
 *
 * SHUTDOWN:
 * - Hold the user key (GPIO47) for 2 s: final Q-table save, fans to 100%
 * - Power cut loses at most SAVE_INTERVAL_CYCLES cycles of learning
 */

#include "AlertNotifier.h"
#include "ControlLoop.h"
#include "ControllerConfig.h"
#include "CrashLog.h"
#include "FanDriver.h"
#include "HardwareRandom.h"
#include "Logger.h"
#include "QTableStore.h"
#include "TelemetryLog.h"
#include "TemperatureSensors.h"
#include "TimeService.h"
#include "config.h"
#include <Arduino.h>
#include <LittleFS.h>
#include <esp_task_wdt.h>

Logger logger;

TemperatureSensors sensors(logger);
FanDriver fans(logger);
AlertNotifier notifier(logger);
LittleFsQTableStore qtableStore(logger, LittleFS, Storage::QTABLE_PATH);
TelemetryLog telemetry(logger, LittleFS);
HardwareRandom rng;

ControlLoop controlLoop(logger, ControllerConfig::fromBuildDefaults(),
                        ControlPorts{sensors, fans, notifier, telemetry,
                                     qtableStore},
                        rng);

static unsigned long button_pressed_since = 0;
static bool button_was_pressed = false;
static bool fans_ready = false;

static void initializeWatchdog() {
    // Using older API compatible with Arduino ESP32 core
    esp_task_wdt_init(Watchdog::TIMEOUT_SECONDS, true); // panic on trigger
    esp_task_wdt_add(NULL); // Add current task (loopTask) to watchdog
}

static void initializeStorage() {
    // Format on first boot; an unformatted partition is not an error
    bool mounted = LittleFS.begin(true);
    qtableStore.setAvailable(mounted);
    telemetry.setAvailable(mounted);
    if (!mounted) {
        logger.log("WARN: LittleFS mount failed, learning not persisted");
        return;
    }
    if (!CrashLog::begin(LittleFS)) {
        logger.log("WARN: Event log unavailable");
    }
    logger.logf("LittleFS: %u/%u kB used",
                static_cast<unsigned>(LittleFS.usedBytes() / 1024),
                static_cast<unsigned>(LittleFS.totalBytes() / 1024));
}

static void initializeHardware() {
    // Fans first: full cooling while everything else comes up
    fans_ready = fans.begin();

    logger.initializeDisplay();
    logger.log("=== BOOT ===");
    if (!fans_ready) {
        logger.log("CRIT: Fan PWM not ready, check wiring");
    }

    initializeStorage();
    CrashLog::logResetReason();

#if FEATURE_WIFI_TIME_SYNC
    TimeService::trySyncFromWifi(
        [](const char *msg, bool serialOnly) { logger.log(msg, serialOnly); });
#endif

    initializeWatchdog();
    sensors.begin();
    pinMode(PIN_SHUTDOWN_BUTTON, INPUT_PULLUP);
}

static void pollShutdownButton(unsigned long now) {
    bool pressed = digitalRead(PIN_SHUTDOWN_BUTTON) == LOW;
    if (!pressed) {
        button_was_pressed = false;
        return;
    }
    if (!button_was_pressed) {
        button_was_pressed = true;
        button_pressed_since = now;
        return;
    }
    if (now - button_pressed_since >= Buttons::SHUTDOWN_HOLD_MS) {
        controlLoop.requestShutdown("shutdown button");
    }
}

void setup() {
    initializeHardware();

    // Without PWM no action can be applied; stop before learning anything
    if (!fans_ready) {
        controlLoop.fail("fan PWM not ready");
        return;
    }
    if (!controlLoop.begin(millis())) {
        logger.log("CRIT: Controller not started, fans held at 100%");
    }
}

void loop() {
    esp_task_wdt_reset();
    logger.update();
    sensors.update();

    unsigned long now = millis();
    pollShutdownButton(now);
    controlLoop.update(now);
}
