/**
 * @file Logger.h
 * @brief Serial log plus TFT status screen (key/value lines + live log area)
 *
 * USAGE:
 * ------
 * 1. Initialize once (also starts Serial):
 *    logger.initializeDisplay();
 *
 * 2. Register status lines during setup:
 *    logger.registerLine("CL_RAD", "Radiator:", "C", 0.0f);
 *    logger.registerTextLine("CL_STATE", "State:", "IDLE");
 *
 * 3. Update values at runtime (redrawn on the next update() if changed):
 *    logger.updateLine("CL_RAD", 34.6f);
 *    logger.updateLineText("CL_STATE", "SLEEP");
 *
 * 4. Log (Serial, and the bottom screen area unless serialOnly):
 *    logger.log("Q-table saved");
 *    logger.logf("Fans %d%%/%d%%", rad, sto);
 *
 * NEVER use Serial.print/println directly, always use logger.log().
 *
 * Without initializeDisplay() the logger is Serial-only, which is how the
 * test suites use it.
 */

#ifndef LOGGER_H
#define LOGGER_H

#include "DFRobot_GDL.h"
#include "config.h"
#include <Arduino.h>

// Display layout
constexpr int LINE_HEIGHT = 12;
constexpr int VALUE_X = 60;
constexpr int VALUE_WIDTH = 68;

// Display physical properties
constexpr int SCREEN_WIDTH = 128;
constexpr int SCREEN_HEIGHT = 160;
constexpr int CHAR_WIDTH = 6; // pixels per character
constexpr int MAX_CHARS_PER_LINE = SCREEN_WIDTH / CHAR_WIDTH; // 21 characters

constexpr unsigned long SERIAL_TIMEOUT_MS = 1000;
constexpr unsigned long SERIAL_BAUD = 115200;

// Fixed buffer sizes (avoid heap fragmentation from String)
constexpr size_t MAX_DISPLAY_LINES = 12;
constexpr size_t MAX_LINE_NAME_LEN = 12;
constexpr size_t MAX_LINE_LABEL_LEN = 12;
constexpr size_t MAX_LINE_VALUE_LEN = 12;
constexpr size_t MAX_LINE_UNIT_LEN = 4;
constexpr size_t MAX_LOG_MESSAGE_LEN = 192;

struct DisplayLine {
    char name[MAX_LINE_NAME_LEN];
    char label[MAX_LINE_LABEL_LEN];
    char value[MAX_LINE_VALUE_LEN];
    char unit[MAX_LINE_UNIT_LEN];
    int slot;   // Row on screen
    bool dirty; // Value changed since last draw
    bool active;
};

class Logger {
  public:
    Logger();

    void initializeDisplay();
    void update(); // Redraw dirty lines and the activity spinner

    // Utility for formatting display labels (adds colon suffix)
    static void formatLabel(char *buf, size_t size, const char *label);

    void registerLine(const char *name, const char *label,
                      const char *unit = "", float initial_value = 0.0f);
    void registerTextLine(const char *name, const char *label,
                          const char *initial_text = "");

    void updateLine(const char *name, float value);
    void updateLineText(const char *name, const char *text);

    void log(const char *message, bool serialOnly = false);
    void logf(const char *format, ...);
    void logf(bool serialOnly, const char *format, ...);

  private:
    DisplayLine *findLine(const char *name);
    void addLine(const char *name, const char *label, const char *value,
                 const char *unit);
    void setValue(DisplayLine &line, const char *value);
    void formatValue(char *buf, size_t size, float value,
                     const char *unit) const;

    void drawLabel(const DisplayLine &line);
    void drawValue(const DisplayLine &line);
    void drawLogArea();
    void drawSpinner();
    void appendLogLine(const char *text);

    DFRobot_ST7735_128x160_HW_SPI *_screen;
    bool _display_initialized;
    unsigned long _last_display_update;
    unsigned long _last_spinner_update;
    int _spinner_index;
    int _next_slot;

    DisplayLine _lines[MAX_DISPLAY_LINES];

    char _log_lines[Display::LOG_AREA_LINES][MAX_CHARS_PER_LINE + 1];
    int _log_count;
    int _log_area_y_start;
};

#endif // LOGGER_H
