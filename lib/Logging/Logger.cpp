/**
 * @file Logger.cpp
 * @brief Serial + TFT logger with fixed-size buffers
 *
 * Fixed-size char arrays instead of Arduino String keep the heap unfragmented
 * over months of uptime.
 */

#include "Logger.h"
#include "TimeService.h"
#include <cstdarg>
#include <cstring>

static void copyString(char *dst, const char *src, size_t size) {
    strncpy(dst, src != nullptr ? src : "", size - 1);
    dst[size - 1] = '\0';
}

Logger::Logger()
    : _screen(nullptr), _display_initialized(false), _last_display_update(0),
      _last_spinner_update(0), _spinner_index(0), _next_slot(0), _log_count(0),
      _log_area_y_start(SCREEN_HEIGHT -
                        (Display::LOG_AREA_LINES * LINE_HEIGHT)) {
    for (size_t i = 0; i < MAX_DISPLAY_LINES; i++) {
        _lines[i].active = false;
    }
}

void Logger::formatLabel(char *buf, size_t size, const char *label) {
    snprintf(buf, size, "%s:", label);
}

void Logger::initializeDisplay() {
    if (_display_initialized)
        return;

    Serial.begin(SERIAL_BAUD);
    while (!Serial && millis() < SERIAL_TIMEOUT_MS) {
        ; // wait for USB CDC
    }

    _screen = new DFRobot_ST7735_128x160_HW_SPI(TFT_DC, TFT_CS, TFT_RST);

    pinMode(LCD_BL, OUTPUT);
    digitalWrite(LCD_BL, HIGH);
    _screen->begin();
    _screen->setRotation(0);
    _screen->fillScreen(COLOR_RGB565_BLACK);
    _screen->setTextColor(COLOR_RGB565_WHITE);
    _screen->setTextSize(1);
    _screen->setTextWrap(false);

    // Separator above the live log area
    _screen->drawFastHLine(0, _log_area_y_start - 1, SCREEN_WIDTH,
                           COLOR_RGB565_WHITE);

    _display_initialized = true;
}

DisplayLine *Logger::findLine(const char *name) {
    for (size_t i = 0; i < MAX_DISPLAY_LINES; i++) {
        if (_lines[i].active && strcmp(_lines[i].name, name) == 0)
            return &_lines[i];
    }
    return nullptr;
}

void Logger::formatValue(char *buf, size_t size, float value,
                         const char *unit) const {
    if (unit != nullptr && unit[0] != '\0') {
        snprintf(buf, size, "%.2f %s", value, unit);
    } else {
        snprintf(buf, size, "%.2f", value);
    }
}

void Logger::addLine(const char *name, const char *label, const char *value,
                     const char *unit) {
    DisplayLine *line = findLine(name);
    if (line == nullptr) {
        int max_slots = _log_area_y_start / LINE_HEIGHT;
        for (size_t i = 0; i < MAX_DISPLAY_LINES && line == nullptr; i++) {
            if (!_lines[i].active)
                line = &_lines[i];
        }
        if (line == nullptr || _next_slot >= max_slots) {
            log("Logger: no free display slots", true);
            return;
        }
        line->active = true;
        line->slot = _next_slot++;
        copyString(line->name, name, sizeof(line->name));
    }

    copyString(line->label, label, sizeof(line->label));
    copyString(line->unit, unit, sizeof(line->unit));
    copyString(line->value, value, sizeof(line->value));
    line->dirty = false;
    drawLabel(*line);
    drawValue(*line);
}

void Logger::registerLine(const char *name, const char *label, const char *unit,
                          float initial_value) {
    if (!_display_initialized)
        return;
    char buf[MAX_LINE_VALUE_LEN];
    formatValue(buf, sizeof(buf), initial_value, unit);
    addLine(name, label, buf, unit);
}

void Logger::registerTextLine(const char *name, const char *label,
                              const char *initial_text) {
    if (!_display_initialized)
        return;
    addLine(name, label, initial_text, "");
}

void Logger::setValue(DisplayLine &line, const char *value) {
    if (strncmp(line.value, value, sizeof(line.value) - 1) == 0)
        return;
    copyString(line.value, value, sizeof(line.value));
    line.dirty = true;
}

void Logger::updateLine(const char *name, float value) {
    if (!_display_initialized)
        return;
    DisplayLine *line = findLine(name);
    if (line == nullptr)
        return;
    char buf[MAX_LINE_VALUE_LEN];
    formatValue(buf, sizeof(buf), value, line->unit);
    setValue(*line, buf);
}

void Logger::updateLineText(const char *name, const char *text) {
    if (!_display_initialized)
        return;
    DisplayLine *line = findLine(name);
    if (line == nullptr)
        return;
    setValue(*line, text);
}

void Logger::drawLabel(const DisplayLine &line) {
    if (_screen == nullptr)
        return;
    int y = line.slot * LINE_HEIGHT;
    _screen->fillRect(0, y, VALUE_X, LINE_HEIGHT, COLOR_RGB565_BLACK);
    _screen->setTextColor(COLOR_RGB565_WHITE);
    _screen->setCursor(0, y);
    _screen->print(line.label);
}

void Logger::drawValue(const DisplayLine &line) {
    if (_screen == nullptr)
        return;
    int y = line.slot * LINE_HEIGHT;
    _screen->fillRect(VALUE_X, y, VALUE_WIDTH, LINE_HEIGHT,
                      COLOR_RGB565_BLACK);
    _screen->setTextColor(COLOR_RGB565_WHITE);
    _screen->setCursor(VALUE_X, y);
    _screen->print(line.value);
}

void Logger::drawSpinner() {
    static const char SPINNER[] = {'|', '/', '-', '\\'};
    _spinner_index = (_spinner_index + 1) % 4;

    int x = SCREEN_WIDTH - (CHAR_WIDTH + 1);
    int y = _log_area_y_start - 1 - LINE_HEIGHT;
    _screen->fillRect(x, y, CHAR_WIDTH + 1, LINE_HEIGHT, COLOR_RGB565_BLACK);
    _screen->setTextColor(COLOR_RGB565_WHITE);
    _screen->setCursor(x, y);
    _screen->print(SPINNER[_spinner_index]);
}

void Logger::update() {
    if (!_display_initialized || _screen == nullptr)
        return;

    unsigned long now = millis();
    if (now - _last_spinner_update >= Display::SPINNER_UPDATE_MS) {
        _last_spinner_update = now;
        drawSpinner();
    }

    if (now - _last_display_update < Display::DISPLAY_INTERVAL_MS)
        return;
    _last_display_update = now;

    for (size_t i = 0; i < MAX_DISPLAY_LINES; i++) {
        if (_lines[i].active && _lines[i].dirty) {
            drawValue(_lines[i]);
            _lines[i].dirty = false;
        }
    }
}

void Logger::drawLogArea() {
    if (_screen == nullptr)
        return;
    _screen->fillRect(0, _log_area_y_start, SCREEN_WIDTH,
                      Display::LOG_AREA_LINES * LINE_HEIGHT,
                      COLOR_RGB565_BLACK);
    _screen->setTextColor(COLOR_RGB565_WHITE);
    for (int i = 0; i < _log_count; i++) {
        _screen->setCursor(0, _log_area_y_start + (i * LINE_HEIGHT) + 1);
        _screen->print(_log_lines[i]);
    }
}

void Logger::appendLogLine(const char *text) {
    if (_log_count >= Display::LOG_AREA_LINES) {
        for (int i = 0; i < Display::LOG_AREA_LINES - 1; i++) {
            memcpy(_log_lines[i], _log_lines[i + 1], sizeof(_log_lines[i]));
        }
        _log_count = Display::LOG_AREA_LINES - 1;
    }
    copyString(_log_lines[_log_count], text, sizeof(_log_lines[0]));
    _log_count++;
}

void Logger::log(const char *message, bool serialOnly) {
    unsigned long ms = millis();
    unsigned int hours = (ms / 3600000UL) % 24;
    unsigned int mins = (ms / 60000UL) % 60;
    unsigned int secs = (ms / 1000UL) % 60;
    unsigned int millis_part = ms % 1000;

    // [wall time][uptime] message, wall time only once NTP has synced
    char stamped[MAX_LOG_MESSAGE_LEN + 48];
    const char *iso = TimeService::getIsoTimestamp();
    if (iso != nullptr) {
        snprintf(stamped, sizeof(stamped), "[%s][%02u:%02u:%02u.%03u] %s", iso,
                 hours, mins, secs, millis_part, message);
    } else {
        snprintf(stamped, sizeof(stamped), "[%02u:%02u:%02u.%03u] %s", hours,
                 mins, secs, millis_part, message);
    }
    Serial.println(stamped);

    if (serialOnly || !_display_initialized || _screen == nullptr)
        return;

    // Word-wrap into the log area, breaking at the last space that fits
    size_t len = strlen(message);
    size_t pos = 0;
    while (pos < len) {
        char chunk[MAX_CHARS_PER_LINE + 1];
        size_t take = len - pos;
        if (take > MAX_CHARS_PER_LINE) {
            take = MAX_CHARS_PER_LINE;
            for (size_t i = MAX_CHARS_PER_LINE; i > 0; i--) {
                if (message[pos + i] == ' ') {
                    take = i;
                    break;
                }
            }
        }
        memcpy(chunk, &message[pos], take);
        chunk[take] = '\0';
        appendLogLine(chunk);
        pos += take;
        while (pos < len && message[pos] == ' ')
            pos++;
    }
    drawLogArea();
}

void Logger::logf(const char *format, ...) {
    char buf[MAX_LOG_MESSAGE_LEN];
    va_list args;
    va_start(args, format);
    vsnprintf(buf, sizeof(buf), format, args);
    va_end(args);
    log(buf, false);
}

void Logger::logf(bool serialOnly, const char *format, ...) {
    char buf[MAX_LOG_MESSAGE_LEN];
    va_list args;
    va_start(args, format);
    vsnprintf(buf, sizeof(buf), format, args);
    va_end(args);
    log(buf, serialOnly);
}
