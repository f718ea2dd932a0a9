/**
 * @file QTable.cpp
 * @brief Implementation of the fixed-capacity action-value table
 */

#include "QTable.h"
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>

QTable::QTable(float alpha, float gamma)
    : _alpha(alpha), _gamma(gamma), _entry_count(0), _state_count(0) {}

const QEntry *QTable::find(const State &state, const Action &action) const {
    for (size_t i = 0; i < _entry_count; i++) {
        if (_entries[i].state == state && _entries[i].action == action)
            return &_entries[i];
    }
    return nullptr;
}

QEntry *QTable::findOrCreate(const State &state, const Action &action) {
    bool state_seen = false;
    for (size_t i = 0; i < _entry_count; i++) {
        if (_entries[i].state != state)
            continue;
        if (_entries[i].action == action)
            return &_entries[i];
        state_seen = true;
    }
    if (_entry_count >= MAX_QTABLE_ENTRIES)
        return nullptr;

    QEntry &entry = _entries[_entry_count++];
    entry.state = state;
    entry.action = action;
    entry.value = 0.0f;
    if (!state_seen)
        _state_count++;
    return &entry;
}

float QTable::get(const State &state, const Action &action) const {
    const QEntry *entry = find(state, action);
    return entry != nullptr ? entry->value : 0.0f;
}

bool QTable::hasState(const State &state) const {
    for (size_t i = 0; i < _entry_count; i++) {
        if (_entries[i].state == state)
            return true;
    }
    return false;
}

float QTable::maxValue(const State &state) const {
    bool found = false;
    float best = 0.0f;
    for (size_t i = 0; i < _entry_count; i++) {
        const QEntry &e = _entries[i];
        if (e.state != state)
            continue;
        if (!found || e.value > best)
            best = e.value;
        found = true;
    }
    return best;
}

bool QTable::bestAction(const State &state, Action &out) const {
    const QEntry *best = nullptr;
    for (size_t i = 0; i < _entry_count; i++) {
        const QEntry &e = _entries[i];
        if (e.state != state)
            continue;
        if (best == nullptr || e.value > best->value ||
            (e.value == best->value && e.action < best->action)) {
            best = &e;
        }
    }
    if (best == nullptr)
        return false;
    out = best->action;
    return true;
}

bool QTable::update(const State &state, const Action &action, float reward,
                    const State &next_state) {
    // Read the successor value first: if s' == s the entry may not exist yet
    float next_max = maxValue(next_state);

    QEntry *entry = findOrCreate(state, action);
    if (entry == nullptr)
        return false;

    float td_target = reward + _gamma * next_max;
    entry->value += _alpha * (td_target - entry->value);
    return true;
}

bool QTable::set(const State &state, const Action &action, float value) {
    QEntry *entry = findOrCreate(state, action);
    if (entry == nullptr)
        return false;
    entry->value = value;
    return true;
}

void QTable::clear() {
    _entry_count = 0;
    _state_count = 0;
}

// =============================================================================
// QKey
// =============================================================================

namespace QKey {

void format(char *buf, size_t size, int a, int b) {
    snprintf(buf, size, "%d%c%d", a, SEPARATOR, b);
}

static bool parseComponent(const char *begin, const char *end, int &out) {
    if (begin == end)
        return false;
    char tmp[MAX_KEY_LEN];
    size_t len = static_cast<size_t>(end - begin);
    if (len >= sizeof(tmp))
        return false;
    for (size_t i = 0; i < len; i++) {
        char c = begin[i];
        bool sign = (i == 0 && (c == '-' || c == '+'));
        if (!sign && (c < '0' || c > '9'))
            return false;
        tmp[i] = c;
    }
    tmp[len] = '\0';

    errno = 0;
    char *parse_end = nullptr;
    long value = strtol(tmp, &parse_end, 10);
    if (errno != 0 || parse_end == tmp || *parse_end != '\0' ||
        value < INT16_MIN || value > INT16_MAX)
        return false;
    out = static_cast<int>(value);
    return true;
}

bool parse(const char *key, int &a, int &b) {
    if (key == nullptr)
        return false;

    // Separator search starts at 1 so a leading sign is never mistaken for it
    const char *sep = nullptr;
    for (const char *p = key + (key[0] != '\0' ? 1 : 0); *p != '\0'; p++) {
        if (*p == SEPARATOR) {
            sep = p;
            break;
        }
    }
    if (sep == nullptr)
        return false;

    const char *end = sep + 1;
    while (*end != '\0')
        end++;

    return parseComponent(key, sep, a) && parseComponent(sep + 1, end, b);
}

} // namespace QKey
