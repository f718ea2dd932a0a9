/**
 * @file QTableStore.cpp
 * @brief Implementation of Q-table persistence
 */

#include "QTableStore.h"
#include <cmath>
#include <cstdio>
#include <cstring>

// =============================================================================
// QTableCodec
// =============================================================================

namespace QTableCodec {

size_t write(const QTable &table, Print &out) {
    size_t written = out.println(HEADER);

    char state_key[QKey::MAX_KEY_LEN];
    char action_key[QKey::MAX_KEY_LEN];
    char line[MAX_LINE_LEN];
    for (size_t i = 0; i < table.entryCount(); i++) {
        const QEntry &e = table.entry(i);
        QKey::format(state_key, sizeof(state_key), e.state.radiator_bucket,
                     e.state.storage_bucket);
        QKey::format(action_key, sizeof(action_key), e.action.radiator_pct,
                     e.action.storage_pct);
        snprintf(line, sizeof(line), "%s %s %.7g", state_key, action_key,
                 static_cast<double>(e.value));
        written += out.println(line);
    }
    return written;
}

static bool parseLine(const char *line, State &state, Action &action,
                      float &value) {
    char state_key[QKey::MAX_KEY_LEN];
    char action_key[QKey::MAX_KEY_LEN];
    char extra;
    float v = 0.0f;
    int fields =
        sscanf(line, "%15s %15s %f %c", state_key, action_key, &v, &extra);
    if (fields != 3 || !std::isfinite(v))
        return false;

    int a = 0;
    int b = 0;
    if (!QKey::parse(state_key, a, b))
        return false;
    state = {static_cast<int16_t>(a), static_cast<int16_t>(b)};

    if (!QKey::parse(action_key, a, b) || a < 0 || a > 100 || b < 0 ||
        b > 100)
        return false;
    action = {static_cast<int16_t>(a), static_cast<int16_t>(b)};
    value = v;
    return true;
}

PersistStatus read(Stream &in, QTable &table, size_t *dropped) {
    table.clear();
    if (dropped != nullptr)
        *dropped = 0;

    char line[MAX_LINE_LEN];
    bool header_seen = false;
    while (in.available() > 0) {
        size_t n = in.readBytesUntil('\n', line, sizeof(line) - 1);
        if (n >= sizeof(line) - 1) {
            table.clear();
            return PersistStatus::CORRUPT; // No valid line is this long
        }
        line[n] = '\0';
        if (n > 0 && line[n - 1] == '\r')
            line[--n] = '\0';
        if (n == 0)
            continue;

        if (!header_seen) {
            if (strcmp(line, HEADER) != 0) {
                table.clear();
                return PersistStatus::CORRUPT;
            }
            header_seen = true;
            continue;
        }
        if (line[0] == '#')
            continue;

        State state;
        Action action;
        float value;
        if (!parseLine(line, state, action, value)) {
            table.clear();
            return PersistStatus::CORRUPT;
        }
        if (!table.set(state, action, value) && dropped != nullptr) {
            (*dropped)++;
        }
    }
    return PersistStatus::OK;
}

} // namespace QTableCodec

// =============================================================================
// LittleFsQTableStore
// =============================================================================

LittleFsQTableStore::LittleFsQTableStore(Logger &logger, fs::FS &fs,
                                         const char *path)
    : _logger(logger), _fs(fs), _available(false) {
    snprintf(_path, sizeof(_path), "%s", path);
    snprintf(_tmp_path, sizeof(_tmp_path), "%s.tmp", path);
}

PersistStatus LittleFsQTableStore::load(QTable &table) {
    table.clear();
    if (!_available)
        return PersistStatus::IO_ERROR;

    // Left over from a save interrupted before the rename
    if (_fs.exists(_tmp_path)) {
        _fs.remove(_tmp_path);
        _logger.log("Discarded partial Q-table save", true);
    }

    if (!_fs.exists(_path))
        return PersistStatus::NOT_FOUND;

    File f = _fs.open(_path, FILE_READ);
    if (!f)
        return PersistStatus::IO_ERROR;

    size_t dropped = 0;
    PersistStatus status = QTableCodec::read(f, table, &dropped);
    f.close();

    if (dropped > 0) {
        _logger.logf("WARN: %u Q-table entries did not fit",
                     static_cast<unsigned>(dropped));
    }
    return status;
}

PersistStatus LittleFsQTableStore::save(const QTable &table) {
    if (!_available)
        return PersistStatus::IO_ERROR;

    File f = _fs.open(_tmp_path, FILE_WRITE);
    if (!f)
        return PersistStatus::IO_ERROR;

    size_t written = QTableCodec::write(table, f);
    bool complete = written > 0 && f.getWriteError() == 0;
    f.close();

    if (!complete) {
        _fs.remove(_tmp_path);
        return PersistStatus::IO_ERROR;
    }
    if (!_fs.rename(_tmp_path, _path)) {
        _fs.remove(_tmp_path);
        return PersistStatus::IO_ERROR;
    }
    return PersistStatus::OK;
}
