/**
 * @file QTableStore.h
 * @brief Q-table persistence on LittleFS
 *
 * FILE FORMAT (text, one entry per line):
 * ---------------------------------------
 *   # qtable v1
 *   <state_key> <action_key> <value>
 *
 * Keys use QKey encoding ("11_20" = radiator bucket 11, storage bucket 20;
 * "40_50" = 40% radiator, 50% storage). Lines starting with '#' are comments.
 * An empty file is an empty table. Any malformed line, or a missing/unknown
 * header, makes the whole file CORRUPT and the table is left empty.
 *
 * SAVING:
 * -------
 * The table is written to "<path>.tmp", closed, then renamed over <path>.
 * A reset mid-save leaves the previous file intact.
 *
 * QTableCodec does the text encoding over Arduino Print/Stream so it can be
 * exercised against a StreamString.
 */

#ifndef QTABLE_STORE_H
#define QTABLE_STORE_H

#include "Collaborators.h"
#include "Logger.h"
#include "QTable.h"
#include <Arduino.h>
#include <FS.h>

namespace QTableCodec {
constexpr const char *HEADER = "# qtable v1";
constexpr size_t MAX_LINE_LEN = 64;

/**
 * @return bytes written
 */
size_t write(const QTable &table, Print &out);

/**
 * @brief Parse a table, replacing the contents of `table`
 * @param dropped Optional count of entries that did not fit the table
 * @return OK or CORRUPT
 */
PersistStatus read(Stream &in, QTable &table, size_t *dropped = nullptr);
} // namespace QTableCodec

class LittleFsQTableStore : public QTableStorage {
  public:
    LittleFsQTableStore(Logger &logger, fs::FS &fs, const char *path);

    /**
     * @brief Tell the store whether the filesystem mounted
     */
    void setAvailable(bool available) { _available = available; }
    bool isAvailable() const { return _available; }

    PersistStatus load(QTable &table) override;
    PersistStatus save(const QTable &table) override;

  private:
    Logger &_logger;
    fs::FS &_fs;
    char _path[32];
    char _tmp_path[40];
    bool _available;
};

#endif // QTABLE_STORE_H
