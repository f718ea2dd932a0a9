/**
 * @file HistoryBuffer.cpp
 * @brief Implementation of the per-zone sample window
 */

#include "HistoryBuffer.h"

HistoryBuffer::HistoryBuffer(size_t length) : _length(length) {
    if (_length == 0)
        _length = 1;
    if (_length > MAX_HISTORY_LENGTH)
        _length = MAX_HISTORY_LENGTH;
    for (size_t i = 0; i < ZONE_COUNT; i++) {
        _zones[i].setLimit(_length);
    }
}

void HistoryBuffer::push(Zone zone, float value) {
    _zones[zoneIndex(zone)].push(value);
}

float HistoryBuffer::mean(Zone zone) const {
    const RingBuffer<float, MAX_HISTORY_LENGTH> &buf = _zones[zoneIndex(zone)];
    if (buf.size() == 0)
        return 0.0f;

    float sum = 0.0f;
    for (size_t i = 0; i < buf.size(); i++) {
        sum += *buf.getFromNewest(i);
    }
    return sum / static_cast<float>(buf.size());
}

size_t HistoryBuffer::size(Zone zone) const {
    return _zones[zoneIndex(zone)].size();
}

void HistoryBuffer::clear() {
    for (size_t i = 0; i < ZONE_COUNT; i++) {
        _zones[i].clear();
    }
}
