/**
 * @file HistoryBuffer.h
 * @brief Per-zone sliding window of raw temperature samples
 *
 * Each zone keeps the last N samples (N set at construction, at most
 * MAX_HISTORY_LENGTH). The smoothed reading is the plain mean of what is
 * retained. The buffer is not persisted and starts empty after every boot.
 */

#ifndef HISTORY_BUFFER_H
#define HISTORY_BUFFER_H

#include "LearningTypes.h"
#include "RingBuffer.h"

constexpr size_t MAX_HISTORY_LENGTH = 16;

class HistoryBuffer {
  public:
    explicit HistoryBuffer(size_t length);

    void push(Zone zone, float value);

    /**
     * @brief Mean of the retained samples for a zone
     *
     * Returns 0.0 for an empty zone. Callers check size() first; the control
     * loop never asks before the first sample.
     */
    float mean(Zone zone) const;

    size_t size(Zone zone) const;
    size_t length() const { return _length; }
    void clear();

  private:
    size_t _length;
    RingBuffer<float, MAX_HISTORY_LENGTH> _zones[ZONE_COUNT];
};

#endif // HISTORY_BUFFER_H
