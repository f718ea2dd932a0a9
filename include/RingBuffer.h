/**
 * @file RingBuffer.h
 * @brief Fixed-storage ring buffer with a runtime window length
 *
 * Storage is sized at compile time (MaxN) so no heap is touched; the window
 * actually used can be shortened at runtime with setLimit(), which lets the
 * history length come from configuration.
 */

#ifndef RINGBUFFER_H
#define RINGBUFFER_H

#include <cstddef>

template <typename T, size_t MaxN> class RingBuffer {
  public:
    RingBuffer() : _limit(MaxN), _head(0), _count(0) {}

    /**
     * @brief Set the number of retained elements (clamped to 1..MaxN)
     *
     * Clears the buffer.
     */
    void setLimit(size_t limit) {
        if (limit == 0)
            limit = 1;
        if (limit > MaxN)
            limit = MaxN;
        _limit = limit;
        clear();
    }

    void push(const T &item) {
        _data[_head] = item;
        _head = (_head + 1) % _limit;
        if (_count < _limit)
            ++_count;
    }

    void clear() {
        _head = 0;
        _count = 0;
    }

    size_t size() const { return _count; }
    size_t limit() const { return _limit; }
    constexpr size_t capacity() const { return MaxN; }

    /**
     * @brief Get element counted from newest (0 = most recent)
     * @return pointer or nullptr if out of range
     */
    const T *getFromNewest(size_t idx) const {
        if (idx >= _count)
            return nullptr;
        size_t pos = (_head + _limit - 1 - idx) % _limit;
        return &_data[pos];
    }

  private:
    T _data[MaxN];
    size_t _limit;
    size_t _head;
    size_t _count;
};

#endif // RINGBUFFER_H
