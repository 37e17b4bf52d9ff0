/*
 * =================================================================================
 * Project:   BehaviorGate - Behavioral Human Verification Engine
 * File:      lib/BehaviorEngine/RingBuffer.h
 *
 * Description:
 * Fixed-capacity FIFO used for every rolling history in the engine.
 * Storage is inline (no heap). When full, push() overwrites the oldest
 * entry and hands it back so callers can retract its running aggregates.
 * =================================================================================
 */
#pragma once
#include <stddef.h>

template <typename T, size_t N>
class RingBuffer {
public:
    RingBuffer() : _head(0), _count(0) {}

    /**
     * Appends an item.
     * @param item    The item to store.
     * @param evicted Receives the overwritten item when the buffer was full (optional).
     * @return true if an item was evicted.
     */
    bool push(const T& item, T* evicted = nullptr) {
        bool wasFull = (_count == N);
        if (wasFull && evicted) {
            *evicted = _items[_head];
        }

        _items[_head] = item;
        _head = (_head + 1) % N;
        if (!wasFull) _count++;

        return wasFull;
    }

    // Index 0 is the oldest retained item.
    const T& at(size_t index) const {
        size_t start = (_head + N - _count) % N;
        return _items[(start + index) % N];
    }

    const T& newest() const { return _items[(_head + N - 1) % N]; }

    size_t size() const { return _count; }
    bool empty() const { return _count == 0; }
    bool full() const { return _count == N; }
    static size_t capacity() { return N; }

    void clear() {
        _head = 0;
        _count = 0;
    }

private:
    T _items[N];
    size_t _head;   // Next write slot
    size_t _count;
};
