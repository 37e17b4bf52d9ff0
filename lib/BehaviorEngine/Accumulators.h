/*
 * =================================================================================
 * Project:   BehaviorGate - Behavioral Human Verification Engine
 * File:      lib/BehaviorEngine/Accumulators.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Per-channel feature accumulators (pointer, touch, click, keyboard, timing).
 *
 * Each accumulator keeps a bounded rolling history and updates its aggregates
 * incrementally on push(). features() is const and never mutates state, so
 * it can be queried at any time. Evicted observations retract their
 * contribution from the running aggregates.
 * =================================================================================
 */
#pragma once
#include "Types.h"
#include "RingBuffer.h"
#include "StatUtils.h"

// =================================================================================
// SECTION: POINTER
// =================================================================================

struct PointerSample {
    float x;
    float y;
    uint32_t timestamp;

    // Contributions of the step ending at this sample
    bool hasVelocity;
    bool hasAcceleration;
    double velocity;
    double acceleration;
    double deviation;          // Heading change at the previous point (radians)
    double deviationDistance;  // Path length paired with that heading change
};

class PointerAccumulator {
public:
    PointerAccumulator();

    void push(float x, float y, uint32_t timestamp);
    PointerFeatures features() const;
    void reset();

    uint32_t getMovementCount() const { return _movementCount; }

private:
    RingBuffer<PointerSample, POINTER_HISTORY_SIZE> _samples;

    RunningStats _velocity;
    RunningStats _acceleration;
    double _windowDeviation;
    double _windowDistance;

    double _totalMovement;
    double _maxVelocity;
    uint32_t _movementCount;

    bool _hasLastVelocity;
    double _lastVelocity;

    void retract(const PointerSample& evicted);
};

// =================================================================================
// SECTION: TOUCH
// =================================================================================

enum TouchPhase : uint8_t { TOUCH_START, TOUCH_MOVE, TOUCH_END };

struct TouchSample {
    TouchPhase phase;
    uint32_t timestamp;
    uint8_t contacts;
    float x;
    float y;
};

class TouchAccumulator {
public:
    TouchAccumulator();

    // contacts == 0 records the snapshot but no position.
    void push(TouchPhase phase, float x, float y, uint8_t contacts, uint32_t timestamp);
    TouchFeatures features() const;
    void reset();

private:
    RingBuffer<double, TOUCH_HISTORY_SIZE> _swipeVelocities;
    RunningStats _swipeStats;

    uint32_t _touchCount;
    uint32_t _swipeCount;
    double _totalSwipeDistance;
    bool _multiTouch;

    bool _hasLastMove;
    TouchSample _lastMove;
};

// =================================================================================
// SECTION: CLICK
// =================================================================================

// Intervals within this distance of the mean count as "consistent".
#define CLICK_CONSISTENCY_TOLERANCE_MS 10.0

class ClickAccumulator {
public:
    ClickAccumulator();

    void push(uint32_t timestamp);
    ClickFeatures features() const;
    void reset();

    bool hasLastClick() const { return _clickCount > 0; }
    uint32_t getLastClick() const { return _lastClick; }

private:
    RingBuffer<double, CLICK_HISTORY_SIZE> _intervals;
    RunningStats _intervalStats;

    uint32_t _clickCount;
    uint32_t _lastClick;
};

// =================================================================================
// SECTION: KEYBOARD
// =================================================================================

// Intervals longer than this are natural pauses.
#define NATURAL_PAUSE_MS 500

class KeyboardAccumulator {
public:
    KeyboardAccumulator();

    void pushDown(uint32_t timestamp);
    void pushUp(uint32_t timestamp);
    KeyboardFeatures features() const;
    void reset();

private:
    RingBuffer<double, KEYBOARD_HISTORY_SIZE> _intervals;
    RunningStats _intervalStats;
    uint32_t _naturalPauses;   // Within the retained window

    uint32_t _keyPressCount;
    bool _lastWasUp;
    uint32_t _lastTimestamp;
};

// =================================================================================
// SECTION: TIMING
// =================================================================================

class TimingAccumulator {
public:
    TimingAccumulator();

    void begin(uint32_t sessionStart);

    /**
     * Records an interaction of the given type.
     * @return true if this was the first interaction of the session.
     */
    bool recordInteraction(InteractionType type, uint32_t timestamp);

    TimingFeatures features() const;
    void reset();

    uint32_t getSessionStart() const { return _sessionStart; }
    bool hasFirstInteraction() const { return _hasFirst; }
    uint32_t getFirstInteraction() const { return _firstInteraction; }

private:
    uint32_t _sessionStart;
    bool _hasFirst;
    uint32_t _firstInteraction;

    bool _seen[INTERACTION_TYPE_COUNT];
    uint32_t _delays[INTERACTION_TYPE_COUNT];   // First-occurrence delay per type, in order seen
    uint32_t _delayCount;
};
