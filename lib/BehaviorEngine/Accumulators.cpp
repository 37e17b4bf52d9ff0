/*
 * =================================================================================
 * Project:   BehaviorGate - Behavioral Human Verification Engine
 * File:      lib/BehaviorEngine/Accumulators.cpp
 *
 * Description:
 * Incremental feature extraction for the five interaction channels.
 * All time deltas are clamped to zero for out-of-order timestamps; a zero
 * delta contributes distance but no velocity sample.
 * =================================================================================
 */
#include <math.h>
#include <string.h>

#include "Accumulators.h"

// =================================================================================
// SECTION: POINTER
// =================================================================================

PointerAccumulator::PointerAccumulator() {
    reset();
}

void PointerAccumulator::reset() {
    _samples.clear();
    _velocity.clear();
    _acceleration.clear();
    _windowDeviation = 0.0;
    _windowDistance = 0.0;
    _totalMovement = 0.0;
    _maxVelocity = 0.0;
    _movementCount = 0;
    _hasLastVelocity = false;
    _lastVelocity = 0.0;
}

void PointerAccumulator::push(float x, float y, uint32_t timestamp) {
    PointerSample s;
    memset(&s, 0, sizeof(s));
    s.x = x;
    s.y = y;
    s.timestamp = timestamp;

    if (!_samples.empty()) {
        const PointerSample& prev = _samples.newest();
        double dist = StatUtils::distance(prev.x, prev.y, x, y);
        uint32_t dtMs = StatUtils::elapsed(prev.timestamp, timestamp);

        _totalMovement += dist;

        // 1. Velocity & Acceleration
        if (dtMs > 0) {
            double dt = dtMs / 1000.0;
            s.velocity = dist / dt;
            s.hasVelocity = true;

            if (s.velocity > _maxVelocity) _maxVelocity = s.velocity;

            if (_hasLastVelocity) {
                s.acceleration = (s.velocity - _lastVelocity) / dt;
                s.hasAcceleration = true;
            }
            _lastVelocity = s.velocity;
            _hasLastVelocity = true;
        }

        // 2. Heading change at the previous point.
        // Zero-length steps have no heading and are skipped.
        if (_samples.size() >= 2 && dist > 0.0) {
            const PointerSample& before = _samples.at(_samples.size() - 2);
            double prevDist = StatUtils::distance(before.x, before.y, prev.x, prev.y);
            if (prevDist > 0.0) {
                double a1 = atan2((double)prev.y - before.y, (double)prev.x - before.x);
                double a2 = atan2((double)y - prev.y, (double)x - prev.x);
                s.deviation = StatUtils::headingDeviation(a1, a2);
                s.deviationDistance = dist;
            }
        }
    }

    if (s.hasVelocity) _velocity.add(s.velocity);
    if (s.hasAcceleration) _acceleration.add(s.acceleration);
    _windowDeviation += s.deviation;
    _windowDistance += s.deviationDistance;
    _movementCount++;

    PointerSample evicted;
    if (_samples.push(s, &evicted)) {
        retract(evicted);
    }
}

void PointerAccumulator::retract(const PointerSample& evicted) {
    if (evicted.hasVelocity) _velocity.remove(evicted.velocity);
    if (evicted.hasAcceleration) _acceleration.remove(evicted.acceleration);
    _windowDeviation -= evicted.deviation;
    _windowDistance -= evicted.deviationDistance;
    if (_windowDeviation < 0.0) _windowDeviation = 0.0;
    if (_windowDistance < 0.0) _windowDistance = 0.0;
}

PointerFeatures PointerAccumulator::features() const {
    PointerFeatures f;
    f.sampleCount = (uint32_t)_samples.size();
    f.movementCount = _movementCount;
    f.totalMovement = (float)_totalMovement;
    f.avgVelocity = (float)_velocity.mean();
    f.maxVelocity = (float)_maxVelocity;
    f.velocityVariance = (float)_velocity.variance();
    f.accelerationVariance = (float)_acceleration.variance();

    // 1.0 = perfectly straight, lower = organically curved
    f.linearity = 0.0f;
    if (_samples.size() >= 3 && _windowDistance > 1e-9) {
        f.linearity = StatUtils::clamp01((float)(1.0 - (_windowDeviation / _windowDistance)));
    }
    return f;
}

// =================================================================================
// SECTION: TOUCH
// =================================================================================

TouchAccumulator::TouchAccumulator() {
    reset();
}

void TouchAccumulator::reset() {
    _swipeVelocities.clear();
    _swipeStats.clear();
    _touchCount = 0;
    _swipeCount = 0;
    _totalSwipeDistance = 0.0;
    _multiTouch = false;
    _hasLastMove = false;
    memset(&_lastMove, 0, sizeof(_lastMove));
}

void TouchAccumulator::push(TouchPhase phase, float x, float y, uint8_t contacts, uint32_t timestamp) {
    _touchCount++;

    if (contacts >= 2) {
        _multiTouch = true;
    }

    if (phase != TOUCH_MOVE) return;

    TouchSample s;
    s.phase = phase;
    s.timestamp = timestamp;
    s.contacts = contacts;
    s.x = x;
    s.y = y;

    // Swipe between consecutive move samples that both carry a contact
    if (_hasLastMove && _lastMove.contacts > 0 && contacts > 0) {
        uint32_t dtMs = StatUtils::elapsed(_lastMove.timestamp, timestamp);
        if (dtMs > 0) {
            double dist = StatUtils::distance(_lastMove.x, _lastMove.y, x, y);
            double velocity = dist / (dtMs / 1000.0);

            double evicted = 0.0;
            if (_swipeVelocities.push(velocity, &evicted)) {
                _swipeStats.remove(evicted);
            }
            _swipeStats.add(velocity);
            _totalSwipeDistance += dist;
            _swipeCount++;
        }
    }

    _lastMove = s;
    _hasLastMove = true;
}

TouchFeatures TouchAccumulator::features() const {
    TouchFeatures f;
    f.touchCount = _touchCount;
    f.swipeCount = _swipeCount;
    f.multiTouch = _multiTouch;
    f.totalSwipeDistance = (float)_totalSwipeDistance;
    f.avgSwipeVelocity = (float)_swipeStats.mean();
    f.swipeVelocityVariance = (float)_swipeStats.variance();
    return f;
}

// =================================================================================
// SECTION: CLICK
// =================================================================================

ClickAccumulator::ClickAccumulator() {
    reset();
}

void ClickAccumulator::reset() {
    _intervals.clear();
    _intervalStats.clear();
    _clickCount = 0;
    _lastClick = 0;
}

void ClickAccumulator::push(uint32_t timestamp) {
    if (_clickCount > 0) {
        double interval = StatUtils::elapsed(_lastClick, timestamp);
        double evicted = 0.0;
        if (_intervals.push(interval, &evicted)) {
            _intervalStats.remove(evicted);
        }
        _intervalStats.add(interval);
    }

    _lastClick = timestamp;
    _clickCount++;
}

ClickFeatures ClickAccumulator::features() const {
    ClickFeatures f;
    f.clickCount = _clickCount;
    f.intervalCount = (uint32_t)_intervals.size();
    f.avgInterval = (float)_intervalStats.mean();
    f.intervalVariance = (float)_intervalStats.variance();
    f.consistency = 0.0f;

    // Fraction of intervals sitting on the mean (bounded by the window size)
    if (!_intervals.empty()) {
        double mean = _intervalStats.mean();
        uint32_t consistent = 0;
        for (size_t i = 0; i < _intervals.size(); i++) {
            if (fabs(_intervals.at(i) - mean) <= CLICK_CONSISTENCY_TOLERANCE_MS) {
                consistent++;
            }
        }
        f.consistency = (float)consistent / (float)_intervals.size();
    }
    return f;
}

// =================================================================================
// SECTION: KEYBOARD
// =================================================================================

KeyboardAccumulator::KeyboardAccumulator() {
    reset();
}

void KeyboardAccumulator::reset() {
    _intervals.clear();
    _intervalStats.clear();
    _naturalPauses = 0;
    _keyPressCount = 0;
    _lastWasUp = false;
    _lastTimestamp = 0;
}

// Interval = time from the previous key release to this press.
void KeyboardAccumulator::pushDown(uint32_t timestamp) {
    _keyPressCount++;

    if (_lastWasUp) {
        double interval = StatUtils::elapsed(_lastTimestamp, timestamp);
        double evicted = 0.0;
        if (_intervals.push(interval, &evicted)) {
            _intervalStats.remove(evicted);
            if (evicted > NATURAL_PAUSE_MS && _naturalPauses > 0) _naturalPauses--;
        }
        _intervalStats.add(interval);
        if (interval > NATURAL_PAUSE_MS) _naturalPauses++;
    }

    _lastWasUp = false;
    _lastTimestamp = timestamp;
}

void KeyboardAccumulator::pushUp(uint32_t timestamp) {
    _keyPressCount++;
    _lastWasUp = true;
    _lastTimestamp = timestamp;
}

KeyboardFeatures KeyboardAccumulator::features() const {
    KeyboardFeatures f;
    f.keyPressCount = _keyPressCount;
    f.intervalCount = (uint32_t)_intervals.size();
    f.avgInterval = (float)_intervalStats.mean();
    f.intervalVariance = (float)_intervalStats.variance();
    f.naturalPauses = _naturalPauses;
    return f;
}

// =================================================================================
// SECTION: TIMING
// =================================================================================

TimingAccumulator::TimingAccumulator() {
    reset();
}

void TimingAccumulator::reset() {
    _sessionStart = 0;
    _hasFirst = false;
    _firstInteraction = 0;
    _delayCount = 0;
    for (int i = 0; i < INTERACTION_TYPE_COUNT; i++) {
        _seen[i] = false;
        _delays[i] = 0;
    }
}

void TimingAccumulator::begin(uint32_t sessionStart) {
    reset();
    _sessionStart = sessionStart;
}

bool TimingAccumulator::recordInteraction(InteractionType type, uint32_t timestamp) {
    if (type < INTERACTION_TYPE_COUNT && !_seen[type]) {
        _seen[type] = true;
        _delays[_delayCount++] = StatUtils::elapsed(_sessionStart, timestamp);
    }

    if (!_hasFirst) {
        _hasFirst = true;
        _firstInteraction = timestamp;
        return true;
    }
    return false;
}

TimingFeatures TimingAccumulator::features() const {
    TimingFeatures f;
    f.hasFirstInteraction = _hasFirst;
    f.firstInteractionDelay = _hasFirst ? StatUtils::elapsed(_sessionStart, _firstInteraction) : 0;
    f.delayCount = _delayCount;

    RunningStats stats;
    for (uint32_t i = 0; i < _delayCount; i++) {
        stats.add(_delays[i]);
    }
    f.delayVariance = (float)stats.variance();
    return f;
}
