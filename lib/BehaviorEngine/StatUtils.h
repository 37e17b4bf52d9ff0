/*
 * =================================================================================
 * Project:   BehaviorGate - Behavioral Human Verification Engine
 * File:      lib/BehaviorEngine/StatUtils.h
 *
 * Description:
 * Pure math helpers shared by the accumulators and scorers.
 * Kept header-only so the native tests can use them without linking.
 * =================================================================================
 */
#pragma once
#include <math.h>
#include <stdint.h>

/**
 * Running sum / sum-of-squares over a sliding window.
 * Values are added when observed and removed when evicted, so the
 * variance is always that of the retained window.
 */
class RunningStats {
public:
    RunningStats() : _count(0), _sum(0.0), _sumSq(0.0) {}

    void add(double value) {
        _count++;
        _sum += value;
        _sumSq += value * value;
    }

    void remove(double value) {
        if (_count == 0) return;
        _count--;
        _sum -= value;
        _sumSq -= value * value;
        if (_count == 0) {
            _sum = 0.0;
            _sumSq = 0.0;
        }
    }

    void clear() {
        _count = 0;
        _sum = 0.0;
        _sumSq = 0.0;
    }

    uint32_t count() const { return _count; }

    double mean() const { return _count > 0 ? _sum / _count : 0.0; }

    // Population variance. Rounding can leave a tiny negative residue; clamp it.
    double variance() const {
        if (_count == 0) return 0.0;
        double m = mean();
        double v = (_sumSq / _count) - (m * m);
        return v > 0.0 ? v : 0.0;
    }

private:
    uint32_t _count;
    double _sum;
    double _sumSq;
};

class StatUtils {
public:
    static float clamp(float value, float lo, float hi) {
        if (value < lo) return lo;
        if (value > hi) return hi;
        return value;
    }

    static float clamp01(float value) { return clamp(value, 0.0f, 1.0f); }

    static double distance(double x1, double y1, double x2, double y2) {
        double dx = x2 - x1;
        double dy = y2 - y1;
        return sqrt(dx * dx + dy * dy);
    }

    /**
     * Absolute change of heading between two direction angles (radians),
     * folded into [0, PI] so a turn across the +/-PI seam is not counted
     * as a near full revolution.
     */
    static double headingDeviation(double angle1, double angle2) {
        const double PI = 3.14159265358979323846;
        double d = fabs(angle2 - angle1);
        if (d > PI) d = 2.0 * PI - d;
        return d;
    }

    /**
     * Millisecond delta that survives the 32-bit clock wrap (~49.7 days).
     * A negative signed difference means the event is out of order and
     * clamps to zero, so deltas are valid up to ~24.8 days.
     */
    static uint32_t elapsed(uint32_t from, uint32_t to) {
        int32_t diff = (int32_t)(to - from);
        return diff > 0 ? (uint32_t)diff : 0;
    }
};
