/* =================================================================================
 * File:      lib/BehaviorEngine/StandardRules.h
 * =================================================================================
 */
#pragma once
#include "ScoringRules.h"
#include "StatUtils.h"

// Variance scale constants (variance / scale, then capped)
#define VELOCITY_VARIANCE_SCALE 1000.0f
#define ACCELERATION_VARIANCE_SCALE 10000.0f
#define SWIPE_VARIANCE_SCALE 1000.0f
#define CLICK_VARIANCE_SCALE 100000.0f
#define KEYBOARD_VARIANCE_SCALE 10000.0f
#define TIMING_VARIANCE_SCALE 1000000.0f

class StandardRules : public IScoringRules {
public:
    // --- 1. Pointer ---
    float scorePointer(const PointerFeatures& f, const AnalysisConfig& analysis) const override {
        // No pointer motion is itself a strong automation signal
        if (f.sampleCount < analysis.minPointerSamples) {
            return 0.1f;
        }

        float score = 0.5f;

        if (f.linearity > analysis.suspiciousLinearity) {
            // Robotic path: speed jitter along a ruler line earns nothing
            score -= 0.4f;
        } else {
            score += minf(f.velocityVariance / VELOCITY_VARIANCE_SCALE, 0.3f);
            score += minf(f.accelerationVariance / ACCELERATION_VARIANCE_SCALE, 0.2f);
        }

        return StatUtils::clamp01(score);
    }

    // --- 2. Touch ---
    float scoreTouch(const TouchFeatures& f) const override {
        // Desktop sessions are not penalized
        if (f.touchCount == 0) return 0.5f;

        float score = 0.5f;
        if (f.multiTouch) {
            score += 0.2f;
        }
        if (f.swipeCount > 0) {
            score += minf(f.swipeVelocityVariance / SWIPE_VARIANCE_SCALE, 0.3f);
        }
        return StatUtils::clamp01(score);
    }

    // --- 3. Click ---
    float scoreClick(const ClickFeatures& f) const override {
        if (f.intervalCount == 0) return 0.5f;

        float score = 0.5f;
        score += minf(f.intervalVariance / CLICK_VARIANCE_SCALE, 0.4f);

        // Metronome clicking
        if (f.consistency > 0.8f) {
            score -= 0.3f;
        }
        return StatUtils::clamp01(score);
    }

    // --- 4. Keyboard ---
    float scoreKeyboard(const KeyboardFeatures& f) const override {
        if (f.intervalCount == 0) return 0.5f;

        float score = 0.5f;
        score += minf(f.intervalVariance / KEYBOARD_VARIANCE_SCALE, 0.4f);
        score += minf((float)f.naturalPauses / (float)f.intervalCount, 0.1f);
        return StatUtils::clamp01(score);
    }

    // --- 5. Timing ---
    float scoreTiming(const TimingFeatures& f) const override {
        float score = 0.5f;

        if (f.hasFirstInteraction) {
            uint32_t delay = f.firstInteractionDelay;
            if (delay < 100) {
                score -= 0.3f;
            } else if (delay > 500 && delay < 10000) {
                score += 0.3f;
            }
        }

        if (f.delayCount > 1) {
            score += minf(f.delayVariance / TIMING_VARIANCE_SCALE, 0.2f);
        }
        return StatUtils::clamp01(score);
    }

    // --- 6. Penalty Table ---
    float penaltyFor(FlagType type) const override {
        switch (type) {
            case FLAG_HONEYPOT_FILLED: return 0.8f;
            case FLAG_BOT_BEHAVIOR:    return 0.6f;
            case FLAG_WEBDRIVER:       return 0.7f;
            case FLAG_PHANTOM:         return 0.9f;
            case FLAG_DEVTOOLS:        return 0.2f;
            case FLAG_FAST_TYPING:     return 0.3f;
            case FLAG_UNIFORM_TYPING:  return 0.4f;
            case FLAG_PASTE:           return 0.1f;
            default:                   return 0.1f;
        }
    }

private:
    static float minf(float a, float b) { return a < b ? a : b; }
};
