/*
 * =================================================================================
 * Project:   BehaviorGate - Behavioral Human Verification Engine
 * File:      lib/BehaviorEngine/VerificationRules.h
 *
 * Description:
 * Pure decision math: weighted fusion, three-way classification, the
 * verification level table and the composite submission score.
 * Header-only so the native tests can exercise the tables directly.
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include "Types.h"
#include "StatUtils.h"

class VerificationRules {
public:
    /**
     * Weighted sum of the five channel scores, clamped to [0,1].
     */
    static float fuse(const ChannelScores& s, const ScoringWeights& w) {
        float overall = s.pointer * w.pointer +
                        s.touch * w.touch +
                        s.click * w.click +
                        s.keyboard * w.keyboard +
                        s.timing * w.timing;
        return StatUtils::clamp01(overall);
    }

    static Classification classify(float score, const ClassifierThresholds& t) {
        if (score <= t.botThreshold) return CLASS_BOT;
        if (score >= t.humanThreshold) return CLASS_HUMAN;
        return CLASS_UNCERTAIN;
    }

    /**
     * Level the current state qualifies for, ignoring what was reached before.
     */
    static VerificationLevel evaluateLevel(float confidence, uint32_t flagCount,
                                           uint32_t elapsedMs, uint32_t minTrackingTimeMs) {
        if (confidence >= 0.8f && flagCount == 0 && elapsedMs >= minTrackingTimeMs) {
            return LEVEL_VERIFIED;
        }
        if (confidence >= 0.6f && flagCount <= 1) {
            return LEVEL_ENHANCED;
        }
        if (confidence >= 0.4f) {
            return LEVEL_BASIC;
        }
        return LEVEL_NONE;
    }

    // Levels only move up; only a session reset clears them.
    static VerificationLevel advance(VerificationLevel current, VerificationLevel candidate) {
        return candidate > current ? candidate : current;
    }

    /**
     * Composite submission score in [0,100].
     */
    static float compositeScore(float confidence, float overall,
                                uint32_t interactedChannels, uint32_t requiredChannels,
                                uint32_t sessionTimeMs, uint32_t minFillTimeMs,
                                uint32_t flagCount) {
        float score = confidence * 100.0f;
        score += overall * 20.0f;
        if (interactedChannels >= requiredChannels) score += 10.0f;
        if (sessionTimeMs >= minFillTimeMs) score += 5.0f;
        score -= (float)flagCount * 15.0f;
        return StatUtils::clamp(score, 0.0f, 100.0f);
    }
};
