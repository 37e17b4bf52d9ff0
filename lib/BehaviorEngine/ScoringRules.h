/*
 * =================================================================================
 * File:      lib/BehaviorEngine/ScoringRules.h
 * Description: Interface for scoring policies. Decouples the feature-to-score
 * math and the flag penalty table from the engine's session handling.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class IScoringRules {
public:
    virtual ~IScoringRules() {}

    /**
     * Channel scorers.
     * Responsibility: map one channel's features to a human-likelihood in [0,1].
     * Must be stateless and must not throw.
     */
    virtual float scorePointer(const PointerFeatures& f, const AnalysisConfig& analysis) const = 0;
    virtual float scoreTouch(const TouchFeatures& f) const = 0;
    virtual float scoreClick(const ClickFeatures& f) const = 0;
    virtual float scoreKeyboard(const KeyboardFeatures& f) const = 0;
    virtual float scoreTiming(const TimingFeatures& f) const = 0;

    /**
     * Confidence penalty applied when a flag of this type is raised.
     * @return A positive magnitude (subtracted from confidence).
     */
    virtual float penaltyFor(FlagType type) const = 0;
};
