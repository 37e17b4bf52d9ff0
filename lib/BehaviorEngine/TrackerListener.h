/*
 * =================================================================================
 * File:      lib/BehaviorEngine/TrackerListener.h
 * Description: Observer interface for engine notifications. All hooks default
 * to no-ops so collaborators override only what they render.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class ITrackerListener {
public:
    virtual ~ITrackerListener() {}

    // Fired after every periodic re-evaluation that recomputed scores.
    virtual void onScoreUpdate(float overall, const ChannelScores& scores) {}

    // Edge-triggered: once per transition into the classification.
    virtual void onBotDetected(const AnalysisSnapshot& snapshot) {}
    virtual void onHumanDetected(const AnalysisSnapshot& snapshot) {}

    virtual void onAnomalyFlag(const AnomalyFlag& flag) {}
    virtual void onDecision(const VerificationDecision& decision) {}
};
