/*
 * =================================================================================
 * Project:   BehaviorGate - Behavioral Human Verification Engine
 * File:      lib/BehaviorEngine/BehaviorEngine.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Header for the BehaviorEngine class. One instance owns one tracked session.
 *
 * NOTES:
 * 1. Decoupled from the host (clock, logging, environment probe) via ITrackerHAL.
 * 2. Decoupled from the scoring math and penalty table via IScoringRules.
 * 3. Single tagged entry point observe() for every interaction event.
 * 4. tick() is the only periodic operation; the host drives it at
 *    analysis.analysisIntervalMs under its state lock.
 * 5. Listener callbacks are isolated: a throwing listener is logged and the
 *    remaining listeners still run.
 * =================================================================================
 */
#pragma once
#include <exception>

#include "Types.h"
#include "TrackerContext.h"
#include "TrackerListener.h"
#include "ScoringRules.h"
#include "Accumulators.h"
#include "AnomalyDetector.h"

#define CONFIG_ERROR_LENGTH 127

class BehaviorEngine {
public:
    BehaviorEngine(ITrackerHAL& hal, const IScoringRules& rules, const EngineConfig& config);

    // --- Lifecycle ---
    // Returns 200 on success, 409 if already tracking, 400 if the configuration is invalid.
    int start();
    void stop();
    void reset();

    // --- Event Entry Point ---
    void observe(const InteractionEvent& event);

    // --- Periodic Re-Evaluation ---
    void tick();

    // --- Submission ---
    VerificationDecision decide();
    VerificationToken makeToken(const VerificationDecision& decision);

    // --- Notifications ---
    bool addListener(ITrackerListener* listener);
    void removeListener(ITrackerListener* listener);

    // --- Queries (Read-Only) ---
    bool isTracking() const { return _tracking; }
    float currentScore() const { return _scores.overall; }
    Classification classification() const { return _classification; }
    AnalysisSnapshot analysisSnapshot() const;
    VerificationStatus getVerificationStatus() const;
    VerificationStatus refreshVerification();

    const ChannelScores& getScores() const { return _scores; }
    VerificationLevel getLevel() const { return _level; }
    float getConfidence() const { return _anomalies.getConfidence(); }
    float getVerificationScore() const { return _verificationScore; }
    uint32_t getSessionDuration() const;
    uint32_t getStartTime() const { return _startTime; }
    uint32_t getInteractedChannels() const;
    const AnomalyDetector& getAnomalies() const { return _anomalies; }

    // --- Configuration ---
    const EngineConfig& getConfig() const { return _config; }
    bool isConfigValid() const { return _configValid; }
    const char* getConfigError() const { return _configError; }

    void printStartupDiagnostics();

    /**
     * Validates a configuration.
     * @return false with a description in errBuf if the configuration is unusable.
     */
    static bool validateConfig(const EngineConfig& config, char* errBuf, size_t errSize);

private:
    // --- Dependencies ---
    ITrackerHAL& _hal;
    const IScoringRules& _rules;

    // --- Configuration ---
    EngineConfig _config;
    bool _configValid;
    char _configError[CONFIG_ERROR_LENGTH + 1];

    // --- Channel Accumulators ---
    PointerAccumulator _pointer;
    TouchAccumulator _touch;
    ClickAccumulator _click;
    KeyboardAccumulator _keyboard;
    TimingAccumulator _timing;

    // --- Flag Detector & Confidence ---
    AnomalyDetector _anomalies;

    // --- Session State ---
    bool _tracking;
    bool _dirty;
    bool _scored;
    uint32_t _startTime;
    uint32_t _stopTime;
    ChannelScores _scores;
    Classification _classification;
    VerificationLevel _level;
    float _verificationScore;

    // --- Listeners ---
    ITrackerListener* _listeners[MAX_LISTENERS];
    size_t _listenerCount;

    // =========================================================================
    // SECTION: INTERNAL HELPERS
    // =========================================================================

    void clearSession();
    void evaluate();
    void recomputeScores();
    void changeClassification(Classification next);
    void updateVerificationLevel();
    void recordInteraction(InteractionType type, uint32_t timestamp);
    void notifyNewFlags(uint32_t flagCountBefore);

    uint32_t sessionEnd() const;

    void addRecommendation(VerificationDecision& d, const char* text);
    VerificationDecision makeDecision(bool allow, const char* reason, const char* recommendation);

    // Invokes fn on every listener, isolating exceptions per listener.
    template <typename Fn>
    void dispatch(const char* hook, Fn fn) {
        ITrackerListener* snapshot[MAX_LISTENERS];
        size_t count = _listenerCount;
        for (size_t i = 0; i < count; i++) snapshot[i] = _listeners[i];

        for (size_t i = 0; i < count; i++) {
            try {
                fn(*snapshot[i]);
            } catch (const std::exception& e) {
                logListenerFailure(hook, e.what());
            } catch (...) {
                logListenerFailure(hook, "unknown exception");
            }
        }
    }

    void logListenerFailure(const char* hook, const char* what);
    void logKeyValue(const char* key, const char* value);
};
