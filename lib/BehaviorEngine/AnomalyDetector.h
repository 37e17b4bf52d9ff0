/*
 * =================================================================================
 * Project:   BehaviorGate - Behavioral Human Verification Engine
 * File:      lib/BehaviorEngine/AnomalyDetector.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Rule checks that run beside the channel classifier. Each detected condition
 * appends an AnomalyFlag to a bounded log and subtracts its penalty from the
 * running confidence (clamped to [0,1]).
 *
 * Every check returns the number of flags it raised so the caller can notify
 * listeners about the newest entries of the log.
 * =================================================================================
 */
#pragma once
#include "Types.h"
#include "RingBuffer.h"
#include "ScoringRules.h"
#include "TrackerContext.h"

// --- Heuristic Constants ---
#define FAST_TYPING_MS 100          // First input this soon after first focus
#define UNIFORM_TYPING_MS 50        // Key-down to key-down interval below this
#define FAST_CLICK_MS 100           // Click-to-click interval below this
#define DEVTOOLS_THRESHOLD_PX 160   // Outer minus inner window size
#define BURST_WINDOW_MS 100         // Window after the page regains visibility
#define BURST_MAX_INTERACTIONS 5    // Field events allowed inside that window
#define VIEWPORT_RATIO_MIN 0.3f
#define VIEWPORT_RATIO_MAX 5.0f

#define INITIAL_CONFIDENCE 0.5f

class AnomalyDetector {
public:
    explicit AnomalyDetector(const IScoringRules& rules);

    void reset();

    // --- Core ---
    // Appends a flag and applies its penalty. data may be null.
    const AnomalyFlag& raise(FlagType type, const char* data, uint32_t timestamp);

    // --- Setup-Time Checks ---
    int runSetupChecks(ITrackerHAL& hal, const SecurityChecks& security, uint32_t now);

    // Re-checked on every tick. Flags on the rising edge only.
    int checkDevTools(const ViewportMetrics& vm, uint32_t now);

    // --- Event-Time Checks ---
    int onFieldFocus(const char* field, uint32_t timestamp);
    int onFieldBlur(const char* field, uint32_t timestamp);
    int onFieldInput(const char* field, uint32_t length, uint32_t timestamp, const GateConfig& gate);
    int onKeyDown(uint32_t timestamp);
    int onClick(uint32_t timestamp);
    int onPaste(const char* field, uint32_t length, uint32_t timestamp);
    int onVisibilityChange(bool visible, uint32_t timestamp);

    // --- Confidence ---
    float getConfidence() const { return _confidence; }

    // Replaces the running confidence with base minus every penalty applied so far.
    void rebase(float base);

    // --- Accessors ---
    uint32_t getFlagCount() const { return _flagCount; }   // Total raised this session
    size_t getRetainedFlagCount() const { return _flags.size(); }
    const AnomalyFlag& getFlag(size_t index) const { return _flags.at(index); }   // 0 = oldest retained

    uint32_t getHoneypotLength() const { return _honeypotLength; }

    size_t getFieldCount() const { return _fieldCount; }
    const FieldActivity* getField(size_t index) const {
        return (index < _fieldCount) ? &_fields[index] : nullptr;
    }
    const FieldActivity* findField(const char* name) const;

private:
    const IScoringRules& _rules;

    RingBuffer<AnomalyFlag, FLAG_LOG_SIZE> _flags;
    uint32_t _flagCount;
    float _confidence;
    float _penaltyTotal;

    // --- Field Table ---
    FieldActivity _fields[MAX_TRACKED_FIELDS];
    size_t _fieldCount;

    // --- Edge / Window State ---
    bool _devToolsOpen;

    bool _hasLastKeyDown;
    uint32_t _lastKeyDown;

    bool _hasLastClick;
    uint32_t _lastClick;

    bool _burstWindowOpen;
    uint32_t _burstWindowStart;
    uint32_t _burstCount;
    bool _burstFlagged;

    uint32_t _honeypotLength;

    FieldActivity* lookupField(const char* name);
    int countBurstActivity(uint32_t timestamp);
};
