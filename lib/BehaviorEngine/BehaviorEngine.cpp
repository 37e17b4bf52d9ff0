/*
 * =================================================================================
 * Project:   BehaviorGate - Behavioral Human Verification Engine
 * File:      lib/BehaviorEngine/BehaviorEngine.cpp
 *
 * Description:
 * Session logic.
 * - Routes tagged events into the channel accumulators and the flag detector.
 * - Uses 'ScoringRules' for the per-channel math and the penalty table.
 * - Fuses channel scores, classifies, and fires edge-triggered notifications.
 * - Tracks the verification level (never downgraded until reset).
 * - Runs the ordered submission gate.
 * =================================================================================
 */
#include <math.h>
#include <stdio.h>
#include <string.h>

#include "BehaviorEngine.h"
#include "TimeUtils.h"
#include "VerificationRules.h"

// Confidence bonus while the classifier reports human
static const float HUMAN_CONFIDENCE_BONUS = 0.2f;

static const float WEIGHT_SUM_EPSILON = 0.001f;

// =================================================================================
// SECTION: CONSTRUCTOR & INIT
// =================================================================================

BehaviorEngine::BehaviorEngine(ITrackerHAL& hal, const IScoringRules& rules, const EngineConfig& config)
    : _hal(hal),
      _rules(rules),
      _config(config),
      _anomalies(rules)
{
    _listenerCount = 0;
    for (int i = 0; i < MAX_LISTENERS; i++) _listeners[i] = nullptr;

    clearSession();

    // Fail fast: an invalid configuration is reported now and every start() is refused.
    _configError[0] = '\0';
    _configValid = validateConfig(_config, _configError, sizeof(_configError));
    if (!_configValid) {
        char logBuf[192];
        snprintf(logBuf, sizeof(logBuf), "Config Error: %s", _configError);
        logKeyValue("Engine", logBuf);
    }
}

void BehaviorEngine::clearSession() {
    _pointer.reset();
    _touch.reset();
    _click.reset();
    _keyboard.reset();
    _timing.reset();
    _anomalies.reset();

    _tracking = false;
    _dirty = false;
    _scored = false;
    _startTime = 0;
    _stopTime = 0;

    _scores.pointer = 0.5f;
    _scores.touch = 0.5f;
    _scores.click = 0.5f;
    _scores.keyboard = 0.5f;
    _scores.timing = 0.5f;
    _scores.overall = 0.5f;

    _classification = CLASS_UNCERTAIN;
    _level = LEVEL_NONE;
    _verificationScore = 0.0f;
}

// =================================================================================
// SECTION: INTERNAL HELPERS (Logging & Utils)
// =================================================================================

void BehaviorEngine::logKeyValue(const char* key, const char* value) {
    char tempBuf[192];
    // Format: " Key : Value"
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _hal.log(tempBuf);
}

void BehaviorEngine::logListenerFailure(const char* hook, const char* what) {
    char logBuf[160];
    snprintf(logBuf, sizeof(logBuf), "%s threw: %s", hook, what ? what : "");
    logKeyValue("Listener", logBuf);
}

uint32_t BehaviorEngine::sessionEnd() const {
    return _tracking ? (uint32_t)_hal.getMillis() : _stopTime;
}

uint32_t BehaviorEngine::getSessionDuration() const {
    return StatUtils::elapsed(_startTime, sessionEnd());
}

uint32_t BehaviorEngine::getInteractedChannels() const {
    uint32_t count = 0;
    if (_pointer.getMovementCount() > 0) count++;
    if (_touch.features().touchCount > 0) count++;
    if (_click.hasLastClick()) count++;
    if (_keyboard.features().keyPressCount > 0) count++;
    if (_timing.hasFirstInteraction()) count++;
    return count;
}

/**
 * Unified Configuration Validator.
 * Weights must be non-negative and sum to 1, thresholds must be ordered
 * inside [0,1], and the analysis cadence and sample minimum must be non-zero.
 */
bool BehaviorEngine::validateConfig(const EngineConfig& config, char* errBuf, size_t errSize) {
    char localBuf[CONFIG_ERROR_LENGTH + 1];
    if (!errBuf || errSize == 0) {
        errBuf = localBuf;
        errSize = sizeof(localBuf);
    }
    errBuf[0] = '\0';

    // --- 1. Weights ---
    const ScoringWeights& w = config.weights;
    const float weights[CHANNEL_COUNT] = { w.pointer, w.touch, w.click, w.keyboard, w.timing };
    float sum = 0.0f;
    for (int i = 0; i < CHANNEL_COUNT; i++) {
        if (!(weights[i] >= 0.0f)) {
            snprintf(errBuf, errSize, "Weight '%s' must be >= 0 (got %.3f).", channelToString((Channel)i), weights[i]);
            return false;
        }
        sum += weights[i];
    }
    if (fabsf(sum - 1.0f) > WEIGHT_SUM_EPSILON) {
        snprintf(errBuf, errSize, "Weights must sum to 1.0 (got %.4f).", sum);
        return false;
    }

    // --- 2. Thresholds ---
    const ClassifierThresholds& t = config.thresholds;
    if (!(t.botThreshold >= 0.0f && t.botThreshold <= 1.0f)) {
        snprintf(errBuf, errSize, "botThreshold must be within [0,1] (got %.3f).", t.botThreshold);
        return false;
    }
    if (!(t.humanThreshold >= 0.0f && t.humanThreshold <= 1.0f)) {
        snprintf(errBuf, errSize, "humanThreshold must be within [0,1] (got %.3f).", t.humanThreshold);
        return false;
    }
    if (t.botThreshold >= t.humanThreshold) {
        snprintf(errBuf, errSize, "botThreshold must be below humanThreshold.");
        return false;
    }

    // --- 3. Analysis ---
    if (config.analysis.analysisIntervalMs == 0) {
        snprintf(errBuf, errSize, "analysisIntervalMs must be > 0.");
        return false;
    }
    if (config.analysis.minPointerSamples == 0) {
        snprintf(errBuf, errSize, "minPointerSamples must be > 0.");
        return false;
    }
    if (config.analysis.minPointerSamples > POINTER_HISTORY_SIZE) {
        snprintf(errBuf, errSize, "minPointerSamples cannot exceed the pointer history (%d).", POINTER_HISTORY_SIZE);
        return false;
    }
    if (!(config.analysis.suspiciousLinearity >= 0.0f && config.analysis.suspiciousLinearity <= 1.0f)) {
        snprintf(errBuf, errSize, "suspiciousLinearity must be within [0,1].");
        return false;
    }

    // --- 4. Gate ---
    if (config.gate.requiredChannels > CHANNEL_COUNT) {
        snprintf(errBuf, errSize, "requiredChannels cannot exceed %d.", CHANNEL_COUNT);
        return false;
    }
    if (config.gate.honeypotEnabled && config.gate.honeypotField[0] == '\0') {
        snprintf(errBuf, errSize, "honeypotField cannot be empty when the honeypot is enabled.");
        return false;
    }

    return true;
}

void BehaviorEngine::printStartupDiagnostics() {
    char logBuf[160];
    const char* boolStr[] = { "NO", "YES" };

    _hal.log("==========================================================================");
    _hal.log("                        BEHAVIOR ENGINE DIAGNOSTICS                       ");
    _hal.log("==========================================================================");

    // -------------------------------------------------------------------------
    // SECTION: CURRENT STATE
    // -------------------------------------------------------------------------
    _hal.log("[ ENGINE STATE ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Tracking", boolStr[_tracking]);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Classification", classificationToString(_classification));
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Verification Level", levelToString(_level));
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %.2f", "Overall Score", _scores.overall);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %.2f", "Confidence", _anomalies.getConfidence());
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Flags Raised", _anomalies.getFlagCount());
    _hal.log(logBuf);

    char timeStr[64];
    TimeUtils::formatMillis(getSessionDuration(), timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Session Duration", timeStr);
    _hal.log(logBuf);

    // -------------------------------------------------------------------------
    // SECTION: CONFIGURATION STATUS
    // -------------------------------------------------------------------------
    _hal.log("");
    _hal.log("[ CONFIGURATION STATUS ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Self-Check", _configValid ? "PASS" : "FAIL (INVALID CONFIG)");
    _hal.log(logBuf);

    if (!_configValid) {
        snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Reason", _configError);
        _hal.log(logBuf);
        _hal.log(" WARNING: Engine will reject start requests until configuration is fixed.");
    }

    // -------------------------------------------------------------------------
    // SECTION: CLASSIFIER
    // -------------------------------------------------------------------------
    _hal.log("");
    _hal.log("[ CLASSIFIER ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : <= %.2f", "Bot Threshold", _config.thresholds.botThreshold);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : >= %.2f", "Human Threshold", _config.thresholds.humanThreshold);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u ms", "Analysis Interval", _config.analysis.analysisIntervalMs);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Min Pointer Samples", _config.analysis.minPointerSamples);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %.2f", "Suspicious Linearity", _config.analysis.suspiciousLinearity);
    _hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %.2f / %.2f / %.2f / %.2f / %.2f", "Weights (P/T/C/K/Tm)",
             _config.weights.pointer, _config.weights.touch, _config.weights.click,
             _config.weights.keyboard, _config.weights.timing);
    _hal.log(logBuf);

    // -------------------------------------------------------------------------
    // SECTION: SUBMISSION GATE
    // -------------------------------------------------------------------------
    _hal.log("");
    _hal.log("[ SUBMISSION GATE ]");

    TimeUtils::formatMillis(_config.gate.minTrackingTimeMs, timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Min Tracking Time", timeStr);
    _hal.log(logBuf);
    TimeUtils::formatMillis(_config.gate.minFillTimeMs, timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Min Fill Time", timeStr);
    _hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Require Pointer", boolStr[_config.gate.requireMouseMovement]);
    _hal.log(logBuf);
    if (_config.gate.requireMouseMovement) {
        snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Min Pointer Moves", _config.gate.minMouseMovements);
        _hal.log(logBuf);
    }
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Required Channels", _config.gate.requiredChannels);
    _hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Honeypot", boolStr[_config.gate.honeypotEnabled]);
    _hal.log(logBuf);
    if (_config.gate.honeypotEnabled) {
        snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Honeypot Field", _config.gate.honeypotField);
        _hal.log(logBuf);
    }

    // -------------------------------------------------------------------------
    // SECTION: ENVIRONMENT PROBE
    // -------------------------------------------------------------------------
    _hal.log("");
    _hal.log("[ ENVIRONMENT PROBE ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Automation Checks", boolStr[_config.security.checkAutomationFlags]);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "User-Agent Checks", boolStr[_config.security.validateUserAgent]);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Viewport Checks", boolStr[_config.security.checkViewportRatio]);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "DevTools Checks", boolStr[_config.security.checkDevTools]);
    _hal.log(logBuf);

    char ua[USER_AGENT_LENGTH + 1];
    _hal.getUserAgent(ua, sizeof(ua));
    snprintf(logBuf, sizeof(logBuf), " %-25s : %.100s", "User Agent", ua[0] ? ua : "(empty)");
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %d", "Languages", _hal.getLanguageCount());
    _hal.log(logBuf);

    ViewportMetrics vm;
    memset(&vm, 0, sizeof(vm));
    if (_hal.getViewport(vm)) {
        snprintf(logBuf, sizeof(logBuf), " %-25s : %ux%u (outer %ux%u)", "Viewport",
                 vm.innerWidth, vm.innerHeight, vm.outerWidth, vm.outerHeight);
    } else {
        snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Viewport", "N/A");
    }
    _hal.log(logBuf);
}

// =================================================================================
// SECTION: LIFECYCLE
// =================================================================================

int BehaviorEngine::start() {
    if (_tracking) {
        logKeyValue("Engine", "Start Failed: Session already tracking.");
        return 409;
    }

    if (!_configValid) {
        logKeyValue("Engine", "Start Failed: Invalid Engine Configuration.");
        return 400;
    }

    // Every start is a fresh session
    clearSession();

    uint32_t now = (uint32_t)_hal.getMillis();
    _startTime = now;
    _timing.begin(now);
    _tracking = true;
    _dirty = true;

    logKeyValue("Engine", "Tracking started.");

    // Setup-time environment checks
    uint32_t before = _anomalies.getFlagCount();
    _anomalies.runSetupChecks(_hal, _config.security, now);
    notifyNewFlags(before);

    return 200;
}

void BehaviorEngine::stop() {
    if (!_tracking) return;

    _stopTime = (uint32_t)_hal.getMillis();
    _tracking = false;

    char timeStr[64];
    char logBuf[96];
    TimeUtils::formatMillis(getSessionDuration(), timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), "Tracking stopped after %s.", timeStr);
    logKeyValue("Engine", logBuf);
}

void BehaviorEngine::reset() {
    clearSession();
    logKeyValue("Engine", "Session reset.");
}

// =================================================================================
// SECTION: EVENT CAPTURE
// =================================================================================

void BehaviorEngine::recordInteraction(InteractionType type, uint32_t timestamp) {
    if (_timing.recordInteraction(type, timestamp)) {
        char timeStr[64];
        char logBuf[96];
        TimeUtils::formatMillis(StatUtils::elapsed(_startTime, timestamp), timeStr, sizeof(timeStr));
        snprintf(logBuf, sizeof(logBuf), "First interaction after %s.", timeStr);
        logKeyValue("Engine", logBuf);
    }
}

/**
 * Single tagged entry point. Payload fields that do not apply to the kind
 * (or are missing) are ignored.
 */
void BehaviorEngine::observe(const InteractionEvent& event) {
    if (!_tracking) return;

    const uint32_t ts = event.timestamp;
    uint32_t before = _anomalies.getFlagCount();

    switch (event.kind) {
    case EVT_POINTER_MOVE:
        if (event.hasPosition) {
            _pointer.push(event.x, event.y, ts);
            recordInteraction(INTERACT_POINTER, ts);
        }
        break;

    case EVT_POINTER_DOWN:
        recordInteraction(INTERACT_POINTER, ts);
        break;

    case EVT_CLICK:
        _click.push(ts);
        _anomalies.onClick(ts);
        recordInteraction(INTERACT_CLICK, ts);
        break;

    case EVT_TOUCH_START:
    case EVT_TOUCH_MOVE:
    case EVT_TOUCH_END: {
        TouchPhase phase = TOUCH_START;
        if (event.kind == EVT_TOUCH_MOVE) phase = TOUCH_MOVE;
        else if (event.kind == EVT_TOUCH_END) phase = TOUCH_END;

        // No position without a contact
        uint8_t contacts = event.hasPosition ? event.contacts : 0;
        _touch.push(phase, event.x, event.y, contacts, ts);

        if (phase != TOUCH_END) {
            recordInteraction(INTERACT_TOUCH, ts);
        }
        break;
    }

    case EVT_KEY_DOWN:
        _keyboard.pushDown(ts);
        _anomalies.onKeyDown(ts);
        recordInteraction(INTERACT_KEYBOARD, ts);
        break;

    case EVT_KEY_UP:
        _keyboard.pushUp(ts);
        break;

    case EVT_FOCUS:
        _anomalies.onFieldFocus(event.field, ts);
        recordInteraction(INTERACT_FIELD, ts);
        break;

    case EVT_BLUR:
        _anomalies.onFieldBlur(event.field, ts);
        break;

    case EVT_VISIBILITY_CHANGE:
        _anomalies.onVisibilityChange(event.visible, ts);
        break;

    case EVT_PASTE:
        _anomalies.onPaste(event.field, event.length, ts);
        recordInteraction(INTERACT_FIELD, ts);
        break;

    case EVT_FIELD_INPUT:
        _anomalies.onFieldInput(event.field, event.length, ts, _config.gate);
        recordInteraction(INTERACT_FIELD, ts);
        break;

    default:
        return;
    }

    if (_config.analysis.logEvents) {
        char logBuf[96];
        snprintf(logBuf, sizeof(logBuf), "%s @ %u", eventKindToString(event.kind), ts);
        logKeyValue("Event", logBuf);
    }

    _dirty = true;

    if (_anomalies.getFlagCount() != before) {
        notifyNewFlags(before);
        updateVerificationLevel();
    }
}

/**
 * Notifies listeners about every flag raised since flagCountBefore.
 * Only flags still retained in the bounded log can be reported.
 */
void BehaviorEngine::notifyNewFlags(uint32_t flagCountBefore) {
    uint32_t added = _anomalies.getFlagCount() - flagCountBefore;
    if (added == 0) return;

    size_t retained = _anomalies.getRetainedFlagCount();
    size_t first = (added < retained) ? retained - added : 0;

    for (size_t i = first; i < retained; i++) {
        const AnomalyFlag flag = _anomalies.getFlag(i);

        char logBuf[128];
        if (flag.data[0] != '\0') {
            snprintf(logBuf, sizeof(logBuf), "%s (%s) -%.2f", flagTypeToString(flag.type), flag.data, flag.penalty);
        } else {
            snprintf(logBuf, sizeof(logBuf), "%s -%.2f", flagTypeToString(flag.type), flag.penalty);
        }
        logKeyValue("Flag", logBuf);

        dispatch("onAnomalyFlag", [&flag](ITrackerListener& l) { l.onAnomalyFlag(flag); });
    }
}

// =================================================================================
// SECTION: PERIODIC RE-EVALUATION
// =================================================================================

/**
 * Called once per analysis interval while tracking.
 */
void BehaviorEngine::tick() {
    if (!_tracking) return;

    // 1. DevTools heuristic (window size gap, rising edge only)
    if (_config.security.checkDevTools) {
        ViewportMetrics vm;
        memset(&vm, 0, sizeof(vm));
        if (_hal.getViewport(vm)) {
            uint32_t before = _anomalies.getFlagCount();
            _anomalies.checkDevTools(vm, (uint32_t)_hal.getMillis());
            notifyNewFlags(before);
        }
    }

    // 2. Scores, classification, confidence, level
    evaluate();
}

void BehaviorEngine::recomputeScores() {
    AnalysisConfig analysis = _config.analysis;

    _scores.pointer = _rules.scorePointer(_pointer.features(), analysis);
    _scores.touch = _rules.scoreTouch(_touch.features());
    _scores.click = _rules.scoreClick(_click.features());
    _scores.keyboard = _rules.scoreKeyboard(_keyboard.features());
    _scores.timing = _rules.scoreTiming(_timing.features());
    _scores.overall = VerificationRules::fuse(_scores, _config.weights);
}

void BehaviorEngine::evaluate() {
    if (_dirty || !_scored) {
        recomputeScores();
        _dirty = false;
        _scored = true;

        const ChannelScores scores = _scores;
        dispatch("onScoreUpdate", [&scores](ITrackerListener& l) { l.onScoreUpdate(scores.overall, scores); });
    }

    Classification next = VerificationRules::classify(_scores.overall, _config.thresholds);

    // Confidence follows the fused score, minus every penalty applied so far
    float bonus = (next == CLASS_HUMAN) ? HUMAN_CONFIDENCE_BONUS : 0.0f;
    _anomalies.rebase(_scores.overall + bonus);

    if (next != _classification) {
        changeClassification(next);
    }

    updateVerificationLevel();
}

/**
 * Classification transition. Notifications are edge-triggered: they fire
 * here and nowhere else.
 */
void BehaviorEngine::changeClassification(Classification next) {
    _classification = next;

    char logBuf[64];
    snprintf(logBuf, sizeof(logBuf), ">>> CLASSIFICATION: %s (%.2f)", classificationToString(next), _scores.overall);
    logKeyValue("Engine", logBuf);

    if (next == CLASS_BOT) {
        uint32_t before = _anomalies.getFlagCount();
        char data[FLAG_DATA_LENGTH + 1];
        snprintf(data, sizeof(data), "score=%.2f", _scores.overall);
        _anomalies.raise(FLAG_BOT_BEHAVIOR, data, (uint32_t)_hal.getMillis());

        const AnalysisSnapshot snap = analysisSnapshot();
        dispatch("onBotDetected", [&snap](ITrackerListener& l) { l.onBotDetected(snap); });
        notifyNewFlags(before);
    } else if (next == CLASS_HUMAN) {
        const AnalysisSnapshot snap = analysisSnapshot();
        dispatch("onHumanDetected", [&snap](ITrackerListener& l) { l.onHumanDetected(snap); });
    }
}

void BehaviorEngine::updateVerificationLevel() {
    float confidence = _anomalies.getConfidence();
    uint32_t flags = _anomalies.getFlagCount();
    uint32_t elapsed = getSessionDuration();

    _verificationScore = VerificationRules::compositeScore(
        confidence, _scores.overall,
        getInteractedChannels(), _config.gate.requiredChannels,
        elapsed, _config.gate.minFillTimeMs, flags);

    VerificationLevel candidate = VerificationRules::evaluateLevel(
        confidence, flags, elapsed, _config.gate.minTrackingTimeMs);
    VerificationLevel next = VerificationRules::advance(_level, candidate);

    if (next != _level) {
        _level = next;
        char logBuf[64];
        snprintf(logBuf, sizeof(logBuf), ">>> LEVEL: %s", levelToString(_level));
        logKeyValue("Engine", logBuf);
    }
}

// =================================================================================
// SECTION: QUERIES
// =================================================================================

AnalysisSnapshot BehaviorEngine::analysisSnapshot() const {
    AnalysisSnapshot s;
    memset(&s, 0, sizeof(s));

    s.scores = _scores;
    s.pointer = _pointer.features();
    s.touch = _touch.features();
    s.click = _click.features();
    s.keyboard = _keyboard.features();
    s.timing = _timing.features();
    s.classification = _classification;
    s.level = _level;
    s.confidence = _anomalies.getConfidence();
    s.flagCount = _anomalies.getFlagCount();
    s.sessionDuration = getSessionDuration();
    s.tracking = _tracking;
    return s;
}

VerificationStatus BehaviorEngine::getVerificationStatus() const {
    VerificationStatus st;
    st.level = _level;
    st.score = _verificationScore;
    st.confidence = _anomalies.getConfidence();
    st.isVerified = (_level == LEVEL_VERIFIED);
    st.flagCount = _anomalies.getFlagCount();
    st.sessionTime = getSessionDuration();
    return st;
}

VerificationStatus BehaviorEngine::refreshVerification() {
    updateVerificationLevel();
    return getVerificationStatus();
}

// =================================================================================
// SECTION: LISTENERS
// =================================================================================

bool BehaviorEngine::addListener(ITrackerListener* listener) {
    if (!listener) return false;
    for (size_t i = 0; i < _listenerCount; i++) {
        if (_listeners[i] == listener) return true;
    }
    if (_listenerCount >= MAX_LISTENERS) {
        logKeyValue("Listener", "Registration rejected: listener table full.");
        return false;
    }
    _listeners[_listenerCount++] = listener;
    return true;
}

void BehaviorEngine::removeListener(ITrackerListener* listener) {
    for (size_t i = 0; i < _listenerCount; i++) {
        if (_listeners[i] == listener) {
            for (size_t j = i + 1; j < _listenerCount; j++) {
                _listeners[j - 1] = _listeners[j];
            }
            _listeners[--_listenerCount] = nullptr;
            return;
        }
    }
}

// =================================================================================
// SECTION: SUBMISSION GATE
// =================================================================================

void BehaviorEngine::addRecommendation(VerificationDecision& d, const char* text) {
    if (!text || d.recommendationCount >= MAX_RECOMMENDATIONS) return;
    snprintf(d.recommendations[d.recommendationCount], sizeof(d.recommendations[0]), "%s", text);
    d.recommendationCount++;
}

VerificationDecision BehaviorEngine::makeDecision(bool allow, const char* reason, const char* recommendation) {
    VerificationDecision d;
    memset(&d, 0, sizeof(d));
    d.allow = allow;
    snprintf(d.reason, sizeof(d.reason), "%s", reason);
    d.confidence = _anomalies.getConfidence();
    d.score = _verificationScore;
    addRecommendation(d, recommendation);
    return d;
}

/**
 * Ordered, short-circuiting admission checks. The first failing check
 * decides the outcome.
 */
VerificationDecision BehaviorEngine::decide() {
    if (_tracking) {
        evaluate();
    } else {
        updateVerificationLevel();
    }

    const GateConfig& gate = _config.gate;
    uint32_t elapsed = getSessionDuration();
    uint32_t fillStart = _timing.hasFirstInteraction() ? _timing.getFirstInteraction() : _startTime;
    uint32_t timeToSubmit = StatUtils::elapsed(fillStart, sessionEnd());

    VerificationDecision d;

    // 1. Honeypot
    if (gate.honeypotEnabled && _anomalies.getHoneypotLength() > 0) {
        d = makeDecision(false, "honeypot filled", "block - likely automated");
    }
    // 2. Tracking time
    else if (elapsed < gate.minTrackingTimeMs) {
        d = makeDecision(false, "insufficient tracking time", "require longer interaction time");
    }
    // 3. Fill time
    else if (timeToSubmit < gate.minFillTimeMs) {
        d = makeDecision(false, "form filled too quickly", "show CAPTCHA fallback");
    }
    // 4. Pointer evidence
    else if (gate.requireMouseMovement && _pointer.getMovementCount() < gate.minMouseMovements) {
        d = makeDecision(false, "insufficient mouse movement", "request mouse interaction");
    }
    // 5. Classifier
    else if (_classification == CLASS_BOT) {
        d = makeDecision(false, "bot behavior detected", "block - behavioral analysis failed");
    }
    // 6. Verification level
    else if (_level == LEVEL_VERIFIED) {
        d = makeDecision(true, "human verified", nullptr);
    } else if (_level == LEVEL_ENHANCED) {
        if (_verificationScore >= 70.0f) {
            d = makeDecision(true, "enhanced verification passed", nullptr);
        } else {
            d = makeDecision(false, "enhanced verification insufficient", "show CAPTCHA");
        }
    } else {
        d = makeDecision(false, "verification level insufficient", "show CAPTCHA");
    }

    char logBuf[128];
    snprintf(logBuf, sizeof(logBuf), "%s: %s (score %.0f, confidence %.2f)",
             d.allow ? "ALLOW" : "BLOCK", d.reason, d.score, d.confidence);
    logKeyValue("Gate", logBuf);

    const VerificationDecision result = d;
    dispatch("onDecision", [&result](ITrackerListener& l) { l.onDecision(result); });
    return d;
}

VerificationToken BehaviorEngine::makeToken(const VerificationDecision& decision) {
    VerificationToken token;
    token.timestamp = _hal.getEpochMillis();
    token.score = decision.score;
    token.confidence = decision.confidence;
    token.sessionDurationMs = getSessionDuration();
    return token;
}
