/*
 * =================================================================================
 * Project:   BehaviorGate - Behavioral Human Verification Engine
 * File:      lib/BehaviorEngine/AnomalyDetector.cpp
 *
 * Description:
 * Setup-time environment checks (automation markers, user agent, languages,
 * viewport ratio, devtools) and event-time checks (honeypot, paste, fast and
 * uniform typing, fast clicking, burst after visibility regained).
 * =================================================================================
 */
#include <stdio.h>
#include <string.h>

#include "AnomalyDetector.h"
#include "StatUtils.h"

// =================================================================================
// SECTION: CONSTRUCTOR & RESET
// =================================================================================

AnomalyDetector::AnomalyDetector(const IScoringRules& rules) : _rules(rules) {
    reset();
}

void AnomalyDetector::reset() {
    _flags.clear();
    _flagCount = 0;
    _confidence = INITIAL_CONFIDENCE;
    _penaltyTotal = 0.0f;

    memset(_fields, 0, sizeof(_fields));
    _fieldCount = 0;

    _devToolsOpen = false;
    _hasLastKeyDown = false;
    _lastKeyDown = 0;
    _hasLastClick = false;
    _lastClick = 0;

    _burstWindowOpen = false;
    _burstWindowStart = 0;
    _burstCount = 0;
    _burstFlagged = false;

    _honeypotLength = 0;
}

// =================================================================================
// SECTION: CORE
// =================================================================================

const AnomalyFlag& AnomalyDetector::raise(FlagType type, const char* data, uint32_t timestamp) {
    AnomalyFlag flag;
    memset(&flag, 0, sizeof(flag));
    flag.type = type;
    flag.timestamp = timestamp;
    flag.penalty = _rules.penaltyFor(type);
    if (data) {
        snprintf(flag.data, sizeof(flag.data), "%s", data);
    }

    _flags.push(flag);
    _flagCount++;

    _penaltyTotal += flag.penalty;
    _confidence = StatUtils::clamp01(_confidence - flag.penalty);

    return _flags.newest();
}

void AnomalyDetector::rebase(float base) {
    _confidence = StatUtils::clamp01(base - _penaltyTotal);
}

// =================================================================================
// SECTION: SETUP-TIME CHECKS
// =================================================================================

int AnomalyDetector::runSetupChecks(ITrackerHAL& hal, const SecurityChecks& security, uint32_t now) {
    int raised = 0;
    char buf[FLAG_DATA_LENGTH + 1];

    // 1. Automation markers
    if (security.checkAutomationFlags) {
        if (hal.isWebDriverFlagSet()) {
            raise(FLAG_WEBDRIVER, nullptr, now);
            raised++;
        }
        if (hal.hasPhantomMarkers()) {
            raise(FLAG_PHANTOM, nullptr, now);
            raised++;
        }
    }

    // 2. User agent & languages
    if (security.validateUserAgent) {
        char ua[USER_AGENT_LENGTH + 1];
        hal.getUserAgent(ua, sizeof(ua));

        if (ua[0] == '\0' || strcmp(ua, "undefined") == 0 ||
            strstr(ua, "HeadlessChrome") != nullptr || strstr(ua, "PhantomJS") != nullptr) {
            snprintf(buf, sizeof(buf), "ua=%s", ua);
            raise(FLAG_SUSPICIOUS_USER_AGENT, buf, now);
            raised++;
        }

        if (hal.getLanguageCount() <= 0) {
            raise(FLAG_MISSING_LANGUAGES, nullptr, now);
            raised++;
        }
    }

    ViewportMetrics vm;
    memset(&vm, 0, sizeof(vm));
    bool hasViewport = hal.getViewport(vm);

    // 3. Viewport ratio
    if (security.checkViewportRatio && hasViewport && vm.innerHeight > 0) {
        float ratio = (float)vm.innerWidth / (float)vm.innerHeight;
        if (ratio < VIEWPORT_RATIO_MIN || ratio > VIEWPORT_RATIO_MAX) {
            snprintf(buf, sizeof(buf), "ratio=%.2f", ratio);
            raise(FLAG_UNUSUAL_VIEWPORT, buf, now);
            raised++;
        }
    }

    // 4. Devtools (initial sample, re-checked on tick)
    if (security.checkDevTools && hasViewport) {
        raised += checkDevTools(vm, now);
    }

    return raised;
}

int AnomalyDetector::checkDevTools(const ViewportMetrics& vm, uint32_t now) {
    bool widthGap = vm.outerWidth > vm.innerWidth &&
                    (vm.outerWidth - vm.innerWidth) > DEVTOOLS_THRESHOLD_PX;
    bool heightGap = vm.outerHeight > vm.innerHeight &&
                     (vm.outerHeight - vm.innerHeight) > DEVTOOLS_THRESHOLD_PX;

    if (widthGap || heightGap) {
        if (!_devToolsOpen) {
            _devToolsOpen = true;
            char buf[FLAG_DATA_LENGTH + 1];
            snprintf(buf, sizeof(buf), "gap=%ux%u",
                     vm.outerWidth > vm.innerWidth ? vm.outerWidth - vm.innerWidth : 0,
                     vm.outerHeight > vm.innerHeight ? vm.outerHeight - vm.innerHeight : 0);
            raise(FLAG_DEVTOOLS, buf, now);
            return 1;
        }
    } else {
        _devToolsOpen = false;
    }
    return 0;
}

// =================================================================================
// SECTION: FIELD TABLE
// =================================================================================

const FieldActivity* AnomalyDetector::findField(const char* name) const {
    if (!name || name[0] == '\0') return nullptr;
    for (size_t i = 0; i < _fieldCount; i++) {
        if (strncmp(_fields[i].name, name, FIELD_NAME_LENGTH) == 0) return &_fields[i];
    }
    return nullptr;
}

FieldActivity* AnomalyDetector::lookupField(const char* name) {
    return const_cast<FieldActivity*>(findField(name));
}

// =================================================================================
// SECTION: EVENT-TIME CHECKS
// =================================================================================

/**
 * Counts field activity inside the window opened when the page became
 * visible again. Flags once per window.
 */
int AnomalyDetector::countBurstActivity(uint32_t timestamp) {
    if (!_burstWindowOpen) return 0;

    if (StatUtils::elapsed(_burstWindowStart, timestamp) > BURST_WINDOW_MS) {
        _burstWindowOpen = false;
        return 0;
    }

    _burstCount++;
    if (_burstCount > BURST_MAX_INTERACTIONS && !_burstFlagged) {
        _burstFlagged = true;
        char buf[FLAG_DATA_LENGTH + 1];
        snprintf(buf, sizeof(buf), "interactions=%u window=%ums", _burstCount, (unsigned)BURST_WINDOW_MS);
        raise(FLAG_RAPID_ACTIVITY, buf, timestamp);
        return 1;
    }
    return 0;
}

int AnomalyDetector::onFieldFocus(const char* field, uint32_t timestamp) {
    if (!field || field[0] == '\0') return 0;

    FieldActivity* fa = lookupField(field);
    if (!fa) {
        if (_fieldCount >= MAX_TRACKED_FIELDS) {
            return countBurstActivity(timestamp);
        }
        fa = &_fields[_fieldCount++];
        snprintf(fa->name, sizeof(fa->name), "%s", field);
        fa->firstFocus = timestamp;
    }

    fa->focusCount++;
    fa->lastActivity = timestamp;
    fa->focused = true;

    return countBurstActivity(timestamp);
}

int AnomalyDetector::onFieldBlur(const char* field, uint32_t timestamp) {
    FieldActivity* fa = lookupField(field);
    if (fa) {
        fa->focused = false;
        fa->lastActivity = timestamp;
    }
    return 0;
}

int AnomalyDetector::onFieldInput(const char* field, uint32_t length, uint32_t timestamp, const GateConfig& gate) {
    if (!field || field[0] == '\0') return 0;

    int raised = 0;
    char buf[FLAG_DATA_LENGTH + 1];

    // 1. Honeypot (does not need a prior focus; bots often skip it)
    if (gate.honeypotEnabled && strncmp(field, gate.honeypotField, FIELD_NAME_LENGTH) == 0) {
        bool wasEmpty = (_honeypotLength == 0);
        _honeypotLength = length;
        if (length > 0 && wasEmpty) {
            snprintf(buf, sizeof(buf), "field=%s length=%u", field, length);
            raise(FLAG_HONEYPOT_FILLED, buf, timestamp);
            raised++;
        }
    }

    // 2. Focus-to-input latency on the first input of a focused field
    FieldActivity* fa = lookupField(field);
    if (fa) {
        fa->inputCount++;
        fa->lastActivity = timestamp;

        if (fa->inputCount == 1) {
            uint32_t sinceFocus = StatUtils::elapsed(fa->firstFocus, timestamp);
            if (sinceFocus < FAST_TYPING_MS) {
                snprintf(buf, sizeof(buf), "field=%s sinceFocus=%ums", field, sinceFocus);
                raise(FLAG_FAST_TYPING, buf, timestamp);
                raised++;
            }
        }
    }

    raised += countBurstActivity(timestamp);
    return raised;
}

int AnomalyDetector::onKeyDown(uint32_t timestamp) {
    int raised = 0;
    if (_hasLastKeyDown) {
        uint32_t interval = StatUtils::elapsed(_lastKeyDown, timestamp);
        if (interval > 0 && interval < UNIFORM_TYPING_MS) {
            char buf[FLAG_DATA_LENGTH + 1];
            snprintf(buf, sizeof(buf), "interval=%ums", interval);
            raise(FLAG_UNIFORM_TYPING, buf, timestamp);
            raised++;
        }
    }
    _hasLastKeyDown = true;
    _lastKeyDown = timestamp;
    return raised;
}

int AnomalyDetector::onClick(uint32_t timestamp) {
    int raised = 0;
    if (_hasLastClick) {
        uint32_t interval = StatUtils::elapsed(_lastClick, timestamp);
        if (interval < FAST_CLICK_MS) {
            char buf[FLAG_DATA_LENGTH + 1];
            snprintf(buf, sizeof(buf), "interval=%ums", interval);
            raise(FLAG_FAST_CLICKING, buf, timestamp);
            raised++;
        }
    }
    _hasLastClick = true;
    _lastClick = timestamp;
    return raised;
}

int AnomalyDetector::onPaste(const char* field, uint32_t length, uint32_t timestamp) {
    char buf[FLAG_DATA_LENGTH + 1];
    snprintf(buf, sizeof(buf), "field=%s length=%u", (field && field[0]) ? field : "-", length);
    raise(FLAG_PASTE, buf, timestamp);
    return 1;
}

int AnomalyDetector::onVisibilityChange(bool visible, uint32_t timestamp) {
    if (visible) {
        _burstWindowOpen = true;
        _burstWindowStart = timestamp;
        _burstCount = 0;
        _burstFlagged = false;
    } else {
        _burstWindowOpen = false;
    }
    return 0;
}
