#include "GateCodec.h"
#include <stdio.h>
#include <string.h>
#include "BehaviorEngine.h"

// =================================================================================
// SECTION: FIELD READERS
// =================================================================================
// Each reader leaves the target untouched when the key is absent and fails
// with a message when the key is present but has the wrong type.

static bool readFloat(JsonVariantConst obj, const char* key, float& out, std::string& errorMsg) {
    JsonVariantConst v = obj[key];
    if (v.isNull()) return true;
    if (!v.is<float>()) {
        errorMsg = std::string(key) + " must be a number.";
        return false;
    }
    out = v.as<float>();
    return true;
}

static bool readUint(JsonVariantConst obj, const char* key, uint32_t& out, std::string& errorMsg) {
    JsonVariantConst v = obj[key];
    if (v.isNull()) return true;
    if (!v.is<uint32_t>()) {
        errorMsg = std::string(key) + " must be a non-negative integer.";
        return false;
    }
    out = v.as<uint32_t>();
    return true;
}

static bool readBool(JsonVariantConst obj, const char* key, bool& out, std::string& errorMsg) {
    JsonVariantConst v = obj[key];
    if (v.isNull()) return true;
    if (!v.is<bool>()) {
        errorMsg = std::string(key) + " must be true or false.";
        return false;
    }
    out = v.as<bool>();
    return true;
}

// =================================================================================
// SECTION: CONFIGURATION
// =================================================================================

bool GateCodec::parseEngineConfig(JsonVariantConst json, EngineConfig& outConfig, std::string& errorMsg) {
    if (!json.is<JsonObjectConst>()) {
        errorMsg = "Configuration must be a JSON object.";
        return false;
    }

    // Work on a copy so a rejected document leaves outConfig untouched
    EngineConfig cfg = outConfig;

    // 1. Weights
    JsonVariantConst w = json["weights"];
    if (!w.isNull()) {
        if (!readFloat(w, "pointer", cfg.weights.pointer, errorMsg)) return false;
        if (!readFloat(w, "touch", cfg.weights.touch, errorMsg)) return false;
        if (!readFloat(w, "click", cfg.weights.click, errorMsg)) return false;
        if (!readFloat(w, "keyboard", cfg.weights.keyboard, errorMsg)) return false;
        if (!readFloat(w, "timing", cfg.weights.timing, errorMsg)) return false;
    }

    // 2. Thresholds
    JsonVariantConst t = json["thresholds"];
    if (!t.isNull()) {
        if (!readFloat(t, "bot", cfg.thresholds.botThreshold, errorMsg)) return false;
        if (!readFloat(t, "human", cfg.thresholds.humanThreshold, errorMsg)) return false;
    }

    // 3. Analysis
    JsonVariantConst a = json["analysis"];
    if (!a.isNull()) {
        if (!readUint(a, "intervalMs", cfg.analysis.analysisIntervalMs, errorMsg)) return false;
        if (!readUint(a, "minPointerSamples", cfg.analysis.minPointerSamples, errorMsg)) return false;
        if (!readFloat(a, "suspiciousLinearity", cfg.analysis.suspiciousLinearity, errorMsg)) return false;
        if (!readBool(a, "logEvents", cfg.analysis.logEvents, errorMsg)) return false;
    }

    // 4. Submission gate
    JsonVariantConst g = json["gate"];
    if (!g.isNull()) {
        if (!readUint(g, "minTrackingTimeMs", cfg.gate.minTrackingTimeMs, errorMsg)) return false;
        if (!readUint(g, "minFillTimeMs", cfg.gate.minFillTimeMs, errorMsg)) return false;
        if (!readUint(g, "minMouseMovements", cfg.gate.minMouseMovements, errorMsg)) return false;
        if (!readUint(g, "requiredChannels", cfg.gate.requiredChannels, errorMsg)) return false;
        if (!readBool(g, "requireMouseMovement", cfg.gate.requireMouseMovement, errorMsg)) return false;
        if (!readBool(g, "honeypotEnabled", cfg.gate.honeypotEnabled, errorMsg)) return false;

        JsonVariantConst field = g["honeypotField"];
        if (!field.isNull()) {
            if (!field.is<const char*>()) {
                errorMsg = "honeypotField must be a string.";
                return false;
            }
            const char* name = field.as<const char*>();
            if (strlen(name) > FIELD_NAME_LENGTH) {
                errorMsg = "honeypotField too long (max " + std::to_string(FIELD_NAME_LENGTH) + " chars).";
                return false;
            }
            snprintf(cfg.gate.honeypotField, sizeof(cfg.gate.honeypotField), "%s", name);
        }
    }

    // 5. Environment checks
    JsonVariantConst s = json["security"];
    if (!s.isNull()) {
        if (!readBool(s, "checkDevTools", cfg.security.checkDevTools, errorMsg)) return false;
        if (!readBool(s, "checkAutomationFlags", cfg.security.checkAutomationFlags, errorMsg)) return false;
        if (!readBool(s, "validateUserAgent", cfg.security.validateUserAgent, errorMsg)) return false;
        if (!readBool(s, "checkViewportRatio", cfg.security.checkViewportRatio, errorMsg)) return false;
    }

    // 6. Semantic validation
    char err[CONFIG_ERROR_LENGTH + 1];
    if (!BehaviorEngine::validateConfig(cfg, err, sizeof(err))) {
        errorMsg = err;
        return false;
    }

    outConfig = cfg;
    return true;
}

// =================================================================================
// SECTION: EVENTS
// =================================================================================

bool GateCodec::parseEvent(JsonVariantConst json, InteractionEvent& outEvent, std::string& errorMsg) {
    if (!json.is<JsonObjectConst>()) {
        errorMsg = "Event must be a JSON object.";
        return false;
    }

    // 1. Kind
    std::string kindStr = json["kind"] | "";
    if (kindStr.empty()) {
        errorMsg = "Event kind is required.";
        return false;
    }

    bool found = false;
    EventKind kind = EVT_POINTER_MOVE;
    for (int k = EVT_POINTER_MOVE; k <= EVT_FIELD_INPUT; k++) {
        if (kindStr == eventKindToString((EventKind)k)) {
            kind = (EventKind)k;
            found = true;
            break;
        }
    }
    if (!found) {
        errorMsg = "Invalid event kind: " + kindStr;
        return false;
    }

    // 2. Timestamp
    if (!json["timestamp"].is<uint32_t>()) {
        errorMsg = "Event timestamp must be a non-negative integer.";
        return false;
    }

    InteractionEvent e;
    memset(&e, 0, sizeof(e));
    e.kind = kind;
    e.timestamp = json["timestamp"].as<uint32_t>();

    // 3. Payload (tolerant: unusable fields are skipped)
    if (json["x"].is<float>() && json["y"].is<float>()) {
        e.hasPosition = true;
        e.x = json["x"].as<float>();
        e.y = json["y"].as<float>();
    }

    if (json["contacts"].is<uint8_t>()) {
        e.contacts = json["contacts"].as<uint8_t>();
    }
    e.visible = json["visible"] | true;
    e.length = json["length"] | 0u;

    const char* field = json["field"] | "";
    snprintf(e.field, sizeof(e.field), "%s", field);

    outEvent = e;
    return true;
}

// =================================================================================
// SECTION: OUTBOUND PAYLOADS
// =================================================================================

void GateCodec::serializeToken(const VerificationToken& token, std::string& out) {
    JsonDocument doc;
    doc["timestamp"] = token.timestamp;
    doc["score"] = token.score;
    doc["confidence"] = token.confidence;
    doc["sessionDurationMs"] = token.sessionDurationMs;

    out.clear();
    serializeJson(doc, out);
}

void GateCodec::serializeVerificationData(const VerificationStatus& status, uint32_t interactionCount, std::string& out) {
    JsonDocument doc;
    doc["sessionTime"] = status.sessionTime;
    doc["interactionCount"] = interactionCount;
    doc["humanConfidence"] = status.confidence;
    doc["verificationLevel"] = levelToString(status.level);

    out.clear();
    serializeJson(doc, out);
}

void GateCodec::serializeSnapshot(const AnalysisSnapshot& snapshot, std::string& out) {
    JsonDocument doc;

    JsonObject scores = doc["scores"].to<JsonObject>();
    scores["pointer"] = snapshot.scores.pointer;
    scores["touch"] = snapshot.scores.touch;
    scores["click"] = snapshot.scores.click;
    scores["keyboard"] = snapshot.scores.keyboard;
    scores["timing"] = snapshot.scores.timing;
    scores["overall"] = snapshot.scores.overall;

    JsonObject pointer = doc["pointer"].to<JsonObject>();
    pointer["movementCount"] = snapshot.pointer.movementCount;
    pointer["totalMovement"] = snapshot.pointer.totalMovement;
    pointer["avgVelocity"] = snapshot.pointer.avgVelocity;
    pointer["maxVelocity"] = snapshot.pointer.maxVelocity;
    pointer["linearity"] = snapshot.pointer.linearity;

    JsonObject touch = doc["touch"].to<JsonObject>();
    touch["touchCount"] = snapshot.touch.touchCount;
    touch["multiTouch"] = snapshot.touch.multiTouch;
    touch["swipeCount"] = snapshot.touch.swipeCount;
    touch["totalSwipeDistance"] = snapshot.touch.totalSwipeDistance;

    JsonObject click = doc["click"].to<JsonObject>();
    click["clickCount"] = snapshot.click.clickCount;
    click["avgInterval"] = snapshot.click.avgInterval;

    JsonObject keyboard = doc["keyboard"].to<JsonObject>();
    keyboard["keyPressCount"] = snapshot.keyboard.keyPressCount;
    keyboard["avgInterval"] = snapshot.keyboard.avgInterval;

    JsonObject timing = doc["timing"].to<JsonObject>();
    timing["sessionDuration"] = snapshot.sessionDuration;
    if (snapshot.timing.hasFirstInteraction) {
        timing["firstInteractionDelay"] = snapshot.timing.firstInteractionDelay;
    } else {
        timing["firstInteractionDelay"] = nullptr;
    }

    doc["classification"] = classificationToString(snapshot.classification);
    doc["level"] = levelToString(snapshot.level);
    doc["confidence"] = snapshot.confidence;
    doc["flagCount"] = snapshot.flagCount;
    doc["sessionDuration"] = snapshot.sessionDuration;
    doc["tracking"] = snapshot.tracking;

    out.clear();
    serializeJson(doc, out);
}

void GateCodec::serializeDecision(const VerificationDecision& decision, std::string& out) {
    JsonDocument doc;
    doc["allow"] = decision.allow;
    doc["reason"] = decision.reason;
    doc["confidence"] = decision.confidence;
    doc["score"] = decision.score;

    JsonArray recs = doc["recommendations"].to<JsonArray>();
    for (uint8_t i = 0; i < decision.recommendationCount && i < MAX_RECOMMENDATIONS; i++) {
        recs.add(decision.recommendations[i]);
    }

    out.clear();
    serializeJson(doc, out);
}
