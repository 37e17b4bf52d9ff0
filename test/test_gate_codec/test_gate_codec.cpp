/*
 * File: test/test_gate_codec/test_gate_codec.cpp
 * Description: JSON boundary. Configuration overrides, streamed events,
 * and the outbound token / verification-data / snapshot / decision payloads.
 */
#include <unity.h>
#include <ArduinoJson.h>
#include <string.h>
#include <string>
#include "Defaults.h"
#include "GateCodec.h"

void setUp(void) {}
void tearDown(void) {}

static JsonDocument parse(const char* json) {
    JsonDocument doc;
    DeserializationError error = deserializeJson(doc, json);
    TEST_ASSERT_FALSE_MESSAGE(error, "test fixture is not valid JSON");
    return doc;
}

// ============================================================================
// TEST GROUP: CONFIGURATION
// ============================================================================

void test_empty_object_keeps_defaults(void) {
    JsonDocument doc = parse("{}");
    EngineConfig cfg = DEFAULT_ENGINE_CONFIG;
    std::string err;

    TEST_ASSERT_TRUE(GateCodec::parseEngineConfig(doc.as<JsonVariantConst>(), cfg, err));
    TEST_ASSERT_EQUAL_UINT32(10000, cfg.gate.minTrackingTimeMs);
    TEST_ASSERT_EQUAL_FLOAT(0.25f, cfg.weights.pointer);
}

void test_partial_overrides_are_applied(void) {
    JsonDocument doc = parse(
        "{\"weights\":{\"pointer\":0.3,\"timing\":0.1},"
        "\"gate\":{\"minTrackingTimeMs\":5000,\"honeypotField\":\"website\",\"requireMouseMovement\":false},"
        "\"security\":{\"checkDevTools\":false}}");
    EngineConfig cfg = DEFAULT_ENGINE_CONFIG;
    std::string err;

    TEST_ASSERT_TRUE(GateCodec::parseEngineConfig(doc.as<JsonVariantConst>(), cfg, err));
    TEST_ASSERT_EQUAL_FLOAT(0.3f, cfg.weights.pointer);
    TEST_ASSERT_EQUAL_FLOAT(0.1f, cfg.weights.timing);
    TEST_ASSERT_EQUAL_UINT32(5000, cfg.gate.minTrackingTimeMs);
    TEST_ASSERT_EQUAL_STRING("website", cfg.gate.honeypotField);
    TEST_ASSERT_FALSE(cfg.gate.requireMouseMovement);
    TEST_ASSERT_FALSE(cfg.security.checkDevTools);
    TEST_ASSERT_TRUE(cfg.security.checkAutomationFlags);
}

void test_type_errors_are_reported(void) {
    EngineConfig cfg = DEFAULT_ENGINE_CONFIG;
    std::string err;

    JsonDocument a = parse("{\"analysis\":{\"intervalMs\":-5}}");
    TEST_ASSERT_FALSE(GateCodec::parseEngineConfig(a.as<JsonVariantConst>(), cfg, err));
    TEST_ASSERT_EQUAL_STRING("intervalMs must be a non-negative integer.", err.c_str());

    JsonDocument b = parse("{\"thresholds\":{\"bot\":\"low\"}}");
    TEST_ASSERT_FALSE(GateCodec::parseEngineConfig(b.as<JsonVariantConst>(), cfg, err));
    TEST_ASSERT_EQUAL_STRING("bot must be a number.", err.c_str());

    JsonDocument c = parse("{\"gate\":{\"honeypotEnabled\":\"yes\"}}");
    TEST_ASSERT_FALSE(GateCodec::parseEngineConfig(c.as<JsonVariantConst>(), cfg, err));
    TEST_ASSERT_EQUAL_STRING("honeypotEnabled must be true or false.", err.c_str());
}

void test_semantic_errors_are_reported(void) {
    JsonDocument doc = parse("{\"thresholds\":{\"bot\":0.8,\"human\":0.7}}");
    EngineConfig cfg = DEFAULT_ENGINE_CONFIG;
    std::string err;

    TEST_ASSERT_FALSE(GateCodec::parseEngineConfig(doc.as<JsonVariantConst>(), cfg, err));
    TEST_ASSERT_EQUAL_STRING("botThreshold must be below humanThreshold.", err.c_str());
}

void test_rejected_document_leaves_config_untouched(void) {
    JsonDocument doc = parse("{\"gate\":{\"minTrackingTimeMs\":1},\"weights\":{\"pointer\":0.9}}");
    EngineConfig cfg = DEFAULT_ENGINE_CONFIG;
    std::string err;

    TEST_ASSERT_FALSE(GateCodec::parseEngineConfig(doc.as<JsonVariantConst>(), cfg, err));
    TEST_ASSERT_EQUAL_UINT32(10000, cfg.gate.minTrackingTimeMs);
    TEST_ASSERT_EQUAL_FLOAT(0.25f, cfg.weights.pointer);
}

void test_non_object_config_is_rejected(void) {
    JsonDocument doc = parse("[1,2,3]");
    EngineConfig cfg = DEFAULT_ENGINE_CONFIG;
    std::string err;

    TEST_ASSERT_FALSE(GateCodec::parseEngineConfig(doc.as<JsonVariantConst>(), cfg, err));
    TEST_ASSERT_EQUAL_STRING("Configuration must be a JSON object.", err.c_str());
}

void test_overlong_honeypot_name_is_rejected(void) {
    JsonDocument doc = parse("{\"gate\":{\"honeypotField\":\"a_field_name_that_is_far_too_long_to_store\"}}");
    EngineConfig cfg = DEFAULT_ENGINE_CONFIG;
    std::string err;

    TEST_ASSERT_FALSE(GateCodec::parseEngineConfig(doc.as<JsonVariantConst>(), cfg, err));
    TEST_ASSERT_EQUAL_STRING("email_confirm", cfg.gate.honeypotField);
}

// ============================================================================
// TEST GROUP: EVENTS
// ============================================================================

void test_pointer_event_is_parsed(void) {
    JsonDocument doc = parse("{\"kind\":\"pointer-move\",\"timestamp\":1500,\"x\":10.5,\"y\":20}");
    InteractionEvent e;
    std::string err;

    TEST_ASSERT_TRUE(GateCodec::parseEvent(doc.as<JsonVariantConst>(), e, err));
    TEST_ASSERT_EQUAL(EVT_POINTER_MOVE, e.kind);
    TEST_ASSERT_EQUAL_UINT32(1500, e.timestamp);
    TEST_ASSERT_TRUE(e.hasPosition);
    TEST_ASSERT_EQUAL_FLOAT(10.5f, e.x);
    TEST_ASSERT_EQUAL_FLOAT(20.0f, e.y);
    TEST_ASSERT_TRUE(e.visible);
}

void test_field_event_is_parsed(void) {
    JsonDocument doc = parse("{\"kind\":\"field-input\",\"timestamp\":42,\"field\":\"email\",\"length\":7}");
    InteractionEvent e;
    std::string err;

    TEST_ASSERT_TRUE(GateCodec::parseEvent(doc.as<JsonVariantConst>(), e, err));
    TEST_ASSERT_EQUAL(EVT_FIELD_INPUT, e.kind);
    TEST_ASSERT_EQUAL_STRING("email", e.field);
    TEST_ASSERT_EQUAL_UINT32(7, e.length);
    TEST_ASSERT_FALSE(e.hasPosition);
}

void test_visibility_event_is_parsed(void) {
    JsonDocument doc = parse("{\"kind\":\"visibility-change\",\"timestamp\":9,\"visible\":false}");
    InteractionEvent e;
    std::string err;

    TEST_ASSERT_TRUE(GateCodec::parseEvent(doc.as<JsonVariantConst>(), e, err));
    TEST_ASSERT_FALSE(e.visible);
}

void test_partial_position_is_dropped(void) {
    JsonDocument doc = parse("{\"kind\":\"touch-move\",\"timestamp\":9,\"x\":4,\"contacts\":1}");
    InteractionEvent e;
    std::string err;

    TEST_ASSERT_TRUE(GateCodec::parseEvent(doc.as<JsonVariantConst>(), e, err));
    TEST_ASSERT_FALSE(e.hasPosition);
    TEST_ASSERT_EQUAL_UINT8(1, e.contacts);
}

void test_bad_events_are_rejected(void) {
    InteractionEvent e;
    std::string err;

    JsonDocument a = parse("{\"timestamp\":1}");
    TEST_ASSERT_FALSE(GateCodec::parseEvent(a.as<JsonVariantConst>(), e, err));
    TEST_ASSERT_EQUAL_STRING("Event kind is required.", err.c_str());

    JsonDocument b = parse("{\"kind\":\"warp\",\"timestamp\":1}");
    TEST_ASSERT_FALSE(GateCodec::parseEvent(b.as<JsonVariantConst>(), e, err));
    TEST_ASSERT_EQUAL_STRING("Invalid event kind: warp", err.c_str());

    JsonDocument c = parse("{\"kind\":\"click\"}");
    TEST_ASSERT_FALSE(GateCodec::parseEvent(c.as<JsonVariantConst>(), e, err));
    TEST_ASSERT_EQUAL_STRING("Event timestamp must be a non-negative integer.", err.c_str());

    JsonDocument d = parse("\"click\"");
    TEST_ASSERT_FALSE(GateCodec::parseEvent(d.as<JsonVariantConst>(), e, err));
    TEST_ASSERT_EQUAL_STRING("Event must be a JSON object.", err.c_str());
}

// ============================================================================
// TEST GROUP: OUTBOUND PAYLOADS
// ============================================================================

void test_token_payload(void) {
    VerificationToken token = { 1700000000123ULL, 87.5f, 0.9f, 12000 };
    std::string out;
    GateCodec::serializeToken(token, out);

    JsonDocument doc = parse(out.c_str());
    TEST_ASSERT_TRUE(doc["timestamp"].as<uint64_t>() == 1700000000123ULL);
    TEST_ASSERT_EQUAL_FLOAT(87.5f, doc["score"].as<float>());
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.9f, doc["confidence"].as<float>());
    TEST_ASSERT_EQUAL_UINT32(12000, doc["sessionDurationMs"].as<uint32_t>());
}

void test_verification_data_payload(void) {
    VerificationStatus st;
    memset(&st, 0, sizeof(st));
    st.level = LEVEL_ENHANCED;
    st.confidence = 0.75f;
    st.sessionTime = 15000;

    std::string out;
    GateCodec::serializeVerificationData(st, 6, out);

    JsonDocument doc = parse(out.c_str());
    TEST_ASSERT_EQUAL_UINT32(15000, doc["sessionTime"].as<uint32_t>());
    TEST_ASSERT_EQUAL_UINT32(6, doc["interactionCount"].as<uint32_t>());
    TEST_ASSERT_EQUAL_FLOAT(0.75f, doc["humanConfidence"].as<float>());
    TEST_ASSERT_EQUAL_STRING("enhanced", doc["verificationLevel"].as<const char*>());
}

void test_snapshot_payload(void) {
    AnalysisSnapshot snap;
    memset(&snap, 0, sizeof(snap));
    snap.scores.overall = 0.4f;
    snap.pointer.movementCount = 12;
    snap.touch.swipeCount = 2;
    snap.touch.totalSwipeDistance = 30.0f;
    snap.classification = CLASS_UNCERTAIN;
    snap.level = LEVEL_BASIC;
    snap.tracking = true;

    std::string out;
    GateCodec::serializeSnapshot(snap, out);

    JsonDocument doc = parse(out.c_str());
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.4f, doc["scores"]["overall"].as<float>());
    TEST_ASSERT_EQUAL_UINT32(12, doc["pointer"]["movementCount"].as<uint32_t>());
    TEST_ASSERT_EQUAL_FLOAT(30.0f, doc["touch"]["totalSwipeDistance"].as<float>());
    TEST_ASSERT_TRUE(doc["timing"]["firstInteractionDelay"].isNull());
    TEST_ASSERT_EQUAL_STRING("uncertain", doc["classification"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("basic", doc["level"].as<const char*>());
    TEST_ASSERT_TRUE(doc["tracking"].as<bool>());

    snap.timing.hasFirstInteraction = true;
    snap.timing.firstInteractionDelay = 800;
    GateCodec::serializeSnapshot(snap, out);
    JsonDocument again = parse(out.c_str());
    TEST_ASSERT_EQUAL_UINT32(800, again["timing"]["firstInteractionDelay"].as<uint32_t>());
}

void test_decision_payload(void) {
    VerificationDecision d;
    memset(&d, 0, sizeof(d));
    d.allow = false;
    strcpy(d.reason, "form filled too quickly");
    d.score = 41.0f;
    d.recommendationCount = 1;
    strcpy(d.recommendations[0], "show CAPTCHA fallback");

    std::string out;
    GateCodec::serializeDecision(d, out);

    JsonDocument doc = parse(out.c_str());
    TEST_ASSERT_FALSE(doc["allow"].as<bool>());
    TEST_ASSERT_EQUAL_STRING("form filled too quickly", doc["reason"].as<const char*>());
    TEST_ASSERT_EQUAL(1, (int)doc["recommendations"].size());
    TEST_ASSERT_EQUAL_STRING("show CAPTCHA fallback", doc["recommendations"][0].as<const char*>());
}

int main(void) {
    UNITY_BEGIN();

    // Configuration
    RUN_TEST(test_empty_object_keeps_defaults);
    RUN_TEST(test_partial_overrides_are_applied);
    RUN_TEST(test_type_errors_are_reported);
    RUN_TEST(test_semantic_errors_are_reported);
    RUN_TEST(test_rejected_document_leaves_config_untouched);
    RUN_TEST(test_non_object_config_is_rejected);
    RUN_TEST(test_overlong_honeypot_name_is_rejected);

    // Events
    RUN_TEST(test_pointer_event_is_parsed);
    RUN_TEST(test_field_event_is_parsed);
    RUN_TEST(test_visibility_event_is_parsed);
    RUN_TEST(test_partial_position_is_dropped);
    RUN_TEST(test_bad_events_are_rejected);

    // Payloads
    RUN_TEST(test_token_payload);
    RUN_TEST(test_verification_data_payload);
    RUN_TEST(test_snapshot_payload);
    RUN_TEST(test_decision_payload);

    return UNITY_END();
}
