/*
 * File: test/test_engine_lifecycle/test_engine_lifecycle.cpp
 * Description: Session lifecycle (start / stop / reset status codes and
 * event gating) and the configuration validator.
 */
#include <unity.h>
#include <string.h>
#include "BehaviorEngine.h"
#include "BehaviorScenarios.h"
#include "Defaults.h"
#include "InteractionEvents.h"
#include "MockTrackerHAL.h"
#include "StandardRules.h"

static MockTrackerHAL* hal = nullptr;
static StandardRules rules;

void setUp(void) {
    hal = new MockTrackerHAL();
}

void tearDown(void) {
    delete hal;
}

static bool validates(const EngineConfig& cfg, char* err, size_t size) {
    return BehaviorEngine::validateConfig(cfg, err, size);
}

// ============================================================================
// TEST GROUP: LIFECYCLE
// ============================================================================

void test_start_returns_200_then_409(void) {
    BehaviorEngine engine(*hal, rules, DEFAULT_ENGINE_CONFIG);
    TEST_ASSERT_FALSE(engine.isTracking());
    TEST_ASSERT_EQUAL(200, engine.start());
    TEST_ASSERT_TRUE(engine.isTracking());
    TEST_ASSERT_EQUAL(409, engine.start());
}

void test_invalid_config_refuses_start(void) {
    EngineConfig cfg = DEFAULT_ENGINE_CONFIG;
    cfg.weights.pointer = 0.5f;

    BehaviorEngine engine(*hal, rules, cfg);
    TEST_ASSERT_FALSE(engine.isConfigValid());
    TEST_ASSERT_TRUE(strlen(engine.getConfigError()) > 0);
    TEST_ASSERT_TRUE(hal->hasLogContaining("Config Error: Weights must sum to 1.0"));
    TEST_ASSERT_EQUAL(400, engine.start());
    TEST_ASSERT_FALSE(engine.isTracking());
}

void test_events_before_start_are_ignored(void) {
    BehaviorEngine engine(*hal, rules, DEFAULT_ENGINE_CONFIG);
    engine.observe(InteractionEvents::pointerMove(10, 10, 1100));
    engine.observe(InteractionEvents::paste("email", 5, 1200));

    AnalysisSnapshot s = engine.analysisSnapshot();
    TEST_ASSERT_EQUAL_UINT32(0, s.pointer.movementCount);
    TEST_ASSERT_EQUAL_UINT32(0, s.flagCount);
}

void test_events_after_stop_are_ignored(void) {
    BehaviorEngine engine(*hal, rules, DEFAULT_ENGINE_CONFIG);
    engine.start();
    engine.observe(InteractionEvents::pointerMove(10, 10, 1100));
    engine.stop();
    engine.observe(InteractionEvents::pointerMove(20, 20, 1200));

    TEST_ASSERT_EQUAL_UINT32(1, engine.analysisSnapshot().pointer.movementCount);
    TEST_ASSERT_FALSE(engine.analysisSnapshot().tracking);
}

void test_stop_freezes_session_duration(void) {
    BehaviorEngine engine(*hal, rules, DEFAULT_ENGINE_CONFIG);
    engine.start();
    hal->advanceTime(4000);
    TEST_ASSERT_EQUAL_UINT32(4000, engine.getSessionDuration());

    engine.stop();
    hal->advanceTime(10000);
    TEST_ASSERT_EQUAL_UINT32(4000, engine.getSessionDuration());
    TEST_ASSERT_TRUE(hal->hasLogContaining("Tracking stopped after 4s."));
}

void test_tick_when_stopped_does_nothing(void) {
    BehaviorEngine engine(*hal, rules, DEFAULT_ENGINE_CONFIG);
    engine.tick();
    TEST_ASSERT_EQUAL(0, hal->viewportQueries);
    TEST_ASSERT_EQUAL_FLOAT(0.5f, engine.currentScore());
}

void test_reset_stops_and_clears(void) {
    BehaviorEngine engine(*hal, rules, DEFAULT_ENGINE_CONFIG);
    engine.start();
    engine.observe(InteractionEvents::pointerMove(10, 10, 1100));
    engine.observe(InteractionEvents::click(1150));
    engine.reset();

    AnalysisSnapshot s = engine.analysisSnapshot();
    TEST_ASSERT_FALSE(engine.isTracking());
    TEST_ASSERT_EQUAL_UINT32(0, s.pointer.movementCount);
    TEST_ASSERT_EQUAL_UINT32(0, s.click.clickCount);
    TEST_ASSERT_EQUAL(CLASS_UNCERTAIN, s.classification);
    TEST_ASSERT_EQUAL(200, engine.start());
}

void test_setup_checks_run_on_start(void) {
    hal->webDriver = true;
    BehaviorEngine engine(*hal, rules, DEFAULT_ENGINE_CONFIG);
    engine.start();

    TEST_ASSERT_EQUAL_UINT32(1, engine.getAnomalies().getFlagCount());
    TEST_ASSERT_TRUE(hal->hasLogContaining("webdriver_detected"));
}

void test_touch_end_is_not_an_interaction(void) {
    BehaviorEngine engine(*hal, rules, DEFAULT_ENGINE_CONFIG);
    engine.start();
    engine.observe(InteractionEvents::touch(EVT_TOUCH_END, 0, 0, 0, 1500));

    AnalysisSnapshot s = engine.analysisSnapshot();
    TEST_ASSERT_EQUAL_UINT32(1, s.touch.touchCount);
    TEST_ASSERT_FALSE(s.timing.hasFirstInteraction);

    engine.observe(InteractionEvents::touch(EVT_TOUCH_START, 40, 40, 1, 1600));
    s = engine.analysisSnapshot();
    TEST_ASSERT_TRUE(s.timing.hasFirstInteraction);
    TEST_ASSERT_EQUAL_UINT32(600, s.timing.firstInteractionDelay);
}

void test_pointer_move_without_position_is_ignored(void) {
    BehaviorEngine engine(*hal, rules, DEFAULT_ENGINE_CONFIG);
    engine.start();
    engine.observe(InteractionEvents::make(EVT_POINTER_MOVE, 1100));

    TEST_ASSERT_EQUAL_UINT32(0, engine.analysisSnapshot().pointer.movementCount);
    TEST_ASSERT_EQUAL_UINT32(0, engine.getInteractedChannels());
}

void test_interacted_channels(void) {
    BehaviorEngine engine(*hal, rules, DEFAULT_ENGINE_CONFIG);
    engine.start();
    engine.observe(InteractionEvents::pointerMove(10, 10, 1100));
    engine.observe(InteractionEvents::click(1200));
    engine.observe(InteractionEvents::keyDown(1300));

    // pointer, click, keyboard, timing
    TEST_ASSERT_EQUAL_UINT32(4, engine.getInteractedChannels());
}

void test_event_logging_follows_config(void) {
    EngineConfig cfg = DEFAULT_ENGINE_CONFIG;
    cfg.analysis.logEvents = true;
    BehaviorEngine engine(*hal, rules, cfg);
    engine.start();
    engine.observe(InteractionEvents::click(1234));

    TEST_ASSERT_TRUE(hal->hasLogContaining("click @ 1234"));
}

void test_startup_diagnostics_cover_sections(void) {
    BehaviorEngine engine(*hal, rules, DEFAULT_ENGINE_CONFIG);
    engine.printStartupDiagnostics();

    TEST_ASSERT_TRUE(hal->hasLogContaining("[ ENGINE STATE ]"));
    TEST_ASSERT_TRUE(hal->hasLogContaining("[ CONFIGURATION STATUS ]"));
    TEST_ASSERT_TRUE(hal->hasLogContaining("[ CLASSIFIER ]"));
    TEST_ASSERT_TRUE(hal->hasLogContaining("[ SUBMISSION GATE ]"));
}

// ============================================================================
// TEST GROUP: SESSION ISOLATION
// ============================================================================

void test_sessions_on_one_hal_do_not_share_state(void) {
    BehaviorEngine fed(*hal, rules, DEFAULT_ENGINE_CONFIG);
    BehaviorEngine idle(*hal, rules, DEFAULT_ENGINE_CONFIG);
    uint32_t t0 = hal->currentMillis;
    TEST_ASSERT_EQUAL(200, fed.start());
    TEST_ASSERT_EQUAL(200, idle.start());

    feedHumanSession(fed, t0);
    fed.observe(InteractionEvents::paste("email", 18, t0 + 9000));
    hal->currentMillis = t0 + 12000;
    fed.tick();

    AnalysisSnapshot a = fed.analysisSnapshot();
    TEST_ASSERT_TRUE(a.pointer.movementCount > 0);
    TEST_ASSERT_TRUE(a.keyboard.keyPressCount > 0);
    TEST_ASSERT_EQUAL_UINT32(1, a.flagCount);
    TEST_ASSERT_EQUAL(CLASS_HUMAN, a.classification);

    AnalysisSnapshot b = idle.analysisSnapshot();
    TEST_ASSERT_EQUAL_UINT32(0, b.pointer.movementCount);
    TEST_ASSERT_EQUAL_UINT32(0, b.touch.touchCount);
    TEST_ASSERT_EQUAL_UINT32(0, b.click.clickCount);
    TEST_ASSERT_EQUAL_UINT32(0, b.keyboard.keyPressCount);
    TEST_ASSERT_FALSE(b.timing.hasFirstInteraction);
    TEST_ASSERT_EQUAL_UINT32(0, b.flagCount);
    TEST_ASSERT_EQUAL_FLOAT(0.5f, b.confidence);
    TEST_ASSERT_EQUAL_FLOAT(0.5f, b.scores.overall);
    TEST_ASSERT_EQUAL(CLASS_UNCERTAIN, b.classification);
    TEST_ASSERT_EQUAL(LEVEL_NONE, b.level);

    // Clearing one session leaves the other tracking
    fed.reset();
    TEST_ASSERT_TRUE(idle.isTracking());
    TEST_ASSERT_EQUAL_UINT32(12000, idle.getSessionDuration());
}

// ============================================================================
// TEST GROUP: CONFIGURATION VALIDATION
// ============================================================================

void test_default_config_is_valid(void) {
    char err[CONFIG_ERROR_LENGTH + 1];
    TEST_ASSERT_TRUE(validates(DEFAULT_ENGINE_CONFIG, err, sizeof(err)));
    TEST_ASSERT_EQUAL_STRING("", err);
}

void test_weights_must_sum_to_one(void) {
    char err[CONFIG_ERROR_LENGTH + 1];
    EngineConfig cfg = DEFAULT_ENGINE_CONFIG;
    cfg.weights.timing = 0.10f;
    TEST_ASSERT_FALSE(validates(cfg, err, sizeof(err)));

    // Within tolerance
    cfg.weights.timing = 0.1505f;
    TEST_ASSERT_TRUE(validates(cfg, err, sizeof(err)));
}

void test_negative_weight_is_rejected(void) {
    char err[CONFIG_ERROR_LENGTH + 1];
    EngineConfig cfg = DEFAULT_ENGINE_CONFIG;
    cfg.weights.touch = -0.20f;
    cfg.weights.pointer = 0.65f;
    TEST_ASSERT_FALSE(validates(cfg, err, sizeof(err)));
    TEST_ASSERT_NOT_NULL(strstr(err, "touch"));
}

void test_thresholds_must_be_ordered_and_bounded(void) {
    char err[CONFIG_ERROR_LENGTH + 1];
    EngineConfig cfg = DEFAULT_ENGINE_CONFIG;

    cfg.thresholds.botThreshold = 0.7f;
    cfg.thresholds.humanThreshold = 0.7f;
    TEST_ASSERT_FALSE(validates(cfg, err, sizeof(err)));

    cfg.thresholds.botThreshold = 0.3f;
    cfg.thresholds.humanThreshold = 1.2f;
    TEST_ASSERT_FALSE(validates(cfg, err, sizeof(err)));

    cfg.thresholds.botThreshold = -0.1f;
    cfg.thresholds.humanThreshold = 0.7f;
    TEST_ASSERT_FALSE(validates(cfg, err, sizeof(err)));
}

void test_zero_interval_and_sample_minimum_are_rejected(void) {
    char err[CONFIG_ERROR_LENGTH + 1];
    EngineConfig cfg = DEFAULT_ENGINE_CONFIG;
    cfg.analysis.analysisIntervalMs = 0;
    TEST_ASSERT_FALSE(validates(cfg, err, sizeof(err)));

    cfg = DEFAULT_ENGINE_CONFIG;
    cfg.analysis.minPointerSamples = 0;
    TEST_ASSERT_FALSE(validates(cfg, err, sizeof(err)));

    cfg = DEFAULT_ENGINE_CONFIG;
    cfg.analysis.suspiciousLinearity = 1.5f;
    TEST_ASSERT_FALSE(validates(cfg, err, sizeof(err)));

    // A minimum the pointer history can never hold pins the channel at its floor
    cfg = DEFAULT_ENGINE_CONFIG;
    cfg.analysis.minPointerSamples = POINTER_HISTORY_SIZE + 1;
    TEST_ASSERT_FALSE(validates(cfg, err, sizeof(err)));
    TEST_ASSERT_NOT_NULL(strstr(err, "minPointerSamples cannot exceed"));

    cfg.analysis.minPointerSamples = POINTER_HISTORY_SIZE;
    TEST_ASSERT_TRUE(validates(cfg, err, sizeof(err)));
}

void test_gate_settings_are_checked(void) {
    char err[CONFIG_ERROR_LENGTH + 1];
    EngineConfig cfg = DEFAULT_ENGINE_CONFIG;
    cfg.gate.requiredChannels = 6;
    TEST_ASSERT_FALSE(validates(cfg, err, sizeof(err)));

    cfg = DEFAULT_ENGINE_CONFIG;
    cfg.gate.honeypotField[0] = '\0';
    TEST_ASSERT_FALSE(validates(cfg, err, sizeof(err)));

    // An empty name is fine once the honeypot is off
    cfg.gate.honeypotEnabled = false;
    TEST_ASSERT_TRUE(validates(cfg, err, sizeof(err)));
}

void test_validator_tolerates_missing_buffer(void) {
    EngineConfig cfg = DEFAULT_ENGINE_CONFIG;
    cfg.analysis.analysisIntervalMs = 0;
    TEST_ASSERT_FALSE(BehaviorEngine::validateConfig(cfg, nullptr, 0));
}

int main(void) {
    UNITY_BEGIN();

    // Lifecycle
    RUN_TEST(test_start_returns_200_then_409);
    RUN_TEST(test_invalid_config_refuses_start);
    RUN_TEST(test_events_before_start_are_ignored);
    RUN_TEST(test_events_after_stop_are_ignored);
    RUN_TEST(test_stop_freezes_session_duration);
    RUN_TEST(test_tick_when_stopped_does_nothing);
    RUN_TEST(test_reset_stops_and_clears);
    RUN_TEST(test_setup_checks_run_on_start);
    RUN_TEST(test_touch_end_is_not_an_interaction);
    RUN_TEST(test_pointer_move_without_position_is_ignored);
    RUN_TEST(test_interacted_channels);
    RUN_TEST(test_event_logging_follows_config);
    RUN_TEST(test_startup_diagnostics_cover_sections);

    // Isolation
    RUN_TEST(test_sessions_on_one_hal_do_not_share_state);

    // Validation
    RUN_TEST(test_default_config_is_valid);
    RUN_TEST(test_weights_must_sum_to_one);
    RUN_TEST(test_negative_weight_is_rejected);
    RUN_TEST(test_thresholds_must_be_ordered_and_bounded);
    RUN_TEST(test_zero_interval_and_sample_minimum_are_rejected);
    RUN_TEST(test_gate_settings_are_checked);
    RUN_TEST(test_validator_tolerates_missing_buffer);

    return UNITY_END();
}
