/*
 * =================================================================================
 * Project:   BehaviorGate - Behavioral Human Verification Engine
 * File:      lib/BehaviorEngine/Types.h
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <stddef.h>

// --- Enums ---
enum Classification : uint8_t { CLASS_BOT, CLASS_UNCERTAIN, CLASS_HUMAN };
enum VerificationLevel : uint8_t { LEVEL_NONE, LEVEL_BASIC, LEVEL_ENHANCED, LEVEL_VERIFIED };
enum Channel : uint8_t { CH_POINTER, CH_TOUCH, CH_CLICK, CH_KEYBOARD, CH_TIMING };

enum EventKind : uint8_t {
  EVT_POINTER_MOVE,
  EVT_POINTER_DOWN,
  EVT_CLICK,
  EVT_TOUCH_START,
  EVT_TOUCH_MOVE,
  EVT_TOUCH_END,
  EVT_KEY_DOWN,
  EVT_KEY_UP,
  EVT_FOCUS,
  EVT_BLUR,
  EVT_VISIBILITY_CHANGE,
  EVT_PASTE,
  EVT_FIELD_INPUT
};

// Interaction types whose first occurrence is timed by the timing channel
enum InteractionType : uint8_t { INTERACT_POINTER, INTERACT_CLICK, INTERACT_TOUCH, INTERACT_KEYBOARD, INTERACT_FIELD };

enum FlagType : uint8_t {
  FLAG_HONEYPOT_FILLED,
  FLAG_BOT_BEHAVIOR,
  FLAG_WEBDRIVER,
  FLAG_PHANTOM,
  FLAG_DEVTOOLS,
  FLAG_FAST_TYPING,
  FLAG_UNIFORM_TYPING,
  FLAG_PASTE,
  FLAG_FAST_CLICKING,
  FLAG_SUSPICIOUS_USER_AGENT,
  FLAG_MISSING_LANGUAGES,
  FLAG_UNUSUAL_VIEWPORT,
  FLAG_RAPID_ACTIVITY,
  FLAG_UNKNOWN
};

// --- Constants ---

// Channels
#define CHANNEL_COUNT 5
#define INTERACTION_TYPE_COUNT 5

// Rolling history capacities (oldest evicted first)
#define POINTER_HISTORY_SIZE 1000
#define TOUCH_HISTORY_SIZE 500
#define CLICK_HISTORY_SIZE 200
#define KEYBOARD_HISTORY_SIZE 500
#define FLAG_LOG_SIZE 64
#define MAX_TRACKED_FIELDS 32

// Strings
#define FIELD_NAME_LENGTH 31
#define USER_AGENT_LENGTH 255
#define FLAG_DATA_LENGTH 63
#define REASON_LENGTH 63
#define RECOMMENDATION_LENGTH 63
#define MAX_RECOMMENDATIONS 4

// Notifications
#define MAX_LISTENERS 4

// --- Configuration Structs ---
struct ScoringWeights {
  float pointer;
  float touch;
  float click;
  float keyboard;
  float timing;
};

struct ClassifierThresholds {
  float botThreshold;
  float humanThreshold;
};

struct AnalysisConfig {
  uint32_t analysisIntervalMs;
  uint32_t minPointerSamples;
  float suspiciousLinearity;
  bool logEvents;
};

struct GateConfig {
  uint32_t minTrackingTimeMs;
  uint32_t minFillTimeMs;
  uint32_t minMouseMovements;
  uint32_t requiredChannels;
  bool requireMouseMovement;
  bool honeypotEnabled;
  char honeypotField[FIELD_NAME_LENGTH + 1];
};

struct SecurityChecks {
  bool checkDevTools;
  bool checkAutomationFlags;
  bool validateUserAgent;
  bool checkViewportRatio;
};

struct EngineConfig {
  ScoringWeights weights;
  ClassifierThresholds thresholds;
  AnalysisConfig analysis;
  GateConfig gate;
  SecurityChecks security;
};

// --- Event Structs ---

// One interaction reported by the UI layer. Payload fields that do not
// apply to the kind are ignored.
struct InteractionEvent {
  EventKind kind;
  uint32_t timestamp;
  bool hasPosition;
  float x;
  float y;
  uint8_t contacts;   // touch: active contacts
  bool visible;       // visibility-change
  uint32_t length;    // paste: clipboard length, field-input: value length
  char field[FIELD_NAME_LENGTH + 1];
};

// --- Environment Probe ---
struct ViewportMetrics {
  uint32_t innerWidth;
  uint32_t innerHeight;
  uint32_t outerWidth;
  uint32_t outerHeight;
};

// --- Feature Structs ---
struct PointerFeatures {
  uint32_t sampleCount;
  uint32_t movementCount;
  float totalMovement;
  float avgVelocity;
  float maxVelocity;
  float velocityVariance;
  float accelerationVariance;
  float linearity;
};

struct TouchFeatures {
  uint32_t touchCount;
  uint32_t swipeCount;
  bool multiTouch;
  float totalSwipeDistance;
  float avgSwipeVelocity;
  float swipeVelocityVariance;
};

struct ClickFeatures {
  uint32_t clickCount;
  uint32_t intervalCount;
  float avgInterval;
  float intervalVariance;
  float consistency;
};

struct KeyboardFeatures {
  uint32_t keyPressCount;
  uint32_t intervalCount;
  float avgInterval;
  float intervalVariance;
  uint32_t naturalPauses;
};

struct TimingFeatures {
  bool hasFirstInteraction;
  uint32_t firstInteractionDelay;
  uint32_t delayCount;
  float delayVariance;
};

// --- State Structs ---
struct ChannelScores {
  float pointer;
  float touch;
  float click;
  float keyboard;
  float timing;
  float overall;
};

struct AnomalyFlag {
  FlagType type;
  uint32_t timestamp;
  float penalty;
  char data[FLAG_DATA_LENGTH + 1];
};

struct FieldActivity {
  char name[FIELD_NAME_LENGTH + 1];
  uint32_t focusCount;
  uint32_t inputCount;
  uint32_t firstFocus;
  uint32_t lastActivity;
  bool focused;
};

struct VerificationDecision {
  bool allow;
  char reason[REASON_LENGTH + 1];
  float confidence;
  float score;
  uint8_t recommendationCount;
  char recommendations[MAX_RECOMMENDATIONS][RECOMMENDATION_LENGTH + 1];
};

struct VerificationToken {
  uint64_t timestamp;
  float score;
  float confidence;
  uint32_t sessionDurationMs;
};

struct VerificationStatus {
  VerificationLevel level;
  float score;
  float confidence;
  bool isVerified;
  uint32_t flagCount;
  uint32_t sessionTime;
};

struct AnalysisSnapshot {
  ChannelScores scores;
  PointerFeatures pointer;
  TouchFeatures touch;
  ClickFeatures click;
  KeyboardFeatures keyboard;
  TimingFeatures timing;
  Classification classification;
  VerificationLevel level;
  float confidence;
  uint32_t flagCount;
  uint32_t sessionDuration;
  bool tracking;
};

extern const char *classificationToString(Classification c);
extern const char *levelToString(VerificationLevel l);
extern const char *flagTypeToString(FlagType f);
extern const char *eventKindToString(EventKind k);
extern const char *channelToString(Channel c);
