/*
 * =================================================================================
 * Project:   BehaviorGate - Behavioral Human Verification Engine
 * File:      lib/BehaviorEngine/Types.cpp
 * =================================================================================
 */

#include "Types.h"

const char *classificationToString(Classification c) {
  switch (c) {
  case CLASS_BOT:
    return "bot";
  case CLASS_HUMAN:
    return "human";
  case CLASS_UNCERTAIN:
  default:
    return "uncertain";
  }
}

const char *levelToString(VerificationLevel l) {
  switch (l) {
  case LEVEL_BASIC:
    return "basic";
  case LEVEL_ENHANCED:
    return "enhanced";
  case LEVEL_VERIFIED:
    return "verified";
  default:
    return "none";
  }
}

const char *flagTypeToString(FlagType f) {
  switch (f) {
  case FLAG_HONEYPOT_FILLED:
    return "honeypot_filled";
  case FLAG_BOT_BEHAVIOR:
    return "bot_behavior_detected";
  case FLAG_WEBDRIVER:
    return "webdriver_detected";
  case FLAG_PHANTOM:
    return "phantom_detected";
  case FLAG_DEVTOOLS:
    return "dev_tools_detected";
  case FLAG_FAST_TYPING:
    return "fast_typing";
  case FLAG_UNIFORM_TYPING:
    return "uniform_typing";
  case FLAG_PASTE:
    return "paste_detected";
  case FLAG_FAST_CLICKING:
    return "fast_clicking";
  case FLAG_SUSPICIOUS_USER_AGENT:
    return "suspicious_user_agent";
  case FLAG_MISSING_LANGUAGES:
    return "missing_languages";
  case FLAG_UNUSUAL_VIEWPORT:
    return "unusual_viewport_ratio";
  case FLAG_RAPID_ACTIVITY:
    return "rapid_activity_after_focus";
  default:
    return "unknown";
  }
}

const char *eventKindToString(EventKind k) {
  switch (k) {
  case EVT_POINTER_MOVE:
    return "pointer-move";
  case EVT_POINTER_DOWN:
    return "pointer-down";
  case EVT_CLICK:
    return "click";
  case EVT_TOUCH_START:
    return "touch-start";
  case EVT_TOUCH_MOVE:
    return "touch-move";
  case EVT_TOUCH_END:
    return "touch-end";
  case EVT_KEY_DOWN:
    return "key-down";
  case EVT_KEY_UP:
    return "key-up";
  case EVT_FOCUS:
    return "focus";
  case EVT_BLUR:
    return "blur";
  case EVT_VISIBILITY_CHANGE:
    return "visibility-change";
  case EVT_PASTE:
    return "paste";
  case EVT_FIELD_INPUT:
    return "field-input";
  default:
    return "unknown";
  }
}

const char *channelToString(Channel c) {
  switch (c) {
  case CH_POINTER:
    return "pointer";
  case CH_TOUCH:
    return "touch";
  case CH_CLICK:
    return "click";
  case CH_KEYBOARD:
    return "keyboard";
  default:
    return "timing";
  }
}
