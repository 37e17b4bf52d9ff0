/*
 * =================================================================================
 * Project:   BehaviorGate - Behavioral Human Verification Engine
 * File:      lib/BehaviorEngine/Defaults.h
 *
 * Description:
 * Default engine configuration. Hosts copy this and override what they need
 * (or load overrides through GateCodec::parseEngineConfig).
 * =================================================================================
 */
#pragma once
#include "Types.h"

static const EngineConfig DEFAULT_ENGINE_CONFIG = {
    // Scoring weights (must sum to 1.0)
    {
        0.25f, // pointer
        0.20f, // touch
        0.20f, // click
        0.20f, // keyboard
        0.15f  // timing
    },
    // Classifier thresholds
    {
        0.3f, // botThreshold
        0.7f  // humanThreshold
    },
    // Analysis
    {
        1000,   // analysisIntervalMs
        5,      // minPointerSamples
        0.95f,  // suspiciousLinearity
        false   // logEvents
    },
    // Submission gate
    {
        10000,          // minTrackingTimeMs
        3000,           // minFillTimeMs
        10,             // minMouseMovements
        3,              // requiredChannels
        true,           // requireMouseMovement
        true,           // honeypotEnabled
        "email_confirm" // honeypotField
    },
    // Environment checks
    {
        true, // checkDevTools
        true, // checkAutomationFlags
        true, // validateUserAgent
        true  // checkViewportRatio
    }};
