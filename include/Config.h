/*
 * =================================================================================
 * Project:   BehaviorGate - Behavioral Human Verification Engine
 * File:      include/Config.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Central configuration file for the host build. Defines project identity,
 * log buffer sizing, tick driver timing and the default environment probe.
 * Engine defaults live in lib/BehaviorEngine/Defaults.h.
 * =================================================================================
 */
#pragma once
#include "Types.h"

// --- Project Name String ---
#define PROJECT_NAME "BehaviorGate"
#define PROJECT_VERSION "1.2.0"

// =================================================================================
// SECTION: LOGGING
// =================================================================================

#define LOG_BUFFER_SIZE 150   // Lines retained in RAM
#define MAX_LOG_LENGTH 150    // Bytes per line (including terminator)
#define LOG_QUEUE_SIZE 50     // Pending lines for the console
#define LOG_DRAIN_BATCH 10    // Lines printed per processLogQueue() call

// =================================================================================
// SECTION: TICK DRIVER
// =================================================================================

#define TICK_LOCK_TIMEOUT_MS 100 // Skip a tick rather than block on a busy state lock

// =================================================================================
// SECTION: ENVIRONMENT PROBE DEFAULTS
// =================================================================================
// A native host has no browser window. These values describe an ordinary
// desktop session so the probe stays quiet until a caller overrides them.

#define DEFAULT_USER_AGENT "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0 Safari/537.36"
#define DEFAULT_LANGUAGE_COUNT 2

static const ViewportMetrics DEFAULT_VIEWPORT = {
    1280, // innerWidth
    720,  // innerHeight
    1280, // outerWidth
    800   // outerHeight
};
