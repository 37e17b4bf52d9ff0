/*
 * =================================================================================
 * File:      lib/BehaviorEngine/TrackerContext.h
 * Description: Abstraction layer (HAL) for Clock, Logging, and the Environment Probe.
 * =================================================================================
 */
#pragma once
#include "Types.h"

class ITrackerHAL {
public:
    virtual ~ITrackerHAL() {}

    // --- Logging ---
    virtual void log(const char* message) = 0;

    // --- Clock ---
    // Monotonic milliseconds. All session timing is measured against this.
    virtual unsigned long getMillis() = 0;

    // Wall-clock milliseconds since the Unix epoch (token timestamps only).
    virtual uint64_t getEpochMillis() = 0;

    // --- Environment Probe ---
    // Automation markers exposed by the host runtime (e.g. navigator.webdriver).
    virtual bool isWebDriverFlagSet() = 0;
    virtual bool hasPhantomMarkers() = 0;

    // Copies the user agent into out (truncated, always terminated). Empty if unknown.
    virtual void getUserAgent(char* out, size_t size) = 0;

    // Number of preferred languages the host reports.
    virtual int getLanguageCount() = 0;

    // Fills the window metrics. Returns false if the host has no window.
    virtual bool getViewport(ViewportMetrics& out) = 0;
};
