/*
 * =================================================================================
 * Project:   BehaviorGate - Behavioral Human Verification Engine
 * File:      src/HostTrackerHAL.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Native implementation of ITrackerHAL. Owns the recursive state lock shared
 * by the tick driver and the event feeders, the in-RAM log ring buffer with
 * its console queue, and the environment probe values.
 * =================================================================================
 */
#include "HostTrackerHAL.h"

#include <chrono>
#include <stdio.h>
#include <string.h>

// Monotonic origin for getMillis()
static const std::chrono::steady_clock::time_point g_bootTime = std::chrono::steady_clock::now();

// =================================================================================
// SECTION: CONSTRUCTOR & INSTANCE
// =================================================================================

HostTrackerHAL::HostTrackerHAL()
    : _logBufferIndex(0), _logBufferFull(false), _queueHead(0), _queueTail(0), _droppedLines(0),
      _webDriver(false), _phantom(false), _userAgent(DEFAULT_USER_AGENT), _languageCount(DEFAULT_LANGUAGE_COUNT),
      _viewport(DEFAULT_VIEWPORT), _viewportAvailable(true) {
  memset(_logBuffer, 0, sizeof(_logBuffer));
  memset(_logQueue, 0, sizeof(_logQueue));
}

HostTrackerHAL &HostTrackerHAL::getInstance() {
  static HostTrackerHAL instance;
  return instance;
}

// =================================================================================
// SECTION: CLOCKS
// =================================================================================

unsigned long HostTrackerHAL::getMillis() {
  auto elapsed = std::chrono::steady_clock::now() - g_bootTime;
  return (unsigned long)std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
}

uint64_t HostTrackerHAL::getEpochMillis() {
  auto since = std::chrono::system_clock::now().time_since_epoch();
  return (uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(since).count();
}

// =================================================================================
// SECTION: SYNCHRONIZATION
// =================================================================================

bool HostTrackerHAL::lockState(uint32_t timeoutMs) {
  return _stateMutex.try_lock_for(std::chrono::milliseconds(timeoutMs));
}

void HostTrackerHAL::unlockState() { _stateMutex.unlock(); }

// =================================================================================
// SECTION: LOGGING SYSTEM
// =================================================================================

/**
 * Adds a message to the RAM ring buffer and pushes it to the console queue.
 * NO CONSOLE IO IN THIS FUNCTION: it runs inside the state lock.
 */
void HostTrackerHAL::log(const char *message) {
  std::lock_guard<std::mutex> guard(_logMutex);

  // 1. Write to RAM
  snprintf(_logBuffer[_logBufferIndex], MAX_LOG_LENGTH, "%s", message);
  _logBufferIndex++;
  if (_logBufferIndex >= LOG_BUFFER_SIZE) {
    _logBufferIndex = 0;
    _logBufferFull = true;
  }

  // 2. Write to Console Queue
  int nextHead = (_queueHead + 1) % LOG_QUEUE_SIZE;
  if (nextHead != _queueTail) {
    snprintf(_logQueue[_queueHead], MAX_LOG_LENGTH, "%s", message);
    _queueHead = nextHead;
  } else {
    // Queue full, drop rather than block the caller
    _droppedLines++;
  }
}

void HostTrackerHAL::logKeyValue(const char *key, const char *value) {
  char tempBuf[MAX_LOG_LENGTH];
  snprintf(tempBuf, MAX_LOG_LENGTH, " %-8s : %s", key, value);
  log(tempBuf);
}

int HostTrackerHAL::processLogQueue() {
  int printed = 0;

  while (printed < LOG_DRAIN_BATCH) {
    char msgCopy[MAX_LOG_LENGTH];

    // 1. Pop under the lock
    {
      std::lock_guard<std::mutex> guard(_logMutex);
      if (_queueHead == _queueTail)
        break;
      snprintf(msgCopy, MAX_LOG_LENGTH, "%s", _logQueue[_queueTail]);
      _queueTail = (_queueTail + 1) % LOG_QUEUE_SIZE;
    }

    // 2. Print outside it
    puts(msgCopy);
    printed++;
  }

  if (printed > 0)
    fflush(stdout);
  return printed;
}

const char *HostTrackerHAL::getLogLine(int i) {
  std::lock_guard<std::mutex> guard(_logMutex);
  int count = _logBufferFull ? LOG_BUFFER_SIZE : _logBufferIndex;
  if (i < 0 || i >= count)
    return "";
  int start = _logBufferFull ? _logBufferIndex : 0;
  return _logBuffer[(start + i) % LOG_BUFFER_SIZE];
}

int HostTrackerHAL::getLogLineCount() {
  std::lock_guard<std::mutex> guard(_logMutex);
  return _logBufferFull ? LOG_BUFFER_SIZE : _logBufferIndex;
}

uint32_t HostTrackerHAL::getDroppedLineCount() {
  std::lock_guard<std::mutex> guard(_logMutex);
  return _droppedLines;
}

void HostTrackerHAL::printStartupDiagnostics() {
  char logBuf[192];

  log("==========================================================================");
  log("                            HOST DIAGNOSTICS                              ");
  log("==========================================================================");

  // -------------------------------------------------------------------------
  // SECTION: LOGGING
  // -------------------------------------------------------------------------
  log("[ LOGGING ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %d lines", "RAM Buffer", LOG_BUFFER_SIZE);
  log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %d lines", "Console Queue", LOG_QUEUE_SIZE);
  log(logBuf);

  // -------------------------------------------------------------------------
  // SECTION: ENVIRONMENT PROBE
  // -------------------------------------------------------------------------
  log("");
  log("[ ENVIRONMENT PROBE ]");

  std::lock_guard<std::recursive_timed_mutex> guard(_stateMutex);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "WebDriver Flag", _webDriver ? "SET" : "clear");
  log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Phantom Markers", _phantom ? "PRESENT" : "none");
  log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %.60s", "User Agent", _userAgent.c_str());
  log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %d", "Languages", _languageCount);
  log(logBuf);

  if (_viewportAvailable) {
    snprintf(logBuf, sizeof(logBuf), " %-25s : %ux%u (outer %ux%u)", "Viewport", (unsigned)_viewport.innerWidth,
             (unsigned)_viewport.innerHeight, (unsigned)_viewport.outerWidth, (unsigned)_viewport.outerHeight);
  } else {
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Viewport", "UNAVAILABLE");
  }
  log(logBuf);
}

// =================================================================================
// SECTION: ENVIRONMENT PROBE
// =================================================================================

bool HostTrackerHAL::isWebDriverFlagSet() {
  std::lock_guard<std::recursive_timed_mutex> guard(_stateMutex);
  return _webDriver;
}

bool HostTrackerHAL::hasPhantomMarkers() {
  std::lock_guard<std::recursive_timed_mutex> guard(_stateMutex);
  return _phantom;
}

void HostTrackerHAL::getUserAgent(char *out, size_t size) {
  if (!out || size == 0)
    return;
  std::lock_guard<std::recursive_timed_mutex> guard(_stateMutex);
  snprintf(out, size, "%s", _userAgent.c_str());
}

int HostTrackerHAL::getLanguageCount() {
  std::lock_guard<std::recursive_timed_mutex> guard(_stateMutex);
  return _languageCount;
}

bool HostTrackerHAL::getViewport(ViewportMetrics &out) {
  std::lock_guard<std::recursive_timed_mutex> guard(_stateMutex);
  if (!_viewportAvailable)
    return false;
  out = _viewport;
  return true;
}

void HostTrackerHAL::setWebDriverFlag(bool set) {
  std::lock_guard<std::recursive_timed_mutex> guard(_stateMutex);
  _webDriver = set;
}

void HostTrackerHAL::setPhantomMarkers(bool set) {
  std::lock_guard<std::recursive_timed_mutex> guard(_stateMutex);
  _phantom = set;
}

void HostTrackerHAL::setUserAgent(const char *ua) {
  std::lock_guard<std::recursive_timed_mutex> guard(_stateMutex);
  _userAgent = ua ? ua : "";
}

void HostTrackerHAL::setLanguageCount(int count) {
  std::lock_guard<std::recursive_timed_mutex> guard(_stateMutex);
  _languageCount = count;
}

void HostTrackerHAL::setViewport(const ViewportMetrics &metrics, bool available) {
  std::lock_guard<std::recursive_timed_mutex> guard(_stateMutex);
  _viewport = metrics;
  _viewportAvailable = available;
}
