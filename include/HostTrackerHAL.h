/*
 * =================================================================================
 * Project:   BehaviorGate - Behavioral Human Verification Engine
 * File:      include/HostTrackerHAL.h
 * Description: Header for the native (POSIX) implementation of ITrackerHAL.
 * Encapsulates the Clocks, the State Lock, Logging and the Environment Probe.
 * =================================================================================
 */
#pragma once

#include <mutex>
#include <string>

#include "Config.h"
#include "TrackerContext.h"
#include "Types.h"

class HostTrackerHAL : public ITrackerHAL {
public:
  HostTrackerHAL();

  // Process-wide instance used by the host executable.
  static HostTrackerHAL &getInstance();

  // --- ITrackerHAL ---
  void log(const char *message) override;
  unsigned long getMillis() override;
  uint64_t getEpochMillis() override;
  bool isWebDriverFlagSet() override;
  bool hasPhantomMarkers() override;
  void getUserAgent(char *out, size_t size) override;
  int getLanguageCount() override;
  bool getViewport(ViewportMetrics &out) override;

  // --- Synchronization ---
  bool lockState(uint32_t timeoutMs = TICK_LOCK_TIMEOUT_MS);
  void unlockState();

  // --- Logging ---
  void logKeyValue(const char *key, const char *value);

  // Prints up to LOG_DRAIN_BATCH queued lines. Returns the number printed.
  int processLogQueue();

  // i = 0 is the oldest retained line.
  const char *getLogLine(int i);
  int getLogLineCount();
  uint32_t getDroppedLineCount();

  void printStartupDiagnostics();

  // --- Environment Probe Overrides ---
  void setWebDriverFlag(bool set);
  void setPhantomMarkers(bool set);
  void setUserAgent(const char *ua);
  void setLanguageCount(int count);
  void setViewport(const ViewportMetrics &metrics, bool available = true);

private:
  // --- Synchronization ---
  std::recursive_timed_mutex _stateMutex;

  // --- Log State (RAM + Console) ---
  char _logBuffer[LOG_BUFFER_SIZE][MAX_LOG_LENGTH];
  int _logBufferIndex;
  bool _logBufferFull;
  char _logQueue[LOG_QUEUE_SIZE][MAX_LOG_LENGTH];
  int _queueHead;
  int _queueTail;
  uint32_t _droppedLines;
  std::mutex _logMutex;

  // --- Environment Probe ---
  bool _webDriver;
  bool _phantom;
  std::string _userAgent;
  int _languageCount;
  ViewportMetrics _viewport;
  bool _viewportAvailable;
};
