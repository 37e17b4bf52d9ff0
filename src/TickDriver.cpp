/*
 * =================================================================================
 * Project:   BehaviorGate - Behavioral Human Verification Engine
 * File:      src/TickDriver.cpp
 * =================================================================================
 */
#include "TickDriver.h"

#include <chrono>
#include <stdio.h>

TickDriver::TickDriver(HostTrackerHAL &hal, BehaviorEngine &engine)
    : _hal(hal), _engine(engine), _stopRequested(false), _running(false), _tickCount(0), _skippedCount(0) {}

TickDriver::~TickDriver() { stop(); }

bool TickDriver::start(uint32_t intervalMs) {
  if (_running.load() || intervalMs == 0)
    return false;

  {
    std::lock_guard<std::mutex> guard(_wakeMutex);
    _stopRequested = false;
  }

  _running.store(true);
  _thread = std::thread(&TickDriver::run, this, intervalMs);

  char logBuf[64];
  snprintf(logBuf, sizeof(logBuf), "Tick driver started (%u ms).", (unsigned)intervalMs);
  _hal.logKeyValue("Driver", logBuf);
  return true;
}

void TickDriver::stop() {
  {
    std::lock_guard<std::mutex> guard(_wakeMutex);
    _stopRequested = true;
  }
  _wake.notify_all();

  if (_thread.joinable()) {
    _thread.join();
    _hal.logKeyValue("Driver", "Tick driver stopped.");
  }
  _running.store(false);
}

void TickDriver::run(uint32_t intervalMs) {
  std::unique_lock<std::mutex> wakeLock(_wakeMutex);

  while (!_stopRequested) {
    // Interruptible sleep: stop() cuts the wait short
    if (_wake.wait_for(wakeLock, std::chrono::milliseconds(intervalMs), [this] { return _stopRequested; })) {
      break;
    }
    wakeLock.unlock();

    // 1. Engine tick under the state lock
    if (_hal.lockState()) {
      _engine.tick();
      _hal.unlockState();
      _tickCount++;
    } else {
      _skippedCount++;
    }

    // 2. Console output outside it
    _hal.processLogQueue();

    wakeLock.lock();
  }
}
