/*
 * =================================================================================
 * Project:   BehaviorGate - Behavioral Human Verification Engine
 * File:      include/TickDriver.h
 * Description: Periodic driver for BehaviorEngine::tick().
 * A background thread wakes every analysis interval, takes the HAL state
 * lock, ticks the engine, then drains the console log queue outside the lock.
 * =================================================================================
 */
#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "BehaviorEngine.h"
#include "HostTrackerHAL.h"

class TickDriver {
public:
  TickDriver(HostTrackerHAL &hal, BehaviorEngine &engine);
  ~TickDriver();

  // Returns false if already running or the interval is zero.
  bool start(uint32_t intervalMs);

  // Wakes the thread and joins it. An in-flight tick completes first.
  void stop();

  bool isRunning() const { return _running.load(); }
  uint32_t getTickCount() const { return _tickCount.load(); }
  uint32_t getSkippedCount() const { return _skippedCount.load(); }

private:
  HostTrackerHAL &_hal;
  BehaviorEngine &_engine;

  std::thread _thread;
  std::mutex _wakeMutex;
  std::condition_variable _wake;
  bool _stopRequested;

  std::atomic<bool> _running;
  std::atomic<uint32_t> _tickCount;
  std::atomic<uint32_t> _skippedCount; // lock not acquired in time

  void run(uint32_t intervalMs);

  TickDriver(const TickDriver &) = delete;
  TickDriver &operator=(const TickDriver &) = delete;
};
