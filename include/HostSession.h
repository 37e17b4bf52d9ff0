/*
 * =================================================================================
 * Project:   BehaviorGate - Behavioral Human Verification Engine
 * File:      include/HostSession.h
 * Description: One tracked session on a native host.
 * Bundles the engine, its rules and its tick driver, and serializes every
 * engine call behind the HAL state lock so feeders and the driver thread
 * never interleave.
 * =================================================================================
 */
#pragma once

#include <string>

#include "BehaviorEngine.h"
#include "HostTrackerHAL.h"
#include "StandardRules.h"
#include "TickDriver.h"

// JSON payloads produced at submission
struct SubmissionResult {
  bool allow;
  std::string decisionJson;
  std::string tokenJson;
  std::string verificationDataJson;
};

class HostSession {
public:
  HostSession(HostTrackerHAL &hal, const EngineConfig &config);
  ~HostSession();

  // Starts tracking and the tick driver. Same status codes as BehaviorEngine::start().
  int begin();

  // Stops the driver (joining any in-flight tick), then stops tracking.
  void end();

  // Clears the session. The driver keeps running if it was.
  void reset();

  // Native feed: event timestamps are HAL getMillis() values.
  bool observe(const InteractionEvent &event);

  // Parses one JSON event and feeds it. The JSON timestamp is milliseconds
  // since begin(). Returns false with errorMsg set when the line is not a
  // usable event.
  bool observeJson(const char *json, std::string &errorMsg);

  // Runs the decision gate and builds the outbound payloads.
  bool submit(SubmissionResult &out);

  std::string snapshotJson();
  uint32_t getInteractionCount();

  BehaviorEngine &getEngine() { return _engine; }
  TickDriver &getDriver() { return _driver; }

  /**
   * Applies a JSON configuration document on top of outConfig.
   * @return false with an explanation in errorMsg on malformed JSON or an invalid configuration.
   */
  static bool parseConfigJson(const char *json, EngineConfig &outConfig, std::string &errorMsg);

private:
  HostTrackerHAL &_hal;
  StandardRules _rules;
  BehaviorEngine _engine;
  TickDriver _driver;

  uint32_t countFieldInteractions() const;

  HostSession(const HostSession &) = delete;
  HostSession &operator=(const HostSession &) = delete;
};
