/*
 * =================================================================================
 * Project:   BehaviorGate - Behavioral Human Verification Engine
 * File:      src/HostSession.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include "HostSession.h"

#include <ArduinoJson.h>
#include <stdio.h>

#include "GateCodec.h"

// Lock wait for feeder calls. Longer than the driver's so a feeder is not
// starved by a tick.
static const uint32_t FEEDER_LOCK_TIMEOUT_MS = 1000;

HostSession::HostSession(HostTrackerHAL &hal, const EngineConfig &config)
    : _hal(hal), _rules(), _engine(hal, _rules, config), _driver(hal, _engine) {}

HostSession::~HostSession() { end(); }

// =================================================================================
// SECTION: LIFECYCLE
// =================================================================================

int HostSession::begin() {
  if (!_hal.lockState(FEEDER_LOCK_TIMEOUT_MS)) {
    _hal.logKeyValue("Host", "Start Failed: state lock busy.");
    return 409;
  }
  int status = _engine.start();
  _hal.unlockState();

  if (status == 200 && !_driver.isRunning()) {
    _driver.start(_engine.getConfig().analysis.analysisIntervalMs);
  }
  return status;
}

void HostSession::end() {
  _driver.stop();

  if (_hal.lockState(FEEDER_LOCK_TIMEOUT_MS)) {
    _engine.stop();
    _hal.unlockState();
  } else {
    _hal.logKeyValue("Host", "Stop deferred: state lock busy.");
  }
}

void HostSession::reset() {
  if (_hal.lockState(FEEDER_LOCK_TIMEOUT_MS)) {
    _engine.reset();
    _hal.unlockState();
  }
}

// =================================================================================
// SECTION: EVENT FEED
// =================================================================================

bool HostSession::observe(const InteractionEvent &event) {
  if (!_hal.lockState(FEEDER_LOCK_TIMEOUT_MS)) {
    _hal.logKeyValue("Host", "Event dropped: state lock busy.");
    return false;
  }
  _engine.observe(event);
  _hal.unlockState();
  return true;
}

bool HostSession::observeJson(const char *json, std::string &errorMsg) {
  JsonDocument doc;
  DeserializationError error = deserializeJson(doc, json ? json : "");
  if (error) {
    errorMsg = std::string("Invalid JSON: ") + error.c_str();
    return false;
  }

  InteractionEvent event;
  if (!GateCodec::parseEvent(doc.as<JsonVariantConst>(), event, errorMsg)) {
    return false;
  }

  if (!_hal.lockState(FEEDER_LOCK_TIMEOUT_MS)) {
    _hal.logKeyValue("Host", "Event dropped: state lock busy.");
    errorMsg = "State lock busy.";
    return false;
  }
  // Wire timestamps count from session start; the engine runs on the HAL clock
  event.timestamp += _engine.getStartTime();
  _engine.observe(event);
  _hal.unlockState();
  return true;
}

// =================================================================================
// SECTION: SUBMISSION & REPORTING
// =================================================================================

bool HostSession::submit(SubmissionResult &out) {
  if (!_hal.lockState(FEEDER_LOCK_TIMEOUT_MS)) {
    _hal.logKeyValue("Host", "Submit Failed: state lock busy.");
    out.allow = false;
    out.decisionJson.clear();
    out.tokenJson.clear();
    out.verificationDataJson.clear();
    return false;
  }

  VerificationDecision decision = _engine.decide();
  VerificationToken token = _engine.makeToken(decision);
  VerificationStatus status = _engine.getVerificationStatus();
  uint32_t interactions = countFieldInteractions();

  _hal.unlockState();

  out.allow = decision.allow;
  GateCodec::serializeDecision(decision, out.decisionJson);
  GateCodec::serializeToken(token, out.tokenJson);
  GateCodec::serializeVerificationData(status, interactions, out.verificationDataJson);
  return true;
}

std::string HostSession::snapshotJson() {
  std::string out;
  if (!_hal.lockState(FEEDER_LOCK_TIMEOUT_MS)) {
    return out;
  }
  AnalysisSnapshot snap = _engine.analysisSnapshot();
  _hal.unlockState();

  GateCodec::serializeSnapshot(snap, out);
  return out;
}

uint32_t HostSession::getInteractionCount() {
  uint32_t count = 0;
  if (_hal.lockState(FEEDER_LOCK_TIMEOUT_MS)) {
    count = countFieldInteractions();
    _hal.unlockState();
  }
  return count;
}

// Focus plus input events over every tracked field
uint32_t HostSession::countFieldInteractions() const {
  const AnomalyDetector &anomalies = _engine.getAnomalies();
  uint32_t count = 0;
  for (size_t i = 0; i < anomalies.getFieldCount(); i++) {
    const FieldActivity *field = anomalies.getField(i);
    if (field) {
      count += field->focusCount + field->inputCount;
    }
  }
  return count;
}

// =================================================================================
// SECTION: CONFIGURATION
// =================================================================================

bool HostSession::parseConfigJson(const char *json, EngineConfig &outConfig, std::string &errorMsg) {
  JsonDocument doc;
  DeserializationError error = deserializeJson(doc, json ? json : "");
  if (error) {
    errorMsg = std::string("Invalid JSON: ") + error.c_str();
    return false;
  }
  return GateCodec::parseEngineConfig(doc.as<JsonVariantConst>(), outConfig, errorMsg);
}
