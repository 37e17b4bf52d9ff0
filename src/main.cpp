/*
 * =================================================================================
 * Project:   BehaviorGate - Behavioral Human Verification Engine
 * File:      main.cpp
 * Description: Demo host for the engine library. Feeds a JSONL event
 * stream through HostSession and prints the submission payloads.
 * Usage:     behaviorgate [config.json] < events.jsonl
 *
 * Reads one JSON event per line from stdin. Event timestamps are
 * milliseconds since tracking began. The commands "snapshot" and "submit"
 * may appear on their own line; end of input submits.
 * =================================================================================
 */

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdio.h>
#include <string>

// --- Module Includes ---
#include "Config.h"
#include "Defaults.h"
#include "HostSession.h"
#include "HostTrackerHAL.h"

/**
 * Prints high-level build identity.
 */
static void printBuildDiagnostics(HostTrackerHAL &hal) {
  char logBuf[128];

  hal.log("==========================================================================");
  hal.log("                       BUILD IDENTITY                                     ");
  hal.log("==========================================================================");

  // -------------------------------------------------------------------------
  // SECTION: IDENTITY
  // -------------------------------------------------------------------------
  hal.log("[ VERSION INFO ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Project Name", PROJECT_NAME);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Version", PROJECT_VERSION);
  hal.log(logBuf);

  // -------------------------------------------------------------------------
  // SECTION: BUILD METADATA
  // -------------------------------------------------------------------------
  hal.log("");
  hal.log("[ BUILD DETAILS ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Date", __DATE__);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Time", __TIME__);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %ld", "C++ Standard", (long)__cplusplus);
  hal.log(logBuf);

  hal.log("==========================================================================");
}

static void drainLogs(HostTrackerHAL &hal) {
  while (hal.processLogQueue() > 0) {
  }
}

static bool loadConfigFile(const char *path, EngineConfig &config, std::string &errorMsg) {
  std::ifstream in(path);
  if (!in) {
    errorMsg = std::string("Cannot open ") + path;
    return false;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return HostSession::parseConfigJson(buffer.str().c_str(), config, errorMsg);
}

static void printSubmission(HostSession &session, HostTrackerHAL &hal) {
  SubmissionResult result;
  if (!session.submit(result)) {
    drainLogs(hal);
    fprintf(stderr, "Submission failed: state lock busy.\n");
    return;
  }
  drainLogs(hal);
  printf("decision %s\n", result.decisionJson.c_str());
  printf("token %s\n", result.tokenJson.c_str());
  printf("data %s\n", result.verificationDataJson.c_str());
}

int main(int argc, char **argv) {
  HostTrackerHAL &hal = HostTrackerHAL::getInstance();

  // 1. Identity
  printBuildDiagnostics(hal);
  drainLogs(hal);

  // 2. Configuration
  EngineConfig config = DEFAULT_ENGINE_CONFIG;
  if (argc > 1) {
    std::string errorMsg;
    if (!loadConfigFile(argv[1], config, errorMsg)) {
      fprintf(stderr, "Config Error: %s\n", errorMsg.c_str());
      return 2;
    }
  }

  // 3. Session
  HostSession session(hal, config);

  hal.printStartupDiagnostics();
  session.getEngine().printStartupDiagnostics();
  drainLogs(hal);

  int status = session.begin();
  if (status != 200) {
    drainLogs(hal);
    fprintf(stderr, "Start failed (%d).\n", status);
    return 1;
  }

  // 4. Event Feed
  std::string line;
  bool submitted = false;
  while (std::getline(std::cin, line)) {
    if (line.empty())
      continue;

    if (line == "snapshot") {
      std::string snap = session.snapshotJson();
      drainLogs(hal);
      printf("snapshot %s\n", snap.c_str());
      continue;
    }
    if (line == "submit") {
      printSubmission(session, hal);
      submitted = true;
      break;
    }

    std::string errorMsg;
    if (!session.observeJson(line.c_str(), errorMsg)) {
      char logBuf[MAX_LOG_LENGTH];
      snprintf(logBuf, sizeof(logBuf), "Skipped: %s", errorMsg.c_str());
      hal.logKeyValue("Host", logBuf);
    }
    hal.processLogQueue();
  }

  if (!submitted) {
    printSubmission(session, hal);
  }

  // 5. Teardown
  session.end();
  drainLogs(hal);
  return 0;
}
