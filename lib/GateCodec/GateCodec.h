#pragma once
#include <ArduinoJson.h>
#include <string>
#include "Types.h"

class GateCodec {
public:
    // Applies a JSON configuration on top of outConfig (missing keys keep their value),
    // then validates the result. Returns false and writes an explanation to errorMsg.
    static bool parseEngineConfig(JsonVariantConst json, EngineConfig& outConfig, std::string& errorMsg);

    // Parses one streamed event {kind, timestamp, ...}. Unknown kinds and missing
    // timestamps are errors; unusable optional payload fields are ignored.
    static bool parseEvent(JsonVariantConst json, InteractionEvent& outEvent, std::string& errorMsg);

    // --- Outbound payloads ---
    static void serializeToken(const VerificationToken& token, std::string& out);
    static void serializeVerificationData(const VerificationStatus& status, uint32_t interactionCount, std::string& out);
    static void serializeSnapshot(const AnalysisSnapshot& snapshot, std::string& out);
    static void serializeDecision(const VerificationDecision& decision, std::string& out);
};
