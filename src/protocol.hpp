#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "conflict_detector.hpp"
#include "errors.hpp"
#include "operation.hpp"
#include "presence_tracker.hpp"
#include "session_types.hpp"

using json = nlohmann::json;

// protocol.hpp
// One JSON object per line; every message carries a "type".

void to_json(json& j, const Target& target);
void to_json(json& j, const Operation& op);
void to_json(json& j, const Conflict& conflict);
void to_json(json& j, const Cursor& cursor);
void to_json(json& j, const Selection& selection);
void to_json(json& j, const Typing& typing);
void to_json(json& j, const Presence& presence);
void to_json(json& j, const Participant& participant);
void to_json(json& j, const SessionSettings& settings);
void to_json(json& j, const SessionStats& stats);
void to_json(json& j, const SessionInfo& info);

json payload_to_json(const OperationPayload& payload);

// Decoders throw CollabError(InvalidOperation / InvalidSettings) on
// malformed input; nlohmann exceptions never escape them.
OperationPayload decode_payload(OperationType type, const json& j);
Operation decode_operation(const json& j);
Presence decode_presence(const json& j);
Participant decode_participant(const json& j);

// Applies the keys present in j on top of base.
SessionSettings decode_settings(const json& j, const SessionSettings& base);

json make_session_joined(const SessionInfo& session,
                         const json& state,
                         const std::vector<Presence>& presence);
json make_session_left(const std::string& session_id, const std::string& user_id);
json make_operation_result(const Operation& op);
json make_operation_committed(const Operation& op);
json make_operation_status(const Operation& op);
json make_conflict_detected(const std::string& session_id, const Conflict& conflict);
json make_presence_update(const Presence& presence);
json make_participant_joined(const std::string& session_id, const Participant& participant);
json make_participant_left(const std::string& session_id, const std::string& user_id);
json make_session_ended(const std::string& session_id, const std::string& reason);
json make_settings_updated(const std::string& session_id, const SessionSettings& settings);
json make_sync_response(const std::string& session_id,
                        const std::vector<Operation>& operations,
                        uint64_t head_version);
json make_session_stats(const std::string& session_id, const SessionStats& stats);
json make_error(ErrorCode code, const std::string& message, const std::string& request_type = "");
