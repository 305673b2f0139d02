#include "protocol.hpp"

namespace {

[[noreturn]] void invalid(const std::string& message) {
  throw CollabError(ErrorCode::InvalidOperation, message);
}

std::string require_string(const json& j, const char* key) {
  auto it = j.find(key);
  if(it == j.end() || !it->is_string() || it->get<std::string>().empty()) {
    invalid(std::string("missing or empty '") + key + "'");
  }
  return it->get<std::string>();
}

json object_or_empty(const json& j, const char* key) {
  auto it = j.find(key);
  if(it == j.end() || it->is_null()) return json::object();
  if(!it->is_object()) invalid(std::string("'") + key + "' must be an object");
  return *it;
}

std::optional<double> optional_number(const json& j, const char* key) {
  auto it = j.find(key);
  if(it == j.end() || it->is_null()) return std::nullopt;
  if(!it->is_number()) invalid(std::string("'") + key + "' must be a number");
  return it->get<double>();
}

std::optional<std::string> optional_string(const json& j, const char* key) {
  auto it = j.find(key);
  if(it == j.end() || it->is_null()) return std::nullopt;
  if(!it->is_string()) invalid(std::string("'") + key + "' must be a string");
  return it->get<std::string>();
}

json geometry_to_json(const Geometry& g) {
  json out = json::object();
  if(g.x) out["x"] = *g.x;
  if(g.y) out["y"] = *g.y;
  if(g.width) out["width"] = *g.width;
  if(g.height) out["height"] = *g.height;
  return out;
}

std::vector<std::string> string_list(const json& j, const char* key) {
  std::vector<std::string> out;
  auto it = j.find(key);
  if(it == j.end() || it->is_null()) return out;
  if(!it->is_array()) invalid(std::string("'") + key + "' must be an array");
  for(const auto& item : *it) {
    if(!item.is_string()) invalid(std::string("'") + key + "' must hold strings");
    out.push_back(item.get<std::string>());
  }
  return out;
}

} // namespace

void to_json(json& j, const Target& target) {
  j = json{{"kind", to_string(target.kind)}, {"id", target.id}};
}

json payload_to_json(const OperationPayload& payload) {
  json j = json::object();
  if(const auto* p = std::get_if<NodeAddPayload>(&payload)) {
    j["node"] = {
      {"id", p->node.id},
      {"kind", p->node.kind},
      {"x", p->node.x},
      {"y", p->node.y},
      {"width", p->node.width},
      {"height", p->node.height},
      {"data", p->node.data}
    };
  } else if(const auto* p = std::get_if<NodeUpdatePayload>(&payload)) {
    j["geometry"] = geometry_to_json(p->geometry);
    j["fields"] = p->fields;
  } else if(const auto* p = std::get_if<EdgeAddPayload>(&payload)) {
    j["edge"] = {
      {"id", p->edge.id},
      {"source", p->edge.source},
      {"target", p->edge.target},
      {"data", p->edge.data}
    };
  } else if(const auto* p = std::get_if<EdgeUpdatePayload>(&payload)) {
    if(p->source) j["source"] = *p->source;
    if(p->target) j["target"] = *p->target;
    j["fields"] = p->fields;
  } else if(const auto* p = std::get_if<PropertyUpdatePayload>(&payload)) {
    j["properties"] = p->properties;
  }
  return j;
}

void to_json(json& j, const Operation& op) {
  j = json{
    {"id", op.id},
    {"sessionId", op.session_id},
    {"workflowId", op.workflow_id},
    {"authorId", op.author_id},
    {"type", to_string(op.type)},
    {"target", op.target},
    {"payload", payload_to_json(op.payload)},
    {"baseVersion", op.base_version},
    {"committedVersion", op.committed_version},
    {"status", to_string(op.status)},
    {"timestamp", op.timestamp}
  };
  if(!op.reason.empty()) j["reason"] = op.reason;
  if(!op.winner_id.empty()) j["winnerId"] = op.winner_id;
  if(!op.conflicting_id.empty()) j["conflictingId"] = op.conflicting_id;
}

void to_json(json& j, const Conflict& conflict) {
  j = json{
    {"id", conflict.id},
    {"operationIds", conflict.operation_ids},
    {"type", to_string(conflict.type)},
    {"resolution", conflict.resolution}
  };
}

void to_json(json& j, const Cursor& cursor) {
  j = json{{"x", cursor.x}, {"y", cursor.y}};
  if(cursor.node_id) j["nodeId"] = *cursor.node_id;
}

void to_json(json& j, const Selection& selection) {
  j = json{{"nodeIds", selection.node_ids}, {"edgeIds", selection.edge_ids}};
}

void to_json(json& j, const Typing& typing) {
  j = json{{"nodeId", typing.node_id}, {"field", typing.field}};
}

void to_json(json& j, const Presence& presence) {
  j = json{
    {"userId", presence.user_id},
    {"sessionId", presence.session_id},
    {"status", to_string(presence.status)},
    {"selection", presence.selection},
    {"updatedAt", presence.updated_at}
  };
  j["cursor"] = presence.cursor ? json(*presence.cursor) : json(nullptr);
  j["typing"] = presence.typing ? json(*presence.typing) : json(nullptr);
}

void to_json(json& j, const Participant& participant) {
  j = json{
    {"userId", participant.user_id},
    {"connectionId", participant.connection_id},
    {"displayName", participant.display_name},
    {"role", to_string(participant.role)},
    {"joinedAt", participant.joined_at},
    {"isActive", participant.is_active}
  };
}

void to_json(json& j, const SessionSettings& settings) {
  json roles = json::array();
  for(auto role : settings.allowed_roles) roles.push_back(to_string(role));
  j = json{
    {"allowedRoles", roles},
    {"maxParticipants", settings.max_participants},
    {"autoSave", settings.auto_save},
    {"idleTimeoutSeconds", settings.idle_timeout_seconds}
  };
}

void to_json(json& j, const SessionStats& stats) {
  j = json{
    {"participants", stats.participants},
    {"operations", stats.operations},
    {"rejected", stats.rejected},
    {"headVersion", stats.head_version},
    {"durationSeconds", stats.duration_seconds}
  };
}

void to_json(json& j, const SessionInfo& info) {
  j = json{
    {"sessionId", info.session_id},
    {"workflowId", info.workflow_id},
    {"createdBy", info.created_by},
    {"participants", info.participants},
    {"settings", info.settings},
    {"state", to_string(info.state)},
    {"isActive", info.is_active()},
    {"headVersion", info.head_version},
    {"createdAt", info.created_at},
    {"lastActivity", info.last_activity}
  };
  if(info.ended_at != 0) j["endedAt"] = info.ended_at;
}

OperationPayload decode_payload(OperationType type, const json& j) {
  if(!j.is_object()) invalid("payload must be an object");
  switch(type) {
    case OperationType::NodeAdd: {
      auto node = j.find("node");
      if(node == j.end() || !node->is_object()) invalid("node_add payload needs 'node'");
      NodeAddPayload p;
      p.node.id = node->value("id", std::string());
      p.node.kind = node->value("kind", std::string());
      p.node.x = optional_number(*node, "x").value_or(0);
      p.node.y = optional_number(*node, "y").value_or(0);
      p.node.width = optional_number(*node, "width").value_or(0);
      p.node.height = optional_number(*node, "height").value_or(0);
      p.node.data = object_or_empty(*node, "data");
      return p;
    }
    case OperationType::NodeUpdate: {
      NodeUpdatePayload p;
      auto geometry = object_or_empty(j, "geometry");
      p.geometry.x = optional_number(geometry, "x");
      p.geometry.y = optional_number(geometry, "y");
      p.geometry.width = optional_number(geometry, "width");
      p.geometry.height = optional_number(geometry, "height");
      p.fields = object_or_empty(j, "fields");
      return p;
    }
    case OperationType::EdgeAdd: {
      auto edge = j.find("edge");
      if(edge == j.end() || !edge->is_object()) invalid("edge_add payload needs 'edge'");
      EdgeAddPayload p;
      p.edge.id = edge->value("id", std::string());
      p.edge.source = require_string(*edge, "source");
      p.edge.target = require_string(*edge, "target");
      p.edge.data = object_or_empty(*edge, "data");
      return p;
    }
    case OperationType::EdgeUpdate: {
      EdgeUpdatePayload p;
      p.source = optional_string(j, "source");
      p.target = optional_string(j, "target");
      p.fields = object_or_empty(j, "fields");
      return p;
    }
    case OperationType::PropertyUpdate: {
      PropertyUpdatePayload p;
      p.properties = object_or_empty(j, "properties");
      return p;
    }
    case OperationType::NodeDelete:
    case OperationType::EdgeDelete:
      return default_payload_for(type);
  }
  invalid("unsupported operation type");
}

Operation decode_operation(const json& j) {
  if(!j.is_object()) invalid("operation must be an object");
  try {
    Operation op;
    op.id = require_string(j, "id");
    op.workflow_id = j.value("workflowId", std::string());
    op.session_id = j.value("sessionId", std::string());
    op.author_id = j.value("authorId", std::string());

    auto type = operation_type_from_string(require_string(j, "type"));
    if(!type) invalid("unknown operation type '" + j.at("type").get<std::string>() + "'");
    op.type = *type;

    auto target = j.find("target");
    if(target == j.end() || !target->is_object()) invalid("missing 'target'");
    auto kind = target_kind_from_string(require_string(*target, "kind"));
    if(!kind) invalid("unknown target kind");
    op.target.kind = *kind;
    op.target.id = require_string(*target, "id");
    if(op.type != OperationType::PropertyUpdate && op.target.kind != expected_target_kind(op.type)) {
      invalid(std::string(to_string(op.type)) + " cannot target a " + to_string(op.target.kind));
    }

    op.payload = decode_payload(op.type, j.contains("payload") ? j.at("payload") : json::object());
    if(auto* add = op.payload_as<NodeAddPayload>()) {
      if(add->node.id.empty()) add->node.id = op.target.id;
      if(add->node.id != op.target.id) invalid("node id does not match target id");
    } else if(auto* add = op.payload_as<EdgeAddPayload>()) {
      if(add->edge.id.empty()) add->edge.id = op.target.id;
      if(add->edge.id != op.target.id) invalid("edge id does not match target id");
    }

    op.base_version = j.value("baseVersion", uint64_t{0});
    op.timestamp = j.value("timestamp", int64_t{0});
    op.status = OperationStatus::Pending;
    return op;
  } catch(const json::exception& e) {
    throw CollabError(ErrorCode::InvalidOperation, std::string("malformed operation: ") + e.what());
  }
}

Presence decode_presence(const json& j) {
  if(!j.is_object()) invalid("presence must be an object");
  try {
    Presence p;
    p.user_id = j.value("userId", std::string());
    p.session_id = j.value("sessionId", std::string());
    auto status = presence_status_from_string(j.value("status", std::string("online")));
    if(!status) invalid("unknown presence status");
    p.status = *status;
    if(auto cursor = j.find("cursor"); cursor != j.end() && cursor->is_object()) {
      Cursor c;
      c.x = optional_number(*cursor, "x").value_or(0);
      c.y = optional_number(*cursor, "y").value_or(0);
      c.node_id = optional_string(*cursor, "nodeId");
      p.cursor = c;
    }
    if(auto selection = j.find("selection"); selection != j.end() && selection->is_object()) {
      p.selection.node_ids = string_list(*selection, "nodeIds");
      p.selection.edge_ids = string_list(*selection, "edgeIds");
    }
    if(auto typing = j.find("typing"); typing != j.end() && typing->is_object()) {
      p.typing = Typing{typing->value("nodeId", std::string()), typing->value("field", std::string())};
    }
    p.updated_at = j.value("updatedAt", int64_t{0});
    return p;
  } catch(const json::exception& e) {
    throw CollabError(ErrorCode::InvalidOperation, std::string("malformed presence: ") + e.what());
  }
}

Participant decode_participant(const json& j) {
  if(!j.is_object()) invalid("participant must be an object");
  try {
    Participant p;
    p.user_id = require_string(j, "userId");
    p.display_name = j.value("displayName", p.user_id);
    auto role_name = j.value("role", std::string("editor"));
    auto role = role_from_string(role_name);
    if(!role) throw CollabError(ErrorCode::RoleNotAllowed, "unknown role '" + role_name + "'");
    p.role = *role;
    return p;
  } catch(const json::exception& e) {
    throw CollabError(ErrorCode::InvalidOperation, std::string("malformed participant: ") + e.what());
  }
}

SessionSettings decode_settings(const json& j, const SessionSettings& base) {
  if(!j.is_object()) throw CollabError(ErrorCode::InvalidSettings, "settings must be an object");
  SessionSettings out = base;
  try {
    if(auto roles = j.find("allowedRoles"); roles != j.end()) {
      if(!roles->is_array()) throw CollabError(ErrorCode::InvalidSettings, "allowedRoles must be an array");
      out.allowed_roles.clear();
      for(const auto& item : *roles) {
        auto role = item.is_string() ? role_from_string(item.get<std::string>()) : std::nullopt;
        if(!role) throw CollabError(ErrorCode::InvalidSettings, "unknown role " + item.dump());
        out.allowed_roles.push_back(*role);
      }
    }
    if(auto max = j.find("maxParticipants"); max != j.end()) {
      if(!max->is_number_integer() || max->get<int64_t>() < 0) {
        throw CollabError(ErrorCode::InvalidSettings, "maxParticipants must be a non-negative integer");
      }
      out.max_participants = max->get<std::size_t>();
    }
    if(auto save = j.find("autoSave"); save != j.end()) {
      if(!save->is_boolean()) throw CollabError(ErrorCode::InvalidSettings, "autoSave must be a boolean");
      out.auto_save = save->get<bool>();
    }
    if(auto idle = j.find("idleTimeoutSeconds"); idle != j.end()) {
      if(!idle->is_number_integer()) throw CollabError(ErrorCode::InvalidSettings, "idleTimeoutSeconds must be an integer");
      out.idle_timeout_seconds = idle->get<int64_t>();
    }
  } catch(const json::exception& e) {
    throw CollabError(ErrorCode::InvalidSettings, std::string("malformed settings: ") + e.what());
  }
  return out;
}

json make_session_joined(const SessionInfo& session,
                         const json& state,
                         const std::vector<Presence>& presence) {
  json j;
  j["type"] = "session_joined";
  j["session"] = session;
  j["state"] = state;
  j["presence"] = presence;
  j["headVersion"] = session.head_version;
  return j;
}

json make_session_left(const std::string& session_id, const std::string& user_id) {
  json j;
  j["type"] = "session_left";
  j["sessionId"] = session_id;
  j["userId"] = user_id;
  return j;
}

json make_operation_result(const Operation& op) {
  json j;
  j["type"] = "operation_result";
  j["status"] = op.status == OperationStatus::Rejected ? "rejected" : "committed";
  j["operation"] = op;
  if(op.status == OperationStatus::Rejected) {
    auto code = error_code_from_reason(op.reason);
    j["detail"] = {
      {"code", code ? to_string(*code) : op.reason},
      {"reason", op.reason},
      {"targetId", op.target.id},
      {"conflictingId", op.conflicting_id}
    };
  } else if(op.status == OperationStatus::Transformed) {
    j["detail"] = {{"winnerId", op.winner_id}, {"targetId", op.target.id}};
  }
  return j;
}

json make_operation_committed(const Operation& op) {
  json j;
  j["type"] = "operation_committed";
  j["operation"] = op;
  return j;
}

json make_operation_status(const Operation& op) {
  json j;
  j["type"] = "operation_status";
  j["operation"] = op;
  return j;
}

json make_conflict_detected(const std::string& session_id, const Conflict& conflict) {
  json j;
  j["type"] = "conflict_detected";
  j["sessionId"] = session_id;
  j["conflict"] = conflict;
  return j;
}

json make_presence_update(const Presence& presence) {
  json j;
  j["type"] = "presence_update";
  j["presence"] = presence;
  return j;
}

json make_participant_joined(const std::string& session_id, const Participant& participant) {
  json j;
  j["type"] = "participant_joined";
  j["sessionId"] = session_id;
  j["participant"] = participant;
  return j;
}

json make_participant_left(const std::string& session_id, const std::string& user_id) {
  json j;
  j["type"] = "participant_left";
  j["sessionId"] = session_id;
  j["userId"] = user_id;
  return j;
}

json make_session_ended(const std::string& session_id, const std::string& reason) {
  json j;
  j["type"] = "session_ended";
  j["sessionId"] = session_id;
  j["reason"] = reason;
  return j;
}

json make_settings_updated(const std::string& session_id, const SessionSettings& settings) {
  json j;
  j["type"] = "settings_updated";
  j["sessionId"] = session_id;
  j["settings"] = settings;
  return j;
}

json make_sync_response(const std::string& session_id,
                        const std::vector<Operation>& operations,
                        uint64_t head_version) {
  json j;
  j["type"] = "sync_response";
  j["sessionId"] = session_id;
  j["operations"] = operations;
  j["headVersion"] = head_version;
  return j;
}

json make_session_stats(const std::string& session_id, const SessionStats& stats) {
  json j;
  j["type"] = "session_stats";
  j["sessionId"] = session_id;
  j["stats"] = stats;
  return j;
}

json make_error(ErrorCode code, const std::string& message, const std::string& request_type) {
  json j;
  j["type"] = "error";
  j["code"] = to_string(code);
  j["message"] = message;
  if(!request_type.empty()) j["request"] = request_type;
  return j;
}
