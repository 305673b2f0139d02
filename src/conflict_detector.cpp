#include "conflict_detector.hpp"

#include <algorithm>

namespace {

bool contains(const std::vector<std::string>& ids, const std::string& id) {
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

// Endpoints an edge entry names in its submitted payload.
std::vector<std::string> submitted_endpoints(const LogEntry& entry) {
  Operation as_submitted = entry.operation;
  as_submitted.payload = entry.submitted;
  return payload_endpoints(as_submitted);
}

// Nodes an edge is attached to. Falls back to the log once a node delete has
// already taken the edge out of the state.
std::vector<std::string> attached_nodes(const WorkflowState& state,
                                        const OperationLog& log,
                                        const std::string& edge_id) {
  if(const auto* e = state.edge(edge_id)) return {e->source, e->target};
  return log.edge_endpoints(edge_id);
}

bool names_endpoint(const Operation& op, const std::string& node_id) {
  return contains(payload_endpoints(op), node_id);
}

} // namespace

const char* to_string(ConflictType type) {
  switch(type) {
    case ConflictType::SameTargetUpdate: return "same-target-update";
    case ConflictType::Position:         return "position";
    case ConflictType::Dependency:       return "dependency";
    case ConflictType::Delete:           return "delete";
  }
  return "unknown";
}

bool ConflictDetector::is_delete_pair(const Operation& incoming, const LogEntry& entry,
                                      const WorkflowState& state, const OperationLog& log) {
  const auto& other = entry.operation;
  if(other.is_delete() && other.target == incoming.target) {
    return incoming.is_update() || incoming.is_add() || incoming.is_delete();
  }
  if(incoming.is_delete() && other.target == incoming.target) {
    return other.is_update();
  }
  // A node delete removes attached edges, so a property write to such an
  // edge loses its target.
  if(incoming.type == OperationType::NodeDelete &&
     other.type == OperationType::PropertyUpdate &&
     other.target.kind == TargetKind::Edge) {
    return contains(attached_nodes(state, log, other.target.id), incoming.target.id);
  }
  if(other.type == OperationType::NodeDelete &&
     incoming.type == OperationType::PropertyUpdate &&
     incoming.target.kind == TargetKind::Edge) {
    return contains(attached_nodes(state, log, incoming.target.id), other.target.id);
  }
  return false;
}

bool ConflictDetector::is_dependency_pair(const Operation& incoming, const LogEntry& entry,
                                          const WorkflowState& state, const OperationLog& log) {
  const auto& other = entry.operation;
  if(incoming.is_edge_write() && other.type == OperationType::NodeDelete) {
    const auto& node_id = other.target.id;
    if(names_endpoint(incoming, node_id)) return true;
    return incoming.type == OperationType::EdgeUpdate &&
           contains(attached_nodes(state, log, incoming.target.id), node_id);
  }
  if(incoming.type == OperationType::NodeDelete && other.is_edge_write()) {
    const auto& node_id = incoming.target.id;
    return contains(submitted_endpoints(entry), node_id) ||
           contains(attached_nodes(state, log, other.target.id), node_id);
  }
  return false;
}

bool ConflictDetector::is_same_target_pair(const Operation& incoming, const LogEntry& entry) {
  return incoming.is_update() && entry.operation.is_update() &&
         incoming.target == entry.operation.target;
}

bool ConflictDetector::is_position_pair(const Operation& incoming, const LogEntry& entry, const WorkflowState& state) {
  const auto& other = entry.operation;
  if(incoming.type != OperationType::NodeUpdate || other.type != OperationType::NodeUpdate) return false;
  if(incoming.target == other.target) return false;
  const auto* mine = incoming.payload_as<NodeUpdatePayload>();
  const auto* theirs = std::get_if<NodeUpdatePayload>(&entry.submitted);
  if(!mine || !theirs) return false;
  if(!mine->geometry.moves() || !theirs->geometry.moves()) return false;
  if(!state.has_node(other.target.id)) return false;
  Rect a = state.region_after(incoming.target, *mine);
  Rect b = state.region_after(other.target, NodeUpdatePayload{});
  return a.overlaps(b);
}

std::optional<ConflictType> ConflictDetector::classify(const Operation& incoming,
                                                       const LogEntry& entry,
                                                       const WorkflowState& state,
                                                       const OperationLog& log) const {
  if(entry.operation.status == OperationStatus::Rejected) return std::nullopt;
  if(entry.operation.author_id == kSystemAuthor) return std::nullopt;
  if(entry.operation.id == incoming.id) return std::nullopt;

  if(is_delete_pair(incoming, entry, state, log)) return ConflictType::Delete;
  if(is_dependency_pair(incoming, entry, state, log)) return ConflictType::Dependency;
  if(is_same_target_pair(incoming, entry)) return ConflictType::SameTargetUpdate;
  if(is_position_pair(incoming, entry, state)) return ConflictType::Position;
  return std::nullopt;
}

std::vector<Conflict> ConflictDetector::detect(const Operation& incoming,
                                               const std::vector<LogEntry>& window,
                                               const WorkflowState& state,
                                               const OperationLog& log) const {
  std::vector<Conflict> out;
  for(const auto& entry : window) {
    auto type = classify(incoming, entry, state, log);
    if(!type) continue;
    Conflict c;
    c.id = "conflict-" + incoming.id + "-" + std::to_string(out.size() + 1);
    c.operation_ids = {entry.operation.id, incoming.id};
    c.type = *type;
    out.push_back(std::move(c));
  }
  return out;
}
