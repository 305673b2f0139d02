#include "transform_engine.hpp"

#include <algorithm>
#include <set>

#include "errors.hpp"

namespace {

const LogEntry* find_entry(const std::vector<LogEntry>& window, const std::string& id) {
  for(const auto& entry : window) {
    if(entry.operation.id == id) return &entry;
  }
  return nullptr;
}

void reject(Operation& op, ErrorCode code, const std::string& conflicting_id) {
  op.status = OperationStatus::Rejected;
  op.reason = rejection_reason(code);
  op.conflicting_id = conflicting_id;
  op.winner_id.clear();
}

// Once the incoming operation is rejected nothing else it touched may change.
void settle_rejected(Resolution& r) {
  r.status_changes.clear();
  for(auto& c : r.conflicts) {
    if(c.resolution.empty()) c.resolution = "superseded";
  }
}

bool overlaps_any(const KeyPathMap& paths, const KeyPath& path) {
  for(const auto& [candidate, value] : paths) {
    if(paths_overlap(candidate, path)) return true;
  }
  return false;
}

bool is_compensation(const Operation& op) {
  return op.author_id == kSystemAuthor &&
         op.type == OperationType::NodeUpdate &&
         op.status != OperationStatus::Rejected;
}

bool is_live_move(const LogEntry& entry) {
  const auto& op = entry.operation;
  if(op.type != OperationType::NodeUpdate || op.author_id == kSystemAuthor) return false;
  if(op.status == OperationStatus::Rejected) return false;
  const auto* submitted = std::get_if<NodeUpdatePayload>(&entry.submitted);
  return submitted && submitted->geometry.moves();
}

// Values of `before` under every key `patch` touches, shaped so that a
// merge patch with the result undoes the original one.
nlohmann::json restore_keys(const nlohmann::json& before, const nlohmann::json& patch) {
  nlohmann::json out = nlohmann::json::object();
  if(!patch.is_object()) return out;
  for(const auto& [key, value] : patch.items()) {
    auto it = before.is_object() ? before.find(key) : before.end();
    if(before.is_object() && it != before.end()) {
      out[key] = (value.is_object() && it->is_object()) ? restore_keys(*it, value) : *it;
    } else {
      out[key] = nullptr;
    }
  }
  return out;
}

} // namespace

TransformEngine::TransformEngine(EngineConfig config) : config_(config) {}

Resolution TransformEngine::resolve(const Operation& incoming,
                                    const std::vector<LogEntry>& window,
                                    std::vector<Conflict> conflicts,
                                    const WorkflowState& state,
                                    const OperationLog& log) const {
  Resolution r;
  r.operation = incoming;
  r.operation.status = OperationStatus::Applied;
  r.operation.reason.clear();
  r.operation.winner_id.clear();
  r.operation.conflicting_id.clear();
  r.conflicts = std::move(conflicts);

  if(resolve_deletes(r, window) ||
     resolve_dependencies(r, window) ||
     validate_against_state(r, state, log)) {
    settle_rejected(r);
    return r;
  }

  merge_same_target(r, window, log);
  return r;
}

bool TransformEngine::resolve_deletes(Resolution& r, const std::vector<LogEntry>& window) const {
  for(auto& c : r.conflicts) {
    if(c.type != ConflictType::Delete) continue;
    const auto* entry = find_entry(window, c.operation_ids.front());
    if(!entry || !entry->operation.is_delete()) continue;
    reject(r.operation, ErrorCode::TargetDeleted, entry->operation.id);
    c.resolution = "delete-wins:" + entry->operation.id;
    return true;
  }

  for(auto& c : r.conflicts) {
    if(c.type != ConflictType::Delete) continue;
    const auto* entry = find_entry(window, c.operation_ids.front());
    if(!entry) continue;
    r.status_changes.push_back(StatusChange{entry->operation.id,
                                            OperationStatus::Rejected,
                                            rejection_reason(ErrorCode::TargetDeleted),
                                            r.operation.id});
    c.resolution = "delete-wins:" + r.operation.id;
  }
  return false;
}

bool TransformEngine::resolve_dependencies(Resolution& r, const std::vector<LogEntry>& window) const {
  for(auto& c : r.conflicts) {
    if(c.type != ConflictType::Dependency) continue;
    const auto* entry = find_entry(window, c.operation_ids.front());
    if(!entry) continue;
    if(r.operation.is_edge_write()) {
      reject(r.operation, ErrorCode::DanglingReference, entry->operation.id);
      c.resolution = "dangling-reference:" + r.operation.id;
      return true;
    }
    r.status_changes.push_back(StatusChange{entry->operation.id,
                                            OperationStatus::Rejected,
                                            rejection_reason(ErrorCode::DanglingReference),
                                            r.operation.id});
    c.resolution = "dangling-reference:" + entry->operation.id;
  }
  return false;
}

bool TransformEngine::validate_against_state(Resolution& r,
                                             const WorkflowState& state,
                                             const OperationLog& log) const {
  auto& op = r.operation;

  auto last_delete_of = [&](TargetKind kind, const std::string& id) {
    std::string found;
    for(const auto& prior : log.by_target(kind, id)) {
      if(prior.is_delete() && prior.status != OperationStatus::Rejected) found = prior.id;
    }
    return found;
  };

  // An edge without a delete of its own went away with one of its nodes.
  auto edge_removed_by = [&](const std::string& edge_id) {
    std::string found = last_delete_of(TargetKind::Edge, edge_id);
    if(!found.empty()) return found;
    for(const auto& node_id : log.edge_endpoints(edge_id)) {
      if(state.has_node(node_id)) continue;
      found = last_delete_of(TargetKind::Node, node_id);
      if(!found.empty()) break;
    }
    return found;
  };

  auto missing_endpoint = [&]() -> std::optional<std::string> {
    for(const auto& node_id : payload_endpoints(op)) {
      if(!state.has_node(node_id)) return node_id;
    }
    return std::nullopt;
  };

  if(op.is_add()) {
    if(state.has(op.target)) {
      reject(op, ErrorCode::DuplicateTarget, "");
      return true;
    }
    if(op.type == OperationType::EdgeAdd) {
      if(auto node_id = missing_endpoint()) {
        reject(op, ErrorCode::DanglingReference, last_delete_of(TargetKind::Node, *node_id));
        return true;
      }
    }
    return false;
  }

  if(!state.has(op.target)) {
    auto history = log.by_target(op.target.kind, op.target.id);
    if(history.empty()) {
      reject(op, ErrorCode::UnknownTarget, "");
    } else if(op.target.kind == TargetKind::Edge) {
      reject(op, ErrorCode::TargetDeleted, edge_removed_by(op.target.id));
    } else {
      reject(op, ErrorCode::TargetDeleted, last_delete_of(op.target.kind, op.target.id));
    }
    return true;
  }

  if(op.type == OperationType::EdgeUpdate) {
    if(auto node_id = missing_endpoint()) {
      reject(op, ErrorCode::DanglingReference, last_delete_of(TargetKind::Node, *node_id));
      return true;
    }
  }
  return false;
}

void TransformEngine::merge_same_target(Resolution& r,
                                        const std::vector<LogEntry>& window,
                                        const OperationLog& log) const {
  struct Candidate {
    const Operation* op = nullptr;
    KeyPathMap paths;
    bool incoming = false;
  };

  std::vector<Candidate> candidates;
  candidates.push_back(Candidate{&r.operation, key_paths(r.operation.payload), true});
  for(const auto& c : r.conflicts) {
    if(c.type != ConflictType::SameTargetUpdate) continue;
    const auto* entry = find_entry(window, c.operation_ids.front());
    if(!entry) continue;
    candidates.push_back(Candidate{&entry->operation, key_paths(entry->submitted), false});
  }
  if(candidates.size() < 2) return;

  // Paths the engine itself rewrote after the fact; earlier author values
  // must not be replayed over them.
  KeyPathMap system_paths;
  for(const auto& entry : window) {
    if(entry.operation.author_id != kSystemAuthor) continue;
    if(entry.operation.target != r.operation.target) continue;
    for(auto& [path, value] : key_paths(entry.submitted)) system_paths[path] = value;
  }

  auto owner_of = [&](const KeyPath& path) -> const Candidate* {
    const Candidate* best = nullptr;
    for(const auto& c : candidates) {
      if(!overlaps_any(c.paths, path)) continue;
      if(!best || best->op->precedes(*c.op)) best = &c;
    }
    return best;
  };

  KeyPathMap merged;
  const Operation* incoming_winner = nullptr;
  std::set<std::string> beat_incoming;
  std::set<std::string> lost_to_incoming;

  for(const auto& c : candidates) {
    for(const auto& [path, value] : c.paths) {
      const Candidate* owner = owner_of(path);
      if(owner == &c) {
        if(c.incoming) {
          merged[path] = value;
        } else if(c.op->type == r.operation.type && !overlaps_any(system_paths, path)) {
          merged[path] = value;
        }
        continue;
      }
      if(c.incoming) {
        beat_incoming.insert(owner->op->id);
        if(!incoming_winner || incoming_winner->precedes(*owner->op)) incoming_winner = owner->op;
      } else if(owner->incoming) {
        lost_to_incoming.insert(c.op->id);
      }
    }
  }

  std::string winner_id = incoming_winner ? incoming_winner->id : std::string();
  r.operation.payload = payload_from_key_paths(r.operation.type, merged);
  if(!winner_id.empty()) {
    r.operation.status = OperationStatus::Transformed;
    r.operation.winner_id = winner_id;
  }

  for(const auto& loser_id : lost_to_incoming) {
    std::string winner = r.operation.id;
    auto existing = log.find(loser_id);
    if(existing && existing->status == OperationStatus::Transformed && !existing->winner_id.empty()) {
      auto prior = log.find(existing->winner_id);
      if(prior && r.operation.precedes(*prior)) winner = prior->id;
    }
    r.status_changes.push_back(StatusChange{loser_id, OperationStatus::Transformed, "", winner});
  }

  for(auto& c : r.conflicts) {
    if(c.type != ConflictType::SameTargetUpdate) continue;
    const auto& other_id = c.operation_ids.front();
    if(lost_to_incoming.count(other_id)) {
      c.resolution = "winner:" + r.operation.id;
    } else if(beat_incoming.count(other_id)) {
      c.resolution = "winner:" + other_id;
    } else {
      c.resolution = "merged";
    }
  }
}

uint64_t TransformEngine::placement_base(const OperationLog& log, uint64_t base_version) const {
  // Widen the window until every live compensation in it has its causes in
  // it as well.
  uint64_t base = base_version;
  for(;;) {
    uint64_t lowest = base;
    for(const auto& entry : log.window_after(base)) {
      if(is_compensation(entry.operation)) lowest = std::min(lowest, entry.operation.base_version);
    }
    if(lowest == base) return base;
    base = lowest;
  }
}

Placement TransformEngine::place(const OperationLog& log,
                                 const WorkflowState& state,
                                 uint64_t base_version) const {
  Placement out;
  out.base_version = placement_base(log, base_version);
  const auto window = log.window_after(out.base_version);

  // Latest live move per node decides whose region the node occupies.
  std::map<std::string, const Operation*> latest;
  std::vector<const Operation*> compensations;
  for(const auto& entry : window) {
    if(is_compensation(entry.operation)) {
      compensations.push_back(&entry.operation);
      continue;
    }
    if(!is_live_move(entry)) continue;
    auto& slot = latest[entry.operation.target.id];
    if(!slot || slot->precedes(entry.operation)) slot = &entry.operation;
  }

  struct Member {
    const Operation* move = nullptr;
    Rect authored;
  };
  std::vector<Member> members;
  for(const auto& [node_id, move] : latest) {
    // Where authors alone put the node: committed history without the
    // compensations this placement is about to recompute.
    std::vector<Operation> history;
    for(auto& op : log.by_target(TargetKind::Node, node_id)) {
      if(op.author_id == kSystemAuthor && op.committed_version > out.base_version) continue;
      history.push_back(std::move(op));
    }
    auto authored = WorkflowState::replay(history, state.default_node_width(), state.default_node_height());
    const auto* node = authored.node(node_id);
    if(!node) continue;
    members.push_back(Member{move, Rect{node->x, node->y, node->width, node->height}});
  }

  // Highest (timestamp, authorId) keeps its spot; every lower move clears
  // the regions placed before it.
  std::sort(members.begin(), members.end(), [](const Member& a, const Member& b) {
    return b.move->precedes(*a.move);
  });

  struct Placed {
    Rect rect;
    const std::string* author;
  };
  std::vector<Placed> placed;
  for(const auto& m : members) {
    Rect rect = m.authored;
    auto first_hit = [&]() {
      return std::find_if(placed.begin(), placed.end(),
                          [&](const Placed& p){ return rect.overlaps(p.rect); });
    };
    auto hit = first_hit();
    if(hit != placed.end()) {
      // Left when this author sorts before the one it collided with. The
      // direction is kept while clearing further regions.
      const bool leftward = m.move->author_id < *hit->author;
      while(hit != placed.end()) {
        rect.x = leftward ? hit->rect.x - rect.width - config_.position_gap
                          : hit->rect.x + hit->rect.width + config_.position_gap;
        hit = first_hit();
      }
    }
    placed.push_back(Placed{rect, &m.move->author_id});
    if(rect.x != m.authored.x) out.shifted[m.move->target.id] = rect.x;
  }

  bool settled = true;
  for(const auto& m : members) {
    const auto* node = state.node(m.move->target.id);
    auto it = out.shifted.find(m.move->target.id);
    const double expected = it != out.shifted.end() ? it->second : m.authored.x;
    if(!node || node->x != expected) settled = false;
  }
  for(const auto* c : compensations) {
    if(!out.shifted.count(c->target.id)) settled = false;
  }
  if(settled) return out;

  for(const auto* c : compensations) out.retired.push_back(c->id);

  std::set<std::string> taken;
  for(const auto& m : members) {
    auto it = out.shifted.find(m.move->target.id);
    if(it == out.shifted.end()) continue;
    const auto& loser = *m.move;

    Operation nudge;
    nudge.id = loser.id + "~nudge";
    for(int n = 2; log.contains(nudge.id) || taken.count(nudge.id); ++n) {
      nudge.id = loser.id + "~nudge" + std::to_string(n);
    }
    taken.insert(nudge.id);
    nudge.session_id = loser.session_id;
    nudge.workflow_id = loser.workflow_id;
    nudge.author_id = kSystemAuthor;
    nudge.type = OperationType::NodeUpdate;
    nudge.target = loser.target;
    NodeUpdatePayload shift;
    shift.geometry.x = it->second;
    nudge.payload = shift;
    nudge.base_version = out.base_version;
    nudge.status = OperationStatus::Applied;
    nudge.timestamp = loser.timestamp;
    out.nudges.push_back(std::move(nudge));
  }
  return out;
}

void TransformEngine::describe_positions(Resolution& r,
                                         const std::vector<LogEntry>& window,
                                         const Placement& placement) const {
  for(auto& c : r.conflicts) {
    if(c.type != ConflictType::Position) continue;
    const auto* entry = find_entry(window, c.operation_ids.front());
    if(!entry) continue;
    const auto& lower = r.operation.precedes(entry->operation) ? r.operation : entry->operation;
    c.resolution = placement.shifted.count(lower.target.id) ? "nudged:" + lower.id : "separated";
  }
}

std::optional<Operation> TransformEngine::inverse_of(const Operation& done, const WorkflowState& before) const {
  Operation inverse;
  inverse.id = done.id + "~undo";
  inverse.session_id = done.session_id;
  inverse.workflow_id = done.workflow_id;
  inverse.author_id = done.author_id;
  inverse.target = done.target;

  switch(done.type) {
    case OperationType::NodeAdd:
      inverse.type = OperationType::NodeDelete;
      inverse.payload = NodeDeletePayload{};
      break;
    case OperationType::EdgeAdd:
      inverse.type = OperationType::EdgeDelete;
      inverse.payload = EdgeDeletePayload{};
      break;
    case OperationType::NodeDelete: {
      const auto* node = before.node(done.target.id);
      if(!node) return std::nullopt;
      NodeAddPayload add;
      add.node = NodeSpec{node->id, node->kind, node->x, node->y, node->width, node->height, node->data};
      inverse.type = OperationType::NodeAdd;
      inverse.payload = add;
      break;
    }
    case OperationType::EdgeDelete: {
      const auto* edge = before.edge(done.target.id);
      if(!edge) return std::nullopt;
      EdgeAddPayload add;
      add.edge = EdgeSpec{edge->id, edge->source, edge->target, edge->data};
      inverse.type = OperationType::EdgeAdd;
      inverse.payload = add;
      break;
    }
    case OperationType::NodeUpdate: {
      const auto* node = before.node(done.target.id);
      const auto* update = done.payload_as<NodeUpdatePayload>();
      if(!node || !update) return std::nullopt;
      NodeUpdatePayload revert;
      if(update->geometry.x) revert.geometry.x = node->x;
      if(update->geometry.y) revert.geometry.y = node->y;
      if(update->geometry.width) revert.geometry.width = node->width;
      if(update->geometry.height) revert.geometry.height = node->height;
      revert.fields = restore_keys(node->data, update->fields);
      inverse.type = OperationType::NodeUpdate;
      inverse.payload = revert;
      break;
    }
    case OperationType::EdgeUpdate: {
      const auto* edge = before.edge(done.target.id);
      const auto* update = done.payload_as<EdgeUpdatePayload>();
      if(!edge || !update) return std::nullopt;
      EdgeUpdatePayload revert;
      if(update->source) revert.source = edge->source;
      if(update->target) revert.target = edge->target;
      revert.fields = restore_keys(edge->data, update->fields);
      inverse.type = OperationType::EdgeUpdate;
      inverse.payload = revert;
      break;
    }
    case OperationType::PropertyUpdate: {
      const auto* update = done.payload_as<PropertyUpdatePayload>();
      if(!update) return std::nullopt;
      const nlohmann::json* data = nullptr;
      if(done.target.kind == TargetKind::Node) {
        if(const auto* node = before.node(done.target.id)) data = &node->data;
      } else if(const auto* edge = before.edge(done.target.id)) {
        data = &edge->data;
      }
      if(!data) return std::nullopt;
      PropertyUpdatePayload revert;
      revert.properties = restore_keys(*data, update->properties);
      inverse.type = OperationType::PropertyUpdate;
      inverse.payload = revert;
      break;
    }
  }
  return inverse;
}
