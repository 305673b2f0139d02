#include "workflow_state.hpp"

WorkflowState::WorkflowState(double default_node_width, double default_node_height)
  : default_node_width_(default_node_width),
    default_node_height_(default_node_height) {}

bool WorkflowState::has(const Target& target) const {
  return target.kind == TargetKind::Node ? has_node(target.id) : has_edge(target.id);
}

const NodeState* WorkflowState::node(const std::string& id) const {
  auto it = nodes_.find(id);
  return it == nodes_.end() ? nullptr : &it->second;
}

const EdgeState* WorkflowState::edge(const std::string& id) const {
  auto it = edges_.find(id);
  return it == edges_.end() ? nullptr : &it->second;
}

Rect WorkflowState::region_after(const Target& target, const NodeUpdatePayload& update) const {
  Rect rect;
  rect.width = default_node_width_;
  rect.height = default_node_height_;
  if(const auto* current = node(target.id)) {
    rect.x = current->x;
    rect.y = current->y;
    if(current->width > 0) rect.width = current->width;
    if(current->height > 0) rect.height = current->height;
  }
  const auto& g = update.geometry;
  if(g.x) rect.x = *g.x;
  if(g.y) rect.y = *g.y;
  if(g.width) rect.width = *g.width;
  if(g.height) rect.height = *g.height;
  return rect;
}

std::vector<std::string> WorkflowState::endpoints_after(const Operation& op) const {
  if(op.type == OperationType::EdgeAdd) return payload_endpoints(op);
  std::vector<std::string> out;
  const auto* current = (op.target.kind == TargetKind::Edge) ? edge(op.target.id) : nullptr;
  const auto* update = op.payload_as<EdgeUpdatePayload>();
  if(update && update->source) {
    out.push_back(*update->source);
  } else if(current) {
    out.push_back(current->source);
  }
  if(update && update->target) {
    out.push_back(*update->target);
  } else if(current) {
    out.push_back(current->target);
  }
  return out;
}

void WorkflowState::remove_node(const std::string& id) {
  nodes_.erase(id);
  for(auto it = edges_.begin(); it != edges_.end();) {
    if(it->second.source == id || it->second.target == id) {
      it = edges_.erase(it);
    } else {
      ++it;
    }
  }
}

void WorkflowState::apply(const Operation& op) {
  if(op.status == OperationStatus::Rejected) return;

  switch(op.type) {
    case OperationType::NodeAdd: {
      const auto* add = op.payload_as<NodeAddPayload>();
      if(!add) return;
      NodeState n;
      n.id = op.target.id;
      n.kind = add->node.kind;
      n.x = add->node.x;
      n.y = add->node.y;
      n.width = add->node.width > 0 ? add->node.width : default_node_width_;
      n.height = add->node.height > 0 ? add->node.height : default_node_height_;
      n.data = add->node.data.is_object() ? add->node.data : nlohmann::json::object();
      nodes_[n.id] = std::move(n);
      break;
    }
    case OperationType::NodeUpdate: {
      auto it = nodes_.find(op.target.id);
      const auto* update = op.payload_as<NodeUpdatePayload>();
      if(it == nodes_.end() || !update) return;
      auto& n = it->second;
      const auto& g = update->geometry;
      if(g.x) n.x = *g.x;
      if(g.y) n.y = *g.y;
      if(g.width) n.width = *g.width;
      if(g.height) n.height = *g.height;
      n.data.merge_patch(update->fields);
      break;
    }
    case OperationType::NodeDelete:
      remove_node(op.target.id);
      break;
    case OperationType::EdgeAdd: {
      const auto* add = op.payload_as<EdgeAddPayload>();
      if(!add) return;
      if(!has_node(add->edge.source) || !has_node(add->edge.target)) return;
      EdgeState e;
      e.id = op.target.id;
      e.source = add->edge.source;
      e.target = add->edge.target;
      e.data = add->edge.data.is_object() ? add->edge.data : nlohmann::json::object();
      edges_[e.id] = std::move(e);
      break;
    }
    case OperationType::EdgeUpdate: {
      auto it = edges_.find(op.target.id);
      const auto* update = op.payload_as<EdgeUpdatePayload>();
      if(it == edges_.end() || !update) return;
      if(update->source) it->second.source = *update->source;
      if(update->target) it->second.target = *update->target;
      it->second.data.merge_patch(update->fields);
      break;
    }
    case OperationType::EdgeDelete:
      edges_.erase(op.target.id);
      break;
    case OperationType::PropertyUpdate: {
      const auto* update = op.payload_as<PropertyUpdatePayload>();
      if(!update) return;
      if(op.target.kind == TargetKind::Node) {
        auto it = nodes_.find(op.target.id);
        if(it != nodes_.end()) it->second.data.merge_patch(update->properties);
      } else {
        auto it = edges_.find(op.target.id);
        if(it != edges_.end()) it->second.data.merge_patch(update->properties);
      }
      break;
    }
  }
}

WorkflowState WorkflowState::replay(const std::vector<Operation>& committed,
                                    double default_node_width,
                                    double default_node_height) {
  WorkflowState state(default_node_width, default_node_height);
  for(const auto& op : committed) {
    state.apply(op);
  }
  return state;
}

nlohmann::json WorkflowState::to_json() const {
  nlohmann::json nodes = nlohmann::json::array();
  for(const auto& [id, n] : nodes_) {
    nodes.push_back({
      {"id", n.id},
      {"kind", n.kind},
      {"x", n.x},
      {"y", n.y},
      {"width", n.width},
      {"height", n.height},
      {"data", n.data}
    });
  }
  nlohmann::json edges = nlohmann::json::array();
  for(const auto& [id, e] : edges_) {
    edges.push_back({
      {"id", e.id},
      {"source", e.source},
      {"target", e.target},
      {"data", e.data}
    });
  }
  return {{"nodes", std::move(nodes)}, {"edges", std::move(edges)}};
}
