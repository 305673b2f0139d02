#include "operation.hpp"

#include <array>
#include <algorithm>
#include <sstream>

namespace {

constexpr std::array<const char*, 7> kTypeNames = {
  "node_add", "node_update", "node_delete",
  "edge_add", "edge_update", "edge_delete",
  "property_update"
};

constexpr std::array<const char*, 4> kStatusNames = {
  "pending", "applied", "transformed", "rejected"
};

constexpr std::array<const char*, 2> kKindNames = { "node", "edge" };

template<typename Enum, std::size_t N>
std::optional<Enum> lookup(const std::array<const char*, N>& names, const std::string& value) {
  for(std::size_t i = 0; i < names.size(); ++i) {
    if(value == names[i]) return static_cast<Enum>(i);
  }
  return std::nullopt;
}

const char* kGeometry = "geometry";
const char* kData = "data";

void flatten_under(const char* root, const nlohmann::json& value, KeyPathMap& out) {
  KeyPath prefix{root};
  flatten_json(value, prefix, out);
}

std::optional<double> take_number(const KeyPathMap& paths, const char* axis) {
  auto it = paths.find(KeyPath{kGeometry, axis});
  if(it == paths.end() || !it->second.is_number()) return std::nullopt;
  return it->second.get<double>();
}

nlohmann::json rebuild_data(const KeyPathMap& paths) {
  nlohmann::json out = nlohmann::json::object();
  for(const auto& [path, value] : paths) {
    if(path.size() < 2 || path.front() != kData) continue;
    assign_path(out, KeyPath(path.begin() + 1, path.end()), value);
  }
  return out;
}

} // namespace

const char* to_string(OperationType type) {
  return kTypeNames[static_cast<std::size_t>(type)];
}

const char* to_string(OperationStatus status) {
  return kStatusNames[static_cast<std::size_t>(status)];
}

const char* to_string(TargetKind kind) {
  return kKindNames[static_cast<std::size_t>(kind)];
}

std::optional<OperationType> operation_type_from_string(const std::string& value) {
  return lookup<OperationType>(kTypeNames, value);
}

std::optional<OperationStatus> operation_status_from_string(const std::string& value) {
  return lookup<OperationStatus>(kStatusNames, value);
}

std::optional<TargetKind> target_kind_from_string(const std::string& value) {
  return lookup<TargetKind>(kKindNames, value);
}

OperationPayload default_payload_for(OperationType type) {
  switch(type) {
    case OperationType::NodeAdd:        return NodeAddPayload{};
    case OperationType::NodeUpdate:     return NodeUpdatePayload{};
    case OperationType::NodeDelete:     return NodeDeletePayload{};
    case OperationType::EdgeAdd:        return EdgeAddPayload{};
    case OperationType::EdgeUpdate:     return EdgeUpdatePayload{};
    case OperationType::EdgeDelete:     return EdgeDeletePayload{};
    case OperationType::PropertyUpdate: return PropertyUpdatePayload{};
  }
  return NodeDeletePayload{};
}

OperationType payload_type(const OperationPayload& payload) {
  return static_cast<OperationType>(payload.index());
}

TargetKind expected_target_kind(OperationType type) {
  switch(type) {
    case OperationType::EdgeAdd:
    case OperationType::EdgeUpdate:
    case OperationType::EdgeDelete:
      return TargetKind::Edge;
    default:
      return TargetKind::Node;
  }
}

std::vector<std::string> payload_endpoints(const Operation& op) {
  std::vector<std::string> out;
  if(const auto* add = op.payload_as<EdgeAddPayload>()) {
    out.push_back(add->edge.source);
    out.push_back(add->edge.target);
  } else if(const auto* update = op.payload_as<EdgeUpdatePayload>()) {
    if(update->source) out.push_back(*update->source);
    if(update->target) out.push_back(*update->target);
  }
  return out;
}

std::string to_string(const KeyPath& path) {
  std::ostringstream oss;
  for(std::size_t i = 0; i < path.size(); ++i) {
    if(i > 0) oss << '.';
    oss << path[i];
  }
  return oss.str();
}

bool paths_overlap(const KeyPath& a, const KeyPath& b) {
  const auto n = std::min(a.size(), b.size());
  for(std::size_t i = 0; i < n; ++i) {
    if(a[i] != b[i]) return false;
  }
  return true;
}

void flatten_json(const nlohmann::json& value, KeyPath& prefix, KeyPathMap& out) {
  if(value.is_object() && !value.empty()) {
    for(const auto& item : value.items()) {
      prefix.push_back(item.key());
      flatten_json(item.value(), prefix, out);
      prefix.pop_back();
    }
    return;
  }
  if(value.is_object()) return;
  out[prefix] = value;
}

void assign_path(nlohmann::json& root, const KeyPath& path, const nlohmann::json& value) {
  if(path.empty()) {
    root = value;
    return;
  }
  nlohmann::json* cursor = &root;
  for(std::size_t i = 0; i + 1 < path.size(); ++i) {
    if(!cursor->is_object()) *cursor = nlohmann::json::object();
    cursor = &(*cursor)[path[i]];
  }
  if(!cursor->is_object()) *cursor = nlohmann::json::object();
  (*cursor)[path.back()] = value;
}

KeyPathMap key_paths(const OperationPayload& payload) {
  KeyPathMap out;
  if(const auto* node = std::get_if<NodeUpdatePayload>(&payload)) {
    const auto& g = node->geometry;
    if(g.x) out[{kGeometry, "x"}] = *g.x;
    if(g.y) out[{kGeometry, "y"}] = *g.y;
    if(g.width) out[{kGeometry, "width"}] = *g.width;
    if(g.height) out[{kGeometry, "height"}] = *g.height;
    flatten_under(kData, node->fields, out);
  } else if(const auto* edge = std::get_if<EdgeUpdatePayload>(&payload)) {
    if(edge->source) out[{"source"}] = *edge->source;
    if(edge->target) out[{"target"}] = *edge->target;
    flatten_under(kData, edge->fields, out);
  } else if(const auto* props = std::get_if<PropertyUpdatePayload>(&payload)) {
    flatten_under(kData, props->properties, out);
  }
  return out;
}

OperationPayload payload_from_key_paths(OperationType type, const KeyPathMap& paths) {
  switch(type) {
    case OperationType::NodeUpdate: {
      NodeUpdatePayload out;
      out.geometry.x = take_number(paths, "x");
      out.geometry.y = take_number(paths, "y");
      out.geometry.width = take_number(paths, "width");
      out.geometry.height = take_number(paths, "height");
      out.fields = rebuild_data(paths);
      return out;
    }
    case OperationType::EdgeUpdate: {
      EdgeUpdatePayload out;
      auto source = paths.find(KeyPath{"source"});
      if(source != paths.end() && source->second.is_string()) out.source = source->second.get<std::string>();
      auto target = paths.find(KeyPath{"target"});
      if(target != paths.end() && target->second.is_string()) out.target = target->second.get<std::string>();
      out.fields = rebuild_data(paths);
      return out;
    }
    case OperationType::PropertyUpdate: {
      PropertyUpdatePayload out;
      out.properties = rebuild_data(paths);
      return out;
    }
    default:
      return default_payload_for(type);
  }
}
