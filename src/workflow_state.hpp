#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "operation.hpp"

struct NodeState {
  std::string id;
  std::string kind;
  double x = 0;
  double y = 0;
  double width = 0;
  double height = 0;
  nlohmann::json data = nlohmann::json::object();
};

struct EdgeState {
  std::string id;
  std::string source;
  std::string target;
  nlohmann::json data = nlohmann::json::object();
};

// Materialized workflow graph. Ordered maps keep to_json() stable so two
// states can be compared by value.
class WorkflowState {
public:
  WorkflowState(double default_node_width = 200, double default_node_height = 80);

  bool has_node(const std::string& id) const { return nodes_.count(id) > 0; }
  bool has_edge(const std::string& id) const { return edges_.count(id) > 0; }
  bool has(const Target& target) const;

  const NodeState* node(const std::string& id) const;
  const EdgeState* edge(const std::string& id) const;

  // Bounding region a node_update payload would leave its node in. Missing
  // axes come from the current node, then from the configured defaults.
  Rect region_after(const Target& target, const NodeUpdatePayload& update) const;

  // Edge endpoints after the edge operation lands (payload first, then state).
  std::vector<std::string> endpoints_after(const Operation& op) const;

  // Applies a committed operation. Rejected operations are ignored.
  void apply(const Operation& op);

  // Replays a committed sequence from an empty graph.
  static WorkflowState replay(const std::vector<Operation>& committed,
                              double default_node_width = 200,
                              double default_node_height = 80);

  double default_node_width() const { return default_node_width_; }
  double default_node_height() const { return default_node_height_; }

  std::size_t node_count() const { return nodes_.size(); }
  std::size_t edge_count() const { return edges_.size(); }

  nlohmann::json to_json() const;

  bool operator==(const WorkflowState& other) const { return to_json() == other.to_json(); }
  bool operator!=(const WorkflowState& other) const { return !(*this == other); }

private:
  void remove_node(const std::string& id);

  double default_node_width_;
  double default_node_height_;
  std::map<std::string, NodeState> nodes_;
  std::map<std::string, EdgeState> edges_;
};
