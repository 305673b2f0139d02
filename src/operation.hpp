#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class OperationType {
  NodeAdd,
  NodeUpdate,
  NodeDelete,
  EdgeAdd,
  EdgeUpdate,
  EdgeDelete,
  PropertyUpdate
};

enum class OperationStatus { Pending, Applied, Transformed, Rejected };

enum class TargetKind { Node, Edge };

const char* to_string(OperationType type);
const char* to_string(OperationStatus status);
const char* to_string(TargetKind kind);
std::optional<OperationType> operation_type_from_string(const std::string& value);
std::optional<OperationStatus> operation_status_from_string(const std::string& value);
std::optional<TargetKind> target_kind_from_string(const std::string& value);

// Author id used for operations the transform engine derives on its own.
inline constexpr const char* kSystemAuthor = "system";

struct Target {
  TargetKind kind = TargetKind::Node;
  std::string id;

  bool operator==(const Target& other) const { return kind == other.kind && id == other.id; }
  bool operator!=(const Target& other) const { return !(*this == other); }
};

struct Rect {
  double x = 0;
  double y = 0;
  double width = 0;
  double height = 0;

  // Strict overlap: touching edges do not count.
  bool overlaps(const Rect& other) const {
    return x < other.x + other.width && other.x < x + width &&
           y < other.y + other.height && other.y < y + height;
  }
};

struct Geometry {
  std::optional<double> x;
  std::optional<double> y;
  std::optional<double> width;
  std::optional<double> height;

  bool moves() const { return x.has_value() || y.has_value(); }
  bool empty() const { return !x && !y && !width && !height; }
};

struct NodeSpec {
  std::string id;
  std::string kind;
  double x = 0;
  double y = 0;
  double width = 0;
  double height = 0;
  nlohmann::json data = nlohmann::json::object();
};

struct EdgeSpec {
  std::string id;
  std::string source;
  std::string target;
  nlohmann::json data = nlohmann::json::object();
};

struct NodeAddPayload { NodeSpec node; };

struct NodeUpdatePayload {
  Geometry geometry;
  nlohmann::json fields = nlohmann::json::object();
};

struct NodeDeletePayload {};

struct EdgeAddPayload { EdgeSpec edge; };

struct EdgeUpdatePayload {
  std::optional<std::string> source;
  std::optional<std::string> target;
  nlohmann::json fields = nlohmann::json::object();
};

struct EdgeDeletePayload {};

struct PropertyUpdatePayload {
  nlohmann::json properties = nlohmann::json::object();
};

// Alternative index follows OperationType.
using OperationPayload = std::variant<NodeAddPayload,
                                      NodeUpdatePayload,
                                      NodeDeletePayload,
                                      EdgeAddPayload,
                                      EdgeUpdatePayload,
                                      EdgeDeletePayload,
                                      PropertyUpdatePayload>;

OperationPayload default_payload_for(OperationType type);
OperationType payload_type(const OperationPayload& payload);

struct Operation {
  std::string id;
  std::string session_id;
  std::string workflow_id;
  std::string author_id;
  OperationType type = OperationType::NodeAdd;
  Target target;
  OperationPayload payload;
  uint64_t base_version = 0;
  uint64_t committed_version = 0;
  OperationStatus status = OperationStatus::Pending;
  int64_t timestamp = 0; // ms since epoch, supplied by the author

  std::string reason;         // rejection reason, empty otherwise
  std::string winner_id;      // set on transformed operations
  std::string conflicting_id; // operation that caused a rejection

  bool is_add() const { return type == OperationType::NodeAdd || type == OperationType::EdgeAdd; }
  bool is_delete() const { return type == OperationType::NodeDelete || type == OperationType::EdgeDelete; }
  bool is_update() const {
    return type == OperationType::NodeUpdate ||
           type == OperationType::EdgeUpdate ||
           type == OperationType::PropertyUpdate;
  }
  bool is_edge_write() const { return type == OperationType::EdgeAdd || type == OperationType::EdgeUpdate; }

  // (timestamp, author_id) ordering used for every deterministic tie-break.
  bool precedes(const Operation& other) const {
    if(timestamp != other.timestamp) return timestamp < other.timestamp;
    if(author_id != other.author_id) return author_id < other.author_id;
    return id < other.id;
  }

  template<typename T>
  const T* payload_as() const { return std::get_if<T>(&payload); }

  template<typename T>
  T* payload_as() { return std::get_if<T>(&payload); }
};

TargetKind expected_target_kind(OperationType type);

// Node ids an edge operation attaches to, as written in the payload.
std::vector<std::string> payload_endpoints(const Operation& op);

// ---- key paths ------------------------------------------------------------
//
// Update payloads are compared leaf by leaf. Node geometry maps to
// geometry.<axis>, edge endpoints to source/target, and both node fields and
// property updates live under data.

using KeyPath = std::vector<std::string>;
using KeyPathMap = std::map<KeyPath, nlohmann::json>;

std::string to_string(const KeyPath& path);
bool paths_overlap(const KeyPath& a, const KeyPath& b);

void flatten_json(const nlohmann::json& value, KeyPath& prefix, KeyPathMap& out);
void assign_path(nlohmann::json& root, const KeyPath& path, const nlohmann::json& value);

KeyPathMap key_paths(const OperationPayload& payload);
OperationPayload payload_from_key_paths(OperationType type, const KeyPathMap& paths);
