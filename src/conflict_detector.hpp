#pragma once

#include <optional>
#include <string>
#include <vector>

#include "operation.hpp"
#include "operation_log.hpp"
#include "workflow_state.hpp"

enum class ConflictType { SameTargetUpdate, Position, Dependency, Delete };

const char* to_string(ConflictType type);

struct Conflict {
  std::string id;
  std::vector<std::string> operation_ids; // window entry first, then the incoming operation
  ConflictType type = ConflictType::SameTargetUpdate;
  std::string resolution; // filled in by the transform engine
};

// Classifies the relationship between an incoming operation and each entry of
// its concurrent window. Rules are checked in priority order; the first match
// decides the pair.
class ConflictDetector {
public:
  std::vector<Conflict> detect(const Operation& incoming,
                               const std::vector<LogEntry>& window,
                               const WorkflowState& state,
                               const OperationLog& log) const;

  std::optional<ConflictType> classify(const Operation& incoming,
                                       const LogEntry& entry,
                                       const WorkflowState& state,
                                       const OperationLog& log) const;

private:
  static bool is_delete_pair(const Operation& incoming, const LogEntry& entry,
                             const WorkflowState& state, const OperationLog& log);
  static bool is_dependency_pair(const Operation& incoming, const LogEntry& entry,
                                 const WorkflowState& state, const OperationLog& log);
  static bool is_same_target_pair(const Operation& incoming, const LogEntry& entry);
  static bool is_position_pair(const Operation& incoming, const LogEntry& entry, const WorkflowState& state);
};
