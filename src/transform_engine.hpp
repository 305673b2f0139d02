#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "conflict_detector.hpp"
#include "operation.hpp"
#include "operation_log.hpp"
#include "workflow_state.hpp"

struct EngineConfig {
  double position_gap = 24;
};

// Status transition of an operation that is already committed.
struct StatusChange {
  std::string operation_id;
  OperationStatus status = OperationStatus::Applied;
  std::string reason;
  std::string related_id; // winner for transformed, conflicting op for rejected
};

struct Resolution {
  Operation operation;                      // the incoming operation, resolved
  std::vector<StatusChange> status_changes; // retroactive transitions of window entries
  std::vector<Conflict> conflicts;

  bool rejected() const { return operation.status == OperationStatus::Rejected; }
};

// Horizontal separation of every node moved concurrently since a base
// version. Compensations are recomputed as a whole, so the outcome depends
// only on which moves are live, never on the order they were committed in.
struct Placement {
  uint64_t base_version = 0;
  std::vector<std::string> retired;     // live compensations this placement replaces
  std::vector<Operation> nudges;        // compensations to commit after the incoming operation
  std::map<std::string, double> shifted; // node id -> x it must end up at

  bool unchanged() const { return retired.empty() && nudges.empty(); }
};

// Turns an incoming operation plus its conflicts into a deterministic
// outcome. The result depends only on the set of operations involved, not on
// the order they arrived in.
class TransformEngine {
public:
  explicit TransformEngine(EngineConfig config = {});

  Resolution resolve(const Operation& incoming,
                     const std::vector<LogEntry>& window,
                     std::vector<Conflict> conflicts,
                     const WorkflowState& state,
                     const OperationLog& log) const;

  // Runs after the incoming operation and its status changes are in the log
  // and in state.
  Placement place(const OperationLog& log, const WorkflowState& state, uint64_t base_version) const;

  // Fills in the resolution of position conflicts once placement is known.
  void describe_positions(Resolution& r,
                          const std::vector<LogEntry>& window,
                          const Placement& placement) const;

  // Operation that reverts `done`, computed against the state just before it
  // was committed. nullopt when the operation has no inverse.
  std::optional<Operation> inverse_of(const Operation& done, const WorkflowState& before) const;

  const EngineConfig& config() const { return config_; }

private:
  bool resolve_deletes(Resolution& r, const std::vector<LogEntry>& window) const;
  bool resolve_dependencies(Resolution& r, const std::vector<LogEntry>& window) const;
  bool validate_against_state(Resolution& r, const WorkflowState& state, const OperationLog& log) const;
  void merge_same_target(Resolution& r, const std::vector<LogEntry>& window, const OperationLog& log) const;
  uint64_t placement_base(const OperationLog& log, uint64_t base_version) const;

  EngineConfig config_;
};
