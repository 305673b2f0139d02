#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "operation.hpp"

// A committed operation together with the payload its author submitted.
// Tie-breaks always look at the submitted payload, never at the resolved one.
struct LogEntry {
  Operation operation;
  OperationPayload submitted;
};

// Append-only ledger for one session. append() is the only writer of
// committed_version and must be called from the session's commit pipeline.
class OperationLog {
public:
  explicit OperationLog(std::string session_id, uint64_t retained_window = 1000);

  const std::string& session_id() const { return session_id_; }

  uint64_t append(Operation& op);
  uint64_t append(Operation& op, const OperationPayload& submitted);

  // Audit-only record; never consumes a version.
  void record_rejected(const Operation& op);

  // Committed operations with from <= committed_version <= to (to == 0 means head).
  std::vector<Operation> range(uint64_t from_version, uint64_t to_version = 0) const;
  std::vector<Operation> by_target(TargetKind kind, const std::string& target_id) const;
  std::vector<LogEntry> window_after(uint64_t base_version) const;

  // Endpoints of an edge as its latest live write left them, even after the
  // edge itself is gone from the state.
  std::vector<std::string> edge_endpoints(const std::string& edge_id) const;

  // Throws StaleBaseVersion when base predates the retained window and
  // InvalidOperation when it lies in the future.
  void check_base_version(uint64_t base_version) const;

  // Status transition of an already committed entry.
  std::optional<Operation> mark(const std::string& operation_id,
                                OperationStatus status,
                                const std::string& reason,
                                const std::string& related_id);

  std::optional<Operation> find(const std::string& operation_id) const;
  bool contains(const std::string& operation_id) const;
  bool has_committed(const Target& target, OperationType type) const;

  // Every entry in arrival order, rejected submissions included.
  std::vector<Operation> audit() const;

  uint64_t head() const;
  std::size_t committed_count() const;
  std::size_t rejected_count() const;
  uint64_t retained_window() const { return retained_window_; }

  void close();
  bool closed() const;

private:
  struct ArrivalSlot {
    bool committed = false;
    std::size_t index = 0;
  };

  std::string session_id_;
  uint64_t retained_window_;

  mutable std::mutex m_;
  bool closed_ = false;
  std::vector<LogEntry> committed_; // committed_[v - 1] holds version v
  std::vector<Operation> rejected_;
  std::vector<ArrivalSlot> arrival_;
  std::unordered_map<std::string, std::size_t> committed_by_id_;
};
