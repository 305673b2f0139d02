#pragma once

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "broadcast_coordinator.hpp"
#include "conflict_detector.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "operation_log.hpp"
#include "outbound_channel.hpp"
#include "persistence.hpp"
#include "presence_tracker.hpp"
#include "session_types.hpp"
#include "transform_engine.hpp"
#include "workflow_state.hpp"

// Pipeline knobs shared by every session of an engine.
struct SessionConfig {
  std::size_t queue_depth = 256;
  uint64_t concurrent_window = 1000;
  double position_gap = 24;
  double default_node_width = 200;
  double default_node_height = 80;
};

// One collaborative editing session. Membership and settings are guarded by a
// mutex; everything that touches the log and the workflow state runs on the
// session's strand, so commits of one session never interleave.
class Session : public std::enable_shared_from_this<Session> {
public:
  using CompletionHandler = std::function<void(const Operation&)>;

  Session(asio::io_context& io,
          std::string session_id,
          std::string workflow_id,
          std::string created_by,
          SessionSettings settings,
          SessionConfig config,
          std::shared_ptr<PersistenceSink> persistence,
          int64_t now,
          std::shared_ptr<Logger> parent_logger = nullptr);

  const std::string& id() const { return session_id_; }
  const std::string& workflow_id() const { return workflow_id_; }
  const std::string& created_by() const { return created_by_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

  // Throws SessionClosed, RoleNotAllowed or CapacityExceeded. A user that is
  // already a member is rebound to the new channel instead.
  Participant add_participant(Participant participant,
                              std::shared_ptr<OutboundChannel> channel,
                              int64_t now);
  bool remove_participant(const std::string& user_id, int64_t now);

  std::optional<Participant> participant(const std::string& user_id) const;
  std::optional<std::string> user_for_connection(const std::string& connection_id) const;
  std::size_t participant_count() const;

  // Owner only (PermissionDenied); InvalidSettings when the result is unusable.
  void update_settings(const std::string& requester, const SessionSettings& settings);
  SessionSettings settings() const;

  // Returns true when this call ended the session.
  bool end(const std::string& reason, int64_t now);
  bool active() const;
  SessionState state() const;

  // Admits the operation and queues it on the strand. Throws SessionClosed,
  // NotAMember, PermissionDenied or Busy without queueing.
  void submit(Operation op, CompletionHandler on_done = {});

  // Runs the full pipeline synchronously. Must not race with the strand.
  Operation commit(Operation op);

  // Commits the inverse of the user's latest live operation that has not
  // been undone yet. Undo operations themselves are never undone. The
  // queued form replies with an error when there is nothing to undo; the
  // synchronous one throws InvalidOperation.
  void submit_undo(const std::string& user_id, CompletionHandler on_done = {});
  Operation undo(const std::string& user_id);

  void update_presence(const std::string& user_id, Presence presence, int64_t now);

  std::vector<Operation> range(uint64_t from_version, uint64_t to_version = 0) const;
  std::vector<Operation> by_target(TargetKind kind, const std::string& target_id) const;
  std::vector<Operation> audit() const;
  uint64_t head_version() const;

  nlohmann::json state_snapshot() const;
  WorkflowState state_copy() const;
  std::vector<Presence> presence() const;

  SessionStats stats(int64_t now) const;
  SessionInfo info() const;
  bool idle_expired(int64_t now) const;
  std::size_t pending() const { return pending_.load(); }

  BroadcastCoordinator& broadcaster() { return broadcast_; }

private:
  void check_can_submit(const std::string& author_id) const;
  Operation run_pipeline(Operation op);
  Operation reject_submission(Operation op, const CollabError& error);
  Operation build_undo(const std::string& user_id) const;
  void rebuild_state();
  void log_conflicts(const Resolution& r) const;
  void touch(int64_t now);
  void persist_operation(const Operation& op);
  void persist_session();
  bool auto_save() const;

  std::string session_id_;
  std::string workflow_id_;
  std::string created_by_;
  SessionConfig config_;
  std::shared_ptr<PersistenceSink> persistence_;
  std::shared_ptr<Logger> logger_;
  asio::strand<asio::io_context::executor_type> strand_;

  mutable std::mutex m_;
  std::map<std::string, Participant> participants_;
  SessionSettings settings_;
  SessionState state_ = SessionState::Created;
  int64_t created_at_ = 0;
  int64_t ended_at_ = 0;
  int64_t last_activity_ = 0;

  OperationLog log_;
  mutable std::mutex state_m_;
  WorkflowState workflow_;
  ConflictDetector detector_;
  TransformEngine engine_;
  BroadcastCoordinator broadcast_;
  PresenceTracker presence_;
  std::atomic<std::size_t> pending_{0};
};
