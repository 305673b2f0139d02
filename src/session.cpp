#include "session.hpp"

#include "errors.hpp"
#include "protocol.hpp"
#include "utils.hpp"

Session::Session(asio::io_context& io,
                 std::string session_id,
                 std::string workflow_id,
                 std::string created_by,
                 SessionSettings settings,
                 SessionConfig config,
                 std::shared_ptr<PersistenceSink> persistence,
                 int64_t now,
                 std::shared_ptr<Logger> parent_logger)
  : session_id_(std::move(session_id)),
    workflow_id_(std::move(workflow_id)),
    created_by_(std::move(created_by)),
    config_(config),
    persistence_(persistence ? std::move(persistence) : std::make_shared<NullPersistence>()),
    logger_(parent_logger ? parent_logger->child(session_id_) : std::make_shared<Logger>(session_id_)),
    strand_(asio::make_strand(io)),
    settings_(std::move(settings)),
    created_at_(now),
    last_activity_(now),
    log_(session_id_, config.concurrent_window),
    workflow_(config.default_node_width, config.default_node_height),
    engine_(EngineConfig{config.position_gap}),
    broadcast_(session_id_, logger_) {}

// ---- membership -----------------------------------------------------------

Participant Session::add_participant(Participant participant,
                                     std::shared_ptr<OutboundChannel> channel,
                                     int64_t now) {
  bool rejoined = false;
  {
    std::lock_guard lg(m_);
    if(state_ == SessionState::Ended) {
      throw CollabError(ErrorCode::SessionClosed, "session " + session_id_ + " has ended");
    }
    if(!settings_.allows(participant.role)) {
      throw CollabError(ErrorCode::RoleNotAllowed,
                        std::string("role ") + to_string(participant.role) + " is not allowed in session " + session_id_);
    }
    auto it = participants_.find(participant.user_id);
    if(it != participants_.end()) {
      it->second.connection_id = participant.connection_id;
      it->second.role = participant.role;
      if(!participant.display_name.empty()) it->second.display_name = participant.display_name;
      it->second.is_active = true;
      participant = it->second;
      rejoined = true;
    } else {
      if(participants_.size() >= settings_.max_participants) {
        throw CollabError(ErrorCode::CapacityExceeded,
                          "session " + session_id_ + " is full (" +
                          std::to_string(settings_.max_participants) + " participants)");
      }
      participant.joined_at = now;
      participant.is_active = true;
      participants_[participant.user_id] = participant;
    }
    state_ = SessionState::Active;
    last_activity_ = now;
  }

  broadcast_.attach(participant.user_id, std::move(channel));
  if(rejoined) {
    logger_->info("{} reconnected on {}", participant.user_id, participant.connection_id);
  } else {
    logger_->info("{} joined as {}", participant.user_id, to_string(participant.role));
    broadcast_.announce(make_participant_joined(session_id_, participant), participant.user_id);
  }
  persist_session();
  return participant;
}

bool Session::remove_participant(const std::string& user_id, int64_t now) {
  {
    std::lock_guard lg(m_);
    if(participants_.erase(user_id) == 0) return false;
    last_activity_ = now;
  }
  broadcast_.detach(user_id);
  auto offline = presence_.remove(user_id, now);
  offline.session_id = session_id_;
  broadcast_.publish_presence(offline);
  broadcast_.announce(make_participant_left(session_id_, user_id));
  logger_->info("{} left", user_id);
  persist_session();
  return true;
}

std::optional<Participant> Session::participant(const std::string& user_id) const {
  std::lock_guard lg(m_);
  auto it = participants_.find(user_id);
  if(it == participants_.end()) return std::nullopt;
  return it->second;
}

std::optional<std::string> Session::user_for_connection(const std::string& connection_id) const {
  std::lock_guard lg(m_);
  for(const auto& [user, p] : participants_) {
    if(p.connection_id == connection_id) return user;
  }
  return std::nullopt;
}

std::size_t Session::participant_count() const {
  std::lock_guard lg(m_);
  return participants_.size();
}

void Session::update_settings(const std::string& requester, const SessionSettings& settings) {
  {
    std::lock_guard lg(m_);
    if(state_ == SessionState::Ended) {
      throw CollabError(ErrorCode::SessionClosed, "session " + session_id_ + " has ended");
    }
    auto it = participants_.find(requester);
    bool owner = it != participants_.end() &&
                 (it->second.role == Role::Owner || requester == created_by_);
    if(!owner) {
      throw CollabError(ErrorCode::PermissionDenied, "only the session owner can change settings");
    }
    auto problem = settings.validate(participants_.size());
    if(!problem.empty()) {
      throw CollabError(ErrorCode::InvalidSettings, problem);
    }
    settings_ = settings;
  }
  logger_->info("settings updated by {}", requester);
  broadcast_.announce(make_settings_updated(session_id_, settings));
  persist_session();
}

SessionSettings Session::settings() const {
  std::lock_guard lg(m_);
  return settings_;
}

bool Session::end(const std::string& reason, int64_t now) {
  {
    std::lock_guard lg(m_);
    if(state_ == SessionState::Ended) return false;
    state_ = SessionState::Ended;
    ended_at_ = now;
    last_activity_ = now;
  }
  log_.close();
  logger_->info("ended ({})", reason);
  broadcast_.announce(make_session_ended(session_id_, reason));
  broadcast_.close_all();
  persist_session();
  return true;
}

bool Session::active() const {
  std::lock_guard lg(m_);
  return state_ != SessionState::Ended;
}

SessionState Session::state() const {
  std::lock_guard lg(m_);
  return state_;
}

void Session::touch(int64_t now) {
  std::lock_guard lg(m_);
  if(now > last_activity_) last_activity_ = now;
}

bool Session::auto_save() const {
  std::lock_guard lg(m_);
  return settings_.auto_save;
}

// ---- commit pipeline ------------------------------------------------------

void Session::check_can_submit(const std::string& author_id) const {
  std::lock_guard lg(m_);
  if(state_ == SessionState::Ended) {
    throw CollabError(ErrorCode::SessionClosed, "session " + session_id_ + " has ended");
  }
  auto it = participants_.find(author_id);
  if(it == participants_.end()) {
    throw CollabError(ErrorCode::NotAMember, author_id + " is not a member of session " + session_id_);
  }
  if(it->second.role == Role::Viewer) {
    throw CollabError(ErrorCode::PermissionDenied, "viewers cannot submit operations");
  }
}

void Session::submit(Operation op, CompletionHandler on_done) {
  check_can_submit(op.author_id);
  auto queued = pending_.fetch_add(1);
  if(queued >= config_.queue_depth) {
    pending_.fetch_sub(1);
    throw CollabError(ErrorCode::Busy,
                      "session " + session_id_ + " has " + std::to_string(queued) + " operations queued");
  }
  asio::post(strand_, [self = shared_from_this(), op = std::move(op), on_done = std::move(on_done)]() mutable {
    self->pending_.fetch_sub(1);
    Operation result;
    try {
      result = self->run_pipeline(op);
    } catch(const CollabError& e) {
      result = self->reject_submission(std::move(op), e);
    }
    if(on_done) on_done(result);
  });
}

Operation Session::commit(Operation op) {
  check_can_submit(op.author_id);
  try {
    return run_pipeline(op);
  } catch(const CollabError& e) {
    return reject_submission(std::move(op), e);
  }
}

Operation Session::reject_submission(Operation op, const CollabError& error) {
  op.session_id = session_id_;
  op.status = OperationStatus::Rejected;
  op.reason = rejection_reason(error.code());
  op.committed_version = 0;
  logger_->warn("{} from {} refused: {}", op.id, op.author_id, error.what());
  if(error.code() != ErrorCode::SessionClosed) {
    log_.record_rejected(op);
  }
  broadcast_.reply(op.author_id, make_operation_result(op));
  return op;
}

Operation Session::run_pipeline(Operation op) {
  if(!active()) {
    throw CollabError(ErrorCode::SessionClosed, "session " + session_id_ + " has ended");
  }
  op.session_id = session_id_;
  if(op.workflow_id.empty()) op.workflow_id = workflow_id_;
  if(op.workflow_id != workflow_id_) {
    throw CollabError(ErrorCode::InvalidOperation,
                      "operation targets workflow " + op.workflow_id + ", session edits " + workflow_id_);
  }
  if(op.author_id == kSystemAuthor) {
    throw CollabError(ErrorCode::PermissionDenied, "author id 'system' is reserved");
  }
  if(op.timestamp == 0) op.timestamp = now_millis();

  // At-least-once delivery from clients: a resubmitted id returns its outcome.
  if(auto existing = log_.find(op.id); existing && existing->committed_version != 0) {
    logger_->debug("{} already processed, replaying outcome", op.id);
    broadcast_.reply(op.author_id, make_operation_result(*existing));
    return *existing;
  }

  log_.check_base_version(op.base_version);
  auto window = log_.window_after(op.base_version);

  Resolution r;
  {
    std::lock_guard lg(state_m_);
    auto conflicts = detector_.detect(op, window, workflow_, log_);
    r = engine_.resolve(op, window, std::move(conflicts), workflow_, log_);
  }

  const bool persist = auto_save();
  touch(now_millis());

  if(r.rejected()) {
    log_conflicts(r);
    log_.record_rejected(r.operation);
    logger_->info("{} {} on {} rejected: {}", r.operation.id, to_string(r.operation.type),
                  r.operation.target.id, r.operation.reason);
    if(persist) persist_operation(r.operation);
    for(const auto& c : r.conflicts) broadcast_.publish_conflict(c);
    broadcast_.reply(r.operation.author_id, make_operation_result(r.operation));
    return r.operation;
  }

  std::vector<Operation> changed;
  Placement placement;
  {
    std::lock_guard lg(state_m_);
    log_.append(r.operation, op.payload);
    for(const auto& change : r.status_changes) {
      if(auto updated = log_.mark(change.operation_id, change.status, change.reason, change.related_id)) {
        changed.push_back(*updated);
      }
    }
    if(changed.empty()) {
      workflow_.apply(r.operation);
    } else {
      rebuild_state();
    }

    placement = engine_.place(log_, workflow_, op.base_version);
    const auto before_retire = changed.size();
    for(const auto& id : placement.retired) {
      if(auto updated = log_.mark(id, OperationStatus::Rejected, "superseded", r.operation.id)) {
        changed.push_back(*updated);
      }
    }
    if(changed.size() != before_retire) rebuild_state();
    for(auto& nudge : placement.nudges) {
      log_.append(nudge);
      workflow_.apply(nudge);
    }
  }
  engine_.describe_positions(r, window, placement);
  log_conflicts(r);

  logger_->debug("{} {} on {} committed at v{} ({})", r.operation.id, to_string(r.operation.type),
                 r.operation.target.id, r.operation.committed_version, to_string(r.operation.status));
  if(!placement.unchanged()) {
    logger_->debug("placement since v{}: {} nudges, {} retired", placement.base_version,
                   placement.nudges.size(), placement.retired.size());
  }

  if(persist) {
    persist_operation(r.operation);
    for(const auto& op_changed : changed) persist_operation(op_changed);
    for(const auto& nudge : placement.nudges) persist_operation(nudge);
  }

  for(const auto& c : r.conflicts) broadcast_.publish_conflict(c);
  broadcast_.publish(r.operation, r.operation.author_id);
  broadcast_.reply(r.operation.author_id, make_operation_result(r.operation));
  for(const auto& op_changed : changed) broadcast_.notify_status(op_changed);
  for(const auto& nudge : placement.nudges) broadcast_.publish(nudge);
  return r.operation;
}

void Session::rebuild_state() {
  workflow_ = WorkflowState::replay(log_.range(1), config_.default_node_width, config_.default_node_height);
}

void Session::log_conflicts(const Resolution& r) const {
  for(const auto& c : r.conflicts) {
    logger_->debug("{} {} between {} ({})", c.id, to_string(c.type),
                   c.operation_ids.front(), c.resolution);
  }
}

// ---- undo -----------------------------------------------------------------

namespace {

bool is_undo(const Operation& op) {
  static const std::string suffix = "~undo";
  return op.id.size() > suffix.size() &&
         op.id.compare(op.id.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

Operation Session::build_undo(const std::string& user_id) const {
  auto history = log_.range(1);
  for(auto it = history.rbegin(); it != history.rend(); ++it) {
    const auto& done = *it;
    if(done.author_id != user_id || done.status == OperationStatus::Rejected || is_undo(done)) continue;
    if(auto earlier = log_.find(done.id + "~undo"); earlier && earlier->committed_version != 0) continue;

    std::vector<Operation> prefix(history.begin(),
                                  history.begin() + static_cast<std::ptrdiff_t>(done.committed_version - 1));
    auto before = WorkflowState::replay(prefix, config_.default_node_width, config_.default_node_height);
    auto inverse = engine_.inverse_of(done, before);
    if(!inverse) {
      throw CollabError(ErrorCode::InvalidOperation, done.id + " cannot be undone");
    }
    inverse->base_version = log_.head();
    inverse->timestamp = now_millis();
    return *inverse;
  }
  throw CollabError(ErrorCode::InvalidOperation, user_id + " has nothing to undo");
}

void Session::submit_undo(const std::string& user_id, CompletionHandler on_done) {
  check_can_submit(user_id);
  auto queued = pending_.fetch_add(1);
  if(queued >= config_.queue_depth) {
    pending_.fetch_sub(1);
    throw CollabError(ErrorCode::Busy,
                      "session " + session_id_ + " has " + std::to_string(queued) + " operations queued");
  }
  asio::post(strand_, [self = shared_from_this(), user_id, on_done = std::move(on_done)]() {
    self->pending_.fetch_sub(1);
    Operation inverse;
    try {
      inverse = self->build_undo(user_id);
    } catch(const CollabError& e) {
      self->logger_->debug("undo for {} refused: {}", user_id, e.what());
      self->broadcast_.reply(user_id, make_error(e.code(), e.what(), "undo"));
      return;
    }
    Operation result;
    try {
      result = self->run_pipeline(inverse);
    } catch(const CollabError& e) {
      result = self->reject_submission(std::move(inverse), e);
    }
    if(on_done) on_done(result);
  });
}

Operation Session::undo(const std::string& user_id) {
  check_can_submit(user_id);
  auto inverse = build_undo(user_id);
  try {
    return run_pipeline(inverse);
  } catch(const CollabError& e) {
    return reject_submission(std::move(inverse), e);
  }
}

// ---- presence -------------------------------------------------------------

void Session::update_presence(const std::string& user_id, Presence presence, int64_t now) {
  {
    std::lock_guard lg(m_);
    if(state_ == SessionState::Ended) {
      throw CollabError(ErrorCode::SessionClosed, "session " + session_id_ + " has ended");
    }
    if(!participants_.count(user_id)) {
      throw CollabError(ErrorCode::NotAMember, user_id + " is not a member of session " + session_id_);
    }
  }
  presence.user_id = user_id;
  presence.session_id = session_id_;
  if(presence.updated_at == 0) presence.updated_at = now;
  if(!presence_.update(presence)) {
    logger_->debug("dropping stale presence from {}", user_id);
    return;
  }
  broadcast_.publish_presence(presence, user_id);
}

// ---- queries --------------------------------------------------------------

std::vector<Operation> Session::range(uint64_t from_version, uint64_t to_version) const {
  return log_.range(from_version, to_version);
}

std::vector<Operation> Session::by_target(TargetKind kind, const std::string& target_id) const {
  return log_.by_target(kind, target_id);
}

std::vector<Operation> Session::audit() const {
  return log_.audit();
}

uint64_t Session::head_version() const {
  return log_.head();
}

nlohmann::json Session::state_snapshot() const {
  std::lock_guard lg(state_m_);
  return workflow_.to_json();
}

WorkflowState Session::state_copy() const {
  std::lock_guard lg(state_m_);
  return workflow_;
}

std::vector<Presence> Session::presence() const {
  return presence_.snapshot();
}

SessionStats Session::stats(int64_t now) const {
  SessionStats s;
  {
    std::lock_guard lg(m_);
    s.participants = participants_.size();
    int64_t until = ended_at_ != 0 ? ended_at_ : now;
    s.duration_seconds = until > created_at_ ? (until - created_at_) / 1000 : 0;
  }
  s.operations = log_.committed_count();
  s.rejected = log_.rejected_count();
  s.head_version = log_.head();
  return s;
}

SessionInfo Session::info() const {
  SessionInfo info;
  info.session_id = session_id_;
  info.workflow_id = workflow_id_;
  info.created_by = created_by_;
  {
    std::lock_guard lg(m_);
    for(const auto& [user, p] : participants_) info.participants.push_back(p);
    info.settings = settings_;
    info.state = state_;
    info.created_at = created_at_;
    info.ended_at = ended_at_;
    info.last_activity = last_activity_;
  }
  info.head_version = log_.head();
  return info;
}

bool Session::idle_expired(int64_t now) const {
  std::lock_guard lg(m_);
  if(state_ == SessionState::Ended || !participants_.empty()) return false;
  if(settings_.idle_timeout_seconds <= 0) return false;
  return now - last_activity_ >= settings_.idle_timeout_seconds * 1000;
}

void Session::persist_operation(const Operation& op) {
  persistence_->store_operation(op);
}

void Session::persist_session() {
  if(!auto_save()) return;
  persistence_->store_session(info());
}
