#include "session_registry.hpp"

#include "errors.hpp"
#include "utils.hpp"

SessionRegistry::SessionRegistry(asio::io_context& io,
                                 RegistryConfig config,
                                 std::shared_ptr<PersistenceSink> persistence,
                                 std::shared_ptr<Logger> logger)
  : io_(io),
    config_(std::move(config)),
    persistence_(persistence ? std::move(persistence) : std::make_shared<NullPersistence>()),
    logger_(std::move(logger)) {}

SessionRegistry::JoinResult SessionRegistry::join(const std::string& workflow_id,
                                                  Participant participant,
                                                  std::shared_ptr<OutboundChannel> channel,
                                                  int64_t now) {
  if(workflow_id.empty()) {
    throw CollabError(ErrorCode::InvalidOperation, "workflowId is required");
  }
  if(participant.user_id.empty()) {
    throw CollabError(ErrorCode::InvalidOperation, "participant userId is required");
  }

  std::lock_guard lg(m_);
  JoinResult result;
  auto it = active_by_workflow_.find(workflow_id);
  if(it != active_by_workflow_.end()) {
    auto existing = sessions_.find(it->second);
    if(existing != sessions_.end() && existing->second->active()) {
      result.session = existing->second;
    }
  }

  if(!result.session) {
    std::string session_id;
    do {
      session_id = generate_id("session");
    } while(sessions_.count(session_id));
    result.session = std::make_shared<Session>(io_, session_id, workflow_id, participant.user_id,
                                               config_.default_settings, config_.session,
                                               persistence_, now, logger_);
    result.created = true;
  }

  // Throws without touching the arena when the join is refused.
  result.participant = result.session->add_participant(std::move(participant), std::move(channel), now);

  if(result.created) {
    sessions_[result.session->id()] = result.session;
    active_by_workflow_[workflow_id] = result.session->id();
    log_info(logger_.get(), "Created session {} for workflow {}", result.session->id(), workflow_id);
  }
  return result;
}

bool SessionRegistry::leave(const std::string& session_id, const std::string& user_id, int64_t now) {
  auto session = require(session_id);
  return session->remove_participant(user_id, now);
}

std::vector<std::pair<std::string, std::string>> SessionRegistry::leave_connection(const std::string& connection_id,
                                                                                   int64_t now) {
  std::vector<std::pair<std::string, std::string>> removed;
  for(const auto& session : sessions()) {
    auto user = session->user_for_connection(connection_id);
    if(!user) continue;
    if(session->remove_participant(*user, now)) {
      removed.emplace_back(session->id(), *user);
    }
  }
  return removed;
}

void SessionRegistry::update_settings(const std::string& session_id,
                                      const std::string& requester,
                                      const SessionSettings& settings) {
  require(session_id)->update_settings(requester, settings);
}

bool SessionRegistry::end(const std::string& session_id, const std::string& reason, int64_t now) {
  auto session = require(session_id);
  bool ended = session->end(reason, now);
  std::lock_guard lg(m_);
  auto it = active_by_workflow_.find(session->workflow_id());
  if(it != active_by_workflow_.end() && it->second == session_id) {
    active_by_workflow_.erase(it);
  }
  return ended;
}

std::shared_ptr<Session> SessionRegistry::find(const std::string& session_id) const {
  std::lock_guard lg(m_);
  auto it = sessions_.find(session_id);
  return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<Session> SessionRegistry::require(const std::string& session_id) const {
  auto session = find(session_id);
  if(!session) {
    throw CollabError(ErrorCode::UnknownSession, "unknown session " + session_id);
  }
  return session;
}

std::shared_ptr<Session> SessionRegistry::active_for_workflow(const std::string& workflow_id) const {
  std::lock_guard lg(m_);
  auto it = active_by_workflow_.find(workflow_id);
  if(it == active_by_workflow_.end()) return nullptr;
  auto session = sessions_.find(it->second);
  if(session == sessions_.end() || !session->second->active()) return nullptr;
  return session->second;
}

std::vector<std::shared_ptr<Session>> SessionRegistry::sessions() const {
  std::lock_guard lg(m_);
  std::vector<std::shared_ptr<Session>> out;
  out.reserve(sessions_.size());
  for(const auto& [id, session] : sessions_) out.push_back(session);
  return out;
}

std::vector<std::string> SessionRegistry::sweep_idle(int64_t now) {
  std::vector<std::shared_ptr<Session>> expired;
  {
    std::lock_guard lg(m_);
    for(auto it = sessions_.begin(); it != sessions_.end();) {
      auto& session = it->second;
      if(!session->active()) {
        if(session->pending() == 0) {
          it = sessions_.erase(it);
          continue;
        }
      } else if(session->idle_expired(now)) {
        expired.push_back(session);
        auto idx = active_by_workflow_.find(session->workflow_id());
        if(idx != active_by_workflow_.end() && idx->second == session->id()) {
          active_by_workflow_.erase(idx);
        }
      }
      ++it;
    }
  }

  std::vector<std::string> ended;
  for(auto& session : expired) {
    if(session->end("idle-timeout", now)) {
      log_info(logger_.get(), "Session {} ended after idle timeout", session->id());
      ended.push_back(session->id());
    }
  }
  return ended;
}

SessionStats SessionRegistry::stats(const std::string& session_id, int64_t now) const {
  return require(session_id)->stats(now);
}

std::vector<Operation> SessionRegistry::range(const std::string& session_id,
                                              uint64_t from_version,
                                              uint64_t to_version) const {
  return require(session_id)->range(from_version, to_version);
}

std::vector<Operation> SessionRegistry::by_target(const std::string& session_id,
                                                  TargetKind kind,
                                                  const std::string& target_id) const {
  return require(session_id)->by_target(kind, target_id);
}

std::size_t SessionRegistry::active_count() const {
  std::lock_guard lg(m_);
  std::size_t count = 0;
  for(const auto& [id, session] : sessions_) {
    if(session->active()) ++count;
  }
  return count;
}

std::size_t SessionRegistry::size() const {
  std::lock_guard lg(m_);
  return sessions_.size();
}
