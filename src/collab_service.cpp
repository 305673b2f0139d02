#include "collab_service.hpp"

#include "errors.hpp"
#include "protocol.hpp"
#include "utils.hpp"

CollabService::CollabService(std::shared_ptr<SessionRegistry> registry,
                             std::shared_ptr<IdentityVerifier> identity,
                             std::shared_ptr<Logger> logger)
  : registry_(std::move(registry)),
    identity_(identity ? std::move(identity) : std::make_shared<TrustingIdentityVerifier>()),
    logger_(std::move(logger)) {}

void CollabService::handle_message(const std::shared_ptr<OutboundChannel>& channel, const nlohmann::json& j) {
  if(!channel) return;
  const std::string type = j.is_object() ? j.value("type", "") : "";
  if(type.empty()) {
    channel->deliver(make_error(ErrorCode::InvalidOperation, "message has no type"));
    return;
  }

  try {
    if(type == "join_workflow") {
      handle_join(channel, j);
    } else if(type == "leave_workflow") {
      handle_leave(channel, j);
    } else if(type == "submit_operation") {
      handle_submit(channel, j);
    } else if(type == "undo") {
      handle_undo(channel);
    } else if(type == "presence_update") {
      handle_presence(channel, j);
    } else if(type == "sync_request") {
      handle_sync(channel, j);
    } else if(type == "update_settings") {
      handle_update_settings(channel, j);
    } else if(type == "end_session") {
      handle_end(channel);
    } else if(type == "session_stats") {
      handle_stats(channel);
    } else {
      channel->deliver(make_error(ErrorCode::InvalidOperation, "unknown message type '" + type + "'", type));
    }
  } catch(const CollabError& e) {
    log_debug(logger_.get(), "{} on {} failed: {} ({})", type, channel->channel_id(), e.what(), to_string(e.code()));
    channel->deliver(make_error(e.code(), e.what(), type));
  } catch(const nlohmann::json::exception& e) {
    log_warn(logger_.get(), "Malformed {} from {}: {}", type, channel->channel_id(), e.what());
    channel->deliver(make_error(ErrorCode::InvalidOperation, e.what(), type));
  }
}

void CollabService::handle_join(const std::shared_ptr<OutboundChannel>& channel, const nlohmann::json& j) {
  auto workflow_id = j.value("workflowId", std::string());
  if(workflow_id.empty()) {
    throw CollabError(ErrorCode::InvalidOperation, "workflowId is required");
  }
  auto claim = decode_participant(j.value("participant", nlohmann::json::object()));
  auto verified = identity_->verify(claim, j.value("token", std::string()));
  claim.user_id = verified.user_id;
  claim.role = verified.role;
  claim.connection_id = channel->channel_id();

  const auto now = now_millis();
  if(auto previous = binding(channel->channel_id())) {
    auto session = previous->session.lock();
    bool same = session && session->workflow_id() == workflow_id && previous->user_id == claim.user_id;
    if(!same) {
      if(session) session->remove_participant(previous->user_id, now);
      unbind(channel->channel_id());
    }
  }

  auto result = registry_->join(workflow_id, claim, channel, now);
  bind(channel->channel_id(), Binding{result.session->id(), result.participant.user_id, result.session});
  log_info(logger_.get(), "{} joined workflow {} (session {}, {})",
           result.participant.user_id, workflow_id, result.session->id(),
           result.created ? "created" : "existing");
  channel->deliver(make_session_joined(result.session->info(),
                                       result.session->state_snapshot(),
                                       result.session->presence()));
}

void CollabService::handle_leave(const std::shared_ptr<OutboundChannel>& channel, const nlohmann::json& j) {
  auto [bound, session] = require_binding(channel->channel_id());
  auto workflow_id = j.value("workflowId", session->workflow_id());
  if(workflow_id != session->workflow_id()) {
    throw CollabError(ErrorCode::NotAMember, "connection is not in workflow " + workflow_id);
  }
  auto user_id = j.value("userId", bound.user_id);
  if(user_id != bound.user_id) {
    throw CollabError(ErrorCode::PermissionDenied, "cannot remove another participant");
  }
  registry_->leave(bound.session_id, bound.user_id, now_millis());
  unbind(channel->channel_id());
  channel->deliver(make_session_left(bound.session_id, bound.user_id));
}

void CollabService::handle_submit(const std::shared_ptr<OutboundChannel>& channel, const nlohmann::json& j) {
  auto [bound, session] = require_binding(channel->channel_id());
  auto it = j.find("operation");
  if(it == j.end()) {
    throw CollabError(ErrorCode::InvalidOperation, "submit_operation needs an operation");
  }
  auto op = decode_operation(*it);
  if(!op.author_id.empty() && op.author_id != bound.user_id) {
    throw CollabError(ErrorCode::PermissionDenied,
                      "operation author " + op.author_id + " does not match " + bound.user_id);
  }
  op.author_id = bound.user_id;
  try {
    session->submit(op);
  } catch(const CollabError& e) {
    op.session_id = session->id();
    op.status = OperationStatus::Rejected;
    op.reason = rejection_reason(e.code());
    channel->deliver(make_operation_result(op));
  }
}

void CollabService::handle_undo(const std::shared_ptr<OutboundChannel>& channel) {
  auto [bound, session] = require_binding(channel->channel_id());
  session->submit_undo(bound.user_id);
}

void CollabService::handle_presence(const std::shared_ptr<OutboundChannel>& channel, const nlohmann::json& j) {
  auto [bound, session] = require_binding(channel->channel_id());
  auto presence = decode_presence(j.value("presence", nlohmann::json::object()));
  session->update_presence(bound.user_id, std::move(presence), now_millis());
}

void CollabService::handle_sync(const std::shared_ptr<OutboundChannel>& channel, const nlohmann::json& j) {
  auto [bound, session] = require_binding(channel->channel_id());
  auto from = j.value("fromVersion", uint64_t{1});
  auto to = j.value("toVersion", uint64_t{0});
  channel->deliver(make_sync_response(session->id(), session->range(from, to), session->head_version()));
}

void CollabService::handle_update_settings(const std::shared_ptr<OutboundChannel>& channel, const nlohmann::json& j) {
  auto [bound, session] = require_binding(channel->channel_id());
  auto settings = decode_settings(j.value("settings", nlohmann::json::object()), session->settings());
  registry_->update_settings(bound.session_id, bound.user_id, settings);
}

void CollabService::handle_end(const std::shared_ptr<OutboundChannel>& channel) {
  auto [bound, session] = require_binding(channel->channel_id());
  auto participant = session->participant(bound.user_id);
  bool owner = participant && (participant->role == Role::Owner || bound.user_id == session->created_by());
  if(!owner) {
    throw CollabError(ErrorCode::PermissionDenied, "only the session owner can end the session");
  }
  // session_ended reaches this channel through the broadcast.
  registry_->end(bound.session_id, "ended-by-owner", now_millis());
  std::lock_guard lg(m_);
  for(auto it = bindings_.begin(); it != bindings_.end();) {
    if(it->second.session_id == bound.session_id) {
      it = bindings_.erase(it);
    } else {
      ++it;
    }
  }
}

void CollabService::handle_stats(const std::shared_ptr<OutboundChannel>& channel) {
  auto [bound, session] = require_binding(channel->channel_id());
  channel->deliver(make_session_stats(session->id(), session->stats(now_millis())));
}

void CollabService::on_disconnected(const std::string& channel_id) {
  auto removed = registry_->leave_connection(channel_id, now_millis());
  for(const auto& [session_id, user_id] : removed) {
    log_info(logger_.get(), "{} disconnected from session {}", user_id, session_id);
  }
  unbind(channel_id);
}

std::pair<CollabService::Binding, std::shared_ptr<Session>>
CollabService::require_binding(const std::string& channel_id) const {
  auto found = binding(channel_id);
  if(!found) {
    throw CollabError(ErrorCode::NotAMember, "connection has not joined a workflow");
  }
  auto session = found->session.lock();
  if(!session || !session->active()) {
    throw CollabError(ErrorCode::SessionClosed, "session " + found->session_id + " has ended");
  }
  return {*found, session};
}

std::optional<CollabService::Binding> CollabService::binding(const std::string& channel_id) const {
  std::lock_guard lg(m_);
  auto it = bindings_.find(channel_id);
  if(it == bindings_.end()) return std::nullopt;
  return it->second;
}

void CollabService::bind(const std::string& channel_id, Binding binding) {
  std::lock_guard lg(m_);
  bindings_[channel_id] = std::move(binding);
}

void CollabService::unbind(const std::string& channel_id) {
  std::lock_guard lg(m_);
  bindings_.erase(channel_id);
}

std::size_t CollabService::bound_connections() const {
  std::lock_guard lg(m_);
  return bindings_.size();
}
