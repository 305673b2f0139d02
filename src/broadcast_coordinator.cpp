#include "broadcast_coordinator.hpp"

#include "protocol.hpp"

BroadcastCoordinator::BroadcastCoordinator(std::string session_id, std::shared_ptr<Logger> logger)
  : session_id_(std::move(session_id)), logger_(std::move(logger)) {}

void BroadcastCoordinator::attach(const std::string& user_id, std::shared_ptr<OutboundChannel> channel) {
  if(!channel) return;
  std::lock_guard lg(m_);
  channels_[user_id] = std::move(channel);
}

void BroadcastCoordinator::detach(const std::string& user_id) {
  std::lock_guard lg(m_);
  channels_.erase(user_id);
}

bool BroadcastCoordinator::attached(const std::string& user_id) const {
  std::lock_guard lg(m_);
  return channels_.count(user_id) > 0;
}

std::size_t BroadcastCoordinator::channel_count() const {
  std::lock_guard lg(m_);
  return channels_.size();
}

std::size_t BroadcastCoordinator::fan_out(const nlohmann::json& message, const std::string& exclude_user) {
  std::vector<std::pair<std::string, std::shared_ptr<OutboundChannel>>> targets;
  {
    std::lock_guard lg(m_);
    for(const auto& [user, channel] : channels_) {
      if(user == exclude_user) continue;
      targets.emplace_back(user, channel);
    }
  }
  std::size_t delivered = 0;
  for(auto& [user, channel] : targets) {
    if(channel->deliver(message)) {
      ++delivered;
    } else {
      log_debug(logger_.get(), "session {}: channel {} for {} is closed",
                session_id_, channel->channel_id(), user);
    }
  }
  return delivered;
}

std::size_t BroadcastCoordinator::publish(const Operation& committed, const std::string& exclude_user) {
  return fan_out(make_operation_committed(committed), exclude_user);
}

bool BroadcastCoordinator::reply(const std::string& user_id, const nlohmann::json& message) {
  std::shared_ptr<OutboundChannel> channel;
  {
    std::lock_guard lg(m_);
    auto it = channels_.find(user_id);
    if(it == channels_.end()) return false;
    channel = it->second;
  }
  return channel->deliver(message);
}

std::size_t BroadcastCoordinator::notify_status(const Operation& op) {
  return fan_out(make_operation_status(op), "");
}

std::size_t BroadcastCoordinator::announce(const nlohmann::json& message, const std::string& exclude_user) {
  return fan_out(message, exclude_user);
}

std::size_t BroadcastCoordinator::publish_conflict(const Conflict& conflict) {
  return fan_out(make_conflict_detected(session_id_, conflict), "");
}

std::size_t BroadcastCoordinator::publish_presence(const Presence& presence, const std::string& exclude_user) {
  return fan_out(make_presence_update(presence), exclude_user);
}

void BroadcastCoordinator::close_all() {
  std::lock_guard lg(m_);
  channels_.clear();
}
