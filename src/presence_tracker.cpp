#include "presence_tracker.hpp"

const char* to_string(PresenceStatus status) {
  switch(status) {
    case PresenceStatus::Online:  return "online";
    case PresenceStatus::Idle:    return "idle";
    case PresenceStatus::Away:    return "away";
    case PresenceStatus::Offline: return "offline";
  }
  return "offline";
}

std::optional<PresenceStatus> presence_status_from_string(const std::string& value) {
  if(value == "online") return PresenceStatus::Online;
  if(value == "idle") return PresenceStatus::Idle;
  if(value == "away") return PresenceStatus::Away;
  if(value == "offline") return PresenceStatus::Offline;
  return std::nullopt;
}

bool PresenceTracker::update(const Presence& presence) {
  std::lock_guard lg(m_);
  auto it = by_user_.find(presence.user_id);
  if(it != by_user_.end() && presence.updated_at < it->second.updated_at) {
    return false;
  }
  by_user_[presence.user_id] = presence;
  return true;
}

Presence PresenceTracker::remove(const std::string& user_id, int64_t now) {
  std::lock_guard lg(m_);
  auto it = by_user_.find(user_id);
  Presence gone;
  if(it != by_user_.end()) {
    gone = it->second;
    by_user_.erase(it);
  } else {
    gone.user_id = user_id;
  }
  gone.status = PresenceStatus::Offline;
  gone.cursor.reset();
  gone.typing.reset();
  gone.selection = Selection{};
  gone.updated_at = now;
  return gone;
}

std::optional<Presence> PresenceTracker::get(const std::string& user_id) const {
  std::lock_guard lg(m_);
  auto it = by_user_.find(user_id);
  if(it == by_user_.end()) return std::nullopt;
  return it->second;
}

std::vector<Presence> PresenceTracker::snapshot() const {
  std::lock_guard lg(m_);
  std::vector<Presence> out;
  out.reserve(by_user_.size());
  for(const auto& [user, presence] : by_user_) out.push_back(presence);
  return out;
}

std::size_t PresenceTracker::size() const {
  std::lock_guard lg(m_);
  return by_user_.size();
}
