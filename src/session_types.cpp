#include "session_types.hpp"

#include <algorithm>

const char* to_string(Role role) {
  switch(role) {
    case Role::Owner:  return "owner";
    case Role::Editor: return "editor";
    case Role::Viewer: return "viewer";
  }
  return "viewer";
}

std::optional<Role> role_from_string(const std::string& value) {
  if(value == "owner") return Role::Owner;
  if(value == "editor") return Role::Editor;
  if(value == "viewer") return Role::Viewer;
  return std::nullopt;
}

const char* to_string(SessionState state) {
  switch(state) {
    case SessionState::Created: return "created";
    case SessionState::Active:  return "active";
    case SessionState::Ended:   return "ended";
  }
  return "ended";
}

bool SessionSettings::allows(Role role) const {
  return std::find(allowed_roles.begin(), allowed_roles.end(), role) != allowed_roles.end();
}

std::string SessionSettings::validate(std::size_t participant_count) const {
  if(max_participants == 0) return "maxParticipants must be at least 1";
  if(max_participants < participant_count) {
    return "maxParticipants " + std::to_string(max_participants) +
           " is below the current participant count " + std::to_string(participant_count);
  }
  if(allowed_roles.empty()) return "allowedRoles must not be empty";
  if(idle_timeout_seconds <= 0) return "idleTimeoutSeconds must be positive";
  return "";
}
