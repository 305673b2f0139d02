#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class Role { Owner, Editor, Viewer };

const char* to_string(Role role);
std::optional<Role> role_from_string(const std::string& value);

enum class SessionState { Created, Active, Ended };

const char* to_string(SessionState state);

struct Participant {
  std::string user_id;
  std::string connection_id;
  std::string display_name;
  Role role = Role::Editor;
  int64_t joined_at = 0;
  bool is_active = true;
};

struct SessionSettings {
  std::vector<Role> allowed_roles{Role::Owner, Role::Editor, Role::Viewer};
  std::size_t max_participants = 10;
  bool auto_save = true;
  int64_t idle_timeout_seconds = 300;

  bool allows(Role role) const;

  // Empty string when the settings are usable for a session that currently
  // holds participant_count members.
  std::string validate(std::size_t participant_count) const;
};

struct SessionStats {
  std::size_t participants = 0;
  std::size_t operations = 0;
  std::size_t rejected = 0;
  uint64_t head_version = 0;
  int64_t duration_seconds = 0;
};

// Point-in-time copy of a session, safe to hand to the wire layer.
struct SessionInfo {
  std::string session_id;
  std::string workflow_id;
  std::string created_by;
  std::vector<Participant> participants;
  SessionSettings settings;
  SessionState state = SessionState::Created;
  uint64_t head_version = 0;
  int64_t created_at = 0;
  int64_t ended_at = 0;
  int64_t last_activity = 0;

  bool is_active() const { return state != SessionState::Ended; }
};
