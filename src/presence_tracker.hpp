#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class PresenceStatus { Online, Idle, Away, Offline };

const char* to_string(PresenceStatus status);
std::optional<PresenceStatus> presence_status_from_string(const std::string& value);

struct Cursor {
  double x = 0;
  double y = 0;
  std::optional<std::string> node_id;
};

struct Selection {
  std::vector<std::string> node_ids;
  std::vector<std::string> edge_ids;
};

struct Typing {
  std::string node_id;
  std::string field;
};

struct Presence {
  std::string user_id;
  std::string session_id;
  PresenceStatus status = PresenceStatus::Online;
  std::optional<Cursor> cursor;
  Selection selection;
  std::optional<Typing> typing;
  int64_t updated_at = 0;
};

// Last-write-wins presence per user for one session. Nothing here is ordered
// against operations or persisted.
class PresenceTracker {
public:
  // Returns false when the update is older than the stored one.
  bool update(const Presence& presence);

  // Drops the user and returns the offline record to broadcast.
  Presence remove(const std::string& user_id, int64_t now);

  std::optional<Presence> get(const std::string& user_id) const;
  std::vector<Presence> snapshot() const;
  std::size_t size() const;

private:
  mutable std::mutex m_;
  std::map<std::string, Presence> by_user_;
};
