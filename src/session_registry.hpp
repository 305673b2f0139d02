#pragma once

#include <asio.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "log.hpp"
#include "outbound_channel.hpp"
#include "persistence.hpp"
#include "session.hpp"
#include "session_types.hpp"

struct RegistryConfig {
  SessionSettings default_settings;
  SessionConfig session;
};

// Arena of sessions indexed by session id. The mutex only covers the maps;
// steady-state traffic goes straight to the Session objects.
class SessionRegistry {
public:
  struct JoinResult {
    std::shared_ptr<Session> session;
    Participant participant;
    bool created = false;
  };

  SessionRegistry(asio::io_context& io,
                  RegistryConfig config,
                  std::shared_ptr<PersistenceSink> persistence = nullptr,
                  std::shared_ptr<Logger> logger = nullptr);

  // Joins the active session of the workflow, creating one when none is
  // active. A failed join leaves no trace.
  JoinResult join(const std::string& workflow_id,
                  Participant participant,
                  std::shared_ptr<OutboundChannel> channel,
                  int64_t now);

  bool leave(const std::string& session_id, const std::string& user_id, int64_t now);

  // Disconnect path: removes whichever participant is bound to the connection.
  std::vector<std::pair<std::string, std::string>> leave_connection(const std::string& connection_id, int64_t now);

  void update_settings(const std::string& session_id,
                       const std::string& requester,
                       const SessionSettings& settings);

  // Idempotent. Throws UnknownSession for ids the registry never held.
  bool end(const std::string& session_id, const std::string& reason, int64_t now);

  std::shared_ptr<Session> find(const std::string& session_id) const;
  std::shared_ptr<Session> require(const std::string& session_id) const;
  std::shared_ptr<Session> active_for_workflow(const std::string& workflow_id) const;
  std::vector<std::shared_ptr<Session>> sessions() const;

  // Ends idle empty sessions and drops ended ones from the arena.
  std::vector<std::string> sweep_idle(int64_t now);

  SessionStats stats(const std::string& session_id, int64_t now) const;
  std::vector<Operation> range(const std::string& session_id, uint64_t from_version, uint64_t to_version = 0) const;
  std::vector<Operation> by_target(const std::string& session_id, TargetKind kind, const std::string& target_id) const;

  std::size_t active_count() const;
  std::size_t size() const;

  const RegistryConfig& config() const { return config_; }

private:
  asio::io_context& io_;
  RegistryConfig config_;
  std::shared_ptr<PersistenceSink> persistence_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  std::map<std::string, std::shared_ptr<Session>> sessions_;
  std::map<std::string, std::string> active_by_workflow_;
};
