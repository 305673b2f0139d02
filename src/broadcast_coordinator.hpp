#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "conflict_detector.hpp"
#include "log.hpp"
#include "operation.hpp"
#include "outbound_channel.hpp"
#include "presence_tracker.hpp"

// Fan-out for one session. Calls made from the session's commit strand reach
// every channel in commit order because each channel queues in call order.
class BroadcastCoordinator {
public:
  BroadcastCoordinator(std::string session_id, std::shared_ptr<Logger> logger = nullptr);

  void attach(const std::string& user_id, std::shared_ptr<OutboundChannel> channel);
  void detach(const std::string& user_id);
  bool attached(const std::string& user_id) const;
  std::size_t channel_count() const;

  // operation_committed to every participant except exclude_user.
  std::size_t publish(const Operation& committed, const std::string& exclude_user = "");

  bool reply(const std::string& user_id, const nlohmann::json& message);
  std::size_t notify_status(const Operation& op);
  std::size_t announce(const nlohmann::json& message, const std::string& exclude_user = "");
  std::size_t publish_conflict(const Conflict& conflict);
  std::size_t publish_presence(const Presence& presence, const std::string& exclude_user = "");

  void close_all();

private:
  std::size_t fan_out(const nlohmann::json& message, const std::string& exclude_user);

  std::string session_id_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex m_;
  std::map<std::string, std::shared_ptr<OutboundChannel>> channels_;
};
