#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "identity.hpp"
#include "log.hpp"
#include "outbound_channel.hpp"
#include "session_registry.hpp"

// Maps wire messages onto registry, pipeline and presence calls. A
// connection is bound to at most one session at a time.
class CollabService {
public:
  CollabService(std::shared_ptr<SessionRegistry> registry,
                std::shared_ptr<IdentityVerifier> identity,
                std::shared_ptr<Logger> logger = nullptr);

  void handle_message(const std::shared_ptr<OutboundChannel>& channel, const nlohmann::json& message);
  void on_disconnected(const std::string& channel_id);

  std::size_t bound_connections() const;
  std::shared_ptr<SessionRegistry> registry() const { return registry_; }

private:
  struct Binding {
    std::string session_id;
    std::string user_id;
    std::weak_ptr<Session> session;
  };

  void handle_join(const std::shared_ptr<OutboundChannel>& channel, const nlohmann::json& message);
  void handle_leave(const std::shared_ptr<OutboundChannel>& channel, const nlohmann::json& message);
  void handle_submit(const std::shared_ptr<OutboundChannel>& channel, const nlohmann::json& message);
  void handle_undo(const std::shared_ptr<OutboundChannel>& channel);
  void handle_presence(const std::shared_ptr<OutboundChannel>& channel, const nlohmann::json& message);
  void handle_sync(const std::shared_ptr<OutboundChannel>& channel, const nlohmann::json& message);
  void handle_update_settings(const std::shared_ptr<OutboundChannel>& channel, const nlohmann::json& message);
  void handle_end(const std::shared_ptr<OutboundChannel>& channel);
  void handle_stats(const std::shared_ptr<OutboundChannel>& channel);

  // Throws NotAMember when the connection has not joined a live session.
  std::pair<Binding, std::shared_ptr<Session>> require_binding(const std::string& channel_id) const;
  std::optional<Binding> binding(const std::string& channel_id) const;
  void bind(const std::string& channel_id, Binding binding);
  void unbind(const std::string& channel_id);

  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<IdentityVerifier> identity_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  std::map<std::string, Binding> bindings_;
};
