#pragma once

#include <nlohmann/json.hpp>

#include <string>

// Write end of a participant connection. deliver() queues the message and
// returns immediately; false means the channel is closed.
class OutboundChannel {
public:
  virtual ~OutboundChannel() = default;

  virtual const std::string& channel_id() const = 0;
  virtual bool deliver(const nlohmann::json& message) = 0;
};
