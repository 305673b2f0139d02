#pragma once

#include "operation.hpp"
#include "session.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace collab::test {

inline Operation make_op(const std::string& id,
                         const std::string& author,
                         OperationType type,
                         const std::string& target_id,
                         int64_t timestamp,
                         uint64_t base_version) {
  Operation op;
  op.id = id;
  op.workflow_id = "wf-1";
  op.author_id = author;
  op.type = type;
  op.target = Target{expected_target_kind(type), target_id};
  op.payload = default_payload_for(type);
  op.timestamp = timestamp;
  op.base_version = base_version;
  return op;
}

inline Operation node_add(const std::string& id, const std::string& node_id,
                          double x, double y, int64_t ts = 1, uint64_t base = 0,
                          const std::string& author = "alice") {
  auto op = make_op(id, author, OperationType::NodeAdd, node_id, ts, base);
  NodeAddPayload p;
  p.node.id = node_id;
  p.node.kind = "task";
  p.node.x = x;
  p.node.y = y;
  p.node.width = 100;
  p.node.height = 50;
  op.payload = p;
  return op;
}

inline Operation node_move(const std::string& id, const std::string& author,
                           const std::string& node_id, double x, double y,
                           int64_t ts, uint64_t base) {
  auto op = make_op(id, author, OperationType::NodeUpdate, node_id, ts, base);
  NodeUpdatePayload p;
  p.geometry.x = x;
  p.geometry.y = y;
  op.payload = p;
  return op;
}

inline Operation node_delete(const std::string& id, const std::string& author,
                             const std::string& node_id, int64_t ts, uint64_t base) {
  return make_op(id, author, OperationType::NodeDelete, node_id, ts, base);
}

inline Operation edge_add(const std::string& id, const std::string& author,
                          const std::string& edge_id, const std::string& source,
                          const std::string& target, int64_t ts, uint64_t base) {
  auto op = make_op(id, author, OperationType::EdgeAdd, edge_id, ts, base);
  EdgeAddPayload p;
  p.edge.id = edge_id;
  p.edge.source = source;
  p.edge.target = target;
  op.payload = p;
  return op;
}

inline Operation property_update(const std::string& id, const std::string& author,
                                 const std::string& node_id, const nlohmann::json& properties,
                                 int64_t ts, uint64_t base) {
  auto op = make_op(id, author, OperationType::PropertyUpdate, node_id, ts, base);
  PropertyUpdatePayload p;
  p.properties = properties;
  op.payload = p;
  return op;
}

// Session with alice (owner) and bob (editor) already joined.
inline std::shared_ptr<Session> make_session(asio::io_context& io,
                                             std::shared_ptr<PersistenceSink> persistence = nullptr,
                                             std::shared_ptr<OutboundChannel> alice = nullptr,
                                             std::shared_ptr<OutboundChannel> bob = nullptr) {
  SessionConfig config;
  config.position_gap = 20;
  auto session = std::make_shared<Session>(io, "s-1", "wf-1", "alice", SessionSettings{},
                                           config, std::move(persistence), 1000);
  Participant a;
  a.user_id = "alice";
  a.role = Role::Owner;
  a.connection_id = "c-alice";
  session->add_participant(a, std::move(alice), 1000);
  Participant b;
  b.user_id = "bob";
  b.role = Role::Editor;
  b.connection_id = "c-bob";
  session->add_participant(b, std::move(bob), 1000);
  return session;
}

} // namespace collab::test
