#include "collab_engine.hpp"
#include "connection.hpp"
#include "identity.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "log.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace collab::test;
using namespace std::chrono_literals;
using nlohmann::json;

struct Server {
  std::filesystem::path root;
  std::shared_ptr<SettingsManager> settings;
  std::unique_ptr<CollabEngine> engine;
  LogCapture* logs = nullptr;

  ~Server() {
    if(logs) logs->detach_all();
    if(engine) engine->stop();
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
  }
};

// Starts an engine on an ephemeral loopback port. tweak runs against the
// settings before start().
std::unique_ptr<Server> start_server(TestContext& ctx,
                                     const std::string& name,
                                     const std::function<void(SettingsManager&)>& tweak = nullptr,
                                     std::shared_ptr<IdentityVerifier> identity = nullptr) {
  auto server = std::make_unique<Server>();
  server->root = std::filesystem::temp_directory_path() / "collab_test_runner" / name;
  std::error_code ec;
  std::filesystem::remove_all(server->root, ec);
  std::filesystem::create_directories(server->root, ec);

  server->settings = std::make_shared<SettingsManager>();
  server->settings->set_settings_path(server->root / ".config" / "settings.json");
  std::string error;
  server->settings->set_from_string("listen_port", "0", error);
  server->settings->set_from_string("listen_ip", "127.0.0.1", error);
  server->settings->set_from_string("data_dir", "", error);
  server->settings->set_from_string("verbose", ctx.verbose ? "true" : "false", error);
  if(tweak) tweak(*server->settings);

  CollabEngine::Options options;
  options.workspace_root = server->root;
  options.identity = std::move(identity);
  server->engine = std::make_unique<CollabEngine>(server->settings, options);
  server->logs = &ctx.logs;
  ctx.logs.attach(*server->engine, name);
  server->engine->start();
  server->engine->start_background();
  return server;
}

json join_message(const std::string& workflow, const std::string& user, const std::string& role,
                  const std::string& token = std::string()) {
  json j = {
    {"type", "join_workflow"},
    {"workflowId", workflow},
    {"participant", {{"userId", user}, {"displayName", user}, {"role", role}}}
  };
  if(!token.empty()) j["token"] = token;
  return j;
}

json node_add_message(const std::string& id, const std::string& node_id, double x, double y,
                      uint64_t base, int64_t ts) {
  json op = {
    {"id", id},
    {"type", "node_add"},
    {"target", {{"kind", "node"}, {"id", node_id}}},
    {"payload", {{"node", {{"kind", "task"}, {"x", x}, {"y", y}, {"width", 100}, {"height", 50}}}}},
    {"baseVersion", base},
    {"timestamp", ts}
  };
  return {{"type", "submit_operation"}, {"operation", op}};
}

json node_move_message(const std::string& id, const std::string& node_id, double x, double y,
                       uint64_t base, int64_t ts) {
  json op = {
    {"id", id},
    {"type", "node_update"},
    {"target", {{"kind", "node"}, {"id", node_id}}},
    {"payload", {{"geometry", {{"x", x}, {"y", y}}}}},
    {"baseVersion", base},
    {"timestamp", ts}
  };
  return {{"type", "submit_operation"}, {"operation", op}};
}

json node_delete_message(const std::string& id, const std::string& node_id, uint64_t base, int64_t ts) {
  json op = {
    {"id", id},
    {"type", "node_delete"},
    {"target", {{"kind", "node"}, {"id", node_id}}},
    {"baseVersion", base},
    {"timestamp", ts}
  };
  return {{"type", "submit_operation"}, {"operation", op}};
}

std::optional<json> result_for(TestClient& client, const std::string& op_id) {
  return client.wait_for_match([&](const json& m){
    return m.value("type", "") == "operation_result" &&
           m.contains("operation") && m["operation"].value("id", "") == op_id;
  });
}

std::optional<json> error_for(TestClient& client, const std::string& request) {
  return client.wait_for_match([&](const json& m){
    return m.value("type", "") == "error" && m.value("request", "") == request;
  });
}

bool test_join_and_commit(TestContext& ctx) {
  auto server = start_server(ctx, "join_and_commit");
  const uint16_t port = server->engine->listen_port();
  COLLAB_EXPECT(ctx, port != 0);

  TestClient alice, bob;
  COLLAB_EXPECT(ctx, alice.connect(port));
  COLLAB_EXPECT(ctx, bob.connect(port));

  alice.send(join_message("wf-e2e", "alice", "owner"));
  auto joined = alice.wait_for("session_joined");
  COLLAB_EXPECT(ctx, joined.has_value());
  COLLAB_EXPECT(ctx, (*joined)["headVersion"] == 0);
  COLLAB_EXPECT(ctx, (*joined)["session"]["participants"].size() == 1);
  COLLAB_EXPECT(ctx, (*joined)["state"]["nodes"].empty());
  const auto session_id = (*joined)["session"]["sessionId"].get<std::string>();

  bob.send(join_message("wf-e2e", "bob", "editor"));
  auto bob_joined = bob.wait_for("session_joined");
  COLLAB_EXPECT(ctx, bob_joined.has_value());
  COLLAB_EXPECT(ctx, (*bob_joined)["session"]["sessionId"] == session_id);
  auto announced = alice.wait_for("participant_joined");
  COLLAB_EXPECT(ctx, announced.has_value());
  COLLAB_EXPECT(ctx, (*announced)["participant"]["userId"] == "bob");

  alice.send(node_add_message("op-1", "n1", 10, 20, 0, 100));
  auto result = result_for(alice, "op-1");
  COLLAB_EXPECT(ctx, result.has_value());
  COLLAB_EXPECT(ctx, (*result)["status"] == "committed");
  COLLAB_EXPECT(ctx, (*result)["operation"]["committedVersion"] == 1);
  COLLAB_EXPECT(ctx, (*result)["operation"]["authorId"] == "alice");

  auto seen = bob.wait_for("operation_committed");
  COLLAB_EXPECT(ctx, seen.has_value());
  COLLAB_EXPECT(ctx, (*seen)["operation"]["id"] == "op-1");

  TestClient carol;
  COLLAB_EXPECT(ctx, carol.connect(port));
  carol.send(join_message("wf-e2e", "carol", "viewer"));
  auto late = carol.wait_for("session_joined");
  COLLAB_EXPECT(ctx, late.has_value());
  COLLAB_EXPECT(ctx, (*late)["headVersion"] == 1);
  COLLAB_EXPECT(ctx, (*late)["state"]["nodes"].size() == 1);
  COLLAB_EXPECT(ctx, (*late)["state"]["nodes"][0]["x"] == 10);

  COLLAB_EXPECT(ctx, wait_for_condition([&]{
    auto stats = server->engine->stats();
    return stats.active_sessions == 1 && stats.participants == 3 && stats.committed_operations == 1;
  }, 3s));
  return true;
}

bool test_concurrent_delete_wins(TestContext& ctx) {
  auto server = start_server(ctx, "concurrent_delete_wins");
  const uint16_t port = server->engine->listen_port();

  TestClient alice, bob;
  COLLAB_EXPECT(ctx, alice.connect(port) && bob.connect(port));
  alice.send(join_message("wf-conflict", "alice", "owner"));
  COLLAB_EXPECT(ctx, alice.wait_for("session_joined").has_value());
  bob.send(join_message("wf-conflict", "bob", "editor"));
  COLLAB_EXPECT(ctx, bob.wait_for("session_joined").has_value());

  alice.send(node_add_message("add", "n1", 0, 0, 0, 1));
  COLLAB_EXPECT(ctx, result_for(alice, "add").has_value());

  // Both edits are based on version 1; the delete reaches the server first.
  alice.send(node_delete_message("del", "n1", 1, 10));
  auto del = result_for(alice, "del");
  COLLAB_EXPECT(ctx, del.has_value());
  COLLAB_EXPECT(ctx, (*del)["status"] == "committed");

  bob.send(node_move_message("move", "n1", 50, 50, 1, 5));
  auto move = result_for(bob, "move");
  COLLAB_EXPECT(ctx, move.has_value());
  COLLAB_EXPECT(ctx, (*move)["status"] == "rejected");
  COLLAB_EXPECT(ctx, (*move)["operation"]["reason"] == "target-deleted");
  COLLAB_EXPECT(ctx, (*move)["detail"]["code"] == "TargetDeleted");
  COLLAB_EXPECT(ctx, (*move)["detail"]["conflictingId"] == "del");

  COLLAB_EXPECT(ctx, alice.wait_for("conflict_detected").has_value());

  bob.send({{"type", "sync_request"}, {"fromVersion", 1}});
  auto sync = bob.wait_for("sync_response");
  COLLAB_EXPECT(ctx, sync.has_value());
  COLLAB_EXPECT(ctx, (*sync)["headVersion"] == 2);
  COLLAB_EXPECT(ctx, (*sync)["operations"].size() == 2);
  COLLAB_EXPECT(ctx, (*sync)["operations"][1]["id"] == "del");
  return true;
}

bool test_presence_and_departure(TestContext& ctx) {
  auto server = start_server(ctx, "presence_and_departure");
  const uint16_t port = server->engine->listen_port();

  TestClient alice;
  auto bob = std::make_unique<TestClient>();
  COLLAB_EXPECT(ctx, alice.connect(port) && bob->connect(port));
  alice.send(join_message("wf-presence", "alice", "owner"));
  COLLAB_EXPECT(ctx, alice.wait_for("session_joined").has_value());
  bob->send(join_message("wf-presence", "bob", "editor"));
  COLLAB_EXPECT(ctx, bob->wait_for("session_joined").has_value());

  alice.send({
    {"type", "presence_update"},
    {"presence", {{"cursor", {{"x", 5}, {"y", 6}}}, {"updatedAt", 100}}}
  });
  auto cursor = bob->wait_for_match([](const json& m){
    return m.value("type", "") == "presence_update" &&
           m["presence"].value("userId", "") == "alice" &&
           m["presence"]["cursor"].is_object();
  });
  COLLAB_EXPECT(ctx, cursor.has_value());
  COLLAB_EXPECT(ctx, (*cursor)["presence"]["cursor"]["x"] == 5);

  bob->send({{"type", "session_stats"}});
  auto stats = bob->wait_for("session_stats");
  COLLAB_EXPECT(ctx, stats.has_value());
  COLLAB_EXPECT(ctx, (*stats)["stats"]["participants"] == 2);
  COLLAB_EXPECT(ctx, (*stats)["stats"]["headVersion"] == 0);

  bob->close();
  bob.reset();
  auto left = alice.wait_for("participant_left");
  COLLAB_EXPECT(ctx, left.has_value());
  COLLAB_EXPECT(ctx, (*left)["userId"] == "bob");
  COLLAB_EXPECT(ctx, wait_for_condition([&]{
    return server->engine->stats().participants == 1;
  }, 3s));
  return true;
}

bool test_admission_errors(TestContext& ctx) {
  auto server = start_server(ctx, "admission_errors", [](SettingsManager& settings){
    std::string error;
    settings.set_from_string("max_participants", "2", error);
    settings.set_from_string("allowed_roles", "[\"owner\",\"editor\",\"viewer\"]", error);
  });
  const uint16_t port = server->engine->listen_port();

  TestClient alice, vera, zed;
  COLLAB_EXPECT(ctx, alice.connect(port) && vera.connect(port) && zed.connect(port));

  alice.send(node_add_message("early", "n1", 0, 0, 0, 1));
  auto early = error_for(alice, "submit_operation");
  COLLAB_EXPECT(ctx, early.has_value());
  COLLAB_EXPECT(ctx, (*early)["code"] == "NotAMember");

  alice.send(join_message("wf-admission", "alice", "owner"));
  COLLAB_EXPECT(ctx, alice.wait_for("session_joined").has_value());
  vera.send(join_message("wf-admission", "vera", "viewer"));
  COLLAB_EXPECT(ctx, vera.wait_for("session_joined").has_value());

  zed.send(join_message("wf-admission", "zed", "editor"));
  auto full = error_for(zed, "join_workflow");
  COLLAB_EXPECT(ctx, full.has_value());
  COLLAB_EXPECT(ctx, (*full)["code"] == "CapacityExceeded");

  vera.send(node_add_message("viewer-op", "n1", 0, 0, 0, 1));
  auto refused = result_for(vera, "viewer-op");
  COLLAB_EXPECT(ctx, refused.has_value());
  COLLAB_EXPECT(ctx, (*refused)["status"] == "rejected");
  COLLAB_EXPECT(ctx, (*refused)["operation"]["reason"] == "permission-denied");

  vera.send({{"type", "update_settings"}, {"settings", {{"maxParticipants", 5}}}});
  auto denied = error_for(vera, "update_settings");
  COLLAB_EXPECT(ctx, denied.has_value());
  COLLAB_EXPECT(ctx, (*denied)["code"] == "PermissionDenied");

  alice.send({{"type", "update_settings"}, {"settings", {{"maxParticipants", 3}}}});
  auto updated = vera.wait_for("settings_updated");
  COLLAB_EXPECT(ctx, updated.has_value());
  COLLAB_EXPECT(ctx, (*updated)["settings"]["maxParticipants"] == 3);

  zed.send(join_message("wf-admission", "zed", "editor"));
  COLLAB_EXPECT(ctx, zed.wait_for("session_joined").has_value());
  return true;
}

bool test_malformed_input(TestContext& ctx) {
  auto server = start_server(ctx, "malformed_input");
  const uint16_t port = server->engine->listen_port();

  TestClient client;
  COLLAB_EXPECT(ctx, client.connect(port));
  client.send_raw("this is not json\n");
  client.send({{"hello", "world"}});
  auto untyped = client.wait_for("error");
  COLLAB_EXPECT(ctx, untyped.has_value());
  COLLAB_EXPECT(ctx, (*untyped)["code"] == "InvalidOperation");

  client.send({{"type", "teleport"}});
  auto unknown = error_for(client, "teleport");
  COLLAB_EXPECT(ctx, unknown.has_value());

  client.send(join_message("wf-malformed", "alice", "owner"));
  COLLAB_EXPECT(ctx, client.wait_for("session_joined").has_value());

  client.send({{"type", "submit_operation"}, {"operation", {{"id", "broken"}, {"type", "node_add"}}}});
  auto broken = error_for(client, "submit_operation");
  COLLAB_EXPECT(ctx, broken.has_value());
  COLLAB_EXPECT(ctx, (*broken)["code"] == "InvalidOperation");
  COLLAB_EXPECT(ctx, !client.disconnected());
  return true;
}

bool test_end_session(TestContext& ctx) {
  auto server = start_server(ctx, "end_session");
  const uint16_t port = server->engine->listen_port();

  TestClient alice, bob;
  COLLAB_EXPECT(ctx, alice.connect(port) && bob.connect(port));
  alice.send(join_message("wf-end", "alice", "owner"));
  auto first = alice.wait_for("session_joined");
  COLLAB_EXPECT(ctx, first.has_value());
  bob.send(join_message("wf-end", "bob", "editor"));
  COLLAB_EXPECT(ctx, bob.wait_for("session_joined").has_value());

  bob.send({{"type", "end_session"}});
  auto denied = error_for(bob, "end_session");
  COLLAB_EXPECT(ctx, denied.has_value());
  COLLAB_EXPECT(ctx, (*denied)["code"] == "PermissionDenied");

  alice.send({{"type", "end_session"}});
  auto ended = bob.wait_for("session_ended");
  COLLAB_EXPECT(ctx, ended.has_value());
  COLLAB_EXPECT(ctx, (*ended)["reason"] == "ended-by-owner");
  COLLAB_EXPECT(ctx, alice.wait_for("session_ended").has_value());

  alice.send(node_add_message("late", "n1", 0, 0, 0, 1));
  auto late = error_for(alice, "submit_operation");
  COLLAB_EXPECT(ctx, late.has_value());
  COLLAB_EXPECT(ctx, (*late)["code"] == "NotAMember");

  alice.send(join_message("wf-end", "alice", "owner"));
  auto second = alice.wait_for("session_joined");
  COLLAB_EXPECT(ctx, second.has_value());
  COLLAB_EXPECT(ctx, (*second)["session"]["sessionId"] != (*first)["session"]["sessionId"]);
  COLLAB_EXPECT(ctx, (*second)["headVersion"] == 0);
  return true;
}

bool test_persistence_and_idle_sweep(TestContext& ctx) {
  auto server = start_server(ctx, "persistence_and_idle_sweep", [](SettingsManager& settings){
    std::string error;
    settings.set_from_string("data_dir", "data", error);
    settings.set_from_string("idle_timeout_seconds", "1", error);
    settings.set_from_string("sweep_interval_ms", "50", error);
  });
  const uint16_t port = server->engine->listen_port();

  auto alice = std::make_unique<TestClient>();
  COLLAB_EXPECT(ctx, alice->connect(port));
  alice->send(join_message("wf-saved", "alice", "owner"));
  auto joined = alice->wait_for("session_joined");
  COLLAB_EXPECT(ctx, joined.has_value());
  const auto session_id = (*joined)["session"]["sessionId"].get<std::string>();

  alice->send(node_add_message("saved-1", "n1", 0, 0, 0, 1));
  COLLAB_EXPECT(ctx, result_for(*alice, "saved-1").has_value());

  const auto ops_file = server->root / "data" / (session_id + ".ops.jsonl");
  COLLAB_EXPECT(ctx, wait_for_condition([&]{ return std::filesystem::exists(ops_file); }, 3s));

  alice->close();
  alice.reset();
  COLLAB_EXPECT(ctx, wait_for_condition([&]{
    return server->engine->stats().active_sessions == 0;
  }, 5s));

  const auto session_file = server->root / "data" / (session_id + ".session.json");
  COLLAB_EXPECT(ctx, wait_for_condition([&]{
    std::ifstream in(session_file);
    if(!in) return false;
    auto doc = json::parse(in, nullptr, false);
    return !doc.is_discarded() && doc.value("state", "") == "ended";
  }, 3s));
  return true;
}

bool test_token_identity(TestContext& ctx) {
  auto tokens = std::make_shared<TokenIdentityVerifier>();
  tokens->add_token("alice-secret", "alice", Role::Owner);
  auto server = start_server(ctx, "token_identity", nullptr, tokens);
  const uint16_t port = server->engine->listen_port();

  TestClient client;
  COLLAB_EXPECT(ctx, client.connect(port));
  client.send(join_message("wf-token", "alice", "owner"));
  auto missing = error_for(client, "join_workflow");
  COLLAB_EXPECT(ctx, missing.has_value());
  COLLAB_EXPECT(ctx, (*missing)["code"] == "Unauthenticated");

  client.send(join_message("wf-token", "alice", "owner", "wrong"));
  auto wrong = error_for(client, "join_workflow");
  COLLAB_EXPECT(ctx, wrong.has_value());
  COLLAB_EXPECT(ctx, (*wrong)["code"] == "Unauthenticated");

  client.send(join_message("wf-token", "alice", "editor", "alice-secret"));
  auto joined = client.wait_for("session_joined");
  COLLAB_EXPECT(ctx, joined.has_value());
  auto participant = (*joined)["session"]["participants"][0];
  COLLAB_EXPECT(ctx, participant["userId"] == "alice");
  COLLAB_EXPECT(ctx, participant["role"] == "owner");
  return true;
}

bool test_undo_over_the_wire(TestContext& ctx) {
  auto server = start_server(ctx, "undo_over_the_wire");
  const uint16_t port = server->engine->listen_port();

  TestClient alice, bob;
  COLLAB_EXPECT(ctx, alice.connect(port) && bob.connect(port));
  alice.send(join_message("wf-undo", "alice", "owner"));
  COLLAB_EXPECT(ctx, alice.wait_for("session_joined").has_value());
  bob.send(join_message("wf-undo", "bob", "editor"));
  COLLAB_EXPECT(ctx, bob.wait_for("session_joined").has_value());

  bob.send({{"type", "undo"}});
  auto nothing = error_for(bob, "undo");
  COLLAB_EXPECT(ctx, nothing.has_value());
  COLLAB_EXPECT(ctx, (*nothing)["code"] == "InvalidOperation");

  alice.send(node_add_message("add", "n1", 0, 0, 0, 1));
  COLLAB_EXPECT(ctx, result_for(alice, "add").has_value());
  alice.send(node_move_message("move", "n1", 500, 40, 1, 2));
  COLLAB_EXPECT(ctx, result_for(alice, "move").has_value());

  alice.send({{"type", "undo"}});
  auto undone = result_for(alice, "move~undo");
  COLLAB_EXPECT(ctx, undone.has_value());
  COLLAB_EXPECT(ctx, (*undone)["status"] == "committed");
  COLLAB_EXPECT(ctx, (*undone)["operation"]["committedVersion"] == 3);

  auto seen = bob.wait_for_match([](const json& m){
    return m.value("type", "") == "operation_committed" && m["operation"].value("id", "") == "move~undo";
  });
  COLLAB_EXPECT(ctx, seen.has_value());

  bob.send({{"type", "sync_request"}, {"fromVersion", 1}});
  auto sync = bob.wait_for("sync_response");
  COLLAB_EXPECT(ctx, sync.has_value());
  COLLAB_EXPECT(ctx, (*sync)["headVersion"] == 3);
  return true;
}

bool test_slow_reader_is_dropped(TestContext&) {
  asio::io_context io;
  asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  asio::ip::tcp::socket peer(io);
  peer.connect(acceptor.local_endpoint());
  asio::ip::tcp::socket accepted(asio::make_strand(io));
  acceptor.accept(accepted);

  // The peer never reads, so once the kernel buffers fill the backlog grows
  // until the connection gives up on it.
  std::atomic<bool> closed{false};
  auto conn = Connection::create_incoming(std::move(accepted), nullptr,
                                          [&](const std::string&){ closed = true; },
                                          nullptr, 64 * 1024);
  auto work = asio::make_work_guard(io);
  std::thread runner([&]{ io.run(); });

  const json filler = {{"type", "filler"}, {"data", std::string(1024, 'x')}};
  bool refused = false;
  for(int i = 0; i < 200000 && !refused; ++i) {
    refused = !conn->deliver(filler);
  }
  const bool reported = wait_for_condition([&]{ return closed.load(); }, 3s);
  const bool open_after = conn->is_open();
  const bool later_refused = !conn->deliver({{"type", "late"}});

  work.reset();
  io.stop();
  runner.join();
  std::error_code ec;
  peer.close(ec);
  return refused && reported && !open_after && later_refused;
}

} // namespace

int main(int argc, char** argv) {
  collab::test::LogCapture logs;
  TestContext ctx{logs, collab::test::verbose_requested(argc, argv)};
  std::vector<TestCase> tests = {
    {"join_and_commit", test_join_and_commit},
    {"concurrent_delete_wins", test_concurrent_delete_wins},
    {"presence_and_departure", test_presence_and_departure},
    {"admission_errors", test_admission_errors},
    {"malformed_input", test_malformed_input},
    {"end_session", test_end_session},
    {"persistence_and_idle_sweep", test_persistence_and_idle_sweep},
    {"token_identity", test_token_identity},
    {"undo_over_the_wire", test_undo_over_the_wire},
    {"slow_reader_is_dropped", test_slow_reader_is_dropped},
  };
  int rc = collab::test::run_tests("collab", tests, ctx);
  std::error_code ec;
  std::filesystem::remove_all(std::filesystem::temp_directory_path() / "collab_test_runner", ec);
  return rc;
}
