#include "errors.hpp"
#include "identity.hpp"
#include "protocol.hpp"
#include "test_fixtures.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <vector>

namespace {

using namespace collab::test;

template<typename Fn>
std::optional<ErrorCode> error_of(Fn&& fn) {
  try {
    fn();
  } catch(const CollabError& e) {
    return e.code();
  }
  return std::nullopt;
}

json wire_node_add() {
  return json{
    {"id", "op-1"},
    {"workflowId", "wf-1"},
    {"authorId", "alice"},
    {"type", "node_add"},
    {"target", {{"kind", "node"}, {"id", "n1"}}},
    {"payload", {{"node", {{"kind", "task"}, {"x", 10}, {"y", 20}, {"data", {{"label", "Start"}}}}}}},
    {"baseVersion", 0},
    {"timestamp", 1234}
  };
}

bool test_decode_operation(TestContext& ctx) {
  auto op = decode_operation(wire_node_add());
  COLLAB_EXPECT(ctx, op.id == "op-1");
  COLLAB_EXPECT(ctx, op.type == OperationType::NodeAdd);
  COLLAB_EXPECT(ctx, op.target.kind == TargetKind::Node);
  COLLAB_EXPECT(ctx, op.status == OperationStatus::Pending);
  COLLAB_EXPECT(ctx, op.timestamp == 1234);
  const auto* add = op.payload_as<NodeAddPayload>();
  COLLAB_EXPECT(ctx, add && add->node.id == "n1");
  COLLAB_EXPECT(ctx, add->node.x == 10 && add->node.y == 20);
  COLLAB_EXPECT(ctx, add->node.data.value("label", "") == "Start");

  json update = {
    {"id", "op-2"},
    {"type", "node_update"},
    {"target", {{"kind", "node"}, {"id", "n1"}}},
    {"payload", {{"geometry", {{"x", 5}}}, {"fields", {{"label", "Go"}}}}}
  };
  auto upd = decode_operation(update);
  const auto* geometry = upd.payload_as<NodeUpdatePayload>();
  COLLAB_EXPECT(ctx, geometry && geometry->geometry.x && *geometry->geometry.x == 5);
  COLLAB_EXPECT(ctx, !geometry->geometry.y);
  COLLAB_EXPECT(ctx, upd.base_version == 0);
  return true;
}

bool test_decode_rejects_malformed(TestContext& ctx) {
  auto wrong_kind = wire_node_add();
  wrong_kind["target"]["kind"] = "edge";
  COLLAB_EXPECT(ctx, error_of([&]{ decode_operation(wrong_kind); }) == ErrorCode::InvalidOperation);

  auto mismatched = wire_node_add();
  mismatched["payload"]["node"]["id"] = "n2";
  COLLAB_EXPECT(ctx, error_of([&]{ decode_operation(mismatched); }) == ErrorCode::InvalidOperation);

  auto unknown = wire_node_add();
  unknown["type"] = "node_explode";
  COLLAB_EXPECT(ctx, error_of([&]{ decode_operation(unknown); }) == ErrorCode::InvalidOperation);

  auto no_target = wire_node_add();
  no_target.erase("target");
  COLLAB_EXPECT(ctx, error_of([&]{ decode_operation(no_target); }) == ErrorCode::InvalidOperation);

  auto bad_number = wire_node_add();
  bad_number["payload"]["node"]["x"] = "far left";
  COLLAB_EXPECT(ctx, error_of([&]{ decode_operation(bad_number); }) == ErrorCode::InvalidOperation);

  json edge = {
    {"id", "op-3"},
    {"type", "edge_add"},
    {"target", {{"kind", "edge"}, {"id", "e1"}}},
    {"payload", {{"edge", {{"source", "n1"}}}}}
  };
  COLLAB_EXPECT(ctx, error_of([&]{ decode_operation(edge); }) == ErrorCode::InvalidOperation);
  COLLAB_EXPECT(ctx, error_of([&]{ decode_operation(json::array()); }) == ErrorCode::InvalidOperation);
  return true;
}

bool test_encode_operation(TestContext& ctx) {
  auto op = node_move("op-9", "bob", "n1", 3, 4, 99, 2);
  op.session_id = "s-1";
  op.committed_version = 3;
  op.status = OperationStatus::Transformed;
  op.winner_id = "op-8";
  json j = op;
  COLLAB_EXPECT(ctx, j["sessionId"] == "s-1");
  COLLAB_EXPECT(ctx, j["authorId"] == "bob");
  COLLAB_EXPECT(ctx, j["type"] == "node_update");
  COLLAB_EXPECT(ctx, j["target"]["kind"] == "node");
  COLLAB_EXPECT(ctx, j["payload"]["geometry"]["x"] == 3);
  COLLAB_EXPECT(ctx, j["baseVersion"] == 2);
  COLLAB_EXPECT(ctx, j["committedVersion"] == 3);
  COLLAB_EXPECT(ctx, j["status"] == "transformed");
  COLLAB_EXPECT(ctx, j["winnerId"] == "op-8");
  COLLAB_EXPECT(ctx, !j.contains("reason"));

  auto back = decode_operation(j);
  COLLAB_EXPECT(ctx, back.type == op.type && back.target == op.target);
  return true;
}

bool test_operation_result_detail(TestContext& ctx) {
  auto op = node_move("op-4", "bob", "n1", 1, 1, 5, 1);
  op.status = OperationStatus::Rejected;
  op.reason = rejection_reason(ErrorCode::TargetDeleted);
  op.conflicting_id = "op-3";
  auto msg = make_operation_result(op);
  COLLAB_EXPECT(ctx, msg["type"] == "operation_result");
  COLLAB_EXPECT(ctx, msg["status"] == "rejected");
  COLLAB_EXPECT(ctx, msg["detail"]["code"] == "TargetDeleted");
  COLLAB_EXPECT(ctx, msg["detail"]["reason"] == "target-deleted");
  COLLAB_EXPECT(ctx, msg["detail"]["targetId"] == "n1");
  COLLAB_EXPECT(ctx, msg["detail"]["conflictingId"] == "op-3");

  op.status = OperationStatus::Applied;
  op.reason.clear();
  auto ok = make_operation_result(op);
  COLLAB_EXPECT(ctx, ok["status"] == "committed");
  COLLAB_EXPECT(ctx, !ok.contains("detail"));

  auto err = make_error(ErrorCode::CapacityExceeded, "full", "join_workflow");
  COLLAB_EXPECT(ctx, err["type"] == "error");
  COLLAB_EXPECT(ctx, err["code"] == "CapacityExceeded");
  COLLAB_EXPECT(ctx, err["request"] == "join_workflow");
  COLLAB_EXPECT(ctx, error_code_from_reason("dangling-reference") == ErrorCode::DanglingReference);
  return true;
}

bool test_settings_and_participants(TestContext& ctx) {
  SessionSettings base;
  auto merged = decode_settings(json{{"maxParticipants", 3}, {"allowedRoles", {"owner", "editor"}}}, base);
  COLLAB_EXPECT(ctx, merged.max_participants == 3);
  COLLAB_EXPECT(ctx, merged.allowed_roles.size() == 2);
  COLLAB_EXPECT(ctx, !merged.allows(Role::Viewer));
  COLLAB_EXPECT(ctx, merged.auto_save == base.auto_save);

  COLLAB_EXPECT(ctx, error_of([&]{ decode_settings(json{{"maxParticipants", -1}}, base); }) == ErrorCode::InvalidSettings);
  COLLAB_EXPECT(ctx, error_of([&]{ decode_settings(json{{"allowedRoles", {"king"}}}, base); }) == ErrorCode::InvalidSettings);
  COLLAB_EXPECT(ctx, error_of([&]{ decode_settings(json{{"autoSave", "yes"}}, base); }) == ErrorCode::InvalidSettings);

  json encoded = merged;
  COLLAB_EXPECT(ctx, encoded["maxParticipants"] == 3);
  COLLAB_EXPECT(ctx, encoded["allowedRoles"] == json({"owner", "editor"}));

  auto p = decode_participant(json{{"userId", "alice"}, {"role", "owner"}});
  COLLAB_EXPECT(ctx, p.role == Role::Owner);
  COLLAB_EXPECT(ctx, p.display_name == "alice");
  COLLAB_EXPECT(ctx, error_of([&]{ decode_participant(json{{"userId", "x"}, {"role", "admin"}}); }) == ErrorCode::RoleNotAllowed);
  COLLAB_EXPECT(ctx, error_of([&]{ decode_participant(json{{"role", "owner"}}); }) == ErrorCode::InvalidOperation);

  auto presence = decode_presence(json{
    {"status", "away"},
    {"cursor", {{"x", 4}, {"y", 5}, {"nodeId", "n1"}}},
    {"selection", {{"nodeIds", {"n1", "n2"}}}},
    {"updatedAt", 77}
  });
  COLLAB_EXPECT(ctx, presence.status == PresenceStatus::Away);
  COLLAB_EXPECT(ctx, presence.cursor && presence.cursor->node_id == std::optional<std::string>("n1"));
  COLLAB_EXPECT(ctx, presence.selection.node_ids.size() == 2);
  COLLAB_EXPECT(ctx, presence.updated_at == 77);
  COLLAB_EXPECT(ctx, error_of([&]{ decode_presence(json{{"status", "asleep"}}); }) == ErrorCode::InvalidOperation);
  return true;
}

bool test_token_identity(TestContext& ctx) {
  auto dir = std::filesystem::temp_directory_path() / "collab_protocol_runner";
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  auto path = dir / "identity.json";
  {
    std::ofstream out(path, std::ios::trunc);
    json entry = {
      {"sha256", "D7ECDF25EAF3DEBA0F2628771DBDD22D4138AB6CF38F91ED02A2CA0DEC7C8AB7"},
      {"user_id", "alice"},
      {"role", "owner"}
    };
    json doc = json::object();
    doc["tokens"] = json::array({entry});
    out << doc.dump();
  }

  TokenIdentityVerifier verifier;
  std::string error;
  COLLAB_EXPECT(ctx, verifier.load_from_file(path, error));
  verifier.add_token("bob-token", "bob", Role::Editor);
  COLLAB_EXPECT(ctx, verifier.size() == 2);

  Participant claim;
  claim.user_id = "alice";
  claim.role = Role::Viewer;
  auto verified = verifier.verify(claim, "open-sesame");
  COLLAB_EXPECT(ctx, verified.user_id == "alice");
  COLLAB_EXPECT(ctx, verified.role == Role::Owner);

  COLLAB_EXPECT(ctx, error_of([&]{ verifier.verify(claim, ""); }) == ErrorCode::Unauthenticated);
  COLLAB_EXPECT(ctx, error_of([&]{ verifier.verify(claim, "wrong"); }) == ErrorCode::Unauthenticated);
  COLLAB_EXPECT(ctx, error_of([&]{ verifier.verify(claim, "bob-token"); }) == ErrorCode::Unauthenticated);

  TrustingIdentityVerifier trusting;
  COLLAB_EXPECT(ctx, trusting.verify(claim, "").role == Role::Viewer);
  COLLAB_EXPECT(ctx, sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  TokenIdentityVerifier missing;
  COLLAB_EXPECT(ctx, !missing.load_from_file(dir / "absent.json", error));
  COLLAB_EXPECT(ctx, !error.empty());
  std::filesystem::remove_all(dir, ec);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  collab::test::LogCapture logs;
  TestContext ctx{logs, collab::test::verbose_requested(argc, argv)};
  std::vector<TestCase> tests = {
    {"decode_operation", test_decode_operation},
    {"decode_rejects_malformed", test_decode_rejects_malformed},
    {"encode_operation", test_encode_operation},
    {"operation_result_detail", test_operation_result_detail},
    {"settings_and_participants", test_settings_and_participants},
    {"token_identity", test_token_identity},
  };
  return collab::test::run_tests("protocol", tests, ctx);
}
