#include "errors.hpp"
#include "presence_tracker.hpp"
#include "test_fixtures.hpp"
#include "test_runner_utils.hpp"

#include <vector>

namespace {

using namespace collab::test;

Presence at(const std::string& user, int64_t when, double x) {
  Presence p;
  p.user_id = user;
  p.updated_at = when;
  p.cursor = Cursor{x, 0, std::nullopt};
  return p;
}

bool test_last_write_wins(TestContext& ctx) {
  PresenceTracker tracker;
  COLLAB_EXPECT(ctx, tracker.update(at("alice", 10, 1)));
  COLLAB_EXPECT(ctx, tracker.update(at("alice", 20, 2)));
  COLLAB_EXPECT(ctx, !tracker.update(at("alice", 15, 3)));
  auto current = tracker.get("alice");
  COLLAB_EXPECT(ctx, current && current->cursor && current->cursor->x == 2);

  COLLAB_EXPECT(ctx, tracker.update(at("bob", 5, 9)));
  COLLAB_EXPECT(ctx, tracker.size() == 2);
  COLLAB_EXPECT(ctx, tracker.snapshot().size() == 2);
  return true;
}

bool test_remove_reports_offline(TestContext& ctx) {
  PresenceTracker tracker;
  auto p = at("alice", 10, 1);
  p.selection.node_ids = {"n1"};
  p.typing = Typing{"n1", "label"};
  tracker.update(p);

  auto gone = tracker.remove("alice", 50);
  COLLAB_EXPECT(ctx, gone.status == PresenceStatus::Offline);
  COLLAB_EXPECT(ctx, !gone.cursor && !gone.typing);
  COLLAB_EXPECT(ctx, gone.selection.node_ids.empty());
  COLLAB_EXPECT(ctx, gone.updated_at == 50);
  COLLAB_EXPECT(ctx, !tracker.get("alice"));

  auto unknown = tracker.remove("nobody", 60);
  COLLAB_EXPECT(ctx, unknown.user_id == "nobody");
  COLLAB_EXPECT(ctx, unknown.status == PresenceStatus::Offline);
  return true;
}

bool test_session_fans_out_presence(TestContext& ctx) {
  asio::io_context io;
  auto alice = std::make_shared<RecordingChannel>("c-alice");
  auto bob = std::make_shared<RecordingChannel>("c-bob");
  auto session = make_session(io, nullptr, alice, bob);

  session->update_presence("alice", at("ignored", 2000, 42), 2000);
  auto seen = bob->last_of_type("presence_update");
  COLLAB_EXPECT(ctx, seen.has_value());
  COLLAB_EXPECT(ctx, (*seen)["presence"]["userId"] == "alice");
  COLLAB_EXPECT(ctx, (*seen)["presence"]["sessionId"] == "s-1");
  COLLAB_EXPECT(ctx, (*seen)["presence"]["cursor"]["x"] == 42);
  COLLAB_EXPECT(ctx, alice->of_type("presence_update").empty());

  bob->clear();
  session->update_presence("alice", at("alice", 1500, 7), 2100);
  COLLAB_EXPECT(ctx, bob->of_type("presence_update").empty());

  bool refused = false;
  try {
    session->update_presence("mallory", at("mallory", 2200, 1), 2200);
  } catch(const CollabError& e) {
    refused = e.code() == ErrorCode::NotAMember;
  }
  COLLAB_EXPECT(ctx, refused);
  COLLAB_EXPECT(ctx, session->presence().size() == 1);
  return true;
}

bool test_presence_does_not_touch_the_log(TestContext& ctx) {
  asio::io_context io;
  auto session = make_session(io);
  for(int i = 0; i < 5; ++i) {
    session->update_presence("bob", at("bob", 2000 + i, i), 2000 + i);
  }
  COLLAB_EXPECT(ctx, session->head_version() == 0);
  COLLAB_EXPECT(ctx, session->audit().empty());
  return true;
}

} // namespace

int main(int argc, char** argv) {
  collab::test::LogCapture logs;
  TestContext ctx{logs, collab::test::verbose_requested(argc, argv)};
  std::vector<TestCase> tests = {
    {"last_write_wins", test_last_write_wins},
    {"remove_reports_offline", test_remove_reports_offline},
    {"session_fans_out_presence", test_session_fans_out_presence},
    {"presence_does_not_touch_the_log", test_presence_does_not_touch_the_log},
  };
  return collab::test::run_tests("presence", tests, ctx);
}
