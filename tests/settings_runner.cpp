#include "command_line_parser.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

using namespace collab::test;

bool parse_args(SettingsManager& settings, std::vector<std::string> args, std::string& error) {
  std::vector<char*> argv;
  for(auto& arg : args) argv.push_back(arg.data());
  CommandLineParser parser("collabd");
  return parser.parse(static_cast<int>(argv.size()), argv.data(), settings, error);
}

bool test_defaults(TestContext& ctx) {
  SettingsManager settings;
  COLLAB_EXPECT(ctx, settings.get<int>("listen_port") == 9400);
  COLLAB_EXPECT(ctx, settings.get<std::string>("listen_ip") == "127.0.0.1");
  COLLAB_EXPECT(ctx, settings.get<int>("max_participants") == 10);
  COLLAB_EXPECT(ctx, settings.get<nlohmann::json>("allowed_roles").size() == 3);
  COLLAB_EXPECT(ctx, settings.get<bool>("auto_save"));
  COLLAB_EXPECT(ctx, settings.get<int>("concurrent_window") == 1000);
  COLLAB_EXPECT(ctx, settings.get<std::string>("data_dir") == ".collab");
  COLLAB_EXPECT(ctx, !settings.help_requested());
  return true;
}

bool test_bounds_are_checked(TestContext& ctx) {
  SettingsManager settings;
  std::string error;
  COLLAB_EXPECT(ctx, !settings.set_from_string("listen_port", "70000", error));
  COLLAB_EXPECT(ctx, !error.empty());
  COLLAB_EXPECT(ctx, settings.get<int>("listen_port") == 9400);
  COLLAB_EXPECT(ctx, !settings.set_from_string("io_threads", "0", error));
  COLLAB_EXPECT(ctx, !settings.set_from_json("max_participants", "ten", error));
  COLLAB_EXPECT(ctx, settings.set_from_string("threads", "4", error));
  COLLAB_EXPECT(ctx, settings.get<int>("io_threads") == 4);
  COLLAB_EXPECT(ctx, !settings.set_from_string("auto_save", "maybe", error));
  COLLAB_EXPECT(ctx, !settings.set_from_string("no_such_key", "1", error));
  return true;
}

bool test_environment_overrides(TestContext& ctx) {
  SettingsManager settings;
  std::string error;
  ::setenv("COLLAB_QUEUE_DEPTH", "12", 1);
  ::setenv("COLLAB_AUTO_SAVE", "off", 1);
  bool ok = settings.apply_environment("COLLAB_", error);
  ::unsetenv("COLLAB_QUEUE_DEPTH");
  ::unsetenv("COLLAB_AUTO_SAVE");
  COLLAB_EXPECT(ctx, ok);
  COLLAB_EXPECT(ctx, settings.get<int>("queue_depth") == 12);
  COLLAB_EXPECT(ctx, !settings.get<bool>("auto_save"));

  ::setenv("COLLAB_MAX_PARTICIPANTS", "lots", 1);
  ok = settings.apply_environment("COLLAB_", error);
  ::unsetenv("COLLAB_MAX_PARTICIPANTS");
  COLLAB_EXPECT(ctx, !ok);
  COLLAB_EXPECT(ctx, error.find("COLLAB_MAX_PARTICIPANTS") != std::string::npos);
  return true;
}

bool test_command_line(TestContext& ctx) {
  SettingsManager settings;
  std::string error;
  bool ok = parse_args(settings, {"collabd", "9500", "0.0.0.0", "--verbose", "-qd", "7", "--roles", "[\"owner\"]"}, error);
  if(!ok && ctx.verbose) std::cout << "\n    " << error << "\n";
  COLLAB_EXPECT(ctx, ok);
  COLLAB_EXPECT(ctx, settings.get<int>("listen_port") == 9500);
  COLLAB_EXPECT(ctx, settings.get<std::string>("listen_ip") == "0.0.0.0");
  COLLAB_EXPECT(ctx, settings.get<bool>("verbose"));
  COLLAB_EXPECT(ctx, settings.get<int>("queue_depth") == 7);
  COLLAB_EXPECT(ctx, settings.get<nlohmann::json>("allowed_roles") == nlohmann::json::array({"owner"}));

  SettingsManager inline_form;
  COLLAB_EXPECT(ctx, parse_args(inline_form, {"collabd", "--gap=40", "--no-auto_save", "-?"}, error));
  COLLAB_EXPECT(ctx, inline_form.get<int>("position_gap") == 40);
  COLLAB_EXPECT(ctx, !inline_form.get<bool>("auto_save"));
  COLLAB_EXPECT(ctx, inline_form.help_requested());

  SettingsManager other;
  COLLAB_EXPECT(ctx, !parse_args(other, {"collabd", "--bogus", "1"}, error));
  COLLAB_EXPECT(ctx, error.find("bogus") != std::string::npos);
  COLLAB_EXPECT(ctx, !parse_args(other, {"collabd", "--queue_depth"}, error));
  COLLAB_EXPECT(ctx, !parse_args(other, {"collabd", "1", "2", "3"}, error));
  COLLAB_EXPECT(ctx, !parse_args(other, {"collabd", "--listen_port", "-5"}, error));
  return true;
}

bool test_save_and_load(TestContext& ctx) {
  auto dir = std::filesystem::temp_directory_path() / "collab_settings_runner";
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  auto path = dir / ".config" / "settings.json";

  SettingsManager settings;
  std::string error;
  settings.set_from_string("position_gap", "40", error);
  settings.set_from_string("help", "true", error);
  COLLAB_EXPECT(ctx, settings.save_to_file(path));

  SettingsManager loaded;
  COLLAB_EXPECT(ctx, loaded.load_from_file(path));
  COLLAB_EXPECT(ctx, loaded.get<int>("position_gap") == 40);
  COLLAB_EXPECT(ctx, !loaded.help_requested());
  std::filesystem::remove_all(dir, ec);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  collab::test::LogCapture logs;
  TestContext ctx{logs, collab::test::verbose_requested(argc, argv)};
  std::vector<TestCase> tests = {
    {"defaults", test_defaults},
    {"bounds_are_checked", test_bounds_are_checked},
    {"environment_overrides", test_environment_overrides},
    {"command_line", test_command_line},
    {"save_and_load", test_save_and_load},
  };
  return collab::test::run_tests("settings", tests, ctx);
}
