#include <cpptrace/cpptrace.hpp>
#include <filesystem>
#include <optional>

#include "collab_engine.hpp"
#include "command_line_parser.hpp"
#include "settings_manager.hpp"
#include "log.hpp"

namespace {

// Layers settings file < COLLAB_* environment < argv. Returns an exit code
// when the process should stop before serving.
std::optional<int> configure(SettingsManager& settings, int argc, char** argv) {
  settings.load();

  CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "collabd");
  std::string error;
  if(!settings.apply_environment("COLLAB_", error)) {
    print_err(nullptr, "Invalid environment setting {}", error);
    return 1;
  }
  if(!parser.parse(argc, argv, settings, error)) {
    print_err(nullptr, "{}", error);
    parser.usage();
    return 1;
  }
  if(settings.help_requested()) {
    parser.usage();
    return 0;
  }
  if(settings.save_requested() && !settings.save()) {
    print_err(nullptr, "Unable to persist settings to {}", settings.settings_path().string());
  }
  return std::nullopt;
}

} // namespace

int main(int argc, char** argv){
  try {
    CollabEngine::Options options;
    options.workspace_root = std::filesystem::current_path();
    options.handle_signals = true;

    CollabEngine engine(nullptr, options);
    auto settings = engine.settings();
    settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
    if(auto exit_code = configure(*settings, argc, argv)) {
      return *exit_code;
    }

    engine.start();
    auto logger = engine.logger();
    for(const auto& key : settings->keys()) {
      logger->debug("setting {} = {}", key, settings->value_as_string(key));
    }
    engine.run();
    engine.stop();

    auto stats = engine.stats();
    logger->info("Stopped with {} active sessions, {} committed operations",
                 stats.active_sessions, stats.committed_operations);
    return 0;
  } catch(const std::exception& e) {
    init_logging(false);
    Logger logger("collabd");
    logger.error("Fatal: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
