#pragma once

#include <optional>
#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto SettingsManager keys. Accepted forms:
//   --key value, --key=value, -alias value, --no-<bool key>
// plus bare positionals bound to positional_keys in order.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "collabd",
                             nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                             std::vector<std::string> positional_keys = {"listen_port", "listen_ip"});

  // Returns false with a message in error; settings keep the values applied
  // before the failing argument.
  bool parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const;
  void usage() const;

private:
  bool apply_option(const std::vector<std::string>& args,
                    std::size_t& i,
                    std::string name,
                    std::optional<std::string> inline_value,
                    bool long_form,
                    SettingsManager& settings,
                    std::string& error) const;

  static bool looks_like_option(const std::string& token);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  nlohmann::json settings_spec_;
  std::vector<std::string> positional_keys_;
};
