#include "command_line_parser.hpp"

#include <cctype>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     std::vector<std::string> positional_keys)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    positional_keys_(std::move(positional_keys)) {
  SettingsManager known(settings_spec_);
  for(const auto& key : positional_keys_) {
    if(!known.resolve_key(key)) {
      throw std::runtime_error("positional argument bound to unknown setting '" + key + "'");
    }
  }
}

bool CommandLineParser::looks_like_option(const std::string& token) {
  if(token.rfind("--", 0) == 0) return token.size() > 2;
  // "-5" and "-.5" are values, "-qd" and "-?" are aliases.
  return token.size() >= 2 && token[0] == '-' &&
         !std::isdigit(static_cast<unsigned char>(token[1])) && token[1] != '.';
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  static const char* literals[] = {"true", "false", "on", "off", "1", "0", "yes", "no"};
  auto lowered = SettingsManager::to_lower(SettingsManager::trim_copy(value));
  for(const char* literal : literals) {
    if(lowered == literal) return true;
  }
  return false;
}

bool CommandLineParser::apply_option(const std::vector<std::string>& args,
                                     std::size_t& i,
                                     std::string name,
                                     std::optional<std::string> inline_value,
                                     bool long_form,
                                     SettingsManager& settings,
                                     std::string& error) const {
  const std::string shown = (long_form ? "--" : "-") + name;
  auto key = settings.resolve_key(name);
  if(!key && long_form && name.rfind("no-", 0) == 0 && !inline_value) {
    auto negated = settings.resolve_key(name.substr(3));
    if(negated && settings.is_bool_setting(*negated)) {
      key = negated;
      inline_value = "false";
    }
  }
  if(!key) {
    error = "Unknown option " + shown;
    return false;
  }

  std::string value;
  if(inline_value) {
    value = *inline_value;
  } else if(settings.is_bool_setting(*key)) {
    // A bare boolean flag means true; a following literal overrides it.
    bool explicit_value = i + 1 < args.size() && !looks_like_option(args[i + 1]) && is_bool_literal(args[i + 1]);
    value = explicit_value ? args[++i] : "true";
  } else if(i + 1 < args.size()) {
    value = args[++i];
  } else {
    error = "Missing value for option " + shown;
    return false;
  }

  std::string why;
  if(!settings.set_from_string(*key, value, why)) {
    error = "Invalid value for option " + shown + " '" + value + "': " + why;
    return false;
  }
  return true;
}

bool CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const {
  error.clear();
  std::vector<std::string> args;
  if(argv && argc > 1) args.assign(argv + 1, argv + argc);

  std::size_t next_positional = 0;
  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];
    if(looks_like_option(token)) {
      const bool long_form = token[1] == '-';
      std::string body = token.substr(long_form ? 2 : 1);
      std::optional<std::string> inline_value;
      if(auto eq = body.find('='); eq != std::string::npos) {
        inline_value = body.substr(eq + 1);
        body.erase(eq);
      }
      if(!apply_option(args, i, body, inline_value, long_form, settings, error)) return false;
      continue;
    }

    if(next_positional >= positional_keys_.size()) {
      error = "Unexpected positional argument '" + token + "'";
      return false;
    }
    const auto& key = positional_keys_[next_positional++];
    std::string why;
    if(!settings.set_from_string(key, token, why)) {
      error = "Invalid value for " + key + " '" + token + "': " + why;
      return false;
    }
  }
  return true;
}

void CommandLineParser::usage() const {
  std::string synopsis = process_name_ + " [options]";
  for(const auto& key : positional_keys_) synopsis += " [" + key + "]";

  print_out(nullptr, "{} - collaborative workflow editing server", process_name_);
  print_out(nullptr, "Usage: {}", synopsis);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings_spec_) {
    const auto key = entry.at("key").get<std::string>();
    const auto type = entry.at("type").get<std::string>();
    const auto& fallback = entry.at("default");

    std::string hint = type == "bool" ? "[true|false]" : "<" + type + ">";
    std::string shown_default = fallback.is_string() ? fallback.get<std::string>() : fallback.dump();
    std::string range;
    if(entry.contains("min") && entry.contains("max")) {
      range = fmt::format(", {}..{}", entry["min"].dump(), entry["max"].dump());
    } else if(entry.contains("min")) {
      range = fmt::format(", >= {}", entry["min"].dump());
    }
    std::string aliases;
    for(const auto& alias : entry.value("aliases", nlohmann::json::array())) {
      aliases += aliases.empty() ? " (alias: -" : ", -";
      aliases += alias.get<std::string>();
    }
    if(!aliases.empty()) aliases += ")";

    print_out(nullptr, "  --{} {:<14} {}{} (default: {}{})",
              key, hint, entry.value("description", ""), aliases, shown_default, range);
  }
  print_out(nullptr, "");
  print_out(nullptr, "Boolean options also accept --no-<key>.");
  print_out(nullptr, "Every persistent option can also be set as COLLAB_<KEY> in the environment.");
}
