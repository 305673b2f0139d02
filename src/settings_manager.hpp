#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","listen_port"},          {"aliases", {"lp","port"}},      {"type","int"},    {"default",9400},       {"min",0}, {"max",65535}, {"description","TCP port to listen on (0 picks a free port)"}, {"persistent", true}},
  {{"key","listen_ip"},            {"aliases", {"li","ip"}},        {"type","string"}, {"default","127.0.0.1"}, {"description","Interface/IP to bind"}, {"persistent", true}},
  {{"key","io_threads"},           {"aliases", {"threads","t"}},    {"type","int"},    {"default",2},          {"min",1}, {"max",64}, {"description","Threads running the io_context"}, {"persistent", true}},
  {{"key","max_participants"},     {"aliases", {"mp"}},             {"type","int"},    {"default",10},         {"min",1}, {"max",10000}, {"description","Default participant cap for new sessions"}, {"persistent", true}},
  {{"key","allowed_roles"},        {"aliases", {"roles"}},          {"type","json"},   {"default",{"owner","editor","viewer"}}, {"description","Default roles allowed to join new sessions"}, {"persistent", true}},
  {{"key","auto_save"},            {"aliases", {"as"}},             {"type","bool"},   {"default",true},       {"description","Write committed operations through to persistence"}, {"persistent", true}},
  {{"key","idle_timeout_seconds"}, {"aliases", {"idle"}},           {"type","int"},    {"default",300},        {"min",1}, {"description","End sessions left without participants this long"}, {"persistent", true}},
  {{"key","sweep_interval_ms"},    {"aliases", {"sweep"}},          {"type","int"},    {"default",1000},       {"min",10}, {"description","Milliseconds between idle session sweeps"}, {"persistent", true}},
  {{"key","queue_depth"},          {"aliases", {"qd"}},             {"type","int"},    {"default",256},        {"min",1}, {"description","Pending submissions per session before Busy"}, {"persistent", true}},
  {{"key","max_outbound_kb"},      {"aliases", {"outbound"}},       {"type","int"},    {"default",8192},       {"min",1}, {"description","Unsent bytes (KiB) a connection may queue before it is dropped"}, {"persistent", true}},
  {{"key","concurrent_window"},    {"aliases", {"window"}},         {"type","int"},    {"default",1000},       {"min",1}, {"description","Oldest base version accepted, counted back from head"}, {"persistent", true}},
  {{"key","position_gap"},         {"aliases", {"gap"}},            {"type","int"},    {"default",24},         {"min",0}, {"description","Spacing applied when separating overlapping nodes"}, {"persistent", true}},
  {{"key","default_node_width"},   {"aliases", {"nw"}},             {"type","int"},    {"default",200},        {"min",1}, {"description","Width used for nodes added without one"}, {"persistent", true}},
  {{"key","default_node_height"},  {"aliases", {"nh"}},             {"type","int"},    {"default",80},         {"min",1}, {"description","Height used for nodes added without one"}, {"persistent", true}},
  {{"key","data_dir"},             {"aliases", {"data"}},           {"type","string"}, {"default",".collab"},  {"description","Directory for session logs, relative to the workspace (empty disables)"}, {"persistent", true}},
  {{"key","identity_file"},        {"aliases", {"identity","id"}},  {"type","string"}, {"default",""},         {"description","Token digest file; empty trusts claimed identities"}, {"persistent", true}},
  {{"key","verbose"},              {"aliases", {"v"}},              {"type","bool"},   {"default",false},      {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                 {"aliases", {"h","?"}},          {"type","bool"},   {"default",false},      {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                 {"aliases", {"persist"}},        {"type","bool"},   {"default",false},      {"description","Persist current settings to disk"}, {"persistent", false}}
});

// Typed view over SETTINGS_SPECIFICATION. Values are layered by the caller:
// defaults, then the settings file, then COLLAB_* variables, then argv.
class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  // Both accept a key or an alias. On failure the stored value is unchanged.
  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  // Applies PREFIX<KEY> variables (key upper-cased) for every persistent
  // setting. Returns false and names the first bad variable in error.
  bool apply_environment(const std::string& prefix, std::string& error);

  nlohmann::json get_json(bool persistent_only = true) const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);

private:
  enum class SettingType { Bool, Int, Float, String, Json };

  struct SettingSpec {
    std::string key;
    SettingType type = SettingType::String;
    nlohmann::json default_value;
    bool persistent = true;
    std::optional<double> min;
    std::optional<double> max;
  };

  static SettingType parse_type(const std::string& name);
  const SettingSpec* find_spec(const std::string& token) const;

  // Converts value to the declared type and checks bounds; returns null json
  // with error set on failure.
  static nlohmann::json coerce(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  static nlohmann::json parse_text(const SettingSpec& spec, const std::string& text, std::string& error);

  nlohmann::json values_ = nlohmann::json::object();
  std::vector<SettingSpec> specs_;
  std::map<std::string, std::size_t> index_;  // lower-cased key or alias -> specs_ slot
  std::filesystem::path settings_path_override_;
};

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return values_.at(key).get<T>();
}
