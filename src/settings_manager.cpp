#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include "log.hpp"

SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

SettingsManager::SettingsManager(const nlohmann::json& specification) {
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.type = parse_type(entry.at("type").get<std::string>());
    spec.default_value = entry.at("default");
    spec.persistent = entry.value("persistent", true);
    if(entry.contains("min")) spec.min = entry.at("min").get<double>();
    if(entry.contains("max")) spec.max = entry.at("max").get<double>();

    const std::size_t slot = specs_.size();
    index_[to_lower(spec.key)] = slot;
    for(const auto& alias : entry.value("aliases", nlohmann::json::array())) {
      index_.emplace(to_lower(alias.get<std::string>()), slot);
    }
    values_[spec.key] = spec.default_value;
    specs_.push_back(std::move(spec));
  }
}

SettingsManager::SettingType SettingsManager::parse_type(const std::string& name) {
  if(name == "bool") return SettingType::Bool;
  if(name == "int") return SettingType::Int;
  if(name == "float") return SettingType::Float;
  if(name == "string") return SettingType::String;
  if(name == "json") return SettingType::Json;
  throw std::runtime_error("Unsupported setting type '" + name + "'");
}

const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  auto it = index_.find(to_lower(token));
  return it == index_.end() ? nullptr : &specs_[it->second];
}

bool SettingsManager::has(const std::string& key) const {
  return values_.contains(key);
}

std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(specs_.size());
  for(const auto& spec : specs_) out.push_back(spec.key);
  return out;
}

std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = values_.at(key);
  if(value.is_string()) return value.get<std::string>();
  return value.dump();
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) return spec->key;
  return std::nullopt;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == SettingType::Bool;
}

nlohmann::json SettingsManager::coerce(const SettingSpec& spec, const nlohmann::json& value, std::string& error) {
  auto mismatch = [&](const char* wanted) {
    error = fmt::format("expected {}, got {}", wanted, value.type_name());
    return nlohmann::json();
  };
  auto in_bounds = [&](double number) {
    if(spec.min && number < *spec.min) {
      error = fmt::format("must be >= {}", *spec.min);
      return false;
    }
    if(spec.max && number > *spec.max) {
      error = fmt::format("must be <= {}", *spec.max);
      return false;
    }
    return true;
  };

  switch(spec.type) {
    case SettingType::Bool:
      if(value.is_boolean()) return value;
      if(value.is_number_integer()) return value.get<int64_t>() != 0;
      return mismatch("boolean");
    case SettingType::Int:
      if(!value.is_number_integer()) return mismatch("integer");
      if(!in_bounds(value.get<double>())) return nlohmann::json();
      return value.get<int>();
    case SettingType::Float:
      if(!value.is_number()) return mismatch("number");
      if(!in_bounds(value.get<double>())) return nlohmann::json();
      return value.get<double>();
    case SettingType::String:
      if(!value.is_string()) return mismatch("string");
      return value;
    case SettingType::Json:
      return value;
  }
  error = "unsupported type";
  return nlohmann::json();
}

nlohmann::json SettingsManager::parse_text(const SettingSpec& spec, const std::string& text, std::string& error) {
  const std::string clean = trim_copy(text);
  switch(spec.type) {
    case SettingType::Bool: {
      const std::string v = to_lower(clean);
      if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
      if(v == "false" || v == "0" || v == "off" || v == "no") return false;
      error = "expected boolean (true|false|on|off)";
      return nlohmann::json();
    }
    case SettingType::Int:
    case SettingType::Float: {
      // Whole-string numbers only; "12abc" is an error, not 12.
      auto parsed = nlohmann::json::parse(clean, nullptr, false);
      if(parsed.is_discarded() || !parsed.is_number()) {
        error = "'" + clean + "' is not a number";
        return nlohmann::json();
      }
      return parsed;
    }
    case SettingType::String:
      return clean;
    case SettingType::Json: {
      auto parsed = nlohmann::json::parse(clean, nullptr, false);
      if(parsed.is_discarded()) {
        error = "'" + clean + "' is not valid JSON";
        return nlohmann::json();
      }
      return parsed;
    }
  }
  error = "unsupported type";
  return nlohmann::json();
}

bool SettingsManager::set_from_json(const std::string& key, const nlohmann::json& value, std::string& error) {
  error.clear();
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto converted = coerce(*spec, value, error);
  if(!error.empty()) return false;
  values_[spec->key] = std::move(converted);
  return true;
}

bool SettingsManager::set_from_string(const std::string& key, const std::string& value, std::string& error) {
  error.clear();
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_text(*spec, value, error);
  if(!error.empty()) return false;
  return set_from_json(spec->key, parsed, error);
}

bool SettingsManager::apply_environment(const std::string& prefix, std::string& error) {
  for(const auto& spec : specs_) {
    if(!spec.persistent) continue;
    std::string name = spec.key;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::toupper(ch)); });
    name = prefix + name;
    const char* raw = std::getenv(name.c_str());
    if(!raw) continue;
    std::string why;
    if(!set_from_string(spec.key, raw, why)) {
      error = name + ": " + why;
      return false;
    }
  }
  return true;
}

nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : specs_) {
    if(persistent_only && !spec.persistent) continue;
    doc[spec.key] = values_.at(spec.key);
  }
  return doc;
}

void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) return settings_path_override_;
  return std::filesystem::current_path() / ".config" / "settings.json";
}

bool SettingsManager::load() {
  return load_from_file(settings_path());
}

bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) return false;
  auto doc = nlohmann::json::parse(in, nullptr, false);
  if(doc.is_discarded() || !doc.is_object()) {
    print_err(nullptr, "Ignoring {}: not a JSON object", path.string());
    return false;
  }
  // Unknown keys are skipped so older files keep loading.
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec || !spec->persistent) continue;
    std::string error;
    if(!set_from_json(spec->key, item.value(), error)) {
      print_err(nullptr, "Ignoring setting '{}' in {}: {}", item.key(), path.string(), error);
    }
  }
  return true;
}

bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2) << "\n";
  return static_cast<bool>(out);
}

std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string SettingsManager::trim_copy(std::string value) {
  auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
  return value;
}
