#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

// Settings table entries: key, aliases, type (bool|int|string|path), default,
// description, persistent, and optionally min/max (int) and env (an
// environment variable that overrides the default).
// Empty config_dir/download_dir/device_name defaults resolve at startup.
inline const nlohmann::json DAEMON_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","port"},                    {"aliases", {"p"}},           {"type","int"},    {"default",1716},            {"min",0}, {"max",65535}, {"env","LIBRECONNECT_PORT"}, {"description","TCP port to listen on (0 picks a free port)"}, {"persistent", true}},
  {{"key","listen_ip"},               {"aliases", {"li","bind"}},   {"type","string"}, {"default","0.0.0.0"},       {"description","Interface/IP to bind"}, {"persistent", true}},
  {{"key","device_name"},             {"aliases", {"name","n"}},    {"type","string"}, {"default",""},              {"description","Name advertised to peers (hostname when empty)"}, {"persistent", true}},
  {{"key","config_dir"},              {"aliases", {"config","c"}},  {"type","path"},   {"default",""},              {"description","Directory holding settings.json and paired_devices.json"}, {"persistent", false}},
  {{"key","download_dir"},            {"aliases", {"downloads","d"}}, {"type","path"}, {"default",""},              {"description","Directory receiving transferred files"}, {"persistent", true}},
  {{"key","read_timeout_secs"},       {"aliases", {"rt"}},          {"type","int"},    {"default",120},             {"min",1}, {"description","Idle read timeout per connection"}, {"persistent", true}},
  {{"key","write_timeout_secs"},      {"aliases", {"wt"}},          {"type","int"},    {"default",120},             {"min",1}, {"description","Write timeout per response"}, {"persistent", true}},
  {{"key","max_message_size"},        {"aliases", {"mms"}},         {"type","int"},    {"default",67108864},        {"min",64}, {"description","Largest accepted message in bytes"}, {"persistent", true}},
  {{"key","worker_threads"},          {"aliases", {"threads","t"}}, {"type","int"},    {"default",4},               {"min",1}, {"max",256}, {"description","Threads running the I/O context"}, {"persistent", true}},
  {{"key","discovery"},               {"aliases", {"mdns"}},        {"type","bool"},   {"default",true},            {"description","Advertise and browse on the local network"}, {"persistent", true}},
  {{"key","discovery_required"},      {"aliases", {"dr"}},          {"type","bool"},   {"default",false},           {"description","Stop the daemon when discovery fails"}, {"persistent", true}},
  {{"key","discovery_group"},         {"aliases", {"dg"}},          {"type","string"}, {"default","239.255.17.16"}, {"description","Multicast group for discovery beacons"}, {"persistent", true}},
  {{"key","discovery_port"},          {"aliases", {"dp"}},          {"type","int"},    {"default",1716},            {"min",1}, {"max",65535}, {"description","UDP port for discovery beacons"}, {"persistent", true}},
  {{"key","discovery_interval_secs"}, {"aliases", {"di"}},          {"type","int"},    {"default",5},               {"min",1}, {"description","Seconds between discovery announcements"}, {"persistent", true}},
  {{"key","allow_legacy_pairing"},    {"aliases", {"legacy"}},      {"type","bool"},   {"default",true},            {"description","Accept pairing requests without a key"}, {"persistent", true}},
  {{"key","verbose"},                 {"aliases", {"v"}},           {"type","bool"},   {"default",false},           {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","log_file"},                {"aliases", {"log"}},         {"type","path"},   {"default",""},              {"description","Also write logs to this rotating file"}, {"persistent", true}},
  {{"key","help"},                    {"aliases", {"h","?"}},       {"type","bool"},   {"default",false},           {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                    {"aliases", {"persist"}},     {"type","bool"},   {"default",false},           {"description","Persist current settings to disk"}, {"persistent", false}}
});

inline const nlohmann::json CLIENT_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","host"},    {"aliases", {"server"}}, {"type","string"}, {"default","127.0.0.1"}, {"description","Daemon host"}, {"persistent", false}},
  {{"key","port"},    {"aliases", {"p"}}, {"type","int"},    {"default",1716}, {"min",1}, {"max",65535}, {"env","LIBRECONNECT_PORT"}, {"description","Daemon port"}, {"persistent", false}},
  {{"key","timeout"}, {"aliases", {"t"}}, {"type","int"},    {"default",5},    {"min",1}, {"description","Seconds to wait for a reply"}, {"persistent", false}},
  {{"key","verbose"}, {"aliases", {"v"}}, {"type","bool"},   {"default",false}, {"description","Enable verbose logging"}, {"persistent", false}},
  {{"key","help"},    {"aliases", {"h","?"}}, {"type","bool"}, {"default",false}, {"description","Show command help and exit"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  // Applies every `env` override present in the process environment.
  void apply_environment();

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

  // <config_dir>/settings.json, or the override when one is set.
  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;
  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::string description;
    std::string env;
    std::optional<long long> min;
    std::optional<long long> max;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);

  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  static std::string expand_home(const std::string& value);

  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_override_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.normalized_key = to_lower(spec.key);
    if(entry.contains("aliases")) {
      for(const auto& alias : entry.at("aliases")) {
        spec.aliases.push_back(to_lower(alias.get<std::string>()));
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    spec.env = entry.value("env", "");
    if(entry.contains("min")) spec.min = entry.at("min").get<long long>();
    if(entry.contains("max")) spec.max = entry.at("max").get<long long>();
    spec.persistent = entry.value("persistent", true);
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(DAEMON_SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : setting_specs_(build_setting_specs(specification)) {
  apply_defaults();
}

inline void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline void SettingsManager::apply_environment() {
  for(const auto& spec : setting_specs_) {
    if(spec.env.empty()) continue;
    const char* value = std::getenv(spec.env.c_str());
    if(!value || !*value) continue;
    std::string error;
    if(!set_from_string(spec.key, value, error)) {
      print_err(nullptr, "Ignoring {}='{}': {}", spec.env, value, error);
    }
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  const std::string lowered = to_lower(token);
  auto it = std::find_if(setting_specs_.begin(), setting_specs_.end(),
    [&](const SettingSpec& spec){
      return lowered == spec.normalized_key ||
             std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end();
    });
  return it == setting_specs_.end() ? nullptr : &*it;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(setting_specs_.size());
  for(const auto& spec : setting_specs_) out.push_back(spec.key);
  return out;
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) {
    return settings_path_override_;
  }
  std::filesystem::path dir;
  if(has("config_dir")) dir = get<std::string>("config_dir");
  if(dir.empty()) dir = default_config_dir();
  return dir / "settings.json";
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

// A missing file is not an error for the caller to report; it returns false
// without printing.
inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if(ec) {
      print_err(nullptr, "Unable to create {}: {}", path.parent_path().string(), ec.message());
      return false;
    }
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2) << '\n';
  return static_cast<bool>(out);
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!convert_and_store(*spec, item.value(), error) && !error.empty()) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    if(persistent_only && !spec.persistent) continue;
    if(settings_.contains(spec.key)) {
      doc[spec.key] = settings_.at(spec.key);
    }
  }
  return doc;
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                               const nlohmann::json& value,
                                               std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      settings_[spec.key] = (value.get<long long>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(!value.is_number_integer()) {
      error = "expected integer";
      return false;
    }
    const auto number = value.get<long long>();
    if(spec.min && number < *spec.min) {
      error = "must be at least " + std::to_string(*spec.min);
      return false;
    }
    if(spec.max && number > *spec.max) {
      error = "must be at most " + std::to_string(*spec.max);
      return false;
    }
    settings_[spec.key] = number;
    return true;
  }
  if(spec.type == "string" || spec.type == "path") {
    if(!value.is_string()) {
      error = "expected string";
      return false;
    }
    auto text = value.get<std::string>();
    settings_[spec.key] = spec.type == "path" ? expand_home(text) : text;
    return true;
  }
  error = "unknown type";
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                          const std::string& value,
                                                          std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      std::size_t used = 0;
      long long number = std::stoll(clean, &used);
      if(used != clean.size()) {
        error = "expected integer";
        return {};
      }
      return number;
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "string" || spec.type == "path") {
    return clean;
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return convert_and_store(*spec, parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return convert_and_store(*spec, value, error);
}

inline std::string SettingsManager::expand_home(const std::string& value) {
  if(value.empty() || value[0] != '~') return value;
  if(value.size() > 1 && value[1] != '/') return value;
  const char* home = std::getenv("HOME");
  if(!home || !*home) return value;
  return std::string(home) + value.substr(1);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

inline bool SettingsManager::is_bool_literal(const std::string& value) {
  std::string lowered = to_lower(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
