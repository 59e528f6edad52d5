#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

// Every recognized setting. "min"/"max" bound numeric values at set time;
// "secret" marks values whose nested "password" fields are masked on display.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","segment_size_bytes"},          {"type","int"},    {"default",768000},  {"min",1024},   {"description","Target plaintext bytes per segment (final segment may be shorter)"}},
  {{"key","pack_threshold_bytes"},        {"type","int"},    {"default",0},       {"min",0},      {"description","Encoded segments below this size share an article (0 = half a segment)"}},
  {{"key","compression_threshold_ratio"}, {"type","float"},  {"default",0.9},     {"min",0.01}, {"max",1.0}, {"description","Compress only when the sampled ratio is below this value"}},
  {{"key","compression_sample_bytes"},    {"type","int"},    {"default",65536},   {"min",1},      {"description","Prefix length probed by the compression heuristic"}},
  {{"key","max_retry_count"},             {"type","int"},    {"default",3},       {"min",0},      {"description","Transient failures tolerated before an item becomes terminal"}},
  {{"key","workers_per_direction"},       {"type","int"},    {"default",4},       {"min",1}, {"max",64}, {"description","Worker threads for uploads and, separately, for downloads"}},
  {{"key","segment_fetch_parallelism"},   {"type","int"},    {"default",4},       {"min",1}, {"max",64}, {"description","Concurrent article fetches within one download item"}},
  {{"key","servers"},                     {"type","json"},   {"default",nlohmann::json::array()}, {"secret",true}, {"description","News servers: host, port, tls, username, password, max_connections, priority, enabled"}},
  {{"key","max_rate_mbps"},               {"type","float"},  {"default",0.0},     {"min",0.0},    {"description","Aggregate bandwidth ceiling shared by all workers (0 = unlimited)"}},
  {{"key","redundancy_copies"},           {"type","int"},    {"default",2},       {"min",1}, {"max",8}, {"description","Articles posted per segment by the redundant strategy"}},
  {{"key","encrypt_segments"},            {"type","bool"},   {"default",true},    {"description","Encrypt segments with the per-folder key"}},
  {{"key","newsgroup"},                   {"type","string"}, {"default","alt.binaries.backup"}, {"description","Newsgroup articles are posted to"}},
  {{"key","poster"},                      {"type","string"}, {"default","usenetsync <poster@usenetsync.invalid>"}, {"description","From header of posted articles"}},
  {{"key","health_check_ttl_seconds"},    {"type","int"},    {"default",300},     {"min",0},      {"description","How long a successful server probe stays valid"}},
  {{"key","server_cooldown_seconds"},     {"type","int"},    {"default",60},      {"min",0},      {"description","How long an unhealthy server is skipped"}},
  {{"key","connection_failure_threshold"},{"type","int"},    {"default",3},       {"min",1},      {"description","Consecutive connection failures before a server is marked unhealthy"}},
  {{"key","acquire_timeout_ms"},          {"type","int"},    {"default",30000},   {"min",1},      {"description","Longest wait for a free pool connection"}},
  {{"key","io_timeout_seconds"},          {"type","int"},    {"default",30},      {"min",1},      {"description","Socket read/write timeout for NNTP connections"}},
  {{"key","queue_poll_interval_ms"},      {"type","int"},    {"default",500},     {"min",1},      {"description","Bounded wait of a worker polling an empty queue"}},
  {{"key","finished_retention_hours"},    {"type","int"},    {"default",168},     {"min",0},      {"description","Completed, failed and cancelled items older than this are dropped at engine start and stop"}},
  {{"key","state_dir"},                   {"type","string"}, {"default",".usenetsync"}, {"description","Directory holding queue, index and share snapshots"}},
  {{"key","log_file"},                    {"type","string"}, {"default",""},      {"description","Also log to this file, rotated by size (empty = console only)"}},
  {{"key","log_file_max_mb"},             {"type","int"},    {"default",10},      {"min",1},      {"description","Size at which the log file is rotated"}},
  {{"key","verbose"},                     {"type","bool"},   {"default",false},   {"description","Enable debug logging"}}
});

class SettingsManager {
public:
  static constexpr const char* kEnvironmentPrefix = "USENETSYNC_";

  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  // Reads USENETSYNC_<KEY> variables (key upper-cased) over the current
  // values. Returns the keys that were overridden; bad values are reported
  // in `errors` and leave the setting untouched.
  std::vector<std::string> apply_environment(std::vector<std::string>& errors);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::string description(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  void set_json(const nlohmann::json& doc);
  nlohmann::json get_json() const;
  // Same as get_json() with secrets masked; safe to log.
  nlohmann::json redacted_json() const;
  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);

private:
  struct SettingSpec {
    std::string key;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::optional<double> min;
    std::optional<double> max;
    bool secret = false;
    std::string description;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  static nlohmann::json redact(const nlohmann::json& value);
  static std::string environment_name(const std::string& key);

  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  bool within_bounds(const SettingSpec& spec, double value, std::string& error) const;
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

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
    spec.normalized_key = SettingsManager::to_lower(spec.key);
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    if(entry.contains("min")) spec.min = entry.at("min").get<double>();
    if(entry.contains("max")) spec.max = entry.at("max").get<double>();
    spec.secret = entry.value("secret", false);
    spec.description = entry.value("description", "");
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

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

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = to_lower(trim_copy(token));
  for(const auto& spec : setting_specs_) {
    if(lowered == spec.normalized_key) return &spec;
  }
  return nullptr;
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
  const auto* spec = find_spec(key);
  if(!spec || !has(spec->key)) return "<unknown>";
  const auto& value = settings_.at(spec->key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return spec->secret ? redact(value).dump() : value.dump();
}

inline std::string SettingsManager::description(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec ? spec->description : std::string();
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) {
    return settings_path_override_;
  }
  return std::filesystem::current_path() / "settings.json";
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const std::exception& e) {
    log_error(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if(!out) {
    log_error(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json().dump(2);
  return static_cast<bool>(out);
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) {
      log_warn(nullptr, "Ignoring unknown setting '{}'", item.key());
      continue;
    }
    std::string error;
    if(!convert_and_store(*spec, item.value(), error) && !error.empty()) {
      log_warn(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline void SettingsManager::set_json(const nlohmann::json& doc) {
  merge_from_json(doc);
}

inline nlohmann::json SettingsManager::get_json() const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    if(settings_.contains(spec.key)) {
      doc[spec.key] = settings_.at(spec.key);
    }
  }
  return doc;
}

inline nlohmann::json SettingsManager::redacted_json() const {
  auto doc = get_json();
  for(const auto& spec : setting_specs_) {
    if(spec.secret && doc.contains(spec.key)) doc[spec.key] = redact(doc[spec.key]);
  }
  return doc;
}

inline nlohmann::json SettingsManager::redact(const nlohmann::json& value) {
  if(value.is_array()) {
    nlohmann::json out = nlohmann::json::array();
    for(const auto& v : value) out.push_back(redact(v));
    return out;
  }
  if(value.is_object()) {
    nlohmann::json out = nlohmann::json::object();
    for(const auto& item : value.items()) {
      bool hide = item.key() == "password" && item.value().is_string() &&
                  !item.value().get<std::string>().empty();
      out[item.key()] = hide ? nlohmann::json("***") : redact(item.value());
    }
    return out;
  }
  return value;
}

inline bool SettingsManager::within_bounds(const SettingSpec& spec, double value, std::string& error) const {
  if(spec.min && value < *spec.min) {
    error = "must be at least " + nlohmann::json(*spec.min).dump();
    return false;
  }
  if(spec.max && value > *spec.max) {
    error = "must be at most " + nlohmann::json(*spec.max).dump();
    return false;
  }
  return true;
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
      settings_[spec.key] = (value.get<int>() != 0);
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
    auto v = value.get<int64_t>();
    if(!within_bounds(spec, static_cast<double>(v), error)) return false;
    settings_[spec.key] = v;
    return true;
  }
  if(spec.type == "float") {
    if(!value.is_number()) {
      error = "expected number";
      return false;
    }
    auto v = value.get<double>();
    if(!within_bounds(spec, v, error)) return false;
    settings_[spec.key] = v;
    return true;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      settings_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  if(spec.type == "json") {
    settings_[spec.key] = value;
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
      auto v = std::stoll(clean, &used);
      if(used != clean.size()) {
        error = "trailing characters in integer";
        return {};
      }
      return v;
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "float") {
    try {
      std::size_t used = 0;
      auto v = std::stod(clean, &used);
      if(used != clean.size()) {
        error = "trailing characters in number";
        return {};
      }
      return v;
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "string") {
    return clean;
  }
  if(spec.type == "json") {
    try {
      return nlohmann::json::parse(clean);
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
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

inline std::string SettingsManager::environment_name(const std::string& key) {
  std::string name = kEnvironmentPrefix;
  for(unsigned char ch : key) name.push_back(static_cast<char>(std::toupper(ch)));
  return name;
}

inline std::vector<std::string> SettingsManager::apply_environment(std::vector<std::string>& errors) {
  std::vector<std::string> applied;
  for(const auto& spec : setting_specs_) {
    auto name = environment_name(spec.key);
    const char* raw = std::getenv(name.c_str());
    if(!raw) continue;
    std::string error;
    if(set_from_string(spec.key, raw, error)) {
      applied.push_back(spec.key);
    } else {
      errors.push_back(name + ": " + error);
    }
  }
  return applied;
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

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
