#pragma once

#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

// Every setting the CLI, the settings file and the engine understand.
// "persistent" entries are written by --save; the rest only live for one invocation.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","command"},                  {"aliases", {"cmd"}},                 {"type","string"}, {"default",""},                {"description","Command to run (upload, download, delete, list, status, remotes, stats)"}, {"persistent", false}},
  {{"key","target"},                   {"aliases", {"file","manifest"}},     {"type","string"}, {"default",""},                {"description","File to upload or manifest id to act on"}, {"persistent", false}},
  {{"key","output"},                   {"aliases", {"o","out"}},             {"type","string"}, {"default",""},                {"description","Output path for downloads"}, {"persistent", false}},
  {{"key","replaces"},                 {"aliases", {"reupload"}},            {"type","string"}, {"default",""},                {"description","Manifest id of a failed upload this upload supersedes"}, {"persistent", false}},
  {{"key","chunk_size_bytes"},         {"aliases", {"chunk_size","cs"}},     {"type","int"},    {"default",104857600},         {"description","Size of each chunk in bytes"}, {"persistent", true}},
  {{"key","max_concurrent_transfers"}, {"aliases", {"parallel","mct"}},      {"type","int"},    {"default",3},                 {"description","Chunk transfers running in parallel per job"}, {"persistent", true}},
  {{"key","upload_folder"},            {"aliases", {"remote_folder","uf"}},  {"type","string"}, {"default","MultiDriveSplit"}, {"description","Folder on each destination that receives chunks"}, {"persistent", true}},
  {{"key","manifest_folder"},          {"aliases", {"manifests","mf"}},      {"type","string"}, {"default","manifests"},       {"description","Local folder holding manifest records"}, {"persistent", true}},
  {{"key","temp_folder"},              {"aliases", {"staging","tf"}},        {"type","string"}, {"default","chunks"},          {"description","Local staging folder for chunk files"}, {"persistent", true}},
  {{"key","chunk_max_attempts"},       {"aliases", {"attempts","cma"}},      {"type","int"},    {"default",3},                 {"description","Attempts per chunk before it is marked failed"}, {"persistent", true}},
  {{"key","chunk_retry_base_ms"},      {"aliases", {"chunk_backoff","crb"}}, {"type","int"},    {"default",2000},              {"description","First backoff between chunk attempts (doubles each retry)"}, {"persistent", true}},
  {{"key","job_max_retries"},          {"aliases", {"retries","jmr"}},       {"type","int"},    {"default",3},                 {"description","Automatic retries per job before it fails terminally"}, {"persistent", true}},
  {{"key","job_retry_base_seconds"},   {"aliases", {"job_backoff","jrb"}},   {"type","int"},    {"default",60},                {"description","Base delay before a held job is requeued"}, {"persistent", true}},
  {{"key","job_retry_max_seconds"},    {"aliases", {"job_backoff_cap","jrm"}}, {"type","int"},  {"default",900},               {"description","Upper bound for the job retry delay"}, {"persistent", true}},
  {{"key","rate_limit_sweeps_queue"},  {"aliases", {"sweep","rlsq"}},        {"type","bool"},   {"default",true},              {"description","On a rate limit, hold every queued job, not just the failed one"}, {"persistent", true}},
  {{"key","verify_chunks_on_merge"},   {"aliases", {"verify","vcm"}},        {"type","bool"},   {"default",true},              {"description","Check each chunk hash while merging downloads"}, {"persistent", true}},
  {{"key","destinations"},             {"aliases", {"drives","remotes"}},    {"type","json"},   {"default",nlohmann::json::array()}, {"description","Destinations as [{name, remote, enabled, description}]"}, {"persistent", true}},
  {{"key","rclone_path"},              {"aliases", {"rclone"}},              {"type","string"}, {"default","rclone"},          {"description","rclone executable"}, {"persistent", true}},
  {{"key","rclone_config"},            {"aliases", {"rclone_conf","rc"}},    {"type","string"}, {"default",""},                {"description","rclone config file (empty = rclone default)"}, {"persistent", true}},
  {{"key","backend_timeout_seconds"},  {"aliases", {"timeout","bts"}},       {"type","int"},    {"default",600},               {"description","Timeout for a single backend call"}, {"persistent", true}},
  {{"key","log_file"},                 {"aliases", {"log"}},                 {"type","string"}, {"default",""},                {"description","Also write log lines to this file"}, {"persistent", true}},
  {{"key","verbose"},                  {"aliases", {"v"}},                   {"type","bool"},   {"default",false},             {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                     {"aliases", {"h","?"}},               {"type","bool"},   {"default",false},             {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                     {"aliases", {"persist"}},             {"type","bool"},   {"default",false},             {"description","Persist current settings to disk"}, {"persistent", false}}
});

enum class SettingType { Bool, Int, String, Json };

struct SettingSpec {
  std::string key;
  std::vector<std::string> aliases;
  SettingType type = SettingType::String;
  nlohmann::json default_value;
  std::string description;
  bool persistent = true;
};

inline const char* to_string(SettingType type) {
  switch(type) {
    case SettingType::Bool: return "bool";
    case SettingType::Int: return "int";
    case SettingType::String: return "string";
    case SettingType::Json: return "json";
  }
  return "string";
}

inline std::optional<bool> parse_bool_literal(const std::string& text) {
  const auto v = to_lower_copy(text);
  if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
  if(v == "false" || v == "0" || v == "off" || v == "no") return false;
  return std::nullopt;
}

class SettingsManager {
public:
  SettingsManager() : SettingsManager(SETTINGS_SPECIFICATION) {}
  explicit SettingsManager(const nlohmann::json& specification);

  // Throws std::runtime_error for a key that is not in the specification.
  template<typename T>
  T get(const std::string& key) const {
    auto it = values_.find(key);
    if(it == values_.end()) {
      throw std::runtime_error("Unknown setting: " + key);
    }
    return it->get<T>();
  }

  bool has(const std::string& key) const { return values_.contains(key); }

  // Both accept a key or any alias, case-insensitively. On failure `error` says why and nothing changes.
  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool load() { return load_from_file(settings_path()); }
  bool save() const { return save_to_file(settings_path()); }
  bool load_from_file(const std::filesystem::path& path);
  bool save_to_file(const std::filesystem::path& path) const;

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  const std::vector<SettingSpec>& specs() const { return specs_; }
  const SettingSpec* find_spec(const std::string& token) const;
  std::optional<std::string> resolve_key(const std::string& token) const {
    const auto* spec = find_spec(token);
    return spec ? std::optional<std::string>(spec->key) : std::nullopt;
  }
  bool is_bool_setting(const std::string& key) const {
    const auto* spec = find_spec(key);
    return spec && spec->type == SettingType::Bool;
  }

  // Defaults to ./.config/settings.json until a path is set.
  std::filesystem::path settings_path() const {
    return path_.empty() ? std::filesystem::current_path() / ".config" / "settings.json" : path_;
  }
  void set_settings_path(const std::filesystem::path& path) { path_ = path; }

  nlohmann::json to_json(bool persistent_only = true) const;

private:
  bool store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  static nlohmann::json parse_text(const SettingSpec& spec, const std::string& text, std::string& error);

  std::vector<SettingSpec> specs_;
  std::unordered_map<std::string, std::size_t> index_; // lowered key or alias -> specs_ slot
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path path_;
};

inline SettingsManager::SettingsManager(const nlohmann::json& specification) {
  static const std::unordered_map<std::string, SettingType> kTypes = {
    {"bool", SettingType::Bool}, {"int", SettingType::Int},
    {"string", SettingType::String}, {"json", SettingType::Json}
  };
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    const auto type_name = entry.at("type").get<std::string>();
    auto type = kTypes.find(type_name);
    if(type == kTypes.end()) {
      throw std::invalid_argument("setting '" + spec.key + "' has unknown type '" + type_name + "'");
    }
    spec.type = type->second;
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
    }

    const auto slot = specs_.size();
    index_[to_lower_copy(spec.key)] = slot;
    for(const auto& alias : spec.aliases) index_.emplace(to_lower_copy(alias), slot);
    values_[spec.key] = spec.default_value;
    specs_.push_back(std::move(spec));
  }
}

inline const SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  auto it = index_.find(to_lower_copy(token));
  return it == index_.end() ? nullptr : &specs_[it->second];
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(path.empty() || !in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    print_err(nullptr, "Ignoring {}: expected a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!store(*spec, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}' in {}: {}", item.key(), path.string(), error);
    }
  }
  return true;
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << to_json(true).dump(2);
  return static_cast<bool>(out);
}

inline nlohmann::json SettingsManager::to_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : specs_) {
    if(persistent_only && !spec.persistent) continue;
    doc[spec.key] = values_.at(spec.key);
  }
  return doc;
}

inline bool SettingsManager::set_from_string(const std::string& key, const std::string& value, std::string& error) {
  error.clear();
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_text(*spec, value, error);
  return error.empty() && store(*spec, parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key, const nlohmann::json& value, std::string& error) {
  error.clear();
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  return store(*spec, value, error);
}

inline bool SettingsManager::store(const SettingSpec& spec, const nlohmann::json& value, std::string& error) {
  switch(spec.type) {
    case SettingType::Bool:
      if(value.is_boolean() || value.is_number_integer()) {
        values_[spec.key] = value.is_boolean() ? value.get<bool>() : value.get<int64_t>() != 0;
        return true;
      }
      error = "expected boolean";
      return false;
    case SettingType::Int:
      if(value.is_number_integer()) {
        values_[spec.key] = value.get<int64_t>();
        return true;
      }
      error = "expected integer";
      return false;
    case SettingType::String:
      if(value.is_string()) {
        values_[spec.key] = value;
        return true;
      }
      error = "expected string";
      return false;
    case SettingType::Json:
      values_[spec.key] = value;
      return true;
  }
  error = "unsupported type";
  return false;
}

inline nlohmann::json SettingsManager::parse_text(const SettingSpec& spec, const std::string& text, std::string& error) {
  const auto clean = trim_copy(text);
  switch(spec.type) {
    case SettingType::Bool: {
      if(auto flag = parse_bool_literal(clean)) return *flag;
      error = "expected boolean (true|false|on|off)";
      return {};
    }
    case SettingType::Int: {
      std::size_t consumed = 0;
      long long parsed = 0;
      try {
        parsed = std::stoll(clean, &consumed);
      } catch(const std::logic_error&) {
        error = "expected integer";
        return {};
      }
      if(consumed != clean.size()) {
        error = "trailing characters after integer";
        return {};
      }
      return static_cast<int64_t>(parsed);
    }
    case SettingType::String:
      return clean;
    case SettingType::Json:
      try {
        return nlohmann::json::parse(clean);
      } catch(const nlohmann::json::parse_error& e) {
        error = e.what();
        return {};
      }
  }
  error = "unsupported type";
  return {};
}
