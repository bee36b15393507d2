#include "engine_config.hpp"

#include <algorithm>
#include <iterator>

#include "errors.hpp"
#include "settings_manager.hpp"

void to_json(nlohmann::json& j, const Destination& d) {
  j = nlohmann::json{
    {"name", d.name},
    {"remote", d.backend_ref},
    {"enabled", d.enabled},
    {"description", d.description}
  };
}

void from_json(const nlohmann::json& j, Destination& d) {
  d.name = j.at("name").get<std::string>();
  d.backend_ref = j.value("remote", j.value("remote_name", d.name));
  d.enabled = j.value("enabled", true);
  d.description = j.value("description", "");
}

namespace {

int64_t positive_setting(const SettingsManager& settings, const std::string& key) {
  auto value = settings.get<int64_t>(key);
  if(value <= 0) {
    throw ConfigurationError(key + " must be > 0 (got " + std::to_string(value) + ")");
  }
  return value;
}

std::filesystem::path resolve_folder(const std::filesystem::path& root, const std::string& value) {
  std::filesystem::path p(value);
  if(p.is_absolute() || root.empty()) return p;
  return root / p;
}

} // namespace

EngineConfig engine_config_from_settings(const SettingsManager& settings,
                                         const std::filesystem::path& workspace_root) {
  EngineConfig config;
  config.chunk_size_bytes = static_cast<uint64_t>(positive_setting(settings, "chunk_size_bytes"));
  config.max_concurrent_transfers =
    static_cast<std::size_t>(positive_setting(settings, "max_concurrent_transfers"));
  config.upload_folder = settings.get<std::string>("upload_folder");
  config.manifest_folder = resolve_folder(workspace_root, settings.get<std::string>("manifest_folder"));
  config.temp_folder = resolve_folder(workspace_root, settings.get<std::string>("temp_folder"));

  config.chunk_max_attempts = static_cast<std::size_t>(positive_setting(settings, "chunk_max_attempts"));
  config.chunk_retry_base = std::chrono::milliseconds(
    std::max<int64_t>(0, settings.get<int64_t>("chunk_retry_base_ms")));

  config.job_max_retries = static_cast<std::size_t>(
    std::max<int64_t>(0, settings.get<int64_t>("job_max_retries")));
  config.job_retry_base = std::chrono::seconds(
    std::max<int64_t>(0, settings.get<int64_t>("job_retry_base_seconds")));
  config.job_retry_cap = std::chrono::seconds(
    std::max<int64_t>(0, settings.get<int64_t>("job_retry_max_seconds")));
  if(config.job_retry_cap < config.job_retry_base) {
    config.job_retry_cap = config.job_retry_base;
  }
  config.rate_limit_sweeps_queue = settings.get<bool>("rate_limit_sweeps_queue");
  config.verify_chunks_on_merge = settings.get<bool>("verify_chunks_on_merge");
  config.backend_timeout = std::chrono::seconds(positive_setting(settings, "backend_timeout_seconds"));
  return config;
}

std::vector<Destination> destinations_from_settings(const SettingsManager& settings) {
  const auto doc = settings.get<nlohmann::json>("destinations");
  if(!doc.is_array()) {
    throw ConfigurationError("destinations must be a JSON array");
  }
  std::vector<Destination> out;
  out.reserve(doc.size());
  for(const auto& entry : doc) {
    try {
      out.push_back(entry.get<Destination>());
    } catch(const nlohmann::json::exception& e) {
      throw ConfigurationError(std::string("invalid destination entry: ") + e.what());
    }
  }
  return out;
}

std::vector<Destination> enabled_destinations(const std::vector<Destination>& all) {
  std::vector<Destination> out;
  std::copy_if(all.begin(), all.end(), std::back_inserter(out),
               [](const Destination& d){ return d.enabled; });
  return out;
}
