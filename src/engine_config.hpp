#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

class SettingsManager;

struct Destination {
  std::string name;        // id stored in manifests
  std::string backend_ref; // remote name understood by the backend
  bool enabled = true;
  std::string description;
};

void to_json(nlohmann::json& j, const Destination& d);
void from_json(const nlohmann::json& j, Destination& d);

struct EngineConfig {
  uint64_t chunk_size_bytes = 100ull * 1024 * 1024;
  std::size_t max_concurrent_transfers = 3;
  std::string upload_folder = "MultiDriveSplit";
  std::filesystem::path manifest_folder = "manifests";
  std::filesystem::path temp_folder = "chunks";

  std::size_t chunk_max_attempts = 3;
  std::chrono::milliseconds chunk_retry_base{2000};
  std::chrono::milliseconds chunk_retry_cap{30000};

  std::size_t job_max_retries = 3;
  std::chrono::milliseconds job_retry_base{60000};
  std::chrono::milliseconds job_retry_cap{900000};
  bool rate_limit_sweeps_queue = true;

  bool verify_chunks_on_merge = true;
  std::chrono::seconds backend_timeout{600};
};

// Relative folders are resolved against workspace_root. Throws ConfigurationError on bad values.
EngineConfig engine_config_from_settings(const SettingsManager& settings,
                                         const std::filesystem::path& workspace_root);

std::vector<Destination> destinations_from_settings(const SettingsManager& settings);
std::vector<Destination> enabled_destinations(const std::vector<Destination>& all);
