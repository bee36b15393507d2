#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

inline constexpr const char* kManifestVersion = "1.0";

enum class ChunkStatus { Pending, Transferring, Done, Failed };
enum class ManifestStatus { Created, Uploading, Completed, Failed, Cancelled };

const char* to_string(ChunkStatus status);
const char* to_string(ManifestStatus status);
ChunkStatus chunk_status_from_string(const std::string& value);
ManifestStatus manifest_status_from_string(const std::string& value);

struct ChunkDescriptor {
  std::size_t index = 0;
  std::string filename;
  std::string local_path;
  uint64_t size = 0;
  std::string hash;
  std::string destination_id;
  std::string remote_path;
  ChunkStatus status = ChunkStatus::Pending;
  std::optional<std::string> error;
  std::optional<std::string> timestamp; // set when the chunk reached its destination
};

struct OriginalFile {
  std::string filename;
  std::string absolute_path;
  uint64_t size = 0;
  std::string hash;
};

struct Manifest {
  std::string id;
  std::string version = kManifestVersion;
  std::string created_at;
  std::optional<std::string> updated_at;
  OriginalFile original;
  std::vector<ChunkDescriptor> chunks;
  ManifestStatus status = ManifestStatus::Created;
  std::optional<std::string> completed_at;
  std::optional<std::string> replaces; // failed upload superseded by this one
  std::optional<std::string> error;

  std::size_t count_chunks(ChunkStatus status) const;
};

void to_json(nlohmann::json& j, const ChunkDescriptor& c);
void from_json(const nlohmann::json& j, ChunkDescriptor& c);
void to_json(nlohmann::json& j, const OriginalFile& o);
void from_json(const nlohmann::json& j, OriginalFile& o);
void to_json(nlohmann::json& j, const Manifest& m);
void from_json(const nlohmann::json& j, Manifest& m);
