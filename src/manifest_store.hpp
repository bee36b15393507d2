#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "manifest.hpp"

class Logger;

struct ManifestUpdate {
  std::optional<ManifestStatus> status;
  std::optional<std::string> completed_at;
  std::optional<std::string> error;
  std::optional<std::string> replaces;
};

struct ChunkUpdate {
  std::optional<std::string> error;
  std::optional<std::string> timestamp;
  std::optional<std::string> local_path;
  bool clear_error = false;
};

struct UploadProgress {
  std::size_t total = 0;
  std::size_t done = 0;
  std::size_t failed = 0;
  std::size_t remaining = 0;
  double percent = 0.0;
  ManifestStatus status = ManifestStatus::Created;
};

struct DownloadSummary {
  std::string id;
  std::string filename;
  uint64_t size = 0;
  std::string size_formatted;
  std::size_t chunk_count = 0;
  std::string created_at;
  std::string completed_at;
};

// One JSON record per manifest under `folder`, named <id>.json.
class ManifestStore {
public:
  explicit ManifestStore(std::filesystem::path folder, std::shared_ptr<Logger> logger = nullptr);

  // Assigns the id and created_at, persists, returns the id. Throws IoError.
  std::string create(Manifest manifest);
  std::optional<Manifest> load(const std::string& id) const;
  bool update_fields(const std::string& id, const ManifestUpdate& update);
  bool update_chunk_status(const std::string& id,
                           std::size_t index,
                           ChunkStatus status,
                           const ChunkUpdate& extra = ChunkUpdate{});
  std::vector<Manifest> list() const; // newest first
  bool remove(const std::string& id);

  std::optional<UploadProgress> upload_progress(const std::string& id) const;
  std::vector<DownloadSummary> available_downloads() const;
  std::vector<std::size_t> orphaned_chunks(const std::string& id,
                                           const std::unordered_set<std::string>& known_destinations) const;

  std::filesystem::path path_for(const std::string& id) const;
  const std::filesystem::path& folder() const { return folder_; }

private:
  std::shared_ptr<std::mutex> lock_for(const std::string& id) const;
  std::optional<Manifest> read_record(const std::string& id) const;
  void write_record(const Manifest& manifest) const;
  std::string generate_id(const std::string& filename) const;

  std::filesystem::path folder_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex locks_mutex_;
  mutable std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
  std::mutex create_mutex_;
};
