#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct BackendResult {
  bool ok = false;
  std::string error; // free text, see classify_backend_error()

  static BackendResult success() { return BackendResult{true, {}}; }
  static BackendResult failure(std::string message) { return BackendResult{false, std::move(message)}; }
};

struct RemoteEntry {
  std::string name;
  std::string path;
  uint64_t size = 0;
  bool is_dir = false;
  std::string mod_time;
};

struct DestinationUsage {
  uint64_t total_bytes = 0;
  uint64_t used_bytes = 0;
  uint64_t free_bytes = 0;
};

// `ok` is false when the backend could not be asked; `names` is then empty and `error` says why.
struct DestinationListing {
  bool ok = false;
  std::vector<std::string> names;
  std::string error;
};

// Remote storage seen by the engine. Destinations are addressed by the backend's own name
// (Destination::backend_ref). Implementations must be callable from several threads at once.
class TransferBackend {
public:
  virtual ~TransferBackend() = default;

  virtual BackendResult upload(const std::filesystem::path& local_path,
                               const std::string& destination,
                               const std::string& remote_path) = 0;
  virtual BackendResult download(const std::string& destination,
                                 const std::string& remote_path,
                                 const std::filesystem::path& local_path) = 0;
  virtual BackendResult remove(const std::string& destination,
                               const std::string& remote_path) = 0;
  virtual std::vector<RemoteEntry> list_files(const std::string& destination,
                                              const std::string& path,
                                              bool recursive,
                                              std::size_t max_entries) = 0;
  // Usage figures only; nullopt when the backend cannot report them (not every remote supports it).
  virtual std::optional<DestinationUsage> stat(const std::string& destination) = 0;
  virtual DestinationListing list_destinations() = 0;
};
