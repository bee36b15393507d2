#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "subprocess.hpp"
#include "transfer_backend.hpp"

class Logger;

struct RcloneOptions {
  std::string executable = "rclone";
  std::string config_path; // empty: rclone's own default
  std::chrono::seconds transfer_timeout{600};
  std::chrono::seconds query_timeout{30};
};

// TransferBackend on top of the rclone command line. Destinations are rclone remote names.
class RcloneBackend : public TransferBackend {
public:
  explicit RcloneBackend(RcloneOptions options, std::shared_ptr<Logger> logger = nullptr);

  BackendResult upload(const std::filesystem::path& local_path,
                       const std::string& destination,
                       const std::string& remote_path) override;
  BackendResult download(const std::string& destination,
                         const std::string& remote_path,
                         const std::filesystem::path& local_path) override;
  BackendResult remove(const std::string& destination,
                       const std::string& remote_path) override;
  std::vector<RemoteEntry> list_files(const std::string& destination,
                                      const std::string& path,
                                      bool recursive,
                                      std::size_t max_entries) override;
  std::optional<DestinationUsage> stat(const std::string& destination) override;
  DestinationListing list_destinations() override;

  static std::vector<RemoteEntry> parse_lsjson(const std::string& json, const std::string& base_path);
  static std::optional<DestinationUsage> parse_about(const std::string& json);
  static std::vector<std::string> parse_listremotes(const std::string& output);
  static std::string remote_spec(const std::string& destination, const std::string& path);
  // Last `count` non-empty lines of rclone output, used as the error text.
  static std::string tail_lines(const std::string& output, std::size_t count);

private:
  ProcessResult run(std::vector<std::string> args, std::chrono::seconds timeout) const;
  BackendResult to_result(const char* verb, const ProcessResult& result,
                          std::chrono::seconds timeout) const;

  RcloneOptions options_;
  std::shared_ptr<Logger> logger_;
};
