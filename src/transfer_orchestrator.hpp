#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "chunker.hpp"
#include "distribution_policy.hpp"
#include "engine_config.hpp"
#include "errors.hpp"
#include "job_context.hpp"
#include "manifest.hpp"
#include "transfer_backend.hpp"

class Logger;
class ManifestStore;

struct UploadRequest {
  std::filesystem::path file_path;
  std::optional<std::string> replaces;
};

struct DownloadRequest {
  std::string manifest_id;
  std::filesystem::path output_path;
};

// Drives one job at a time through Preparing -> Transferring -> [Verifying] -> terminal.
// Never throws: every failure is folded into the returned JobOutcome.
class TransferOrchestrator {
public:
  TransferOrchestrator(TransferBackend& backend,
                       ManifestStore& store,
                       EngineConfig config,
                       std::shared_ptr<Logger> logger = nullptr,
                       std::shared_ptr<const DistributionPolicy> policy = nullptr);

  JobOutcome run_upload(const UploadRequest& request,
                        const std::vector<Destination>& destinations,
                        JobContext& ctx);

  JobOutcome run_download(const DownloadRequest& request,
                          const std::vector<Destination>& destinations,
                          JobContext& ctx);

  // Removes every chunk from its destination; the manifest goes only when all removals succeed.
  JobOutcome run_delete(const std::string& manifest_id,
                        const std::vector<Destination>& destinations,
                        JobContext& ctx);

  const EngineConfig& config() const { return config_; }

  static std::string remote_path_for(const std::string& upload_folder, const std::string& chunk_filename);

private:
  using ChunkCall = std::function<BackendResult(std::size_t index)>;
  using ChunkStatusSink = std::function<void(std::size_t index, ChunkStatus status, const std::string& error)>;

  struct PoolResult {
    std::size_t completed = 0;
    std::vector<std::size_t> failed;
    std::vector<std::size_t> skipped;
    bool cancelled = false;
    ErrorCategory failure_category = ErrorCategory::Other;
    std::string failure_reason;

    bool ok() const { return !cancelled && failed.empty() && skipped.empty(); }
  };

  PoolResult run_chunk_pool(const std::vector<std::size_t>& indices,
                            std::size_t total_chunks,
                            const std::string& stage,
                            const ChunkCall& call,
                            const ChunkStatusSink& on_status,
                            JobContext& ctx) const;

  std::chrono::milliseconds chunk_backoff(std::size_t failed_attempts) const;

  JobOutcome finish(JobContext& ctx, JobOutcome outcome) const;

  TransferBackend& backend_;
  ManifestStore& store_;
  EngineConfig config_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<const DistributionPolicy> policy_;
  Chunker chunker_;
};
