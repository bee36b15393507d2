#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "engine_config.hpp"
#include "job_queue.hpp"
#include "log.hpp"
#include "progress_channel.hpp"

class ManifestStore;
class SettingsManager;
class TransferBackend;
class TransferOrchestrator;

// Wires settings, logging, backend, manifest store, orchestrator and job queue together.
class Engine {
public:
  struct Options {
    std::filesystem::path workspace_root = std::filesystem::current_path();
    std::shared_ptr<TransferBackend> backend; // null: rclone, configured from settings
    ProgressCallbacks progress;
    bool reload_destinations = true;          // re-read the settings file before every job
  };

  struct Stats {
    std::size_t manifests = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t in_progress = 0;
    std::size_t queued_uploads = 0;
    std::size_t queued_downloads = 0;
    std::size_t held_jobs = 0;
    bool upload_active = false;
    bool download_active = false;
  };

  Engine(std::shared_ptr<SettingsManager> settings, Options options);
  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  void start();
  void stop();

  std::string upload(const std::filesystem::path& file_path,
                     std::optional<std::string> replaces = std::nullopt);
  std::string download(const std::string& manifest_id, const std::filesystem::path& output_path);
  std::string remove(const std::string& manifest_id);
  bool wait_idle(std::chrono::milliseconds timeout);

  // Destinations as currently configured; see Options::reload_destinations.
  std::vector<Destination> destinations() const;
  Stats stats() const;

  void set_job_event_callback(JobEventCallback callback);
  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);
  void clear_log_listeners();

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  const EngineConfig& config() const { return config_; }
  ManifestStore& store();
  TransferBackend& backend();
  JobQueueManager& queue();
  const std::filesystem::path& workspace_root() const { return options_.workspace_root; }

private:
  JobOutcome run_job(const Job& job, JobContext& ctx);
  void ensure_started() const;

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  EngineConfig config_;
  std::shared_ptr<TransferBackend> backend_;
  std::unique_ptr<ManifestStore> store_;
  std::unique_ptr<TransferOrchestrator> orchestrator_;
  std::shared_ptr<ProgressChannel> progress_channel_;
  std::unique_ptr<ProgressDispatcher> dispatcher_;
  std::unique_ptr<JobQueueManager> queue_;
  bool started_ = false;
};
