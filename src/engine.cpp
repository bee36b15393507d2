#include "engine.hpp"

#include <stdexcept>

#include "errors.hpp"
#include "manifest_store.hpp"
#include "rclone_backend.hpp"
#include "settings_manager.hpp"
#include "transfer_orchestrator.hpp"

Engine::Engine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("drivesplit")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
}

Engine::~Engine() {
  stop();
}

void Engine::start() {
  if(started_) return;

  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root, ec);

  LogOptions log_options;
  log_options.verbose = settings_->get<bool>("verbose");
  log_options.log_file = settings_->get<std::string>("log_file");
  init_logging(log_options);

  config_ = engine_config_from_settings(*settings_, options_.workspace_root);

  backend_ = options_.backend;
  if(!backend_) {
    RcloneOptions rclone;
    rclone.executable = settings_->get<std::string>("rclone_path");
    rclone.config_path = settings_->get<std::string>("rclone_config");
    rclone.transfer_timeout = config_.backend_timeout;
    backend_ = std::make_shared<RcloneBackend>(rclone, logger_);
  }

  store_ = std::make_unique<ManifestStore>(config_.manifest_folder, logger_);
  orchestrator_ = std::make_unique<TransferOrchestrator>(*backend_, *store_, config_, logger_);

  progress_channel_ = std::make_shared<ProgressChannel>();
  dispatcher_ = std::make_unique<ProgressDispatcher>(progress_channel_, options_.progress, logger_);
  dispatcher_->start();

  QueuePolicy policy;
  policy.max_retries = config_.job_max_retries;
  policy.base_delay = config_.job_retry_base;
  policy.max_delay = config_.job_retry_cap;
  policy.rate_limit_sweeps_queue = config_.rate_limit_sweeps_queue;
  queue_ = std::make_unique<JobQueueManager>(
    [this](const Job& job, JobContext& ctx){ return run_job(job, ctx); },
    policy, logger_, progress_channel_);
  queue_->start();

  started_ = true;
  logger_->debug("Engine started in {} (chunk size {}, {} parallel transfers)",
                 options_.workspace_root.string(), config_.chunk_size_bytes, config_.max_concurrent_transfers);
}

void Engine::stop() {
  if(!started_) return;
  started_ = false;
  if(queue_) queue_->stop();
  if(dispatcher_) dispatcher_->stop();
  queue_.reset();
  dispatcher_.reset();
  orchestrator_.reset();
  store_.reset();
}

void Engine::ensure_started() const {
  if(!started_) {
    throw std::logic_error("Engine not started");
  }
}

std::vector<Destination> Engine::destinations() const {
  if(options_.reload_destinations) {
    SettingsManager fresh;
    if(fresh.load_from_file(settings_->settings_path())) {
      return destinations_from_settings(fresh);
    }
  }
  return destinations_from_settings(*settings_);
}

JobOutcome Engine::run_job(const Job& job, JobContext& ctx) {
  std::vector<Destination> all;
  try {
    all = destinations();
  } catch(const ConfigurationError& e) {
    JobOutcome outcome;
    outcome.state = JobState::Failed;
    outcome.category = e.category();
    outcome.message = e.what();
    return outcome;
  }

  switch(job.kind) {
    case JobKind::Upload: {
      UploadRequest request;
      request.file_path = job.file_path;
      request.replaces = job.replaces;
      return orchestrator_->run_upload(request, enabled_destinations(all), ctx);
    }
    case JobKind::Download: {
      DownloadRequest request;
      request.manifest_id = job.manifest_id;
      request.output_path = job.output_path;
      return orchestrator_->run_download(request, all, ctx);
    }
    case JobKind::Delete:
      return orchestrator_->run_delete(job.manifest_id, all, ctx);
  }
  JobOutcome outcome;
  outcome.message = "unknown job kind";
  return outcome;
}

std::string Engine::upload(const std::filesystem::path& file_path, std::optional<std::string> replaces) {
  ensure_started();
  return queue_->enqueue_upload(file_path, std::move(replaces));
}

std::string Engine::download(const std::string& manifest_id, const std::filesystem::path& output_path) {
  ensure_started();
  return queue_->enqueue_download(manifest_id, output_path);
}

std::string Engine::remove(const std::string& manifest_id) {
  ensure_started();
  return queue_->enqueue_delete(manifest_id);
}

bool Engine::wait_idle(std::chrono::milliseconds timeout) {
  ensure_started();
  return queue_->wait_idle(timeout);
}

Engine::Stats Engine::stats() const {
  ensure_started();
  Stats s;
  for(const auto& manifest : store_->list()) {
    ++s.manifests;
    switch(manifest.status) {
      case ManifestStatus::Completed: ++s.completed; break;
      case ManifestStatus::Failed:
      case ManifestStatus::Cancelled: ++s.failed; break;
      default: ++s.in_progress; break;
    }
  }
  const auto uploads = queue_->snapshot(Lane::Upload);
  const auto downloads = queue_->snapshot(Lane::Download);
  s.queued_uploads = uploads.queued.size();
  s.queued_downloads = downloads.queued.size();
  s.held_jobs = uploads.held.size() + downloads.held.size();
  s.upload_active = uploads.active.has_value();
  s.download_active = downloads.active.has_value();
  return s;
}

void Engine::set_job_event_callback(JobEventCallback callback) {
  ensure_started();
  queue_->set_event_callback(std::move(callback));
}

LogListenerHandle Engine::add_log_listener(Logger::Listener listener, void* user_data) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener), user_data);
}

void Engine::remove_log_listener(LogListenerHandle handle) {
  if(logger_ && handle != 0) {
    logger_->remove_listener(handle);
  }
}

void Engine::clear_log_listeners() {
  if(logger_) {
    logger_->clear_listeners();
  }
}

ManifestStore& Engine::store() {
  ensure_started();
  return *store_;
}

TransferBackend& Engine::backend() {
  ensure_started();
  return *backend_;
}

JobQueueManager& Engine::queue() {
  ensure_started();
  return *queue_;
}
