#include "transfer_orchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <deque>
#include <exception>
#include <mutex>
#include <numeric>
#include <thread>
#include <unordered_map>
#include <unordered_set>

#include "log.hpp"
#include "manifest_store.hpp"
#include "utils.hpp"

namespace {

constexpr const char* kStageChunking = "Chunking file";
constexpr const char* kStageManifest = "Creating manifest";
constexpr const char* kStageUploading = "Uploading chunks";
constexpr const char* kStagePreparing = "Preparing";
constexpr const char* kStageDownloading = "Downloading chunks";
constexpr const char* kStageMerging = "Merging chunks";
constexpr const char* kStageVerifying = "Verifying file";
constexpr const char* kStageDeleting = "Deleting chunks";
constexpr const char* kStageCompleted = "Completed";
constexpr const char* kStageFailed = "Failed";
constexpr const char* kStageCancelled = "Cancelled";

constexpr const char* kChunkSkipped = "skipped";

// Removes a staging directory when the job leaves scope, whatever the outcome.
class StagingDirectory {
public:
  StagingDirectory(std::filesystem::path path, Logger* logger)
    : path_(std::move(path)), logger_(logger) {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_, ec);
    if(ec) {
      throw IoError(path_, "staging directory is not writable");
    }
  }

  ~StagingDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if(ec) {
      log_warn(logger_, "Failed to clean staging directory {}: {}", path_.string(), ec.message());
    }
  }

  StagingDirectory(const StagingDirectory&) = delete;
  StagingDirectory& operator=(const StagingDirectory&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  Logger* logger_;
};

std::string staging_name(const std::string& prefix, const std::string& key) {
  std::string out = prefix + "_";
  for(char c : key) {
    out.push_back((std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_') ? c : '_');
  }
  return out;
}

const Destination* find_destination(const std::vector<Destination>& destinations, const std::string& name) {
  for(const auto& d : destinations) {
    if(d.name == name) return &d;
  }
  return nullptr;
}

// Names the backend knows. A failed listing is reported with the backend's own message so
// rate limits and timeouts keep their category instead of reading as a configuration problem.
std::unordered_set<std::string> backend_destination_names(TransferBackend& backend) {
  auto listing = backend.list_destinations();
  if(!listing.ok) {
    throw EngineError(classify_backend_error(listing.error), "unable to list destinations: " + listing.error);
  }
  return std::unordered_set<std::string>(listing.names.begin(), listing.names.end());
}

std::string join_indices(const std::vector<std::size_t>& indices) {
  std::string out;
  for(std::size_t i = 0; i < indices.size(); ++i) {
    if(i > 0) out += ", ";
    out += std::to_string(indices[i]);
  }
  return out;
}

bool is_missing_remote(const std::string& error) {
  const auto lowered = to_lower_copy(error);
  return lowered.find("not found") != std::string::npos ||
         lowered.find("doesn't exist") != std::string::npos ||
         lowered.find("does not exist") != std::string::npos;
}

JobOutcome outcome_from_error(const EngineError& e) {
  JobOutcome outcome;
  outcome.state = e.category() == ErrorCategory::Cancelled ? JobState::Cancelled : JobState::Failed;
  outcome.category = e.category();
  outcome.message = e.what();
  if(e.category() == ErrorCategory::Integrity) {
    outcome.integrity_index = e.chunk_index();
  }
  if(e.chunk_index()) {
    outcome.failed_chunks.push_back(*e.chunk_index());
  }
  return outcome;
}

// Only the job's own `.partial` is discarded; a file already at the output path is left alone.
void discard_partial_output(const std::filesystem::path& output) {
  std::error_code ec;
  std::filesystem::remove(Chunker::partial_path_for(output), ec);
}

} // namespace

TransferOrchestrator::TransferOrchestrator(TransferBackend& backend,
                                           ManifestStore& store,
                                           EngineConfig config,
                                           std::shared_ptr<Logger> logger,
                                           std::shared_ptr<const DistributionPolicy> policy)
  : backend_(backend),
    store_(store),
    config_(std::move(config)),
    logger_(std::move(logger)),
    policy_(policy ? std::move(policy) : std::make_shared<RoundRobinPolicy>()),
    chunker_(config_.chunk_size_bytes) {}

std::string TransferOrchestrator::remote_path_for(const std::string& upload_folder,
                                                  const std::string& chunk_filename) {
  if(upload_folder.empty()) return chunk_filename;
  if(upload_folder.back() == '/') return upload_folder + chunk_filename;
  return upload_folder + "/" + chunk_filename;
}

std::chrono::milliseconds TransferOrchestrator::chunk_backoff(std::size_t failed_attempts) const {
  auto delay = config_.chunk_retry_base;
  for(std::size_t i = 1; i < failed_attempts && delay < config_.chunk_retry_cap; ++i) {
    delay *= 2;
  }
  return std::min(delay, config_.chunk_retry_cap);
}

JobOutcome TransferOrchestrator::finish(JobContext& ctx, JobOutcome outcome) const {
  ctx.set_state(outcome.state);
  switch(outcome.state) {
    case JobState::Completed:
      log_info(logger_.get(), "Job {} completed", ctx.job_id());
      break;
    case JobState::Cancelled:
      outcome.category = ErrorCategory::Cancelled;
      if(outcome.message.empty()) outcome.message = "Cancelled by user";
      ctx.report_progress(kStageCancelled, 0, 0);
      log_warn(logger_.get(), "Job {} cancelled", ctx.job_id());
      break;
    default:
      ctx.report_progress(kStageFailed, 0, 0);
      log_error(logger_.get(), "Job {} failed [{}]: {}", ctx.job_id(), to_string(outcome.category), outcome.message);
      break;
  }
  return outcome;
}

TransferOrchestrator::PoolResult TransferOrchestrator::run_chunk_pool(const std::vector<std::size_t>& indices,
                                                                      std::size_t total_chunks,
                                                                      const std::string& stage,
                                                                      const ChunkCall& call,
                                                                      const ChunkStatusSink& on_status,
                                                                      JobContext& ctx) const {
  PoolResult result;
  if(indices.empty()) return result;

  std::mutex job_mutex;
  std::deque<std::size_t> job_queue(indices.begin(), indices.end());
  std::atomic<bool> failure{false};
  std::mutex progress_mutex; // keeps published counts monotonic
  std::size_t completed = 0;

  auto take_job = [&]() -> std::optional<std::size_t> {
    std::lock_guard<std::mutex> lock(job_mutex);
    if(failure.load() || ctx.cancelled() || job_queue.empty()) return std::nullopt;
    std::size_t job = job_queue.front();
    job_queue.pop_front();
    return job;
  };

  auto fail_job = [&](std::size_t index, ErrorCategory category, const std::string& reason){
    std::lock_guard<std::mutex> lock(job_mutex);
    result.failed.push_back(index);
    if(!failure.exchange(true)) {
      result.failure_category = category;
      result.failure_reason = "chunk " + std::to_string(index) + ": " + reason;
    }
  };

  auto release_job = [&](std::size_t index){
    std::lock_guard<std::mutex> lock(job_mutex);
    result.skipped.push_back(index);
  };

  auto emit_status = [&](std::size_t index, ChunkStatus status, const std::string& error){
    if(on_status) on_status(index, status, error);
    ctx.report_chunk(index, total_chunks, to_string(status));
  };

  auto process = [&](std::size_t index){
    emit_status(index, ChunkStatus::Transferring, {});
    const std::size_t max_attempts = std::max<std::size_t>(1, config_.chunk_max_attempts);
    for(std::size_t attempt = 1; attempt <= max_attempts; ++attempt) {
      if(ctx.cancelled()) break;
      auto response = call(index);
      if(ctx.cancelled()) break; // result discarded
      if(response.ok) {
        emit_status(index, ChunkStatus::Done, {});
        std::lock_guard<std::mutex> lock(progress_mutex);
        ctx.report_progress(stage, ++completed, total_chunks);
        return;
      }
      const auto category = classify_backend_error(response.error);
      log_warn(logger_.get(), "Job {} chunk {} attempt {}/{} failed [{}]: {}",
               ctx.job_id(), index, attempt, max_attempts, to_string(category), response.error);
      if(!is_chunk_retryable(category) || attempt == max_attempts) {
        emit_status(index, ChunkStatus::Failed, response.error);
        fail_job(index, category, response.error);
        return;
      }
      if(ctx.wait_cancelled_for(chunk_backoff(attempt))) break;
    }
    emit_status(index, ChunkStatus::Pending, {});
    release_job(index);
  };

  auto worker_fn = [&](){
    while(true) {
      auto job = take_job();
      if(!job) break;
      try {
        process(*job);
      } catch(const EngineError& e) {
        fail_job(*job, e.category(), e.what());
      } catch(const std::exception& e) {
        fail_job(*job, ErrorCategory::Other, e.what());
      }
    }
  };

  const std::size_t worker_count =
    std::min(std::max<std::size_t>(1, config_.max_concurrent_transfers), indices.size());
  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for(std::size_t i = 0; i < worker_count; ++i) {
    workers.emplace_back(worker_fn);
  }
  for(auto& thread : workers) {
    if(thread.joinable()) thread.join();
  }

  for(auto index : job_queue) {
    ctx.report_chunk(index, total_chunks, kChunkSkipped);
    result.skipped.push_back(index);
  }
  std::sort(result.failed.begin(), result.failed.end());
  std::sort(result.skipped.begin(), result.skipped.end());
  result.completed = completed;
  result.cancelled = ctx.cancelled();
  return result;
}

JobOutcome TransferOrchestrator::run_upload(const UploadRequest& request,
                                            const std::vector<Destination>& destinations,
                                            JobContext& ctx) {
  ctx.set_state(JobState::Preparing);
  JobOutcome outcome;
  std::string manifest_id;
  try {
    auto targets = enabled_destinations(destinations);
    if(targets.empty()) {
      throw ConfigurationError("no enabled destinations");
    }
    const auto configured = backend_destination_names(backend_);
    for(const auto& target : targets) {
      if(configured.count(target.backend_ref) == 0) {
        throw ConfigurationError("destination '" + target.name + "' (remote '" + target.backend_ref +
                                 "') is not configured in the backend");
      }
    }

    std::error_code ec;
    const auto source = std::filesystem::absolute(request.file_path, ec);
    if(ec || !std::filesystem::is_regular_file(source, ec)) {
      throw IoError(request.file_path, "file not found");
    }
    log_info(logger_.get(), "Job {} uploading {}", ctx.job_id(), source.string());

    StagingDirectory staging(config_.temp_folder / staging_name("upload", ctx.job_id()), logger_.get());
    ctx.report_progress(kStageChunking, 0, 0);
    auto split = chunker_.split(source, staging.path(), [&](std::size_t current, std::size_t total){
      ctx.report_progress(kStageChunking, current, total);
    });
    if(ctx.cancelled()) {
      outcome.state = JobState::Cancelled;
      return finish(ctx, std::move(outcome));
    }

    const auto total = split.chunks.size();
    const auto assignment = policy_->assign(total, targets);

    ctx.report_progress(kStageManifest, 0, 1);
    Manifest manifest;
    manifest.original.filename = source.filename().string();
    manifest.original.absolute_path = source.string();
    manifest.original.size = split.file_size;
    manifest.original.hash = split.file_hash;
    manifest.replaces = request.replaces;
    manifest.chunks.reserve(total);
    for(std::size_t i = 0; i < total; ++i) {
      ChunkDescriptor chunk;
      chunk.index = i;
      chunk.filename = split.chunks[i].path.filename().string();
      chunk.local_path = split.chunks[i].path.string();
      chunk.size = split.chunks[i].size;
      chunk.hash = split.chunks[i].hash;
      chunk.destination_id = assignment[i];
      chunk.remote_path = remote_path_for(config_.upload_folder, chunk.filename);
      manifest.chunks.push_back(std::move(chunk));
    }
    manifest_id = store_.create(manifest);
    outcome.manifest_id = manifest_id;
    ctx.report_progress(kStageManifest, 1, 1);

    std::unordered_map<std::string, std::string> backend_refs;
    for(const auto& target : targets) backend_refs[target.name] = target.backend_ref;

    ManifestUpdate uploading;
    uploading.status = ManifestStatus::Uploading;
    store_.update_fields(manifest_id, uploading);
    ctx.set_state(JobState::Transferring);
    ctx.report_progress(kStageUploading, 0, total);

    std::vector<std::size_t> indices(total);
    std::iota(indices.begin(), indices.end(), 0);
    const auto& chunks = manifest.chunks;
    auto pool = run_chunk_pool(indices, total, kStageUploading,
      [&](std::size_t index){
        const auto& chunk = chunks[index];
        return backend_.upload(chunk.local_path, backend_refs.at(chunk.destination_id), chunk.remote_path);
      },
      [&](std::size_t index, ChunkStatus status, const std::string& error){
        ChunkUpdate extra;
        if(status == ChunkStatus::Done) {
          extra.timestamp = iso_timestamp_now();
          extra.clear_error = true;
        } else if(status == ChunkStatus::Failed) {
          extra.error = error;
        }
        store_.update_chunk_status(manifest_id, index, status, extra);
      },
      ctx);

    ManifestUpdate final_update;
    if(pool.cancelled) {
      final_update.status = ManifestStatus::Cancelled;
      final_update.error = std::string("Cancelled by user");
      store_.update_fields(manifest_id, final_update);
      outcome.state = JobState::Cancelled;
      return finish(ctx, std::move(outcome));
    }
    if(!pool.ok()) {
      outcome.state = JobState::Failed;
      outcome.category = pool.failure_category;
      outcome.failed_chunks = pool.failed;
      outcome.message = pool.failure_reason.empty() ? "upload incomplete" : pool.failure_reason;
      final_update.status = ManifestStatus::Failed;
      final_update.error = outcome.message;
      store_.update_fields(manifest_id, final_update);
      return finish(ctx, std::move(outcome));
    }

    final_update.status = ManifestStatus::Completed;
    final_update.completed_at = iso_timestamp_now();
    store_.update_fields(manifest_id, final_update);
    if(request.replaces && *request.replaces != manifest_id) {
      if(store_.remove(*request.replaces)) {
        log_info(logger_.get(), "Manifest {} superseded by {}", *request.replaces, manifest_id);
      }
    }
    ctx.report_progress(kStageCompleted, total, total);
    outcome.state = JobState::Completed;
    outcome.category = ErrorCategory::Other;
    return finish(ctx, std::move(outcome));
  } catch(const EngineError& e) {
    outcome = outcome_from_error(e);
  } catch(const std::exception& e) {
    outcome.state = JobState::Failed;
    outcome.category = ErrorCategory::Other;
    outcome.message = e.what();
  }

  outcome.manifest_id = manifest_id;
  if(!manifest_id.empty()) {
    ManifestUpdate failed;
    failed.status = ManifestStatus::Failed;
    failed.error = outcome.message;
    try {
      store_.update_fields(manifest_id, failed);
    } catch(const EngineError& e) {
      log_error(logger_.get(), "Unable to record failure on manifest {}: {}", manifest_id, e.what());
    }
  }
  return finish(ctx, std::move(outcome));
}

JobOutcome TransferOrchestrator::run_download(const DownloadRequest& request,
                                              const std::vector<Destination>& destinations,
                                              JobContext& ctx) {
  ctx.set_state(JobState::Preparing);
  JobOutcome outcome;
  outcome.manifest_id = request.manifest_id;
  try {
    ctx.report_progress(kStagePreparing, 0, 1);
    auto manifest = store_.load(request.manifest_id);
    if(!manifest) {
      throw ConfigurationError("manifest '" + request.manifest_id + "' not found");
    }
    if(manifest->status != ManifestStatus::Completed) {
      throw ConfigurationError("manifest '" + request.manifest_id + "' is " +
                               to_string(manifest->status) + ", not completed");
    }
    if(request.output_path.empty()) {
      throw ConfigurationError("no output path given");
    }

    const auto configured = backend_destination_names(backend_);
    std::unordered_set<std::string> known;
    for(const auto& d : destinations) {
      if(configured.count(d.backend_ref) > 0) known.insert(d.name);
    }
    auto orphaned = store_.orphaned_chunks(manifest->id, known);
    if(!orphaned.empty()) {
      throw ConfigurationError("chunks [" + join_indices(orphaned) + "] reference destinations that are no longer configured");
    }

    StagingDirectory staging(config_.temp_folder / staging_name("download", ctx.job_id()), logger_.get());
    const auto total = manifest->chunks.size();
    std::vector<std::filesystem::path> local_paths;
    std::vector<std::string> expected_hashes;
    local_paths.reserve(total);
    for(const auto& chunk : manifest->chunks) {
      local_paths.push_back(staging.path() / chunk.filename);
      expected_hashes.push_back(chunk.hash);
    }
    ctx.report_progress(kStagePreparing, 1, 1);
    log_info(logger_.get(), "Job {} downloading {} ({} chunks)", ctx.job_id(), manifest->id, total);

    ctx.set_state(JobState::Transferring);
    ctx.report_progress(kStageDownloading, 0, total);
    std::vector<std::size_t> indices(total);
    std::iota(indices.begin(), indices.end(), 0);
    const auto& chunks = manifest->chunks;
    auto pool = run_chunk_pool(indices, total, kStageDownloading,
      [&](std::size_t index){
        const auto& chunk = chunks[index];
        const auto* destination = find_destination(destinations, chunk.destination_id);
        return backend_.download(destination->backend_ref, chunk.remote_path, local_paths[index]);
      },
      nullptr,
      ctx);

    if(pool.cancelled) {
      outcome.state = JobState::Cancelled;
      return finish(ctx, std::move(outcome));
    }
    if(!pool.ok()) {
      outcome.state = JobState::Failed;
      outcome.category = pool.failure_category;
      outcome.failed_chunks = pool.failed;
      outcome.message = pool.failure_reason.empty() ? "download incomplete" : pool.failure_reason;
      return finish(ctx, std::move(outcome));
    }

    ctx.set_state(JobState::Verifying);
    ctx.report_progress(kStageMerging, 0, total);
    const auto merged = chunker_.merge_to_partial(
      local_paths,
      config_.verify_chunks_on_merge ? expected_hashes : std::vector<std::string>{},
      request.output_path,
      [&](std::size_t current, std::size_t count){
        ctx.report_progress(kStageMerging, current, count);
      });
    if(ctx.cancelled()) {
      discard_partial_output(request.output_path);
      outcome.state = JobState::Cancelled;
      return finish(ctx, std::move(outcome));
    }

    ctx.report_progress(kStageVerifying, 0, 1);
    const auto actual = Chunker::file_hash(merged);
    if(actual != manifest->original.hash) {
      throw IntegrityError("file hash mismatch (expected " + manifest->original.hash + ", got " + actual + ")");
    }
    Chunker::publish(merged, request.output_path);
    ctx.report_progress(kStageVerifying, 1, 1);
    ctx.report_progress(kStageCompleted, total, total);
    outcome.state = JobState::Completed;
    return finish(ctx, std::move(outcome));
  } catch(const EngineError& e) {
    outcome = outcome_from_error(e);
    outcome.manifest_id = request.manifest_id;
  } catch(const std::exception& e) {
    outcome.state = JobState::Failed;
    outcome.category = ErrorCategory::Other;
    outcome.message = e.what();
  }
  discard_partial_output(request.output_path);
  return finish(ctx, std::move(outcome));
}

JobOutcome TransferOrchestrator::run_delete(const std::string& manifest_id,
                                            const std::vector<Destination>& destinations,
                                            JobContext& ctx) {
  ctx.set_state(JobState::Preparing);
  JobOutcome outcome;
  outcome.manifest_id = manifest_id;
  try {
    auto manifest = store_.load(manifest_id);
    if(!manifest) {
      throw ConfigurationError("manifest '" + manifest_id + "' not found");
    }
    const auto total = manifest->chunks.size();
    std::vector<std::size_t> indices;
    std::vector<std::size_t> orphaned;
    for(const auto& chunk : manifest->chunks) {
      if(find_destination(destinations, chunk.destination_id)) {
        indices.push_back(chunk.index);
      } else {
        orphaned.push_back(chunk.index);
      }
    }
    if(!orphaned.empty()) {
      throw ConfigurationError("chunks [" + join_indices(orphaned) + "] reference destinations that are no longer configured");
    }

    ctx.set_state(JobState::Transferring);
    ctx.report_progress(kStageDeleting, 0, total);
    const auto& chunks = manifest->chunks;
    auto pool = run_chunk_pool(indices, total, kStageDeleting,
      [&](std::size_t index){
        const auto& chunk = chunks[index];
        const auto* destination = find_destination(destinations, chunk.destination_id);
        auto response = backend_.remove(destination->backend_ref, chunk.remote_path);
        if(!response.ok && is_missing_remote(response.error)) {
          log_debug(logger_.get(), "Chunk {} already gone from {}", index, destination->name);
          return BackendResult::success();
        }
        return response;
      },
      nullptr,
      ctx);

    if(pool.cancelled) {
      outcome.state = JobState::Cancelled;
      return finish(ctx, std::move(outcome));
    }
    if(!pool.ok()) {
      outcome.state = JobState::Failed;
      outcome.category = pool.failure_category;
      outcome.failed_chunks = pool.failed;
      outcome.message = pool.failure_reason;
      return finish(ctx, std::move(outcome));
    }
    store_.remove(manifest_id);
    ctx.report_progress(kStageCompleted, total, total);
    outcome.state = JobState::Completed;
    return finish(ctx, std::move(outcome));
  } catch(const EngineError& e) {
    outcome = outcome_from_error(e);
    outcome.manifest_id = manifest_id;
  } catch(const std::exception& e) {
    outcome.state = JobState::Failed;
    outcome.category = ErrorCategory::Other;
    outcome.message = e.what();
  }
  return finish(ctx, std::move(outcome));
}
