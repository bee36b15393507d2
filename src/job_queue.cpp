#include "job_queue.hpp"

#include <algorithm>
#include <exception>

#include "log.hpp"

const char* to_string(JobKind kind) {
  switch(kind) {
    case JobKind::Upload: return "upload";
    case JobKind::Download: return "download";
    case JobKind::Delete: return "delete";
  }
  return "upload";
}

const char* to_string(Lane lane) {
  return lane == Lane::Upload ? "upload" : "download";
}

const char* to_string(JobEventType type) {
  switch(type) {
    case JobEventType::Queued: return "queued";
    case JobEventType::Started: return "started";
    case JobEventType::Completed: return "completed";
    case JobEventType::RetryScheduled: return "retry_scheduled";
    case JobEventType::FailedTerminal: return "failed_terminal";
    case JobEventType::AuthRequired: return "auth_required";
    case JobEventType::Cancelled: return "cancelled";
    case JobEventType::Removed: return "removed";
  }
  return "queued";
}

JobQueueManager::JobQueueManager(JobRunner runner,
                                 QueuePolicy policy,
                                 std::shared_ptr<Logger> logger,
                                 std::shared_ptr<ProgressChannel> progress)
  : runner_(std::move(runner)),
    policy_(policy),
    logger_(std::move(logger)),
    progress_(std::move(progress)) {}

JobQueueManager::~JobQueueManager() {
  stop();
}

Lane JobQueueManager::lane_for(JobKind kind) {
  return kind == JobKind::Download ? Lane::Download : Lane::Upload;
}

std::chrono::milliseconds JobQueueManager::retry_delay(const QueuePolicy& policy, std::size_t attempt) {
  auto delay = policy.base_delay;
  for(std::size_t i = 0; i < attempt && delay < policy.max_delay; ++i) {
    delay *= 2;
  }
  return std::min(delay, policy.max_delay);
}

void JobQueueManager::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(started_) return;
  started_ = true;
  stopping_ = false;
  io_.restart();
  work_guard_.emplace(asio::make_work_guard(io_));
  io_thread_ = std::thread([this](){
    io_.run();
  });
  for(auto lane : {Lane::Upload, Lane::Download}) {
    lane_state(lane).thread = std::thread([this, lane](){ lane_loop(lane); });
  }
}

void JobQueueManager::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(!started_) return;
    stopping_ = true;
    for(auto& state : lanes_) {
      if(state.active_ctx) state.active_ctx->cancel();
    }
  }
  cv_.notify_all();
  for(auto& state : lanes_) {
    if(state.thread.joinable()) state.thread.join();
  }

  asio::post(io_, [this](){
    for(auto& timer : timers_) timer->cancel();
  });
  work_guard_.reset();
  if(io_thread_.joinable()) io_thread_.join();
  io_.stop();
  timers_.clear();

  std::lock_guard<std::mutex> lock(mutex_);
  started_ = false;
  cv_.notify_all();
}

std::string JobQueueManager::enqueue(Job job) {
  job.id = "job-" + std::to_string(next_job_id_++);
  const auto lane = lane_for(job.kind);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    lane_state(lane).queue.push_back(job);
  }
  cv_.notify_all();
  log_debug(logger_.get(), "Queued {} job {}", to_string(job.kind), job.id);
  JobEvent event;
  event.type = JobEventType::Queued;
  event.lane = lane;
  event.job = job;
  emit(event);
  return job.id;
}

std::string JobQueueManager::enqueue_upload(const std::filesystem::path& file_path,
                                            std::optional<std::string> replaces) {
  Job job;
  job.kind = JobKind::Upload;
  job.file_path = file_path;
  job.replaces = std::move(replaces);
  return enqueue(std::move(job));
}

std::string JobQueueManager::enqueue_download(const std::string& manifest_id,
                                              const std::filesystem::path& output_path) {
  Job job;
  job.kind = JobKind::Download;
  job.manifest_id = manifest_id;
  job.output_path = output_path;
  return enqueue(std::move(job));
}

std::string JobQueueManager::enqueue_delete(const std::string& manifest_id) {
  Job job;
  job.kind = JobKind::Delete;
  job.manifest_id = manifest_id;
  return enqueue(std::move(job));
}

bool JobQueueManager::remove_queued(const std::string& job_id) {
  std::optional<JobEvent> removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for(auto lane : {Lane::Upload, Lane::Download}) {
      auto& state = lane_state(lane);
      auto qit = std::find_if(state.queue.begin(), state.queue.end(),
                              [&](const Job& j){ return j.id == job_id; });
      if(qit != state.queue.end()) {
        removed = JobEvent{JobEventType::Removed, lane, *qit, {}, {}};
        state.queue.erase(qit);
        break;
      }
      auto hit = std::find_if(state.held.begin(), state.held.end(),
                              [&](const RetryRecord& r){ return r.job.id == job_id; });
      if(hit != state.held.end()) {
        removed = JobEvent{JobEventType::Removed, lane, hit->job, {}, {}};
        state.held.erase(hit);
        break;
      }
    }
  }
  if(!removed) return false;
  cv_.notify_all();
  emit(*removed);
  return true;
}

bool JobQueueManager::cancel_active(Lane lane) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& state = lane_state(lane);
  if(!state.active_ctx) return false;
  state.active_ctx->cancel();
  return true;
}

void JobQueueManager::resume(Lane lane) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    lane_state(lane).halted = false;
  }
  log_info(logger_.get(), "Resuming {} lane", to_string(lane));
  cv_.notify_all();
}

LaneSnapshot JobQueueManager::snapshot(Lane lane) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto& state = lane_state(lane);
  LaneSnapshot out;
  out.queued.assign(state.queue.begin(), state.queue.end());
  out.held = state.held;
  out.active = state.active;
  out.halted = state.halted;
  return out;
}

bool JobQueueManager::lane_idle_locked(const LaneState& state) const {
  if(state.active) return false;
  if(!state.held.empty()) return false;
  return state.queue.empty() || state.halted;
}

bool JobQueueManager::wait_idle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [&]{
    return lane_idle_locked(lanes_[0]) && lane_idle_locked(lanes_[1]);
  });
}

void JobQueueManager::set_event_callback(JobEventCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  event_callback_ = std::move(callback);
}

void JobQueueManager::emit(const JobEvent& event) {
  JobEventCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = event_callback_;
  }
  if(!callback) return;
  try {
    callback(event);
  } catch(const std::exception& e) {
    log_error(logger_.get(), "Job event callback threw: {}", e.what());
  }
}

void JobQueueManager::lane_loop(Lane lane) {
  while(true) {
    Job job;
    std::shared_ptr<JobContext> ctx;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      auto& state = lane_state(lane);
      cv_.wait(lock, [&]{ return stopping_ || (!state.halted && !state.queue.empty()); });
      if(stopping_) break;
      job = std::move(state.queue.front());
      state.queue.pop_front();
      ctx = std::make_shared<JobContext>(job.id, progress_);
      state.active = job;
      state.active_ctx = ctx;
    }

    log_info(logger_.get(), "Starting {} job {} (attempt {})", to_string(job.kind), job.id, job.attempt + 1);
    JobEvent started;
    started.type = JobEventType::Started;
    started.lane = lane;
    started.job = job;
    emit(started);

    auto outcome = run_job(job, *ctx);
    handle_outcome(lane, std::move(job), outcome);
  }
}

JobOutcome JobQueueManager::run_job(const Job& job, JobContext& ctx) {
  JobOutcome outcome;
  try {
    if(!runner_) {
      throw ConfigurationError("no job runner installed");
    }
    outcome = runner_(job, ctx);
  } catch(const EngineError& e) {
    outcome.state = JobState::Failed;
    outcome.category = e.category();
    outcome.message = e.what();
  } catch(const std::exception& e) {
    outcome.state = JobState::Failed;
    outcome.category = ErrorCategory::Other;
    outcome.message = e.what();
  }
  if(outcome.state != JobState::Completed && outcome.message.empty()) {
    outcome.message = "job failed without a message";
  }
  return outcome;
}

void JobQueueManager::handle_outcome(Lane lane, Job job, const JobOutcome& outcome) {
  JobEvent event;
  event.lane = lane;
  event.outcome = outcome;
  std::vector<std::string> release_ids;
  std::vector<Job> halted_siblings;
  std::chrono::milliseconds delay{0};

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = lane_state(lane);
    if(outcome.state == JobState::Completed) {
      event.type = JobEventType::Completed;
    } else if(outcome.state == JobState::Cancelled || outcome.category == ErrorCategory::Cancelled) {
      event.type = JobEventType::Cancelled;
    } else if(outcome.category == ErrorCategory::Auth) {
      // Halt until someone re-authenticates; nothing is dropped.
      state.halted = true;
      halted_siblings.assign(state.queue.begin(), state.queue.end());
      state.queue.push_front(job);
      event.type = JobEventType::AuthRequired;
    } else if(outcome.category == ErrorCategory::Integrity ||
              outcome.category == ErrorCategory::Configuration ||
              outcome.category == ErrorCategory::IO ||
              job.attempt >= policy_.max_retries) {
      event.type = JobEventType::FailedTerminal;
    } else {
      delay = retry_delay(policy_, job.attempt);
      const auto not_before = std::chrono::steady_clock::now() + delay;
      ++job.attempt;
      state.held.push_back(RetryRecord{job, job.attempt, outcome.message, not_before});
      release_ids.push_back(job.id);
      if(outcome.category == ErrorCategory::RateLimit && policy_.rate_limit_sweeps_queue) {
        for(auto& queued : state.queue) {
          release_ids.push_back(queued.id);
          state.held.push_back(RetryRecord{queued, queued.attempt, outcome.message, not_before});
        }
        state.queue.clear();
      }
      event.type = JobEventType::RetryScheduled;
      event.delay = delay;
    }
    event.job = job;
  }
  cv_.notify_all();

  switch(event.type) {
    case JobEventType::Completed:
      log_info(logger_.get(), "Job {} completed", job.id);
      break;
    case JobEventType::Cancelled:
      log_warn(logger_.get(), "Job {} cancelled", job.id);
      break;
    case JobEventType::AuthRequired:
      log_error(logger_.get(), "Job {} needs re-authentication, {} lane halted with {} job(s) waiting: {}",
                job.id, to_string(lane), halted_siblings.size(), outcome.message);
      break;
    case JobEventType::FailedTerminal:
      log_error(logger_.get(), "Job {} failed: {}", job.id, outcome.message);
      break;
    case JobEventType::RetryScheduled:
      log_warn(logger_.get(), "Job {} retry {}/{} in {} ms ({} job(s) held): {}",
               job.id, job.attempt, policy_.max_retries, delay.count(), release_ids.size(), outcome.message);
      schedule_release(lane, release_ids, delay);
      break;
    default:
      break;
  }
  emit(event);
  for(const auto& sibling : halted_siblings) {
    JobEvent blocked;
    blocked.type = JobEventType::AuthRequired;
    blocked.lane = lane;
    blocked.job = sibling;
    blocked.outcome = outcome;
    blocked.blocked_by = job.id;
    emit(blocked);
  }

  // The lane only reads as idle once listeners have seen the outcome.
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = lane_state(lane);
    state.active.reset();
    state.active_ctx.reset();
  }
  cv_.notify_all();
}

void JobQueueManager::schedule_release(Lane lane, std::vector<std::string> job_ids, std::chrono::milliseconds delay) {
  asio::post(io_, [this, lane, job_ids = std::move(job_ids), delay]() mutable {
    auto timer = std::make_shared<asio::steady_timer>(io_);
    timers_.push_back(timer);
    timer->expires_after(delay);
    timer->async_wait([this, lane, timer, job_ids = std::move(job_ids)](const std::error_code& ec){
      timers_.erase(std::remove(timers_.begin(), timers_.end(), timer), timers_.end());
      if(ec) return;
      release_held(lane, job_ids);
    });
  });
}

void JobQueueManager::release_held(Lane lane, const std::vector<std::string>& job_ids) {
  std::size_t released = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = lane_state(lane);
    std::vector<Job> front;
    for(const auto& id : job_ids) {
      auto it = std::find_if(state.held.begin(), state.held.end(),
                             [&](const RetryRecord& r){ return r.job.id == id; });
      if(it == state.held.end()) continue;
      front.push_back(it->job);
      state.held.erase(it);
    }
    state.queue.insert(state.queue.begin(), front.begin(), front.end());
    released = front.size();
  }
  if(released > 0) {
    log_info(logger_.get(), "Requeued {} held job(s) on the {} lane", released, to_string(lane));
  }
  cv_.notify_all();
}
