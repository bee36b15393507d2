#include "job_context.hpp"

const char* to_string(JobState state) {
  switch(state) {
    case JobState::Preparing: return "preparing";
    case JobState::Transferring: return "transferring";
    case JobState::Verifying: return "verifying";
    case JobState::Completed: return "completed";
    case JobState::Failed: return "failed";
    case JobState::Cancelled: return "cancelled";
  }
  return "failed";
}

JobContext::JobContext(std::string job_id, std::shared_ptr<ProgressChannel> channel)
  : job_id_(std::move(job_id)), channel_(std::move(channel)) {}

void JobContext::cancel() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    cancelled_.store(true);
  }
  wait_cv_.notify_all();
}

bool JobContext::wait_cancelled_for(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(wait_mutex_);
  return wait_cv_.wait_for(lock, duration, [&]{ return cancelled_.load(); });
}

void JobContext::report_progress(const std::string& stage, std::size_t current, std::size_t total) {
  if(!channel_) return;
  ProgressEvent event;
  event.kind = ProgressEvent::Kind::Progress;
  event.job_id = job_id_;
  event.stage = stage;
  event.current = current;
  event.total = total;
  channel_->publish(std::move(event));
}

void JobContext::report_chunk(std::size_t index, std::size_t total, const std::string& status) {
  if(!channel_) return;
  ProgressEvent event;
  event.kind = ProgressEvent::Kind::ChunkStatus;
  event.job_id = job_id_;
  event.index = index;
  event.total = total;
  event.status = status;
  channel_->publish(std::move(event));
}
