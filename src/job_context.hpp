#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "progress_channel.hpp"

enum class JobState { Preparing, Transferring, Verifying, Completed, Failed, Cancelled };

const char* to_string(JobState state);

// Per-job cancellation and reporting handle passed into the orchestrator.
class JobContext {
public:
  explicit JobContext(std::string job_id, std::shared_ptr<ProgressChannel> channel = nullptr);

  const std::string& job_id() const { return job_id_; }

  void cancel();
  bool cancelled() const { return cancelled_.load(); }
  // Sleeps up to `duration`; returns true as soon as the job is cancelled.
  bool wait_cancelled_for(std::chrono::milliseconds duration);

  void set_state(JobState state) { state_.store(state); }
  JobState state() const { return state_.load(); }

  void report_progress(const std::string& stage, std::size_t current, std::size_t total);
  void report_chunk(std::size_t index, std::size_t total, const std::string& status);

private:
  std::string job_id_;
  std::shared_ptr<ProgressChannel> channel_;
  std::atomic<bool> cancelled_{false};
  std::atomic<JobState> state_{JobState::Preparing};
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;
};

struct JobOutcome {
  JobState state = JobState::Failed;
  ErrorCategory category = ErrorCategory::Other;
  std::string message;
  std::string manifest_id;
  std::vector<std::size_t> failed_chunks;
  std::optional<std::size_t> integrity_index;

  bool ok() const { return state == JobState::Completed; }
};
