#pragma once

#include <asio.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "errors.hpp"
#include "job_context.hpp"

class Logger;

enum class JobKind { Upload, Download, Delete };
enum class Lane { Upload = 0, Download = 1 };

const char* to_string(JobKind kind);
const char* to_string(Lane lane);

struct Job {
  std::string id;
  JobKind kind = JobKind::Upload;
  std::filesystem::path file_path;       // upload
  std::optional<std::string> replaces;   // upload
  std::string manifest_id;               // download, delete
  std::filesystem::path output_path;     // download
  std::size_t attempt = 0;               // automatic retries used so far
};

struct RetryRecord {
  Job job;
  std::size_t attempt_count = 0;
  std::string last_error;
  std::chrono::steady_clock::time_point not_before;
};

enum class JobEventType {
  Queued,
  Started,
  Completed,
  RetryScheduled,
  FailedTerminal,
  AuthRequired,
  Cancelled,
  Removed
};

const char* to_string(JobEventType type);

struct JobEvent {
  JobEventType type = JobEventType::Queued;
  Lane lane = Lane::Upload;
  Job job;
  JobOutcome outcome;                    // Completed, RetryScheduled, FailedTerminal, AuthRequired, Cancelled
  std::chrono::milliseconds delay{0};    // RetryScheduled
  std::string blocked_by;                // AuthRequired for a queued sibling: id of the job that halted the lane
};

struct QueuePolicy {
  std::size_t max_retries = 3;
  std::chrono::milliseconds base_delay{60000};
  std::chrono::milliseconds max_delay{900000};
  bool rate_limit_sweeps_queue = true;
};

struct LaneSnapshot {
  std::vector<Job> queued;
  std::vector<RetryRecord> held;
  std::optional<Job> active;
  bool halted = false;
};

using JobRunner = std::function<JobOutcome(const Job& job, JobContext& ctx)>;
using JobEventCallback = std::function<void(const JobEvent& event)>;

// Two FIFO lanes (uploads and deletes share one, downloads get the other), one job running per
// lane, plus a retry holding set released by timers. Never throws from the processing path.
class JobQueueManager {
public:
  JobQueueManager(JobRunner runner,
                  QueuePolicy policy,
                  std::shared_ptr<Logger> logger = nullptr,
                  std::shared_ptr<ProgressChannel> progress = nullptr);
  ~JobQueueManager();

  JobQueueManager(const JobQueueManager&) = delete;
  JobQueueManager& operator=(const JobQueueManager&) = delete;

  void start();
  void stop();

  std::string enqueue_upload(const std::filesystem::path& file_path,
                             std::optional<std::string> replaces = std::nullopt);
  std::string enqueue_download(const std::string& manifest_id, const std::filesystem::path& output_path);
  std::string enqueue_delete(const std::string& manifest_id);

  // Drops a queued or held job. The running job is not affected; use cancel_active().
  bool remove_queued(const std::string& job_id);
  bool cancel_active(Lane lane);
  // Clears an auth halt so the lane picks up its queue again.
  void resume(Lane lane);

  LaneSnapshot snapshot(Lane lane) const;
  bool wait_idle(std::chrono::milliseconds timeout);

  void set_event_callback(JobEventCallback callback);

  static Lane lane_for(JobKind kind);
  static std::chrono::milliseconds retry_delay(const QueuePolicy& policy, std::size_t attempt);

private:
  struct LaneState {
    std::deque<Job> queue;
    std::vector<RetryRecord> held;
    std::optional<Job> active;
    std::shared_ptr<JobContext> active_ctx;
    bool halted = false;
    std::thread thread;
  };

  std::string enqueue(Job job);
  void lane_loop(Lane lane);
  JobOutcome run_job(const Job& job, JobContext& ctx);
  void handle_outcome(Lane lane, Job job, const JobOutcome& outcome);
  void schedule_release(Lane lane, std::vector<std::string> job_ids, std::chrono::milliseconds delay);
  void release_held(Lane lane, const std::vector<std::string>& job_ids);
  bool lane_idle_locked(const LaneState& state) const;
  void emit(const JobEvent& event);

  LaneState& lane_state(Lane lane) { return lanes_[static_cast<std::size_t>(lane)]; }
  const LaneState& lane_state(Lane lane) const { return lanes_[static_cast<std::size_t>(lane)]; }

  JobRunner runner_;
  QueuePolicy policy_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<ProgressChannel> progress_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::array<LaneState, 2> lanes_;
  bool started_ = false;
  bool stopping_ = false;
  std::atomic<std::size_t> next_job_id_{1};

  std::mutex callback_mutex_;
  JobEventCallback event_callback_;

  asio::io_context io_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::thread io_thread_;
  std::vector<std::shared_ptr<asio::steady_timer>> timers_;
};
