#include "job_queue.hpp"
#include "test_runner_utils.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using drivesplit::test::TestCase;
using drivesplit::test::TestContext;
using drivesplit::test::expect;
using drivesplit::test::wait_for_condition;

constexpr std::chrono::seconds kWait{5};

QueuePolicy fast_policy(std::size_t max_retries = 3) {
  QueuePolicy policy;
  policy.max_retries = max_retries;
  policy.base_delay = std::chrono::milliseconds(10);
  policy.max_delay = std::chrono::milliseconds(40);
  return policy;
}

JobOutcome completed() {
  JobOutcome outcome;
  outcome.state = JobState::Completed;
  return outcome;
}

JobOutcome failed(ErrorCategory category, const std::string& message = "failed") {
  JobOutcome outcome;
  outcome.state = JobState::Failed;
  outcome.category = category;
  outcome.message = message;
  return outcome;
}

// Thread-safe record of what the queue emitted and ran.
class Recorder {
public:
  JobEventCallback callback() {
    return [this](const JobEvent& event){
      std::lock_guard<std::mutex> lock(mutex_);
      events_.push_back(event);
    };
  }

  void ran(const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    runs_.push_back(label);
  }

  std::vector<std::string> runs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_;
  }

  std::size_t count(JobEventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = 0;
    for(const auto& e : events_) n += e.type == type ? 1 : 0;
    return n;
  }

  std::vector<JobEvent> of(JobEventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JobEvent> out;
    for(const auto& e : events_) {
      if(e.type == type) out.push_back(e);
    }
    return out;
  }

private:
  mutable std::mutex mutex_;
  std::vector<JobEvent> events_;
  std::vector<std::string> runs_;
};

std::string label_of(const Job& job) {
  return job.kind == JobKind::Upload ? job.file_path.string() : job.manifest_id;
}

std::size_t index_of(const std::vector<std::string>& runs, const std::string& label, std::size_t occurrence = 0) {
  for(std::size_t i = 0; i < runs.size(); ++i) {
    if(runs[i] == label && occurrence-- == 0) return i;
  }
  return runs.size();
}

bool test_jobs_run_in_fifo_order(TestContext& ctx) {
  Recorder rec;
  JobQueueManager queue([&](const Job& job, JobContext&){
    rec.ran(label_of(job));
    return completed();
  }, fast_policy());
  queue.set_event_callback(rec.callback());
  queue.start();
  const auto first = queue.enqueue_upload("a.bin");
  queue.enqueue_upload("b.bin");
  queue.enqueue_delete("manifest_c");

  bool ok = expect(ctx, queue.wait_idle(kWait), "queue drains");
  queue.stop();
  ok &= expect(ctx, first == "job-1", "ids are sequential");
  ok &= expect(ctx, rec.runs() == std::vector<std::string>({"a.bin", "b.bin", "manifest_c"}), "FIFO order");
  ok &= expect(ctx, rec.count(JobEventType::Queued) == 3, "queued events");
  ok &= expect(ctx, rec.count(JobEventType::Completed) == 3, "completed events");
  return ok;
}

bool test_lanes_run_independently(TestContext& ctx) {
  Recorder rec;
  std::atomic<bool> release_upload{false};
  JobQueueManager queue([&](const Job& job, JobContext&){
    if(job.kind == JobKind::Upload) {
      wait_for_condition([&]{ return release_upload.load(); }, kWait, std::chrono::milliseconds(2));
    }
    rec.ran(label_of(job));
    return completed();
  }, fast_policy());
  queue.set_event_callback(rec.callback());
  queue.start();
  queue.enqueue_upload("slow.bin");
  queue.enqueue_download("manifest_x", "out.bin");

  bool ok = expect(ctx, wait_for_condition([&]{ return rec.count(JobEventType::Completed) == 1; }, kWait),
                   "download finishes while upload runs");
  ok &= expect(ctx, rec.runs() == std::vector<std::string>({"manifest_x"}), "download ran first");
  auto upload_lane = queue.snapshot(Lane::Upload);
  ok &= expect(ctx, upload_lane.active.has_value(), "upload still active");
  release_upload = true;
  ok &= expect(ctx, queue.wait_idle(kWait), "queue drains");
  queue.stop();
  ok &= expect(ctx, JobQueueManager::lane_for(JobKind::Delete) == Lane::Upload, "deletes share the upload lane");
  return ok;
}

bool test_retry_then_success(TestContext& ctx) {
  Recorder rec;
  std::vector<std::size_t> attempts;
  JobQueueManager queue([&](const Job& job, JobContext&){
    attempts.push_back(job.attempt);
    return job.attempt < 2 ? failed(ErrorCategory::Transient, "timed out") : completed();
  }, fast_policy());
  queue.set_event_callback(rec.callback());
  queue.start();
  queue.enqueue_upload("flaky.bin");

  bool ok = expect(ctx, wait_for_condition([&]{ return rec.count(JobEventType::Completed) == 1; }, kWait),
                   "job eventually completes");
  queue.stop();
  auto retries = rec.of(JobEventType::RetryScheduled);
  ok &= expect(ctx, attempts == std::vector<std::size_t>({0, 1, 2}), "attempt counter advances");
  ok &= expect(ctx, retries.size() == 2, "two retries scheduled");
  if(retries.size() == 2) {
    ok &= expect(ctx, retries[0].delay == std::chrono::milliseconds(10), "first delay is the base");
    ok &= expect(ctx, retries[1].delay == std::chrono::milliseconds(20), "second delay doubles");
    ok &= expect(ctx, retries[0].outcome.message == "timed out", "retry carries the error");
  }
  return ok;
}

bool test_retries_are_bounded(TestContext& ctx) {
  Recorder rec;
  std::atomic<std::size_t> runs{0};
  JobQueueManager queue([&](const Job&, JobContext&){
    ++runs;
    return failed(ErrorCategory::RateLimit, "429 too many requests");
  }, fast_policy(3));
  queue.set_event_callback(rec.callback());
  queue.start();
  queue.enqueue_upload("hopeless.bin");

  bool ok = expect(ctx, wait_for_condition([&]{ return rec.count(JobEventType::FailedTerminal) == 1; }, kWait),
                   "job fails terminally");
  ok &= expect(ctx, queue.wait_idle(kWait), "queue idle afterwards");
  queue.stop();
  ok &= expect(ctx, runs.load() == 4, "one run plus three retries");
  ok &= expect(ctx, rec.count(JobEventType::RetryScheduled) == 3, "three retries scheduled");
  return ok;
}

bool run_rate_limit_scenario(TestContext& ctx, bool sweep, std::vector<std::string>& runs_out,
                             LaneSnapshot& at_retry) {
  Recorder rec;
  std::atomic<bool> limited{false};
  QueuePolicy policy = fast_policy();
  policy.base_delay = std::chrono::milliseconds(sweep ? 200 : 10);
  policy.rate_limit_sweeps_queue = sweep;
  JobQueueManager* queue_ptr = nullptr;
  JobQueueManager queue([&](const Job& job, JobContext&){
    rec.ran(label_of(job));
    if(job.file_path == "a.bin" && !limited.exchange(true)) {
      wait_for_condition([&]{ return queue_ptr->snapshot(Lane::Upload).queued.size() == 2; }, kWait,
                         std::chrono::milliseconds(2));
      return failed(ErrorCategory::RateLimit, "userRateLimitExceeded");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    return completed();
  }, policy);
  queue_ptr = &queue;
  queue.set_event_callback([&](const JobEvent& event){
    if(event.type == JobEventType::RetryScheduled) at_retry = queue_ptr->snapshot(Lane::Upload);
    rec.callback()(event);
  });
  queue.start();
  queue.enqueue_upload("a.bin");
  queue.enqueue_upload("b.bin");
  queue.enqueue_upload("c.bin");

  bool ok = expect(ctx, wait_for_condition([&]{ return rec.count(JobEventType::Completed) == 3; }, kWait),
                   "all three complete");
  queue.stop();
  runs_out = rec.runs();
  return ok;
}

bool test_rate_limit_holds_whole_lane(TestContext& ctx) {
  std::vector<std::string> runs;
  LaneSnapshot at_retry;
  bool ok = run_rate_limit_scenario(ctx, true, runs, at_retry);
  ok &= expect(ctx, at_retry.held.size() == 3 && at_retry.queued.empty(), "queued jobs moved to held set");
  ok &= expect(ctx, runs == std::vector<std::string>({"a.bin", "a.bin", "b.bin", "c.bin"}),
               "original order kept after release");
  return ok;
}

bool test_rate_limit_without_sweep(TestContext& ctx) {
  std::vector<std::string> runs;
  LaneSnapshot at_retry;
  bool ok = run_rate_limit_scenario(ctx, false, runs, at_retry);
  ok &= expect(ctx, at_retry.held.size() == 1, "only the failed job held");
  ok &= expect(ctx, index_of(runs, "b.bin") < index_of(runs, "a.bin", 1), "other jobs keep running");
  return ok;
}

bool test_auth_failure_halts_lane(TestContext& ctx) {
  Recorder rec;
  std::atomic<bool> authed{false};
  JobQueueManager queue([&](const Job& job, JobContext&){
    rec.ran(label_of(job));
    if(!authed.load()) return failed(ErrorCategory::Auth, "invalid_grant");
    return completed();
  }, fast_policy());
  queue.set_event_callback(rec.callback());
  const auto a = queue.enqueue_upload("a.bin");
  const auto b = queue.enqueue_upload("b.bin");
  queue.start();

  bool ok = expect(ctx, wait_for_condition([&]{ return rec.count(JobEventType::AuthRequired) == 2; }, kWait),
                   "auth events emitted for the failed job and the one waiting behind it");
  auto auth_events = rec.of(JobEventType::AuthRequired);
  ok &= expect(ctx, auth_events.size() == 2 && auth_events[0].job.id == a && auth_events[0].blocked_by.empty(),
               "failed job reported first");
  ok &= expect(ctx, auth_events.size() == 2 && auth_events[1].job.id == b && auth_events[1].blocked_by == a &&
                    auth_events[1].outcome.category == ErrorCategory::Auth,
               "waiting job reported as blocked by the failed one");
  ok &= expect(ctx, queue.wait_idle(kWait), "halted lane counts as idle");
  auto snap = queue.snapshot(Lane::Upload);
  ok &= expect(ctx, snap.halted, "lane halted");
  ok &= expect(ctx, snap.queued.size() == 2 && snap.queued[0].file_path == "a.bin", "failed job kept at the front");
  ok &= expect(ctx, rec.runs().size() == 1, "nothing else ran");

  authed = true;
  queue.resume(Lane::Upload);
  ok &= expect(ctx, wait_for_condition([&]{ return rec.count(JobEventType::Completed) == 2; }, kWait),
               "both complete after resume");
  queue.stop();
  ok &= expect(ctx, rec.runs() == std::vector<std::string>({"a.bin", "a.bin", "b.bin"}), "order after resume");
  return ok;
}

bool test_terminal_categories_are_not_retried(TestContext& ctx) {
  Recorder rec;
  std::map<std::string, ErrorCategory> plan = {
    {"integrity.bin", ErrorCategory::Integrity},
    {"config.bin", ErrorCategory::Configuration},
    {"io.bin", ErrorCategory::IO}
  };
  JobQueueManager queue([&](const Job& job, JobContext&){
    rec.ran(label_of(job));
    return failed(plan.at(job.file_path.string()));
  }, fast_policy());
  queue.set_event_callback(rec.callback());
  queue.start();
  for(const auto& entry : plan) queue.enqueue_upload(entry.first);

  bool ok = expect(ctx, wait_for_condition([&]{ return rec.count(JobEventType::FailedTerminal) == 3; }, kWait),
                   "three terminal failures");
  queue.stop();
  ok &= expect(ctx, rec.runs().size() == 3, "each ran once");
  ok &= expect(ctx, rec.count(JobEventType::RetryScheduled) == 0, "no retries");
  return ok;
}

bool test_remove_queued_job(TestContext& ctx) {
  Recorder rec;
  std::atomic<bool> release{false};
  JobQueueManager queue([&](const Job& job, JobContext&){
    if(job.file_path == "a.bin") {
      wait_for_condition([&]{ return release.load(); }, kWait, std::chrono::milliseconds(2));
    }
    rec.ran(label_of(job));
    return completed();
  }, fast_policy());
  queue.set_event_callback(rec.callback());
  queue.start();
  const auto a = queue.enqueue_upload("a.bin");
  const auto b = queue.enqueue_upload("b.bin");
  queue.enqueue_upload("c.bin");

  bool ok = expect(ctx, wait_for_condition([&]{ return queue.snapshot(Lane::Upload).active.has_value(); }, kWait),
                   "first job started");
  ok &= expect(ctx, queue.remove_queued(b), "queued job removed");
  ok &= expect(ctx, !queue.remove_queued(a), "running job is not removable");
  ok &= expect(ctx, !queue.remove_queued("job-999"), "unknown id");
  release = true;
  ok &= expect(ctx, queue.wait_idle(kWait), "queue drains");
  queue.stop();
  ok &= expect(ctx, rec.runs() == std::vector<std::string>({"a.bin", "c.bin"}), "removed job never ran");
  ok &= expect(ctx, rec.count(JobEventType::Removed) == 1, "removed event");
  return ok;
}

bool test_cancel_active_job(TestContext& ctx) {
  Recorder rec;
  JobQueueManager queue([&](const Job&, JobContext& job_ctx){
    if(job_ctx.wait_cancelled_for(std::chrono::seconds(5))) {
      JobOutcome outcome;
      outcome.state = JobState::Cancelled;
      outcome.category = ErrorCategory::Cancelled;
      outcome.message = "Cancelled by user";
      return outcome;
    }
    return completed();
  }, fast_policy());
  queue.set_event_callback(rec.callback());
  queue.start();

  bool ok = expect(ctx, !queue.cancel_active(Lane::Download), "nothing to cancel on an idle lane");
  queue.enqueue_download("manifest_x", "out.bin");
  ok &= expect(ctx, wait_for_condition([&]{ return rec.count(JobEventType::Started) == 1; }, kWait), "job started");
  ok &= expect(ctx, queue.cancel_active(Lane::Download), "cancel accepted");
  ok &= expect(ctx, wait_for_condition([&]{ return rec.count(JobEventType::Cancelled) == 1; }, kWait),
               "cancelled event");
  ok &= expect(ctx, queue.wait_idle(kWait), "lane idle");
  queue.stop();
  ok &= expect(ctx, rec.count(JobEventType::RetryScheduled) == 0, "cancelled jobs are not retried");
  return ok;
}

bool test_retry_delay_doubles_up_to_cap(TestContext& ctx) {
  QueuePolicy policy;
  using std::chrono::milliseconds;
  return expect(ctx, JobQueueManager::retry_delay(policy, 0) == milliseconds(60000), "attempt 0") &&
         expect(ctx, JobQueueManager::retry_delay(policy, 1) == milliseconds(120000), "attempt 1") &&
         expect(ctx, JobQueueManager::retry_delay(policy, 2) == milliseconds(240000), "attempt 2") &&
         expect(ctx, JobQueueManager::retry_delay(policy, 4) == milliseconds(900000), "capped");
}

bool test_runner_exceptions_become_outcomes(TestContext& ctx) {
  Recorder rec;
  JobQueueManager queue([&](const Job& job, JobContext&) -> JobOutcome {
    if(job.file_path == "io.bin") throw IoError(job.file_path, "read failed");
    throw std::runtime_error("boom");
  }, fast_policy(0));
  queue.set_event_callback(rec.callback());
  queue.start();
  queue.enqueue_upload("io.bin");
  queue.enqueue_upload("other.bin");

  bool ok = expect(ctx, wait_for_condition([&]{ return rec.count(JobEventType::FailedTerminal) == 2; }, kWait),
                   "both fail terminally");
  queue.stop();
  auto failures = rec.of(JobEventType::FailedTerminal);
  if(failures.size() == 2) {
    ok &= expect(ctx, failures[0].outcome.category == ErrorCategory::IO, "engine error keeps its category");
    ok &= expect(ctx, failures[1].outcome.category == ErrorCategory::Other, "other exceptions are Other");
    ok &= expect(ctx, failures[1].outcome.message == "boom", "message kept");
  }
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"jobs_run_in_fifo_order", test_jobs_run_in_fifo_order},
    {"lanes_run_independently", test_lanes_run_independently},
    {"retry_then_success", test_retry_then_success},
    {"retries_are_bounded", test_retries_are_bounded},
    {"rate_limit_holds_whole_lane", test_rate_limit_holds_whole_lane},
    {"rate_limit_without_sweep", test_rate_limit_without_sweep},
    {"auth_failure_halts_lane", test_auth_failure_halts_lane},
    {"terminal_categories_are_not_retried", test_terminal_categories_are_not_retried},
    {"remove_queued_job", test_remove_queued_job},
    {"cancel_active_job", test_cancel_active_job},
    {"retry_delay_doubles_up_to_cap", test_retry_delay_doubles_up_to_cap},
    {"runner_exceptions_become_outcomes", test_runner_exceptions_become_outcomes}
  };
  return drivesplit::test::run_tests("job queue", tests, argc, argv);
}
