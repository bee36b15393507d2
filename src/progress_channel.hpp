#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

class Logger;

struct ProgressEvent {
  enum class Kind { Progress, ChunkStatus };

  Kind kind = Kind::Progress;
  std::string job_id;
  std::string stage;       // Progress
  std::size_t current = 0; // Progress
  std::size_t index = 0;   // ChunkStatus
  std::size_t total = 0;
  std::string status;      // ChunkStatus
};

// Workers publish, one consumer drains. publish() only takes the mutex long enough to push.
class ProgressChannel {
public:
  void publish(ProgressEvent event);
  std::optional<ProgressEvent> pop(std::chrono::milliseconds timeout);
  std::vector<ProgressEvent> drain();
  void close();
  bool closed() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<ProgressEvent> events_;
  bool closed_ = false;
};

struct ProgressCallbacks {
  std::function<void(const std::string& job_id, const std::string& stage,
                     std::size_t current, std::size_t total)> on_progress;
  std::function<void(const std::string& job_id, std::size_t index,
                     std::size_t total, const std::string& status)> on_chunk_status;
};

// Delivers channel events to the callbacks on its own thread.
class ProgressDispatcher {
public:
  ProgressDispatcher(std::shared_ptr<ProgressChannel> channel,
                     ProgressCallbacks callbacks,
                     std::shared_ptr<Logger> logger = nullptr);
  ~ProgressDispatcher();

  ProgressDispatcher(const ProgressDispatcher&) = delete;
  ProgressDispatcher& operator=(const ProgressDispatcher&) = delete;

  void start();
  void stop(); // closes the channel and delivers what is left

private:
  void deliver(const ProgressEvent& event);

  std::shared_ptr<ProgressChannel> channel_;
  ProgressCallbacks callbacks_;
  std::shared_ptr<Logger> logger_;
  std::thread thread_;
};
