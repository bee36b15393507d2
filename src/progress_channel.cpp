#include "progress_channel.hpp"

#include <exception>
#include <iterator>

#include "log.hpp"

void ProgressChannel::publish(ProgressEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(closed_) return;
    events_.push_back(std::move(event));
  }
  cv_.notify_one();
}

std::optional<ProgressEvent> ProgressChannel::pop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [&]{ return closed_ || !events_.empty(); });
  if(events_.empty()) return std::nullopt;
  auto event = std::move(events_.front());
  events_.pop_front();
  return event;
}

std::vector<ProgressEvent> ProgressChannel::drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ProgressEvent> out(std::make_move_iterator(events_.begin()),
                                 std::make_move_iterator(events_.end()));
  events_.clear();
  return out;
}

void ProgressChannel::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool ProgressChannel::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

ProgressDispatcher::ProgressDispatcher(std::shared_ptr<ProgressChannel> channel,
                                       ProgressCallbacks callbacks,
                                       std::shared_ptr<Logger> logger)
  : channel_(std::move(channel)), callbacks_(std::move(callbacks)), logger_(std::move(logger)) {}

ProgressDispatcher::~ProgressDispatcher() {
  stop();
}

void ProgressDispatcher::start() {
  if(thread_.joinable() || !channel_) return;
  thread_ = std::thread([this](){
    while(true) {
      auto event = channel_->pop(std::chrono::milliseconds(100));
      if(event) {
        deliver(*event);
        continue;
      }
      if(channel_->closed()) break;
    }
  });
}

void ProgressDispatcher::stop() {
  if(!channel_) return;
  channel_->close();
  if(thread_.joinable()) thread_.join();
  for(const auto& event : channel_->drain()) {
    deliver(event);
  }
}

void ProgressDispatcher::deliver(const ProgressEvent& event) {
  try {
    if(event.kind == ProgressEvent::Kind::Progress) {
      if(callbacks_.on_progress) {
        callbacks_.on_progress(event.job_id, event.stage, event.current, event.total);
      }
    } else if(callbacks_.on_chunk_status) {
      callbacks_.on_chunk_status(event.job_id, event.index, event.total, event.status);
    }
  } catch(const std::exception& e) {
    log_error(logger_.get(), "Progress callback threw: {}", e.what());
  }
}
