#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <exception>
#include <vector>

namespace {

constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

// Four process-wide spdlog loggers: stamped stdout/stderr for log lines, bare stdout/stderr for prints.
struct Sinks {
  std::shared_ptr<spdlog::logger> log_out;
  std::shared_ptr<spdlog::logger> log_err;
  std::shared_ptr<spdlog::logger> print_out;
  std::shared_ptr<spdlog::logger> print_err;
  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file;
};

std::mutex g_sinks_mutex;
Sinks g_sinks;
std::atomic<bool> g_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const std::string& name, spdlog::sink_ptr sink,
                                            const char* pattern, spdlog::level::level_enum flush_level) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  spdlog::register_logger(logger);
  return logger;
}

Sinks& sinks_locked() {
  if(g_sinks.log_out) return g_sinks;
  g_sinks.log_out = make_logger("drivesplit.log", std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                                kStampedPattern, spdlog::level::warn);
  g_sinks.log_err = make_logger("drivesplit.error", std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                kStampedPattern, spdlog::level::err);
  g_sinks.print_out = make_logger("drivesplit.print", std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                                  "%v", spdlog::level::info);
  g_sinks.print_err = make_logger("drivesplit.print_err", std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                  "%v", spdlog::level::err);
  return g_sinks;
}

spdlog::logger* route(Sinks& sinks, LogChannel channel) {
  switch(channel) {
    case LogChannel::Print: return sinks.print_out.get();
    case LogChannel::PrintErr: return sinks.print_err.get();
    case LogChannel::Error: return sinks.log_err.get();
    default: return sinks.log_out.get();
  }
}

} // namespace

const char* to_string(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return "debug";
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum level_of(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    default: return spdlog::level::info;
  }
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_passthrough.load(std::memory_order_acquire);
}

void init_logging(const LogOptions& options) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  auto& sinks = sinks_locked();

  if(!options.log_file.empty() && !sinks.file) {
    try {
      sinks.file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_file, false);
      sinks.file->set_pattern(kStampedPattern);
      for(auto* logger : {sinks.log_out.get(), sinks.log_err.get(), sinks.print_out.get(), sinks.print_err.get()}) {
        logger->sinks().push_back(sinks.file);
      }
    } catch(const spdlog::spdlog_ex& e) {
      sinks.file.reset();
      sinks.log_err->error("Unable to open log file {}: {}", options.log_file, e.what());
    }
  }

  const auto level = options.verbose ? spdlog::level::debug : spdlog::level::info;
  sinks.log_out->set_level(level);
  sinks.log_err->set_level(spdlog::level::info);
  sinks.print_out->set_level(spdlog::level::info);
  sinks.print_err->set_level(spdlog::level::info);
  spdlog::set_default_logger(sinks.log_out);
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
}

void Logger::emit(LogChannel channel, const std::string& message) {
  const std::string channel_name = name_.empty()
    ? std::string(to_string(channel))
    : name_ + ":" + to_string(channel);
  if(notify_listeners(channel_name, level_of(channel), message)) return;
  detail::write_default(channel, name_, message);
}

bool Logger::notify_listeners(const std::string& channel_name,
                              spdlog::level::level_enum level,
                              const std::string& message) {
  std::vector<ListenerBinding> bindings;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    bindings.reserve(listeners_.size());
    for(const auto& entry : listeners_) bindings.push_back(entry.second);
  }
  bool consumed = false;
  for(auto& binding : bindings) {
    try {
      consumed |= binding.callback(binding.user_data, channel_name, level, message);
    } catch(const std::exception& e) {
      detail::write_default(LogChannel::Error, "log-listener", fmt::format("listener threw: {}", e.what()));
    }
  }
  return consumed;
}

namespace detail {

void write_default(LogChannel channel, const std::string& prefix, const std::string& message) {
  if(!log_passthrough()) return;
  spdlog::logger* sink = nullptr;
  {
    std::lock_guard<std::mutex> lock(g_sinks_mutex);
    sink = route(sinks_locked(), channel);
  }
  const bool decorated = channel != LogChannel::Print && channel != LogChannel::PrintErr && !prefix.empty();
  if(decorated) {
    sink->log(level_of(channel), "[{}] {}", prefix, message);
  } else {
    sink->log(level_of(channel), "{}", message);
  }
}

} // namespace detail
