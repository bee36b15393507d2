#include "rclone_backend.hpp"

#include <nlohmann/json.hpp>

#include <deque>
#include <sstream>

#include "log.hpp"

namespace {

constexpr std::size_t kErrorTailLines = 10;
constexpr std::chrono::seconds kListRemotesTimeout{10};

} // namespace

RcloneBackend::RcloneBackend(RcloneOptions options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)), logger_(std::move(logger)) {}

std::string RcloneBackend::remote_spec(const std::string& destination, const std::string& path) {
  return destination + ":" + path;
}

std::string RcloneBackend::tail_lines(const std::string& output, std::size_t count) {
  std::deque<std::string> lines;
  std::istringstream in(output);
  std::string line;
  while(std::getline(in, line)) {
    if(!line.empty() && line.back() == '\r') line.pop_back();
    if(line.find_first_not_of(" \t") == std::string::npos) continue;
    lines.push_back(line);
    if(lines.size() > count) lines.pop_front();
  }
  std::string out;
  for(const auto& l : lines) {
    if(!out.empty()) out += "\n";
    out += l;
  }
  return out;
}

ProcessResult RcloneBackend::run(std::vector<std::string> args, std::chrono::seconds timeout) const {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 3);
  argv.push_back(options_.executable);
  for(auto& arg : args) argv.push_back(std::move(arg));
  if(!options_.config_path.empty()) {
    argv.push_back("--config");
    argv.push_back(options_.config_path);
  }
  log_debug(logger_.get(), "rclone {}", argv.size() > 1 ? argv[1] : std::string());
  return run_process(argv, timeout);
}

BackendResult RcloneBackend::to_result(const char* verb, const ProcessResult& result,
                                       std::chrono::seconds timeout) const {
  if(result.ok()) return BackendResult::success();
  std::ostringstream oss;
  if(!result.spawn_error.empty()) {
    oss << "rclone " << verb << " could not start: " << result.spawn_error;
  } else if(result.timed_out) {
    oss << "rclone " << verb << " timed out after " << timeout.count() << "s";
  } else {
    oss << "rclone " << verb << " failed with exit code " << result.exit_code;
  }
  const auto tail = tail_lines(result.output, kErrorTailLines);
  if(!tail.empty()) oss << "\n" << tail;
  return BackendResult::failure(oss.str());
}

BackendResult RcloneBackend::upload(const std::filesystem::path& local_path,
                                    const std::string& destination,
                                    const std::string& remote_path) {
  auto result = run({"copyto", local_path.string(), remote_spec(destination, remote_path)},
                    options_.transfer_timeout);
  return to_result("copyto", result, options_.transfer_timeout);
}

BackendResult RcloneBackend::download(const std::string& destination,
                                      const std::string& remote_path,
                                      const std::filesystem::path& local_path) {
  std::error_code ec;
  if(local_path.has_parent_path()) {
    std::filesystem::create_directories(local_path.parent_path(), ec);
    if(ec) {
      return BackendResult::failure("unable to create " + local_path.parent_path().string() + ": " + ec.message());
    }
  }
  auto result = run({"copyto", remote_spec(destination, remote_path), local_path.string()},
                    options_.transfer_timeout);
  return to_result("copyto", result, options_.transfer_timeout);
}

BackendResult RcloneBackend::remove(const std::string& destination, const std::string& remote_path) {
  auto result = run({"deletefile", remote_spec(destination, remote_path)}, options_.query_timeout);
  return to_result("deletefile", result, options_.query_timeout);
}

std::vector<RemoteEntry> RcloneBackend::list_files(const std::string& destination,
                                                   const std::string& path,
                                                   bool recursive,
                                                   std::size_t max_entries) {
  std::vector<std::string> args{"lsjson", remote_spec(destination, path)};
  if(recursive) args.push_back("-R");
  auto result = run(std::move(args), options_.query_timeout);
  if(!result.ok()) {
    log_warn(logger_.get(), "{}", to_result("lsjson", result, options_.query_timeout).error);
    return {};
  }
  auto entries = parse_lsjson(result.output, path);
  if(max_entries > 0 && entries.size() > max_entries) {
    entries.resize(max_entries);
  }
  return entries;
}

std::optional<DestinationUsage> RcloneBackend::stat(const std::string& destination) {
  auto result = run({"about", remote_spec(destination, ""), "--json"}, options_.query_timeout);
  if(!result.ok()) {
    log_warn(logger_.get(), "{}", to_result("about", result, options_.query_timeout).error);
    return std::nullopt;
  }
  return parse_about(result.output);
}

DestinationListing RcloneBackend::list_destinations() {
  DestinationListing listing;
  auto result = run({"listremotes"}, kListRemotesTimeout);
  if(!result.ok()) {
    listing.error = to_result("listremotes", result, kListRemotesTimeout).error;
    log_warn(logger_.get(), "{}", listing.error);
    return listing;
  }
  listing.ok = true;
  listing.names = parse_listremotes(result.output);
  return listing;
}

std::vector<RemoteEntry> RcloneBackend::parse_lsjson(const std::string& json, const std::string& base_path) {
  std::vector<RemoteEntry> out;
  nlohmann::json doc = nlohmann::json::parse(json, nullptr, false);
  if(doc.is_discarded() || !doc.is_array()) return out;
  std::string prefix = base_path;
  if(!prefix.empty() && prefix.back() != '/') prefix += "/";
  for(const auto& item : doc) {
    if(!item.is_object()) continue;
    RemoteEntry entry;
    entry.name = item.value("Name", "");
    entry.path = prefix + item.value("Path", entry.name);
    const auto size = item.value<int64_t>("Size", 0);
    entry.size = size > 0 ? static_cast<uint64_t>(size) : 0;
    entry.is_dir = item.value("IsDir", false);
    entry.mod_time = item.value("ModTime", "");
    out.push_back(std::move(entry));
  }
  return out;
}

std::optional<DestinationUsage> RcloneBackend::parse_about(const std::string& json) {
  nlohmann::json doc = nlohmann::json::parse(json, nullptr, false);
  if(doc.is_discarded() || !doc.is_object()) return std::nullopt;
  DestinationUsage usage;
  usage.total_bytes = doc.value<uint64_t>("total", 0);
  usage.used_bytes = doc.value<uint64_t>("used", 0);
  usage.free_bytes = doc.value<uint64_t>("free", 0);
  return usage;
}

std::vector<std::string> RcloneBackend::parse_listremotes(const std::string& output) {
  std::vector<std::string> out;
  std::istringstream in(output);
  std::string line;
  while(std::getline(in, line)) {
    while(!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == ':')) {
      line.pop_back();
    }
    if(!line.empty()) out.push_back(line);
  }
  return out;
}
