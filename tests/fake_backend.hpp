#pragma once

#include "transfer_backend.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <limits>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace drivesplit::test {

// TransferBackend that keeps "remote" files under a local directory, one subdirectory per
// destination, with hooks to inject failures.
class FakeBackend : public TransferBackend {
public:
  enum class Op { Upload, Download, Remove };

  FakeBackend(std::filesystem::path root, std::vector<std::string> destinations)
    : root_(std::move(root)), destinations_(std::move(destinations)) {
    std::error_code ec;
    for(const auto& d : destinations_) std::filesystem::create_directories(root_ / d, ec);
  }

  // Calls of `op` whose remote path contains `match` fail with `message`, `times` times.
  void add_fault(Op op, std::string match, std::string message,
                 std::size_t times = std::numeric_limits<std::size_t>::max()) {
    std::lock_guard<std::mutex> lock(mutex_);
    faults_.push_back(Fault{op, std::move(match), std::move(message), times});
  }

  void clear_faults() {
    std::lock_guard<std::mutex> lock(mutex_);
    faults_.clear();
  }

  // Downloads of remote paths containing `match` arrive with one byte flipped.
  void corrupt_downloads(std::string match) {
    std::lock_guard<std::mutex> lock(mutex_);
    corrupt_.push_back(std::move(match));
  }

  // The next `times` list_destinations() calls fail with `message`.
  void fail_listing(std::string message, std::size_t times = std::numeric_limits<std::size_t>::max()) {
    std::lock_guard<std::mutex> lock(mutex_);
    listing_error_ = std::move(message);
    listing_failures_ = times;
  }

  void set_unavailable(const std::string& destination) {
    std::lock_guard<std::mutex> lock(mutex_);
    unavailable_.insert(destination);
  }

  // While held, transfer calls block after being counted until release_gate().
  void hold_gate() {
    std::lock_guard<std::mutex> lock(mutex_);
    gate_closed_ = true;
  }

  void release_gate() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      gate_closed_ = false;
    }
    gate_cv_.notify_all();
  }

  std::size_t waiting_at_gate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiting_;
  }

  std::size_t upload_calls() const { return upload_calls_.load(); }
  std::size_t download_calls() const { return download_calls_.load(); }
  std::size_t remove_calls() const { return remove_calls_.load(); }
  std::size_t stat_calls() const { return stat_calls_.load(); }
  std::size_t listing_calls() const { return listing_calls_.load(); }
  std::size_t max_in_flight() const { return max_in_flight_.load(); }

  std::size_t calls_for(const std::string& remote_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = per_path_calls_.find(remote_path);
    return it == per_path_calls_.end() ? 0 : it->second;
  }

  std::filesystem::path stored_path(const std::string& destination, const std::string& remote_path) const {
    return root_ / destination / remote_path;
  }

  bool has_remote(const std::string& destination, const std::string& remote_path) const {
    std::error_code ec;
    return std::filesystem::exists(stored_path(destination, remote_path), ec);
  }

  BackendResult upload(const std::filesystem::path& local_path,
                       const std::string& destination,
                       const std::string& remote_path) override {
    ++upload_calls_;
    InFlight guard(*this);
    if(auto failure = enter(Op::Upload, destination, remote_path)) return *failure;
    auto target = stored_path(destination, remote_path);
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    std::filesystem::copy_file(local_path, target, std::filesystem::copy_options::overwrite_existing, ec);
    if(ec) return BackendResult::failure("copy failed: " + ec.message());
    return BackendResult::success();
  }

  BackendResult download(const std::string& destination,
                         const std::string& remote_path,
                         const std::filesystem::path& local_path) override {
    ++download_calls_;
    InFlight guard(*this);
    if(auto failure = enter(Op::Download, destination, remote_path)) return *failure;
    auto source = stored_path(destination, remote_path);
    std::error_code ec;
    if(!std::filesystem::exists(source, ec)) {
      return BackendResult::failure("object not found: " + remote_path);
    }
    if(local_path.has_parent_path()) std::filesystem::create_directories(local_path.parent_path(), ec);
    std::filesystem::copy_file(source, local_path, std::filesystem::copy_options::overwrite_existing, ec);
    if(ec) return BackendResult::failure("copy failed: " + ec.message());
    if(should_corrupt(remote_path)) {
      std::fstream f(local_path, std::ios::in | std::ios::out | std::ios::binary);
      char c = 0;
      if(f.get(c)) {
        f.seekp(0);
        f.put(static_cast<char>(c ^ 0x5a));
      }
    }
    return BackendResult::success();
  }

  BackendResult remove(const std::string& destination, const std::string& remote_path) override {
    ++remove_calls_;
    if(auto failure = enter(Op::Remove, destination, remote_path)) return *failure;
    std::error_code ec;
    if(!std::filesystem::remove(stored_path(destination, remote_path), ec)) {
      return BackendResult::failure("object not found: " + remote_path);
    }
    return BackendResult::success();
  }

  std::vector<RemoteEntry> list_files(const std::string& destination,
                                      const std::string& path,
                                      bool recursive,
                                      std::size_t max_entries) override {
    std::vector<RemoteEntry> out;
    const auto base = root_ / destination / path;
    std::error_code ec;
    if(!std::filesystem::is_directory(base, ec)) return out;
    auto add = [&](const std::filesystem::directory_entry& entry){
      RemoteEntry r;
      r.name = entry.path().filename().string();
      r.path = std::filesystem::relative(entry.path(), root_ / destination, ec).generic_string();
      r.is_dir = entry.is_directory(ec);
      r.size = r.is_dir ? 0 : entry.file_size(ec);
      out.push_back(std::move(r));
    };
    if(recursive) {
      for(const auto& entry : std::filesystem::recursive_directory_iterator(base, ec)) add(entry);
    } else {
      for(const auto& entry : std::filesystem::directory_iterator(base, ec)) add(entry);
    }
    if(max_entries > 0 && out.size() > max_entries) out.resize(max_entries);
    return out;
  }

  std::optional<DestinationUsage> stat(const std::string& destination) override {
    ++stat_calls_;
    std::lock_guard<std::mutex> lock(mutex_);
    if(unavailable_.count(destination) > 0) return std::nullopt;
    DestinationUsage usage;
    usage.total_bytes = 15ull << 30;
    usage.free_bytes = usage.total_bytes;
    return usage;
  }

  DestinationListing list_destinations() override {
    ++listing_calls_;
    std::lock_guard<std::mutex> lock(mutex_);
    DestinationListing listing;
    if(listing_failures_ > 0) {
      if(listing_failures_ != std::numeric_limits<std::size_t>::max()) --listing_failures_;
      listing.error = listing_error_;
      return listing;
    }
    listing.ok = true;
    listing.names = destinations_;
    return listing;
  }

private:
  struct Fault {
    Op op;
    std::string match;
    std::string message;
    std::size_t remaining;
  };

  struct InFlight {
    explicit InFlight(FakeBackend& owner) : owner_(owner) {
      auto now = ++owner_.in_flight_;
      auto seen = owner_.max_in_flight_.load();
      while(now > seen && !owner_.max_in_flight_.compare_exchange_weak(seen, now)) {}
    }
    ~InFlight() { --owner_.in_flight_; }
    FakeBackend& owner_;
  };

  std::optional<BackendResult> enter(Op op, const std::string& destination, const std::string& remote_path) {
    std::unique_lock<std::mutex> lock(mutex_);
    per_path_calls_[remote_path]++;
    if(op != Op::Remove && gate_closed_) {
      ++waiting_;
      gate_cv_.wait(lock, [&]{ return !gate_closed_; });
      --waiting_;
    }
    if(unavailable_.count(destination) > 0) {
      return BackendResult::failure("connection refused: " + destination);
    }
    for(auto& fault : faults_) {
      if(fault.op != op || fault.remaining == 0) continue;
      if(remote_path.find(fault.match) == std::string::npos) continue;
      if(fault.remaining != std::numeric_limits<std::size_t>::max()) --fault.remaining;
      return BackendResult::failure(fault.message);
    }
    return std::nullopt;
  }

  bool should_corrupt(const std::string& remote_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for(const auto& m : corrupt_) {
      if(remote_path.find(m) != std::string::npos) return true;
    }
    return false;
  }

  std::filesystem::path root_;
  std::vector<std::string> destinations_;
  mutable std::mutex mutex_;
  std::condition_variable gate_cv_;
  bool gate_closed_ = false;
  std::size_t waiting_ = 0;
  std::vector<Fault> faults_;
  std::vector<std::string> corrupt_;
  std::set<std::string> unavailable_;
  std::string listing_error_;
  std::size_t listing_failures_ = 0;
  std::map<std::string, std::size_t> per_path_calls_;
  std::atomic<std::size_t> upload_calls_{0};
  std::atomic<std::size_t> download_calls_{0};
  std::atomic<std::size_t> remove_calls_{0};
  std::atomic<std::size_t> stat_calls_{0};
  std::atomic<std::size_t> listing_calls_{0};
  std::atomic<std::size_t> in_flight_{0};
  std::atomic<std::size_t> max_in_flight_{0};
};

} // namespace drivesplit::test
