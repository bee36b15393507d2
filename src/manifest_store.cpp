#include "manifest_store.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace {

constexpr const char* kRecordExtension = ".json";

std::string sanitize_stem(const std::string& filename) {
  auto stem = std::filesystem::path(filename).stem().string();
  std::string out;
  out.reserve(stem.size());
  for(unsigned char c : stem) {
    if(std::isalnum(c) || c == '-' || c == '_') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('_');
    }
  }
  if(out.empty()) out = "file";
  return out;
}

} // namespace

ManifestStore::ManifestStore(std::filesystem::path folder, std::shared_ptr<Logger> logger)
  : folder_(std::move(folder)), logger_(std::move(logger)) {
  std::error_code ec;
  std::filesystem::create_directories(folder_, ec);
  if(ec || !std::filesystem::is_directory(folder_)) {
    throw IoError(folder_, "manifest folder is not writable");
  }
}

std::filesystem::path ManifestStore::path_for(const std::string& id) const {
  return folder_ / (id + kRecordExtension);
}

std::shared_ptr<std::mutex> ManifestStore::lock_for(const std::string& id) const {
  std::lock_guard<std::mutex> lock(locks_mutex_);
  auto& slot = locks_[id];
  if(!slot) slot = std::make_shared<std::mutex>();
  return slot;
}

std::optional<Manifest> ManifestStore::read_record(const std::string& id) const {
  const auto path = path_for(id);
  std::error_code ec;
  if(!std::filesystem::exists(path, ec)) return std::nullopt;
  std::ifstream in(path);
  if(!in) {
    throw IoError(path, "unable to open manifest");
  }
  try {
    nlohmann::json doc;
    in >> doc;
    return doc.get<Manifest>();
  } catch(const nlohmann::json::exception& e) {
    throw IoError(path, std::string("corrupt manifest (") + e.what() + ")");
  }
}

void ManifestStore::write_record(const Manifest& manifest) const {
  const auto path = path_for(manifest.id);
  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if(!out) {
      throw IoError(tmp, "unable to write manifest");
    }
    out << nlohmann::json(manifest).dump(2);
    out.close();
    if(!out) {
      std::error_code ignored;
      std::filesystem::remove(tmp, ignored);
      throw IoError(tmp, "failed flushing manifest");
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if(ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    throw IoError(path, "unable to replace manifest (" + ec.message() + ")");
  }
}

std::string ManifestStore::generate_id(const std::string& filename) const {
  const auto base = sanitize_stem(filename) + "_" + compact_timestamp_now();
  std::string id = base;
  std::error_code ec;
  for(int suffix = 2; std::filesystem::exists(path_for(id), ec); ++suffix) {
    id = base + "_" + std::to_string(suffix);
  }
  return id;
}

std::string ManifestStore::create(Manifest manifest) {
  std::lock_guard<std::mutex> create_lock(create_mutex_);
  manifest.id = generate_id(manifest.original.filename);
  manifest.version = kManifestVersion;
  manifest.created_at = iso_timestamp_now();
  manifest.updated_at.reset();
  for(std::size_t i = 0; i < manifest.chunks.size(); ++i) {
    manifest.chunks[i].index = i;
  }
  auto guard = lock_for(manifest.id);
  std::lock_guard<std::mutex> lock(*guard);
  write_record(manifest);
  log_debug(logger_.get(), "Manifest {} created ({} chunks)", manifest.id, manifest.chunks.size());
  return manifest.id;
}

std::optional<Manifest> ManifestStore::load(const std::string& id) const {
  auto guard = lock_for(id);
  std::lock_guard<std::mutex> lock(*guard);
  return read_record(id);
}

bool ManifestStore::update_fields(const std::string& id, const ManifestUpdate& update) {
  auto guard = lock_for(id);
  std::lock_guard<std::mutex> lock(*guard);
  auto manifest = read_record(id);
  if(!manifest) return false;
  if(update.status) manifest->status = *update.status;
  if(update.completed_at) manifest->completed_at = update.completed_at;
  if(update.error) manifest->error = update.error;
  if(update.replaces) manifest->replaces = update.replaces;
  manifest->updated_at = iso_timestamp_now();
  write_record(*manifest);
  return true;
}

bool ManifestStore::update_chunk_status(const std::string& id,
                                        std::size_t index,
                                        ChunkStatus status,
                                        const ChunkUpdate& extra) {
  auto guard = lock_for(id);
  std::lock_guard<std::mutex> lock(*guard);
  auto manifest = read_record(id);
  if(!manifest) return false;
  if(index >= manifest->chunks.size()) return false;
  auto& chunk = manifest->chunks[index];
  chunk.status = status;
  if(extra.clear_error) chunk.error.reset();
  if(extra.error) chunk.error = extra.error;
  if(extra.timestamp) chunk.timestamp = extra.timestamp;
  if(extra.local_path) chunk.local_path = *extra.local_path;
  manifest->updated_at = iso_timestamp_now();
  write_record(*manifest);
  return true;
}

std::vector<Manifest> ManifestStore::list() const {
  std::vector<Manifest> out;
  std::error_code ec;
  for(std::filesystem::directory_iterator it(folder_, ec), end; !ec && it != end; it.increment(ec)) {
    const auto& path = it->path();
    if(path.extension() != kRecordExtension) continue;
    const auto id = path.stem().string();
    try {
      auto manifest = load(id);
      if(manifest) out.push_back(std::move(*manifest));
    } catch(const IoError& e) {
      log_warn(logger_.get(), "Skipping manifest {}: {}", id, e.what());
    }
  }
  std::sort(out.begin(), out.end(), [](const Manifest& a, const Manifest& b){
    if(a.created_at != b.created_at) return a.created_at > b.created_at;
    return a.id > b.id;
  });
  return out;
}

bool ManifestStore::remove(const std::string& id) {
  auto guard = lock_for(id);
  bool removed = false;
  {
    std::lock_guard<std::mutex> lock(*guard);
    std::error_code ec;
    removed = std::filesystem::remove(path_for(id), ec);
    if(ec) {
      log_warn(logger_.get(), "Failed removing manifest {}: {}", id, ec.message());
      return false;
    }
  }
  if(removed) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    locks_.erase(id);
  }
  return removed;
}

std::optional<UploadProgress> ManifestStore::upload_progress(const std::string& id) const {
  auto manifest = load(id);
  if(!manifest) return std::nullopt;
  UploadProgress progress;
  progress.total = manifest->chunks.size();
  progress.done = manifest->count_chunks(ChunkStatus::Done);
  progress.failed = manifest->count_chunks(ChunkStatus::Failed);
  progress.remaining = progress.total - progress.done - progress.failed;
  progress.percent = progress.total == 0
    ? 0.0
    : 100.0 * static_cast<double>(progress.done) / static_cast<double>(progress.total);
  progress.status = manifest->status;
  return progress;
}

std::vector<DownloadSummary> ManifestStore::available_downloads() const {
  std::vector<DownloadSummary> out;
  for(const auto& manifest : list()) {
    if(manifest.status != ManifestStatus::Completed) continue;
    DownloadSummary summary;
    summary.id = manifest.id;
    summary.filename = manifest.original.filename;
    summary.size = manifest.original.size;
    summary.size_formatted = format_size(manifest.original.size);
    summary.chunk_count = manifest.chunks.size();
    summary.created_at = manifest.created_at;
    summary.completed_at = manifest.completed_at.value_or("");
    out.push_back(std::move(summary));
  }
  return out;
}

std::vector<std::size_t> ManifestStore::orphaned_chunks(
  const std::string& id,
  const std::unordered_set<std::string>& known_destinations) const {
  std::vector<std::size_t> out;
  auto manifest = load(id);
  if(!manifest) return out;
  for(const auto& chunk : manifest->chunks) {
    if(known_destinations.count(chunk.destination_id) == 0) {
      out.push_back(chunk.index);
    }
  }
  return out;
}
