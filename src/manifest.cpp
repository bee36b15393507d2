#include "manifest.hpp"

#include <algorithm>

#include "utils.hpp"

namespace {

template<typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
  if(value) {
    j[key] = *value;
  } else {
    j[key] = nullptr;
  }
}

std::optional<std::string> get_optional_string(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if(it == j.end() || it->is_null()) return std::nullopt;
  if(!it->is_string()) return std::nullopt;
  return it->get<std::string>();
}

} // namespace

const char* to_string(ChunkStatus status) {
  switch(status) {
    case ChunkStatus::Pending: return "pending";
    case ChunkStatus::Transferring: return "transferring";
    case ChunkStatus::Done: return "done";
    case ChunkStatus::Failed: return "failed";
  }
  return "pending";
}

const char* to_string(ManifestStatus status) {
  switch(status) {
    case ManifestStatus::Created: return "created";
    case ManifestStatus::Uploading: return "uploading";
    case ManifestStatus::Completed: return "completed";
    case ManifestStatus::Failed: return "failed";
    case ManifestStatus::Cancelled: return "cancelled";
  }
  return "created";
}

// Older records used "uploading"/"uploaded" for chunk states.
ChunkStatus chunk_status_from_string(const std::string& value) {
  if(value == "done" || value == "uploaded") return ChunkStatus::Done;
  if(value == "transferring" || value == "uploading") return ChunkStatus::Transferring;
  if(value == "failed" || value == "error") return ChunkStatus::Failed;
  return ChunkStatus::Pending;
}

ManifestStatus manifest_status_from_string(const std::string& value) {
  if(value == "uploading") return ManifestStatus::Uploading;
  if(value == "completed") return ManifestStatus::Completed;
  if(value == "failed") return ManifestStatus::Failed;
  if(value == "cancelled") return ManifestStatus::Cancelled;
  return ManifestStatus::Created;
}

std::size_t Manifest::count_chunks(ChunkStatus wanted) const {
  return static_cast<std::size_t>(std::count_if(chunks.begin(), chunks.end(),
    [wanted](const ChunkDescriptor& c){ return c.status == wanted; }));
}

void to_json(nlohmann::json& j, const ChunkDescriptor& c) {
  j = nlohmann::json{
    {"index", c.index},
    {"filename", c.filename},
    {"local_path", c.local_path},
    {"size", c.size},
    {"size_formatted", format_size(c.size)},
    {"hash", c.hash},
    {"destination", c.destination_id},
    {"remote_path", c.remote_path},
    {"status", to_string(c.status)}
  };
  put_optional(j, "error", c.error);
  put_optional(j, "timestamp", c.timestamp);
}

void from_json(const nlohmann::json& j, ChunkDescriptor& c) {
  c.index = j.at("index").get<std::size_t>();
  c.filename = j.value("filename", "");
  c.local_path = j.value("local_path", "");
  c.size = j.value<uint64_t>("size", 0);
  c.hash = j.value("hash", "");
  c.destination_id = j.contains("destination") ? j.at("destination").get<std::string>()
                                               : j.value("drive", "");
  c.remote_path = j.value("remote_path", "");
  c.status = chunk_status_from_string(j.value("status", "pending"));
  c.error = get_optional_string(j, "error");
  c.timestamp = get_optional_string(j, "timestamp");
  if(!c.timestamp) c.timestamp = get_optional_string(j, "uploaded_at");
}

void to_json(nlohmann::json& j, const OriginalFile& o) {
  j = nlohmann::json{
    {"filename", o.filename},
    {"path", o.absolute_path},
    {"size", o.size},
    {"size_formatted", format_size(o.size)},
    {"hash", o.hash}
  };
}

void from_json(const nlohmann::json& j, OriginalFile& o) {
  o.filename = j.value("filename", "");
  o.absolute_path = j.value("path", "");
  o.size = j.value<uint64_t>("size", 0);
  o.hash = j.value("hash", "");
}

void to_json(nlohmann::json& j, const Manifest& m) {
  j = nlohmann::json{
    {"manifest_id", m.id},
    {"version", m.version},
    {"created_at", m.created_at},
    {"original_file", m.original},
    {"chunks", m.chunks},
    {"total_chunks", m.chunks.size()},
    {"status", to_string(m.status)}
  };
  put_optional(j, "updated_at", m.updated_at);
  put_optional(j, "completed_at", m.completed_at);
  put_optional(j, "replaces", m.replaces);
  put_optional(j, "error", m.error);
}

void from_json(const nlohmann::json& j, Manifest& m) {
  m.id = j.at("manifest_id").get<std::string>();
  m.version = j.value("version", kManifestVersion);
  m.created_at = j.value("created_at", "");
  m.updated_at = get_optional_string(j, "updated_at");
  m.original = j.at("original_file").get<OriginalFile>();
  m.chunks = j.at("chunks").get<std::vector<ChunkDescriptor>>();
  std::sort(m.chunks.begin(), m.chunks.end(),
            [](const ChunkDescriptor& a, const ChunkDescriptor& b){ return a.index < b.index; });
  m.status = manifest_status_from_string(j.value("status", "created"));
  m.completed_at = get_optional_string(j, "completed_at");
  m.replaces = get_optional_string(j, "replaces");
  m.error = get_optional_string(j, "error");
}
