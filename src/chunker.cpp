#include "chunker.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "errors.hpp"
#include "utils.hpp"

namespace {

constexpr std::size_t kIoBufferSize = 1 << 20;

std::size_t index_width(std::size_t total_chunks) {
  std::size_t width = 1;
  for(std::size_t n = total_chunks > 0 ? total_chunks - 1 : 0; n >= 10; n /= 10) ++width;
  return std::max<std::size_t>(4, width);
}

void remove_quietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

} // namespace

Chunker::Chunker(uint64_t chunk_size_bytes) : chunk_size_bytes_(chunk_size_bytes) {
  if(chunk_size_bytes_ == 0) {
    throw std::invalid_argument("chunk size must be > 0");
  }
}

std::size_t Chunker::chunk_count(uint64_t file_size, uint64_t chunk_size) {
  if(chunk_size == 0) throw std::invalid_argument("chunk size must be > 0");
  if(file_size == 0) return 1;
  return static_cast<std::size_t>((file_size + chunk_size - 1) / chunk_size);
}

std::string Chunker::chunk_filename(const std::filesystem::path& source,
                                    std::size_t index,
                                    std::size_t total_chunks) {
  std::ostringstream oss;
  oss << source.stem().string() << ".part"
      << std::setw(static_cast<int>(index_width(total_chunks))) << std::setfill('0') << index
      << source.extension().string() << ".chunk";
  return oss.str();
}

SplitResult Chunker::split(const std::filesystem::path& source,
                           const std::filesystem::path& staging_dir,
                           const ChunkProgress& progress) const {
  std::error_code ec;
  if(!std::filesystem::is_regular_file(source, ec)) {
    throw IoError(source, "source is not a readable file");
  }
  const uint64_t file_size = std::filesystem::file_size(source, ec);
  if(ec) {
    throw IoError(source, "unable to stat source (" + ec.message() + ")");
  }
  std::filesystem::create_directories(staging_dir, ec);
  if(ec) {
    throw IoError(staging_dir, "unable to create staging directory (" + ec.message() + ")");
  }

  std::ifstream in(source, std::ios::binary);
  if(!in) {
    throw IoError(source, "unable to open source");
  }

  const std::size_t total = chunk_count(file_size, chunk_size_bytes_);
  const std::size_t buffer_size =
    static_cast<std::size_t>(std::min<uint64_t>(std::max<uint64_t>(chunk_size_bytes_, 1), kIoBufferSize));
  std::vector<char> buffer(buffer_size);

  SplitResult result;
  result.file_size = file_size;
  result.chunks.reserve(total);
  Sha256Accumulator whole_file;

  for(std::size_t index = 0; index < total; ++index) {
    const uint64_t offset = static_cast<uint64_t>(index) * chunk_size_bytes_;
    const uint64_t slice = std::min<uint64_t>(chunk_size_bytes_, file_size - std::min(offset, file_size));
    ChunkFile chunk;
    chunk.path = staging_dir / chunk_filename(source, index, total);
    chunk.size = slice;

    std::ofstream out(chunk.path, std::ios::binary | std::ios::trunc);
    if(!out) {
      throw IoError(chunk.path, "unable to write chunk");
    }
    Sha256Accumulator chunk_hash;
    uint64_t remaining = slice;
    while(remaining > 0) {
      const auto want = static_cast<std::size_t>(std::min<uint64_t>(remaining, buffer.size()));
      in.read(buffer.data(), static_cast<std::streamsize>(want));
      const auto got = static_cast<std::size_t>(in.gcount());
      if(got != want) {
        throw IoError(source, "short read at offset " + std::to_string(offset + (slice - remaining)));
      }
      chunk_hash.update(buffer.data(), got);
      whole_file.update(buffer.data(), got);
      out.write(buffer.data(), static_cast<std::streamsize>(got));
      remaining -= got;
    }
    out.close();
    if(!out) {
      throw IoError(chunk.path, "failed writing chunk");
    }
    chunk.hash = chunk_hash.hex();
    result.chunks.push_back(std::move(chunk));
    if(progress) progress(index + 1, total);
  }

  result.file_hash = whole_file.hex();
  return result;
}

std::filesystem::path Chunker::partial_path_for(const std::filesystem::path& output) {
  auto partial = output;
  partial += ".partial";
  return partial;
}

void Chunker::merge(const std::vector<std::filesystem::path>& ordered_chunks,
                    const std::vector<std::string>& expected_hashes,
                    const std::filesystem::path& output,
                    const ChunkProgress& progress) const {
  const auto partial = merge_to_partial(ordered_chunks, expected_hashes, output, progress);
  publish(partial, output);
}

void Chunker::publish(const std::filesystem::path& partial, const std::filesystem::path& output) {
  std::error_code ec;
  std::filesystem::rename(partial, output, ec);
  if(ec) {
    remove_quietly(partial);
    throw IoError(output, "unable to move merged file into place (" + ec.message() + ")");
  }
}

std::filesystem::path Chunker::merge_to_partial(const std::vector<std::filesystem::path>& ordered_chunks,
                                                const std::vector<std::string>& expected_hashes,
                                                const std::filesystem::path& output,
                                                const ChunkProgress& progress) const {
  if(!expected_hashes.empty() && expected_hashes.size() != ordered_chunks.size()) {
    throw std::invalid_argument("expected_hashes must match the chunk list");
  }
  std::error_code ec;
  if(output.has_parent_path()) {
    std::filesystem::create_directories(output.parent_path(), ec);
  }

  const auto partial = partial_path_for(output);
  std::ofstream out(partial, std::ios::binary | std::ios::trunc);
  if(!out) {
    throw IoError(partial, "unable to open merge output");
  }

  std::vector<char> buffer(kIoBufferSize);
  const std::size_t total = ordered_chunks.size();
  try {
    for(std::size_t index = 0; index < total; ++index) {
      const auto& chunk_path = ordered_chunks[index];
      if(!std::filesystem::is_regular_file(chunk_path, ec)) {
        throw EngineError(ErrorCategory::IO,
                          "chunk " + std::to_string(index) + " missing: " + chunk_path.string(),
                          index);
      }
      if(!expected_hashes.empty()) {
        const auto actual = sha256_file_hex(chunk_path);
        if(actual != expected_hashes[index]) {
          throw IntegrityError(index, "hash mismatch for chunk " + std::to_string(index) +
                               " (expected " + expected_hashes[index] + ", got " + actual + ")");
        }
      }
      std::ifstream in(chunk_path, std::ios::binary);
      if(!in) {
        throw EngineError(ErrorCategory::IO,
                          "unable to read chunk " + std::to_string(index) + ": " + chunk_path.string(),
                          index);
      }
      while(in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = in.gcount();
        if(got <= 0) break;
        out.write(buffer.data(), got);
      }
      if(!out) {
        throw IoError(partial, "write failed while merging chunk " + std::to_string(index));
      }
      if(progress) progress(index + 1, total);
    }
    out.close();
    if(!out) {
      throw IoError(partial, "failed to flush merge output");
    }
  } catch(...) {
    out.close();
    remove_quietly(partial);
    throw;
  }
  return partial;
}

std::string Chunker::file_hash(const std::filesystem::path& path) {
  return sha256_file_hex(path);
}
