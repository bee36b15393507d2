#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

struct ChunkFile {
  std::filesystem::path path;
  std::string hash; // sha256 hex of the slice
  uint64_t size = 0;
};

struct SplitResult {
  std::vector<ChunkFile> chunks; // index order
  std::string file_hash;
  uint64_t file_size = 0;
};

using ChunkProgress = std::function<void(std::size_t current, std::size_t total)>;

class Chunker {
public:
  explicit Chunker(uint64_t chunk_size_bytes);

  // Reads `source` once. Each slice lands in staging_dir under chunk_filename(); the whole-file
  // hash is accumulated from the same reads. Throws IoError.
  SplitResult split(const std::filesystem::path& source,
                    const std::filesystem::path& staging_dir,
                    const ChunkProgress& progress = {}) const;

  // Concatenates chunks in the given order into `output`. When expected_hashes is non-empty every
  // chunk is checked before it is appended. Throws IntegrityError / EngineError(IO) carrying the
  // failing index. Only `<output>.partial` is written until the final rename, so a failure leaves
  // whatever was at `output` untouched.
  void merge(const std::vector<std::filesystem::path>& ordered_chunks,
             const std::vector<std::string>& expected_hashes,
             const std::filesystem::path& output,
             const ChunkProgress& progress = {}) const;

  // merge() without the final rename: returns `<output>.partial`, removed again on failure.
  std::filesystem::path merge_to_partial(const std::vector<std::filesystem::path>& ordered_chunks,
                                         const std::vector<std::string>& expected_hashes,
                                         const std::filesystem::path& output,
                                         const ChunkProgress& progress = {}) const;

  // Renames `partial` over `output`. Throws IoError, removing `partial`.
  static void publish(const std::filesystem::path& partial, const std::filesystem::path& output);
  static std::filesystem::path partial_path_for(const std::filesystem::path& output);

  static std::string file_hash(const std::filesystem::path& path);

  // "<stem>.part<index><ext>.chunk", index zero-padded to at least four digits.
  static std::string chunk_filename(const std::filesystem::path& source,
                                    std::size_t index,
                                    std::size_t total_chunks);

  // Never zero: an empty file still has one (empty) chunk.
  static std::size_t chunk_count(uint64_t file_size, uint64_t chunk_size);

  uint64_t chunk_size_bytes() const noexcept { return chunk_size_bytes_; }

private:
  uint64_t chunk_size_bytes_;
};
