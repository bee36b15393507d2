#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

struct evp_md_ctx_st;

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);

// Incremental SHA-256 so large files never have to sit in memory.
class Sha256Accumulator {
public:
  Sha256Accumulator();
  ~Sha256Accumulator();
  Sha256Accumulator(Sha256Accumulator&&) noexcept;
  Sha256Accumulator& operator=(Sha256Accumulator&&) noexcept;
  Sha256Accumulator(const Sha256Accumulator&) = delete;
  Sha256Accumulator& operator=(const Sha256Accumulator&) = delete;

  void update(const char* data, std::size_t size);
  std::string hex(); // finalizes; further updates throw

private:
  struct CtxDeleter { void operator()(evp_md_ctx_st* ctx) const; };
  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
  bool finalized_ = false;
};

std::string sha256_file_hex(const std::filesystem::path& path);

std::string format_size(uint64_t size_bytes);
std::string iso_timestamp_now();
std::string compact_timestamp_now(); // YYYYmmdd_HHMMSS, used in ids
std::string to_lower_copy(std::string value);
std::string trim_copy(std::string value);
