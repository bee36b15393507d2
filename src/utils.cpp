#include "utils.hpp"
#include "errors.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {
constexpr std::size_t kHashBufferSize = 1 << 20;

std::tm local_time_now(std::chrono::system_clock::time_point now, long& millis) {
  auto t = std::chrono::system_clock::to_time_t(now);
  millis = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
    now.time_since_epoch()).count() % 1000);
  std::tm tm{};
  localtime_r(&t, &tm);
  return tm;
}
} // namespace

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if(EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }
    out.resize(len);
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

void Sha256Accumulator::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
  EVP_MD_CTX_free(ctx);
}

Sha256Accumulator::Sha256Accumulator() : ctx_(EVP_MD_CTX_new()) {
  if(!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("Unable to initialise SHA-256 context");
  }
}

Sha256Accumulator::~Sha256Accumulator() = default;
Sha256Accumulator::Sha256Accumulator(Sha256Accumulator&&) noexcept = default;
Sha256Accumulator& Sha256Accumulator::operator=(Sha256Accumulator&&) noexcept = default;

void Sha256Accumulator::update(const char* data, std::size_t size) {
  if(finalized_) throw std::logic_error("Sha256Accumulator already finalized");
  if(data == nullptr || size == 0) return;
  if(EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

std::string Sha256Accumulator::hex() {
  if(finalized_) throw std::logic_error("Sha256Accumulator already finalized");
  std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
  unsigned int len = 0;
  if(EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  finalized_ = true;
  out.resize(len);
  return hex_from_bytes(out);
}

std::string sha256_file_hex(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if(!in) {
    throw IoError(path, "unable to open for hashing");
  }
  Sha256Accumulator acc;
  std::vector<char> buffer(kHashBufferSize);
  while(in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto got = in.gcount();
    if(got <= 0) break;
    acc.update(buffer.data(), static_cast<std::size_t>(got));
  }
  if(in.bad()) {
    throw IoError(path, "read error while hashing");
  }
  return acc.hex();
}

std::string format_size(uint64_t size_bytes) {
  static const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};
  double value = static_cast<double>(size_bytes);
  for(const char* unit : kUnits) {
    if(value < 1024.0) {
      std::ostringstream oss;
      oss << std::fixed << std::setprecision(2) << value << ' ' << unit;
      return oss.str();
    }
    value /= 1024.0;
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << value << " PB";
  return oss.str();
}

std::string iso_timestamp_now() {
  long millis = 0;
  auto tm = local_time_now(std::chrono::system_clock::now(), millis);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
      << '.' << std::setw(3) << std::setfill('0') << millis;
  return oss.str();
}

std::string compact_timestamp_now() {
  long millis = 0;
  auto tm = local_time_now(std::chrono::system_clock::now(), millis);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
  return oss.str();
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string trim_copy(std::string value) {
  auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
  return value;
}
