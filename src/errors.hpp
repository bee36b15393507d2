#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

enum class ErrorCategory {
  RateLimit,
  Transient,
  Auth,
  Integrity,
  Configuration,
  IO,
  Cancelled,
  Other
};

const char* to_string(ErrorCategory category);

// Backend messages are free text; this is the only place that interprets them.
ErrorCategory classify_backend_error(const std::string& message);

// Whether a chunk transfer that failed with this category may be attempted again.
bool is_chunk_retryable(ErrorCategory category);

class EngineError : public std::runtime_error {
public:
  EngineError(ErrorCategory category, const std::string& message,
              std::optional<std::size_t> chunk_index = std::nullopt)
    : std::runtime_error(message), category_(category), chunk_index_(chunk_index) {}

  ErrorCategory category() const { return category_; }
  std::optional<std::size_t> chunk_index() const { return chunk_index_; }

private:
  ErrorCategory category_;
  std::optional<std::size_t> chunk_index_;
};

class IntegrityError : public EngineError {
public:
  IntegrityError(std::size_t chunk_index, const std::string& message)
    : EngineError(ErrorCategory::Integrity, message, chunk_index) {}
  explicit IntegrityError(const std::string& message)
    : EngineError(ErrorCategory::Integrity, message) {}
};

class IoError : public EngineError {
public:
  IoError(const std::filesystem::path& path, const std::string& what)
    : EngineError(ErrorCategory::IO, what + ": " + path.string()), path_(path) {}

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

class ConfigurationError : public EngineError {
public:
  explicit ConfigurationError(const std::string& message)
    : EngineError(ErrorCategory::Configuration, "Configuration error: " + message) {}
};
