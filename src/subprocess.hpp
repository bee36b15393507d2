#pragma once

#include <chrono>
#include <string>
#include <vector>

struct ProcessResult {
  int exit_code = -1;
  bool timed_out = false;
  std::string output; // stdout and stderr interleaved
  std::string spawn_error;

  bool ok() const { return spawn_error.empty() && !timed_out && exit_code == 0; }
};

// Runs argv[0] from PATH with stdout and stderr merged into one pipe. The child is killed once
// `timeout` elapses. Never throws for child failures; those land in the result.
ProcessResult run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);
