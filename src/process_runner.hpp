#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pcli2mcp {

struct ProcessLimits {
  std::chrono::milliseconds wall_clock{120000};
  size_t max_output_bytes = 8 * 1024 * 1024;  // per stream
};

// Exit code reported when the child died from a signal, including the
// SIGKILL sent on timeout. Real exit codes are always >= 0.
constexpr int kExitTerminated = -1;

struct ExecutionResult {
  int pid = -1;
  int exit_code = kExitTerminated;
  int term_signal = 0;
  bool timed_out = false;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
  std::string stdout_data;
  std::string stderr_data;
  std::chrono::milliseconds elapsed{0};

  bool Truncated() const { return stdout_truncated || stderr_truncated; }
  bool Succeeded() const { return !timed_out && exit_code == 0; }
};

// Runs argv[0] (PATH lookup, no shell) with stdin on /dev/null, capturing
// stdout and stderr up to limits.max_output_bytes each. Output past the cap
// is drained and dropped; only the wall clock kills the child. The child gets
// its own process group and the whole group is killed before returning, on
// every path. Returns nullopt with *err set when the program cannot be
// started at all.
std::optional<ExecutionResult> RunProcess(const std::vector<std::string>& argv,
                                          const ProcessLimits& limits,
                                          std::string* err);

}  // namespace pcli2mcp
