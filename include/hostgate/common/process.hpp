#pragma once

#include "hostgate/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace hostgate::common {

struct ProcessOptions {
  std::filesystem::path working_dir;
  std::chrono::milliseconds timeout{60'000};
  std::size_t max_output_bytes = 1024 * 1024;
};

struct ProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  /// Set when either stream exceeded `output_limit` and the rest was dropped.
  bool truncated = false;
  std::size_t output_limit = 0;
};

/// Runs an argv vector directly (never through a shell). A non-zero exit code
/// is a successful Result; failures are reserved for spawn problems
/// (ExecutionFailure) and deadline expiry (Timeout).
class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  [[nodiscard]] virtual Result<ProcessResult> run(const std::vector<std::string> &argv,
                                                  const ProcessOptions &options = {}) = 0;
};

class PosixProcessRunner final : public IProcessRunner {
public:
  [[nodiscard]] Result<ProcessResult> run(const std::vector<std::string> &argv,
                                          const ProcessOptions &options = {}) override;
};

[[nodiscard]] std::string format_duration(std::chrono::milliseconds duration);

/// `[output truncated at N bytes]`. Appended after masking, never masked.
[[nodiscard]] std::string truncation_marker(std::size_t limit);

} // namespace hostgate::common
