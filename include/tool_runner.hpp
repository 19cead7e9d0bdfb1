#pragma once

#include "cancellation.hpp"
#include "progress_parser.hpp"
#include "transfer_models.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace xfer {

inline constexpr const char *MONGODUMP_TOOL = "mongodump";
inline constexpr const char *MONGORESTORE_TOOL = "mongorestore";

/**
 * Resolves the external tools. A configured path wins over the execution
 * search path. Absence raises EnvironmentException(TOOL_NOT_FOUND) naming the
 * install source.
 */
class ToolLocator {
public:
  ToolLocator(std::string mongodumpPath = "", std::string mongorestorePath = "");

  std::string locate(const std::string &tool) const;
  std::string mongodump() const { return locate(MONGODUMP_TOOL); }
  std::string mongorestore() const { return locate(MONGORESTORE_TOOL); }

private:
  std::string mongodumpPath_;
  std::string mongorestorePath_;
};

// First non-empty stdout line of `<tool> --version`, empty on timeout/failure
std::string toolVersion(const std::string &toolPath,
                        std::chrono::milliseconds timeout);

ToolAvailability checkToolAvailability(const ToolLocator &locator,
                                       std::chrono::milliseconds timeout);

using LineHandler = std::function<void(const std::string &line)>;

struct ProcessOutcome {
  int exitCode = 0;
  bool cancelled = false;
  bool timedOut = false;
  DiagnosticTail tail;

  bool succeeded() const { return exitCode == 0 && !cancelled && !timedOut; }
};

/**
 * Runs one external tool. Stderr is drained line by line on a reader thread
 * that signals completion through a future; the calling thread waits on the
 * process and kills its process group once the token fires or the timeout
 * passes. Stdout is discarded.
 */
class ProcessRunner {
public:
  explicit ProcessRunner(
      size_t tailLines = 10,
      std::chrono::milliseconds pollInterval = std::chrono::milliseconds(50));

  // Throws SystemException(PROCESS_ERROR) when the tool cannot be started.
  // A handler exception is rethrown after the process has been reaped.
  ProcessOutcome
  run(const std::string &toolPath, const std::vector<std::string> &args,
      const CancellationToken *token, const LineHandler &onLine,
      std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

private:
  size_t tailLines_;
  std::chrono::milliseconds pollInterval_;
};

} // namespace xfer
