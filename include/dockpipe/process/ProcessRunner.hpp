#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dockpipe {

struct ProcessRequest_t {
  std::string executable;
  std::vector<std::string> args;
  // Empty: inherit the orchestrator's working directory.
  std::filesystem::path workingDirectory;
  // Added to (or replacing entries of) the inherited environment.
  std::map<std::string, std::string> environment;
  // Logger tag for the child's output lines.
  std::string label = "tool";
};

enum class ProcessOutcome_e { kExited, kInterrupted, kSpawnFailed };

constexpr int kExitSpawnFailed = 127;

struct ProcessResult_t {
  ProcessOutcome_e outcome = ProcessOutcome_e::kExited;
  // Child exit code; 128 + signal when interrupted; 127 when the child never ran.
  int exitStatus = 0;
  int signalNumber = 0;
  std::string error;

  bool ok() const { return outcome == ProcessOutcome_e::kExited && exitStatus == 0; }
};

// Receives each line of combined stdout/stderr, without the trailing newline.
using LineSink = std::function<void(const std::string&)>;

// Runs one external tool to completion, forwarding its output line by line.
class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  // Logs the invocation, then blocks until the child terminates.
  ProcessResult_t run(const ProcessRequest_t& request, const LineSink& sink);

protected:
  virtual ProcessResult_t execute(const ProcessRequest_t& request, const LineSink& sink) = 0;
};

// fork/execve with stdout and stderr joined on one pipe.
class PosixProcessRunner final : public IProcessRunner {
protected:
  ProcessResult_t execute(const ProcessRequest_t& request, const LineSink& sink) override;
};

std::string describeCommand(const ProcessRequest_t& request);

// PATH lookup for bare names; direct check for names containing '/'.
std::optional<std::filesystem::path> resolveExecutable(const std::string& name);

} // namespace dockpipe
