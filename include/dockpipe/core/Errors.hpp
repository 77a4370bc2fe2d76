#pragma once

#include <stdexcept>
#include <string>

namespace dockpipe {

constexpr int kExitFailure = 1;
// Reserved: a stage had inputs but produced no artifacts.
constexpr int kExitNoArtifacts = 2;
constexpr int kExitSignalBase = 128;

// Base for every failure the sequencer turns into a process exit status.
class PipelineError : public std::runtime_error {
public:
  PipelineError(const std::string& message, int exitStatus)
      : std::runtime_error(message), status(exitStatus) {}

  int exitStatus() const { return status; }

private:
  int status;
};

class ConfigError : public PipelineError {
public:
  explicit ConfigError(const std::string& message) : PipelineError(message, kExitFailure) {}
};

// A declared runtime-environment executable cannot be resolved.
class MissingToolError : public PipelineError {
public:
  explicit MissingToolError(const std::string& message) : PipelineError(message, kExitFailure) {}
};

// The executable resolves, but not to the installation the environment expects.
class EnvironmentMismatchError : public MissingToolError {
public:
  explicit EnvironmentMismatchError(const std::string& message) : MissingToolError(message) {}
};

// Raised only when a stage has zero input items.
class MissingInputError : public PipelineError {
public:
  explicit MissingInputError(const std::string& message) : PipelineError(message, kExitFailure) {}
};

class ChildProcessFailure : public PipelineError {
public:
  ChildProcessFailure(const std::string& command, int exitStatus)
      : PipelineError("Command failed with code " + std::to_string(exitStatus) + ": " + command,
                      exitStatus) {}
};

class NoArtifactsError : public PipelineError {
public:
  explicit NoArtifactsError(const std::string& message) : PipelineError(message, kExitNoArtifacts) {}
};

class InterruptedError : public PipelineError {
public:
  explicit InterruptedError(int signalNumber)
      : PipelineError("interrupted by signal " + std::to_string(signalNumber),
                      kExitSignalBase + signalNumber),
        signal(signalNumber) {}

  int signalNumber() const { return signal; }

private:
  int signal;
};

} // namespace dockpipe
