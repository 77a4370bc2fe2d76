#include "dockpipe/process/ProcessRunner.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include "dockpipe/core/Logger.hpp"
#include "dockpipe/process/Interrupt.hpp"

extern char** environ;

namespace dockpipe {

namespace {

std::string quoteArg(const std::string& arg) {
  if (!arg.empty() && arg.find_first_of(" \t\"'") == std::string::npos) {
    return arg;
  }
  std::string quoted = "\"";
  for (char c : arg) {
    if (c == '"' || c == '\\') {
      quoted.push_back('\\');
    }
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

bool isExecutableFile(const std::filesystem::path& path) {
  struct stat info {};
  if (::stat(path.c_str(), &info) != 0 || !S_ISREG(info.st_mode)) {
    return false;
  }
  return ::access(path.c_str(), X_OK) == 0;
}

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides) {
  std::vector<std::string> entries;
  for (char** entry = environ; entry && *entry; ++entry) {
    const std::string value(*entry);
    const auto eq = value.find('=');
    const std::string key = value.substr(0, eq);
    if (overrides.count(key) == 0) {
      entries.push_back(value);
    }
  }
  for (const auto& item : overrides) {
    entries.push_back(item.first + "=" + item.second);
  }
  return entries;
}

std::vector<char*> toPointers(std::vector<std::string>& values) {
  std::vector<char*> pointers;
  pointers.reserve(values.size() + 1);
  for (auto& value : values) {
    pointers.push_back(value.data());
  }
  pointers.push_back(nullptr);
  return pointers;
}

void closeFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// Child side of the fork: only async-signal-safe calls from here on.
[[noreturn]] void execChild(const char* path,
                            const char* workingDirectory,
                            char* const* argv,
                            char* const* envp,
                            int outputFd,
                            int errorFd) {
  ::signal(SIGINT, SIG_DFL);
  ::signal(SIGTERM, SIG_DFL);
  int failure = 0;
  if (workingDirectory && ::chdir(workingDirectory) != 0) {
    failure = errno;
  }
  if (failure == 0 && (::dup2(outputFd, STDOUT_FILENO) < 0 || ::dup2(outputFd, STDERR_FILENO) < 0)) {
    failure = errno;
  }
  if (failure == 0) {
    ::close(outputFd);
    ::execve(path, argv, envp);
    failure = errno;
  }
  ssize_t written = ::write(errorFd, &failure, sizeof(failure));
  (void)written;
  ::_exit(kExitSpawnFailed);
}

int waitForChild(pid_t pid, int& rawStatus) {
  while (::waitpid(pid, &rawStatus, 0) < 0) {
    if (errno != EINTR) {
      return errno;
    }
  }
  return 0;
}

ProcessResult_t spawnFailure(const std::string& message) {
  ProcessResult_t result;
  result.outcome = ProcessOutcome_e::kSpawnFailed;
  result.exitStatus = kExitSpawnFailed;
  result.error = message;
  return result;
}

class LineSplitter {
public:
  explicit LineSplitter(const LineSink& lineSink) : sink(lineSink) {}

  void feed(const char* data, std::size_t size) {
    for (std::size_t i = 0; i < size; ++i) {
      if (data[i] == '\n') {
        emit();
      } else {
        pending.push_back(data[i]);
      }
    }
  }

  void finish() {
    if (!pending.empty()) {
      emit();
    }
  }

private:
  void emit() {
    if (!pending.empty() && pending.back() == '\r') {
      pending.pop_back();
    }
    if (sink) {
      sink(pending);
    }
    pending.clear();
  }

  const LineSink& sink;
  std::string pending;
};

} // namespace

ProcessResult_t IProcessRunner::run(const ProcessRequest_t& request, const LineSink& sink) {
  auto logger = Logger::GetClass("ProcessRunner");
  if (logger) {
    if (request.workingDirectory.empty()) {
      logger->info(">>> invoking: {}", describeCommand(request));
    } else {
      logger->info(">>> invoking: {} (cwd {})", describeCommand(request), request.workingDirectory.string());
    }
  }
  ProcessResult_t result = execute(request, sink);
  if (logger) {
    switch (result.outcome) {
      case ProcessOutcome_e::kSpawnFailed:
        logger->error("Could not execute '{}': {}", request.executable, result.error);
        break;
      case ProcessOutcome_e::kInterrupted:
        logger->warn("'{}' interrupted by signal {}", request.executable, result.signalNumber);
        break;
      case ProcessOutcome_e::kExited:
        if (result.exitStatus != 0) {
          logger->error("Command failed with code {}: {}", result.exitStatus, describeCommand(request));
        }
        break;
    }
  }
  return result;
}

ProcessResult_t PosixProcessRunner::execute(const ProcessRequest_t& request, const LineSink& sink) {
  const auto resolved = resolveExecutable(request.executable);
  if (!resolved) {
    return spawnFailure("executable not found");
  }
  if (!request.workingDirectory.empty() && !std::filesystem::is_directory(request.workingDirectory)) {
    return spawnFailure("working directory does not exist: " + request.workingDirectory.string());
  }

  // Everything the child needs is allocated before fork.
  const std::string path = resolved->string();
  const std::string workingDirectory = request.workingDirectory.string();
  std::vector<std::string> argvStrings;
  argvStrings.push_back(request.executable);
  argvStrings.insert(argvStrings.end(), request.args.begin(), request.args.end());
  std::vector<std::string> envStrings = buildEnvironment(request.environment);
  std::vector<char*> argv = toPointers(argvStrings);
  std::vector<char*> envp = toPointers(envStrings);

  int outputPipe[2] = {-1, -1};
  int errorPipe[2] = {-1, -1};
  if (::pipe2(outputPipe, O_CLOEXEC) != 0) {
    return spawnFailure(std::strerror(errno));
  }
  if (::pipe2(errorPipe, O_CLOEXEC) != 0) {
    const int err = errno;
    closeFd(outputPipe[0]);
    closeFd(outputPipe[1]);
    return spawnFailure(std::strerror(err));
  }

  const pid_t child = ::fork();
  if (child < 0) {
    const int err = errno;
    closeFd(outputPipe[0]);
    closeFd(outputPipe[1]);
    closeFd(errorPipe[0]);
    closeFd(errorPipe[1]);
    return spawnFailure(std::strerror(err));
  }
  if (child == 0) {
    execChild(path.c_str(),
              workingDirectory.empty() ? nullptr : workingDirectory.c_str(),
              argv.data(),
              envp.data(),
              outputPipe[1],
              errorPipe[1]);
  }

  closeFd(outputPipe[1]);
  closeFd(errorPipe[1]);

  // EOF on the CLOEXEC error pipe means execve succeeded.
  int childErrno = 0;
  ssize_t errBytes = 0;
  do {
    errBytes = ::read(errorPipe[0], &childErrno, sizeof(childErrno));
  } while (errBytes < 0 && errno == EINTR);
  closeFd(errorPipe[0]);

  bool forwarded = false;
  try {
    LineSplitter splitter(sink);
    char buffer[4096];
    while (true) {
      // The signal may have arrived outside read(), e.g. while the sink ran.
      if (interruptRequested() && !forwarded) {
        ::kill(child, pendingInterrupt());
        forwarded = true;
      }
      const ssize_t n = ::read(outputPipe[0], buffer, sizeof(buffer));
      if (n > 0) {
        splitter.feed(buffer, static_cast<std::size_t>(n));
        continue;
      }
      if (n == 0) {
        break;
      }
      if (errno != EINTR) {
        break;
      }
    }
    splitter.finish();
  } catch (...) {
    ::kill(child, SIGTERM);
    int ignored = 0;
    waitForChild(child, ignored);
    closeFd(outputPipe[0]);
    throw;
  }
  closeFd(outputPipe[0]);

  int rawStatus = 0;
  const int waitError = waitForChild(child, rawStatus);
  if (waitError != 0) {
    return spawnFailure(std::string("waitpid: ") + std::strerror(waitError));
  }
  if (errBytes == static_cast<ssize_t>(sizeof(childErrno))) {
    return spawnFailure(std::strerror(childErrno));
  }

  ProcessResult_t result;
  if (WIFSIGNALED(rawStatus)) {
    result.outcome = ProcessOutcome_e::kInterrupted;
    result.signalNumber = WTERMSIG(rawStatus);
    result.exitStatus = 128 + result.signalNumber;
    return result;
  }
  result.exitStatus = WIFEXITED(rawStatus) ? WEXITSTATUS(rawStatus) : 1;
  if (result.exitStatus != 0 && interruptRequested()) {
    result.outcome = ProcessOutcome_e::kInterrupted;
    result.signalNumber = pendingInterrupt();
    result.exitStatus = 128 + result.signalNumber;
  }
  return result;
}

std::string describeCommand(const ProcessRequest_t& request) {
  std::string text = quoteArg(request.executable);
  for (const auto& arg : request.args) {
    text += " ";
    text += quoteArg(arg);
  }
  return text;
}

std::optional<std::filesystem::path> resolveExecutable(const std::string& name) {
  if (name.empty()) {
    return std::nullopt;
  }
  if (name.find('/') != std::string::npos) {
    if (isExecutableFile(std::filesystem::path(name))) {
      std::error_code ec;
      const auto absolute = std::filesystem::absolute(name, ec);
      return ec ? std::filesystem::path(name) : absolute;
    }
    return std::nullopt;
  }
  const char* pathEnv = std::getenv("PATH");
  const std::string searchPath = pathEnv ? pathEnv : "/usr/local/bin:/usr/bin:/bin";
  std::size_t start = 0;
  while (start <= searchPath.size()) {
    const auto end = searchPath.find(':', start);
    const std::string dir = searchPath.substr(start, end == std::string::npos ? std::string::npos : end - start);
    const std::filesystem::path candidate = std::filesystem::path(dir.empty() ? "." : dir) / name;
    if (isExecutableFile(candidate)) {
      std::error_code ec;
      const auto absolute = std::filesystem::absolute(candidate, ec);
      return ec ? candidate : absolute;
    }
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
  return std::nullopt;
}

} // namespace dockpipe
