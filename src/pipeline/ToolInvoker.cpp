#include "dockpipe/pipeline/ToolInvoker.hpp"

#include "dockpipe/core/Errors.hpp"
#include "dockpipe/core/Logger.hpp"

namespace dockpipe {

std::vector<std::string> expandArguments(const std::vector<std::string>& templates, const TemplateValues& values) {
  std::vector<std::string> args;
  args.reserve(templates.size());
  for (const auto& item : templates) {
    std::string expanded;
    bool lonePlaceholder = false;
    std::size_t pos = 0;
    while (pos < item.size()) {
      const auto open = item.find('{', pos);
      if (open == std::string::npos) {
        expanded.append(item, pos, std::string::npos);
        break;
      }
      const auto close = item.find('}', open);
      if (close == std::string::npos) {
        throw ConfigError("unterminated placeholder in argument '" + item + "'");
      }
      expanded.append(item, pos, open - pos);
      const std::string name = item.substr(open + 1, close - open - 1);
      auto value = values.find(name);
      if (value == values.end()) {
        throw ConfigError("unknown placeholder {" + name + "} in argument '" + item + "'");
      }
      expanded += value->second;
      lonePlaceholder = open == 0 && close + 1 == item.size();
      pos = close + 1;
    }
    if (lonePlaceholder && expanded.empty()) {
      continue;
    }
    args.push_back(expanded);
  }
  return args;
}

ToolInvoker::ToolInvoker(const PipelineConfig_t& config, IProcessRunner& runner)
    : config(config), runner(runner) {}

ProcessRequest_t ToolInvoker::buildRequest(const std::string& toolName,
                                           const TemplateValues& values,
                                           const std::filesystem::path& workingDirectory) const {
  const ToolConfig_t& tool = findTool(config, toolName);
  const EnvironmentConfig_t& env = findEnvironment(config, tool.environment);

  TemplateValues merged = env.variables;
  merged["ligandAddFlag"] = config.preparation.ligandAddFlag;
  merged["receptorCleanFlag"] = config.preparation.receptorCleanFlag;
  for (const auto& value : values) {
    merged[value.first] = value.second;
  }

  ProcessRequest_t request;
  request.executable = env.executable;
  request.args = expandArguments(tool.args, merged);
  request.workingDirectory = workingDirectory;
  request.environment = env.exports;
  request.label = toolName;
  return request;
}

ProcessResult_t ToolInvoker::invoke(const std::string& toolName,
                                    const TemplateValues& values,
                                    const std::filesystem::path& workingDirectory,
                                    const LineSink& tee) {
  const ProcessRequest_t request = buildRequest(toolName, values, workingDirectory);
  auto toolLogger = Logger::GetClass(toolName);
  return runner.run(request, [&](const std::string& line) {
    if (toolLogger) {
      toolLogger->info("{}", line);
    }
    if (tee) {
      tee(line);
    }
  });
}

void ToolInvoker::invokeOrThrow(const std::string& toolName,
                                const TemplateValues& values,
                                const std::filesystem::path& workingDirectory,
                                const LineSink& tee) {
  const ProcessResult_t result = invoke(toolName, values, workingDirectory, tee);
  switch (result.outcome) {
    case ProcessOutcome_e::kExited:
      if (result.exitStatus != 0) {
        throw ChildProcessFailure(describeCommand(buildRequest(toolName, values, workingDirectory)),
                                  result.exitStatus);
      }
      return;
    case ProcessOutcome_e::kInterrupted:
      throw InterruptedError(result.signalNumber);
    case ProcessOutcome_e::kSpawnFailed:
      throw MissingToolError("could not execute tool '" + toolName + "': " + result.error);
  }
}

} // namespace dockpipe
