#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "dockpipe/core/Config.hpp"
#include "dockpipe/process/ProcessRunner.hpp"

namespace dockpipe {

using TemplateValues = std::map<std::string, std::string>;

// Replaces {name} tokens. An argument that is a lone placeholder expanding to an
// empty string is dropped. Unknown placeholders raise ConfigError.
std::vector<std::string> expandArguments(const std::vector<std::string>& templates, const TemplateValues& values);

// Runs configured tools inside their runtime environment.
class ToolInvoker {
public:
  ToolInvoker(const PipelineConfig_t& config, IProcessRunner& runner);

  ProcessRequest_t buildRequest(const std::string& toolName,
                                const TemplateValues& values,
                                const std::filesystem::path& workingDirectory = {}) const;

  // Output lines go to the run log; `tee` also receives each line when set.
  ProcessResult_t invoke(const std::string& toolName,
                         const TemplateValues& values,
                         const std::filesystem::path& workingDirectory = {},
                         const LineSink& tee = {});

  // Like invoke, but translates any failure into the pipeline error taxonomy.
  void invokeOrThrow(const std::string& toolName,
                     const TemplateValues& values,
                     const std::filesystem::path& workingDirectory = {},
                     const LineSink& tee = {});

private:
  const PipelineConfig_t& config;
  IProcessRunner& runner;
};

} // namespace dockpipe
