#include "dockpipe/core/Config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include "dockpipe/core/Errors.hpp"

namespace dockpipe {

namespace {

std::string getString(const nlohmann::json& node, const std::string& key, const std::string& fallback) {
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_string()) {
    throw ConfigError("'" + key + "' must be a string");
  }
  return it->get<std::string>();
}

bool getBool(const nlohmann::json& node, const std::string& key, bool fallback) {
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_boolean()) {
    throw ConfigError("'" + key + "' must be a boolean");
  }
  return it->get<bool>();
}

int getInt(const nlohmann::json& node, const std::string& key, int fallback) {
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_number_integer()) {
    throw ConfigError("'" + key + "' must be an integer");
  }
  return it->get<int>();
}

double getDouble(const nlohmann::json& node, const std::string& key, double fallback) {
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_number()) {
    throw ConfigError("'" + key + "' must be a number");
  }
  return it->get<double>();
}

nlohmann::json getObject(const nlohmann::json& node, const std::string& key) {
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return nlohmann::json::object();
  }
  if (!it->is_object()) {
    throw ConfigError("'" + key + "' must be an object");
  }
  return *it;
}

std::vector<std::string> getStringList(const nlohmann::json& node,
                                       const std::string& key,
                                       const std::vector<std::string>& fallback) {
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_array()) {
    throw ConfigError("'" + key + "' must be an array of strings");
  }
  std::vector<std::string> values;
  for (const auto& item : *it) {
    if (!item.is_string()) {
      throw ConfigError("'" + key + "' must be an array of strings");
    }
    values.push_back(item.get<std::string>());
  }
  return values;
}

Vector3 parseVector3(const nlohmann::json& node, const std::string& key, const Vector3& fallback) {
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_array() || it->size() != 3) {
    throw ConfigError("'" + key + "' must be an array of three numbers");
  }
  Vector3 value;
  for (int i = 0; i < 3; ++i) {
    if (!(*it)[i].is_number()) {
      throw ConfigError("'" + key + "' must be an array of three numbers");
    }
    value(i) = (*it)[i].get<double>();
  }
  return value;
}

std::map<std::string, EnvironmentConfig_t> defaultEnvironments() {
  std::map<std::string, EnvironmentConfig_t> environments;
  environments["fetch"] = {"fetch", "wget", "", false, {}};
  environments["chem"] = {"chem", "obabel", "", false, {}};
  environments["mgltools"] = {
      "mgltools", "pythonsh", "", false, {{"utilities", "/opt/mgltools/MGLToolsPckgs/AutoDockTools/Utilities24"}}};
  environments["vina"] = {"vina", "vina", "", false, {}};
  environments["viz"] = {"viz", "python3", "", false, {{"scripts", "scripts"}}};
  return environments;
}

std::map<std::string, ToolConfig_t> defaultTools() {
  std::map<std::string, ToolConfig_t> tools;
  tools["fetchStructure"] = {
      "fetchStructure", "fetch", {"-q", "-O", "{output}", "https://files.rcsb.org/download/{id}.pdb"}};
  tools["fetchLigand"] = {
      "fetchLigand",
      "fetch",
      {"-q", "-O", "{output}", "https://pubchem.ncbi.nlm.nih.gov/rest/pug/compound/name/{name}/SDF?record_type=3d"}};
  tools["convertLigand"] = {"convertLigand", "chem", {"{input}", "-O", "{output}"}};
  tools["splitAltLocs"] = {
      "splitAltLocs", "mgltools", {"{utilities}/prepare_pdb_split_alt_confs.py", "-r", "{input}", "-o", "{output}"}};
  tools["prepareReceptor"] = {"prepareReceptor",
                              "mgltools",
                              {"{utilities}/prepare_receptor4.py",
                               "-r",
                               "{input}",
                               "-o",
                               "{output}",
                               "-A",
                               "hydrogens",
                               "-U",
                               "{receptorCleanFlag}"}};
  tools["prepareLigand"] = {
      "prepareLigand",
      "mgltools",
      {"{utilities}/prepare_ligand4.py", "-l", "{input}", "-o", "{output}", "-A", "{ligandAddFlag}"}};
  tools["dock"] = {"dock",
                   "vina",
                   {"--receptor", "{receptor}",
                    "--ligand", "{ligand}",
                    "--center_x", "{center_x}",
                    "--center_y", "{center_y}",
                    "--center_z", "{center_z}",
                    "--size_x", "{size_x}",
                    "--size_y", "{size_y}",
                    "--size_z", "{size_z}",
                    "--exhaustiveness", "{exhaustiveness}",
                    "--verbosity", "{verbosity}",
                    "--out", "{output}"}};
  tools["depictLigand"] = {"depictLigand", "viz", {"{scripts}/depict_ligand.py", "{input}", "{output}"}};
  tools["renderComplex"] = {
      "renderComplex", "viz", {"{scripts}/render_complex.py", "{mode}", "{pose}", "{output}", "{receptor}"}};
  return tools;
}

void applyLayout(const nlohmann::json& node, ArtifactLayout_t& layout) {
  layout.proteinDir = getString(node, "proteinDir", layout.proteinDir.string());
  layout.ligandSdfDir = getString(node, "ligandSdfDir", layout.ligandSdfDir.string());
  layout.ligandPdbDir = getString(node, "ligandPdbDir", layout.ligandPdbDir.string());
  layout.receptorDir = getString(node, "receptorDir", layout.receptorDir.string());
  layout.ligandDir = getString(node, "ligandDir", layout.ligandDir.string());
  layout.dockingDir = getString(node, "dockingDir", layout.dockingDir.string());
  layout.affinityTable = getString(node, "affinityTable", layout.affinityTable.string());
  layout.visualizationDir = getString(node, "visualizationDir", layout.visualizationDir.string());
}

void applyEnvironments(const nlohmann::json& node, std::map<std::string, EnvironmentConfig_t>& environments) {
  for (auto it = node.begin(); it != node.end(); ++it) {
    if (!it->is_object()) {
      throw ConfigError("environment '" + it.key() + "' must be an object");
    }
    EnvironmentConfig_t& env = environments[it.key()];
    env.name = it.key();
    env.executable = getString(*it, "executable", env.executable);
    env.expectedExecutable = getString(*it, "expectedExecutable", env.expectedExecutable);
    env.ignoreIdentityCheck = getBool(*it, "ignoreIdentityCheck", env.ignoreIdentityCheck);
    const nlohmann::json variables = getObject(*it, "variables");
    for (auto var = variables.begin(); var != variables.end(); ++var) {
      if (!var->is_string()) {
        throw ConfigError("variable '" + var.key() + "' of environment '" + it.key() + "' must be a string");
      }
      env.variables[var.key()] = var->get<std::string>();
    }
    const nlohmann::json exports = getObject(*it, "exports");
    for (auto var = exports.begin(); var != exports.end(); ++var) {
      if (!var->is_string()) {
        throw ConfigError("export '" + var.key() + "' of environment '" + it.key() + "' must be a string");
      }
      env.exports[var.key()] = var->get<std::string>();
    }
  }
}

void applyTools(const nlohmann::json& node, std::map<std::string, ToolConfig_t>& tools) {
  for (auto it = node.begin(); it != node.end(); ++it) {
    if (!it->is_object()) {
      throw ConfigError("tool '" + it.key() + "' must be an object");
    }
    ToolConfig_t& tool = tools[it.key()];
    tool.name = it.key();
    tool.environment = getString(*it, "environment", tool.environment);
    tool.args = getStringList(*it, "args", tool.args);
  }
}

void applyDownload(const nlohmann::json& node, DownloadConfig_t& download) {
  auto structures = node.find("structures");
  if (structures != node.end() && !structures->is_null()) {
    download.structures.clear();
    if (structures->is_object()) {
      for (auto it = structures->begin(); it != structures->end(); ++it) {
        if (!it->is_string()) {
          throw ConfigError("structure id of '" + it.key() + "' must be a string");
        }
        download.structures.emplace_back(it.key(), it->get<std::string>());
      }
    } else if (structures->is_array()) {
      for (const auto& item : *structures) {
        if (!item.is_object()) {
          throw ConfigError("'structures' entries must be objects with 'label' and 'id'");
        }
        const std::string id = getString(item, "id", "");
        download.structures.emplace_back(getString(item, "label", id), id);
      }
    } else {
      throw ConfigError("'structures' must be an object or an array");
    }
  }
  download.ligands = getStringList(node, "ligands", download.ligands);
  download.skipLigands = getStringList(node, "skipLigands", download.skipLigands);
}

void applyDocking(const nlohmann::json& node, DockingConfig_t& docking) {
  docking.exhaustiveness = getInt(node, "exhaustiveness", docking.exhaustiveness);
  docking.verbosity = getInt(node, "verbosity", docking.verbosity);

  const nlohmann::json boxNode = getObject(node, "box");
  docking.box.margin = getDouble(boxNode, "margin", docking.box.margin);
  docking.box.minSize = getDouble(boxNode, "minSize", docking.box.minSize);
  docking.box.maxSize = getDouble(boxNode, "maxSize", docking.box.maxSize);
  docking.box.defaultCenter = parseVector3(boxNode, "defaultCenter", docking.box.defaultCenter);
  docking.box.defaultSize = parseVector3(boxNode, "defaultSize", docking.box.defaultSize);

  const nlohmann::json manualNode = getObject(node, "manualBoxes");
  for (auto it = manualNode.begin(); it != manualNode.end(); ++it) {
    if (!it->is_object() || !it->contains("center") || !it->contains("size")) {
      throw ConfigError("manual box '" + it.key() + "' needs 'center' and 'size'");
    }
    ManualBox_t box;
    box.center = parseVector3(*it, "center", box.center);
    box.size = parseVector3(*it, "size", box.size);
    docking.manualBoxes[it.key()] = box;
  }

  docking.resultFormat.marker = getString(node, "resultMarker", docking.resultFormat.marker);
  const int tokenIndex = getInt(node, "resultTokenIndex", static_cast<int>(docking.resultFormat.tokenIndex));
  if (tokenIndex < 0) {
    throw ConfigError("'resultTokenIndex' must not be negative");
  }
  docking.resultFormat.tokenIndex = static_cast<std::size_t>(tokenIndex);
}

void applyEnvironmentFlags(const EnvLookup& env, PipelineConfig_t& config) {
  if (!env) {
    return;
  }
  if (auto force = env("FORCE_REBUILD")) {
    config.forceRebuild = isTruthy(*force);
  }
  if (auto flag = env("LIGAND_ADD_FLAG")) {
    if (!flag->empty()) {
      config.preparation.ligandAddFlag = *flag;
    }
  }
  if (auto flag = env("RECEPTOR_CLEAN_FLAG")) {
    if (!flag->empty()) {
      config.preparation.receptorCleanFlag = *flag;
    }
  }
  if (auto ignore = env("VIZ_IGNORE_PY_CHECK")) {
    if (isTruthy(*ignore)) {
      for (auto& entry : config.environments) {
        entry.second.ignoreIdentityCheck = true;
      }
    }
  }
}

bool isToken(const std::string& value) {
  return !value.empty() && value.find_first_of(" \t\r\n") == std::string::npos;
}

} // namespace

std::optional<std::string> systemEnvironment(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (!value) {
    return std::nullopt;
  }
  return std::string(value);
}

bool isTruthy(const std::string& value) {
  return value == "1" || value == "true" || value == "True";
}

std::vector<std::string> defaultStageOrder() {
  return {"download", "convert", "prepare", "dock", "extract", "visualize"};
}

PipelineConfig_t defaultConfig() {
  PipelineConfig_t config;
  config.stages = defaultStageOrder();
  config.environments = defaultEnvironments();
  config.tools = defaultTools();
  return config;
}

PipelineConfig_t parseConfig(const nlohmann::json& root, const EnvLookup& env) {
  if (!root.is_object()) {
    throw ConfigError("configuration root must be an object");
  }
  PipelineConfig_t config = defaultConfig();

  const nlohmann::json loggingNode = getObject(root, "logging");
  config.logging.enabled = getBool(loggingNode, "enabled", config.logging.enabled);
  config.logging.level = getString(loggingNode, "level", config.logging.level);
  const nlohmann::json runLogNode = getObject(loggingNode, "runLog");
  config.logging.runLog.enabled = getBool(runLogNode, "enabled", config.logging.runLog.enabled);
  config.logging.runLog.directory = getString(runLogNode, "directory", config.logging.runLog.directory);
  config.logging.runLog.prefix = getString(runLogNode, "prefix", config.logging.runLog.prefix);

  const nlohmann::json pipelineNode = getObject(root, "pipeline");
  config.forceRebuild = getBool(pipelineNode, "forceRebuild", config.forceRebuild);
  config.stages = getStringList(pipelineNode, "stages", config.stages);
  config.workingDirectory = getString(pipelineNode, "workingDirectory", config.workingDirectory);

  applyLayout(getObject(root, "layout"), config.layout);
  const nlohmann::json visualizationNode = getObject(root, "visualization");
  config.layout.ligandImageSubdir = getString(visualizationNode, "ligandImages", config.layout.ligandImageSubdir);
  config.layout.complexFlatSubdir = getString(visualizationNode, "complexFlatImages", config.layout.complexFlatSubdir);
  config.layout.complexImageSubdir = getString(visualizationNode, "complexImages", config.layout.complexImageSubdir);
  applyEnvironments(getObject(root, "environments"), config.environments);
  applyTools(getObject(root, "tools"), config.tools);
  applyDownload(getObject(root, "download"), config.download);

  const nlohmann::json prepNode = getObject(root, "preparation");
  config.preparation.ligandAddFlag = getString(prepNode, "ligandAddFlag", config.preparation.ligandAddFlag);
  config.preparation.receptorCleanFlag =
      getString(prepNode, "receptorCleanFlag", config.preparation.receptorCleanFlag);
  config.preparation.splitAltLocs = getBool(prepNode, "splitAltLocs", config.preparation.splitAltLocs);

  applyDocking(getObject(root, "docking"), config.docking);
  applyEnvironmentFlags(env, config);

  validateConfig(config);
  return config;
}

PipelineConfig_t loadConfig(const std::string& path, const EnvLookup& env) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("Failed to open config file: " + path);
  }
  nlohmann::json root;
  try {
    file >> root;
  } catch (const nlohmann::json::parse_error& ex) {
    throw ConfigError("Failed to parse config file " + path + ": " + ex.what());
  }
  return parseConfig(root, env);
}

void validateConfig(const PipelineConfig_t& config) {
  if (config.stages.empty()) {
    throw ConfigError("pipeline.stages must name at least one stage");
  }
  const auto known = defaultStageOrder();
  for (const auto& stage : config.stages) {
    if (std::find(known.begin(), known.end(), stage) == known.end()) {
      throw ConfigError("unknown stage '" + stage + "'");
    }
  }

  for (const auto& entry : config.environments) {
    if (entry.second.executable.empty()) {
      throw ConfigError("environment '" + entry.first + "' has no executable");
    }
  }
  for (const auto& entry : config.tools) {
    if (config.environments.count(entry.second.environment) == 0) {
      throw ConfigError("tool '" + entry.first + "' uses unknown environment '" + entry.second.environment + "'");
    }
  }

  const BoxOptions_t& box = config.docking.box;
  if (box.margin < 0.0 || box.minSize <= 0.0 || box.maxSize < box.minSize) {
    throw ConfigError("docking.box needs margin >= 0 and 0 < minSize <= maxSize");
  }
  if ((box.defaultSize.array() <= 0.0).any()) {
    throw ConfigError("docking.box.defaultSize must be positive");
  }
  for (const auto& entry : config.docking.manualBoxes) {
    if ((entry.second.size.array() <= 0.0).any()) {
      throw ConfigError("manual box '" + entry.first + "' must have a positive size");
    }
  }
  const ArtifactLayout_t& layout = config.layout;
  for (const auto* subdir : {&layout.ligandImageSubdir, &layout.complexFlatSubdir, &layout.complexImageSubdir}) {
    if (subdir->empty()) {
      throw ConfigError("visualization sub-directories must not be empty");
    }
  }
  if (config.docking.exhaustiveness < 1) {
    throw ConfigError("docking.exhaustiveness must be at least 1");
  }
  if (config.docking.resultFormat.marker.empty()) {
    throw ConfigError("docking.resultMarker must not be empty");
  }

  if (!isToken(config.preparation.ligandAddFlag) || !isToken(config.preparation.receptorCleanFlag)) {
    throw ConfigError("preparation flags must be single tokens");
  }

  for (const auto& structure : config.download.structures) {
    if (!isPairIdentifier(structure.second)) {
      throw ConfigError("invalid structure id '" + structure.second + "' for " + structure.first);
    }
  }
  for (const auto& ligand : config.download.ligands) {
    if (!isPairIdentifier(ligand)) {
      throw ConfigError("invalid ligand name '" + ligand + "'");
    }
  }
}

const ToolConfig_t& findTool(const PipelineConfig_t& config, const std::string& name) {
  auto it = config.tools.find(name);
  if (it == config.tools.end()) {
    throw ConfigError("no tool named '" + name + "' configured");
  }
  return it->second;
}

const EnvironmentConfig_t& findEnvironment(const PipelineConfig_t& config, const std::string& name) {
  auto it = config.environments.find(name);
  if (it == config.environments.end()) {
    throw ConfigError("no environment named '" + name + "' configured");
  }
  return it->second;
}

} // namespace dockpipe
