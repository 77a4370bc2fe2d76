#include "dockpipe/stages/ExtractStage.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

#include "dockpipe/core/Errors.hpp"
#include "dockpipe/core/Logger.hpp"
#include "dockpipe/io/FileScan.hpp"

namespace dockpipe {

namespace {

std::string csvField(const std::string& value) {
  if (value.find_first_of(",\"\r\n") == std::string::npos) {
    return value;
  }
  std::string quoted = "\"";
  for (char c : value) {
    if (c == '"') {
      quoted.push_back('"');
    }
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

} // namespace

std::vector<AffinityRecord_t> collectAffinities(const std::filesystem::path& dockingDir, const ResultParser& parser) {
  std::vector<AffinityRecord_t> records;
  for (const auto& log : listFiles(dockingDir, {".log"})) {
    const std::string stem = log.stem().string();
    AffinityRecord_t record{stem, stem, std::nullopt};
    if (auto pair = splitPairStem(stem)) {
      record.protein = pair->first;
      record.ligand = pair->second;
    }
    record.score = parser.parseFile(log).score;
    records.push_back(record);
  }
  return records;
}

void writeAffinityCsv(std::ostream& out, const std::vector<AffinityRecord_t>& records) {
  out << "Protein,Ligand,Binding Affinity (kcal/mol)\n";
  for (const auto& record : records) {
    out << csvField(record.protein) << ',' << csvField(record.ligand) << ',';
    if (record.score) {
      out << formatNumber(*record.score);
    }
    out << '\n';
  }
}

int ExtractStage::run(StageContext_t& context) {
  auto logger = Logger::GetClass("ExtractStage");
  const ArtifactLayout_t& layout = context.store.layout();
  std::error_code ec;
  if (!std::filesystem::is_directory(layout.dockingDir, ec)) {
    throw MissingInputError("Log directory " + layout.dockingDir.string() + " not found.");
  }

  const ResultParser parser(context.config.docking.resultFormat);
  const auto records = collectAffinities(layout.dockingDir, parser);
  if (records.empty()) {
    if (logger) {
      logger->info("[INFO] No log files found in {}", layout.dockingDir.string());
    }
    return 0;
  }

  const ArtifactKey_t key{ArtifactKind_e::kAffinityTable, {}, {}};
  const auto staging = context.store.stagingFor(key);
  {
    std::ofstream csv(staging);
    if (!csv.is_open()) {
      throw std::runtime_error("cannot write " + staging.string());
    }
    writeAffinityCsv(csv, records);
    csv.close();
    if (!csv) {
      throw std::runtime_error("failed writing " + staging.string());
    }
  }
  context.store.commit(key);

  std::size_t scored = 0;
  for (const auto& record : records) {
    if (record.score) {
      ++scored;
    }
  }
  if (logger) {
    logger->info("[OK] Binding affinities saved to {} ({} of {} logs scored)", context.store.locationFor(key).string(),
                 scored, records.size());
  }
  return 0;
}

} // namespace dockpipe
