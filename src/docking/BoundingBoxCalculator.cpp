#include "dockpipe/docking/BoundingBox.hpp"

#include <fstream>
#include <utility>

#include "dockpipe/core/Logger.hpp"

namespace dockpipe {

CoordinateScan_t readCoordinates(std::istream& in, const RecordLayout& layout) {
  CoordinateScan_t scan;
  std::string line;
  while (std::getline(in, line)) {
    if (!layout.matches(line)) {
      continue;
    }
    const auto x = layout.number(line, "x");
    const auto y = layout.number(line, "y");
    const auto z = layout.number(line, "z");
    if (!x || !y || !z) {
      ++scan.malformedCount;
      continue;
    }
    scan.coordinates.emplace_back(*x, *y, *z);
  }
  return scan;
}

CoordinateScan_t readCoordinates(const std::filesystem::path& path, const RecordLayout& layout) {
  std::ifstream file(path);
  if (!file.is_open()) {
    CoordinateScan_t scan;
    scan.readable = false;
    return scan;
  }
  return readCoordinates(file, layout);
}

BoundingBoxCalculator::BoundingBoxCalculator(BoxOptions_t options,
                                             std::map<std::string, ManualBox_t> manualBoxes)
    : boxOptions(std::move(options)), overrides(std::move(manualBoxes)) {}

BoundingBox_t BoundingBoxCalculator::defaultBox(BoxFallback_e reason) const {
  BoundingBox_t box;
  box.center = boxOptions.defaultCenter;
  box.size = boxOptions.defaultSize;
  box.provenance = BoxProvenance_e::kDefault;
  box.fallback = reason;
  return box;
}

BoundingBox_t BoundingBoxCalculator::fromCoordinates(const std::vector<Vector3>& coordinates) const {
  if (coordinates.empty()) {
    return defaultBox(BoxFallback_e::kNoCoordinates);
  }

  Vector3 lower = coordinates.front();
  Vector3 upper = coordinates.front();
  for (const auto& point : coordinates) {
    lower = lower.cwiseMin(point);
    upper = upper.cwiseMax(point);
  }

  BoundingBox_t box;
  box.center = (lower + upper) / 2.0;
  box.size = ((upper - lower).array() + boxOptions.margin)
                 .min(boxOptions.maxSize)
                 .max(boxOptions.minSize)
                 .matrix();
  box.provenance = BoxProvenance_e::kComputed;
  box.coordinateCount = coordinates.size();
  return box;
}

BoundingBox_t BoundingBoxCalculator::fromScan(const CoordinateScan_t& scan) const {
  if (!scan.readable) {
    return defaultBox(BoxFallback_e::kUnreadable);
  }
  if (scan.coordinates.empty()) {
    BoundingBox_t box = defaultBox(scan.malformedCount > 0 ? BoxFallback_e::kMalformedRecords
                                                           : BoxFallback_e::kNoCoordinates);
    box.malformedCount = scan.malformedCount;
    return box;
  }
  BoundingBox_t box = fromCoordinates(scan.coordinates);
  box.malformedCount = scan.malformedCount;
  return box;
}

BoundingBox_t BoundingBoxCalculator::forReceptor(const std::string& receptorName,
                                                 const std::filesystem::path& receptorPath) {
  auto cached = resolved.find(receptorName);
  if (cached != resolved.end()) {
    return cached->second;
  }

  auto logger = Logger::GetClass("BoundingBox");
  BoundingBox_t box;
  auto manual = overrides.find(receptorName);
  if (manual != overrides.end()) {
    box.center = manual->second.center;
    box.size = manual->second.size;
    box.provenance = BoxProvenance_e::kManual;
  } else {
    box = fromScan(readCoordinates(receptorPath));
    if (logger) {
      if (box.fallback == BoxFallback_e::kUnreadable) {
        logger->warn("Could not read receptor coords ({}); using default box.", receptorPath.string());
      } else if (box.provenance == BoxProvenance_e::kDefault) {
        logger->warn("No receptor coords parsed from {} ({}); using default box.",
                     receptorPath.string(),
                     toString(box.fallback));
      }
      if (box.malformedCount > 0) {
        logger->warn("Skipped {} malformed coordinate records in {}", box.malformedCount, receptorPath.string());
      }
    }
  }

  if (logger) {
    logger->debug("Box for {} ({}): center=({:.3f}, {:.3f}, {:.3f}) size=({:.3f}, {:.3f}, {:.3f})",
                  receptorName,
                  toString(box.provenance),
                  box.center.x(),
                  box.center.y(),
                  box.center.z(),
                  box.size.x(),
                  box.size.y(),
                  box.size.z());
  }
  resolved.emplace(receptorName, box);
  return box;
}

const char* toString(BoxProvenance_e provenance) {
  switch (provenance) {
    case BoxProvenance_e::kManual:
      return "manual";
    case BoxProvenance_e::kComputed:
      return "computed";
    case BoxProvenance_e::kDefault:
      return "default";
  }
  return "unknown";
}

const char* toString(BoxFallback_e fallback) {
  switch (fallback) {
    case BoxFallback_e::kNone:
      return "none";
    case BoxFallback_e::kNoCoordinates:
      return "no coordinate records";
    case BoxFallback_e::kMalformedRecords:
      return "all coordinate records malformed";
    case BoxFallback_e::kUnreadable:
      return "file unreadable";
  }
  return "unknown";
}

} // namespace dockpipe
