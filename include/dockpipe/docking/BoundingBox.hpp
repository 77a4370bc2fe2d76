#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <map>
#include <string>
#include <vector>

#include "dockpipe/core/Types.hpp"
#include "dockpipe/io/RecordLayout.hpp"

namespace dockpipe {

enum class BoxProvenance_e { kManual, kComputed, kDefault };

// Why the default box was used; kNone for manual and computed boxes.
enum class BoxFallback_e { kNone, kNoCoordinates, kMalformedRecords, kUnreadable };

struct BoundingBox_t {
  Vector3 center = Vector3::Zero();
  Vector3 size = Vector3::Constant(24.0);
  BoxProvenance_e provenance = BoxProvenance_e::kDefault;
  BoxFallback_e fallback = BoxFallback_e::kNone;
  std::size_t coordinateCount = 0;
  std::size_t malformedCount = 0;
};

struct BoxOptions_t {
  double margin = 8.0;
  double minSize = 20.0;
  double maxSize = 28.0;
  Vector3 defaultCenter = Vector3::Zero();
  Vector3 defaultSize = Vector3::Constant(24.0);
};

struct ManualBox_t {
  Vector3 center = Vector3::Zero();
  Vector3 size = Vector3::Zero();
};

struct CoordinateScan_t {
  std::vector<Vector3> coordinates;
  std::size_t malformedCount = 0;
  bool readable = true;
};

// Collects x/y/z of every record the layout matches; bad records are counted, not fatal.
CoordinateScan_t readCoordinates(std::istream& in, const RecordLayout& layout = atomRecordLayout());
CoordinateScan_t readCoordinates(const std::filesystem::path& path,
                                 const RecordLayout& layout = atomRecordLayout());

// Derives the docking search box of a receptor.
class BoundingBoxCalculator {
public:
  explicit BoundingBoxCalculator(BoxOptions_t options = {},
                                 std::map<std::string, ManualBox_t> manualBoxes = {});

  BoundingBox_t fromCoordinates(const std::vector<Vector3>& coordinates) const;
  BoundingBox_t fromScan(const CoordinateScan_t& scan) const;
  BoundingBox_t defaultBox(BoxFallback_e reason) const;

  // Manual override when present, otherwise computed from the receptor file.
  // The first answer for a receptor is reused for the rest of the run.
  BoundingBox_t forReceptor(const std::string& receptorName, const std::filesystem::path& receptorPath);

  const BoxOptions_t& options() const { return boxOptions; }

private:
  BoxOptions_t boxOptions;
  std::map<std::string, ManualBox_t> overrides;
  std::map<std::string, BoundingBox_t> resolved;
};

const char* toString(BoxProvenance_e provenance);
const char* toString(BoxFallback_e fallback);

} // namespace dockpipe
