#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dockpipe {

// Half-open byte range [begin, end) of one column in a fixed-width line.
struct FieldSpec_t {
  std::string name;
  std::size_t begin = 0;
  std::size_t end = 0;
};

// Field name -> byte range table shared by fixed-width readers.
class RecordLayout {
public:
  RecordLayout(std::vector<std::string> recordTags, std::vector<FieldSpec_t> fields);

  bool matches(std::string_view line) const;
  // Raw column text; nullopt when the line is too short to hold the field.
  std::optional<std::string_view> field(std::string_view line, const std::string& name) const;
  // Column parsed as a number; nullopt when absent, blank or not numeric.
  std::optional<double> number(std::string_view line, const std::string& name) const;

  const std::vector<FieldSpec_t>& fields() const { return fieldSpecs; }

private:
  const FieldSpec_t* find(const std::string& name) const;

  std::vector<std::string> tags;
  std::vector<FieldSpec_t> fieldSpecs;
};

// ATOM/HETATM records of PDB and PDBQT files.
const RecordLayout& atomRecordLayout();

} // namespace dockpipe
