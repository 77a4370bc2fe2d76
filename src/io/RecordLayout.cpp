#include "dockpipe/io/RecordLayout.hpp"

#include <cerrno>
#include <cstdlib>
#include <utility>

namespace dockpipe {

namespace {

std::string_view trim(std::string_view value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

} // namespace

RecordLayout::RecordLayout(std::vector<std::string> recordTags, std::vector<FieldSpec_t> fields)
    : tags(std::move(recordTags)), fieldSpecs(std::move(fields)) {}

bool RecordLayout::matches(std::string_view line) const {
  for (const auto& tag : tags) {
    if (line.substr(0, tag.size()) == tag) {
      return true;
    }
  }
  return false;
}

const FieldSpec_t* RecordLayout::find(const std::string& name) const {
  for (const auto& spec : fieldSpecs) {
    if (spec.name == name) {
      return &spec;
    }
  }
  return nullptr;
}

std::optional<std::string_view> RecordLayout::field(std::string_view line, const std::string& name) const {
  const FieldSpec_t* spec = find(name);
  if (!spec || line.size() <= spec->begin) {
    return std::nullopt;
  }
  return line.substr(spec->begin, spec->end - spec->begin);
}

std::optional<double> RecordLayout::number(std::string_view line, const std::string& name) const {
  const auto raw = field(line, name);
  if (!raw) {
    return std::nullopt;
  }
  const std::string text(trim(*raw));
  if (text.empty()) {
    return std::nullopt;
  }
  errno = 0;
  char* end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (errno != 0 || end != text.c_str() + text.size()) {
    return std::nullopt;
  }
  return value;
}

const RecordLayout& atomRecordLayout() {
  static const RecordLayout layout({"ATOM", "HETATM"},
                                   {{"x", 30, 38}, {"y", 38, 46}, {"z", 46, 54}});
  return layout;
}

} // namespace dockpipe
