#include "dockpipe/io/FileScan.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include <fmt/core.h>

namespace dockpipe {

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string toUpper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return value;
}

std::vector<std::filesystem::path> listFiles(const std::filesystem::path& dir,
                                             const std::vector<std::string>& suffixes) {
  std::vector<std::filesystem::path> files;
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return files;
  }
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec)) {
      continue;
    }
    const std::string name = it->path().filename().string();
    if (name.empty() || name.front() == '.') {
      continue;
    }
    const std::string lower = toLower(name);
    for (const auto& suffix : suffixes) {
      const std::string wanted = toLower(suffix);
      if (lower.size() >= wanted.size() && lower.compare(lower.size() - wanted.size(), wanted.size(), wanted) == 0) {
        files.push_back(it->path());
        break;
      }
    }
  }
  std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) {
    return a.filename().string() < b.filename().string();
  });
  return files;
}

std::string formatNumber(double value) {
  return fmt::format("{}", value);
}

} // namespace dockpipe
