#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace dockpipe {

// Regular, non-hidden files of `dir` whose lowercase name ends with one of
// `suffixes`, sorted by file name. A missing directory yields an empty list.
std::vector<std::filesystem::path> listFiles(const std::filesystem::path& dir,
                                             const std::vector<std::string>& suffixes);

std::string toLower(std::string value);
std::string toUpper(std::string value);

// Shortest decimal text that reads back as the same double.
std::string formatNumber(double value);

} // namespace dockpipe
