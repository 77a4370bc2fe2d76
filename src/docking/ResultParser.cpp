#include "dockpipe/docking/ResultParser.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

#include "dockpipe/core/Logger.hpp"

namespace dockpipe {

namespace {

std::string_view stripLeading(std::string_view line) {
  const auto first = line.find_first_not_of(" \t\r\n");
  return first == std::string_view::npos ? std::string_view{} : line.substr(first);
}

std::vector<std::string> splitWhitespace(std::string_view line) {
  std::vector<std::string> tokens;
  std::istringstream iss{std::string(line)};
  std::string token;
  while (iss >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

std::optional<double> parseDouble(const std::string& token) {
  errno = 0;
  char* end = nullptr;
  const double value = std::strtod(token.c_str(), &end);
  if (errno != 0 || end == token.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return value;
}

void warnIfAbsent(const ScoreResult_t& result, const std::string& source) {
  if (result.score) {
    return;
  }
  if (auto logger = Logger::GetClass("ResultParser")) {
    if (result.status == ScoreStatus_e::kMalformed) {
      logger->warn("Could not parse affinity from {} (line {})", source, result.lineNumber);
    } else {
      logger->warn("No affinity found in {} ({})", source, toString(result.status));
    }
  }
}

} // namespace

ResultParser::ResultParser(ResultFormat_t format) : resultFormat(std::move(format)) {}

void ResultParser::reset() {
  current = ScoreResult_t{};
  linesSeen = 0;
}

bool ResultParser::consume(std::string_view line) {
  if (settled()) {
    return true;
  }
  ++linesSeen;
  const std::string_view stripped = stripLeading(line);
  if (stripped.substr(0, resultFormat.marker.size()) != resultFormat.marker) {
    return false;
  }
  current.lineNumber = linesSeen;
  const auto tokens = splitWhitespace(stripped);
  if (tokens.size() > resultFormat.tokenIndex) {
    current.score = parseDouble(tokens[resultFormat.tokenIndex]);
  }
  current.status = current.score ? ScoreStatus_e::kFound : ScoreStatus_e::kMalformed;
  return true;
}

ScoreResult_t ResultParser::parse(std::istream& in, const std::string& source) const {
  ResultParser scanner(resultFormat);
  std::string line;
  while (std::getline(in, line)) {
    if (scanner.consume(line)) {
      break;
    }
  }
  const ScoreResult_t result = scanner.result();
  warnIfAbsent(result, source);
  return result;
}

ScoreResult_t ResultParser::parseText(const std::string& text) const {
  std::istringstream in(text);
  return parse(in);
}

ScoreResult_t ResultParser::parseFile(const std::filesystem::path& path) const {
  std::ifstream file(path);
  if (!file.is_open()) {
    ScoreResult_t result;
    result.status = ScoreStatus_e::kUnreadable;
    warnIfAbsent(result, path.string());
    return result;
  }
  return parse(file, path.string());
}

const char* toString(ScoreStatus_e status) {
  switch (status) {
    case ScoreStatus_e::kFound:
      return "found";
    case ScoreStatus_e::kNoMatch:
      return "no result line";
    case ScoreStatus_e::kMalformed:
      return "malformed result line";
    case ScoreStatus_e::kUnreadable:
      return "unreadable";
  }
  return "unknown";
}

} // namespace dockpipe
