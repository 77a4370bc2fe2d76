#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace dockpipe {

enum class ScoreStatus_e { kFound, kNoMatch, kMalformed, kUnreadable };

struct ScoreResult_t {
  std::optional<double> score;
  ScoreStatus_e status = ScoreStatus_e::kNoMatch;
  std::size_t lineNumber = 0;
};

struct ResultFormat_t {
  std::string marker = "REMARK VINA RESULT:";
  // Whitespace-separated token holding the score, counted from the start of the line.
  std::size_t tokenIndex = 3;
};

// Extracts the score of a docking run from its captured output.
// The first marker line decides the result; later marker lines are ignored.
class ResultParser {
public:
  explicit ResultParser(ResultFormat_t format = {});

  // Streaming use: returns true once the first marker line has been seen.
  bool consume(std::string_view line);
  bool settled() const { return current.status != ScoreStatus_e::kNoMatch; }
  ScoreResult_t result() const { return current; }
  void reset();

  ScoreResult_t parse(std::istream& in, const std::string& source = "output") const;
  ScoreResult_t parseText(const std::string& text) const;
  ScoreResult_t parseFile(const std::filesystem::path& path) const;

private:
  ResultFormat_t resultFormat;
  ScoreResult_t current;
  std::size_t linesSeen = 0;
};

const char* toString(ScoreStatus_e status);

} // namespace dockpipe
