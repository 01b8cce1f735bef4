#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "leak_digest/issue.hpp"

namespace leak_digest {

struct AnalyzeOptions {
  std::string file;
  bool strict = true;
  std::size_t top_n = 10;
  std::size_t wrap_lookahead = 2;
};

struct AnalysisResult {
  std::uint64_t total_lines = 0;
  std::vector<IssueRecord> records;
  std::vector<ParseWarning> warnings;
  ClassifiedIssues classified;
  Statistics statistics;
};

class Analyzer {
 public:
  AnalysisResult analyze(const AnalyzeOptions& options) const;
  AnalysisResult analyze_lines(const std::vector<std::string>& lines, const AnalyzeOptions& options) const;
};

}  // namespace leak_digest
