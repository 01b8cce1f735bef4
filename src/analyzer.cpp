#include "leak_digest/analyzer.hpp"

#include <stdexcept>
#include <utility>

#include "leak_digest/classifier.hpp"
#include "leak_digest/log_source.hpp"
#include "leak_digest/parser.hpp"

namespace leak_digest {

AnalysisResult Analyzer::analyze(const AnalyzeOptions& options) const {
  if (options.file.empty()) {
    throw std::invalid_argument("no input file supplied");
  }

  const std::vector<std::string> lines = read_log_lines(options.file, options.strict);
  return analyze_lines(lines, options);
}

AnalysisResult Analyzer::analyze_lines(const std::vector<std::string>& lines, const AnalyzeOptions& options) const {
  ParserOptions parser_options;
  parser_options.wrap_lookahead = options.wrap_lookahead;
  const LogParser parser(parser_options);
  ParseResult parsed = parser.parse(lines);

  const IssueClassifier classifier;

  AnalysisResult result;
  result.total_lines = lines.size();
  result.classified = classifier.classify(parsed.records);
  result.statistics = classifier.compute_statistics(result.classified, options.top_n);
  result.records = std::move(parsed.records);
  result.warnings = std::move(parsed.warnings);
  return result;
}

}  // namespace leak_digest
