#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "leak_digest/issue.hpp"
#include "leak_digest/patterns.hpp"

namespace leak_digest {

struct ParserOptions {
  std::size_t wrap_lookahead = 2;
};

struct ParseResult {
  std::vector<IssueRecord> records;
  std::vector<ParseWarning> warnings;
};

class LogParser {
 public:
  explicit LogParser(ParserOptions options = {});

  ParseResult parse(const std::vector<std::string>& lines) const;

 private:
  ParserOptions options_;
  LinePatterns patterns_;
};

}  // namespace leak_digest
