#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "leak_digest/issue.hpp"

namespace leak_digest {

struct HeaderMatch {
  IssueType issue_type = IssueType::Other;
  // False when the line has the leak-record shape but an unknown verdict.
  bool recognized = true;
  std::string bytes_token;
  std::string blocks_token;
  std::string loss_record_id;
  std::string verdict;
};

struct ContinuationMatch {
  bool freed = false;
};

struct RecoveredHeader {
  HeaderMatch header;
  // Physical lines covered by the header, including the first one.
  std::size_t lines_consumed = 1;
};

// Strips the "==PID==" (or "--PID--") marker and surrounding whitespace.
std::string_view strip_pid_prefix(std::string_view line);

class LinePatterns {
 public:
  LinePatterns();

  bool is_summary(std::string_view line) const;
  std::optional<HeaderMatch> match_header(std::string_view line) const;
  std::optional<StackFrame> match_frame(std::string_view line) const;
  std::optional<ContinuationMatch> match_continuation(std::string_view line) const;
  std::optional<SourceLocation> extract_source_location(std::string_view description) const;

  // Re-joins a header severed by a line wrap. Looks at most `max_lookahead`
  // lines past `index`; returns nullopt when no join yields a complete header.
  std::optional<RecoveredHeader> recover_wrapped_header(const std::vector<std::string>& lines,
                                                        std::size_t index,
                                                        std::size_t max_lookahead) const;

 private:
  std::optional<HeaderMatch> match_header_body(const std::string& body) const;
  bool is_complete(const std::optional<HeaderMatch>& header) const;
  bool may_be_partial_header(std::string_view body) const;

  std::regex summary_;
  std::regex leak_header_;
  std::regex access_header_;
  std::regex free_header_;
  std::regex definitely_lost_;
  std::regex possibly_lost_;
  std::regex still_reachable_;
  std::regex frame_;
  std::regex address_line_;
  std::regex freed_block_;
  std::regex alloc_site_line_;
  std::regex file_line_;
};

}  // namespace leak_digest
